#pragma once
#include <credo/schema/primitives.hpp>

namespace credo::schema {

template <uint16_t Version>
struct add_trusted_issuer;

template <>
struct add_trusted_issuer<1> final {
  uint16_t version{1};
  principal_t issuer{};
};

using add_trusted_issuer_t = add_trusted_issuer<1>;

}  // namespace credo::schema
