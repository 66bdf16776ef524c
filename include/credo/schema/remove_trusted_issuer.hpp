#pragma once
#include <credo/schema/primitives.hpp>

namespace credo::schema {

template <uint16_t Version>
struct remove_trusted_issuer;

template <>
struct remove_trusted_issuer<1> final {
  uint16_t version{1};
  principal_t issuer{};
};

using remove_trusted_issuer_t = remove_trusted_issuer<1>;

}  // namespace credo::schema
