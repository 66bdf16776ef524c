#pragma once
#include <credo/schema/primitives.hpp>

namespace credo::schema {

template <uint16_t Version>
struct verify_identity;

template <>
struct verify_identity<1> final {
  uint16_t version{1};
  principal_t subject{};
  bool verified{};
};

using verify_identity_t = verify_identity<1>;

}  // namespace credo::schema
