#pragma once
#include <credo/schema/primitives.hpp>
#include <string>

namespace credo::schema {

template <uint16_t Version>
struct create_identity;

template <>
struct create_identity<1> final {
  uint16_t version{1};
  std::string name;
  std::string email;
  std::string profile_hash;
};

using create_identity_t = create_identity<1>;

}  // namespace credo::schema
