#pragma once
#include <credo/schema/primitives.hpp>
#include <string>

namespace credo::schema {

template <uint16_t Version>
struct update_profile;

// Always targets the signer's own identity.
template <>
struct update_profile<1> final {
  uint16_t version{1};
  std::string name;
  std::string email;
  std::string profile_hash;
};

using update_profile_t = update_profile<1>;

}  // namespace credo::schema
