#pragma once
#include <credo/schema/primitives.hpp>
#include <string>

namespace credo::schema {

template <uint16_t Version>
struct add_credential;

template <>
struct add_credential<1> final {
  uint16_t version{1};
  principal_t subject{};
  std::string credential_type;
  std::string credential_hash;
  timestamp_milliseconds_t expires_at{};
};

using add_credential_t = add_credential<1>;

}  // namespace credo::schema
