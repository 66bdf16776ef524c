#pragma once

#include <credo/crypto/verify.hpp>
#include <credo/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace credo::testing {

inline credo::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = credo::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline credo::schema::principal_t make_principal(const uint8_t seed) {
  auto principal = credo::schema::principal_t{};
  principal[0] = seed;
  return principal;
}

inline credo::crypto::ed25519_private_key_t make_private_key(
    const uint8_t seed) {
  auto key = credo::crypto::ed25519_private_key_t{};
  for (std::size_t i = 0; i < key.size(); ++i) {
    key[i] = static_cast<uint8_t>((seed * 31u) + static_cast<uint8_t>(i));
  }
  return key;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace credo::testing
