#pragma once

#include <credo/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>

// Schema type: credential record.
// Registry workflow: typed, revocable claim about a subject. `issuer` is the
// issuer display name captured at issuance, not a live reference.
namespace credo::schema {

inline constexpr std::string_view kUnknownIssuerName{"Unknown Issuer"};

template <uint16_t Version>
struct credential_record;

template <>
struct credential_record<1> final {
  uint16_t version{1};
  std::string credential_type;
  std::string issuer;
  std::string credential_hash;
  principal_t issuer_principal{};
  timestamp_milliseconds_t issued_at{};
  // 0 means the credential never expires.
  timestamp_milliseconds_t expires_at{};
  bool is_valid{true};
};

using credential_record_t = credential_record<1>;

/// Revocation is sticky; expiry is computed against `now`, never stored.
inline bool is_valid_at(const credential_record_t& credential,
                        const timestamp_milliseconds_t now) {
  return credential.is_valid &&
         (credential.expires_at == 0 || credential.expires_at > now);
}

}  // namespace credo::schema
