#pragma once

#include <credo/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: event type.
// Registry workflow: audit event classifier; the string form is the event
// name carried in transaction results.
namespace credo::schema {

enum class event_type_t : uint8_t {
  identity_created = 0,
  identity_updated = 1,
  credential_added = 2,
  credential_revoked = 3,
  trusted_issuer_added = 4,
  trusted_issuer_removed = 5,
  reputation_updated = 6
};

inline constexpr auto kEventTypeMappings = std::array{
    std::pair<std::string_view, event_type_t>{"IdentityCreated",
                                              event_type_t::identity_created},
    std::pair<std::string_view, event_type_t>{"IdentityUpdated",
                                              event_type_t::identity_updated},
    std::pair<std::string_view, event_type_t>{"CredentialAdded",
                                              event_type_t::credential_added},
    std::pair<std::string_view, event_type_t>{
        "CredentialRevoked", event_type_t::credential_revoked},
    std::pair<std::string_view, event_type_t>{
        "TrustedIssuerAdded", event_type_t::trusted_issuer_added},
    std::pair<std::string_view, event_type_t>{
        "TrustedIssuerRemoved", event_type_t::trusted_issuer_removed},
    std::pair<std::string_view, event_type_t>{
        "ReputationUpdated", event_type_t::reputation_updated},
};

template <>
inline std::optional<event_type_t> try_from_string<event_type_t>(
    const std::string_view value) {
  return from_string(value, kEventTypeMappings);
}

inline constexpr std::string_view to_string(const event_type_t value) {
  return to_string(value, kEventTypeMappings).value_or("unknown");
}

}  // namespace credo::schema
