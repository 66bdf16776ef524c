#pragma once

#include <array>
#include <credo/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema key type: engine keys.
// Registry workflow: canonical key prefixes and key codecs for registry
// state, history and the audit event log.
namespace credo::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kGenesisKeyPrefix{"SYS|STATE|GENESIS|"};
inline constexpr std::string_view kOwnerKeyPrefix{"SYS|STATE|OWNER|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kIdentityKeyPrefix{"SYS|STATE|IDENTITY|"};
inline constexpr std::string_view kIdentityCountKeyPrefix{
    "SYS|STATE|IDENTITY_COUNT|"};
inline constexpr std::string_view kCredentialKeyPrefix{
    "SYS|STATE|CREDENTIAL|"};
inline constexpr std::string_view kCredentialCountKeyPrefix{
    "SYS|STATE|CREDENTIAL_COUNT|"};
inline constexpr std::string_view kTrustedIssuerKeyPrefix{
    "SYS|STATE|TRUSTED_ISSUER|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline const std::array<std::string_view, 12> kEngineKeyspaces{
    kStatePrefix,
    kGenesisKeyPrefix,
    kOwnerKeyPrefix,
    kNonceKeyPrefix,
    kIdentityKeyPrefix,
    kIdentityCountKeyPrefix,
    kCredentialKeyPrefix,
    kCredentialCountKeyPrefix,
    kTrustedIssuerKeyPrefix,
    kEventSeqKeyPrefix,
    kHistoryPrefix,
    kEventPrefix};

credo::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                         const credo::schema::bytes_t& id);

credo::schema::bytes_t make_genesis_key();
credo::schema::bytes_t make_owner_key();
credo::schema::bytes_t make_nonce_key(const credo::schema::principal_t& signer);
credo::schema::bytes_t make_identity_key(
    const credo::schema::principal_t& principal);
credo::schema::bytes_t make_identity_count_key();
credo::schema::bytes_t make_credential_key(
    const credo::schema::principal_t& subject,
    credo::schema::credential_index_t index);
credo::schema::bytes_t make_credential_count_key(
    const credo::schema::principal_t& subject);
credo::schema::bytes_t make_trusted_issuer_key(
    const credo::schema::principal_t& issuer);
credo::schema::bytes_t make_event_sequence_key();
credo::schema::bytes_t make_history_key(uint64_t height, uint32_t index);
credo::schema::bytes_t make_event_key(uint64_t event_id);

std::optional<std::pair<uint64_t, uint32_t>> parse_history_key(
    const credo::schema::bytes_view_t& key);
std::optional<uint64_t> parse_event_key(const credo::schema::bytes_view_t& key);

}  // namespace credo::schema::key
