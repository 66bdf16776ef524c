#include <credo/schema/key/engine_keys.hpp>

#include <credo/schema/encoding/scale/encoder.hpp>

#include <tuple>

namespace credo::schema::key {

namespace {

using key_encoder_t = credo::schema::encoding::encoder<
    credo::schema::encoding::scale_encoder_tag>;

std::optional<credo::schema::bytes_view_t> strip_prefix(
    const credo::schema::bytes_view_t& key,
    const std::string_view prefix) {
  auto key_view =
      std::string_view{reinterpret_cast<const char*>(key.data()), key.size()};
  if (!key_view.starts_with(prefix)) {
    return std::nullopt;
  }
  return credo::schema::bytes_view_t{key.data() + prefix.size(),
                                     key.size() - prefix.size()};
}

}  // namespace

credo::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                         const credo::schema::bytes_t& id) {
  auto key = credo::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

credo::schema::bytes_t make_genesis_key() {
  return make_prefixed_key(kGenesisKeyPrefix, credo::schema::make_bytes(
                                                  std::string_view{"CURRENT"}));
}

credo::schema::bytes_t make_owner_key() {
  return make_prefixed_key(kOwnerKeyPrefix, credo::schema::make_bytes(
                                                std::string_view{"CURRENT"}));
}

credo::schema::bytes_t make_nonce_key(
    const credo::schema::principal_t& signer) {
  return make_prefixed_key(kNonceKeyPrefix, key_encoder_t{}.encode(signer));
}

credo::schema::bytes_t make_identity_key(
    const credo::schema::principal_t& principal) {
  return make_prefixed_key(kIdentityKeyPrefix,
                           key_encoder_t{}.encode(principal));
}

credo::schema::bytes_t make_identity_count_key() {
  return make_prefixed_key(
      kIdentityCountKeyPrefix,
      credo::schema::make_bytes(std::string_view{"TOTAL"}));
}

credo::schema::bytes_t make_credential_key(
    const credo::schema::principal_t& subject,
    const credo::schema::credential_index_t index) {
  return make_prefixed_key(kCredentialKeyPrefix,
                           key_encoder_t{}.encode(std::tuple{subject, index}));
}

credo::schema::bytes_t make_credential_count_key(
    const credo::schema::principal_t& subject) {
  return make_prefixed_key(kCredentialCountKeyPrefix,
                           key_encoder_t{}.encode(subject));
}

credo::schema::bytes_t make_trusted_issuer_key(
    const credo::schema::principal_t& issuer) {
  return make_prefixed_key(kTrustedIssuerKeyPrefix,
                           key_encoder_t{}.encode(issuer));
}

credo::schema::bytes_t make_event_sequence_key() {
  return make_prefixed_key(kEventSeqKeyPrefix, credo::schema::make_bytes(
                                                   std::string_view{"NEXT"}));
}

credo::schema::bytes_t make_history_key(uint64_t height, uint32_t index) {
  return make_prefixed_key(kHistoryPrefix,
                           key_encoder_t{}.encode(std::tuple{height, index}));
}

credo::schema::bytes_t make_event_key(uint64_t event_id) {
  return make_prefixed_key(kEventPrefix, key_encoder_t{}.encode(event_id));
}

std::optional<std::pair<uint64_t, uint32_t>> parse_history_key(
    const credo::schema::bytes_view_t& key) {
  auto encoded = strip_prefix(key, kHistoryPrefix);
  if (!encoded) {
    return std::nullopt;
  }
  auto decoded =
      key_encoder_t{}.try_decode<std::tuple<uint64_t, uint32_t>>(*encoded);
  if (!decoded) {
    return std::nullopt;
  }
  return std::pair<uint64_t, uint32_t>{std::get<0>(decoded.value()),
                                       std::get<1>(decoded.value())};
}

std::optional<uint64_t> parse_event_key(
    const credo::schema::bytes_view_t& key) {
  auto encoded = strip_prefix(key, kEventPrefix);
  if (!encoded) {
    return std::nullopt;
  }
  return key_encoder_t{}.try_decode<uint64_t>(*encoded);
}

}  // namespace credo::schema::key
