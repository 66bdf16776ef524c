#include <spdlog/spdlog.h>
#include <credo/common/critical.hpp>
#include <credo/execution/registry.hpp>
#include <credo/execution/reputation.hpp>

#include <algorithm>
#include <string>
#include <utility>

using namespace credo::schema;

namespace {

credo::execution::operation_result make_error(const transaction_error_code code,
                                              std::string log) {
  return credo::execution::operation_result{
      .error = code, .log = std::move(log), .events = {}};
}

transaction_event_attribute_t make_attribute(std::string key,
                                             std::string value,
                                             const bool index = false) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

event_record_t make_event(const event_type_t type,
                          const principal_t& principal,
                          std::vector<transaction_event_attribute_t> attributes,
                          const timestamp_milliseconds_t now) {
  attributes.push_back(make_attribute("timestamp", std::to_string(now)));
  auto event = event_record_t{};
  event.type = type;
  event.principal = principal;
  event.attributes = std::move(attributes);
  event.recorded_at = now;
  return event;
}

std::string to_bool_string(const bool value) {
  return value ? "true" : "false";
}

void touch(identity_record_t& identity, const timestamp_milliseconds_t now) {
  identity.last_updated = std::max(identity.last_updated, now);
}

}  // namespace

namespace credo::execution {

registry::registry(state_cache& state)
    : identities_{state}, credentials_{state}, issuers_{state} {}

void registry::initialize(const genesis_t& genesis) {
  issuers_.set_owner(genesis.owner);
  issuers_.set_trusted(genesis.owner, true);
  spdlog::info("Registry initialized with owner {}", to_hex(genesis.owner));
}

operation_result registry::create_identity(const principal_t& caller,
                                           const create_identity_t& payload,
                                           const timestamp_milliseconds_t now) {
  if (identities_.contains(caller)) {
    return make_error(transaction_error_code::already_exists,
                      "identity already exists");
  }
  if (payload.name.empty() || payload.email.empty()) {
    return make_error(transaction_error_code::invalid_input,
                      "name and email must not be empty");
  }

  auto identity = identity_record_t{};
  identity.name = payload.name;
  identity.email = payload.email;
  identity.profile_hash = payload.profile_hash;
  identity.created_at = now;
  identity.last_updated = now;
  identities_.put(caller, identity);
  identities_.increment_total();

  auto result = operation_result{};
  result.events.push_back(make_event(
      event_type_t::identity_created, caller,
      {make_attribute("principal", to_hex(caller), true),
       make_attribute("name", payload.name),
       make_attribute("email", payload.email),
       make_attribute("profile_hash", payload.profile_hash)},
      now));
  return result;
}

operation_result registry::update_profile(const principal_t& caller,
                                          const principal_t& principal,
                                          const update_profile_t& payload,
                                          const timestamp_milliseconds_t now) {
  auto identity = identities_.find(principal);
  if (!identity) {
    return make_error(transaction_error_code::not_found,
                      "identity does not exist");
  }
  if (caller != principal) {
    return make_error(transaction_error_code::forbidden,
                      "only the identity owner may update the profile");
  }
  if (payload.name.empty() || payload.email.empty()) {
    return make_error(transaction_error_code::invalid_input,
                      "name and email must not be empty");
  }

  identity->name = payload.name;
  identity->email = payload.email;
  identity->profile_hash = payload.profile_hash;
  touch(*identity, now);
  identities_.put(principal, *identity);

  auto result = operation_result{};
  result.events.push_back(make_event(
      event_type_t::identity_updated, principal,
      {make_attribute("principal", to_hex(principal), true),
       make_attribute("name", payload.name),
       make_attribute("email", payload.email),
       make_attribute("profile_hash", payload.profile_hash)},
      now));
  return result;
}

operation_result registry::verify_identity(const principal_t& caller,
                                           const verify_identity_t& payload,
                                           const timestamp_milliseconds_t now) {
  if (!issuers_.is_trusted(caller)) {
    return make_error(transaction_error_code::forbidden,
                      "caller is not a trusted issuer");
  }
  auto identity = identities_.find(payload.subject);
  if (!identity) {
    return make_error(transaction_error_code::not_found,
                      "identity does not exist");
  }

  auto result = operation_result{};
  identity->is_verified = payload.verified;
  touch(*identity, now);
  apply_reputation(payload.subject, *identity,
                   payload.verified ? reputation::kVerifiedDelta
                                    : reputation::kUnverifiedDelta,
                   now, result.events);
  identities_.put(payload.subject, *identity);

  result.events.push_back(make_event(
      event_type_t::identity_updated, payload.subject,
      {make_attribute("principal", to_hex(payload.subject), true),
       make_attribute("is_verified", to_bool_string(payload.verified)),
       make_attribute("verifier", to_hex(caller), true)},
      now));
  return result;
}

operation_result registry::add_credential(const principal_t& caller,
                                          const add_credential_t& payload,
                                          const timestamp_milliseconds_t now) {
  if (!issuers_.is_trusted(caller)) {
    return make_error(transaction_error_code::forbidden,
                      "caller is not a trusted issuer");
  }
  auto identity = identities_.find(payload.subject);
  if (!identity) {
    return make_error(transaction_error_code::not_found,
                      "subject identity does not exist");
  }
  if (payload.credential_type.empty() || payload.credential_hash.empty()) {
    return make_error(transaction_error_code::invalid_input,
                      "credential type and hash must not be empty");
  }
  if (payload.expires_at != 0 && payload.expires_at <= now) {
    return make_error(transaction_error_code::invalid_input,
                      "credential expiry must be in the future");
  }

  auto credential = credential_record_t{};
  credential.credential_type = payload.credential_type;
  credential.credential_hash = payload.credential_hash;
  credential.issuer_principal = caller;
  credential.issued_at = now;
  credential.expires_at = payload.expires_at;
  credential.is_valid = true;
  if (auto issuer_identity = identities_.find(caller)) {
    credential.issuer = issuer_identity->name;
  } else {
    credential.issuer = std::string{kUnknownIssuerName};
  }
  const auto index = credentials_.append(payload.subject, credential);

  auto result = operation_result{};
  touch(*identity, now);
  apply_reputation(payload.subject, *identity,
                   reputation::kCredentialAddedDelta, now, result.events);
  identities_.put(payload.subject, *identity);

  result.events.push_back(make_event(
      event_type_t::credential_added, payload.subject,
      {make_attribute("subject", to_hex(payload.subject), true),
       make_attribute("index", std::to_string(index)),
       make_attribute("credential_type", credential.credential_type),
       make_attribute("issuer", credential.issuer),
       make_attribute("issuer_principal", to_hex(caller), true),
       make_attribute("expires_at", std::to_string(credential.expires_at))},
      now));
  return result;
}

operation_result registry::revoke_credential(
    const principal_t& caller,
    const revoke_credential_t& payload,
    const timestamp_milliseconds_t now) {
  if (!issuers_.is_trusted(caller)) {
    return make_error(transaction_error_code::forbidden,
                      "caller is not a trusted issuer");
  }
  auto credential = credentials_.at(payload.subject, payload.index);
  if (!credential) {
    return make_error(transaction_error_code::index_out_of_range,
                      "credential index out of range");
  }
  auto identity = identities_.find(payload.subject);
  if (!identity) {
    credo::common::critical("credential subject has no identity record");
  }

  credential->is_valid = false;
  credentials_.replace(payload.subject, payload.index, *credential);

  auto result = operation_result{};
  touch(*identity, now);
  apply_reputation(payload.subject, *identity,
                   reputation::kCredentialRevokedDelta, now, result.events);
  identities_.put(payload.subject, *identity);

  result.events.push_back(make_event(
      event_type_t::credential_revoked, payload.subject,
      {make_attribute("subject", to_hex(payload.subject), true),
       make_attribute("index", std::to_string(payload.index)),
       make_attribute("revoker", to_hex(caller), true)},
      now));
  return result;
}

operation_result registry::add_trusted_issuer(
    const principal_t& caller,
    const add_trusted_issuer_t& payload,
    const timestamp_milliseconds_t now) {
  if (!issuers_.is_owner(caller)) {
    return make_error(transaction_error_code::forbidden,
                      "only the owner may manage trusted issuers");
  }
  issuers_.set_trusted(payload.issuer, true);

  auto result = operation_result{};
  result.events.push_back(
      make_event(event_type_t::trusted_issuer_added, payload.issuer,
                 {make_attribute("issuer", to_hex(payload.issuer), true)}, now));
  return result;
}

operation_result registry::remove_trusted_issuer(
    const principal_t& caller,
    const remove_trusted_issuer_t& payload,
    const timestamp_milliseconds_t now) {
  if (!issuers_.is_owner(caller)) {
    return make_error(transaction_error_code::forbidden,
                      "only the owner may manage trusted issuers");
  }
  if (issuers_.is_owner(payload.issuer)) {
    return make_error(transaction_error_code::forbidden,
                      "the owner cannot be removed");
  }
  issuers_.set_trusted(payload.issuer, false);

  auto result = operation_result{};
  result.events.push_back(
      make_event(event_type_t::trusted_issuer_removed, payload.issuer,
                 {make_attribute("issuer", to_hex(payload.issuer), true)}, now));
  return result;
}

std::optional<identity_record_t> registry::get_identity(
    const principal_t& principal) const {
  return identities_.find(principal);
}

std::optional<credential_record_t> registry::get_credential(
    const principal_t& subject,
    const credential_index_t index) const {
  return credentials_.at(subject, index);
}

uint64_t registry::get_credentials_count(const principal_t& subject) const {
  return credentials_.count(subject);
}

bool registry::is_credential_valid(const principal_t& subject,
                                   const credential_index_t index,
                                   const timestamp_milliseconds_t now) const {
  auto credential = credentials_.at(subject, index);
  return credential.has_value() && is_valid_at(*credential, now);
}

bool registry::is_trusted_issuer(const principal_t& principal) const {
  return issuers_.is_trusted(principal);
}

std::optional<principal_t> registry::owner() const {
  return issuers_.owner();
}

registry_stats_t registry::get_contract_stats() const {
  auto stats = registry_stats_t{};
  stats.total_identities = identities_.total_count();
  return stats;
}

void registry::apply_reputation(const principal_t& principal,
                                identity_record_t& identity,
                                const int32_t delta,
                                const timestamp_milliseconds_t now,
                                std::vector<event_record_t>& events) {
  identity.reputation_score =
      reputation::apply_delta(identity.reputation_score, delta);
  touch(identity, now);
  events.push_back(make_event(
      event_type_t::reputation_updated, principal,
      {make_attribute("principal", to_hex(principal), true),
       make_attribute("score", std::to_string(identity.reputation_score)),
       make_attribute("delta", std::to_string(delta))},
      now));
}

}  // namespace credo::execution
