#pragma once

#include <credo/execution/credential_store.hpp>
#include <credo/execution/identity_store.hpp>
#include <credo/execution/issuer_set.hpp>
#include <credo/execution/state_cache.hpp>
#include <credo/schema/add_credential.hpp>
#include <credo/schema/add_trusted_issuer.hpp>
#include <credo/schema/create_identity.hpp>
#include <credo/schema/credential_record.hpp>
#include <credo/schema/event_record.hpp>
#include <credo/schema/genesis.hpp>
#include <credo/schema/identity_record.hpp>
#include <credo/schema/primitives.hpp>
#include <credo/schema/registry_stats.hpp>
#include <credo/schema/remove_trusted_issuer.hpp>
#include <credo/schema/revoke_credential.hpp>
#include <credo/schema/transaction_error_code.hpp>
#include <credo/schema/update_profile.hpp>
#include <credo/schema/verify_identity.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace credo::execution {

/// Outcome of one registry operation.
///
/// On failure `events` is empty and the backing cache was not written.
/// Event ids, heights and tx indexes are left for the caller to assign.
struct operation_result final {
  std::optional<credo::schema::transaction_error_code> error;
  std::string log;
  std::vector<credo::schema::event_record_t> events;

  bool ok() const { return !error.has_value(); }
};

/// Identity, credential and trusted issuer state machine.
///
/// Every mutation path into the stores goes through this class. Operations
/// check authorization before input validation, and no operation writes
/// until all of its checks pass.
class registry final {
 public:
  explicit registry(state_cache& state);

  /// Seed owner and trusted issuer. Caller guarantees it runs once.
  void initialize(const credo::schema::genesis_t& genesis);

  operation_result create_identity(
      const credo::schema::principal_t& caller,
      const credo::schema::create_identity_t& payload,
      credo::schema::timestamp_milliseconds_t now);

  /// `principal` is the identity being edited; only its owner may edit it.
  operation_result update_profile(
      const credo::schema::principal_t& caller,
      const credo::schema::principal_t& principal,
      const credo::schema::update_profile_t& payload,
      credo::schema::timestamp_milliseconds_t now);

  operation_result verify_identity(
      const credo::schema::principal_t& caller,
      const credo::schema::verify_identity_t& payload,
      credo::schema::timestamp_milliseconds_t now);

  operation_result add_credential(
      const credo::schema::principal_t& caller,
      const credo::schema::add_credential_t& payload,
      credo::schema::timestamp_milliseconds_t now);

  /// Revoking an already revoked credential succeeds and re-applies the
  /// penalty.
  operation_result revoke_credential(
      const credo::schema::principal_t& caller,
      const credo::schema::revoke_credential_t& payload,
      credo::schema::timestamp_milliseconds_t now);

  operation_result add_trusted_issuer(
      const credo::schema::principal_t& caller,
      const credo::schema::add_trusted_issuer_t& payload,
      credo::schema::timestamp_milliseconds_t now);

  operation_result remove_trusted_issuer(
      const credo::schema::principal_t& caller,
      const credo::schema::remove_trusted_issuer_t& payload,
      credo::schema::timestamp_milliseconds_t now);

  std::optional<credo::schema::identity_record_t> get_identity(
      const credo::schema::principal_t& principal) const;
  std::optional<credo::schema::credential_record_t> get_credential(
      const credo::schema::principal_t& subject,
      credo::schema::credential_index_t index) const;
  uint64_t get_credentials_count(
      const credo::schema::principal_t& subject) const;
  /// False for out-of-range indexes.
  bool is_credential_valid(const credo::schema::principal_t& subject,
                           credo::schema::credential_index_t index,
                           credo::schema::timestamp_milliseconds_t now) const;
  bool is_trusted_issuer(const credo::schema::principal_t& principal) const;
  std::optional<credo::schema::principal_t> owner() const;
  credo::schema::registry_stats_t get_contract_stats() const;

 private:
  /// Apply a reputation delta to `identity` in place and record the
  /// ReputationUpdated event.
  void apply_reputation(const credo::schema::principal_t& principal,
                        credo::schema::identity_record_t& identity,
                        int32_t delta,
                        credo::schema::timestamp_milliseconds_t now,
                        std::vector<credo::schema::event_record_t>& events);

  identity_store identities_;
  credential_store credentials_;
  issuer_set issuers_;
};

}  // namespace credo::execution
