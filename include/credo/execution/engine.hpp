#pragma once

#include <credo/execution/registry.hpp>
#include <credo/execution/signature_verifier.hpp>
#include <credo/execution/state_cache.hpp>
#include <credo/schema/app_info.hpp>
#include <credo/schema/block_result.hpp>
#include <credo/schema/commit_result.hpp>
#include <credo/schema/credential_record.hpp>
#include <credo/schema/encoding/scale/encoder.hpp>
#include <credo/schema/event_record.hpp>
#include <credo/schema/genesis.hpp>
#include <credo/schema/history_entry.hpp>
#include <credo/schema/identity_record.hpp>
#include <credo/schema/primitives.hpp>
#include <credo/schema/query_result.hpp>
#include <credo/schema/registry_stats.hpp>
#include <credo/schema/replay_result.hpp>
#include <credo/schema/transaction.hpp>
#include <credo/schema/transaction_error_code.hpp>
#include <credo/schema/transaction_result.hpp>
#include <credo/storage/storage.hpp>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace credo::execution {

/// Deterministic registry state machine over an ordered transaction log.
///
/// The engine validates transaction envelopes, executes registry operations
/// against a per-block overlay, persists history and audit events, and
/// exposes the query surface over committed state. `Library` selects the
/// storage backend (rocksdb_storage_tag or memory_storage_tag).
template <typename Library>
class engine final {
 public:
  using storage_t = credo::storage::storage<Library>;

  /// Construct the engine over an open storage backend.
  ///
  /// `require_strict_crypto` enables Ed25519 signature verification; when
  /// false, signatures are not checked.
  explicit engine(scale_encoder_t& encoder,
                  storage_t& storage,
                  bool require_strict_crypto = true);

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Persist genesis and seed the owner as owner and trusted issuer.
  ///
  /// Fails with already_exists when the registry was initialized before.
  credo::schema::transaction_result_t initialize(
      const credo::schema::genesis_t& genesis);

  /// Decode and validate an envelope against committed state without
  /// executing it.
  credo::schema::transaction_result_t check_transaction(
      const credo::schema::bytes_view_t& raw_tx);

  /// Execute a block against a pending overlay and compute the candidate
  /// state root.
  ///
  /// Transactions are processed in order; each one is all-or-nothing and
  /// per-tx results are returned even on failure. Height must exceed the
  /// committed height and block time must not go backwards, otherwise every
  /// transaction fails with invalid_block.
  credo::schema::block_result_t finalize_block(
      uint64_t height,
      credo::schema::timestamp_milliseconds_t block_time,
      const std::vector<credo::schema::bytes_t>& txs);

  /// Atomically write the finalized block to storage.
  credo::schema::commit_result_t commit();

  /// Return application metadata (latest committed height, time, root).
  credo::schema::app_info_t info() const;

  /// Execute a read-path query by route against committed state.
  credo::schema::query_result_t query(
      std::string_view path,
      const credo::schema::bytes_view_t& data) const;

  /// Return history entries in the inclusive height range.
  std::vector<credo::schema::history_entry_t> history(uint64_t from_height,
                                                      uint64_t to_height) const;

  /// Return persisted audit events in the inclusive id range.
  std::vector<credo::schema::event_record_t> events(uint64_t from_id,
                                                    uint64_t to_id) const;

  /// Re-run persisted history on a fresh in-memory store and check
  /// deterministic state-root agreement.
  credo::schema::replay_result_t replay_history() const;

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  std::optional<credo::schema::genesis_t> genesis() const;
  std::optional<credo::schema::identity_record_t> get_identity(
      const credo::schema::principal_t& principal) const;
  std::optional<credo::schema::credential_record_t> get_credential(
      const credo::schema::principal_t& subject,
      credo::schema::credential_index_t index) const;
  uint64_t get_credentials_count(
      const credo::schema::principal_t& subject) const;
  /// Evaluated at the committed block time.
  bool is_credential_valid(const credo::schema::principal_t& subject,
                           credo::schema::credential_index_t index) const;
  bool is_trusted_issuer(const credo::schema::principal_t& principal) const;
  std::optional<credo::schema::principal_t> owner() const;
  credo::schema::registry_stats_t get_contract_stats() const;
  /// Last accepted nonce for signer; 0 before its first transaction.
  uint64_t nonce(const credo::schema::principal_t& signer) const;

 private:
  /// Validate envelope: version, initialization, chain id, nonce, signature.
  credo::schema::transaction_result_t validate_transaction(
      const credo::schema::transaction_t& tx,
      const state_cache& state,
      std::string_view codespace) const;

  /// Execute one raw transaction inside `block`; returns its result and the
  /// audit events it appended.
  credo::schema::transaction_result_t execute_transaction(
      state_cache& block,
      const credo::schema::bytes_t& raw_tx,
      uint64_t height,
      uint32_t index,
      credo::schema::timestamp_milliseconds_t block_time);

  /// Dispatch the payload to the registry.
  operation_result execute_operation(
      registry& target,
      const credo::schema::transaction_t& tx,
      credo::schema::timestamp_milliseconds_t now) const;

  /// Cache reading straight from committed storage.
  state_cache committed_view() const;

  /// Load committed state from storage at startup.
  void load_persisted_state();

  mutable std::shared_mutex mutex_;
  scale_encoder_t& encoder_;
  storage_t& storage_;
  int64_t last_committed_height_{};
  credo::schema::timestamp_milliseconds_t last_committed_block_time_{};
  credo::schema::hash32_t last_committed_state_root_{};
  std::optional<state_cache> pending_;
  int64_t pending_height_{};
  credo::schema::timestamp_milliseconds_t pending_block_time_{};
  credo::schema::hash32_t pending_state_root_{};
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
};

}  // namespace credo::execution
