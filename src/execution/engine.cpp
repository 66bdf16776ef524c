#include <spdlog/spdlog.h>
#include <algorithm>
#include <credo/blake3/hash.hpp>
#include <credo/crypto/verify.hpp>
#include <credo/execution/engine.hpp>
#include <credo/schema/encoding/scale/encoder.hpp>
#include <credo/schema/event_type.hpp>
#include <credo/schema/key/engine_keys.hpp>
#include <credo/schema/query_error_code.hpp>
#include <credo/storage/memory/storage.hpp>
#include <credo/storage/rocksdb/storage.hpp>
#include <iterator>
#include <limits>
#include <map>
#include <tuple>
#include <utility>

using namespace credo::schema;

namespace {

inline constexpr auto kCheckTxCodespace = std::string_view{"credo.checktx"};
inline constexpr auto kFinalizeCodespace = std::string_view{"credo.finalize"};
inline constexpr auto kExecuteCodespace = std::string_view{"credo.execute"};
inline constexpr auto kQueryCodespace = std::string_view{"credo.query"};

using encoder_t = credo::schema::encoding::encoder<
    credo::schema::encoding::scale_encoder_tag>;

bytes_view_t view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& tx,
                         uint64_t height,
                         uint64_t index) {
  auto material = bytes_t{};
  material.reserve(seed.size() + tx.size() + 32);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return credo::blake3::hash(bytes_view_t{material.data(), material.size()});
}

hash32_t genesis_state_root(const hash32_t& seed, const genesis_t& genesis) {
  auto encoder = encoder_t{};
  auto material = bytes_t{std::begin(seed), std::end(seed)};
  encoder.encode(genesis, material);
  return credo::blake3::hash(bytes_view_t{material.data(), material.size()});
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "transaction is not valid SCALE";
  }
  return tx;
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       std::string log,
                                       std::string info,
                                       const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

void make_query_error(query_result_t& result,
                      const query_error_code code,
                      std::string log) {
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.codespace = std::string{kQueryCodespace};
}

transaction_event_t make_transaction_event(const event_record_t& record) {
  auto event = transaction_event_t{};
  event.type = std::string{to_string(record.type)};
  event.attributes.push_back(transaction_event_attribute_t{
      .key = "event_id", .value = std::to_string(record.event_id)});
  event.attributes.insert(std::end(event.attributes),
                          std::begin(record.attributes),
                          std::end(record.attributes));
  return event;
}

std::string_view operation_name(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const create_identity_t&) {
            return std::string_view{"create_identity"};
          },
          [](const update_profile_t&) {
            return std::string_view{"update_profile"};
          },
          [](const verify_identity_t&) {
            return std::string_view{"verify_identity"};
          },
          [](const add_credential_t&) {
            return std::string_view{"add_credential"};
          },
          [](const revoke_credential_t&) {
            return std::string_view{"revoke_credential"};
          },
          [](const add_trusted_issuer_t&) {
            return std::string_view{"add_trusted_issuer"};
          },
          [](const remove_trusted_issuer_t&) {
            return std::string_view{"remove_trusted_issuer"};
          }},
      payload);
}

template <typename Storage>
std::vector<history_entry_t> load_history(const Storage& storage,
                                          encoder_t& encoder,
                                          uint64_t from_height,
                                          uint64_t to_height) {
  auto prefix = make_bytes(credo::schema::key::kHistoryPrefix);
  auto rows = storage.list_by_prefix(view(prefix));
  auto entries = std::vector<history_entry_t>{};
  for (const auto& [key, value] : rows) {
    auto parsed = credo::schema::key::parse_history_key(view(key));
    if (!parsed) {
      spdlog::warn("Skipping malformed history key");
      continue;
    }
    if (parsed->first < from_height || parsed->first > to_height) {
      continue;
    }
    entries.push_back(encoder.decode<history_entry_t>(view(value)));
  }
  // SCALE integers are little-endian, so key order is not height order.
  std::sort(std::begin(entries), std::end(entries),
            [](const history_entry_t& lhs, const history_entry_t& rhs) {
              return std::tie(lhs.height, lhs.index) <
                     std::tie(rhs.height, rhs.index);
            });
  return entries;
}

template <typename Storage>
std::vector<event_record_t> load_events(const Storage& storage,
                                        encoder_t& encoder,
                                        uint64_t from_id,
                                        uint64_t to_id) {
  auto prefix = make_bytes(credo::schema::key::kEventPrefix);
  auto rows = storage.list_by_prefix(view(prefix));
  auto events = std::vector<event_record_t>{};
  for (const auto& [key, value] : rows) {
    auto event_id = credo::schema::key::parse_event_key(view(key));
    if (!event_id) {
      spdlog::warn("Skipping malformed event key");
      continue;
    }
    if (*event_id < from_id || *event_id > to_id) {
      continue;
    }
    events.push_back(encoder.decode<event_record_t>(view(value)));
  }
  std::sort(std::begin(events), std::end(events),
            [](const event_record_t& lhs, const event_record_t& rhs) {
              return lhs.event_id < rhs.event_id;
            });
  return events;
}

}  // namespace

namespace credo::execution {

template <typename Library>
engine<Library>::engine(scale_encoder_t& encoder,
                        storage_t& storage,
                        bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      require_strict_crypto_{require_strict_crypto},
      signature_verifier_{credo::crypto::verify_signature} {
  auto lock = std::unique_lock{mutex_};
  load_persisted_state();
  if (require_strict_crypto_ && !credo::crypto::available()) {
    spdlog::warn("Strict crypto requested but OpenSSL lacks Ed25519");
  }
  if (!require_strict_crypto_) {
    spdlog::warn("Strict crypto disabled; signatures are not verified");
  }
  spdlog::info("Execution engine ready at height {}", last_committed_height_);
}

template <typename Library>
transaction_result_t engine<Library>::initialize(const genesis_t& genesis) {
  auto lock = std::unique_lock{mutex_};
  if (pending_) {
    return make_error_result(transaction_error_code::invalid_block,
                             "block pending commit",
                             "commit the finalized block first",
                             kExecuteCodespace);
  }
  auto state = committed_view();
  auto genesis_key = credo::schema::key::make_genesis_key();
  if (state.get_raw(view(genesis_key))) {
    return make_error_result(transaction_error_code::already_exists,
                             "registry already initialized", "",
                             kExecuteCodespace);
  }

  auto target = registry{state};
  target.initialize(genesis);
  state.put(view(genesis_key), genesis);

  auto committed = credo::storage::committed_state{
      .height = last_committed_height_,
      .block_time = std::max(last_committed_block_time_, genesis.genesis_time),
      .state_root = genesis_state_root(last_committed_state_root_, genesis)};
  storage_.commit_batch(state.entries(), committed);
  last_committed_block_time_ = committed.block_time;
  last_committed_state_root_ = committed.state_root;
  spdlog::info("Genesis applied for chain {}", to_hex(genesis.chain_id));

  auto result = transaction_result_t{};
  result.info = "initialized";
  return result;
}

template <typename Library>
transaction_result_t engine<Library>::check_transaction(
    const bytes_view_t& raw_tx) {
  auto lock = std::shared_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction", decode_error,
                             kCheckTxCodespace);
  }
  auto state = committed_view();
  return validate_transaction(*maybe_tx, state, kCheckTxCodespace);
}

template <typename Library>
transaction_result_t engine<Library>::validate_transaction(
    const transaction_t& tx,
    const state_cache& state,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1", codespace);
  }
  auto genesis_key = credo::schema::key::make_genesis_key();
  auto genesis = state.get<genesis_t>(view(genesis_key));
  if (!genesis) {
    return make_error_result(transaction_error_code::registry_uninitialized,
                             "registry not initialized", "", codespace);
  }
  if (tx.chain_id != genesis->chain_id) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             "invalid chain id",
                             "expected " + to_hex(genesis->chain_id),
                             codespace);
  }
  auto nonce_key = credo::schema::key::make_nonce_key(tx.signer);
  auto expected_nonce = state.get<uint64_t>(view(nonce_key)).value_or(0) + 1;
  if (tx.nonce != expected_nonce) {
    return make_error_result(transaction_error_code::invalid_nonce,
                             "invalid nonce",
                             "expected " + std::to_string(expected_nonce),
                             codespace);
  }
  if (require_strict_crypto_) {
    auto message = make_signing_message(tx);
    if (!signature_verifier_ ||
        !signature_verifier_(view(message), tx.signer, tx.signature)) {
      return make_error_result(
          transaction_error_code::signature_verification_failed,
          "signature verification failed", "", codespace);
    }
  }
  return transaction_result_t{};
}

template <typename Library>
operation_result engine<Library>::execute_operation(
    registry& target,
    const transaction_t& tx,
    const timestamp_milliseconds_t now) const {
  return std::visit(
      overloaded{[&](const create_identity_t& payload) {
                   return target.create_identity(tx.signer, payload, now);
                 },
                 [&](const update_profile_t& payload) {
                   return target.update_profile(tx.signer, tx.signer, payload,
                                                now);
                 },
                 [&](const verify_identity_t& payload) {
                   return target.verify_identity(tx.signer, payload, now);
                 },
                 [&](const add_credential_t& payload) {
                   return target.add_credential(tx.signer, payload, now);
                 },
                 [&](const revoke_credential_t& payload) {
                   return target.revoke_credential(tx.signer, payload, now);
                 },
                 [&](const add_trusted_issuer_t& payload) {
                   return target.add_trusted_issuer(tx.signer, payload, now);
                 },
                 [&](const remove_trusted_issuer_t& payload) {
                   return target.remove_trusted_issuer(tx.signer, payload,
                                                       now);
                 }},
      tx.payload);
}

template <typename Library>
transaction_result_t engine<Library>::execute_transaction(
    state_cache& block,
    const bytes_t& raw_tx,
    const uint64_t height,
    const uint32_t index,
    const timestamp_milliseconds_t block_time) {
  auto result = transaction_result_t{};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(view(raw_tx), decode_error);
  if (!maybe_tx) {
    result = make_error_result(transaction_error_code::invalid_transaction,
                               "invalid transaction", decode_error,
                               kFinalizeCodespace);
  } else {
    auto tx_state = state_cache{encoder_, block.reader()};
    result = validate_transaction(*maybe_tx, tx_state, kFinalizeCodespace);
    if (result.code == 0) {
      auto target = registry{tx_state};
      auto outcome = execute_operation(target, *maybe_tx, block_time);
      if (!outcome.ok()) {
        result = make_error_result(*outcome.error, outcome.log,
                                   std::string{operation_name(
                                       maybe_tx->payload)},
                                   kExecuteCodespace);
      } else {
        auto nonce_key = credo::schema::key::make_nonce_key(maybe_tx->signer);
        tx_state.put(view(nonce_key), maybe_tx->nonce);

        auto sequence_key = credo::schema::key::make_event_sequence_key();
        auto next_event_id =
            tx_state.get<uint64_t>(view(sequence_key)).value_or(1);
        for (auto& event : outcome.events) {
          event.event_id = next_event_id++;
          event.height = height;
          event.tx_index = index;
          auto event_key = credo::schema::key::make_event_key(event.event_id);
          tx_state.put(view(event_key), event);
          result.events.push_back(make_transaction_event(event));
        }
        tx_state.put(view(sequence_key), next_event_id);

        result.info = std::string{operation_name(maybe_tx->payload)} +
                      " accepted";
        block.merge(tx_state);
      }
    }
  }

  if (result.code != 0) {
    spdlog::debug("Transaction {}:{} failed with code {}: {}", height, index,
                  result.code, result.log);
  }
  auto entry = history_entry_t{};
  entry.height = height;
  entry.index = index;
  entry.code = result.code;
  entry.block_time = block_time;
  entry.tx = raw_tx;
  auto history_key = credo::schema::key::make_history_key(height, index);
  block.put(view(history_key), entry);
  return result;
}

template <typename Library>
block_result_t engine<Library>::finalize_block(
    const uint64_t height,
    const timestamp_milliseconds_t block_time,
    const std::vector<bytes_t>& txs) {
  auto lock = std::unique_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  if (height > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) ||
      static_cast<int64_t>(height) <= last_committed_height_ ||
      block_time < last_committed_block_time_) {
    spdlog::warn("Rejecting block {} at time {}; committed height {} time {}",
                 height, block_time, last_committed_height_,
                 last_committed_block_time_);
    for (size_t i = 0; i < txs.size(); ++i) {
      result.tx_results.push_back(make_error_result(
          transaction_error_code::invalid_block, "invalid block",
          "height must increase and block time must not decrease",
          kFinalizeCodespace));
    }
    result.state_root = last_committed_state_root_;
    result.rejected = true;
    return result;
  }

  pending_.reset();
  pending_.emplace(encoder_, [this](const bytes_view_t& key) {
    return storage_.get_raw(key);
  });

  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto tx_result = execute_transaction(*pending_, txs[i], height,
                                         static_cast<uint32_t>(i), block_time);
    if (tx_result.code == 0) {
      rolling_root = fold_state_root(rolling_root, txs[i], height, i);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_block_time_ = block_time;
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  spdlog::debug("Finalized block {} with {} transaction(s)", height,
                txs.size());
  return result;
}

template <typename Library>
commit_result_t engine<Library>::commit() {
  auto lock = std::unique_lock{mutex_};
  if (pending_) {
    storage_.commit_batch(
        pending_->entries(),
        credo::storage::committed_state{.height = pending_height_,
                                        .block_time = pending_block_time_,
                                        .state_root = pending_state_root_});
    last_committed_height_ = pending_height_;
    last_committed_block_time_ = pending_block_time_;
    last_committed_state_root_ = pending_state_root_;
    pending_.reset();
    spdlog::info("Committed block {} with state root {}",
                 last_committed_height_, to_hex(last_committed_state_root_));
  }

  auto result = commit_result_t{};
  result.committed_height = last_committed_height_;
  result.block_time = last_committed_block_time_;
  result.state_root = last_committed_state_root_;
  return result;
}

template <typename Library>
app_info_t engine<Library>::info() const {
  auto lock = std::shared_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_time = last_committed_block_time_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

template <typename Library>
query_result_t engine<Library>::query(const std::string_view path,
                                      const bytes_view_t& data) const {
  auto lock = std::shared_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;

  auto state = committed_view();
  auto target = registry{state};

  if (path == "/engine/info") {
    auto genesis_key = credo::schema::key::make_genesis_key();
    auto genesis = state.get<genesis_t>(view(genesis_key));
    auto chain_id = genesis ? genesis->chain_id : make_zero_hash();
    result.value = encoder_.encode(std::tuple{
        last_committed_height_, last_committed_state_root_, chain_id});
    return result;
  }

  if (path == "/registry/stats") {
    result.value = encoder_.encode(target.get_contract_stats());
    return result;
  }

  if (path == "/registry/owner") {
    auto current = target.owner();
    if (!current) {
      make_query_error(result, query_error_code::not_found,
                       "registry not initialized");
      return result;
    }
    result.value = encoder_.encode(*current);
    return result;
  }

  if (path == "/state/identity" || path == "/state/trusted_issuer" ||
      path == "/state/credentials_count") {
    auto principal = encoder_.try_decode<principal_t>(data);
    if (!principal) {
      make_query_error(result, query_error_code::invalid_key,
                       "key must be a 32-byte principal");
      return result;
    }
    if (path == "/state/trusted_issuer") {
      result.value = encoder_.encode(target.is_trusted_issuer(*principal));
      return result;
    }
    if (path == "/state/credentials_count") {
      result.value = encoder_.encode(target.get_credentials_count(*principal));
      return result;
    }
    auto identity = target.get_identity(*principal);
    if (!identity) {
      make_query_error(result, query_error_code::not_found,
                       "identity not found");
      return result;
    }
    result.value = encoder_.encode(*identity);
    return result;
  }

  if (path == "/state/credential" || path == "/state/credential_valid") {
    auto decoded =
        encoder_.try_decode<std::tuple<principal_t, credential_index_t>>(data);
    if (!decoded) {
      make_query_error(result, query_error_code::invalid_key,
                       "key must be (principal, u64 index)");
      return result;
    }
    const auto& [subject, index] = *decoded;
    if (path == "/state/credential_valid") {
      result.value = encoder_.encode(target.is_credential_valid(
          subject, index, last_committed_block_time_));
      return result;
    }
    auto credential = target.get_credential(subject, index);
    if (!credential) {
      make_query_error(result, query_error_code::index_out_of_range,
                       "credential index out of range");
      return result;
    }
    result.value = encoder_.encode(*credential);
    return result;
  }

  if (path == "/events/range" || path == "/history/range") {
    auto decoded = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!decoded) {
      make_query_error(result, query_error_code::invalid_key,
                       "key must be (u64 from, u64 to)");
      return result;
    }
    const auto& [from, to] = *decoded;
    if (path == "/events/range") {
      result.value = encoder_.encode(load_events(storage_, encoder_, from, to));
    } else {
      result.value =
          encoder_.encode(load_history(storage_, encoder_, from, to));
    }
    return result;
  }

  make_query_error(result, query_error_code::unsupported_path,
                   "unsupported query path");
  result.info = std::string{path};
  return result;
}

template <typename Library>
std::vector<history_entry_t> engine<Library>::history(
    const uint64_t from_height,
    const uint64_t to_height) const {
  auto lock = std::shared_lock{mutex_};
  return load_history(storage_, encoder_, from_height, to_height);
}

template <typename Library>
std::vector<event_record_t> engine<Library>::events(
    const uint64_t from_id,
    const uint64_t to_id) const {
  auto lock = std::shared_lock{mutex_};
  return load_events(storage_, encoder_, from_id, to_id);
}

template <typename Library>
replay_result_t engine<Library>::replay_history() const {
  auto lock = std::shared_lock{mutex_};
  auto result = replay_result_t{};

  auto state = committed_view();
  auto genesis_key = credo::schema::key::make_genesis_key();
  auto genesis = state.get<genesis_t>(view(genesis_key));
  if (!genesis) {
    result.error = "registry not initialized";
    return result;
  }

  auto entries = load_history(storage_, encoder_, 0,
                              std::numeric_limits<uint64_t>::max());
  result.tx_count = entries.size();

  auto replay_encoder = scale_encoder_t{};
  auto replay_storage =
      credo::storage::make_storage<credo::storage::memory_storage_tag>(
          std::string_view{});
  auto replay = engine<credo::storage::memory_storage_tag>{
      replay_encoder, replay_storage, require_strict_crypto_};
  replay.set_signature_verifier(signature_verifier_);
  auto initialized = replay.initialize(*genesis);
  if (initialized.code != 0) {
    result.error = "replay genesis failed: " + initialized.log;
    return result;
  }

  auto cursor = std::begin(entries);
  while (cursor != std::end(entries)) {
    auto block_end = std::find_if(cursor, std::end(entries),
                                  [&](const history_entry_t& entry) {
                                    return entry.height != cursor->height;
                                  });
    // A block without a successful transaction leaves state and root as they
    // were, including blocks rejected before genesis.
    if (std::none_of(cursor, block_end, [](const history_entry_t& entry) {
          return entry.code == 0;
        })) {
      cursor = block_end;
      continue;
    }
    auto txs = std::vector<bytes_t>{};
    for (auto it = cursor; it != block_end; ++it) {
      txs.push_back(it->tx);
    }
    auto block = replay.finalize_block(cursor->height, cursor->block_time, txs);
    for (size_t i = 0; i < block.tx_results.size(); ++i) {
      const auto& expected = *(cursor + static_cast<std::ptrdiff_t>(i));
      if (block.tx_results[i].code != expected.code) {
        result.error = "result code mismatch at height " +
                       std::to_string(expected.height) + " index " +
                       std::to_string(expected.index);
        return result;
      }
      if (expected.code == 0) {
        ++result.applied_count;
      }
    }
    replay.commit();
    result.last_height = static_cast<int64_t>(cursor->height);
    cursor = block_end;
  }

  result.state_root = replay.info().last_block_state_root;
  result.ok = result.state_root == last_committed_state_root_;
  if (!result.ok) {
    result.error = "state root mismatch";
    spdlog::error("Replay produced state root {} but committed root is {}",
                  to_hex(result.state_root),
                  to_hex(last_committed_state_root_));
  } else {
    spdlog::info("Replayed {} transaction(s); state root matches",
                 result.tx_count);
  }
  return result;
}

template <typename Library>
void engine<Library>::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::unique_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

template <typename Library>
std::optional<genesis_t> engine<Library>::genesis() const {
  auto lock = std::shared_lock{mutex_};
  auto state = committed_view();
  auto genesis_key = credo::schema::key::make_genesis_key();
  return state.get<genesis_t>(view(genesis_key));
}

template <typename Library>
std::optional<identity_record_t> engine<Library>::get_identity(
    const principal_t& principal) const {
  auto lock = std::shared_lock{mutex_};
  auto state = committed_view();
  return registry{state}.get_identity(principal);
}

template <typename Library>
std::optional<credential_record_t> engine<Library>::get_credential(
    const principal_t& subject,
    const credential_index_t index) const {
  auto lock = std::shared_lock{mutex_};
  auto state = committed_view();
  return registry{state}.get_credential(subject, index);
}

template <typename Library>
uint64_t engine<Library>::get_credentials_count(
    const principal_t& subject) const {
  auto lock = std::shared_lock{mutex_};
  auto state = committed_view();
  return registry{state}.get_credentials_count(subject);
}

template <typename Library>
bool engine<Library>::is_credential_valid(
    const principal_t& subject,
    const credential_index_t index) const {
  auto lock = std::shared_lock{mutex_};
  auto state = committed_view();
  return registry{state}.is_credential_valid(subject, index,
                                             last_committed_block_time_);
}

template <typename Library>
bool engine<Library>::is_trusted_issuer(const principal_t& principal) const {
  auto lock = std::shared_lock{mutex_};
  auto state = committed_view();
  return registry{state}.is_trusted_issuer(principal);
}

template <typename Library>
std::optional<principal_t> engine<Library>::owner() const {
  auto lock = std::shared_lock{mutex_};
  auto state = committed_view();
  return registry{state}.owner();
}

template <typename Library>
registry_stats_t engine<Library>::get_contract_stats() const {
  auto lock = std::shared_lock{mutex_};
  auto state = committed_view();
  return registry{state}.get_contract_stats();
}

template <typename Library>
uint64_t engine<Library>::nonce(const principal_t& signer) const {
  auto lock = std::shared_lock{mutex_};
  auto state = committed_view();
  auto nonce_key = credo::schema::key::make_nonce_key(signer);
  return state.get<uint64_t>(view(nonce_key)).value_or(0);
}

template <typename Library>
state_cache engine<Library>::committed_view() const {
  return state_cache{encoder_, [this](const bytes_view_t& key) {
                       return storage_.get_raw(key);
                     }};
}

template <typename Library>
void engine<Library>::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_block_time_ = committed->block_time;
    last_committed_state_root_ = committed->state_root;
    return;
  }
  last_committed_state_root_ = make_zero_hash();
  storage_.save_committed_state(credo::storage::committed_state{
      .height = last_committed_height_,
      .block_time = last_committed_block_time_,
      .state_root = last_committed_state_root_});
}

template class engine<credo::storage::rocksdb_storage_tag>;
template class engine<credo::storage::memory_storage_tag>;

}  // namespace credo::execution
