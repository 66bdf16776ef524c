#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <credo/common/critical.hpp>
#include <credo/schema/encoding/scale/encoder.hpp>
#include <credo/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string>
#include <string_view>
#include <tuple>

namespace credo::storage {

namespace detail {

using encoder_t = credo::schema::encoding::encoder<
    credo::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

inline credo::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const credo::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline void require_open(
    const std::shared_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    credo::common::critical("RocksDB database is not initialized");
  }
}

/// Abort with `what` unless `status` is ok.
inline void require_ok(const ROCKSDB_NAMESPACE::Status& status,
                       const std::string_view what) {
  if (!status.ok()) {
    spdlog::error("{}: {}", what, status.ToString());
    credo::common::critical(std::string{what});
  }
}

inline credo::schema::bytes_t encode_committed_state(
    const committed_state& state) {
  auto encoder = encoder_t{};
  return encoder.encode(
      std::tuple{state.height, state.block_time, state.state_root});
}

inline std::optional<committed_state> decode_committed_state(
    const credo::schema::bytes_view_t& bytes) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<
      std::tuple<int64_t, credo::schema::timestamp_milliseconds_t,
                 credo::schema::hash32_t>>(bytes);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .block_time = std::get<1>(decoded.value()),
                         .state_root = std::get<2>(decoded.value())};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::shared_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const credo::schema::bytes_view_t& key) const;

  std::optional<credo::schema::bytes_t> get_raw(
      const credo::schema::bytes_view_t& key) const;

  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const credo::schema::bytes_view_t& prefix) const;
  void commit_batch(const std::vector<key_value_entry_t>& entries,
                    const committed_state& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const credo::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      credo::schema::bytes_view_t{value->data(), value->size()})};
}

inline std::optional<credo::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const credo::schema::bytes_view_t& key) const {
  detail::require_open(database);
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  detail::require_ok(status, "failed to read key from RocksDB");
  return credo::schema::bytes_t(std::begin(value), std::end(value));
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = get_raw(credo::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(detail::kCommittedStateKey.data()),
      detail::kCommittedStateKey.size()});
  if (!raw) {
    return std::nullopt;
  }
  auto state = detail::decode_committed_state(
      credo::schema::bytes_view_t{raw->data(), raw->size()});
  if (!state) {
    credo::common::critical("failed to decode committed state");
  }
  return state;
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  detail::require_open(database);
  auto encoded = detail::encode_committed_state(state);
  detail::require_ok(
      database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                    std::string{detail::kCommittedStateKey},
                    detail::to_slice(credo::schema::bytes_view_t{
                        encoded.data(), encoded.size()})),
      "failed to persist committed state");
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const credo::schema::bytes_view_t& prefix) const {
  detail::require_open(database);
  const auto target = detail::to_slice(prefix);
  auto entries = std::vector<key_value_entry_t>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(target);
       iterator->Valid() && iterator->key().starts_with(target);
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  detail::require_ok(iterator->status(), "RocksDB prefix scan failed");
  return entries;
}

/// Entries and the committed marker land in one synced write batch.
inline void storage<rocksdb_storage_tag>::commit_batch(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  detail::require_open(database);
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    detail::require_ok(
        batch.Put(detail::to_slice(key), detail::to_slice(value)),
        "failed to stage key in commit batch");
  }
  auto encoded = detail::encode_committed_state(state);
  detail::require_ok(
      batch.Put(std::string{detail::kCommittedStateKey},
                detail::to_slice(credo::schema::bytes_view_t{
                    encoded.data(), encoded.size()})),
      "failed to stage committed state in commit batch");

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  detail::require_ok(database->Write(write_options, &batch),
                     "failed to commit write batch to RocksDB");
}

}  // namespace credo::storage
