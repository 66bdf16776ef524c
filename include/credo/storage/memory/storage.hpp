#pragma once
#include <credo/common/critical.hpp>
#include <credo/storage/storage.hpp>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <string_view>

// In-process backend used by tests and history replay. Copies share the same
// table, mirroring a handle to an open database.
namespace credo::storage {

struct memory_storage_tag {};

namespace detail {

struct memory_table final {
  mutable std::mutex mutex;
  std::map<credo::schema::bytes_t, credo::schema::bytes_t> entries;
  std::optional<committed_state> committed;
};

}  // namespace detail

template <>
struct storage<memory_storage_tag> final {
  std::shared_ptr<detail::memory_table> table;

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

/// The path is ignored; every call yields a fresh empty table.
template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<memory_storage_tag>::get(
    Encoder& encoder,
    const credo::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      credo::schema::bytes_view_t{value->data(), value->size()})};
}

}  // namespace credo::storage
