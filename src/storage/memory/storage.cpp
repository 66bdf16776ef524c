#include <credo/storage/memory/storage.hpp>

#include <algorithm>

namespace credo::storage {

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  static_cast<void>(path);
  auto store = storage<memory_storage_tag>{};
  store.table = std::make_shared<detail::memory_table>();
  return store;
}

std::optional<credo::schema::bytes_t> storage<memory_storage_tag>::get_raw(
    const credo::schema::bytes_view_t& key) const {
  if (!table) {
    credo::common::critical("memory storage is not initialized");
  }
  auto lock = std::scoped_lock{table->mutex};
  auto it = table->entries.find(credo::schema::make_bytes(key));
  if (it == std::end(table->entries)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<committed_state>
storage<memory_storage_tag>::load_committed_state() const {
  if (!table) {
    credo::common::critical("memory storage is not initialized");
  }
  auto lock = std::scoped_lock{table->mutex};
  return table->committed;
}

void storage<memory_storage_tag>::save_committed_state(
    const committed_state& state) const {
  if (!table) {
    credo::common::critical("memory storage is not initialized");
  }
  auto lock = std::scoped_lock{table->mutex};
  table->committed = state;
}

std::vector<key_value_entry_t> storage<memory_storage_tag>::list_by_prefix(
    const credo::schema::bytes_view_t& prefix) const {
  if (!table) {
    credo::common::critical("memory storage is not initialized");
  }
  auto entries = std::vector<key_value_entry_t>{};
  auto lock = std::scoped_lock{table->mutex};
  for (auto it = table->entries.lower_bound(credo::schema::make_bytes(prefix));
       it != std::end(table->entries); ++it) {
    const auto& key = it->first;
    if (key.size() < prefix.size() ||
        !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
      break;
    }
    entries.push_back(*it);
  }
  return entries;
}

void storage<memory_storage_tag>::commit_batch(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  if (!table) {
    credo::common::critical("memory storage is not initialized");
  }
  auto lock = std::scoped_lock{table->mutex};
  for (const auto& [key, value] : entries) {
    table->entries.insert_or_assign(key, value);
  }
  table->committed = state;
}

}  // namespace credo::storage
