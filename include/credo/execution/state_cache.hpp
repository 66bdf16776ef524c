#pragma once

#include <credo/schema/encoding/scale/encoder.hpp>
#include <credo/schema/primitives.hpp>
#include <credo/storage/storage.hpp>

#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace credo::execution {

using scale_encoder_t = credo::schema::encoding::encoder<
    credo::schema::encoding::scale_encoder_tag>;

/// Raw read callback into the layer underneath a cache (committed storage or
/// an enclosing cache).
using state_reader_t = std::function<std::optional<credo::schema::bytes_t>(
    const credo::schema::bytes_view_t&)>;

/// Write-back overlay over a state reader.
///
/// Writes stay in the overlay until the owner merges them into an enclosing
/// cache or flushes them to storage. Dropping the cache discards them, which
/// is how a failed transaction leaves no trace.
class state_cache final {
 public:
  state_cache(scale_encoder_t& encoder, state_reader_t reader);

  state_cache(const state_cache&) = delete;
  state_cache& operator=(const state_cache&) = delete;
  state_cache(state_cache&&) = default;
  state_cache& operator=(state_cache&&) = delete;

  std::optional<credo::schema::bytes_t> get_raw(
      const credo::schema::bytes_view_t& key) const;
  void put_raw(const credo::schema::bytes_view_t& key,
               credo::schema::bytes_t value);

  template <typename T>
  std::optional<T> get(const credo::schema::bytes_view_t& key) const;

  template <typename T>
  void put(const credo::schema::bytes_view_t& key, const T& value);

  /// Reader over this cache, for stacking a child overlay on top of it.
  state_reader_t reader() const;

  /// Take over every write of a child overlay.
  void merge(const state_cache& child);

  /// Pending writes in key order.
  std::vector<credo::storage::key_value_entry_t> entries() const;

  bool empty() const;
  scale_encoder_t& encoder() const { return encoder_; }

 private:
  scale_encoder_t& encoder_;
  state_reader_t reader_;
  std::map<credo::schema::bytes_t, credo::schema::bytes_t> writes_;
};

template <typename T>
std::optional<T> state_cache::get(
    const credo::schema::bytes_view_t& key) const {
  auto raw = get_raw(key);
  if (!raw) {
    return std::nullopt;
  }
  return encoder_.template decode<T>(
      credo::schema::bytes_view_t{raw->data(), raw->size()});
}

template <typename T>
void state_cache::put(const credo::schema::bytes_view_t& key, const T& value) {
  put_raw(key, encoder_.encode(value));
}

}  // namespace credo::execution
