#include <credo/common/critical.hpp>
#include <credo/execution/state_cache.hpp>

#include <iterator>
#include <utility>

namespace credo::execution {

state_cache::state_cache(scale_encoder_t& encoder, state_reader_t reader)
    : encoder_{encoder}, reader_{std::move(reader)} {
  if (!reader_) {
    credo::common::critical("state cache requires a backing reader");
  }
}

std::optional<credo::schema::bytes_t> state_cache::get_raw(
    const credo::schema::bytes_view_t& key) const {
  auto it = writes_.find(credo::schema::make_bytes(key));
  if (it != std::end(writes_)) {
    return it->second;
  }
  return reader_(key);
}

void state_cache::put_raw(const credo::schema::bytes_view_t& key,
                          credo::schema::bytes_t value) {
  writes_.insert_or_assign(credo::schema::make_bytes(key), std::move(value));
}

state_reader_t state_cache::reader() const {
  return [this](const credo::schema::bytes_view_t& key) {
    return get_raw(key);
  };
}

void state_cache::merge(const state_cache& child) {
  for (const auto& [key, value] : child.writes_) {
    writes_.insert_or_assign(key, value);
  }
}

std::vector<credo::storage::key_value_entry_t> state_cache::entries() const {
  return {std::begin(writes_), std::end(writes_)};
}

bool state_cache::empty() const {
  return writes_.empty();
}

}  // namespace credo::execution
