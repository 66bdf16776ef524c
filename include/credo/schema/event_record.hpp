#pragma once

#include <credo/schema/event_type.hpp>
#include <credo/schema/primitives.hpp>
#include <credo/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <vector>

namespace credo::schema {

template <uint16_t Version>
struct event_record;

/// Persisted audit-log row. `event_id` is a dense sequence starting at 1.
template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t height{};
  uint32_t tx_index{};
  event_type_t type{};
  principal_t principal{};
  std::vector<transaction_event_attribute_t> attributes;
  timestamp_milliseconds_t recorded_at{};
};

using event_record_t = event_record<1>;

}  // namespace credo::schema
