#pragma once

#include <cstdint>

namespace credo::schema {

template <uint16_t Version>
struct registry_stats;

template <>
struct registry_stats<1> final {
  uint16_t version{1};
  uint64_t total_identities{};
};

using registry_stats_t = registry_stats<1>;

}  // namespace credo::schema
