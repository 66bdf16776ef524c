#pragma once

#include <credo/execution/state_cache.hpp>
#include <credo/schema/identity_record.hpp>
#include <credo/schema/primitives.hpp>

#include <cstdint>
#include <optional>

namespace credo::execution {

/// principal -> identity record, plus the registry-wide identity counter.
class identity_store final {
 public:
  explicit identity_store(state_cache& state);

  std::optional<credo::schema::identity_record_t> find(
      const credo::schema::principal_t& principal) const;
  bool contains(const credo::schema::principal_t& principal) const;
  void put(const credo::schema::principal_t& principal,
           const credo::schema::identity_record_t& identity);

  uint64_t total_count() const;
  void increment_total();

 private:
  state_cache& state_;
};

}  // namespace credo::execution
