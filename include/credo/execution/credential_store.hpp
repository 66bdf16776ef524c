#pragma once

#include <credo/execution/state_cache.hpp>
#include <credo/schema/credential_record.hpp>
#include <credo/schema/primitives.hpp>

#include <cstdint>
#include <optional>

namespace credo::execution {

/// Per-subject append-only credential sequence. Index is the stable id.
class credential_store final {
 public:
  explicit credential_store(state_cache& state);

  uint64_t count(const credo::schema::principal_t& subject) const;
  std::optional<credo::schema::credential_record_t> at(
      const credo::schema::principal_t& subject,
      credo::schema::credential_index_t index) const;

  /// Append and return the new index (the length before the append).
  credo::schema::credential_index_t append(
      const credo::schema::principal_t& subject,
      const credo::schema::credential_record_t& credential);

  /// Overwrite an existing element; critical if index is past the end.
  void replace(const credo::schema::principal_t& subject,
               credo::schema::credential_index_t index,
               const credo::schema::credential_record_t& credential);

 private:
  state_cache& state_;
};

}  // namespace credo::execution
