#pragma once

#include <credo/execution/state_cache.hpp>
#include <credo/schema/primitives.hpp>

#include <optional>

namespace credo::execution {

/// Trusted issuer membership plus the registry owner. Owner and issuer are
/// separate predicates.
class issuer_set final {
 public:
  explicit issuer_set(state_cache& state);

  bool is_trusted(const credo::schema::principal_t& principal) const;
  void set_trusted(const credo::schema::principal_t& principal, bool trusted);

  std::optional<credo::schema::principal_t> owner() const;
  bool is_owner(const credo::schema::principal_t& principal) const;
  void set_owner(const credo::schema::principal_t& principal);

 private:
  state_cache& state_;
};

}  // namespace credo::execution
