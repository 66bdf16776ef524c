#include <credo/execution/issuer_set.hpp>
#include <credo/schema/key/engine_keys.hpp>

namespace credo::execution {

issuer_set::issuer_set(state_cache& state) : state_{state} {}

bool issuer_set::is_trusted(const credo::schema::principal_t& principal) const {
  auto key = credo::schema::key::make_trusted_issuer_key(principal);
  return state_.get<bool>(credo::schema::bytes_view_t{key.data(), key.size()})
      .value_or(false);
}

void issuer_set::set_trusted(const credo::schema::principal_t& principal,
                             const bool trusted) {
  auto key = credo::schema::key::make_trusted_issuer_key(principal);
  state_.put(credo::schema::bytes_view_t{key.data(), key.size()}, trusted);
}

std::optional<credo::schema::principal_t> issuer_set::owner() const {
  auto key = credo::schema::key::make_owner_key();
  return state_.get<credo::schema::principal_t>(
      credo::schema::bytes_view_t{key.data(), key.size()});
}

bool issuer_set::is_owner(const credo::schema::principal_t& principal) const {
  auto current = owner();
  return current.has_value() && *current == principal;
}

void issuer_set::set_owner(const credo::schema::principal_t& principal) {
  auto key = credo::schema::key::make_owner_key();
  state_.put(credo::schema::bytes_view_t{key.data(), key.size()}, principal);
}

}  // namespace credo::execution
