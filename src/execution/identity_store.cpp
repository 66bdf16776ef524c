#include <credo/execution/identity_store.hpp>
#include <credo/schema/key/engine_keys.hpp>

namespace credo::execution {

identity_store::identity_store(state_cache& state) : state_{state} {}

std::optional<credo::schema::identity_record_t> identity_store::find(
    const credo::schema::principal_t& principal) const {
  auto key = credo::schema::key::make_identity_key(principal);
  return state_.get<credo::schema::identity_record_t>(
      credo::schema::bytes_view_t{key.data(), key.size()});
}

bool identity_store::contains(
    const credo::schema::principal_t& principal) const {
  auto key = credo::schema::key::make_identity_key(principal);
  return state_.get_raw(credo::schema::bytes_view_t{key.data(), key.size()})
      .has_value();
}

void identity_store::put(const credo::schema::principal_t& principal,
                         const credo::schema::identity_record_t& identity) {
  auto key = credo::schema::key::make_identity_key(principal);
  state_.put(credo::schema::bytes_view_t{key.data(), key.size()}, identity);
}

uint64_t identity_store::total_count() const {
  auto key = credo::schema::key::make_identity_count_key();
  return state_.get<uint64_t>(credo::schema::bytes_view_t{key.data(), key.size()})
      .value_or(0);
}

void identity_store::increment_total() {
  auto key = credo::schema::key::make_identity_count_key();
  state_.put(credo::schema::bytes_view_t{key.data(), key.size()},
             total_count() + 1);
}

}  // namespace credo::execution
