#include <credo/common/critical.hpp>
#include <credo/execution/credential_store.hpp>
#include <credo/schema/key/engine_keys.hpp>

namespace credo::execution {

credential_store::credential_store(state_cache& state) : state_{state} {}

uint64_t credential_store::count(
    const credo::schema::principal_t& subject) const {
  auto key = credo::schema::key::make_credential_count_key(subject);
  return state_.get<uint64_t>(credo::schema::bytes_view_t{key.data(), key.size()})
      .value_or(0);
}

std::optional<credo::schema::credential_record_t> credential_store::at(
    const credo::schema::principal_t& subject,
    const credo::schema::credential_index_t index) const {
  if (index >= count(subject)) {
    return std::nullopt;
  }
  auto key = credo::schema::key::make_credential_key(subject, index);
  auto credential = state_.get<credo::schema::credential_record_t>(
      credo::schema::bytes_view_t{key.data(), key.size()});
  if (!credential) {
    credo::common::critical("credential missing below the stored count");
  }
  return credential;
}

credo::schema::credential_index_t credential_store::append(
    const credo::schema::principal_t& subject,
    const credo::schema::credential_record_t& credential) {
  const auto index = count(subject);
  auto key = credo::schema::key::make_credential_key(subject, index);
  state_.put(credo::schema::bytes_view_t{key.data(), key.size()}, credential);
  auto count_key = credo::schema::key::make_credential_count_key(subject);
  state_.put(credo::schema::bytes_view_t{count_key.data(), count_key.size()},
             uint64_t{index + 1});
  return index;
}

void credential_store::replace(
    const credo::schema::principal_t& subject,
    const credo::schema::credential_index_t index,
    const credo::schema::credential_record_t& credential) {
  if (index >= count(subject)) {
    credo::common::critical("credential replace past the end of sequence");
  }
  auto key = credo::schema::key::make_credential_key(subject, index);
  state_.put(credo::schema::bytes_view_t{key.data(), key.size()}, credential);
}

}  // namespace credo::execution
