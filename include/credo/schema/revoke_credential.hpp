#pragma once
#include <credo/schema/primitives.hpp>

namespace credo::schema {

template <uint16_t Version>
struct revoke_credential;

template <>
struct revoke_credential<1> final {
  uint16_t version{1};
  principal_t subject{};
  credential_index_t index{};
};

using revoke_credential_t = revoke_credential<1>;

}  // namespace credo::schema
