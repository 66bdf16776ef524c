#pragma once
#include <credo/schema/add_credential.hpp>
#include <credo/schema/add_trusted_issuer.hpp>
#include <credo/schema/create_identity.hpp>
#include <credo/schema/primitives.hpp>
#include <credo/schema/remove_trusted_issuer.hpp>
#include <credo/schema/revoke_credential.hpp>
#include <credo/schema/update_profile.hpp>
#include <credo/schema/verify_identity.hpp>
#include <variant>

namespace credo::schema {

using transaction_payload_t = std::variant<create_identity_t,
                                           update_profile_t,
                                           verify_identity_t,
                                           add_credential_t,
                                           revoke_credential_t,
                                           add_trusted_issuer_t,
                                           remove_trusted_issuer_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  // Caller principal for every authorization check.
  principal_t signer{};
  transaction_payload_t payload{};
  ed25519_signature_t signature{};
};

using transaction_t = transaction<1>;

}  // namespace credo::schema
