#pragma once

#include <credo/schema/primitives.hpp>
#include <credo/schema/transaction.hpp>
#include <functional>

namespace credo::execution {

using signature_verifier_t =
    std::function<bool(const credo::schema::bytes_view_t& message,
                       const credo::schema::principal_t& signer,
                       const credo::schema::ed25519_signature_t& signature)>;

/// Bytes covered by the envelope signature: SCALE encoding of
/// (version, chain_id, nonce, signer, payload).
credo::schema::bytes_t make_signing_message(
    const credo::schema::transaction_t& tx);

}  // namespace credo::execution
