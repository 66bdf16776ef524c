#pragma once

#include <credo/schema/primitives.hpp>
#include <optional>

namespace credo::crypto {

using ed25519_private_key_t = std::array<uint8_t, 32>;

/// True when the linked OpenSSL provides Ed25519.
bool available();

bool verify_signature(const credo::schema::bytes_view_t& message,
                      const credo::schema::principal_t& signer,
                      const credo::schema::ed25519_signature_t& signature);

/// Derive the public key (principal) for a raw Ed25519 private key.
std::optional<credo::schema::principal_t> derive_public_key(
    const ed25519_private_key_t& private_key);

/// Sign message with a raw Ed25519 private key. Used by tools and tests.
std::optional<credo::schema::ed25519_signature_t> sign(
    const credo::schema::bytes_view_t& message,
    const ed25519_private_key_t& private_key);

}  // namespace credo::crypto
