#pragma once

#include <gtest/gtest.h>

#include <credo/crypto/verify.hpp>
#include <credo/execution/engine.hpp>
#include <credo/execution/signature_verifier.hpp>
#include <credo/schema/encoding/scale/encoder.hpp>
#include <credo/schema/event_record.hpp>
#include <credo/schema/transaction.hpp>
#include <credo/testing/common.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace credo::testing {

using scale_encoder_t = credo::execution::scale_encoder_t;

inline credo::schema::transaction_t make_transaction(
    const credo::schema::hash32_t& chain_id,
    const uint64_t nonce,
    const credo::schema::principal_t& signer,
    const credo::schema::transaction_payload_t& payload) {
  return credo::schema::transaction_t{
      .version = 1,
      .chain_id = chain_id,
      .nonce = nonce,
      .signer = signer,
      .payload = payload,
      .signature = credo::schema::ed25519_signature_t{}};
}

inline credo::schema::bytes_t encode_transaction(
    const credo::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

/// Sign `tx` in place with a raw Ed25519 key.
inline void sign_transaction(
    credo::schema::transaction_t& tx,
    const credo::crypto::ed25519_private_key_t& private_key) {
  auto message = credo::execution::make_signing_message(tx);
  auto signature = credo::crypto::sign(
      credo::schema::bytes_view_t{message.data(), message.size()},
      private_key);
  ASSERT_TRUE(signature.has_value());
  tx.signature = *signature;
}

template <typename Library>
credo::schema::hash32_t chain_id_from_engine(
    const credo::execution::engine<Library>& engine) {
  const auto query = engine.query("/engine/info", {});
  EXPECT_EQ(query.code, 0u);
  auto encoder = scale_encoder_t{};
  const auto decoded = encoder.decode<std::tuple<
      int64_t, credo::schema::hash32_t, credo::schema::hash32_t>>(
      credo::schema::bytes_view_t{query.value.data(), query.value.size()});
  return std::get<2>(decoded);
}

/// Run `tx` alone in the next block and commit it.
///
/// The nonce is replaced with the next one the engine expects from the
/// signer, so tests only spell out nonces when they are the point.
template <typename Library>
credo::schema::transaction_result_t finalize_single(
    credo::execution::engine<Library>& engine,
    const credo::schema::timestamp_milliseconds_t block_time,
    const credo::schema::transaction_t& tx) {
  auto normalized = tx;
  normalized.nonce = engine.nonce(tx.signer) + 1;
  const auto height =
      static_cast<uint64_t>(engine.info().last_block_height) + 1;
  auto block =
      engine.finalize_block(height, block_time, {encode_transaction(normalized)});
  EXPECT_EQ(block.tx_results.size(), 1u);
  auto result = block.tx_results.front();
  (void)engine.commit();
  return result;
}

template <typename Library>
std::vector<credo::schema::event_record_t> query_events(
    const credo::execution::engine<Library>& engine,
    const uint64_t from_id,
    const uint64_t to_id) {
  auto encoder = scale_encoder_t{};
  const auto query_key = encoder.encode(std::tuple{from_id, to_id});
  const auto result = engine.query(
      "/events/range",
      credo::schema::bytes_view_t{query_key.data(), query_key.size()});
  EXPECT_EQ(result.code, 0u);
  return encoder.decode<std::vector<credo::schema::event_record_t>>(
      credo::schema::bytes_view_t{result.value.data(), result.value.size()});
}

inline std::optional<std::string> find_attribute(
    const credo::schema::transaction_event_t& event,
    const std::string_view key) {
  for (const auto& attribute : event.attributes) {
    if (attribute.key == key) {
      return attribute.value;
    }
  }
  return std::nullopt;
}

inline std::vector<std::string> event_types(
    const credo::schema::transaction_result_t& result) {
  auto types = std::vector<std::string>{};
  for (const auto& event : result.events) {
    types.push_back(event.type);
  }
  return types;
}

}  // namespace credo::testing
