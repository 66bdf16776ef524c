#pragma once

#include <credo/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Schema type: genesis.
// Registry workflow: explicit one-time initialization; seeds the owner as
// both owner and trusted issuer.
namespace credo::schema {

/// BLAKE3 of this seed is the chain id tools use when none is given.
inline constexpr std::string_view kDefaultChainIdSeed{"credo-registry-chain"};

template <uint16_t Version>
struct genesis;

template <>
struct genesis<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  principal_t owner{};
  timestamp_milliseconds_t genesis_time{};
};

using genesis_t = genesis<1>;

}  // namespace credo::schema
