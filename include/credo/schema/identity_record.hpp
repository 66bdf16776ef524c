#pragma once

#include <credo/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: identity record.
// Registry workflow: self-owned profile of one principal; the reputation
// score is bounded by kMaxReputationScore after every mutation.
namespace credo::schema {

inline constexpr reputation_score_t kInitialReputationScore{100};
inline constexpr reputation_score_t kMaxReputationScore{1000};

template <uint16_t Version>
struct identity_record;

template <>
struct identity_record<1> final {
  uint16_t version{1};
  std::string name;
  std::string email;
  // Content reference to the off-ledger profile payload; may be empty.
  std::string profile_hash;
  reputation_score_t reputation_score{kInitialReputationScore};
  bool is_verified{};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t last_updated{};
};

using identity_record_t = identity_record<1>;

}  // namespace credo::schema
