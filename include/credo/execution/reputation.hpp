#pragma once

#include <credo/schema/primitives.hpp>
#include <cstdint>

namespace credo::execution::reputation {

inline constexpr int32_t kVerifiedDelta{100};
inline constexpr int32_t kUnverifiedDelta{-50};
inline constexpr int32_t kCredentialAddedDelta{50};
inline constexpr int32_t kCredentialRevokedDelta{-30};

/// Saturating score update bounded to [0, kMaxReputationScore].
///
/// Positive deltas add up to the ceiling; zero and negative deltas subtract
/// |delta| down to the floor.
credo::schema::reputation_score_t apply_delta(
    credo::schema::reputation_score_t current,
    int32_t delta);

}  // namespace credo::execution::reputation
