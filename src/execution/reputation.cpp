#include <credo/execution/reputation.hpp>
#include <credo/schema/identity_record.hpp>

#include <algorithm>

namespace credo::execution::reputation {

credo::schema::reputation_score_t apply_delta(
    const credo::schema::reputation_score_t current,
    const int32_t delta) {
  const auto bounded = std::min<int64_t>(
      current, static_cast<int64_t>(credo::schema::kMaxReputationScore));
  auto next = int64_t{};
  if (delta > 0) {
    next = std::min<int64_t>(
        bounded + delta,
        static_cast<int64_t>(credo::schema::kMaxReputationScore));
  } else {
    next = std::max<int64_t>(bounded + delta, 0);
  }
  return static_cast<credo::schema::reputation_score_t>(next);
}

}  // namespace credo::execution::reputation
