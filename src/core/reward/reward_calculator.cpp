#include "core/reward/reward_calculator.hpp"

#include <algorithm>
#include <limits>

namespace totem {

std::uint32_t RewardCalculator::multiplier_pct(std::uint64_t streak_length) const {
  if (streak_length <= 1) {
    return std::min<std::uint32_t>(100, policy_.max_multiplier_pct);
  }
  const std::uint64_t steps = streak_length - 1;
  const std::uint64_t cap = policy_.max_multiplier_pct;
  // Saturate before multiplying so very long streaks cannot overflow.
  if (policy_.multiplier_step_pct > 0 && steps > cap / policy_.multiplier_step_pct) {
    return policy_.max_multiplier_pct;
  }
  return static_cast<std::uint32_t>(std::min<std::uint64_t>(100 + steps * policy_.multiplier_step_pct, cap));
}

std::uint64_t RewardCalculator::max_base_points(std::uint32_t max_multiplier_pct) {
  if (max_multiplier_pct <= 100) {
    return std::numeric_limits<std::uint64_t>::max();
  }
  return std::numeric_limits<std::uint64_t>::max() / max_multiplier_pct;
}

std::uint64_t RewardCalculator::scale_pct(std::uint64_t value, std::uint64_t pct) {
  constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
  if (pct == 0) {
    return 0;
  }
  // value * pct / 100 split as (value / 100) * pct + (value % 100) * pct / 100.
  const std::uint64_t whole = value / 100;
  const std::uint64_t rest = value % 100;
  const std::uint64_t rest_part = pct > kMax / 100 ? rest * (pct / 100) + rest * (pct % 100) / 100 : rest * pct / 100;
  if (whole > (kMax - rest_part) / pct) {
    return kMax;
  }
  return whole * pct + rest_part;
}

std::uint64_t RewardCalculator::free_reward(std::uint64_t streak_length, const PeriodMultiplier& period) const {
  return apply_period(scale_pct(policy_.base_points, multiplier_pct(streak_length)), period);
}

std::uint64_t RewardCalculator::premium_reward(std::uint64_t tier_base_points, std::uint64_t streak_length,
                                               const PeriodMultiplier& period) const {
  return apply_period(scale_pct(tier_base_points, multiplier_pct(streak_length)), period);
}

std::uint64_t RewardCalculator::apply_period(std::uint64_t reward, const PeriodMultiplier& period) {
  if (!period.active) {
    return reward;
  }
  return scale_pct(reward, period.multiplier_pct);
}

}  // namespace totem
