#pragma once

#include <cstdint>

namespace totem {

struct RewardPolicy {
  std::uint64_t base_points = 100;
  std::uint32_t multiplier_step_pct = 5;
  std::uint32_t max_multiplier_pct = 245;
};

// Boost period ("Mythum") state as reported by the merit manager.
struct PeriodMultiplier {
  bool active = false;
  std::uint64_t multiplier_pct = 100;
};

class RewardCalculator {
public:
  explicit RewardCalculator(RewardPolicy policy = {}) : policy_(policy) {}

  void set_base_points(std::uint64_t points) { policy_.base_points = points; }
  [[nodiscard]] const RewardPolicy& policy() const { return policy_; }

  [[nodiscard]] std::uint32_t multiplier_pct(std::uint64_t streak_length) const;
  [[nodiscard]] std::uint64_t free_reward(std::uint64_t streak_length, const PeriodMultiplier& period) const;
  [[nodiscard]] std::uint64_t premium_reward(std::uint64_t tier_base_points, std::uint64_t streak_length,
                                             const PeriodMultiplier& period) const;
  // Saturates at UINT64_MAX instead of wrapping.
  [[nodiscard]] static std::uint64_t apply_period(std::uint64_t reward, const PeriodMultiplier& period);
  [[nodiscard]] static std::uint64_t scale_pct(std::uint64_t value, std::uint64_t pct);

  // Largest base that cannot overflow once the full streak multiplier applies.
  [[nodiscard]] static std::uint64_t max_base_points(std::uint32_t max_multiplier_pct);

private:
  RewardPolicy policy_;
};

}  // namespace totem
