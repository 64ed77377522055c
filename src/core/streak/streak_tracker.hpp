#pragma once

#include <cstdint>
#include <vector>

#include "core/model/app_meta.hpp"
#include "core/model/types.hpp"

namespace totem {

struct StreakPolicy {
  std::int64_t cooldown_seconds = kSecondsPerDay;
  std::uint64_t grace_day_streak_interval = 30;
  std::vector<std::uint64_t> milestones = {7, 14, 30, 60, 100, 180, 365};
};

struct StreakAdvance {
  std::uint64_t streak_length = 0;
  bool first_interaction = false;
  bool streak_extended = false;
  bool streak_reset = false;
  bool grace_day_granted = false;
  std::uint64_t interval_grace_days = 0;
  std::uint64_t grace_days_consumed = 0;
  std::vector<std::uint64_t> milestones_reached;
};

// Per-(user, totem) streak and grace-day state machine. The anchor only ever
// moves in whole cooldown steps so that windows stay aligned to the first
// boost of the streak.
class StreakTracker {
public:
  explicit StreakTracker(StreakPolicy policy = {});

  void set_cooldown_seconds(std::int64_t seconds) { policy_.cooldown_seconds = seconds; }
  [[nodiscard]] const StreakPolicy& policy() const { return policy_; }

  StreakAdvance advance(BoostRecord& record, std::int64_t now_unix, bool is_premium) const;
  [[nodiscard]] StreakInfo describe(const BoostRecord& record, std::int64_t now_unix) const;

private:
  void note_new_length(BoostRecord& record, StreakAdvance& out) const;
  void reset(BoostRecord& record, std::int64_t now_unix) const;

  StreakPolicy policy_;
};

}  // namespace totem
