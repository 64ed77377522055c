#include "core/streak/streak_tracker.hpp"

#include <algorithm>
#include <utility>

namespace totem {

StreakTracker::StreakTracker(StreakPolicy policy) : policy_(std::move(policy)) {}

StreakAdvance StreakTracker::advance(BoostRecord& record, std::int64_t now_unix, bool is_premium) const {
  const std::int64_t cooldown = policy_.cooldown_seconds;
  StreakAdvance out;

  if (!record.initialized()) {
    record.streak_anchor_at = now_unix;
    record.streak_length = 1;
    out.first_interaction = true;
    note_new_length(record, out);
  } else {
    const std::int64_t elapsed = std::max<std::int64_t>(0, now_unix - record.streak_anchor_at);
    if (elapsed >= 2 * cooldown) {
      const std::int64_t windows = elapsed / cooldown;
      const auto missed = static_cast<std::uint64_t>(windows - 1);
      if (missed <= record.grace_days_available()) {
        record.grace_days_used += missed;
        record.streak_length += 1;
        record.streak_anchor_at += windows * cooldown;
        out.grace_days_consumed = missed;
        out.streak_extended = true;
        note_new_length(record, out);
      } else {
        reset(record, now_unix);
        out.streak_reset = true;
        note_new_length(record, out);
      }
    } else if (elapsed >= cooldown) {
      record.streak_length += 1;
      record.streak_anchor_at += cooldown;
      out.streak_extended = true;
      note_new_length(record, out);
    }
  }

  if (is_premium &&
      (record.total_premium_boosts == 0 || now_unix - record.last_premium_boost_at >= cooldown)) {
    record.grace_days_earned += 1;
    out.grace_day_granted = true;
  }

  out.streak_length = record.streak_length;
  return out;
}

StreakInfo StreakTracker::describe(const BoostRecord& record, std::int64_t now_unix) const {
  StreakInfo info;
  info.streak_length = record.streak_length;
  info.streak_anchor_at = record.streak_anchor_at;
  info.grace_days_earned = record.grace_days_earned;
  info.grace_days_used = record.grace_days_used;
  info.grace_days_available = record.grace_days_available();
  if (record.total_free_boosts > 0) {
    info.next_free_boost_at = record.last_free_boost_at + policy_.cooldown_seconds;
  }

  if (!record.initialized()) {
    info.status = StreakStatus::Uninitialized;
    return info;
  }

  const std::int64_t elapsed = std::max<std::int64_t>(0, now_unix - record.streak_anchor_at);
  const std::int64_t windows = elapsed / policy_.cooldown_seconds;
  info.missed_windows = windows > 1 ? static_cast<std::uint64_t>(windows - 1) : 0;
  if (info.missed_windows == 0) {
    info.status = StreakStatus::Active;
  } else if (info.missed_windows <= info.grace_days_available) {
    info.status = StreakStatus::GraceCovered;
  } else {
    info.status = StreakStatus::Broken;
  }
  return info;
}

void StreakTracker::note_new_length(BoostRecord& record, StreakAdvance& out) const {
  const std::uint64_t length = record.streak_length;
  if (policy_.grace_day_streak_interval > 0 && length % policy_.grace_day_streak_interval == 0) {
    record.grace_days_earned += 1;
    out.interval_grace_days += 1;
  }
  if (std::ranges::find(policy_.milestones, length) != policy_.milestones.end()) {
    record.unminted_badges[length] += 1;
    out.milestones_reached.push_back(length);
  }
}

void StreakTracker::reset(BoostRecord& record, std::int64_t now_unix) const {
  record.streak_length = 1;
  record.streak_anchor_at = now_unix;
  record.grace_days_earned = 0;
  record.grace_days_used = 0;
  record.unminted_badges.clear();
}

}  // namespace totem
