#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace totem {

enum class BoostError {
  None,
  InvalidSignature,
  SignatureExpired,
  SignatureAlreadyUsed,
  NotEnoughTokens,
  NotEnoughTimePassedForFreeBoost,
  InsufficientPayment,
  MilestoneNotAchieved,
  Paused,
  Unauthorized,
  InvalidArgument,
  UnknownRequest,
  CollaboratorFailure,
  NotInitialized,
  StorageFailure,
};

enum class ErrorCategory {
  None,
  Auth,
  Eligibility,
  RateLimit,
  Payment,
  Milestone,
  System,
  Admin,
  Callback,
  External,
};

struct Result {
  bool ok = false;
  std::string message;
  std::string data;
  BoostError error = BoostError::None;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, std::move(msg), std::move(payload), BoostError::None};
  }

  static Result failure(std::string msg) {
    return {false, std::move(msg), {}, BoostError::CollaboratorFailure};
  }

  static Result failure(BoostError code, std::string msg) {
    return {false, std::move(msg), {}, code};
  }
};

using RequestId = std::uint64_t;

// Unminted badge counts keyed by milestone (streak length).
using BadgeCounts = std::map<std::uint64_t, std::uint64_t>;

struct BoostRecord {
  std::int64_t last_free_boost_at = 0;
  std::int64_t last_premium_boost_at = 0;
  std::int64_t streak_anchor_at = 0;
  std::uint64_t streak_length = 0;
  std::uint64_t grace_days_earned = 0;
  std::uint64_t grace_days_used = 0;
  std::uint64_t total_free_boosts = 0;
  std::uint64_t total_premium_boosts = 0;
  BadgeCounts unminted_badges;
  std::vector<RequestId> pending_premium_requests;

  [[nodiscard]] bool initialized() const { return streak_length > 0; }
  [[nodiscard]] std::uint64_t grace_days_available() const {
    return grace_days_earned > grace_days_used ? grace_days_earned - grace_days_used : 0;
  }
};

// A user's records keyed by totem.
using TotemRecords = std::map<std::string, BoostRecord, std::less<>>;
// Badges minted per (user, milestone).
using MintedBadgeCounts = std::map<std::pair<std::string, std::uint64_t>, std::uint64_t>;

struct PendingPremiumRequest {
  RequestId request_id = 0;
  std::string user;
  std::string totem;
  std::uint64_t streak_length = 0;
  std::int64_t requested_unix = 0;
};

struct PremiumTier {
  std::uint64_t base_points = 0;
  std::uint32_t probability_pct = 0;
};

enum class TotemAssetKind {
  Fungible,
  Nft,
};

struct TotemHolding {
  bool known_totem = false;
  TotemAssetKind kind = TotemAssetKind::Fungible;
  std::uint64_t amount = 0;
};

struct BoostDraft {
  std::string user;
  std::string totem;
  std::int64_t timestamp = 0;
  std::string signature;
};

struct PremiumBoostDraft {
  std::string user;
  std::string totem;
  std::uint64_t payment = 0;
};

enum class StreakStatus {
  Uninitialized,
  Active,
  GraceCovered,
  Broken,
};

struct StreakInfo {
  StreakStatus status = StreakStatus::Uninitialized;
  std::uint64_t streak_length = 0;
  std::int64_t streak_anchor_at = 0;
  std::uint64_t grace_days_earned = 0;
  std::uint64_t grace_days_used = 0;
  std::uint64_t grace_days_available = 0;
  std::uint32_t multiplier_pct = 100;
  std::int64_t next_free_boost_at = 0;
  std::uint64_t missed_windows = 0;
};

struct PremiumBoostConfig {
  std::uint64_t price = 0;
  std::vector<PremiumTier> tiers;
};

enum class EventKind {
  FreeBoosted,
  PremiumBoostRequested,
  PremiumBoostFulfilled,
  GraceDayEarned,
  GraceDaysConsumed,
  StreakReset,
  MilestoneReached,
  BadgeMinted,
  ConfigUpdated,
  Paused,
  Unpaused,
};

struct EngineEvent {
  std::uint64_t sequence = 0;
  EventKind kind = EventKind::FreeBoosted;
  std::int64_t unix_ts = 0;
  std::string payload;
};

struct RejectionCounters {
  std::uint64_t auth = 0;
  std::uint64_t eligibility = 0;
  std::uint64_t rate_limit = 0;
  std::uint64_t payment = 0;
  std::uint64_t milestone = 0;
  std::uint64_t system = 0;
  std::uint64_t admin = 0;
  std::uint64_t callback = 0;
  std::uint64_t external = 0;
};

struct EngineStatusReport {
  bool initialized = false;
  bool paused = false;
  std::string interface_version;
  std::string engine_version;
  std::vector<std::string> managers;
  std::size_t user_count = 0;
  std::size_t record_count = 0;
  std::size_t pending_premium_requests = 0;
  std::size_t consumed_signature_count = 0;
  std::size_t journal_size = 0;
  RejectionCounters rejections;
  std::string state_dir;
  std::string events_file;
  std::string snapshot_file;
  std::uint32_t snapshot_format_version = 0;
  bool migrated_from_legacy_snapshot = false;
  std::uint64_t journal_write_failures = 0;
  std::int64_t last_checkpoint_unix = 0;
};

struct BoostConfig {
  std::string state_dir;
  std::string frontend_signer_public_key;
  std::vector<std::string> managers;

  std::int64_t free_boost_cooldown_seconds = 24 * 60 * 60;
  std::int64_t signature_tolerance_seconds = 5 * 60;
  std::uint64_t boost_reward_points = 100;
  std::uint64_t premium_boost_price = 10'000'000;
  std::uint64_t grace_day_streak_interval = 30;
  std::uint32_t multiplier_step_pct = 5;
  std::uint32_t max_multiplier_pct = 245;
  std::vector<std::uint64_t> milestones = {7, 14, 30, 60, 100, 180, 365};
  std::vector<PremiumTier> premium_tiers = {
      {.base_points = 500, .probability_pct = 50},
      {.base_points = 700, .probability_pct = 25},
      {.base_points = 1000, .probability_pct = 15},
      {.base_points = 2000, .probability_pct = 7},
      {.base_points = 3000, .probability_pct = 3},
  };
  std::uint64_t min_fungible_holding = 250;
};

}  // namespace totem
