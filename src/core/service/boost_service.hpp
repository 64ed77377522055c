#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/auth/access_policy.hpp"
#include "core/auth/signature_verifier.hpp"
#include "core/badge/badge_ledger.hpp"
#include "core/crypto/crypto.hpp"
#include "core/external/collaborators.hpp"
#include "core/model/types.hpp"
#include "core/random/random_reward_resolver.hpp"
#include "core/reward/reward_calculator.hpp"
#include "core/storage/store.hpp"
#include "core/streak/streak_tracker.hpp"

namespace totem {

class BoostService {
public:
  using Clock = std::function<std::int64_t()>;

  Result init(const BoostConfig& config, Collaborators collaborators);
  void set_clock(Clock clock) { clock_ = std::move(clock); }

  Result boost(const BoostDraft& draft);
  Result premium_boost(const PremiumBoostDraft& draft);
  // Oracle callback. Accepted while paused so paid requests are never stranded.
  Result fulfill_random_words(RequestId request_id, const std::vector<std::uint64_t>& words);
  Result mint_badge(std::string_view user, std::uint64_t milestone);

  Result set_boost_reward_points(std::string_view caller, std::uint64_t points);
  Result set_premium_boost_price(std::string_view caller, std::uint64_t price);
  Result set_free_boost_cooldown(std::string_view caller, std::int64_t seconds);
  Result set_frontend_signer(std::string_view caller, std::string_view public_key_hex);
  Result set_badge_nft(std::string_view caller, std::shared_ptr<IBadgeMinter> minter);
  Result pause(std::string_view caller);
  Result unpause(std::string_view caller);

  Result checkpoint();

  [[nodiscard]] StreakInfo streak_info(std::string_view user, std::string_view totem) const;
  [[nodiscard]] BoostRecord boost_data(std::string_view user, std::string_view totem) const;
  [[nodiscard]] std::uint64_t available_badges(std::string_view user, std::uint64_t milestone) const;
  [[nodiscard]] std::uint64_t minted_badges(std::string_view user, std::uint64_t milestone) const;
  [[nodiscard]] PremiumBoostConfig premium_boost_config() const;
  [[nodiscard]] std::int64_t free_boost_cooldown() const;
  [[nodiscard]] std::uint64_t boost_reward_points() const;
  [[nodiscard]] std::string frontend_signer() const { return verifier_.frontend_signer(); }
  [[nodiscard]] std::vector<PendingPremiumRequest> pending_premium_requests() const;
  [[nodiscard]] const std::vector<EngineEvent>& events() const { return store_.events(); }
  [[nodiscard]] EngineStatusReport status() const;
  [[nodiscard]] bool paused() const { return paused_; }

private:
  Result ensure_initialized() const;
  Result ensure_not_paused() const;
  Result ensure_holding(std::string_view user, std::string_view totem) const;
  Result ensure_manager(std::string_view caller, std::string_view operation) const;
  Result reject(std::string_view operation, Result failure);
  Result note_config_update(std::string_view caller, std::string_view setting, std::string value);

  void journal_advance(std::string_view user, std::string_view totem, const StreakAdvance& advance,
                       std::int64_t now_unix);
  void unlink_pending(const PendingPremiumRequest& request);
  [[nodiscard]] PeriodMultiplier current_period() const;
  [[nodiscard]] std::int64_t now() const;

  // Rewrites the snapshot after a committed mutation so a restart never
  // loses state the journal already reports.
  void persist();
  [[nodiscard]] StateSnapshot snapshot() const;

  Result apply_settings(const std::map<std::string, std::string>& settings);
  [[nodiscard]] std::map<std::string, std::string> settings() const;

  BoostConfig config_;
  Collaborators collaborators_;
  Clock clock_;

  bool initialized_ = false;
  bool paused_ = false;
  std::uint32_t loaded_snapshot_version_ = 0;
  bool migrated_from_legacy_ = false;
  RejectionCounters rejections_;

  CryptoEngine crypto_;
  Store store_;
  AccessPolicy access_;
  SignatureVerifier verifier_;
  StreakTracker streak_;
  RewardCalculator rewards_;
  RandomRewardResolver resolver_;
  BadgeLedger badges_;
};

}  // namespace totem
