#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "core/external/collaborators.hpp"
#include "core/model/types.hpp"
#include "core/reward/reward_calculator.hpp"

namespace totem {

struct PremiumRequestReceipt {
  PendingPremiumRequest pending;
  std::uint64_t forwarded = 0;
  std::uint64_t refunded = 0;
};

struct PremiumFulfillment {
  PendingPremiumRequest request;
  PremiumTier tier;
  std::uint64_t random_word = 0;
  std::uint64_t reward = 0;
  bool boost_period_applied = false;
};

// Two-phase premium boost: request() settles payment and places the oracle
// request, fulfill() maps the delivered word onto a reward tier. Rewards are
// always computed from the streak snapshot taken at request time.
class RandomRewardResolver {
public:
  static constexpr std::uint32_t kWordsPerRequest = 1;

  RandomRewardResolver();
  explicit RandomRewardResolver(std::vector<PremiumTier> tiers);

  static Result validate_tiers(const std::vector<PremiumTier>& tiers);

  void set_price(std::uint64_t price) { price_ = price; }
  [[nodiscard]] std::uint64_t price() const { return price_; }
  [[nodiscard]] const std::vector<PremiumTier>& tiers() const { return tiers_; }
  [[nodiscard]] const PremiumTier& tier_for_word(std::uint64_t word) const;

  Result request(const PremiumBoostDraft& draft, std::uint64_t streak_length, std::int64_t now_unix,
                 ITreasury& treasury, IPaymentChannel& payments, IRandomnessOracle& oracle,
                 PremiumRequestReceipt& out) const;
  void track(PendingPremiumRequest pending);

  Result fulfill(RequestId request_id, const std::vector<std::uint64_t>& words,
                 const RewardCalculator& calculator, IMeritManager& merit, PremiumFulfillment& out);

  [[nodiscard]] bool is_pending(RequestId request_id) const { return pending_.contains(request_id); }
  [[nodiscard]] const std::map<RequestId, PendingPremiumRequest>& pending() const { return pending_; }
  void restore(std::map<RequestId, PendingPremiumRequest> pending) { pending_ = std::move(pending); }

private:
  std::vector<PremiumTier> tiers_;
  std::uint64_t price_ = 0;
  std::map<RequestId, PendingPremiumRequest> pending_;
};

}  // namespace totem
