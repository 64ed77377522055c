#include "core/random/random_reward_resolver.hpp"

#include <numeric>
#include <string>
#include <utility>

namespace totem {
namespace {

std::uint64_t total_probability(const std::vector<PremiumTier>& tiers) {
  return std::accumulate(tiers.begin(), tiers.end(), std::uint64_t{0},
                         [](std::uint64_t sum, const PremiumTier& tier) { return sum + tier.probability_pct; });
}

}  // namespace

RandomRewardResolver::RandomRewardResolver() : RandomRewardResolver(BoostConfig{}.premium_tiers) {}

RandomRewardResolver::RandomRewardResolver(std::vector<PremiumTier> tiers) : tiers_(std::move(tiers)) {}

Result RandomRewardResolver::validate_tiers(const std::vector<PremiumTier>& tiers) {
  if (tiers.empty()) {
    return Result::failure(BoostError::InvalidArgument, "Premium tier table is empty.");
  }
  for (const auto& tier : tiers) {
    if (tier.probability_pct == 0) {
      return Result::failure(BoostError::InvalidArgument, "Premium tier has zero probability.");
    }
  }
  if (total_probability(tiers) != 100) {
    return Result::failure(BoostError::InvalidArgument, "Premium tier probabilities must sum to 100.");
  }
  return Result::success("Premium tier table is valid.");
}

const PremiumTier& RandomRewardResolver::tier_for_word(std::uint64_t word) const {
  const std::uint64_t roll = word % total_probability(tiers_);
  std::uint64_t cumulative = 0;
  for (const auto& tier : tiers_) {
    cumulative += tier.probability_pct;
    if (roll < cumulative) {
      return tier;
    }
  }
  return tiers_.back();
}

Result RandomRewardResolver::request(const PremiumBoostDraft& draft, std::uint64_t streak_length,
                                     std::int64_t now_unix, ITreasury& treasury, IPaymentChannel& payments,
                                     IRandomnessOracle& oracle, PremiumRequestReceipt& out) const {
  if (draft.payment < price_) {
    return Result::failure(BoostError::InsufficientPayment,
                           "Premium boost requires a payment of at least " + std::to_string(price_) + ".");
  }

  const auto request_id = oracle.request_random_words(kWordsPerRequest);
  if (!request_id.has_value()) {
    return Result::failure(BoostError::CollaboratorFailure, "Randomness oracle rejected the request.");
  }

  // The treasury must accept the price before any refund leaves; later
  // failures undo what already went out.
  const Result forwarded = treasury.receive(draft.user, price_);
  if (!forwarded.ok) {
    oracle.cancel_request(*request_id);
    return Result::failure(BoostError::CollaboratorFailure, "Treasury rejected premium payment: " + forwarded.message);
  }

  const std::uint64_t excess = draft.payment - price_;
  if (excess > 0) {
    const Result refunded = payments.refund(draft.user, excess);
    if (!refunded.ok) {
      oracle.cancel_request(*request_id);
      const Result reversed = treasury.reverse(draft.user, price_);
      std::string message = "Premium boost refund failed: " + refunded.message;
      if (!reversed.ok) {
        message += " Treasury reversal also failed: " + reversed.message;
      }
      return Result::failure(BoostError::CollaboratorFailure, std::move(message));
    }
  }

  out.pending = {
      .request_id = *request_id,
      .user = draft.user,
      .totem = draft.totem,
      .streak_length = streak_length,
      .requested_unix = now_unix,
  };
  out.forwarded = price_;
  out.refunded = excess;
  return Result::success("Premium boost randomness requested.", std::to_string(*request_id));
}

void RandomRewardResolver::track(PendingPremiumRequest pending) {
  const RequestId id = pending.request_id;
  pending_.insert_or_assign(id, std::move(pending));
}

Result RandomRewardResolver::fulfill(RequestId request_id, const std::vector<std::uint64_t>& words,
                                     const RewardCalculator& calculator, IMeritManager& merit,
                                     PremiumFulfillment& out) {
  const auto it = pending_.find(request_id);
  if (it == pending_.end()) {
    return Result::failure(BoostError::UnknownRequest,
                           "No pending premium boost for request " + std::to_string(request_id) + ".");
  }
  if (words.empty()) {
    return Result::failure(BoostError::InvalidArgument, "Fulfillment carried no random words.");
  }

  const PremiumTier& tier = tier_for_word(words.front());
  const PeriodMultiplier period{
      .active = merit.is_boost_period(),
      .multiplier_pct = merit.boost_period_multiplier_pct(),
  };
  const std::uint64_t reward = calculator.premium_reward(tier.base_points, it->second.streak_length, period);

  const Result credited = merit.credit_merit(it->second.totem, reward);
  if (!credited.ok) {
    return Result::failure(BoostError::CollaboratorFailure, "Premium reward credit failed: " + credited.message);
  }

  out.request = std::move(it->second);
  out.tier = tier;
  out.random_word = words.front();
  out.reward = reward;
  out.boost_period_applied = period.active;
  pending_.erase(it);
  return Result::success("Premium boost fulfilled.", std::to_string(reward));
}

}  // namespace totem
