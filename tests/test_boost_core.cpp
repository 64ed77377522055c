#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/auth/access_policy.hpp"
#include "core/auth/signature_verifier.hpp"
#include "core/config/boost_config.hpp"
#include "core/crypto/crypto.hpp"
#include "core/external/local_collaborators.hpp"
#include "core/model/errors.hpp"
#include "core/random/random_reward_resolver.hpp"
#include "core/reward/reward_calculator.hpp"
#include "core/streak/streak_tracker.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace {

constexpr std::int64_t kBase = 1'700'000'000;
constexpr std::int64_t kDay = 24 * 60 * 60;
constexpr std::string_view kUser = "user-1";
constexpr std::string_view kManager = "manager";
constexpr std::string_view kTotemA = "totem-a";
constexpr std::string_view kTotemB = "totem-b";
constexpr std::string_view kTotemNft = "totem-nft";

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "totem-boost-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

// Engine wired to the local collaborators with a manual clock.
struct Harness {
  std::shared_ptr<totem::LocalMeritLedger> merit = std::make_shared<totem::LocalMeritLedger>();
  std::shared_ptr<totem::LocalTreasury> treasury = std::make_shared<totem::LocalTreasury>();
  std::shared_ptr<totem::LocalPaymentChannel> payments = std::make_shared<totem::LocalPaymentChannel>();
  std::shared_ptr<totem::LocalBadgeMinter> badges = std::make_shared<totem::LocalBadgeMinter>();
  std::shared_ptr<totem::LocalTotemHoldings> holdings = std::make_shared<totem::LocalTotemHoldings>();
  std::shared_ptr<totem::LocalRandomnessOracle> oracle = std::make_shared<totem::LocalRandomnessOracle>();
  totem::CryptoEngine signer;
  totem::CoreApi api;
  std::int64_t now = kBase;

  totem::Result start(totem::BoostConfig config = {}) {
    assert(signer.initialize().ok);
    assert(signer.generate_identity().ok);
    config.frontend_signer_public_key = signer.identity().public_key;
    if (config.managers.empty()) {
      config.managers = {std::string{kManager}};
    }

    for (const auto totem_id : {kTotemA, kTotemB}) {
      merit->register_totem(totem_id);
      holdings->add_totem(totem_id, totem::TotemAssetKind::Fungible);
      holdings->set_holding(kUser, totem_id, 1000);
    }
    merit->register_totem(kTotemNft);
    holdings->add_totem(kTotemNft, totem::TotemAssetKind::Nft);

    api.set_clock([this]() { return now; });
    oracle->bind([this](totem::RequestId id, const std::vector<std::uint64_t>& words) {
      return api.fulfill_random_words(id, words);
    });
    return api.init(config, {
                                .merit = merit,
                                .treasury = treasury,
                                .payments = payments,
                                .badges = badges,
                                .holdings = holdings,
                                .oracle = oracle,
                            });
  }

  totem::BoostDraft draft(std::string_view totem_id, std::string_view user = kUser) const {
    return {
        .user = std::string{user},
        .totem = std::string{totem_id},
        .timestamp = now,
        .signature = signer.sign_boost_request(user, totem_id, now),
    };
  }

  totem::Result free_boost(std::string_view totem_id, std::string_view user = kUser) {
    return api.boost(draft(totem_id, user));
  }

  totem::Result premium(std::string_view totem_id, std::uint64_t extra = 0) {
    return api.premium_boost({
        .user = std::string{kUser},
        .totem = std::string{totem_id},
        .payment = api.premium_boost_config().price + extra,
    });
  }

  // Boosts once per cooldown window, leaving the clock on the last boost.
  void daily_boosts(std::string_view totem_id, int days) {
    for (int day = 0; day < days; ++day) {
      if (day > 0) {
        now += kDay;
      }
      const totem::Result boosted = free_boost(totem_id);
      assert(boosted.ok);
    }
  }
};

std::size_t count_events(const std::vector<totem::EngineEvent>& events, totem::EventKind kind) {
  std::size_t count = 0;
  for (const auto& event : events) {
    if (event.kind == kind) {
      ++count;
    }
  }
  return count;
}

void test_error_taxonomy() {
  assert(totem::error_category(totem::BoostError::InvalidSignature) == totem::ErrorCategory::Auth);
  assert(totem::error_category(totem::BoostError::SignatureExpired) == totem::ErrorCategory::Auth);
  assert(totem::error_category(totem::BoostError::SignatureAlreadyUsed) == totem::ErrorCategory::Auth);
  assert(totem::error_category(totem::BoostError::NotEnoughTokens) == totem::ErrorCategory::Eligibility);
  assert(totem::error_category(totem::BoostError::NotEnoughTimePassedForFreeBoost) ==
         totem::ErrorCategory::RateLimit);
  assert(totem::error_category(totem::BoostError::InsufficientPayment) == totem::ErrorCategory::Payment);
  assert(totem::error_category(totem::BoostError::MilestoneNotAchieved) == totem::ErrorCategory::Milestone);
  assert(totem::error_category(totem::BoostError::Paused) == totem::ErrorCategory::System);
  assert(totem::category_to_string(totem::ErrorCategory::Auth) == "AuthFailure");
  assert(totem::error_to_string(totem::BoostError::NotEnoughTimePassedForFreeBoost) ==
         "NotEnoughTimePassedForFreeBoost");
}

void test_signature_verifier() {
  totem::CryptoEngine signer;
  assert(signer.initialize().ok);
  assert(signer.generate_identity().ok);
  totem::CryptoEngine stranger;
  assert(stranger.initialize().ok);
  assert(stranger.generate_identity().ok);

  totem::SignatureVerifier verifier;
  const totem::BoostDraft draft{
      .user = "alice",
      .totem = "totem-a",
      .timestamp = kBase,
      .signature = signer.sign_boost_request("alice", "totem-a", kBase),
  };
  assert(verifier.verify(draft, kBase).error == totem::BoostError::InvalidSignature);

  verifier.set_frontend_signer(signer.identity().public_key);
  verifier.set_tolerance_seconds(300);

  totem::BoostDraft forged = draft;
  forged.signature = stranger.sign_boost_request("alice", "totem-a", kBase);
  assert(verifier.verify(forged, kBase).error == totem::BoostError::InvalidSignature);

  totem::BoostDraft other_totem = draft;
  other_totem.totem = "totem-b";
  assert(verifier.verify(other_totem, kBase).error == totem::BoostError::InvalidSignature);

  // Signature checks come before expiry.
  assert(verifier.verify(forged, kBase + 301).error == totem::BoostError::InvalidSignature);
  assert(verifier.verify(draft, kBase + 301).error == totem::BoostError::SignatureExpired);
  assert(verifier.verify(draft, kBase - 301).error == totem::BoostError::SignatureExpired);

  std::string digest;
  assert(verifier.check(draft, kBase + 300, digest).ok);
  assert(verifier.consumed_count() == 0);

  assert(verifier.verify(draft, kBase).ok);
  assert(verifier.consumed(digest));
  assert(verifier.verify(draft, kBase + 10).error == totem::BoostError::SignatureAlreadyUsed);

  totem::CryptoEngine restored;
  assert(restored.adopt_identity(signer.identity().private_key).error == totem::BoostError::NotInitialized);
  assert(restored.initialize().ok);
  assert(restored.adopt_identity("00ff").error == totem::BoostError::InvalidArgument);
  assert(restored.adopt_identity(signer.identity().private_key).ok);
  assert(restored.identity().public_key == signer.identity().public_key);
  assert(restored.sign_boost_request("alice", "totem-a", kBase) == draft.signature);
  assert(totem::verify_detached(totem::boost_request_digest("alice", "totem-a", kBase), draft.signature,
                                restored.identity().public_key));
  assert(!totem::verify_detached(totem::boost_request_digest("alice", "totem-a", kBase + 1), draft.signature,
                                 restored.identity().public_key));

  assert(verifier.purge_expired(kBase + 300) == 0);
  assert(verifier.purge_expired(kBase + 301) == 1);
  assert(verifier.consumed_count() == 0);
}

void test_reward_calculator() {
  const totem::RewardCalculator calculator;
  assert(calculator.multiplier_pct(0) == 100);
  assert(calculator.multiplier_pct(1) == 100);
  assert(calculator.multiplier_pct(2) == 105);
  assert(calculator.multiplier_pct(29) == 240);
  assert(calculator.multiplier_pct(30) == 245);
  assert(calculator.multiplier_pct(10'000) == 245);
  assert(calculator.multiplier_pct(UINT64_MAX) == 245);

  const totem::PeriodMultiplier idle{};
  const totem::PeriodMultiplier mythum{.active = true, .multiplier_pct = 150};
  assert(calculator.free_reward(1, idle) == 100);
  assert(calculator.free_reward(3, idle) == 110);
  assert(calculator.free_reward(3, mythum) == 165);
  assert(calculator.premium_reward(500, 3, idle) == 550);
  assert(calculator.premium_reward(700, 2, mythum) == 1102);
}

void test_streak_tracker() {
  const totem::StreakTracker tracker{{.cooldown_seconds = kDay, .grace_day_streak_interval = 3, .milestones = {2, 4}}};
  totem::BoostRecord record;

  totem::StreakAdvance step = tracker.advance(record, kBase, false);
  assert(step.first_interaction);
  assert(record.streak_length == 1);
  assert(record.streak_anchor_at == kBase);

  step = tracker.advance(record, kBase + kDay - 1, false);
  assert(!step.streak_extended);
  assert(record.streak_length == 1);

  // The anchor moves by whole windows, not to the boost time.
  step = tracker.advance(record, kBase + kDay + 500, false);
  assert(step.streak_extended);
  assert(record.streak_length == 2);
  assert(record.streak_anchor_at == kBase + kDay);
  assert(step.milestones_reached == std::vector<std::uint64_t>{2});
  assert(record.unminted_badges.at(2) == 1);

  step = tracker.advance(record, kBase + 2 * kDay, false);
  assert(record.streak_length == 3);
  assert(step.interval_grace_days == 1);
  assert(record.grace_days_available() == 1);

  totem::StreakInfo info = tracker.describe(record, kBase + 4 * kDay);
  assert(info.status == totem::StreakStatus::GraceCovered);
  assert(info.missed_windows == 1);

  step = tracker.advance(record, kBase + 4 * kDay + 10, false);
  assert(step.grace_days_consumed == 1);
  assert(record.streak_length == 4);
  assert(record.streak_anchor_at == kBase + 4 * kDay);
  assert(record.grace_days_used == 1);
  assert(record.unminted_badges.at(4) == 1);

  info = tracker.describe(record, kBase + 6 * kDay);
  assert(info.status == totem::StreakStatus::Broken);

  step = tracker.advance(record, kBase + 6 * kDay, false);
  assert(step.streak_reset);
  assert(record.streak_length == 1);
  assert(record.streak_anchor_at == kBase + 6 * kDay);
  assert(record.grace_days_earned == 0);
  assert(record.grace_days_used == 0);
  assert(record.unminted_badges.empty());

  assert(tracker.describe(totem::BoostRecord{}, kBase).status == totem::StreakStatus::Uninitialized);
}

void test_replay_and_rate_limit() {
  Harness h;
  assert(h.start().ok);

  const totem::BoostDraft draft = h.draft(kTotemA);
  const totem::Result first = h.api.boost(draft);
  assert(first.ok);
  assert(first.data == "100");

  const totem::Result replay = h.api.boost(draft);
  assert(!replay.ok);
  assert(replay.error == totem::BoostError::SignatureAlreadyUsed);

  h.now += kDay - 60;
  const totem::Result early = h.free_boost(kTotemA);
  assert(early.error == totem::BoostError::NotEnoughTimePassedForFreeBoost);

  h.now += 60;
  assert(h.free_boost(kTotemA).ok);

  // Stale replays fail expiry before the consumed set is consulted.
  assert(h.api.boost(draft).error == totem::BoostError::SignatureExpired);

  const totem::EngineStatusReport status = h.api.status();
  assert(status.rejections.auth == 2);
  assert(status.rejections.rate_limit == 1);
  assert(h.merit->merit_of(kTotemA) == 205);

  const totem::EngineEvent& last = h.api.events().back();
  assert(last.kind == totem::EventKind::FreeBoosted);
  assert(last.unix_ts == h.now);
  assert(last.payload.find("totem=totem-a\n") != std::string::npos);
  assert(last.payload.find("reward=105\n") != std::string::npos);
  assert(last.payload.find("streak_length=2\n") != std::string::npos);
  assert(last.payload.find("multiplier_pct=105\n") != std::string::npos);
}

void test_streak_reward_table() {
  Harness h;
  assert(h.start().ok);

  std::vector<std::string> rewards;
  for (int day = 0; day < 3; ++day) {
    if (day > 0) {
      h.now += kDay;
    }
    const totem::Result boosted = h.free_boost(kTotemA);
    assert(boosted.ok);
    rewards.push_back(boosted.data);
  }
  assert((rewards == std::vector<std::string>{"100", "105", "110"}));

  for (int day = 3; day < 32; ++day) {
    h.now += kDay;
    const totem::Result boosted = h.free_boost(kTotemA);
    assert(boosted.ok);
    if (day >= 29) {
      assert(boosted.data == "245");
    }
  }

  const totem::StreakInfo info = h.api.streak_info(kUser, kTotemA);
  assert(info.streak_length == 32);
  assert(info.multiplier_pct == 245);
  assert(info.status == totem::StreakStatus::Active);
  assert(info.next_free_boost_at == h.now + kDay);
}

void test_grace_banking_and_reset() {
  Harness h;
  assert(h.start().ok);

  h.daily_boosts(kTotemA, 30);
  totem::StreakInfo info = h.api.streak_info(kUser, kTotemA);
  assert(info.streak_length == 30);
  assert(info.grace_days_available == 1);
  assert(h.api.available_badges(kUser, 7) == 1);
  assert(h.api.available_badges(kUser, 30) == 1);

  // One missed window is forgiven by the banked grace day.
  h.now += 2 * kDay;
  assert(h.api.streak_info(kUser, kTotemA).status == totem::StreakStatus::GraceCovered);
  const totem::Result forgiven = h.free_boost(kTotemA);
  assert(forgiven.ok);
  assert(forgiven.data == "245");
  info = h.api.streak_info(kUser, kTotemA);
  assert(info.streak_length == 31);
  assert(info.grace_days_used == 1);
  assert(info.grace_days_available == 0);

  h.now += 2 * kDay;
  assert(h.api.streak_info(kUser, kTotemA).status == totem::StreakStatus::Broken);
  const totem::Result reset = h.free_boost(kTotemA);
  assert(reset.ok);
  assert(reset.data == "100");

  const totem::BoostRecord record = h.api.boost_data(kUser, kTotemA);
  assert(record.streak_length == 1);
  assert(record.streak_anchor_at == h.now);
  assert(record.grace_days_earned == 0);
  assert(record.grace_days_used == 0);
  assert(h.api.available_badges(kUser, 7) == 0);

  const auto& events = h.api.events();
  assert(count_events(events, totem::EventKind::GraceDaysConsumed) == 1);
  assert(count_events(events, totem::EventKind::StreakReset) == 1);
  assert(count_events(events, totem::EventKind::MilestoneReached) == 3);
}

void test_badge_availability_and_mint() {
  Harness h;
  assert(h.start().ok);

  assert(h.api.mint_badge(kUser, 7).error == totem::BoostError::MilestoneNotAchieved);

  h.daily_boosts(kTotemA, 6);
  assert(h.api.available_badges(kUser, 7) == 0);

  h.now += kDay;
  assert(h.free_boost(kTotemA).ok);
  assert(h.api.available_badges(kUser, 7) == 1);

  const totem::Result minted = h.api.mint_badge(kUser, 7);
  assert(minted.ok);
  assert(h.api.available_badges(kUser, 7) == 0);
  assert(h.badges->minted(kUser, 7) == 1);

  const totem::Result again = h.api.mint_badge(kUser, 7);
  assert(!again.ok);
  assert(again.error == totem::BoostError::MilestoneNotAchieved);
  assert(h.badges->total_minted() == 1);
  assert(h.api.status().rejections.milestone == 2);
}

void test_totem_independence() {
  Harness h;
  assert(h.start().ok);

  h.daily_boosts(kTotemA, 7);
  // Same moment, other totem: neither the rate limit nor the consumed set is shared.
  assert(h.free_boost(kTotemB).ok);

  const totem::StreakInfo a = h.api.streak_info(kUser, kTotemA);
  const totem::StreakInfo b = h.api.streak_info(kUser, kTotemB);
  assert(a.streak_length == 7);
  assert(b.streak_length == 1);
  assert(h.api.boost_data(kUser, kTotemA).unminted_badges.at(7) == 1);
  assert(h.api.boost_data(kUser, kTotemB).unminted_badges.empty());

  // Breaking the streak on B leaves A intact.
  h.now += 3 * kDay;
  assert(h.free_boost(kTotemB).ok);
  assert(h.api.boost_data(kUser, kTotemA).streak_length == 7);
  assert(h.api.boost_data(kUser, kTotemA).unminted_badges.at(7) == 1);
  assert(h.merit->merit_of(kTotemB) == 200);
}

void test_eligibility() {
  Harness h;
  assert(h.start().ok);

  h.holdings->set_holding(kUser, kTotemA, 249);
  assert(h.free_boost(kTotemA).error == totem::BoostError::NotEnoughTokens);
  h.holdings->set_holding(kUser, kTotemA, 250);
  assert(h.free_boost(kTotemA).ok);

  assert(h.free_boost("totem-unknown").error == totem::BoostError::NotEnoughTokens);

  assert(h.free_boost(kTotemNft).error == totem::BoostError::NotEnoughTokens);
  h.holdings->set_holding(kUser, kTotemNft, 1);
  assert(h.free_boost(kTotemNft).ok);

  assert(h.premium(kTotemB).ok);
  h.holdings->set_holding(kUser, kTotemB, 0);
  assert(h.premium(kTotemB).error == totem::BoostError::NotEnoughTokens);
  assert(h.api.status().rejections.eligibility == 4);
}

void test_premium_refund_and_fulfillment() {
  Harness h;
  assert(h.start().ok);
  const std::uint64_t price = h.api.premium_boost_config().price;

  const totem::Result short_paid = h.api.premium_boost({
      .user = std::string{kUser},
      .totem = std::string{kTotemA},
      .payment = price - 1,
  });
  assert(short_paid.error == totem::BoostError::InsufficientPayment);
  assert(h.treasury->balance() == 0);
  assert(!h.oracle->last_request_id().has_value());
  assert(!h.api.boost_data(kUser, kTotemA).initialized());

  const totem::Result requested = h.premium(kTotemA, 777);
  assert(requested.ok);
  assert(requested.data == "1");
  assert(h.payments->refunded_to(kUser) == 777);
  assert(h.treasury->received_from(kUser) == price);
  assert(h.treasury->balance() == price);

  // Nothing is credited until the oracle calls back.
  assert(h.merit->merit_of(kTotemA) == 0);
  assert(h.api.pending_premium_requests().size() == 1);
  totem::BoostRecord record = h.api.boost_data(kUser, kTotemA);
  assert(record.total_premium_boosts == 1);
  assert(record.last_premium_boost_at == h.now);
  assert((record.pending_premium_requests == std::vector<totem::RequestId>{1}));

  // The streak moves on before fulfillment; the reward uses the request-time length.
  h.now += kDay;
  assert(h.free_boost(kTotemA).ok);
  assert(h.api.boost_data(kUser, kTotemA).streak_length == 2);

  const totem::Result fulfilled = h.oracle->deliver(1, {99});
  assert(fulfilled.ok);
  assert(fulfilled.data == "3000");
  assert(h.merit->merit_of(kTotemA) == 3000 + 105);
  assert(h.api.pending_premium_requests().empty());
  assert(h.api.boost_data(kUser, kTotemA).pending_premium_requests.empty());

  assert(h.api.fulfill_random_words(1, {5}).error == totem::BoostError::UnknownRequest);
  assert(h.api.fulfill_random_words(42, {5}).error == totem::BoostError::UnknownRequest);

  // No refund is issued for an exact payment.
  assert(h.premium(kTotemA).ok);
  assert(h.payments->refund_count() == 1);
  assert(h.treasury->balance() == 2 * price);
  assert(h.api.fulfill_random_words(2, {}).error == totem::BoostError::InvalidArgument);
  assert(h.oracle->deliver(2, {1, 2}).error == totem::BoostError::InvalidArgument);
  assert(h.api.pending_premium_requests().size() == 1);
  assert(h.oracle->deliver_random(2).ok);
  assert(h.api.pending_premium_requests().empty());
  assert(h.oracle->outstanding().empty());

  const auto& events = h.api.events();
  assert(count_events(events, totem::EventKind::PremiumBoostRequested) == 2);
  assert(count_events(events, totem::EventKind::PremiumBoostFulfilled) == 2);
  assert(h.api.status().rejections.payment == 1);
  assert(h.api.status().rejections.callback == 2);
}

void test_premium_grace_uniqueness() {
  Harness h;
  assert(h.start().ok);

  assert(h.premium(kTotemA).ok);
  h.now += 60 * 60;
  assert(h.premium(kTotemA).ok);
  h.now += 60 * 60;
  assert(h.premium(kTotemA).ok);
  assert(h.api.boost_data(kUser, kTotemA).grace_days_earned == 1);

  h.now += kDay;
  assert(h.premium(kTotemA).ok);
  assert(h.api.boost_data(kUser, kTotemA).grace_days_earned == 2);
  assert(h.api.boost_data(kUser, kTotemA).total_premium_boosts == 4);

  // Premium grace is per totem.
  assert(h.premium(kTotemB).ok);
  assert(h.api.boost_data(kUser, kTotemB).grace_days_earned == 1);
  assert(h.api.pending_premium_requests().size() == 5);
}

void test_boost_period_multiplier() {
  Harness h;
  assert(h.start().ok);

  h.merit->set_boost_period(true, 200);
  const totem::Result boosted = h.free_boost(kTotemA);
  assert(boosted.ok);
  assert(boosted.data == "200");

  assert(h.premium(kTotemA).ok);
  h.merit->set_boost_period(false, 200);
  assert(h.oracle->deliver(1, {0}).ok);
  assert(h.merit->merit_of(kTotemA) == 200 + 500);

  assert(h.premium(kTotemA).ok);
  h.merit->set_boost_period(true, 300);
  const totem::Result fulfilled = h.oracle->deliver(2, {60});
  assert(fulfilled.ok);
  assert(fulfilled.data == "2100");
}

void test_tier_mapping() {
  const totem::RandomRewardResolver resolver;
  assert(resolver.tier_for_word(0).base_points == 500);
  assert(resolver.tier_for_word(49).base_points == 500);
  assert(resolver.tier_for_word(50).base_points == 700);
  assert(resolver.tier_for_word(74).base_points == 700);
  assert(resolver.tier_for_word(75).base_points == 1000);
  assert(resolver.tier_for_word(89).base_points == 1000);
  assert(resolver.tier_for_word(90).base_points == 2000);
  assert(resolver.tier_for_word(96).base_points == 2000);
  assert(resolver.tier_for_word(97).base_points == 3000);
  assert(resolver.tier_for_word(99).base_points == 3000);
  assert(resolver.tier_for_word(100).base_points == 500);
  assert(resolver.tier_for_word(UINT64_MAX).base_points == 500);

  assert(totem::RandomRewardResolver::validate_tiers(resolver.tiers()).ok);
  assert(!totem::RandomRewardResolver::validate_tiers({}).ok);
  assert(!totem::RandomRewardResolver::validate_tiers({{.base_points = 500, .probability_pct = 90}}).ok);
  assert(!totem::RandomRewardResolver::validate_tiers(
              {{.base_points = 500, .probability_pct = 100}, {.base_points = 700, .probability_pct = 0}})
              .ok);
}

void test_pause_and_access_policy() {
  totem::AccessPolicy policy;
  policy.set_managers({" alice ", "", "bob"});
  assert(policy.is_manager("alice"));
  assert(!policy.is_manager(""));
  assert(policy.managers().size() == 2);
  assert(policy.require_manager("mallory", "pause").error == totem::BoostError::Unauthorized);

  Harness h;
  assert(h.start().ok);
  assert((h.api.status().managers == std::vector<std::string>{std::string{kManager}}));
  h.daily_boosts(kTotemA, 7);
  assert(h.premium(kTotemA).ok);

  assert(h.api.pause("mallory").error == totem::BoostError::Unauthorized);
  assert(!h.api.paused());
  assert(h.api.pause(kManager).ok);
  assert(h.api.paused());
  assert(h.api.pause(kManager).error == totem::BoostError::InvalidArgument);

  h.now += kDay;
  assert(h.free_boost(kTotemA).error == totem::BoostError::Paused);
  assert(h.premium(kTotemA).error == totem::BoostError::Paused);
  assert(h.api.mint_badge(kUser, 7).error == totem::BoostError::Paused);

  // Reads and oracle callbacks keep working while paused.
  assert(h.api.available_badges(kUser, 7) == 1);
  assert(h.api.streak_info(kUser, kTotemA).streak_length == 7);
  assert(h.oracle->deliver(1, {0}).ok);

  assert(h.api.unpause("mallory").error == totem::BoostError::Unauthorized);
  assert(h.api.unpause(kManager).ok);
  assert(h.free_boost(kTotemA).ok);
  assert(h.api.mint_badge(kUser, 7).ok);

  const totem::EngineStatusReport status = h.api.status();
  assert(status.rejections.system == 3);
  assert(status.rejections.admin == 3);
  assert(count_events(h.api.events(), totem::EventKind::Paused) == 1);
  assert(count_events(h.api.events(), totem::EventKind::Unpaused) == 1);
}

void test_admin_setters() {
  Harness h;
  assert(h.start().ok);

  assert(h.api.set_boost_reward_points("mallory", 10).error == totem::BoostError::Unauthorized);
  assert(h.api.set_boost_reward_points(kManager, 0).error == totem::BoostError::InvalidArgument);
  assert(h.api.set_boost_reward_points(kManager, 200).ok);
  const totem::Result boosted = h.free_boost(kTotemA);
  assert(boosted.data == "200");

  assert(h.api.set_premium_boost_price(kManager, 0).error == totem::BoostError::InvalidArgument);
  assert(h.api.set_premium_boost_price(kManager, 50).ok);
  assert(h.api.premium_boost_config().price == 50);
  assert(h.api.premium_boost_config().tiers.size() == 5);
  assert(h.premium(kTotemA, 5).ok);
  assert(h.treasury->balance() == 50);
  assert(h.payments->refunded_to(kUser) == 5);

  assert(h.api.set_free_boost_cooldown(kManager, 0).error == totem::BoostError::InvalidArgument);
  assert(h.api.set_free_boost_cooldown(kManager, 60 * 60).ok);
  assert(h.api.free_boost_cooldown() == 60 * 60);
  h.now += 60 * 60;
  const totem::Result hourly = h.free_boost(kTotemA);
  assert(hourly.ok);
  assert(hourly.data == "210");

  totem::CryptoEngine rotated;
  assert(rotated.initialize().ok);
  assert(rotated.generate_identity().ok);
  assert(h.api.set_frontend_signer(kManager, "not-a-key").error == totem::BoostError::InvalidArgument);
  assert(h.api.set_frontend_signer("mallory", rotated.identity().public_key).error ==
         totem::BoostError::Unauthorized);
  assert(h.api.set_frontend_signer(kManager, rotated.identity().public_key).ok);
  h.now += 60 * 60;
  assert(h.free_boost(kTotemA).error == totem::BoostError::InvalidSignature);
  const totem::Result rotated_boost = h.api.boost({
      .user = std::string{kUser},
      .totem = std::string{kTotemA},
      .timestamp = h.now,
      .signature = rotated.sign_boost_request(kUser, kTotemA, h.now),
  });
  assert(rotated_boost.ok);

  auto replacement = std::make_shared<totem::LocalBadgeMinter>();
  assert(h.api.set_badge_nft(kManager, nullptr).error == totem::BoostError::InvalidArgument);
  assert(h.api.set_badge_nft("mallory", replacement).error == totem::BoostError::Unauthorized);
  assert(h.api.set_badge_nft(kManager, replacement).ok);

  assert(count_events(h.api.events(), totem::EventKind::ConfigUpdated) == 5);
  assert(h.api.status().rejections.admin == 8);
}

void test_badge_minter_replacement() {
  Harness h;
  assert(h.start().ok);
  h.daily_boosts(kTotemA, 7);

  auto replacement = std::make_shared<totem::LocalBadgeMinter>();
  assert(h.api.set_badge_nft(kManager, replacement).ok);
  assert(h.api.mint_badge(kUser, 7).ok);
  assert(replacement->minted(kUser, 7) == 1);
  assert(h.badges->total_minted() == 0);
}

void test_failed_calls_leave_no_trace() {
  Harness h;
  assert(h.start().ok);

  // Holdings know the totem but the merit ledger does not, so crediting fails.
  constexpr std::string_view kUnregistered = "totem-unregistered";
  h.holdings->add_totem(kUnregistered, totem::TotemAssetKind::Fungible);
  h.holdings->set_holding(kUser, kUnregistered, 1000);

  const totem::BoostDraft draft = h.draft(kUnregistered);
  const totem::Result failed = h.api.boost(draft);
  assert(failed.error == totem::BoostError::CollaboratorFailure);
  assert(!h.api.boost_data(kUser, kUnregistered).initialized());
  assert(h.api.status().consumed_signature_count == 0);
  assert(h.api.status().record_count == 0);

  h.merit->register_totem(kUnregistered);
  assert(h.api.boost(draft).ok);
  assert(h.api.boost_data(kUser, kUnregistered).streak_length == 1);

  h.oracle->set_available(false);
  const totem::Result no_oracle = h.premium(kTotemA, 10);
  assert(no_oracle.error == totem::BoostError::CollaboratorFailure);
  assert(h.treasury->balance() == 0);
  assert(h.payments->refund_count() == 0);
  assert(!h.api.boost_data(kUser, kTotemA).initialized());
  assert(h.api.pending_premium_requests().empty());
  assert(h.api.status().rejections.external == 2);
}

void test_premium_settlement_failures() {
  totem::RandomRewardResolver resolver;
  resolver.set_price(100);
  totem::LocalTreasury closed_treasury;
  closed_treasury.set_accepting(false);
  totem::LocalPaymentChannel channel;
  totem::LocalRandomnessOracle standalone_oracle;
  totem::PremiumRequestReceipt receipt;
  const totem::Result refused = resolver.request({.user = "alice", .totem = "totem-a", .payment = 150}, 1, kBase,
                                                 closed_treasury, channel, standalone_oracle, receipt);
  assert(refused.error == totem::BoostError::CollaboratorFailure);
  assert(channel.refund_count() == 0);
  assert(closed_treasury.balance() == 0);
  assert(standalone_oracle.outstanding().empty());

  Harness h;
  assert(h.start().ok);
  h.daily_boosts(kTotemA, 2);
  const totem::BoostRecord before = h.api.boost_data(kUser, kTotemA);
  const std::uint64_t price = h.api.premium_boost_config().price;

  h.treasury->set_accepting(false);
  assert(h.premium(kTotemA, 50).error == totem::BoostError::CollaboratorFailure);
  assert(h.payments->refunded_to(kUser) == 0);
  assert(h.oracle->outstanding().empty());

  // A refund failure hands the forwarded price back.
  h.treasury->set_accepting(true);
  h.payments->set_available(false);
  assert(h.premium(kTotemA, 50).error == totem::BoostError::CollaboratorFailure);
  assert(h.treasury->balance() == 0);
  assert(h.treasury->received_from(kUser) == 0);
  assert(h.payments->refund_count() == 0);
  assert(h.oracle->outstanding().empty());

  const totem::BoostRecord after = h.api.boost_data(kUser, kTotemA);
  assert(after.total_premium_boosts == before.total_premium_boosts);
  assert(after.grace_days_earned == before.grace_days_earned);
  assert(after.pending_premium_requests.empty());
  assert(h.api.pending_premium_requests().empty());
  assert(count_events(h.api.events(), totem::EventKind::PremiumBoostRequested) == 0);
  assert(h.api.status().rejections.external == 2);

  h.payments->set_available(true);
  assert(h.premium(kTotemA, 50).ok);
  assert(h.treasury->balance() == price);
  assert(h.payments->refunded_to(kUser) == 50);
  assert(h.oracle->outstanding().size() == 1);
}

void test_reward_overflow_bounds() {
  totem::RewardCalculator calculator;
  calculator.set_base_points(100'000'000'000'000'000ULL);
  const totem::PeriodMultiplier idle{};
  assert(calculator.free_reward(30, idle) == 245'000'000'000'000'000ULL);
  assert(calculator.premium_reward(100'000'000'000'000'000ULL, 30, idle) == 245'000'000'000'000'000ULL);

  const totem::PeriodMultiplier huge{.active = true, .multiplier_pct = UINT64_MAX};
  assert(totem::RewardCalculator::apply_period(UINT64_MAX / 2, {.active = true, .multiplier_pct = 300}) ==
         UINT64_MAX);
  assert(totem::RewardCalculator::apply_period(1'000, huge) == UINT64_MAX);
  assert(totem::RewardCalculator::apply_period(99, huge) == UINT64_MAX / 100 * 99 + 99 * (UINT64_MAX % 100) / 100);

  const std::uint64_t limit = totem::RewardCalculator::max_base_points(245);
  assert(limit == UINT64_MAX / 245);
  assert(totem::RewardCalculator::max_base_points(100) == UINT64_MAX);

  Harness h;
  assert(h.start().ok);
  assert(h.api.set_boost_reward_points(kManager, limit + 1).error == totem::BoostError::InvalidArgument);
  assert(h.api.boost_reward_points() == 100);
  assert(h.api.set_boost_reward_points(kManager, limit).ok);
  h.daily_boosts(kTotemA, 1);
  assert(h.merit->merit_of(kTotemA) == limit);

  totem::BoostConfig config;
  config.boost_reward_points = limit + 1;
  assert(totem::validate_boost_config(config).error == totem::BoostError::InvalidArgument);
  config.boost_reward_points = 100;
  config.premium_tiers = {{.base_points = UINT64_MAX, .probability_pct = 100}};
  assert(totem::validate_boost_config(config).error == totem::BoostError::InvalidArgument);
  config.premium_tiers = totem::BoostConfig{}.premium_tiers;
  config.premium_boost_price = 0;
  assert(totem::validate_boost_config(config).error == totem::BoostError::InvalidArgument);

  const auto dir = temp_dir("overflow-setting");
  {
    std::ofstream out(dir / "state.snapshot");
    out << "format_version=2\nsetting\tboost_reward_points\t" << (limit + 1) << '\n';
  }
  totem::BoostConfig persisted;
  persisted.state_dir = dir.string();
  Harness restored;
  assert(restored.start(persisted).error == totem::BoostError::StorageFailure);
}

void test_restart_without_checkpoint() {
  const auto dir = temp_dir("restart");
  totem::BoostConfig config;
  config.state_dir = dir.string();

  Harness first;
  assert(first.start(config).ok);
  first.daily_boosts(kTotemA, 7);
  const totem::BoostDraft last_draft = first.draft(kTotemA);
  assert(first.api.mint_badge(kUser, 7).ok);
  assert(first.premium(kTotemB).ok);

  // The engine goes away without an explicit checkpoint.
  Harness second;
  second.now = first.now + 60;
  const totem::Result restarted = second.start(config);
  assert(restarted.ok);
  assert(restarted.data == "loaded");

  assert(second.api.boost(last_draft).error == totem::BoostError::SignatureAlreadyUsed);
  assert(second.merit->credits().empty());

  const totem::BoostRecord record = second.api.boost_data(kUser, kTotemA);
  assert(record.streak_length == 7);
  assert(record.total_free_boosts == 7);
  assert(second.api.available_badges(kUser, 7) == 0);
  assert(second.api.minted_badges(kUser, 7) == 1);
  assert(second.api.pending_premium_requests().size() == 1);
  assert(second.api.events().size() == first.api.events().size());
  assert(second.api.status().consumed_signature_count == first.api.status().consumed_signature_count);

  assert(second.api.fulfill_random_words(1, {0}).ok);
  assert(second.api.boost_data(kUser, kTotemB).pending_premium_requests.empty());

  Harness third;
  third.now = second.now;
  assert(third.start(config).ok);
  assert(third.api.pending_premium_requests().empty());
  assert(third.api.minted_badges(kUser, 7) == 1);
}

void test_requires_init() {
  totem::CoreApi api;
  assert(api.boost({}).error == totem::BoostError::NotInitialized);
  assert(api.pause("manager").error == totem::BoostError::NotInitialized);
  assert(!api.status().initialized);
  assert(totem::CoreApi::interface_version() == "boost-system-v1");

  totem::BoostConfig config;
  assert(api.init(config, {}).error == totem::BoostError::InvalidArgument);
}

void test_config_file() {
  const auto dir = temp_dir("config");
  const auto path = dir / "boost.conf";
  {
    std::ofstream out(path);
    out << "# boost engine settings\n"
        << "free_boost_cooldown_seconds = 3600\n"
        << "boost_reward_points = 250\n"
        << "managers = alice, bob\n"
        << "milestones = 3, 5, 9\n"
        << "premium_tiers = 100:60, 200:40\n"
        << "\n"
        << "min_fungible_holding = 10\n";
  }

  totem::BoostConfig config;
  const totem::Result loaded = totem::load_boost_config_file(path.string(), config);
  assert(loaded.ok);
  assert(config.free_boost_cooldown_seconds == 3600);
  assert(config.boost_reward_points == 250);
  assert((config.managers == std::vector<std::string>{"alice", "bob"}));
  assert((config.milestones == std::vector<std::uint64_t>{3, 5, 9}));
  assert(config.premium_tiers.size() == 2);
  assert(config.premium_tiers[1].base_points == 200);
  assert(config.min_fungible_holding == 10);
  assert(config.signature_tolerance_seconds == 300);

  const auto bad_key = dir / "bad_key.conf";
  {
    std::ofstream out(bad_key);
    out << "boost_reward_points = 1\nspeed = fast\n";
  }
  totem::BoostConfig untouched;
  assert(totem::load_boost_config_file(bad_key.string(), untouched).error == totem::BoostError::InvalidArgument);
  assert(untouched.boost_reward_points == 100);

  const auto bad_tiers = dir / "bad_tiers.conf";
  {
    std::ofstream out(bad_tiers);
    out << "premium_tiers = 100:60, 200:30\n";
  }
  assert(!totem::load_boost_config_file(bad_tiers.string(), untouched).ok);

  const auto bad_number = dir / "bad_number.conf";
  {
    std::ofstream out(bad_number);
    out << "free_boost_cooldown_seconds = 1d\n";
  }
  assert(!totem::load_boost_config_file(bad_number.string(), untouched).ok);
  assert(!totem::load_boost_config_file((dir / "missing.conf").string(), untouched).ok);

  totem::BoostConfig unsorted;
  unsorted.milestones = {14, 7};
  assert(!totem::validate_boost_config(unsorted).ok);
  totem::BoostConfig zero_cooldown;
  zero_cooldown.free_boost_cooldown_seconds = 0;
  assert(!totem::validate_boost_config(zero_cooldown).ok);
  totem::BoostConfig bad_signer;
  bad_signer.frontend_signer_public_key = "abcd";
  assert(!totem::validate_boost_config(bad_signer).ok);
  assert(totem::validate_boost_config(totem::BoostConfig{}).ok);
}

void test_checkpoint_and_restore() {
  const auto dir = temp_dir("checkpoint");
  totem::BoostConfig config;
  config.state_dir = dir.string();

  Harness first;
  const totem::Result started = first.start(config);
  assert(started.ok);
  assert(started.data == "absent");

  first.daily_boosts(kTotemA, 2);
  const totem::BoostDraft last_draft = first.draft(kTotemA);
  assert(first.premium(kTotemA).ok);
  assert(first.api.set_boost_reward_points(kManager, 150).ok);
  assert(first.api.pause(kManager).ok);
  assert(first.free_boost(kTotemB).error == totem::BoostError::Paused);

  const totem::Result saved = first.api.checkpoint();
  assert(saved.ok);
  assert(std::filesystem::exists(dir / "state.snapshot"));
  assert(std::filesystem::exists(dir / "events.log"));
  assert(std::filesystem::exists(dir / "rejections.log"));
  assert(first.api.status().last_checkpoint_unix == first.now);

  Harness second;
  second.now = first.now;
  const totem::Result restored = second.start(config);
  assert(restored.ok);
  assert(restored.data == "loaded");

  const totem::EngineStatusReport status = second.api.status();
  assert(status.paused);
  assert(status.snapshot_format_version == 2);
  assert(!status.migrated_from_legacy_snapshot);
  assert(status.pending_premium_requests == 1);
  assert(status.consumed_signature_count == first.api.status().consumed_signature_count);
  assert(second.api.events().size() == first.api.events().size());

  const totem::BoostRecord record = second.api.boost_data(kUser, kTotemA);
  assert(record.streak_length == 2);
  assert(record.total_free_boosts == 2);
  assert(record.total_premium_boosts == 1);
  assert(record.grace_days_earned == 1);
  assert((record.pending_premium_requests == std::vector<totem::RequestId>{1}));

  assert(second.api.unpause(kManager).ok);
  // The restored signer and consumed set still reject the old authorization.
  assert(second.api.boost(last_draft).error == totem::BoostError::SignatureAlreadyUsed);

  const totem::Result fulfilled = second.api.fulfill_random_words(1, {0});
  assert(fulfilled.ok);
  assert(fulfilled.data == "525");
  assert(second.api.boost_data(kUser, kTotemA).pending_premium_requests.empty());

  assert(second.api.set_frontend_signer(kManager, second.signer.identity().public_key).ok);
  second.now += kDay;
  const totem::Result boosted = second.free_boost(kTotemA);
  assert(boosted.ok);
  assert(boosted.data == "165");

  Harness memory_only;
  assert(memory_only.start().ok);
  assert(memory_only.api.checkpoint().error == totem::BoostError::StorageFailure);
}

void test_legacy_snapshot_migration() {
  const auto dir = temp_dir("legacy");
  {
    std::ofstream out(dir / "state.snapshot");
    out << "# totem-boost state snapshot\n"
        << "format_version=1\n"
        << "paused\t0\n"
        << "record\t" << totem::util::to_hex(kUser) << '\t' << totem::util::to_hex(kTotemA) << '\t' << kBase
        << "\t0\t" << kBase << "\t7\t1\t0\t" << (1U | (2U << 8U)) << '\n';
  }

  totem::BoostConfig config;
  config.state_dir = dir.string();
  Harness h;
  h.now = kBase + kDay;
  const totem::Result started = h.start(config);
  assert(started.ok);
  assert(started.data == "migrated");

  const totem::EngineStatusReport status = h.api.status();
  assert(status.migrated_from_legacy_snapshot);
  assert(status.snapshot_format_version == 2);

  assert(h.api.available_badges(kUser, 7) == 1);
  assert(h.api.available_badges(kUser, 14) == 2);
  totem::BoostRecord record = h.api.boost_data(kUser, kTotemA);
  assert(record.total_free_boosts == 1);
  assert(record.total_premium_boosts == 0);
  assert(record.grace_days_available() == 1);

  const totem::Result boosted = h.free_boost(kTotemA);
  assert(boosted.ok);
  assert(boosted.data == "135");
  assert(h.api.boost_data(kUser, kTotemA).streak_length == 8);

  assert(h.api.checkpoint().ok);
  std::ifstream in(dir / "state.snapshot");
  const std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  assert(text.find("format_version=2") != std::string::npos);
  assert(text.find("7:1,14:2") != std::string::npos);
}

void test_unsupported_snapshot() {
  const auto dir = temp_dir("unsupported");
  {
    std::ofstream out(dir / "state.snapshot");
    out << "format_version=9\n";
  }
  totem::BoostConfig config;
  config.state_dir = dir.string();
  Harness h;
  assert(h.start(config).error == totem::BoostError::StorageFailure);

  const auto garbled = temp_dir("garbled");
  {
    std::ofstream out(garbled / "state.snapshot");
    out << "format_version=2\nrecord\tzz\n";
  }
  config.state_dir = garbled.string();
  Harness g;
  assert(g.start(config).error == totem::BoostError::StorageFailure);
}

}  // namespace

int main() {
  test_error_taxonomy();
  test_signature_verifier();
  test_reward_calculator();
  test_streak_tracker();
  test_replay_and_rate_limit();
  test_streak_reward_table();
  test_grace_banking_and_reset();
  test_badge_availability_and_mint();
  test_totem_independence();
  test_eligibility();
  test_premium_refund_and_fulfillment();
  test_premium_grace_uniqueness();
  test_boost_period_multiplier();
  test_tier_mapping();
  test_pause_and_access_policy();
  test_admin_setters();
  test_badge_minter_replacement();
  test_failed_calls_leave_no_trace();
  test_premium_settlement_failures();
  test_reward_overflow_bounds();
  test_restart_without_checkpoint();
  test_requires_init();
  test_config_file();
  test_checkpoint_and_restore();
  test_legacy_snapshot_migration();
  test_unsupported_snapshot();

  std::cout << "totem_boost_unit_tests passed\n";
  return 0;
}
