#include "core/service/boost_service.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "core/config/boost_config.hpp"
#include "core/model/app_meta.hpp"
#include "core/model/errors.hpp"
#include "core/util/canonical.hpp"

namespace totem {
namespace {

constexpr std::string_view kSettingRewardPoints = "boost_reward_points";
constexpr std::string_view kSettingPremiumPrice = "premium_boost_price";
constexpr std::string_view kSettingCooldown = "free_boost_cooldown_seconds";
constexpr std::string_view kSettingFrontendSigner = "frontend_signer";

void bump(RejectionCounters& counters, ErrorCategory category) {
  switch (category) {
    case ErrorCategory::Auth:
      ++counters.auth;
      break;
    case ErrorCategory::Eligibility:
      ++counters.eligibility;
      break;
    case ErrorCategory::RateLimit:
      ++counters.rate_limit;
      break;
    case ErrorCategory::Payment:
      ++counters.payment;
      break;
    case ErrorCategory::Milestone:
      ++counters.milestone;
      break;
    case ErrorCategory::Admin:
      ++counters.admin;
      break;
    case ErrorCategory::Callback:
      ++counters.callback;
      break;
    case ErrorCategory::External:
      ++counters.external;
      break;
    case ErrorCategory::None:
    case ErrorCategory::System:
      ++counters.system;
      break;
  }
}

Result require_subject(std::string_view user, std::string_view totem) {
  if (util::trim_copy(user).empty() || util::trim_copy(totem).empty()) {
    return Result::failure(BoostError::InvalidArgument, "A user and a totem are required.");
  }
  return Result::success();
}

}  // namespace

Result BoostService::init(const BoostConfig& config, Collaborators collaborators) {
  initialized_ = false;

  if (const Result valid = validate_boost_config(config); !valid.ok) {
    return valid;
  }
  if (!collaborators.merit || !collaborators.treasury || !collaborators.payments || !collaborators.badges ||
      !collaborators.holdings || !collaborators.oracle) {
    return Result::failure(BoostError::InvalidArgument, "Init failed: every external collaborator is required.");
  }

  if (const Result crypto = crypto_.initialize(); !crypto.ok) {
    return crypto;
  }

  config_ = config;
  collaborators_ = std::move(collaborators);
  paused_ = false;
  loaded_snapshot_version_ = 0;
  migrated_from_legacy_ = false;
  rejections_ = {};

  access_.set_managers(config_.managers);
  verifier_ = SignatureVerifier{};
  verifier_.set_frontend_signer(config_.frontend_signer_public_key);
  verifier_.set_tolerance_seconds(config_.signature_tolerance_seconds);
  streak_ = StreakTracker{StreakPolicy{
      .cooldown_seconds = config_.free_boost_cooldown_seconds,
      .grace_day_streak_interval = config_.grace_day_streak_interval,
      .milestones = config_.milestones,
  }};
  rewards_ = RewardCalculator{RewardPolicy{
      .base_points = config_.boost_reward_points,
      .multiplier_step_pct = config_.multiplier_step_pct,
      .max_multiplier_pct = config_.max_multiplier_pct,
  }};
  resolver_ = RandomRewardResolver{config_.premium_tiers};
  resolver_.set_price(config_.premium_boost_price);
  badges_ = BadgeLedger{};

  store_ = Store{};
  if (const Result opened = store_.open(config_.state_dir); !opened.ok) {
    return opened;
  }

  StateSnapshot snapshot;
  const Result loaded = store_.load_snapshot(config_.milestones, snapshot);
  if (!loaded.ok) {
    return loaded;
  }
  if (loaded.data != "absent") {
    if (const Result applied = apply_settings(snapshot.settings); !applied.ok) {
      return applied;
    }
    verifier_.restore(std::move(snapshot.consumed_signatures));
    resolver_.restore(std::move(snapshot.pending));
    badges_.restore(std::move(snapshot.minted_badges));
    paused_ = snapshot.paused;
    loaded_snapshot_version_ = snapshot.format_version;
    migrated_from_legacy_ = snapshot.migrated_from_legacy;
  }

  initialized_ = true;
  return Result::success("Boost engine initialized.", loaded.data);
}

Result BoostService::boost(const BoostDraft& draft) {
  constexpr std::string_view op = "boost";
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return reject(op, ready);
  }
  if (const Result running = ensure_not_paused(); !running.ok) {
    return reject(op, running);
  }
  if (const Result subject = require_subject(draft.user, draft.totem); !subject.ok) {
    return reject(op, subject);
  }
  if (const Result held = ensure_holding(draft.user, draft.totem); !held.ok) {
    return reject(op, held);
  }

  const std::int64_t now_unix = now();
  std::string digest;
  if (const Result verified = verifier_.check(draft, now_unix, digest); !verified.ok) {
    return reject(op, verified);
  }

  BoostRecord record = store_.record_or_default(draft.user, draft.totem);
  if (record.total_free_boosts > 0 && now_unix - record.last_free_boost_at < streak_.policy().cooldown_seconds) {
    return reject(op, Result::failure(BoostError::NotEnoughTimePassedForFreeBoost,
                                      "Free boost is available again at " +
                                          std::to_string(record.last_free_boost_at +
                                                         streak_.policy().cooldown_seconds) +
                                          "."));
  }

  const StreakAdvance advance = streak_.advance(record, now_unix, false);
  const PeriodMultiplier period = current_period();
  const std::uint64_t reward = rewards_.free_reward(advance.streak_length, period);

  const Result credited = collaborators_.merit->credit_merit(draft.totem, reward);
  if (!credited.ok) {
    return reject(op, Result::failure(BoostError::CollaboratorFailure, "Merit credit failed: " + credited.message));
  }

  record.last_free_boost_at = now_unix;
  ++record.total_free_boosts;
  store_.put_record(draft.user, draft.totem, std::move(record));
  verifier_.consume(std::move(digest), draft.timestamp);
  verifier_.purge_expired(now_unix);

  journal_advance(draft.user, draft.totem, advance, now_unix);
  store_.append_event(EventKind::FreeBoosted, now_unix,
                      {{"user", draft.user},
                       {"totem", draft.totem},
                       {"reward", std::to_string(reward)},
                       {"streak_length", std::to_string(advance.streak_length)},
                       {"multiplier_pct", std::to_string(rewards_.multiplier_pct(advance.streak_length))},
                       {"boost_period", period.active ? "1" : "0"}});
  persist();
  return Result::success("Free boost credited.", std::to_string(reward));
}

Result BoostService::premium_boost(const PremiumBoostDraft& draft) {
  constexpr std::string_view op = "premium_boost";
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return reject(op, ready);
  }
  if (const Result running = ensure_not_paused(); !running.ok) {
    return reject(op, running);
  }
  if (const Result subject = require_subject(draft.user, draft.totem); !subject.ok) {
    return reject(op, subject);
  }
  if (const Result held = ensure_holding(draft.user, draft.totem); !held.ok) {
    return reject(op, held);
  }

  const std::int64_t now_unix = now();
  BoostRecord record = store_.record_or_default(draft.user, draft.totem);
  const StreakAdvance advance = streak_.advance(record, now_unix, true);

  PremiumRequestReceipt receipt;
  const Result requested = resolver_.request(draft, advance.streak_length, now_unix, *collaborators_.treasury,
                                             *collaborators_.payments, *collaborators_.oracle, receipt);
  if (!requested.ok) {
    return reject(op, requested);
  }

  const RequestId request_id = receipt.pending.request_id;
  record.last_premium_boost_at = now_unix;
  ++record.total_premium_boosts;
  record.pending_premium_requests.push_back(request_id);
  store_.put_record(draft.user, draft.totem, std::move(record));
  resolver_.track(std::move(receipt.pending));

  journal_advance(draft.user, draft.totem, advance, now_unix);
  store_.append_event(EventKind::PremiumBoostRequested, now_unix,
                      {{"user", draft.user},
                       {"totem", draft.totem},
                       {"request_id", std::to_string(request_id)},
                       {"price", std::to_string(receipt.forwarded)},
                       {"refunded", std::to_string(receipt.refunded)},
                       {"streak_length", std::to_string(advance.streak_length)}});
  persist();
  return Result::success("Premium boost requested.", std::to_string(request_id));
}

Result BoostService::fulfill_random_words(RequestId request_id, const std::vector<std::uint64_t>& words) {
  constexpr std::string_view op = "fulfill_random_words";
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return reject(op, ready);
  }

  PremiumFulfillment fulfillment;
  const Result fulfilled = resolver_.fulfill(request_id, words, rewards_, *collaborators_.merit, fulfillment);
  if (!fulfilled.ok) {
    return reject(op, fulfilled);
  }

  unlink_pending(fulfillment.request);
  store_.append_event(EventKind::PremiumBoostFulfilled, now(),
                      {{"user", fulfillment.request.user},
                       {"totem", fulfillment.request.totem},
                       {"request_id", std::to_string(request_id)},
                       {"tier_points", std::to_string(fulfillment.tier.base_points)},
                       {"reward", std::to_string(fulfillment.reward)},
                       {"streak_length", std::to_string(fulfillment.request.streak_length)},
                       {"boost_period", fulfillment.boost_period_applied ? "1" : "0"}});
  persist();
  return fulfilled;
}

Result BoostService::mint_badge(std::string_view user, std::uint64_t milestone) {
  constexpr std::string_view op = "mint_badge";
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return reject(op, ready);
  }
  if (const Result running = ensure_not_paused(); !running.ok) {
    return reject(op, running);
  }
  if (util::trim_copy(user).empty()) {
    return reject(op, Result::failure(BoostError::InvalidArgument, "A user is required."));
  }

  const Result minted = badges_.mint(user, store_.records_for(user), milestone, *collaborators_.badges);
  if (!minted.ok) {
    return reject(op, minted);
  }

  store_.append_event(EventKind::BadgeMinted, now(),
                      {{"user", std::string{user}}, {"milestone", std::to_string(milestone)}});
  persist();
  return minted;
}

Result BoostService::set_boost_reward_points(std::string_view caller, std::uint64_t points) {
  constexpr std::string_view op = "set_boost_reward_points";
  if (const Result allowed = ensure_manager(caller, op); !allowed.ok) {
    return reject(op, allowed);
  }
  if (points == 0) {
    return reject(op, Result::failure(BoostError::InvalidArgument, "Boost reward points must be positive."));
  }
  if (points > RewardCalculator::max_base_points(rewards_.policy().max_multiplier_pct)) {
    return reject(op, Result::failure(BoostError::InvalidArgument,
                                      "Boost reward points would overflow at the maximum multiplier."));
  }
  rewards_.set_base_points(points);
  config_.boost_reward_points = points;
  return note_config_update(caller, kSettingRewardPoints, std::to_string(points));
}

Result BoostService::set_premium_boost_price(std::string_view caller, std::uint64_t price) {
  constexpr std::string_view op = "set_premium_boost_price";
  if (const Result allowed = ensure_manager(caller, op); !allowed.ok) {
    return reject(op, allowed);
  }
  if (price == 0) {
    return reject(op, Result::failure(BoostError::InvalidArgument, "Premium boost price must be positive."));
  }
  resolver_.set_price(price);
  config_.premium_boost_price = price;
  return note_config_update(caller, kSettingPremiumPrice, std::to_string(price));
}

Result BoostService::set_free_boost_cooldown(std::string_view caller, std::int64_t seconds) {
  constexpr std::string_view op = "set_free_boost_cooldown";
  if (const Result allowed = ensure_manager(caller, op); !allowed.ok) {
    return reject(op, allowed);
  }
  if (seconds <= 0) {
    return reject(op, Result::failure(BoostError::InvalidArgument, "Free boost cooldown must be positive."));
  }
  streak_.set_cooldown_seconds(seconds);
  config_.free_boost_cooldown_seconds = seconds;
  return note_config_update(caller, kSettingCooldown, std::to_string(seconds));
}

Result BoostService::set_frontend_signer(std::string_view caller, std::string_view public_key_hex) {
  constexpr std::string_view op = "set_frontend_signer";
  if (const Result allowed = ensure_manager(caller, op); !allowed.ok) {
    return reject(op, allowed);
  }
  const std::string key = util::trim_copy(public_key_hex);
  if (!is_valid_public_key(key)) {
    return reject(op, Result::failure(BoostError::InvalidArgument,
                                      "Frontend signer must be a 32-byte Ed25519 public key in hex."));
  }
  verifier_.set_frontend_signer(key);
  config_.frontend_signer_public_key = key;
  return note_config_update(caller, kSettingFrontendSigner, key);
}

Result BoostService::set_badge_nft(std::string_view caller, std::shared_ptr<IBadgeMinter> minter) {
  constexpr std::string_view op = "set_badge_nft";
  if (const Result allowed = ensure_manager(caller, op); !allowed.ok) {
    return reject(op, allowed);
  }
  if (!minter) {
    return reject(op, Result::failure(BoostError::InvalidArgument, "Badge minter must not be null."));
  }
  collaborators_.badges = std::move(minter);
  return note_config_update(caller, "badge_nft", "replaced");
}

Result BoostService::pause(std::string_view caller) {
  constexpr std::string_view op = "pause";
  if (const Result allowed = ensure_manager(caller, op); !allowed.ok) {
    return reject(op, allowed);
  }
  if (paused_) {
    return reject(op, Result::failure(BoostError::InvalidArgument, "Boost engine is already paused."));
  }
  paused_ = true;
  store_.append_event(EventKind::Paused, now(), {{"caller", std::string{caller}}});
  persist();
  return Result::success("Boost engine paused.");
}

Result BoostService::unpause(std::string_view caller) {
  constexpr std::string_view op = "unpause";
  if (const Result allowed = ensure_manager(caller, op); !allowed.ok) {
    return reject(op, allowed);
  }
  if (!paused_) {
    return reject(op, Result::failure(BoostError::InvalidArgument, "Boost engine is not paused."));
  }
  paused_ = false;
  store_.append_event(EventKind::Unpaused, now(), {{"caller", std::string{caller}}});
  persist();
  return Result::success("Boost engine resumed.");
}

Result BoostService::checkpoint() {
  constexpr std::string_view op = "checkpoint";
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return reject(op, ready);
  }

  const Result saved = store_.save_snapshot(snapshot(), now());
  if (!saved.ok) {
    return reject(op, saved);
  }
  return saved;
}

StreakInfo BoostService::streak_info(std::string_view user, std::string_view totem) const {
  StreakInfo info = streak_.describe(store_.record_or_default(user, totem), now());
  if (info.status != StreakStatus::Uninitialized) {
    info.multiplier_pct = rewards_.multiplier_pct(info.streak_length);
  }
  return info;
}

BoostRecord BoostService::boost_data(std::string_view user, std::string_view totem) const {
  return store_.record_or_default(user, totem);
}

std::uint64_t BoostService::available_badges(std::string_view user, std::uint64_t milestone) const {
  const TotemRecords* records = store_.records_for(user);
  return records == nullptr ? 0 : BadgeLedger::available(*records, milestone);
}

std::uint64_t BoostService::minted_badges(std::string_view user, std::uint64_t milestone) const {
  return badges_.minted(user, milestone);
}

PremiumBoostConfig BoostService::premium_boost_config() const {
  return {.price = resolver_.price(), .tiers = resolver_.tiers()};
}

std::int64_t BoostService::free_boost_cooldown() const {
  return streak_.policy().cooldown_seconds;
}

std::uint64_t BoostService::boost_reward_points() const {
  return rewards_.policy().base_points;
}

std::vector<PendingPremiumRequest> BoostService::pending_premium_requests() const {
  std::vector<PendingPremiumRequest> out;
  out.reserve(resolver_.pending().size());
  for (const auto& [id, pending] : resolver_.pending()) {
    out.push_back(pending);
  }
  return out;
}

EngineStatusReport BoostService::status() const {
  return {
      .initialized = initialized_,
      .paused = paused_,
      .interface_version = std::string{kInterfaceVersion},
      .engine_version = std::string{kEngineVersion},
      .managers = access_.managers(),
      .user_count = store_.all_records().size(),
      .record_count = store_.record_count(),
      .pending_premium_requests = resolver_.pending().size(),
      .consumed_signature_count = verifier_.consumed_count(),
      .journal_size = store_.events().size(),
      .rejections = rejections_,
      .state_dir = store_.state_dir(),
      .events_file = store_.events_path(),
      .snapshot_file = store_.snapshot_path(),
      .snapshot_format_version = loaded_snapshot_version_,
      .migrated_from_legacy_snapshot = migrated_from_legacy_,
      .journal_write_failures = store_.journal_write_failures(),
      .last_checkpoint_unix = store_.last_checkpoint_unix(),
  };
}

Result BoostService::ensure_initialized() const {
  if (!initialized_) {
    return Result::failure(BoostError::NotInitialized, "Boost engine is not initialized.");
  }
  return Result::success();
}

Result BoostService::ensure_not_paused() const {
  if (paused_) {
    return Result::failure(BoostError::Paused, "Boost engine is paused.");
  }
  return Result::success();
}

Result BoostService::ensure_holding(std::string_view user, std::string_view totem) const {
  const TotemHolding holding = collaborators_.holdings->holding(user, totem);
  if (!holding.known_totem) {
    return Result::failure(BoostError::NotEnoughTokens, "Totem " + std::string{totem} + " is not known.");
  }
  const std::uint64_t required = holding.kind == TotemAssetKind::Nft ? 1 : config_.min_fungible_holding;
  if (holding.amount < required) {
    return Result::failure(BoostError::NotEnoughTokens,
                           "Holding of " + std::to_string(holding.amount) + " is below the required " +
                               std::to_string(required) + ".");
  }
  return Result::success();
}

Result BoostService::ensure_manager(std::string_view caller, std::string_view operation) const {
  if (const Result ready = ensure_initialized(); !ready.ok) {
    return ready;
  }
  return access_.require_manager(caller, operation);
}

Result BoostService::reject(std::string_view operation, Result failure) {
  bump(rejections_, error_category(failure.error));
  store_.record_rejection(operation, failure.error, failure.message, now());
  return failure;
}

Result BoostService::note_config_update(std::string_view caller, std::string_view setting, std::string value) {
  store_.append_event(EventKind::ConfigUpdated, now(),
                      {{"caller", std::string{caller}}, {"setting", std::string{setting}}, {"value", value}});
  persist();
  return Result::success(std::string{setting} + " updated.", std::move(value));
}

void BoostService::journal_advance(std::string_view user, std::string_view totem, const StreakAdvance& advance,
                                   std::int64_t now_unix) {
  const std::string user_id{user};
  const std::string totem_id{totem};
  if (advance.streak_reset) {
    store_.append_event(EventKind::StreakReset, now_unix, {{"user", user_id}, {"totem", totem_id}});
  }
  if (advance.grace_days_consumed > 0) {
    store_.append_event(EventKind::GraceDaysConsumed, now_unix,
                        {{"user", user_id},
                         {"totem", totem_id},
                         {"count", std::to_string(advance.grace_days_consumed)}});
  }
  if (advance.interval_grace_days > 0) {
    store_.append_event(EventKind::GraceDayEarned, now_unix,
                        {{"user", user_id},
                         {"totem", totem_id},
                         {"reason", "streak-interval"},
                         {"count", std::to_string(advance.interval_grace_days)}});
  }
  if (advance.grace_day_granted) {
    store_.append_event(EventKind::GraceDayEarned, now_unix,
                        {{"user", user_id}, {"totem", totem_id}, {"reason", "premium"}, {"count", "1"}});
  }
  for (const std::uint64_t milestone : advance.milestones_reached) {
    store_.append_event(EventKind::MilestoneReached, now_unix,
                        {{"user", user_id}, {"totem", totem_id}, {"milestone", std::to_string(milestone)}});
  }
}

void BoostService::unlink_pending(const PendingPremiumRequest& request) {
  TotemRecords* records = store_.records_for(request.user);
  if (records == nullptr) {
    return;
  }
  const auto it = records->find(request.totem);
  if (it != records->end()) {
    std::erase(it->second.pending_premium_requests, request.request_id);
  }
}

PeriodMultiplier BoostService::current_period() const {
  return {
      .active = collaborators_.merit->is_boost_period(),
      .multiplier_pct = collaborators_.merit->boost_period_multiplier_pct(),
  };
}

std::int64_t BoostService::now() const {
  return clock_ ? clock_() : util::unix_timestamp_now();
}

void BoostService::persist() {
  if (!store_.persistent()) {
    return;
  }
  const Result saved = store_.save_snapshot(snapshot(), now());
  if (!saved.ok) {
    store_.record_rejection("persist", saved.error, saved.message, now());
  }
}

StateSnapshot BoostService::snapshot() const {
  return {
      .format_version = kSnapshotFormatVersion,
      .consumed_signatures = verifier_.consumed_entries(),
      .pending = resolver_.pending(),
      .settings = settings(),
      .minted_badges = badges_.minted_entries(),
      .paused = paused_,
  };
}

Result BoostService::apply_settings(const std::map<std::string, std::string>& settings) {
  for (const auto& [key, value] : settings) {
    const auto bad = [&key = key]() {
      return Result::failure(BoostError::StorageFailure, "Snapshot setting " + key + " is invalid.");
    };
    if (key == kSettingRewardPoints) {
      const auto points = util::parse_uint64(value);
      if (!points.has_value() || *points == 0 ||
          *points > RewardCalculator::max_base_points(rewards_.policy().max_multiplier_pct)) {
        return bad();
      }
      rewards_.set_base_points(*points);
      config_.boost_reward_points = *points;
    } else if (key == kSettingPremiumPrice) {
      const auto price = util::parse_uint64(value);
      if (!price.has_value() || *price == 0) {
        return bad();
      }
      resolver_.set_price(*price);
      config_.premium_boost_price = *price;
    } else if (key == kSettingCooldown) {
      const auto seconds = util::parse_int64(value);
      if (!seconds.has_value() || *seconds <= 0) {
        return bad();
      }
      streak_.set_cooldown_seconds(*seconds);
      config_.free_boost_cooldown_seconds = *seconds;
    } else if (key == kSettingFrontendSigner) {
      if (!value.empty() && !is_valid_public_key(value)) {
        return bad();
      }
      verifier_.set_frontend_signer(value);
      config_.frontend_signer_public_key = value;
    }
  }
  return Result::success();
}

std::map<std::string, std::string> BoostService::settings() const {
  return {
      {std::string{kSettingRewardPoints}, std::to_string(rewards_.policy().base_points)},
      {std::string{kSettingPremiumPrice}, std::to_string(resolver_.price())},
      {std::string{kSettingCooldown}, std::to_string(streak_.policy().cooldown_seconds)},
      {std::string{kSettingFrontendSigner}, verifier_.frontend_signer()},
  };
}

}  // namespace totem
