#include "core/api/core_api.hpp"

#include <utility>

#include "core/model/app_meta.hpp"

namespace totem {

std::string_view CoreApi::interface_version() {
  return kInterfaceVersion;
}

Result CoreApi::init(const BoostConfig& config, Collaborators collaborators) {
  return service_.init(config, std::move(collaborators));
}

void CoreApi::set_clock(BoostService::Clock clock) {
  service_.set_clock(std::move(clock));
}

Result CoreApi::boost(const BoostDraft& draft) {
  return service_.boost(draft);
}

Result CoreApi::premium_boost(const PremiumBoostDraft& draft) {
  return service_.premium_boost(draft);
}

Result CoreApi::fulfill_random_words(RequestId request_id, const std::vector<std::uint64_t>& words) {
  return service_.fulfill_random_words(request_id, words);
}

Result CoreApi::mint_badge(std::string_view user, std::uint64_t milestone) {
  return service_.mint_badge(user, milestone);
}

Result CoreApi::set_boost_reward_points(std::string_view caller, std::uint64_t points) {
  return service_.set_boost_reward_points(caller, points);
}

Result CoreApi::set_premium_boost_price(std::string_view caller, std::uint64_t price) {
  return service_.set_premium_boost_price(caller, price);
}

Result CoreApi::set_free_boost_cooldown(std::string_view caller, std::int64_t seconds) {
  return service_.set_free_boost_cooldown(caller, seconds);
}

Result CoreApi::set_frontend_signer(std::string_view caller, std::string_view public_key_hex) {
  return service_.set_frontend_signer(caller, public_key_hex);
}

Result CoreApi::set_badge_nft(std::string_view caller, std::shared_ptr<IBadgeMinter> minter) {
  return service_.set_badge_nft(caller, std::move(minter));
}

Result CoreApi::pause(std::string_view caller) {
  return service_.pause(caller);
}

Result CoreApi::unpause(std::string_view caller) {
  return service_.unpause(caller);
}

Result CoreApi::checkpoint() {
  return service_.checkpoint();
}

StreakInfo CoreApi::streak_info(std::string_view user, std::string_view totem) const {
  return service_.streak_info(user, totem);
}

BoostRecord CoreApi::boost_data(std::string_view user, std::string_view totem) const {
  return service_.boost_data(user, totem);
}

std::uint64_t CoreApi::available_badges(std::string_view user, std::uint64_t milestone) const {
  return service_.available_badges(user, milestone);
}

std::uint64_t CoreApi::minted_badges(std::string_view user, std::uint64_t milestone) const {
  return service_.minted_badges(user, milestone);
}

PremiumBoostConfig CoreApi::premium_boost_config() const {
  return service_.premium_boost_config();
}

std::int64_t CoreApi::free_boost_cooldown() const {
  return service_.free_boost_cooldown();
}

std::uint64_t CoreApi::boost_reward_points() const {
  return service_.boost_reward_points();
}

std::vector<PendingPremiumRequest> CoreApi::pending_premium_requests() const {
  return service_.pending_premium_requests();
}

const std::vector<EngineEvent>& CoreApi::events() const {
  return service_.events();
}

EngineStatusReport CoreApi::status() const {
  return service_.status();
}

bool CoreApi::paused() const {
  return service_.paused();
}

}  // namespace totem
