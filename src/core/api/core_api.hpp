#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/service/boost_service.hpp"

namespace totem {

// Stable, versioned entry point for hosts embedding the boost engine.
class CoreApi {
public:
  [[nodiscard]] static std::string_view interface_version();

  Result init(const BoostConfig& config, Collaborators collaborators);
  void set_clock(BoostService::Clock clock);

  Result boost(const BoostDraft& draft);
  Result premium_boost(const PremiumBoostDraft& draft);
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
  [[nodiscard]] std::vector<PendingPremiumRequest> pending_premium_requests() const;
  [[nodiscard]] const std::vector<EngineEvent>& events() const;
  [[nodiscard]] EngineStatusReport status() const;
  [[nodiscard]] bool paused() const;

private:
  BoostService service_;
};

}  // namespace totem
