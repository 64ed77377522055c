#include "core/config/boost_config.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <unordered_map>
#include <utility>

#include "core/crypto/crypto.hpp"
#include "core/random/random_reward_resolver.hpp"
#include "core/reward/reward_calculator.hpp"
#include "core/util/canonical.hpp"

namespace totem {
namespace {

Result invalid(std::string_view key, std::string_view value) {
  return Result::failure(BoostError::InvalidArgument,
                         "Config value for '" + std::string{key} + "' is invalid: " + std::string{value});
}

bool parse_tiers(std::string_view text, std::vector<PremiumTier>& out) {
  std::vector<PremiumTier> tiers;
  for (const auto& item : util::split_csv(text)) {
    const auto split = item.find(':');
    if (split == std::string::npos) {
      return false;
    }
    const auto points = util::parse_uint64(util::trim_copy(std::string_view{item}.substr(0, split)));
    const auto probability = util::parse_uint64(util::trim_copy(std::string_view{item}.substr(split + 1)));
    if (!points.has_value() || !probability.has_value() || *probability > 100) {
      return false;
    }
    tiers.push_back({.base_points = *points, .probability_pct = static_cast<std::uint32_t>(*probability)});
  }
  out = std::move(tiers);
  return true;
}

}  // namespace

Result validate_boost_config(const BoostConfig& config) {
  if (config.free_boost_cooldown_seconds <= 0) {
    return Result::failure(BoostError::InvalidArgument, "Free boost cooldown must be positive.");
  }
  if (config.signature_tolerance_seconds <= 0) {
    return Result::failure(BoostError::InvalidArgument, "Signature tolerance must be positive.");
  }
  if (config.grace_day_streak_interval == 0) {
    return Result::failure(BoostError::InvalidArgument, "Grace day streak interval must be positive.");
  }
  if (config.max_multiplier_pct < 100) {
    return Result::failure(BoostError::InvalidArgument, "Maximum multiplier must be at least 100%.");
  }
  if (config.boost_reward_points == 0 || config.premium_boost_price == 0) {
    return Result::failure(BoostError::InvalidArgument, "Boost reward points and premium price must be positive.");
  }
  const std::uint64_t max_points = RewardCalculator::max_base_points(config.max_multiplier_pct);
  if (config.boost_reward_points > max_points) {
    return Result::failure(BoostError::InvalidArgument,
                           "Boost reward points may not exceed " + std::to_string(max_points) + ".");
  }
  for (const auto& tier : config.premium_tiers) {
    if (tier.base_points > max_points) {
      return Result::failure(BoostError::InvalidArgument,
                             "Premium tier points may not exceed " + std::to_string(max_points) + ".");
    }
  }
  if (config.milestones.empty() || config.milestones.front() == 0 ||
      !std::ranges::is_sorted(config.milestones) ||
      std::ranges::adjacent_find(config.milestones) != config.milestones.end()) {
    return Result::failure(BoostError::InvalidArgument,
                           "Milestones must be a non-empty, strictly increasing list of positive lengths.");
  }
  if (!config.frontend_signer_public_key.empty() && !is_valid_public_key(config.frontend_signer_public_key)) {
    return Result::failure(BoostError::InvalidArgument, "Frontend signer public key is malformed.");
  }
  return RandomRewardResolver::validate_tiers(config.premium_tiers);
}

Result load_boost_config_file(std::string_view path, BoostConfig& out) {
  std::ifstream in{std::string{path}};
  if (!in) {
    return Result::failure(BoostError::InvalidArgument, "Config file could not be opened: " + std::string{path});
  }

  std::unordered_map<std::string, std::string> fields;
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const auto split = trimmed.find('=');
    if (split == std::string::npos) {
      return Result::failure(BoostError::InvalidArgument, "Config line has no '=': " + trimmed);
    }

    fields[util::trim_copy(trimmed.substr(0, split))] = util::trim_copy(trimmed.substr(split + 1));
  }

  BoostConfig config = out;
  for (const auto& [key, value] : fields) {
    if (key == "state_dir") {
      config.state_dir = value;
    } else if (key == "frontend_signer") {
      config.frontend_signer_public_key = value;
    } else if (key == "managers") {
      config.managers = util::split_csv(value);
    } else if (key == "free_boost_cooldown_seconds" || key == "signature_tolerance_seconds") {
      const auto parsed = util::parse_int64(value);
      if (!parsed.has_value()) {
        return invalid(key, value);
      }
      (key == "free_boost_cooldown_seconds" ? config.free_boost_cooldown_seconds
                                            : config.signature_tolerance_seconds) = *parsed;
    } else if (key == "boost_reward_points" || key == "premium_boost_price" ||
               key == "grace_day_streak_interval" || key == "min_fungible_holding") {
      const auto parsed = util::parse_uint64(value);
      if (!parsed.has_value()) {
        return invalid(key, value);
      }
      if (key == "boost_reward_points") {
        config.boost_reward_points = *parsed;
      } else if (key == "premium_boost_price") {
        config.premium_boost_price = *parsed;
      } else if (key == "grace_day_streak_interval") {
        config.grace_day_streak_interval = *parsed;
      } else {
        config.min_fungible_holding = *parsed;
      }
    } else if (key == "multiplier_step_pct" || key == "max_multiplier_pct") {
      const auto parsed = util::parse_uint64(value);
      if (!parsed.has_value() || *parsed > 10'000) {
        return invalid(key, value);
      }
      (key == "multiplier_step_pct" ? config.multiplier_step_pct : config.max_multiplier_pct) =
          static_cast<std::uint32_t>(*parsed);
    } else if (key == "milestones") {
      std::vector<std::uint64_t> milestones;
      for (const auto& item : util::split_csv(value)) {
        const auto parsed = util::parse_uint64(item);
        if (!parsed.has_value()) {
          return invalid(key, value);
        }
        milestones.push_back(*parsed);
      }
      config.milestones = std::move(milestones);
    } else if (key == "premium_tiers") {
      if (!parse_tiers(value, config.premium_tiers)) {
        return invalid(key, value);
      }
    } else {
      return Result::failure(BoostError::InvalidArgument, "Unknown config key: " + key);
    }
  }

  const Result valid = validate_boost_config(config);
  if (!valid.ok) {
    return valid;
  }

  out = std::move(config);
  return Result::success("Config loaded.", std::string{path});
}

}  // namespace totem
