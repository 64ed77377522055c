#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/config/boost_config.hpp"
#include "core/crypto/crypto.hpp"
#include "core/external/local_collaborators.hpp"
#include "core/model/app_meta.hpp"
#include "core/model/errors.hpp"
#include "core/util/canonical.hpp"

namespace {

constexpr std::string_view kDemoUser = "demo-user";
constexpr std::string_view kDemoTotem = "demo-totem";
constexpr int kDemoDays = 8;

std::string status_to_string(totem::StreakStatus status) {
  switch (status) {
    case totem::StreakStatus::Uninitialized:
      return "uninitialized";
    case totem::StreakStatus::Active:
      return "active";
    case totem::StreakStatus::GraceCovered:
      return "grace-covered";
    case totem::StreakStatus::Broken:
      return "broken";
  }
  return "unknown";
}

void print_failure(std::string_view what, const totem::Result& result) {
  std::cerr << what << " failed [" << totem::error_to_string(result.error) << "/"
            << totem::category_to_string(totem::error_category(result.error)) << "]: " << result.message << '\n';
}

}  // namespace

int main(int argc, char** argv) {
  totem::BoostConfig config;
  if (argc > 1) {
    const totem::Result loaded = totem::load_boost_config_file(argv[1], config);
    if (!loaded.ok) {
      print_failure("Loading config", loaded);
      return 1;
    }
  }

  totem::CryptoEngine signer;
  if (const totem::Result ready = signer.initialize(); !ready.ok) {
    print_failure("Crypto init", ready);
    return 1;
  }
  const totem::Result identity = argc > 2 ? signer.adopt_identity(argv[2]) : signer.generate_identity();
  if (!identity.ok) {
    print_failure("Signer setup", identity);
    return 1;
  }
  config.frontend_signer_public_key = signer.identity().public_key;
  if (config.managers.empty()) {
    config.managers = {"manager"};
  }

  auto merit = std::make_shared<totem::LocalMeritLedger>();
  auto treasury = std::make_shared<totem::LocalTreasury>();
  auto payments = std::make_shared<totem::LocalPaymentChannel>();
  auto badges = std::make_shared<totem::LocalBadgeMinter>();
  auto holdings = std::make_shared<totem::LocalTotemHoldings>();
  auto oracle = std::make_shared<totem::LocalRandomnessOracle>();
  merit->register_totem(kDemoTotem);
  holdings->add_totem(kDemoTotem, totem::TotemAssetKind::Fungible);
  holdings->set_holding(kDemoUser, kDemoTotem, config.min_fungible_holding);

  totem::CoreApi api;
  std::int64_t clock_unix = totem::util::unix_timestamp_now();
  api.set_clock([&clock_unix]() { return clock_unix; });
  oracle->bind([&api](totem::RequestId id, const std::vector<std::uint64_t>& words) {
    return api.fulfill_random_words(id, words);
  });

  const totem::Result init = api.init(config, {
                                                  .merit = merit,
                                                  .treasury = treasury,
                                                  .payments = payments,
                                                  .badges = badges,
                                                  .holdings = holdings,
                                                  .oracle = oracle,
                                              });
  if (!init.ok) {
    print_failure("Engine init", init);
    return 1;
  }
  // A restored snapshot carries the previous run's signer.
  const totem::Result rotated = api.set_frontend_signer(config.managers.front(), signer.identity().public_key);
  if (!rotated.ok) {
    print_failure("Signer rotation", rotated);
    return 1;
  }

  std::cout << totem::kEngineDisplayName << " " << totem::kEngineVersion << " (" << totem::kBuildRelease
            << "), interface " << totem::CoreApi::interface_version() << "\n\n";

  for (int day = 0; day < kDemoDays; ++day) {
    const totem::Result boosted = api.boost({
        .user = std::string{kDemoUser},
        .totem = std::string{kDemoTotem},
        .timestamp = clock_unix,
        .signature = signer.sign_boost_request(kDemoUser, kDemoTotem, clock_unix),
    });
    if (!boosted.ok) {
      print_failure("Free boost", boosted);
      return 1;
    }
    std::cout << "Day " << (day + 1) << ": credited " << boosted.data << " merit points\n";
    clock_unix += api.free_boost_cooldown();
  }
  clock_unix -= api.free_boost_cooldown();

  const totem::StreakInfo streak = api.streak_info(kDemoUser, kDemoTotem);
  std::cout << "\nStreak: " << streak.streak_length << " (" << status_to_string(streak.status)
            << "), multiplier " << streak.multiplier_pct << "%, grace days " << streak.grace_days_available
            << ", next free boost at " << streak.next_free_boost_at << '\n';
  std::cout << "Badges available for milestone 7: " << api.available_badges(kDemoUser, 7) << '\n';

  if (const totem::Result minted = api.mint_badge(kDemoUser, 7); minted.ok) {
    std::cout << "Minted milestone badge " << minted.data << " (" << api.minted_badges(kDemoUser, 7)
              << " minted so far)\n";
  } else {
    print_failure("Badge mint", minted);
  }

  const totem::PremiumBoostConfig premium = api.premium_boost_config();
  const totem::Result requested = api.premium_boost({
      .user = std::string{kDemoUser},
      .totem = std::string{kDemoTotem},
      .payment = premium.price + 5,
  });
  if (!requested.ok) {
    print_failure("Premium boost", requested);
    return 1;
  }
  std::cout << "\nPremium boost request " << requested.data << " placed; refunded "
            << payments->refunded_to(kDemoUser) << ", treasury holds " << treasury->balance() << '\n';

  const auto request_id = totem::util::parse_uint64(requested.data);
  if (request_id.has_value()) {
    const totem::Result fulfilled = oracle->deliver_random(*request_id);
    if (!fulfilled.ok) {
      print_failure("Premium fulfillment", fulfilled);
      return 1;
    }
    std::cout << "Premium boost fulfilled: credited " << fulfilled.data << " merit points\n";
  }

  const totem::EngineStatusReport report = api.status();
  std::cout << "\nTotal merit for " << kDemoTotem << ": " << merit->merit_of(kDemoTotem) << '\n';
  std::cout << "Records: " << report.record_count << ", pending premium requests: "
            << report.pending_premium_requests << ", consumed signatures: " << report.consumed_signature_count
            << ", journal events: " << report.journal_size << ", managers: " << report.managers.size() << '\n';

  if (!report.state_dir.empty()) {
    const totem::Result saved = api.checkpoint();
    if (!saved.ok) {
      print_failure("Checkpoint", saved);
      return 1;
    }
    std::cout << "Checkpoint written to " << report.snapshot_file << '\n';
  }
  return 0;
}
