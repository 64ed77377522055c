#include "core/badge/badge_ledger.hpp"

namespace totem {

std::uint64_t BadgeLedger::available(const TotemRecords& records, std::uint64_t milestone) {
  std::uint64_t total = 0;
  for (const auto& [totem, record] : records) {
    const auto it = record.unminted_badges.find(milestone);
    if (it != record.unminted_badges.end()) {
      total += it->second;
    }
  }
  return total;
}

Result BadgeLedger::mint(std::string_view user, TotemRecords* records, std::uint64_t milestone,
                         IBadgeMinter& minter) {
  if (records == nullptr) {
    return Result::failure(BoostError::MilestoneNotAchieved, "Milestone has not been achieved.");
  }

  BadgeCounts* source = nullptr;
  for (auto& [totem, record] : *records) {
    const auto it = record.unminted_badges.find(milestone);
    if (it != record.unminted_badges.end() && it->second > 0) {
      source = &record.unminted_badges;
      break;
    }
  }
  if (source == nullptr) {
    return Result::failure(BoostError::MilestoneNotAchieved,
                           "Milestone " + std::to_string(milestone) + " has not been achieved.");
  }

  const Result minted = minter.mint(user, milestone);
  if (!minted.ok) {
    return Result::failure(BoostError::CollaboratorFailure, "Badge mint failed: " + minted.message);
  }

  auto it = source->find(milestone);
  if (--it->second == 0) {
    source->erase(it);
  }
  ++minted_[{std::string{user}, milestone}];
  return Result::success("Badge minted.", std::to_string(milestone));
}

std::uint64_t BadgeLedger::minted(std::string_view user, std::uint64_t milestone) const {
  const auto it = minted_.find({std::string{user}, milestone});
  return it == minted_.end() ? 0 : it->second;
}

}  // namespace totem
