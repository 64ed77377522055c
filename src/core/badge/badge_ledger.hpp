#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>

#include "core/external/collaborators.hpp"
#include "core/model/types.hpp"

namespace totem {

class BadgeLedger {
public:
  [[nodiscard]] static std::uint64_t available(const TotemRecords& records, std::uint64_t milestone);

  // Spends one unminted count for the milestone (taken from the first totem,
  // in totem order, that still has one) and mints through the collaborator.
  // Nothing is decremented unless the mint succeeds.
  Result mint(std::string_view user, TotemRecords* records, std::uint64_t milestone, IBadgeMinter& minter);

  [[nodiscard]] std::uint64_t minted(std::string_view user, std::uint64_t milestone) const;
  [[nodiscard]] const MintedBadgeCounts& minted_entries() const { return minted_; }
  void restore(MintedBadgeCounts minted) { minted_ = std::move(minted); }

private:
  MintedBadgeCounts minted_;
};

}  // namespace totem
