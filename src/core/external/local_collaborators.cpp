#include "core/external/local_collaborators.hpp"

#include <array>

#include <sodium.h>

namespace totem {

void LocalMeritLedger::register_totem(std::string_view totem) {
  registered_.emplace(totem);
}

void LocalMeritLedger::set_boost_period(bool active, std::uint64_t multiplier_pct) {
  boost_period_active_ = active;
  multiplier_pct_ = multiplier_pct;
}

Result LocalMeritLedger::credit_merit(std::string_view totem, std::uint64_t amount) {
  if (!registered_.contains(totem)) {
    return Result::failure(BoostError::CollaboratorFailure, "Merit credit failed: totem is not registered.");
  }
  auto it = merit_.find(totem);
  if (it == merit_.end()) {
    it = merit_.emplace(std::string{totem}, 0).first;
  }
  it->second += amount;
  credits_.push_back(amount);
  return Result::success("Merit credited.", std::to_string(amount));
}

std::uint64_t LocalMeritLedger::merit_of(std::string_view totem) const {
  const auto it = merit_.find(totem);
  return it == merit_.end() ? 0 : it->second;
}

Result LocalTreasury::receive(std::string_view from, std::uint64_t amount) {
  if (!accepting_) {
    return Result::failure(BoostError::CollaboratorFailure, "Treasury is not accepting payments.");
  }
  balance_ += amount;
  auto it = by_sender_.find(from);
  if (it == by_sender_.end()) {
    it = by_sender_.emplace(std::string{from}, 0).first;
  }
  it->second += amount;
  return Result::success("Treasury received payment.");
}

Result LocalTreasury::reverse(std::string_view from, std::uint64_t amount) {
  const auto it = by_sender_.find(from);
  if (it == by_sender_.end() || it->second < amount) {
    return Result::failure(BoostError::CollaboratorFailure, "Treasury holds no such payment to reverse.");
  }
  it->second -= amount;
  balance_ -= amount;
  if (it->second == 0) {
    by_sender_.erase(it);
  }
  return Result::success("Treasury payment reversed.");
}

std::uint64_t LocalTreasury::received_from(std::string_view from) const {
  const auto it = by_sender_.find(from);
  return it == by_sender_.end() ? 0 : it->second;
}

Result LocalPaymentChannel::refund(std::string_view to, std::uint64_t amount) {
  if (!available_) {
    return Result::failure(BoostError::CollaboratorFailure, "Payment channel is unavailable.");
  }
  auto it = refunds_.find(to);
  if (it == refunds_.end()) {
    it = refunds_.emplace(std::string{to}, 0).first;
  }
  it->second += amount;
  ++refund_count_;
  return Result::success("Refund sent.");
}

std::uint64_t LocalPaymentChannel::refunded_to(std::string_view to) const {
  const auto it = refunds_.find(to);
  return it == refunds_.end() ? 0 : it->second;
}

Result LocalBadgeMinter::mint(std::string_view user, std::uint64_t milestone) {
  ++minted_[{std::string{user}, milestone}];
  ++total_minted_;
  return Result::success("Badge minted.");
}

std::uint64_t LocalBadgeMinter::minted(std::string_view user, std::uint64_t milestone) const {
  const auto it = minted_.find({std::string{user}, milestone});
  return it == minted_.end() ? 0 : it->second;
}

void LocalTotemHoldings::add_totem(std::string_view totem, TotemAssetKind kind) {
  totems_.insert_or_assign(std::string{totem}, kind);
}

void LocalTotemHoldings::set_holding(std::string_view user, std::string_view totem, std::uint64_t amount) {
  balances_[{std::string{user}, std::string{totem}}] = amount;
}

TotemHolding LocalTotemHoldings::holding(std::string_view user, std::string_view totem) const {
  TotemHolding out;
  const auto totem_it = totems_.find(totem);
  if (totem_it == totems_.end()) {
    return out;
  }
  out.known_totem = true;
  out.kind = totem_it->second;
  const auto balance_it = balances_.find({std::string{user}, std::string{totem}});
  out.amount = balance_it == balances_.end() ? 0 : balance_it->second;
  return out;
}

std::optional<RequestId> LocalRandomnessOracle::request_random_words(std::uint32_t num_words) {
  if (!available_ || num_words == 0) {
    return std::nullopt;
  }
  const RequestId id = next_id_++;
  outstanding_.emplace(id, num_words);
  return id;
}

Result LocalRandomnessOracle::deliver(RequestId request_id, std::vector<std::uint64_t> words) {
  const auto it = outstanding_.find(request_id);
  if (it == outstanding_.end()) {
    return Result::failure(BoostError::UnknownRequest, "Oracle has no outstanding request with that id.");
  }
  if (!sink_) {
    return Result::failure(BoostError::CollaboratorFailure, "Oracle has no fulfillment sink bound.");
  }
  if (words.size() != it->second) {
    return Result::failure(BoostError::InvalidArgument, "Oracle delivered the wrong number of words.");
  }

  Result fulfilled = sink_(request_id, words);
  if (fulfilled.ok) {
    outstanding_.erase(it);
  }
  return fulfilled;
}

Result LocalRandomnessOracle::deliver_random(RequestId request_id) {
  const auto it = outstanding_.find(request_id);
  if (it == outstanding_.end()) {
    return Result::failure(BoostError::UnknownRequest, "Oracle has no outstanding request with that id.");
  }

  std::vector<std::uint64_t> words(it->second);
  for (auto& word : words) {
    std::array<unsigned char, sizeof(std::uint64_t)> bytes{};
    randombytes_buf(bytes.data(), bytes.size());
    word = 0;
    for (unsigned char b : bytes) {
      word = (word << 8U) | b;
    }
  }
  return deliver(request_id, std::move(words));
}

std::vector<RequestId> LocalRandomnessOracle::outstanding() const {
  std::vector<RequestId> ids;
  ids.reserve(outstanding_.size());
  for (const auto& [id, words] : outstanding_) {
    ids.push_back(id);
  }
  return ids;
}

std::optional<RequestId> LocalRandomnessOracle::last_request_id() const {
  if (next_id_ == 1) {
    return std::nullopt;
  }
  return next_id_ - 1;
}

}  // namespace totem
