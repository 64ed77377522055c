#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/external/collaborators.hpp"

namespace totem {

class LocalMeritLedger final : public IMeritManager {
public:
  void register_totem(std::string_view totem);
  void set_boost_period(bool active, std::uint64_t multiplier_pct);

  Result credit_merit(std::string_view totem, std::uint64_t amount) override;
  [[nodiscard]] bool is_boost_period() const override { return boost_period_active_; }
  [[nodiscard]] std::uint64_t boost_period_multiplier_pct() const override { return multiplier_pct_; }

  [[nodiscard]] std::uint64_t merit_of(std::string_view totem) const;
  [[nodiscard]] const std::vector<std::uint64_t>& credits() const { return credits_; }

private:
  std::set<std::string, std::less<>> registered_;
  std::map<std::string, std::uint64_t, std::less<>> merit_;
  std::vector<std::uint64_t> credits_;
  bool boost_period_active_ = false;
  std::uint64_t multiplier_pct_ = 100;
};

class LocalTreasury final : public ITreasury {
public:
  void set_accepting(bool accepting) { accepting_ = accepting; }

  Result receive(std::string_view from, std::uint64_t amount) override;
  Result reverse(std::string_view from, std::uint64_t amount) override;

  [[nodiscard]] std::uint64_t balance() const { return balance_; }
  [[nodiscard]] std::uint64_t received_from(std::string_view from) const;

private:
  bool accepting_ = true;
  std::uint64_t balance_ = 0;
  std::map<std::string, std::uint64_t, std::less<>> by_sender_;
};

class LocalPaymentChannel final : public IPaymentChannel {
public:
  void set_available(bool available) { available_ = available; }

  Result refund(std::string_view to, std::uint64_t amount) override;

  [[nodiscard]] std::uint64_t refunded_to(std::string_view to) const;
  [[nodiscard]] std::size_t refund_count() const { return refund_count_; }

private:
  bool available_ = true;
  std::map<std::string, std::uint64_t, std::less<>> refunds_;
  std::size_t refund_count_ = 0;
};

class LocalBadgeMinter final : public IBadgeMinter {
public:
  Result mint(std::string_view user, std::uint64_t milestone) override;

  [[nodiscard]] std::uint64_t minted(std::string_view user, std::uint64_t milestone) const;
  [[nodiscard]] std::uint64_t total_minted() const { return total_minted_; }

private:
  std::map<std::pair<std::string, std::uint64_t>, std::uint64_t> minted_;
  std::uint64_t total_minted_ = 0;
};

class LocalTotemHoldings final : public ITotemHoldings {
public:
  void add_totem(std::string_view totem, TotemAssetKind kind);
  void set_holding(std::string_view user, std::string_view totem, std::uint64_t amount);

  [[nodiscard]] TotemHolding holding(std::string_view user, std::string_view totem) const override;

private:
  std::map<std::string, TotemAssetKind, std::less<>> totems_;
  std::map<std::pair<std::string, std::string>, std::uint64_t> balances_;
};

// In-process oracle: requests are queued and fulfilled explicitly through
// deliver()/deliver_random(), which call the bound fulfillment sink.
class LocalRandomnessOracle final : public IRandomnessOracle {
public:
  using FulfillmentSink = std::function<Result(RequestId, const std::vector<std::uint64_t>&)>;

  void bind(FulfillmentSink sink) { sink_ = std::move(sink); }
  void set_available(bool available) { available_ = available; }

  std::optional<RequestId> request_random_words(std::uint32_t num_words) override;
  void cancel_request(RequestId request_id) override { outstanding_.erase(request_id); }

  Result deliver(RequestId request_id, std::vector<std::uint64_t> words);
  Result deliver_random(RequestId request_id);

  [[nodiscard]] std::vector<RequestId> outstanding() const;
  [[nodiscard]] std::optional<RequestId> last_request_id() const;

private:
  FulfillmentSink sink_;
  bool available_ = true;
  RequestId next_id_ = 1;
  std::map<RequestId, std::uint32_t> outstanding_;
};

}  // namespace totem
