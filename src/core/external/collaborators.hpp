#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace totem {

class IMeritManager {
public:
  virtual ~IMeritManager() = default;

  // Fails when the totem is not registered with the merit ledger.
  virtual Result credit_merit(std::string_view totem, std::uint64_t amount) = 0;
  [[nodiscard]] virtual bool is_boost_period() const = 0;
  [[nodiscard]] virtual std::uint64_t boost_period_multiplier_pct() const = 0;
};

class ITreasury {
public:
  virtual ~ITreasury() = default;

  virtual Result receive(std::string_view from, std::uint64_t amount) = 0;
  // Returns a payment accepted by receive() whose boost was abandoned.
  virtual Result reverse(std::string_view from, std::uint64_t amount) = 0;
};

class IPaymentChannel {
public:
  virtual ~IPaymentChannel() = default;

  virtual Result refund(std::string_view to, std::uint64_t amount) = 0;
};

class IBadgeMinter {
public:
  virtual ~IBadgeMinter() = default;

  virtual Result mint(std::string_view user, std::uint64_t milestone) = 0;
};

class ITotemHoldings {
public:
  virtual ~ITotemHoldings() = default;

  [[nodiscard]] virtual TotemHolding holding(std::string_view user, std::string_view totem) const = 0;
};

class IRandomnessOracle {
public:
  virtual ~IRandomnessOracle() = default;

  // Returns the id the oracle will later fulfill, or nullopt if the request
  // could not be placed.
  virtual std::optional<RequestId> request_random_words(std::uint32_t num_words) = 0;
  // Withdraws a request that will never be tracked; the id is not fulfilled.
  virtual void cancel_request(RequestId request_id) = 0;
};

struct Collaborators {
  std::shared_ptr<IMeritManager> merit;
  std::shared_ptr<ITreasury> treasury;
  std::shared_ptr<IPaymentChannel> payments;
  std::shared_ptr<IBadgeMinter> badges;
  std::shared_ptr<ITotemHoldings> holdings;
  std::shared_ptr<IRandomnessOracle> oracle;
};

}  // namespace totem
