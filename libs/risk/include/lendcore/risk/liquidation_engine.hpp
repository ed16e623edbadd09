#pragma once

#include <cstdint>

#include "lendcore/risk/risk_engine.hpp"

namespace lendcore {
namespace risk {

struct LiquidationPlan {
  std::int64_t health_factor{0};
  std::int64_t repay_amount{0};       // borrow asset paid in by the liquidator
  std::int64_t seized_collateral{0};  // collateral paid out to the liquidator
  std::int64_t bad_debt{0};           // debt written off once collateral is exhausted
};

class LiquidationManager {
 public:
  enum class Status : std::uint8_t {
    kHealthy,
    kLiquidatable,
  };

  struct Result {
    Status status{Status::kHealthy};
    std::int64_t health_factor{kInfiniteHealthFactor};
    std::int64_t max_repay{0};
  };

  explicit LiquidationManager(const RiskEngine& engine) : engine_(engine) {}

  [[nodiscard]] Result evaluate(const Position& position, const AssetPrices& prices) const;

  // Throws kPositionHealthy when the health factor is at least 1.0.
  [[nodiscard]] LiquidationPlan plan(const Position& position, const AssetPrices& prices) const;

 private:
  const RiskEngine& engine_;
};

}  // namespace risk
}  // namespace lendcore
