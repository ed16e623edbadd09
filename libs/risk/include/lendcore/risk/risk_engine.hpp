#pragma once

#include <cstdint>

namespace lendcore {
namespace risk {

// Health factor reported for an account without debt.
inline constexpr std::int64_t kInfiniteHealthFactor = 999'000'000;

struct RiskParameters {
  std::int32_t ltv_basis_points{7'500};
  std::int32_t liquidation_threshold_basis_points{8'000};
  std::int32_t close_factor_basis_points{10'000};  // share of debt one liquidation repays
  std::int32_t liquidation_bonus_basis_points{0};  // collateral premium paid to liquidators
};

// Throws LendingError(kInvalidInput) unless
// 0 < ltv < threshold < 10'000, 0 < close factor <= 10'000, 0 <= bonus <= 10'000.
void validate(const RiskParameters& params);

// The four fields as 16-bit lanes, ltv in the top lane. Signed requests to
// change parameters carry this as their amount.
[[nodiscard]] std::int64_t pack(const RiskParameters& params) noexcept;

struct Position {
  std::int64_t collateral{0};  // collateral asset units
  std::int64_t debt{0};        // borrow asset units, interest included
};

struct AssetPrices {
  std::int64_t collateral_price{0};  // USD, scale 1e7
  std::int64_t borrow_price{0};      // USD, scale 1e7
};

struct PositionSummary {
  std::int64_t collateral_value_usd{0};
  std::int64_t borrow_value_usd{0};
  std::int64_t max_borrow_usd{0};
  std::int64_t max_borrow{0};
  std::int64_t health_factor{kInfiniteHealthFactor};
  bool liquidatable{false};
};

// Stateless valuation of a single position against fixed prices.
class RiskEngine {
 public:
  explicit RiskEngine(RiskParameters params = {});

  [[nodiscard]] const RiskParameters& parameters() const noexcept { return params_; }
  void set_parameters(const RiskParameters& params);

  [[nodiscard]] std::int64_t collateral_value_usd(std::int64_t collateral, const AssetPrices& prices) const;
  [[nodiscard]] std::int64_t borrow_value_usd(std::int64_t debt, const AssetPrices& prices) const;
  [[nodiscard]] std::int64_t max_borrow_usd(std::int64_t collateral, const AssetPrices& prices) const;
  // Borrow asset units the collateral supports at the LTV ratio.
  [[nodiscard]] std::int64_t max_borrow(std::int64_t collateral, const AssetPrices& prices) const;
  // Scale 1e7; kInfiniteHealthFactor when debt is zero.
  [[nodiscard]] std::int64_t health_factor(const Position& position, const AssetPrices& prices) const;
  [[nodiscard]] bool is_liquidatable(const Position& position, const AssetPrices& prices) const;
  [[nodiscard]] PositionSummary summarize(const Position& position, const AssetPrices& prices) const;

 private:
  RiskParameters params_;
};

}  // namespace risk
}  // namespace lendcore
