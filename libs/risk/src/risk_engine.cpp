#include "lendcore/risk/risk_engine.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include "lendcore/common/error.hpp"
#include "lendcore/common/fixed_point.hpp"

namespace lendcore {
namespace risk {

using common::ErrorCode;
using common::LendingError;

namespace {

void require_price(std::int64_t price, const char* which) {
  if (price <= 0) {
    throw LendingError(ErrorCode::kPriceNotSet, std::string(which) + " price not set");
  }
}

}  // namespace

void validate(const RiskParameters& params) {
  if (params.ltv_basis_points <= 0 ||
      params.ltv_basis_points >= params.liquidation_threshold_basis_points ||
      params.liquidation_threshold_basis_points >= common::kBasisPointDenominator) {
    throw LendingError(ErrorCode::kInvalidInput, "require 0 < ltv < liquidation threshold < 10000");
  }
  if (params.close_factor_basis_points <= 0 || params.close_factor_basis_points > common::kBasisPointDenominator) {
    throw LendingError(ErrorCode::kInvalidInput, "close factor must lie in (0, 10000]");
  }
  if (params.liquidation_bonus_basis_points < 0 ||
      params.liquidation_bonus_basis_points > common::kBasisPointDenominator) {
    throw LendingError(ErrorCode::kInvalidInput, "liquidation bonus must lie in [0, 10000]");
  }
}

std::int64_t pack(const RiskParameters& params) noexcept {
  const auto lane = [](std::int32_t value) { return static_cast<std::uint64_t>(static_cast<std::uint16_t>(value)); };
  return static_cast<std::int64_t>(lane(params.ltv_basis_points) << 48 |
                                   lane(params.liquidation_threshold_basis_points) << 32 |
                                   lane(params.close_factor_basis_points) << 16 |
                                   lane(params.liquidation_bonus_basis_points));
}

RiskEngine::RiskEngine(RiskParameters params) : params_(params) {
  validate(params_);
}

void RiskEngine::set_parameters(const RiskParameters& params) {
  validate(params);
  params_ = params;
}

std::int64_t RiskEngine::collateral_value_usd(std::int64_t collateral, const AssetPrices& prices) const {
  return common::asset_to_usd(collateral, prices.collateral_price);
}

std::int64_t RiskEngine::borrow_value_usd(std::int64_t debt, const AssetPrices& prices) const {
  return common::asset_to_usd(debt, prices.borrow_price);
}

std::int64_t RiskEngine::max_borrow_usd(std::int64_t collateral, const AssetPrices& prices) const {
  return common::mul_div(collateral_value_usd(collateral, prices), params_.ltv_basis_points,
                         common::kBasisPointDenominator);
}

std::int64_t RiskEngine::max_borrow(std::int64_t collateral, const AssetPrices& prices) const {
  require_price(prices.borrow_price, "borrow asset");
  return common::usd_to_asset(max_borrow_usd(collateral, prices), prices.borrow_price);
}

std::int64_t RiskEngine::health_factor(const Position& position, const AssetPrices& prices) const {
  if (position.debt <= 0) {
    return kInfiniteHealthFactor;
  }
  require_price(prices.collateral_price, "collateral");
  require_price(prices.borrow_price, "borrow asset");

  const std::int64_t threshold_value =
      common::mul_div(collateral_value_usd(position.collateral, prices),
                      params_.liquidation_threshold_basis_points, common::kBasisPointDenominator);
  // Dust debt that truncates to zero USD still counts as one unit.
  const std::int64_t debt_value = std::max<std::int64_t>(borrow_value_usd(position.debt, prices), 1);

  const common::Wide ratio = static_cast<common::Wide>(threshold_value) * common::kRateScale / debt_value;
  if (ratio > static_cast<common::Wide>(std::numeric_limits<std::int64_t>::max())) {
    return std::numeric_limits<std::int64_t>::max();
  }
  return static_cast<std::int64_t>(ratio);
}

bool RiskEngine::is_liquidatable(const Position& position, const AssetPrices& prices) const {
  return health_factor(position, prices) < common::kRateScale;
}

PositionSummary RiskEngine::summarize(const Position& position, const AssetPrices& prices) const {
  PositionSummary summary;
  summary.collateral_value_usd = collateral_value_usd(position.collateral, prices);
  summary.borrow_value_usd = borrow_value_usd(position.debt, prices);
  summary.max_borrow_usd = max_borrow_usd(position.collateral, prices);
  summary.max_borrow = max_borrow(position.collateral, prices);
  summary.health_factor = health_factor(position, prices);
  summary.liquidatable = summary.health_factor < common::kRateScale;
  return summary;
}

}  // namespace risk
}  // namespace lendcore
