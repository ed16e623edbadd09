#include "lendcore/risk/liquidation_engine.hpp"

#include <algorithm>
#include <string>

#include "lendcore/common/error.hpp"
#include "lendcore/common/fixed_point.hpp"

namespace lendcore {
namespace risk {

using common::Wide;

LiquidationManager::Result LiquidationManager::evaluate(const Position& position, const AssetPrices& prices) const {
  Result result;
  result.health_factor = engine_.health_factor(position, prices);
  if (result.health_factor >= common::kRateScale) {
    result.status = Status::kHealthy;
    return result;
  }

  result.status = Status::kLiquidatable;
  const std::int64_t closable = common::mul_div(position.debt, engine_.parameters().close_factor_basis_points,
                                                common::kBasisPointDenominator);
  result.max_repay = std::clamp<std::int64_t>(closable, 1, position.debt);
  return result;
}

LiquidationPlan LiquidationManager::plan(const Position& position, const AssetPrices& prices) const {
  const Result eligibility = evaluate(position, prices);
  if (eligibility.status == Status::kHealthy) {
    throw common::LendingError(common::ErrorCode::kPositionHealthy,
                               "health factor " + std::to_string(eligibility.health_factor) + " is not below 1.0");
  }

  const Wide premium = common::kBasisPointDenominator + engine_.parameters().liquidation_bonus_basis_points;

  LiquidationPlan plan;
  plan.health_factor = eligibility.health_factor;
  plan.repay_amount = eligibility.max_repay;

  // Collateral worth the repaid debt plus the bonus, at current prices.
  const Wide seize = common::checked_mul(common::checked_mul(plan.repay_amount, prices.borrow_price), premium) /
                     common::checked_mul(prices.collateral_price, common::kBasisPointDenominator);

  if (seize < position.collateral) {
    plan.seized_collateral = common::narrow(seize);
    return plan;
  }

  // Collateral exhausted: the liquidator only pays what the whole collateral
  // is worth after the bonus and the rest of the debt cannot be recovered.
  plan.seized_collateral = position.collateral;
  const Wide collateral_worth =
      common::checked_mul(common::checked_mul(position.collateral, prices.collateral_price),
                          common::kBasisPointDenominator) /
      common::checked_mul(prices.borrow_price, premium);
  plan.repay_amount = std::min(plan.repay_amount, common::narrow(collateral_worth));
  plan.bad_debt = position.debt - plan.repay_amount;
  return plan;
}

}  // namespace risk
}  // namespace lendcore
