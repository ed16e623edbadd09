#include "lendcore/interest/interest_rate_model.hpp"

#include <string>

#include "lendcore/common/error.hpp"
#include "lendcore/common/fixed_point.hpp"

namespace lendcore {
namespace interest {

using common::ErrorCode;
using common::LendingError;
using common::Wide;

void InterestRateModel::validate(const RateCurveParameters& params) {
  if (params.optimal_utilization <= 0 || params.optimal_utilization >= common::kRateScale) {
    throw LendingError(ErrorCode::kInvalidInput, "optimal utilization must lie in (0, 1e7)");
  }
  if (params.base_rate < 0 || params.slope1 < 0 || params.slope2 < 0) {
    throw LendingError(ErrorCode::kInvalidInput, "rate curve parameters must be non-negative");
  }
  const Wide max_rate = static_cast<Wide>(params.base_rate) + params.slope1 + params.slope2;
  if (max_rate > kMaxBorrowRate) {
    throw LendingError(ErrorCode::kInvalidInput,
                       "base + slope1 + slope2 exceeds " + std::to_string(kMaxBorrowRate));
  }
}

void InterestRateModel::initialize(const RateCurveParameters& params) {
  if (params_) {
    throw LendingError(ErrorCode::kAlreadyInitialized, "interest rate model already initialized");
  }
  validate(params);
  params_ = params;
}

std::int64_t InterestRateModel::borrow_rate(std::int64_t utilization) const {
  const auto& p = parameters();
  if (utilization < 0 || utilization > common::kRateScale) {
    throw LendingError(ErrorCode::kInvalidInput, "utilization out of range: " + std::to_string(utilization));
  }

  if (utilization <= p.optimal_utilization) {
    return p.base_rate + common::mul_div(utilization, p.slope1, p.optimal_utilization);
  }

  const std::int64_t excess = common::mul_div(utilization - p.optimal_utilization, common::kRateScale,
                                              common::kRateScale - p.optimal_utilization);
  return p.base_rate + p.slope1 + common::mul_div(excess, p.slope2, common::kRateScale);
}

std::int64_t InterestRateModel::supply_rate(std::int64_t utilization) const {
  return common::mul_div(borrow_rate(utilization), utilization, common::kRateScale);
}

const RateCurveParameters& InterestRateModel::parameters() const {
  if (!params_) {
    throw LendingError(ErrorCode::kNotInitialized, "interest rate model not initialized");
  }
  return *params_;
}

}  // namespace interest
}  // namespace lendcore
