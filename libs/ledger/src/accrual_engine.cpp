#include "lendcore/ledger/accrual_engine.hpp"

#include <algorithm>

namespace lendcore {
namespace ledger {

namespace {
constexpr common::Wide kAccrualDenominator = static_cast<common::Wide>(common::kSecondsPerYear) * common::kRateScale;
}

AccrualEngine::AccrualEngine(const interest::InterestRateModel& model, AccrualConfig config)
    : model_(model), config_(config) {
  if (config_.max_step_seconds == 0) {
    config_.max_step_seconds = static_cast<std::uint64_t>(common::kSecondsPerYear);
  }
}

std::int64_t AccrualEngine::utilization(const PoolState& state) {
  if (state.total_deposits <= 0) {
    return 0;
  }
  return std::clamp<std::int64_t>(common::mul_div(state.total_borrows, common::kRateScale, state.total_deposits),
                                  0, common::kRateScale);
}

AccrualResult AccrualEngine::accrue(PoolState& state, common::TimestampSec now) const {
  AccrualResult result;
  if (now <= state.last_accrual_time) {
    return result;
  }

  PoolState working = state;
  std::uint64_t remaining = now - state.last_accrual_time;
  result.elapsed_seconds = remaining;
  while (remaining > 0) {
    const std::uint64_t seconds = std::min(remaining, config_.max_step_seconds);
    step(working, seconds, result);
    remaining -= seconds;
  }
  working.last_accrual_time = now;
  state = working;
  return result;
}

PoolState AccrualEngine::preview(const PoolState& state, common::TimestampSec now) const {
  PoolState copy = state;
  accrue(copy, now);
  return copy;
}

void AccrualEngine::step(PoolState& state, std::uint64_t seconds, AccrualResult& result) const {
  const std::int64_t util = utilization(state);
  const std::int64_t rate = model_.borrow_rate(util);
  const auto elapsed = static_cast<common::Wide>(seconds);

  const common::Wide accrued =
      common::checked_mul(common::checked_mul(state.borrow_index, rate), elapsed) + state.borrow_index_carry;
  const std::int64_t index_growth = common::narrow(accrued / kAccrualDenominator);
  state.borrow_index_carry = common::narrow(accrued % kAccrualDenominator);

  // Pool interest follows the index, so the total never runs ahead of the
  // debts it is the sum of.
  const std::int64_t interest =
      index_growth == 0 ? 0 : common::mul_div(state.total_borrows, index_growth, state.borrow_index);

  state.borrow_index = common::checked_add(state.borrow_index, index_growth);
  state.total_borrows = common::checked_add(state.total_borrows, interest);
  distribute(state, interest);

  result.utilization = util;
  result.borrow_rate = rate;
  result.interest = common::checked_add(result.interest, interest);
}

void AccrualEngine::distribute(PoolState& state, std::int64_t interest) {
  const std::int64_t claimed = state.claimed_deposits();
  state.total_deposits = common::checked_add(state.total_deposits, interest);
  const std::int64_t pending = common::checked_add(state.undistributed_interest, interest);
  if (pending == 0 || claimed <= 0) {
    state.undistributed_interest = pending;
    return;
  }

  const std::int64_t growth = common::mul_div(state.supply_index, pending, claimed);
  // Round what depositors received up so their balances never exceed the
  // deposits backing them.
  const common::Wide credited = static_cast<common::Wide>(claimed) * growth;
  const std::int64_t distributed =
      common::narrow((credited + state.supply_index - 1) / state.supply_index);
  state.supply_index = common::checked_add(state.supply_index, growth);
  state.undistributed_interest = pending - distributed;
}

}  // namespace ledger
}  // namespace lendcore
