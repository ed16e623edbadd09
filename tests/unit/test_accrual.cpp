#include "test_accrual.hpp"

#include <cassert>

#include "lendcore/common/fixed_point.hpp"
#include "lendcore/ledger/accrual_engine.hpp"
#include "test_support.hpp"

namespace lendcore::tests {

namespace {

constexpr common::TimestampSec kYear = static_cast<common::TimestampSec>(common::kSecondsPerYear);

interest::InterestRateModel default_model() {
  interest::InterestRateModel model;
  model.initialize({});
  return model;
}

}  // namespace

void test_accrual_one_year() {
  const auto model = default_model();
  ledger::AccrualEngine engine{model};

  // 80% utilization: 4% APR.
  ledger::PoolState state{.total_deposits = 1'000'000'000'000,
                          .total_borrows = 800'000'000'000,
                          .borrow_index = common::kIndexScale,
                          .supply_index = common::kIndexScale,
                          .last_accrual_time = kGenesis};
  const auto result = engine.accrue(state, kGenesis + kYear);

  assert(result.elapsed_seconds == kYear);
  assert(result.utilization == 8'000'000);
  assert(result.borrow_rate == 400'000);
  assert(result.interest == 32'000'000'000);
  assert(state.total_borrows == 832'000'000'000);
  assert(state.total_deposits == 1'032'000'000'000);
  assert(state.borrow_index == 1'040'000'000);
  assert(state.supply_index == 1'032'000'000);
  assert(state.last_accrual_time == kGenesis + kYear);
  assert(state.total_borrows <= state.total_deposits);
}

void test_accrual_noop_cases() {
  const auto model = default_model();
  ledger::AccrualEngine engine{model};

  const ledger::PoolState origin{.total_deposits = 5'000,
                                 .total_borrows = 4'000,
                                 .borrow_index = common::kIndexScale,
                                 .supply_index = common::kIndexScale,
                                 .last_accrual_time = kGenesis};

  // Same timestamp twice.
  ledger::PoolState state = origin;
  engine.accrue(state, kGenesis + 3'600);
  const ledger::PoolState once = state;
  const auto again = engine.accrue(state, kGenesis + 3'600);
  assert(again.elapsed_seconds == 0);
  assert(again.interest == 0);
  assert(state == once);

  // Clock behind the last accrual.
  const auto behind = engine.accrue(state, kGenesis);
  assert(behind.elapsed_seconds == 0);
  assert(state == once);

  // Preview leaves the source untouched and matches a real accrual.
  const auto preview = engine.preview(origin, kGenesis + 3'600);
  assert(preview == once);

  // Empty pool: time advances, nothing else does.
  ledger::PoolState empty{.last_accrual_time = kGenesis};
  const auto idle = engine.accrue(empty, kGenesis + kYear);
  assert(idle.interest == 0);
  assert(idle.utilization == 0);
  assert(empty.borrow_index == common::kIndexScale);
  assert(empty.supply_index == common::kIndexScale);
  assert(empty.last_accrual_time == kGenesis + kYear);

  assert(ledger::AccrualEngine::utilization(origin) == 8'000'000);
  assert(ledger::AccrualEngine::utilization(empty) == 0);
}

void test_accrual_long_gaps() {
  const auto model = default_model();

  // Ten years at full utilization in yearly steps.
  ledger::AccrualEngine yearly{model};
  ledger::PoolState state{.total_deposits = 1'000'000'000'000,
                          .total_borrows = 1'000'000'000'000,
                          .borrow_index = common::kIndexScale,
                          .supply_index = common::kIndexScale,
                          .last_accrual_time = kGenesis};
  std::int64_t previous_index = state.borrow_index;
  for (int year = 1; year <= 10; ++year) {
    ledger::PoolState stepped = state;
    yearly.accrue(stepped, kGenesis + static_cast<common::TimestampSec>(year) * kYear);
    assert(stepped.borrow_index >= previous_index);
    assert(stepped.total_borrows <= stepped.total_deposits);
    previous_index = stepped.borrow_index;
  }

  // One call over ten years equals ten yearly calls.
  ledger::PoolState once = state;
  const auto result = yearly.accrue(once, kGenesis + 10 * kYear);
  assert(result.elapsed_seconds == 10 * kYear);
  ledger::PoolState incremental = state;
  for (int year = 1; year <= 10; ++year) {
    yearly.accrue(incremental, kGenesis + static_cast<common::TimestampSec>(year) * kYear);
  }
  assert(once == incremental);

  // Shorter steps compound more often.
  ledger::AccrualEngine monthly{model, {.max_step_seconds = kYear / 12}};
  ledger::PoolState fine = state;
  ledger::PoolState coarse = state;
  monthly.accrue(fine, kGenesis + kYear);
  yearly.accrue(coarse, kGenesis + kYear);
  assert(fine.borrow_index > coarse.borrow_index);
  assert(fine.total_borrows <= fine.total_deposits);
}

void test_pool_accrual() {
  Protocol protocol;
  auto& pool = protocol.pool;

  protocol.supply(10, 10'000);
  protocol.collateralize(20, 20'000);
  protocol.borrow(20, 8'000);
  assert(pool.utilization_rate() == 8'000'000);
  assert(pool.borrow_rate() == 400'000);
  assert(pool.supply_rate() == 320'000);

  protocol.clock.advance(kYear);

  // Queries preview interest without committing it.
  assert(pool.total_borrows() == 8'320);
  assert(pool.total_deposits() == 10'320);
  assert(pool.borrow_balance(20) == 8'320);
  assert(pool.deposit_balance(10) == 10'320);
  assert(pool.pool_state().total_borrows == 8'000);
  assert(pool.pool_state().last_accrual_time == kGenesis);

  const auto info = pool.market_info();
  assert(info.borrow_index == 1'040'000'000);
  assert(info.supply_index == 1'032'000'000);
  assert(info.available_liquidity == 2'000);

  const auto accrued = pool.accrue_interest();
  assert(accrued.interest == 320);
  assert(pool.pool_state().total_borrows == 8'320);
  assert(pool.pool_state().borrow_index == 1'040'000'000);
  assert(pool.pool_state().last_accrual_time == kGenesis + kYear);
  assert(protocol.events.count(telemetry::EventKind::kInterestAccrued) == 1);

  // Nothing left to accrue at the same instant.
  const auto repeat = pool.accrue_interest();
  assert(repeat.elapsed_seconds == 0);
  assert(pool.pool_state().total_borrows == 8'320);

  // Full repayment with interest, then the lender exits with theirs.
  protocol.fund(common::AssetKind::kLendable, 20, 320);
  assert(protocol.repay(20, 1'000'000) == 8'320);
  assert(pool.borrow_balance(20) == 0);
  assert(pool.total_borrows() == 0);
  assert(protocol.withdraw(10, 10'320) == 10'320);
  assert(protocol.tokens.wallet(common::AssetKind::kLendable, 10) == 10'320);
  assert(protocol.tokens.custody(common::AssetKind::kLendable) == 0);
  assert(pool.total_deposits() == 0);
}

void test_accrual_short_steps() {
  // An hour of one-second accruals at 50% utilization, against the same hour
  // accrued at once.
  Protocol stepped;
  Protocol single;
  for (Protocol* protocol : {&stepped, &single}) {
    protocol->supply(10, 1'000'000'000'000);
    protocol->collateralize(20, 1'000'000'000'000);
    protocol->borrow(20, 500'000'000'000);
  }

  for (int second = 0; second < 3'600; ++second) {
    stepped.clock.advance(1);
    (void)stepped.pool.accrue_interest();
  }
  single.clock.advance(3'600);
  (void)single.pool.accrue_interest();

  const auto& state = stepped.pool.pool_state();
  const auto& reference = single.pool.pool_state();
  assert(state.borrow_index > common::kIndexScale);
  assert(state.borrow_index >= reference.borrow_index);
  assert(state.borrow_index - reference.borrow_index <= 2);

  // The pool total is exactly what the only borrower owes.
  assert(state.total_borrows > 500'000'000'000);
  assert(stepped.pool.borrow_balance(20) == state.total_borrows);

  // The lender's balance plus interest not yet passed on adds up to the
  // deposits, and what is held back is less than one index unit of them.
  const std::int64_t lender = stepped.pool.deposit_balance(10);
  assert(lender > 1'000'000'000'000);
  assert(lender + state.undistributed_interest == state.total_deposits);
  assert(state.undistributed_interest < 1'000);

  // Repaying the debt in full clears the pool total.
  const std::int64_t debt = stepped.pool.borrow_balance(20);
  stepped.fund(common::AssetKind::kLendable, 20, debt - 500'000'000'000);
  assert(stepped.repay(20, debt) == debt);
  assert(stepped.pool.pool_state().total_borrows == 0);
  assert(stepped.pool.borrow_balance(20) == 0);
  assert(stepped.withdraw(10, lender) == lender);
}

}  // namespace lendcore::tests
