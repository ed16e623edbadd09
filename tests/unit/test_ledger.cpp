#include "test_ledger.hpp"

#include <cassert>
#include <vector>

#include "lendcore/common/fixed_point.hpp"
#include "lendcore/ledger/account_book.hpp"
#include "lendcore/risk/risk_engine.hpp"
#include "test_support.hpp"

namespace lendcore::tests {

namespace {

auth::Credential sign_risk(Protocol& protocol, common::AccountId signer, const risk::RiskParameters& params) {
  return protocol.sign(signer, auth::ActionKind::kSetRiskParameters, 0, risk::pack(params), {});
}

}  // namespace

void test_account_book() {
  ledger::AccountBook book;
  assert(book.get(5) == ledger::AccountRecord{});
  assert(!book.contains(5));

  book.put(9, {.deposit_principal = 100});
  book.put(5, {.collateral = 7});
  book.put(7, {});
  assert(book.size() == 2);
  assert((book.accounts() == std::vector<common::AccountId>{5, 9}));

  book.put(9, {});
  assert(!book.contains(9));

  book.set_prune_empty(false);
  book.put(9, {});
  assert(book.contains(9));
  book.clear();
  assert(book.size() == 0);

  // Balances scale with the index growth since the snapshot.
  const ledger::PoolState pool{.borrow_index = 1'500'000'000, .supply_index = 1'200'000'000};
  const ledger::AccountRecord record{.deposit_principal = 1'000,
                                     .supply_index_snapshot = 1'000'000'000,
                                     .borrow_principal = 300,
                                     .borrow_index_snapshot = 1'250'000'000,
                                     .collateral = 0};
  assert(ledger::deposit_balance(record, pool) == 1'200);
  assert(ledger::borrow_balance(record, pool) == 360);
  assert(ledger::borrow_balance({}, pool) == 0);
}

void test_pool_initialization() {
  Protocol protocol;
  expect_error(common::ErrorCode::kAlreadyInitialized, [&] { protocol.pool.initialize({.admin = kAdmin}); });

  const ledger::PoolServices services{.clock = protocol.clock,
                                      .authorizer = protocol.authorizer,
                                      .tokens = protocol.tokens,
                                      .events = protocol.events};

  interest::InterestRateModel idle_model;
  ledger::LendingPool unbound{services, protocol.price_oracle, idle_model};
  expect_error(common::ErrorCode::kNotInitialized, [&] { unbound.initialize({.admin = kAdmin}); });
  assert(!unbound.initialized());
  expect_error(common::ErrorCode::kNotInitialized, [&] { (void)unbound.total_deposits(); });
  expect_error(common::ErrorCode::kNotInitialized, [&] { (void)unbound.health_factor(1); });
  expect_error(common::ErrorCode::kNotInitialized, [&] { (void)unbound.accrue_interest(); });
  expect_error(common::ErrorCode::kNotInitialized, [&] {
    unbound.deposit(protocol.sign(10, auth::ActionKind::kDeposit, 10, 1, "USDC"), 1);
  });

  idle_model.initialize({});
  expect_error(common::ErrorCode::kInvalidInput, [&] {
    unbound.initialize({.admin = kAdmin,
                        .risk = {.ltv_basis_points = 8'000, .liquidation_threshold_basis_points = 8'000}});
  });
  expect_error(common::ErrorCode::kInvalidInput, [&] {
    unbound.initialize({.admin = kAdmin, .lendable_asset = "XLM", .collateral_asset = "XLM"});
  });
  expect_error(common::ErrorCode::kInvalidInput,
               [&] { unbound.initialize({.admin = kAdmin, .lendable_asset = "", .collateral_asset = "XLM"}); });
  assert(!unbound.initialized());

  protocol.clock.advance(50);
  unbound.initialize({.admin = kAdmin});
  assert(unbound.initialized());
  assert(unbound.pool_state() == ledger::PoolState{.last_accrual_time = kGenesis + 50});
  assert(unbound.settings().lendable_asset == "USDC");
  assert(unbound.settings().collateral_asset == "XLM");
  assert(unbound.risk_parameters().ltv_basis_points == 7'500);
}

void test_deposit_withdraw() {
  Protocol protocol;
  auto& pool = protocol.pool;

  protocol.fund(common::AssetKind::kLendable, 10, 1'000);
  assert(protocol.deposit(10, 600) == 600);
  assert(pool.deposit_balance(10) == 600);
  assert(pool.total_deposits() == 600);
  assert(protocol.tokens.wallet(common::AssetKind::kLendable, 10) == 400);
  assert(protocol.tokens.custody(common::AssetKind::kLendable) == 600);
  assert(protocol.events.count(telemetry::EventKind::kDeposit) == 1);

  expect_error(common::ErrorCode::kInvalidInput, [&] { protocol.deposit(10, 0); });
  expect_error(common::ErrorCode::kInvalidInput, [&] { protocol.deposit(10, -5); });
  expect_error(common::ErrorCode::kInsufficientBalance, [&] { protocol.withdraw(10, 601); });
  expect_error(common::ErrorCode::kInvalidInput, [&] { protocol.withdraw(10, 0); });

  assert(protocol.withdraw(10, 250) == 250);
  assert(pool.deposit_balance(10) == 350);
  assert(protocol.withdraw(10, 350) == 350);
  assert(pool.deposit_balance(10) == 0);
  assert(pool.total_deposits() == 0);
  assert(protocol.tokens.wallet(common::AssetKind::kLendable, 10) == 1'000);
  // Emptied accounts are pruned and read back as zero.
  assert(!pool.accounts().contains(10));
  assert(pool.account(10).deposit_balance == 0);

  // Liquidity lent out cannot be withdrawn; the balance check comes first.
  protocol.supply(11, 1'000);
  protocol.collateralize(20, 1'000);
  protocol.borrow(20, 700);
  expect_error(common::ErrorCode::kInsufficientBalance, [&] { protocol.withdraw(11, 2'000); });
  expect_error(common::ErrorCode::kInsufficientLiquidity, [&] { protocol.withdraw(11, 500); });
  assert(protocol.withdraw(11, 300) == 300);
  assert(pool.total_borrows() <= pool.total_deposits());

  // With pruning off, empty records stay.
  Protocol keeping{{.prune_empty_accounts = false}};
  keeping.supply(10, 50);
  keeping.withdraw(10, 50);
  assert(keeping.pool.accounts().contains(10));
  assert(keeping.pool.accounts().get(10).empty());
}

void test_borrow_and_repay() {
  Protocol protocol;
  auto& pool = protocol.pool;
  protocol.supply(10, 10'000);

  expect_error(common::ErrorCode::kNoOutstandingDebt, [&] { protocol.repay(20, 10); });
  // No collateral, no capacity.
  expect_error(common::ErrorCode::kExceedsCapacity, [&] { protocol.borrow(20, 1); });

  protocol.collateralize(20, 1'000);
  expect_error(common::ErrorCode::kExceedsCapacity, [&] { protocol.borrow(20, 751); });
  assert(protocol.borrow(20, 750) == 750);
  expect_error(common::ErrorCode::kExceedsCapacity, [&] { protocol.borrow(20, 1); });
  assert(pool.borrow_balance(20) == 750);
  assert(pool.total_borrows() == 750);
  assert(protocol.tokens.wallet(common::AssetKind::kLendable, 20) == 750);
  assert(pool.account(20).borrow_index_snapshot == common::kIndexScale);

  assert(protocol.repay(20, 300) == 300);
  assert(pool.borrow_balance(20) == 450);
  assert(pool.total_borrows() == 450);

  // Overpayment is capped at the debt; only the debt leaves the wallet.
  assert(protocol.repay(20, 1'000) == 450);
  assert(pool.borrow_balance(20) == 0);
  assert(pool.total_borrows() == 0);
  assert(protocol.tokens.wallet(common::AssetKind::kLendable, 20) == 0);
  expect_error(common::ErrorCode::kNoOutstandingDebt, [&] { protocol.repay(20, 1); });

  // Without debt the whole collateral can leave.
  assert(protocol.withdraw_collateral(20, 1'000) == 1'000);
  assert(!pool.accounts().contains(20));
  assert(protocol.tokens.wallet(common::AssetKind::kCollateral, 20) == 1'000);

  // Liquidity is checked before capacity.
  Protocol shallow;
  shallow.supply(10, 100);
  shallow.collateralize(20, 1'000);
  expect_error(common::ErrorCode::kInsufficientLiquidity, [&] { shallow.borrow(20, 800); });
  expect_error(common::ErrorCode::kInsufficientLiquidity, [&] { shallow.borrow(20, 101); });
  assert(shallow.borrow(20, 100) == 100);
  assert(shallow.pool.market_info().available_liquidity == 0);
  assert(shallow.pool.utilization_rate() == common::kRateScale);

  assert(protocol.events.count(telemetry::EventKind::kBorrow) == 1);
  assert(protocol.events.count(telemetry::EventKind::kRepay) == 2);
}

void test_collateral_withdrawal_guard() {
  Protocol protocol;
  auto& pool = protocol.pool;
  protocol.supply(10, 10'000);
  protocol.collateralize(20, 1'000);
  protocol.borrow(20, 750);
  assert(pool.health_factor(20) == 10'666'666);

  expect_error(common::ErrorCode::kInsufficientBalance, [&] { protocol.withdraw_collateral(20, 1'001); });
  expect_error(common::ErrorCode::kUnhealthyPosition, [&] { protocol.withdraw_collateral(20, 100); });
  assert(pool.collateral_balance(20) == 1'000);

  assert(protocol.withdraw_collateral(20, 50) == 50);
  assert(pool.health_factor(20) == 10'133'333);

  // 938 collateral backs exactly 1.0; one unit less does not.
  assert(protocol.withdraw_collateral(20, 12) == 12);
  assert(pool.health_factor(20) == common::kRateScale);
  expect_error(common::ErrorCode::kUnhealthyPosition, [&] { protocol.withdraw_collateral(20, 1); });
  assert(pool.collateral_balance(20) == 938);
  assert(protocol.tokens.wallet(common::AssetKind::kCollateral, 20) == 62);
  assert(protocol.events.count(telemetry::EventKind::kCollateralWithdrawn) == 2);

  // The guard values the debt with interest accrued to now: 938 collateral
  // no longer backs it after a year.
  protocol.collateralize(20, 2);
  protocol.clock.advance(static_cast<common::TimestampSec>(common::kSecondsPerYear));
  protocol.set_price("XLM", kOneUsd);
  protocol.set_price("USDC", kOneUsd);
  assert(pool.borrow_balance(20) == 752);
  expect_error(common::ErrorCode::kUnhealthyPosition, [&] { protocol.withdraw_collateral(20, 2); });
  assert(pool.collateral_balance(20) == 940);
}

void test_failed_operations_leave_state_unchanged() {
  Protocol protocol;
  auto& pool = protocol.pool;
  protocol.supply(10, 10'000);
  protocol.collateralize(20, 1'000);
  protocol.borrow(20, 750);

  const auto pool_before = pool.pool_state();
  const auto accounts_before = pool.accounts().records();
  const auto usdc_custody = protocol.tokens.custody(common::AssetKind::kLendable);
  const auto xlm_custody = protocol.tokens.custody(common::AssetKind::kCollateral);
  const auto unchanged = [&] {
    assert(pool.pool_state() == pool_before);
    assert(pool.accounts().records() == accounts_before);
    assert(protocol.tokens.custody(common::AssetKind::kLendable) == usdc_custody);
    assert(protocol.tokens.custody(common::AssetKind::kCollateral) == xlm_custody);
  };

  expect_error(common::ErrorCode::kUnhealthyPosition, [&] { protocol.withdraw_collateral(20, 500); });
  unchanged();

  // Unfunded wallet: the transfer fails after every check passed.
  expect_error(common::ErrorCode::kTransferFailed, [&] { protocol.deposit(30, 100); });
  expect_error(common::ErrorCode::kTransferFailed, [&] { protocol.deposit_collateral(30, 100); });
  assert(!pool.accounts().contains(30));
  unchanged();

  // Bad signature.
  expect_error(common::ErrorCode::kUnauthorized, [&] {
    pool.deposit(protocol.sign(10, auth::ActionKind::kDeposit, 10, 5, "USDC"), 6);
  });
  // Someone else's credential.
  expect_error(common::ErrorCode::kUnauthorized, [&] {
    auto credential = protocol.sign(10, auth::ActionKind::kWithdraw, 10, 5, "USDC");
    credential.principal = 20;
    pool.withdraw(credential, 5);
  });
  unchanged();

  // Stale prices abort decisions that need them, even after interest
  // accrued on the working copy.
  protocol.clock.advance(oracle::kDefaultStalenessSeconds + 1);
  expect_error(common::ErrorCode::kStalePrice, [&] { protocol.borrow(20, 1); });
  expect_error(common::ErrorCode::kStalePrice, [&] { protocol.withdraw_collateral(20, 1); });
  unchanged();
  assert(pool.pool_state().last_accrual_time == kGenesis);

  // Operations without a price dependency proceed.
  protocol.fund(common::AssetKind::kCollateral, 20, 10);
  assert(protocol.deposit_collateral(20, 10) == 10);
  assert(pool.pool_state().last_accrual_time == kGenesis + oracle::kDefaultStalenessSeconds + 1);
}

void test_pool_queries() {
  Protocol protocol;
  auto& pool = protocol.pool;
  protocol.supply(10, 10'000);
  protocol.collateralize(20, 1'000);

  assert(pool.health_factor(20) == risk::kInfiniteHealthFactor);
  assert(pool.health_factor(99) == risk::kInfiniteHealthFactor);
  assert(pool.available_to_borrow(20) == 750);
  assert(pool.available_to_borrow(99) == 0);

  protocol.borrow(20, 500);
  assert(pool.available_to_borrow(20) == 250);
  assert(pool.health_factor(20) == 16'000'000);

  const auto view = pool.account(20);
  assert(view.borrow_balance == 500);
  assert(view.collateral_balance == 1'000);
  assert(view.deposit_balance == 0);
  assert(view.borrow_index_snapshot == common::kIndexScale);

  using ledger::PositionChange;
  assert(pool.projected_health_factor(20, PositionChange::kBorrow, 250) == 10'666'666);
  assert(pool.projected_health_factor(20, PositionChange::kWithdrawCollateral, 375) == common::kRateScale);
  assert(pool.projected_health_factor(20, PositionChange::kDepositCollateral, 1'000) == 32'000'000);
  assert(pool.projected_health_factor(20, PositionChange::kRepay, 500) == risk::kInfiniteHealthFactor);
  assert(pool.projected_health_factor(20, PositionChange::kRepay, 5'000) == risk::kInfiniteHealthFactor);
  assert(pool.projected_health_factor(99, PositionChange::kDepositCollateral, 5) == risk::kInfiniteHealthFactor);
  expect_error(common::ErrorCode::kInsufficientBalance,
               [&] { (void)pool.projected_health_factor(20, PositionChange::kWithdrawCollateral, 1'001); });
  expect_error(common::ErrorCode::kInvalidInput,
               [&] { (void)pool.projected_health_factor(20, PositionChange::kBorrow, -1); });

  // Queries never commit.
  const auto before = pool.pool_state();
  protocol.clock.advance(static_cast<common::TimestampSec>(common::kSecondsPerYear));
  (void)pool.market_info();
  (void)pool.health_factor(20);
  assert(pool.pool_state() == before);

  // Queries need a quote, not a fresh one. 0.25% APR at 5% utilization.
  assert(protocol.price_oracle.is_stale("XLM"));
  assert(pool.borrow_balance(20) == 501);
  assert(pool.health_factor(20) == 15'968'063);

  // A collateral asset without any price.
  Protocol unpriced{{.collateral_asset = "ETH"}};
  unpriced.supply(10, 1'000);
  unpriced.fund(common::AssetKind::kCollateral, 20, 100);
  unpriced.pool.deposit_collateral(unpriced.sign(20, auth::ActionKind::kDepositCollateral, 20, 100, "ETH"), 100);
  assert(unpriced.pool.health_factor(20) == risk::kInfiniteHealthFactor);
  expect_error(common::ErrorCode::kPriceNotSet, [&] { (void)unpriced.pool.available_to_borrow(20); });
  expect_error(common::ErrorCode::kPriceNotSet, [&] {
    unpriced.pool.borrow(unpriced.sign(20, auth::ActionKind::kBorrow, 20, 10, "USDC"), 10);
  });
  expect_error(common::ErrorCode::kPriceNotSet,
               [&] { (void)unpriced.pool.projected_health_factor(20, PositionChange::kBorrow, 10); });
}

void test_risk_parameter_updates() {
  Protocol protocol;
  auto& pool = protocol.pool;
  protocol.supply(10, 10'000);
  protocol.collateralize(20, 1'000);
  assert(pool.available_to_borrow(20) == 750);

  const risk::RiskParameters tighter{.ltv_basis_points = 5'000,
                                     .liquidation_threshold_basis_points = 6'000,
                                     .close_factor_basis_points = 5'000,
                                     .liquidation_bonus_basis_points = 500};
  expect_error(common::ErrorCode::kUnauthorized,
               [&] { pool.set_risk_parameters(sign_risk(protocol, 10, tighter), tighter); });

  const risk::RiskParameters inverted{.ltv_basis_points = 6'000, .liquidation_threshold_basis_points = 5'000};
  expect_error(common::ErrorCode::kInvalidInput,
               [&] { pool.set_risk_parameters(sign_risk(protocol, kAdmin, inverted), inverted); });
  const risk::RiskParameters no_close{.close_factor_basis_points = 0};
  expect_error(common::ErrorCode::kInvalidInput,
               [&] { pool.set_risk_parameters(sign_risk(protocol, kAdmin, no_close), no_close); });
  assert(pool.risk_parameters().ltv_basis_points == 7'500);

  // Signed for one set of parameters, submitted with another.
  expect_error(common::ErrorCode::kUnauthorized,
               [&] { pool.set_risk_parameters(sign_risk(protocol, kAdmin, tighter), risk::RiskParameters{}); });

  pool.set_risk_parameters(sign_risk(protocol, kAdmin, tighter), tighter);
  assert(pool.risk_parameters().ltv_basis_points == 5'000);
  assert(pool.risk_parameters().liquidation_bonus_basis_points == 500);
  assert(pool.available_to_borrow(20) == 500);
  expect_error(common::ErrorCode::kExceedsCapacity, [&] { protocol.borrow(20, 501); });
  assert(protocol.borrow(20, 500) == 500);
  assert(pool.health_factor(20) == 12'000'000);
}

void test_commit_hook() {
  Protocol protocol;
  auto& pool = protocol.pool;
  std::vector<ledger::CommitRecord> commits;
  pool.set_commit_hook([&](const ledger::CommitRecord& record) { commits.push_back(record); });

  protocol.supply(10, 1'000);
  assert(commits.size() == 1);
  assert(commits.back().operation == ledger::Operation::kDeposit);
  assert(commits.back().account.has_value());
  assert(commits.back().account->first == 10);
  assert(commits.back().account->second.deposit_principal == 1'000);
  assert(commits.back().pool == pool.pool_state());

  // Rejected calls commit nothing.
  expect_error(common::ErrorCode::kInsufficientBalance, [&] { protocol.withdraw(10, 5'000); });
  assert(commits.size() == 1);

  // No elapsed time, nothing to accrue.
  (void)pool.accrue_interest();
  assert(commits.size() == 1);

  protocol.clock.advance(60);
  (void)pool.accrue_interest();
  assert(commits.size() == 2);
  assert(commits.back().operation == ledger::Operation::kAccrue);
  assert(!commits.back().account.has_value());
  assert(commits.back().timestamp == kGenesis + 60);

  protocol.withdraw(10, 1'000);
  assert(commits.back().operation == ledger::Operation::kWithdraw);
  // The pruned account is journaled as an empty record.
  assert(commits.back().account->second.empty());
}

}  // namespace lendcore::tests
