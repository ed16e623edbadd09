#include "lendcore/ledger/lending_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

#include "lendcore/common/error.hpp"
#include "lendcore/common/fixed_point.hpp"

namespace lendcore {
namespace ledger {

using common::AssetKind;
using common::ErrorCode;
using common::LendingError;

namespace {

// Folds accrued interest into the principal and re-tags it with the
// current index so the principal can be adjusted directly.
void settle_supply(AccountRecord& record, const PoolState& pool) {
  record.deposit_principal = deposit_balance(record, pool);
  record.supply_index_snapshot = pool.supply_index;
  record.supply_epoch = pool.supply_epoch;
}

void settle_borrow(AccountRecord& record, const PoolState& pool) {
  record.borrow_principal = borrow_balance(record, pool);
  record.borrow_index_snapshot = pool.borrow_index;
}

// Per-account debts truncate independently of the pool total, so the total
// can trail their sum by a few units.
std::int64_t saturating_sub(std::int64_t total, std::int64_t amount) {
  return std::max<std::int64_t>(total - amount, 0);
}

// Depositors absorb a write-off pro rata through the supply index, after any
// interest not yet passed on to them. A loss that consumes every claim opens
// a new supply epoch instead of leaving a near-zero index behind, so no
// earlier principal keeps a residual balance.
void absorb_bad_debt(PoolState& pool, std::int64_t bad_debt) {
  const std::int64_t claimed = pool.claimed_deposits();
  const std::int64_t from_undistributed = std::min(pool.undistributed_interest, bad_debt);
  pool.undistributed_interest -= from_undistributed;
  const std::int64_t remaining = saturating_sub(claimed, bad_debt - from_undistributed);

  if (remaining == 0) {
    ++pool.supply_epoch;
    pool.supply_index = common::kIndexScale;
    spdlog::warn("deposits wiped out by bad debt; supply epoch {} opened", pool.supply_epoch);
  } else if (remaining < claimed) {
    pool.supply_index = std::max<std::int64_t>(common::mul_div(pool.supply_index, remaining, claimed), 1);
  }
  pool.total_deposits = remaining + pool.undistributed_interest;
}

}  // namespace

LendingPool::LendingPool(PoolServices services, const oracle::PriceOracle& oracle,
                         const interest::InterestRateModel& model)
    : services_(services), oracle_(oracle), model_(model), accrual_(model), liquidation_(risk_) {}

void LendingPool::initialize(const PoolSettings& settings) {
  if (initialized_) {
    throw LendingError(ErrorCode::kAlreadyInitialized, "lending pool already initialized");
  }
  if (!model_.initialized()) {
    throw LendingError(ErrorCode::kNotInitialized, "interest rate model not initialized");
  }
  oracle::validate_asset_symbol(settings.lendable_asset);
  oracle::validate_asset_symbol(settings.collateral_asset);
  if (settings.lendable_asset == settings.collateral_asset) {
    throw LendingError(ErrorCode::kInvalidInput, "lendable and collateral assets must differ");
  }
  risk_.set_parameters(settings.risk);

  settings_ = settings;
  accrual_.set_config(settings.accrual);
  accounts_.set_prune_empty(settings.prune_empty_accounts);
  pool_ = PoolState{};
  pool_.last_accrual_time = services_.clock.now();
  initialized_ = true;

  spdlog::info("lending pool initialized lendable={} collateral={} admin={} ltv={}bp threshold={}bp",
               settings_.lendable_asset, settings_.collateral_asset, settings_.admin,
               settings_.risk.ltv_basis_points, settings_.risk.liquidation_threshold_basis_points);
}

std::int64_t LendingPool::deposit(const auth::Credential& credential, std::int64_t amount) {
  require_initialized();
  const auto account = credential.principal;
  authorize(credential, account, auth::ActionKind::kDeposit, account, amount, settings_.lendable_asset);
  require_positive(amount);

  Working working = begin(account);
  settle_supply(working.record, working.pool);
  working.record.deposit_principal = common::checked_add(working.record.deposit_principal, amount);
  working.pool.total_deposits = common::checked_add(working.pool.total_deposits, amount);

  services_.tokens.transfer_in(AssetKind::kLendable, account, amount);
  commit(Operation::kDeposit, working);
  publish(telemetry::EventKind::kDeposit, account, amount, settings_.lendable_asset);
  return amount;
}

std::int64_t LendingPool::withdraw(const auth::Credential& credential, std::int64_t amount) {
  require_initialized();
  const auto account = credential.principal;
  authorize(credential, account, auth::ActionKind::kWithdraw, account, amount, settings_.lendable_asset);
  require_positive(amount);

  Working working = begin(account);
  settle_supply(working.record, working.pool);
  if (amount > working.record.deposit_principal) {
    throw LendingError(ErrorCode::kInsufficientBalance,
                       "withdraw " + std::to_string(amount) + " exceeds deposit " +
                           std::to_string(working.record.deposit_principal));
  }
  if (amount > working.pool.available_liquidity()) {
    throw LendingError(ErrorCode::kInsufficientLiquidity,
                       "withdraw " + std::to_string(amount) + " exceeds available liquidity " +
                           std::to_string(working.pool.available_liquidity()));
  }
  working.record.deposit_principal -= amount;
  working.pool.total_deposits -= amount;

  services_.tokens.transfer_out(AssetKind::kLendable, account, amount);
  commit(Operation::kWithdraw, working);
  publish(telemetry::EventKind::kWithdraw, account, amount, settings_.lendable_asset);
  return amount;
}

std::int64_t LendingPool::deposit_collateral(const auth::Credential& credential, std::int64_t amount) {
  require_initialized();
  const auto account = credential.principal;
  authorize(credential, account, auth::ActionKind::kDepositCollateral, account, amount, settings_.collateral_asset);
  require_positive(amount);

  Working working = begin(account);
  working.record.collateral = common::checked_add(working.record.collateral, amount);

  services_.tokens.transfer_in(AssetKind::kCollateral, account, amount);
  commit(Operation::kDepositCollateral, working);
  publish(telemetry::EventKind::kCollateralDeposited, account, amount, settings_.collateral_asset);
  return amount;
}

std::int64_t LendingPool::withdraw_collateral(const auth::Credential& credential, std::int64_t amount) {
  require_initialized();
  const auto account = credential.principal;
  authorize(credential, account, auth::ActionKind::kWithdrawCollateral, account, amount, settings_.collateral_asset);
  require_positive(amount);

  Working working = begin(account);
  if (amount > working.record.collateral) {
    throw LendingError(ErrorCode::kInsufficientBalance,
                       "withdraw " + std::to_string(amount) + " exceeds collateral " +
                           std::to_string(working.record.collateral));
  }

  const std::int64_t debt = ledger::borrow_balance(working.record, working.pool);
  if (debt > 0) {
    const risk::Position projected{.collateral = working.record.collateral - amount, .debt = debt};
    const std::int64_t health = risk_.health_factor(projected, safe_prices());
    if (health < common::kRateScale) {
      throw LendingError(ErrorCode::kUnhealthyPosition,
                         "health factor after withdrawal would be " + std::to_string(health));
    }
  }
  working.record.collateral -= amount;

  services_.tokens.transfer_out(AssetKind::kCollateral, account, amount);
  commit(Operation::kWithdrawCollateral, working);
  publish(telemetry::EventKind::kCollateralWithdrawn, account, amount, settings_.collateral_asset);
  return amount;
}

std::int64_t LendingPool::borrow(const auth::Credential& credential, std::int64_t amount) {
  require_initialized();
  const auto account = credential.principal;
  authorize(credential, account, auth::ActionKind::kBorrow, account, amount, settings_.lendable_asset);
  require_positive(amount);

  Working working = begin(account);
  if (amount > working.pool.available_liquidity()) {
    throw LendingError(ErrorCode::kInsufficientLiquidity,
                       "borrow " + std::to_string(amount) + " exceeds available liquidity " +
                           std::to_string(working.pool.available_liquidity()));
  }

  settle_borrow(working.record, working.pool);
  const std::int64_t capacity = risk_.max_borrow(working.record.collateral, safe_prices());
  const std::int64_t new_debt = common::checked_add(working.record.borrow_principal, amount);
  if (new_debt > capacity) {
    throw LendingError(ErrorCode::kExceedsCapacity,
                       "debt " + std::to_string(new_debt) + " would exceed capacity " + std::to_string(capacity));
  }
  working.record.borrow_principal = new_debt;
  working.pool.total_borrows = common::checked_add(working.pool.total_borrows, amount);

  services_.tokens.transfer_out(AssetKind::kLendable, account, amount);
  commit(Operation::kBorrow, working);
  publish(telemetry::EventKind::kBorrow, account, amount, settings_.lendable_asset);
  return amount;
}

std::int64_t LendingPool::repay(const auth::Credential& credential, std::int64_t amount) {
  require_initialized();
  const auto account = credential.principal;
  authorize(credential, account, auth::ActionKind::kRepay, account, amount, settings_.lendable_asset);
  require_positive(amount);

  Working working = begin(account);
  settle_borrow(working.record, working.pool);
  if (working.record.borrow_principal == 0) {
    throw LendingError(ErrorCode::kNoOutstandingDebt, "account " + std::to_string(account) + " owes nothing");
  }
  const std::int64_t repaid = std::min(amount, working.record.borrow_principal);
  working.record.borrow_principal -= repaid;
  working.pool.total_borrows = saturating_sub(working.pool.total_borrows, repaid);

  services_.tokens.transfer_in(AssetKind::kLendable, account, repaid);
  commit(Operation::kRepay, working);
  publish(telemetry::EventKind::kRepay, account, repaid, settings_.lendable_asset);
  return repaid;
}

LiquidationOutcome LendingPool::liquidate(const auth::Credential& credential, common::AccountId borrower) {
  require_initialized();
  const auto liquidator = credential.principal;
  authorize(credential, liquidator, auth::ActionKind::kLiquidate, borrower, 0, settings_.collateral_asset);

  Working working = begin(borrower);
  settle_borrow(working.record, working.pool);
  const risk::Position position{.collateral = working.record.collateral, .debt = working.record.borrow_principal};
  if (position.debt == 0) {
    throw LendingError(ErrorCode::kPositionHealthy, "account " + std::to_string(borrower) + " has no debt");
  }
  const risk::LiquidationPlan plan = liquidation_.plan(position, safe_prices());

  working.record.borrow_principal = position.debt - plan.repay_amount - plan.bad_debt;
  working.record.collateral -= plan.seized_collateral;
  working.pool.total_borrows =
      saturating_sub(working.pool.total_borrows, common::checked_add(plan.repay_amount, plan.bad_debt));

  if (plan.bad_debt > 0) {
    absorb_bad_debt(working.pool, plan.bad_debt);
  }

  if (plan.repay_amount > 0) {
    services_.tokens.transfer_in(AssetKind::kLendable, liquidator, plan.repay_amount);
  }
  if (plan.seized_collateral > 0) {
    services_.tokens.transfer_out(AssetKind::kCollateral, liquidator, plan.seized_collateral);
  }
  commit(Operation::kLiquidate, working);
  publish(telemetry::EventKind::kLiquidation, borrower, plan.repay_amount, settings_.lendable_asset);

  spdlog::info("liquidated account={} by={} hf={} repaid={} seized={}", borrower, liquidator, plan.health_factor,
               plan.repay_amount, plan.seized_collateral);
  if (plan.bad_debt > 0) {
    spdlog::warn("bad debt of {} {} written off for account {}", plan.bad_debt, settings_.lendable_asset,
                 borrower);
  }

  return LiquidationOutcome{.borrower = borrower,
                            .liquidator = liquidator,
                            .health_factor_before = plan.health_factor,
                            .repaid = plan.repay_amount,
                            .seized_collateral = plan.seized_collateral,
                            .bad_debt = plan.bad_debt};
}

AccrualResult LendingPool::accrue_interest() {
  require_initialized();
  Working working = begin(std::nullopt);
  if (working.accrual.elapsed_seconds > 0) {
    commit(Operation::kAccrue, working);
  }
  return working.accrual;
}

void LendingPool::set_risk_parameters(const auth::Credential& credential, const risk::RiskParameters& params) {
  require_initialized();
  authorize(credential, settings_.admin, auth::ActionKind::kSetRiskParameters, 0, risk::pack(params), {});
  risk::validate(params);

  Working working = begin(std::nullopt);
  risk_.set_parameters(params);
  settings_.risk = params;
  commit(Operation::kSetRiskParameters, working);
  spdlog::info("risk parameters updated ltv={}bp threshold={}bp close={}bp bonus={}bp", params.ltv_basis_points,
               params.liquidation_threshold_basis_points, params.close_factor_basis_points,
               params.liquidation_bonus_basis_points);
}

std::int64_t LendingPool::total_deposits() const {
  return previewed().total_deposits;
}

std::int64_t LendingPool::total_borrows() const {
  return previewed().total_borrows;
}

std::int64_t LendingPool::utilization_rate() const {
  return AccrualEngine::utilization(previewed());
}

std::int64_t LendingPool::borrow_rate() const {
  return model_.borrow_rate(utilization_rate());
}

std::int64_t LendingPool::supply_rate() const {
  return model_.supply_rate(utilization_rate());
}

MarketInfo LendingPool::market_info() const {
  const PoolState state = previewed();
  const std::int64_t utilization = AccrualEngine::utilization(state);
  return MarketInfo{.total_deposits = state.total_deposits,
                    .total_borrows = state.total_borrows,
                    .available_liquidity = state.available_liquidity(),
                    .utilization = utilization,
                    .borrow_rate = model_.borrow_rate(utilization),
                    .supply_rate = model_.supply_rate(utilization),
                    .borrow_index = state.borrow_index,
                    .supply_index = state.supply_index};
}

std::int64_t LendingPool::deposit_balance(common::AccountId account) const {
  return ledger::deposit_balance(accounts_.get(account), previewed());
}

std::int64_t LendingPool::borrow_balance(common::AccountId account) const {
  return ledger::borrow_balance(accounts_.get(account), previewed());
}

std::int64_t LendingPool::collateral_balance(common::AccountId account) const {
  require_initialized();
  return accounts_.get(account).collateral;
}

AccountView LendingPool::account(common::AccountId account) const {
  const PoolState state = previewed();
  const AccountRecord record = accounts_.get(account);
  return AccountView{.deposit_balance = ledger::deposit_balance(record, state),
                     .borrow_balance = ledger::borrow_balance(record, state),
                     .collateral_balance = record.collateral,
                     .borrow_index_snapshot = record.borrow_index_snapshot};
}

std::int64_t LendingPool::health_factor(common::AccountId account) const {
  const AccountRecord record = accounts_.get(account);
  const risk::Position position{.collateral = record.collateral,
                                .debt = ledger::borrow_balance(record, previewed())};
  if (position.debt == 0) {
    return risk::kInfiniteHealthFactor;
  }
  return risk_.health_factor(position, quoted_prices());
}

std::int64_t LendingPool::available_to_borrow(common::AccountId account) const {
  const PoolState state = previewed();
  const AccountRecord record = accounts_.get(account);
  if (record.collateral == 0) {
    return 0;
  }
  const std::int64_t capacity = risk_.max_borrow(record.collateral, quoted_prices());
  const std::int64_t headroom = std::max<std::int64_t>(capacity - ledger::borrow_balance(record, state), 0);
  return std::min(headroom, std::max<std::int64_t>(state.available_liquidity(), 0));
}

std::int64_t LendingPool::projected_health_factor(common::AccountId account, PositionChange change,
                                                  std::int64_t amount) const {
  if (amount < 0) {
    throw LendingError(ErrorCode::kInvalidInput, "amount must not be negative");
  }
  const AccountRecord record = accounts_.get(account);
  risk::Position position{.collateral = record.collateral, .debt = ledger::borrow_balance(record, previewed())};

  switch (change) {
    case PositionChange::kDepositCollateral:
      position.collateral = common::checked_add(position.collateral, amount);
      break;
    case PositionChange::kWithdrawCollateral:
      if (amount > position.collateral) {
        throw LendingError(ErrorCode::kInsufficientBalance, "withdrawal exceeds collateral");
      }
      position.collateral -= amount;
      break;
    case PositionChange::kBorrow:
      position.debt = common::checked_add(position.debt, amount);
      break;
    case PositionChange::kRepay:
      position.debt -= std::min(amount, position.debt);
      break;
  }

  if (position.debt == 0) {
    return risk::kInfiniteHealthFactor;
  }
  return risk_.health_factor(position, quoted_prices());
}

PoolImage LendingPool::export_image() const {
  PoolImage image{.pool = pool_, .risk = risk_.parameters(), .accounts = {}};
  for (const auto id : accounts_.accounts()) {
    image.accounts.emplace_back(id, accounts_.get(id));
  }
  return image;
}

void LendingPool::restore(const PoolImage& image) {
  require_initialized();
  risk_.set_parameters(image.risk);
  settings_.risk = image.risk;
  pool_ = image.pool;
  accounts_.clear();
  for (const auto& [id, record] : image.accounts) {
    accounts_.put(id, record);
  }
}

void LendingPool::apply(const CommitRecord& record) {
  require_initialized();
  risk_.set_parameters(record.risk);
  settings_.risk = record.risk;
  pool_ = record.pool;
  if (record.account) {
    accounts_.put(record.account->first, record.account->second);
  }
}

void LendingPool::require_initialized() const {
  if (!initialized_) {
    throw LendingError(ErrorCode::kNotInitialized, "lending pool not initialized");
  }
}

void LendingPool::authorize(const auth::Credential& credential, common::AccountId principal, auth::ActionKind kind,
                            common::AccountId subject, std::int64_t amount, const std::string& asset) {
  services_.authorizer.require(credential, principal,
                               auth::Action{.kind = kind, .subject = subject, .amount = amount, .asset = asset});
}

void LendingPool::require_positive(std::int64_t amount) {
  if (amount <= 0) {
    throw LendingError(ErrorCode::kInvalidInput, "amount must be positive");
  }
}

LendingPool::Working LendingPool::begin(std::optional<common::AccountId> account) const {
  Working working{.pool = pool_, .accrual = {}, .account = account, .record = {}};
  working.accrual = accrual_.accrue(working.pool, services_.clock.now());
  if (account) {
    working.record = accounts_.get(*account);
  }
  return working;
}

void LendingPool::commit(Operation operation, const Working& working) {
  pool_ = working.pool;
  CommitRecord record{.operation = operation,
                      .timestamp = pool_.last_accrual_time,
                      .account = std::nullopt,
                      .pool = pool_,
                      .risk = risk_.parameters()};
  if (working.account) {
    accounts_.put(*working.account, working.record);
    record.account = std::make_pair(*working.account, working.record);
  }

  if (working.accrual.interest > 0) {
    publish(telemetry::EventKind::kInterestAccrued, 0, working.accrual.interest, settings_.lendable_asset);
  }
  if (commit_hook_) {
    commit_hook_(record);
  }
}

void LendingPool::publish(telemetry::EventKind kind, common::AccountId account, std::int64_t amount,
                          const std::string& asset) {
  services_.events.publish(telemetry::Event{.kind = kind,
                                            .account = account,
                                            .amount = amount,
                                            .timestamp = services_.clock.now(),
                                            .asset = asset});
}

risk::AssetPrices LendingPool::safe_prices() const {
  return risk::AssetPrices{.collateral_price = oracle_.get_price_safe(settings_.collateral_asset),
                           .borrow_price = oracle_.get_price_safe(settings_.lendable_asset)};
}

risk::AssetPrices LendingPool::quoted_prices() const {
  const risk::AssetPrices prices{.collateral_price = oracle_.get_price(settings_.collateral_asset),
                                 .borrow_price = oracle_.get_price(settings_.lendable_asset)};
  if (prices.collateral_price == 0) {
    throw LendingError(ErrorCode::kPriceNotSet, "no price for " + settings_.collateral_asset);
  }
  if (prices.borrow_price == 0) {
    throw LendingError(ErrorCode::kPriceNotSet, "no price for " + settings_.lendable_asset);
  }
  return prices;
}

PoolState LendingPool::previewed() const {
  require_initialized();
  return accrual_.preview(pool_, services_.clock.now());
}

}  // namespace ledger
}  // namespace lendcore
