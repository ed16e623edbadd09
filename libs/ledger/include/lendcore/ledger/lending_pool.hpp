#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "lendcore/auth/authorizer.hpp"
#include "lendcore/common/clock.hpp"
#include "lendcore/common/types.hpp"
#include "lendcore/interest/interest_rate_model.hpp"
#include "lendcore/ledger/account_book.hpp"
#include "lendcore/ledger/accrual_engine.hpp"
#include "lendcore/ledger/pool_state.hpp"
#include "lendcore/oracle/price_oracle.hpp"
#include "lendcore/risk/liquidation_engine.hpp"
#include "lendcore/risk/risk_engine.hpp"
#include "lendcore/telemetry/event_sink.hpp"
#include "lendcore/token/token_gateway.hpp"

namespace lendcore {
namespace ledger {

struct PoolSettings {
  common::AccountId admin{0};
  std::string lendable_asset{"USDC"};
  std::string collateral_asset{"XLM"};
  risk::RiskParameters risk{};
  AccrualConfig accrual{};
  bool prune_empty_accounts{true};
};

// Host-provided collaborators. All must outlive the pool.
struct PoolServices {
  const common::Clock& clock;
  auth::Authorizer& authorizer;
  token::TokenGateway& tokens;
  telemetry::EventSink& events;
};

enum class Operation : std::uint8_t {
  kAccrue = 1,
  kDeposit,
  kWithdraw,
  kDepositCollateral,
  kWithdrawCollateral,
  kBorrow,
  kRepay,
  kLiquidate,
  kSetRiskParameters,
};

// One committed state transition: the resulting pool state and, when an
// account changed, its resulting record.
struct CommitRecord {
  Operation operation{Operation::kAccrue};
  common::TimestampSec timestamp{0};
  std::optional<std::pair<common::AccountId, AccountRecord>> account{};
  PoolState pool{};
  risk::RiskParameters risk{};
};

// Runs after the operation has taken effect (tokens moved, state committed),
// so it must not throw; a hook that cannot record the commit reports the
// failure through its own channel.
using CommitHook = std::function<void(const CommitRecord&)>;

struct AccountView {
  std::int64_t deposit_balance{0};
  std::int64_t borrow_balance{0};
  std::int64_t collateral_balance{0};
  std::int64_t borrow_index_snapshot{common::kIndexScale};
};

struct MarketInfo {
  std::int64_t total_deposits{0};
  std::int64_t total_borrows{0};
  std::int64_t available_liquidity{0};
  std::int64_t utilization{0};
  std::int64_t borrow_rate{0};
  std::int64_t supply_rate{0};
  std::int64_t borrow_index{common::kIndexScale};
  std::int64_t supply_index{common::kIndexScale};
};

struct LiquidationOutcome {
  common::AccountId borrower{0};
  common::AccountId liquidator{0};
  std::int64_t health_factor_before{0};
  std::int64_t repaid{0};
  std::int64_t seized_collateral{0};
  std::int64_t bad_debt{0};
};

enum class PositionChange : std::uint8_t {
  kDepositCollateral,
  kWithdrawCollateral,
  kBorrow,
  kRepay,
};

struct PoolImage {
  PoolState pool{};
  risk::RiskParameters risk{};
  std::vector<std::pair<common::AccountId, AccountRecord>> accounts{};
};

// Single-asset lending pool with one collateral asset. Every mutating call
// authorizes, accrues interest on a working copy, validates, moves tokens and
// only then commits; a throwing call leaves the pool untouched.
class LendingPool {
 public:
  LendingPool(PoolServices services, const oracle::PriceOracle& oracle, const interest::InterestRateModel& model);

  void initialize(const PoolSettings& settings);
  [[nodiscard]] bool initialized() const noexcept { return initialized_; }

  // Each returns the amount actually moved.
  std::int64_t deposit(const auth::Credential& credential, std::int64_t amount);
  std::int64_t withdraw(const auth::Credential& credential, std::int64_t amount);
  std::int64_t deposit_collateral(const auth::Credential& credential, std::int64_t amount);
  std::int64_t withdraw_collateral(const auth::Credential& credential, std::int64_t amount);
  std::int64_t borrow(const auth::Credential& credential, std::int64_t amount);
  std::int64_t repay(const auth::Credential& credential, std::int64_t amount);
  LiquidationOutcome liquidate(const auth::Credential& credential, common::AccountId borrower);

  AccrualResult accrue_interest();
  void set_risk_parameters(const auth::Credential& credential, const risk::RiskParameters& params);

  // Queries. Interest is previewed to now; nothing is committed.
  [[nodiscard]] std::int64_t total_deposits() const;
  [[nodiscard]] std::int64_t total_borrows() const;
  [[nodiscard]] std::int64_t utilization_rate() const;
  [[nodiscard]] std::int64_t borrow_rate() const;
  [[nodiscard]] std::int64_t supply_rate() const;
  [[nodiscard]] MarketInfo market_info() const;
  [[nodiscard]] std::int64_t deposit_balance(common::AccountId account) const;
  [[nodiscard]] std::int64_t borrow_balance(common::AccountId account) const;
  [[nodiscard]] std::int64_t collateral_balance(common::AccountId account) const;
  [[nodiscard]] AccountView account(common::AccountId account) const;
  [[nodiscard]] std::int64_t health_factor(common::AccountId account) const;
  // Further borrow capacity, limited by both collateral and pool liquidity.
  [[nodiscard]] std::int64_t available_to_borrow(common::AccountId account) const;
  [[nodiscard]] std::int64_t projected_health_factor(common::AccountId account,
                                                     PositionChange change,
                                                     std::int64_t amount) const;

  // Committed state, without accrual preview.
  [[nodiscard]] const PoolState& pool_state() const noexcept { return pool_; }
  [[nodiscard]] const AccountBook& accounts() const noexcept { return accounts_; }
  [[nodiscard]] const risk::RiskParameters& risk_parameters() const noexcept { return risk_.parameters(); }
  [[nodiscard]] const PoolSettings& settings() const noexcept { return settings_; }

  void set_commit_hook(CommitHook hook) { commit_hook_ = std::move(hook); }
  [[nodiscard]] PoolImage export_image() const;
  void restore(const PoolImage& image);
  void apply(const CommitRecord& record);

 private:
  struct Working {
    PoolState pool{};
    AccrualResult accrual{};
    std::optional<common::AccountId> account{};
    AccountRecord record{};
  };

  PoolServices services_;
  const oracle::PriceOracle& oracle_;
  const interest::InterestRateModel& model_;
  AccrualEngine accrual_;
  risk::RiskEngine risk_;
  risk::LiquidationManager liquidation_;
  PoolSettings settings_{};
  bool initialized_{false};

  PoolState pool_{};
  AccountBook accounts_{};
  CommitHook commit_hook_{};

  void require_initialized() const;
  void authorize(const auth::Credential& credential, common::AccountId principal, auth::ActionKind kind,
                 common::AccountId subject, std::int64_t amount, const std::string& asset);
  static void require_positive(std::int64_t amount);

  [[nodiscard]] Working begin(std::optional<common::AccountId> account) const;
  void commit(Operation operation, const Working& working);
  void publish(telemetry::EventKind kind, common::AccountId account, std::int64_t amount, const std::string& asset);

  [[nodiscard]] risk::AssetPrices safe_prices() const;
  [[nodiscard]] risk::AssetPrices quoted_prices() const;
  [[nodiscard]] PoolState previewed() const;
};

}  // namespace ledger
}  // namespace lendcore
