#pragma once

#include <cstdint>

#include "lendcore/common/fixed_point.hpp"
#include "lendcore/common/types.hpp"
#include "lendcore/interest/interest_rate_model.hpp"
#include "lendcore/ledger/pool_state.hpp"

namespace lendcore {
namespace ledger {

struct AccrualConfig {
  // Longest interval folded into one linear step.
  std::uint64_t max_step_seconds{static_cast<std::uint64_t>(common::kSecondsPerYear)};
};

struct AccrualResult {
  std::uint64_t elapsed_seconds{0};
  std::int64_t utilization{0};  // at the last step
  std::int64_t borrow_rate{0};  // at the last step
  std::int64_t interest{0};     // total added to borrows (and deposits)
};

// Linear, O(1) interest accrual over the time since the last accrual:
//   growth   = borrow_index * rate * elapsed / (SECONDS_PER_YEAR * SCALE)
//   interest = total_borrows * growth / borrow_index
// added to both borrows and deposits. The truncated part of the growth is
// carried into the next accrual, and the supply index only passes on whole
// index units of interest, so frequent accrual neither drops interest nor
// books more of it than the accounts owe.
class AccrualEngine {
 public:
  explicit AccrualEngine(const interest::InterestRateModel& model, AccrualConfig config = {});

  // Advances `state` to `now`. No-op when no time has passed.
  AccrualResult accrue(PoolState& state, common::TimestampSec now) const;
  // Accrued copy of `state`; `state` is untouched.
  [[nodiscard]] PoolState preview(const PoolState& state, common::TimestampSec now) const;

  [[nodiscard]] static std::int64_t utilization(const PoolState& state);
  [[nodiscard]] const AccrualConfig& config() const noexcept { return config_; }
  void set_config(const AccrualConfig& config) noexcept { config_ = config; }

 private:
  const interest::InterestRateModel& model_;
  AccrualConfig config_;

  void step(PoolState& state, std::uint64_t seconds, AccrualResult& result) const;
  static void distribute(PoolState& state, std::int64_t interest);
};

}  // namespace ledger
}  // namespace lendcore
