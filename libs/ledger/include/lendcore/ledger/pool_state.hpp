#pragma once

#include <cstdint>

#include "lendcore/common/fixed_point.hpp"
#include "lendcore/common/types.hpp"

namespace lendcore {
namespace ledger {

// Pool-wide totals. Invariant after every commit:
// 0 <= total_borrows <= total_deposits; indexes never decrease through accrual.
//
// Accrual runs in integer steps, so the fractions it cannot express yet are
// carried rather than dropped: `borrow_index_carry` is the remainder of the
// borrow index growth (in units of 1 / (SECONDS_PER_YEAR * 1e7) of an index
// unit) and `undistributed_interest` is interest already counted in
// `total_deposits` that the supply index has not passed on to depositors.
// `supply_epoch` advances when a write-off consumes every deposit; principals
// settled in an earlier epoch are worth nothing.
struct PoolState {
  std::int64_t total_deposits{0};
  std::int64_t total_borrows{0};
  std::int64_t borrow_index{common::kIndexScale};  // scale 1e9
  std::int64_t supply_index{common::kIndexScale};  // scale 1e9
  common::TimestampSec last_accrual_time{0};
  std::int64_t borrow_index_carry{0};
  std::int64_t undistributed_interest{0};
  std::uint64_t supply_epoch{0};

  [[nodiscard]] std::int64_t available_liquidity() const noexcept { return total_deposits - total_borrows; }
  // Part of total_deposits represented by depositor balances.
  [[nodiscard]] std::int64_t claimed_deposits() const noexcept { return total_deposits - undistributed_interest; }

  friend bool operator==(const PoolState&, const PoolState&) = default;
};

}  // namespace ledger
}  // namespace lendcore
