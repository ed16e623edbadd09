#include "test_interest.hpp"

#include <cassert>

#include "lendcore/interest/interest_rate_model.hpp"
#include "test_support.hpp"

namespace lendcore::tests {

void test_rate_curve_reference_points() {
  interest::InterestRateModel model;
  model.initialize({.base_rate = 0, .slope1 = 400'000, .slope2 = 7'500'000, .optimal_utilization = 8'000'000});

  assert(model.borrow_rate(0) == 0);
  assert(model.borrow_rate(4'000'000) == 200'000);
  assert(model.borrow_rate(8'000'000) == 400'000);
  assert(model.borrow_rate(9'000'000) == 4'150'000);
  assert(model.borrow_rate(10'000'000) == 7'900'000);

  assert(model.supply_rate(0) == 0);
  assert(model.supply_rate(8'000'000) == 320'000);
  assert(model.supply_rate(10'000'000) == 7'900'000);

  // Monotone across the kink.
  std::int64_t previous = 0;
  for (std::int64_t u = 0; u <= 10'000'000; u += 250'000) {
    const auto rate = model.borrow_rate(u);
    assert(rate >= previous);
    previous = rate;
  }

  expect_error(common::ErrorCode::kInvalidInput, [&] { (void)model.borrow_rate(-1); });
  expect_error(common::ErrorCode::kInvalidInput, [&] { (void)model.borrow_rate(10'000'001); });

  interest::InterestRateModel based;
  based.initialize({.base_rate = 100'000, .slope1 = 400'000, .slope2 = 7'500'000, .optimal_utilization = 8'000'000});
  assert(based.borrow_rate(0) == 100'000);
  assert(based.borrow_rate(10'000'000) == 8'000'000);
}

void test_rate_model_lifecycle() {
  interest::InterestRateModel model;
  assert(!model.initialized());
  expect_error(common::ErrorCode::kNotInitialized, [&] { (void)model.borrow_rate(0); });
  expect_error(common::ErrorCode::kNotInitialized, [&] { (void)model.parameters(); });

  expect_error(common::ErrorCode::kInvalidInput, [&] { model.initialize({.optimal_utilization = 0}); });
  expect_error(common::ErrorCode::kInvalidInput, [&] { model.initialize({.optimal_utilization = 10'000'000}); });
  expect_error(common::ErrorCode::kInvalidInput, [&] { model.initialize({.slope1 = -1}); });
  expect_error(common::ErrorCode::kInvalidInput,
               [&] { model.initialize({.base_rate = 0, .slope1 = 0, .slope2 = interest::kMaxBorrowRate + 1}); });
  assert(!model.initialized());

  model.initialize({});
  assert(model.initialized());
  assert(model.slope1() == 400'000);
  assert(model.slope2() == 7'500'000);
  assert(model.optimal_utilization() == 8'000'000);
  assert(model.base_rate() == 0);
  expect_error(common::ErrorCode::kAlreadyInitialized, [&] { model.initialize({}); });
}

}  // namespace lendcore::tests
