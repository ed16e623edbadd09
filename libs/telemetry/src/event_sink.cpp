#include "lendcore/telemetry/event_sink.hpp"

#include <spdlog/spdlog.h>

#include <iterator>
#include <utility>

namespace lendcore {
namespace telemetry {

std::string_view to_string(EventKind kind) noexcept {
  switch (kind) {
    case EventKind::kDeposit:
      return "deposit";
    case EventKind::kWithdraw:
      return "withdraw";
    case EventKind::kBorrow:
      return "borrow";
    case EventKind::kRepay:
      return "repay";
    case EventKind::kCollateralDeposited:
      return "collateral_deposited";
    case EventKind::kCollateralWithdrawn:
      return "collateral_withdrawn";
    case EventKind::kLiquidation:
      return "liquidation";
    case EventKind::kPriceUpdated:
      return "price_updated";
    case EventKind::kPriceChaos:
      return "price_chaos";
    case EventKind::kInterestAccrued:
      return "interest_accrued";
    case EventKind::kCount:
      break;
  }
  return "unknown";
}

EventSink::EventSink(std::size_t capacity, bool enabled)
    : capacity_(capacity == 0 ? 1 : capacity), enabled_(enabled) {}

void EventSink::publish(Event event) {
  std::scoped_lock lock(mutex_);
  const auto idx = static_cast<std::size_t>(event.kind);
  if (idx < kNumKinds) {
    ++counters_[idx];
  }
  if (!enabled_) {
    return;
  }

  spdlog::debug("event {} account={} amount={} asset={} t={}",
                to_string(event.kind), event.account, event.amount, event.asset, event.timestamp);

  if (buffer_.size() >= capacity_) {
    buffer_.pop_front();
    ++dropped_;
  }
  buffer_.push_back(std::move(event));
}

std::vector<Event> EventSink::drain() {
  std::scoped_lock lock(mutex_);
  std::vector<Event> copy(std::make_move_iterator(buffer_.begin()), std::make_move_iterator(buffer_.end()));
  buffer_.clear();
  return copy;
}

std::uint64_t EventSink::count(EventKind kind) const {
  std::scoped_lock lock(mutex_);
  const auto idx = static_cast<std::size_t>(kind);
  return idx < kNumKinds ? counters_[idx] : 0;
}

std::uint64_t EventSink::dropped() const {
  std::scoped_lock lock(mutex_);
  return dropped_;
}

}  // namespace telemetry
}  // namespace lendcore
