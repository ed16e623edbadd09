#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace telemetry {

enum class EventKind : std::uint8_t {
  kDeposit,
  kWithdraw,
  kBorrow,
  kRepay,
  kCollateralDeposited,
  kCollateralWithdrawn,
  kLiquidation,
  kPriceUpdated,
  kPriceChaos,
  kInterestAccrued,
  kCount,
};

std::string_view to_string(EventKind kind) noexcept;

struct Event {
  EventKind kind{EventKind::kDeposit};
  common::AccountId account{0};
  std::int64_t amount{0};
  common::TimestampSec timestamp{0};
  std::string asset{};
};

// Best-effort notification buffer. Publishing never fails: when the buffer
// is full the oldest event is dropped. A disabled sink only counts.
class EventSink {
 public:
  explicit EventSink(std::size_t capacity = 1024, bool enabled = true);

  void publish(Event event);
  [[nodiscard]] std::vector<Event> drain();

  [[nodiscard]] std::uint64_t count(EventKind kind) const;
  [[nodiscard]] std::uint64_t dropped() const;
  [[nodiscard]] bool enabled() const noexcept { return enabled_; }

 private:
  static constexpr std::size_t kNumKinds = static_cast<std::size_t>(EventKind::kCount);

  mutable std::mutex mutex_;
  std::deque<Event> buffer_{};
  std::array<std::uint64_t, kNumKinds> counters_{};
  std::uint64_t dropped_{0};
  std::size_t capacity_;
  bool enabled_;
};

}  // namespace telemetry
}  // namespace lendcore
