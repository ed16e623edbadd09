#pragma once

#include <chrono>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace common {

class Clock {
 public:
  virtual ~Clock() = default;
  [[nodiscard]] virtual TimestampSec now() const = 0;
};

class SystemClock final : public Clock {
 public:
  [[nodiscard]] TimestampSec now() const override {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<TimestampSec>(std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
  }
};

// Host-driven clock for tests and deterministic replays.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimestampSec start = 0) noexcept : now_(start) {}

  [[nodiscard]] TimestampSec now() const override { return now_; }
  void set(TimestampSec value) noexcept { now_ = value; }
  void advance(TimestampSec seconds) noexcept { now_ += seconds; }

 private:
  TimestampSec now_;
};

}  // namespace common
}  // namespace lendcore
