#pragma once

#include <cstdint>

namespace tether {

/**
 * Injectable clock. Production code uses RealClock; tests inject a fake so
 * TTL expiry is deterministic.
 */
class Clock {
 public:
  virtual ~Clock() = default;
  virtual uint64_t NowMicros() const = 0;       // Monotonic (for latency)
  virtual uint64_t WallClockMicros() const = 0;  // Wall clock (for TTL, timestamps)
};

/** Real clock using system time. */
class RealClock : public Clock {
 public:
  uint64_t NowMicros() const override;
  uint64_t WallClockMicros() const override;

  /** Process-wide instance used when no clock is injected. */
  static const Clock* Default();
};

}  // namespace tether
