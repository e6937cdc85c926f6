#include <tether/clock.hpp>

#include <tether/internal.hpp>

namespace tether {

uint64_t RealClock::NowMicros() const { return internal::NowMicros(); }

uint64_t RealClock::WallClockMicros() const { return internal::WallClockMicros(); }

const Clock* RealClock::Default() {
  static const RealClock clock;
  return &clock;
}

}  // namespace tether
