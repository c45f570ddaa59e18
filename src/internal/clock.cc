#include "faketime/internal/clock.hpp"

#include <atomic>

namespace faketime::internal {

namespace {

class RealtimeClock final : public SystemClock {
 public:
  std::chrono::nanoseconds since_epoch() noexcept override {
    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch());
    // A clock set before 1970 reads as the epoch itself.
    if (elapsed.count() < 0) {
      return std::chrono::nanoseconds::zero();
    }
    return elapsed;
  }
};

std::atomic<SystemClock*> g_system_clock_override{nullptr};

}  // namespace

ScopedSystemClockOverride::ScopedSystemClockOverride(SystemClock& clock)
    : previous_(g_system_clock_override.exchange(&clock)) {}

ScopedSystemClockOverride::~ScopedSystemClockOverride() {
  g_system_clock_override.store(previous_);
}

SystemClock& default_system_clock() noexcept {
  if (auto* override_clock = g_system_clock_override.load()) {
    return *override_clock;
  }
  static RealtimeClock clock;
  return clock;
}

}  // namespace faketime::internal
