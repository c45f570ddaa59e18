#pragma once

#include <chrono>

namespace faketime::internal {

/// @brief Source of real wall-clock time, replaceable in tests.
class SystemClock {
 public:
  virtual ~SystemClock() = default;
  /// @brief Elapsed time since the UNIX epoch; never negative.
  virtual std::chrono::nanoseconds since_epoch() noexcept = 0;
};

class ScopedSystemClockOverride {
 public:
  explicit ScopedSystemClockOverride(SystemClock& clock);
  ~ScopedSystemClockOverride();
  ScopedSystemClockOverride(const ScopedSystemClockOverride&) = delete;
  ScopedSystemClockOverride& operator=(const ScopedSystemClockOverride&) = delete;

 private:
  SystemClock* previous_ = nullptr;
};

SystemClock& default_system_clock() noexcept;

}  // namespace faketime::internal
