#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <variant>

#include "faketime/internal/clock.hpp"
#include "faketime/internal/environment.hpp"
#include "faketime/internal/thread_state.hpp"
#include "faketime/result.hpp"

namespace faketime::internal {

struct RealClockSource {};

struct FileOverrideSource {
  std::filesystem::path path;
};

/// @brief Where the current time of a thread comes from.
using TimeSource = std::variant<RealClockSource, FileOverrideSource>;

/// @brief Largest faked millisecond count unix_time() can return exactly.
///
/// Larger counts are still valid timestamps; unix_time() saturates them while
/// unix_time_as_millis() returns them unchanged.
inline constexpr std::uint64_t kMaxFakeMillis =
    static_cast<std::uint64_t>(std::chrono::nanoseconds::max().count()) / 1000000U;

/// @brief Thread name prefix whose remainder names a timestamp file.
inline constexpr std::string_view kFaketimePathPrefix = "FAKETIME=";

/// @brief Outcome of one resolution.
///
/// A file reading keeps the exact millisecond count it parsed; a clock
/// reading keeps the clock's native precision.
class ResolvedTime {
 public:
  static ResolvedTime from_file(std::uint64_t millis) noexcept;
  static ResolvedTime from_clock(std::chrono::nanoseconds since_epoch) noexcept;

  [[nodiscard]] bool faked() const noexcept { return faked_; }

  /// @brief Time since epoch; file readings past kMaxFakeMillis saturate.
  [[nodiscard]] std::chrono::nanoseconds since_epoch() const noexcept;
  /// @brief Whole milliseconds since epoch, exact for file readings.
  [[nodiscard]] std::uint64_t as_millis() const noexcept;

 private:
  bool faked_ = false;
  std::uint64_t file_millis_ = 0;
  std::chrono::nanoseconds clock_reading_{0};
};

/// @brief Parse trimmed timestamp file content as milliseconds since epoch.
///
/// Accepts any unsigned 64-bit decimal without sign.
std::optional<std::uint64_t> parse_millis(std::string_view text) noexcept;

/// @brief Read and parse a timestamp file.
Result<std::uint64_t> try_read_millis(const std::filesystem::path& path);

/// @brief Pick the time source for a thread.
///
/// Precedence: the thread's own override, then FAKETIME_FILE, then
/// FAKETIME_DIR joined with the thread name, then a thread name of the form
/// FAKETIME=<path> while FAKETIME_DIR is unset, then the real clock. Empty
/// variable values count as unset.
TimeSource select_source(const ThreadOverrideState& state, Environment& environment);

/// @brief Evaluate a source; file failures fall back to the clock.
ResolvedTime resolve(const TimeSource& source, SystemClock& clock) noexcept;

/// @brief Resolve the calling thread's current time since epoch.
ResolvedTime resolve_current_time() noexcept;

}  // namespace faketime::internal
