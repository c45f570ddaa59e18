#pragma once

/// @file faketime.hpp
/// @brief Per-thread fake wall clock.
///
/// unix_time() returns the elapsed time since the UNIX epoch. A thread may
/// redirect it to a timestamp file, a text file holding a decimal number of
/// milliseconds since the epoch. The file is read on every query, so a test
/// can rewrite it to move time forward or backward.
///
/// Sources are tried in order, first match wins:
///   1. the file set on this thread by enable_faketime();
///   2. the file named by the FAKETIME_FILE environment variable;
///   3. FAKETIME_DIR/<thread name> when FAKETIME_DIR is set and the thread
///      was named with set_thread_name();
///   4. <path> when FAKETIME_DIR is unset and the thread name is
///      "FAKETIME=<path>";
///   5. the real clock.
/// A selected file that is missing, unreadable or malformed yields the real
/// clock for that call. Queries never fail.
///
/// Faked values have millisecond precision; real values carry the system
/// clock's native precision. unix_time_as_millis() returns any faked 64-bit
/// count unchanged, while unix_time() saturates counts past the nanosecond
/// range.
///
/// FAKETIME_FILE and FAKETIME_DIR are read with getenv() on every query. The
/// process must not change them while other threads may be querying; set
/// them before starting those threads or after joining them.
///
/// Building with FAKETIME_DISABLED=1 compiles the lookup out: queries always
/// return the real clock while the control calls keep their signatures.

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "faketime/platform.hpp"
#include "faketime/result.hpp"

namespace faketime {

/// @brief Current time since the UNIX epoch for the calling thread.
std::chrono::nanoseconds unix_time() noexcept;

/// @brief Current time since the UNIX epoch in whole milliseconds.
std::uint64_t unix_time_as_millis() noexcept;

/// @brief Read the calling thread's time from the timestamp file at path.
///
/// Only an empty path is rejected here; whether the file exists or parses is
/// decided on each query. Other threads are unaffected.
[[nodiscard]] Result<void> enable_faketime(std::filesystem::path path);
/// @brief enable_faketime() that throws on error.
void enable_faketime_or_throw(std::filesystem::path path);

/// @brief Stop using the thread's own timestamp file.
///
/// Environment overrides, if any, apply again.
void disable_faketime() noexcept;

/// @brief Whether the calling thread has its own timestamp file enabled.
[[nodiscard]] bool faketime_enabled() noexcept;
/// @brief The calling thread's timestamp file while enabled.
[[nodiscard]] std::optional<std::filesystem::path> faketime_path();

/// @brief Name the calling thread for FAKETIME_DIR and FAKETIME=<path> lookup.
///
/// The name is recorded by faketime, not taken from the OS: it has no length
/// limit, and threads started by this one begin unnamed. An empty name is
/// rejected with errc::invalid_thread_name.
[[nodiscard]] Result<void> set_thread_name(std::string name);
/// @brief set_thread_name() that throws on error.
void set_thread_name_or_throw(std::string name);
/// @brief Forget the calling thread's name.
void clear_thread_name() noexcept;
/// @brief The calling thread's name, if set.
[[nodiscard]] std::optional<std::string> thread_name();

/// @brief Enable a timestamp file for the current scope.
///
/// Restores the thread's previous setting on destruction, so guards nest.
/// Must be destroyed on the thread that created it.
class ScopedFaketime {
 public:
  /// @brief Enable path; throws like enable_faketime_or_throw().
  explicit ScopedFaketime(std::filesystem::path path);
  ~ScopedFaketime();
  ScopedFaketime(const ScopedFaketime&) = delete;
  ScopedFaketime& operator=(const ScopedFaketime&) = delete;

 private:
  bool previous_enabled_ = false;
  std::optional<std::filesystem::path> previous_path_;
};

}  // namespace faketime
