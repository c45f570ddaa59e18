#pragma once

#include <chrono>

namespace faketime::system {

/// @brief Real elapsed time since the UNIX epoch, ignoring every override.
///
/// Readings before the epoch are clamped to zero.
std::chrono::nanoseconds unix_time() noexcept;

}  // namespace faketime::system
