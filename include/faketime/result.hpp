#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include "faketime/platform.hpp"

#if defined(__cpp_lib_expected) && (__cpp_lib_expected >= 202202L)
#include <expected>
#define FAKETIME_HAS_STD_EXPECTED 1
#else
#define FAKETIME_HAS_STD_EXPECTED 0
#endif

#if !FAKETIME_HAS_STD_EXPECTED
#include "faketime/internal/expected.hpp"
#endif

namespace faketime {

/// @brief Error codes for faketime operations.
enum class errc : std::uint8_t {
  /// @brief No error.
  ok = 0,

  // API misuse
  /// @brief Path argument is empty or otherwise unusable as a timestamp source.
  invalid_path,
  /// @brief Thread name argument is empty.
  invalid_thread_name,

  // Timestamp file handling
  /// @brief Temporary file could not be created.
  tempfile_failed,
  /// @brief Timestamp could not be written in full.
  write_failed,
  /// @brief Timestamp file content is not a non-negative decimal millisecond count.
  malformed_timestamp,
};

/// @brief Error payload returned by faketime APIs.
struct Error {
  /// @brief Error code, either in the faketime or the system category.
  std::error_code code;
  /// @brief Human-readable context for the failure.
  std::string context;
};

/// @brief faketime error category for std::error_code.
const std::error_category& error_category() noexcept;
/// @brief Create an error_code in the faketime category.
std::error_code make_error_code(errc value) noexcept;

/// @brief Result type used by faketime APIs (std::expected-compatible).
#if FAKETIME_HAS_STD_EXPECTED
template <typename T>
using Result = std::expected<T, Error>;
#else
template <typename T>
using Result = expected<T, Error>;
#endif

/// @brief Wrap an error for returning from a function that yields Result<T>.
#if FAKETIME_HAS_STD_EXPECTED
inline std::unexpected<Error> make_unexpected(Error error) {
  return std::unexpected<Error>(std::move(error));
}
#else
inline unexpected<Error> make_unexpected(Error error) { return unexpected<Error>(std::move(error)); }
#endif

namespace internal {
/// @brief Throw an error as an exception (used by *_or_throw helpers).
[[noreturn]] void throw_error(const Error& error);
}  // namespace internal

}  // namespace faketime

namespace std {

/// @brief Enable implicit conversion from faketime::errc to std::error_code.
template <>
struct is_error_code_enum<faketime::errc> : true_type {};

}  // namespace std
