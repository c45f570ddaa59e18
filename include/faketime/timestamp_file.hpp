#pragma once

/// @file timestamp_file.hpp
/// @brief Helpers that create and update timestamp files.

#include <cstdint>
#include <filesystem>
#include <utility>

#include "faketime/result.hpp"

namespace faketime {

/// @brief Atomically replace path with the decimal text of millis.
///
/// The value is written to a sibling temporary file which is then renamed
/// over path, so concurrent readers see either the old or the new value.
[[nodiscard]] Result<void> write_millis(const std::filesystem::path& path, std::uint64_t millis);
/// @brief write_millis() that throws on error.
void write_millis_or_throw(const std::filesystem::path& path, std::uint64_t millis);

/// @brief Create a uniquely named file in the temp directory holding initial_millis.
///
/// The caller owns the file and is responsible for removing it.
[[nodiscard]] Result<std::filesystem::path> millis_tempfile(std::uint64_t initial_millis);
/// @brief millis_tempfile() that throws on error.
[[nodiscard]] std::filesystem::path millis_tempfile_or_throw(std::uint64_t initial_millis);

/// @brief Owned temporary timestamp file, removed on destruction.
class TimestampFile {
 public:
  /// @brief Create a temporary timestamp file holding millis.
  [[nodiscard]] static Result<TimestampFile> create(std::uint64_t millis);

  /// @brief Construct an empty handle.
  TimestampFile() = default;
  /// @brief Take ownership of an existing file.
  explicit TimestampFile(std::filesystem::path path) : path_(std::move(path)) {}
  /// @brief Move-construct a handle.
  TimestampFile(TimestampFile&& other) noexcept;
  /// @brief Move-assign a handle, removing the file currently owned.
  TimestampFile& operator=(TimestampFile&& other) noexcept;
  TimestampFile(const TimestampFile&) = delete;
  TimestampFile& operator=(const TimestampFile&) = delete;
  /// @brief Remove the owned file, if any.
  ~TimestampFile();

  /// @brief Path of the owned file; empty for an empty handle.
  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
  /// @brief Atomically store a new timestamp.
  [[nodiscard]] Result<void> write(std::uint64_t millis) const;
  /// @brief Remove the file now. Safe to call repeatedly.
  void remove() noexcept;

 private:
  std::filesystem::path path_;
};

/// @brief Create a temporary timestamp file and enable it on the calling thread.
///
/// Keep the returned handle alive while fake time is needed; once it is
/// destroyed the file is gone and queries fall back to the real clock.
[[nodiscard]] Result<TimestampFile> enable_and_write_millis(std::uint64_t millis);

}  // namespace faketime
