#pragma once

#include <unistd.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "faketime/result.hpp"

namespace faketime::internal {

class unique_fd {
 public:
  unique_fd() = default;
  explicit unique_fd(int fd) : fd_(fd) {}
  unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}
  unique_fd& operator=(unique_fd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }
  unique_fd(const unique_fd&) = delete;
  unique_fd& operator=(const unique_fd&) = delete;
  ~unique_fd() { reset(-1); }

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] int release() noexcept {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void reset(int fd) noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

  /// @brief Close and report failure, unlike reset().
  Result<void> close();

  explicit operator bool() const noexcept { return fd_ >= 0; }

 private:
  int fd_{-1};
};

/// @brief Upper bound on the size of a timestamp file that will be read.
inline constexpr std::size_t kMaxTimestampFileSize = 4096;

/// @brief Read a whole file of at most max_size bytes.
Result<std::string> read_small_file(const std::filesystem::path& path, std::size_t max_size);

/// @brief Write every byte of data to fd, retrying short writes and EINTR.
Result<void> write_all(int fd, std::string_view data);

}  // namespace faketime::internal
