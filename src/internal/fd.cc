#include "faketime/internal/fd.hpp"

#include <fcntl.h>

#include <array>
#include <cerrno>

namespace faketime::internal {

namespace {

Error make_errno_error(const char* context) {
  return Error{std::error_code(errno, std::system_category()), context};
}

}  // namespace

Result<void> unique_fd::close() {
  int fd = release();
  if (fd >= 0 && ::close(fd) == -1) {
    return make_unexpected(make_errno_error("close"));
  }
  return {};
}

Result<std::string> read_small_file(const std::filesystem::path& path, std::size_t max_size) {
  unique_fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd) {
    return make_unexpected(make_errno_error("open"));
  }

  std::string out;
  constexpr std::size_t kReadChunkSize = 512;
  std::array<char, kReadChunkSize> buffer{};
  while (true) {
    ssize_t rv = ::read(fd.get(), buffer.data(), buffer.size());
    if (rv < 0) {
      if (errno == EINTR) {
        continue;
      }
      return make_unexpected(make_errno_error("read"));
    }
    if (rv == 0) {
      break;
    }
    out.append(buffer.data(), static_cast<std::size_t>(rv));
    if (out.size() > max_size) {
      return make_unexpected(Error{make_error_code(errc::malformed_timestamp), "file too large"});
    }
  }
  return out;
}

Result<void> write_all(int fd, std::string_view data) {
  std::size_t offset = 0;
  while (offset < data.size()) {
    ssize_t rv = ::write(fd, data.data() + offset, data.size() - offset);
    if (rv < 0) {
      if (errno == EINTR) {
        continue;
      }
      return make_unexpected(make_errno_error("write"));
    }
    if (rv == 0) {
      return make_unexpected(Error{make_error_code(errc::write_failed), "write"});
    }
    offset += static_cast<std::size_t>(rv);
  }
  return {};
}

}  // namespace faketime::internal
