#include "faketime/timestamp_file.hpp"

#include <stdlib.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <string>
#include <system_error>
#include <vector>

#include "faketime/faketime.hpp"
#include "faketime/internal/fd.hpp"

namespace faketime {

namespace {

Error make_errno_error(const char* context) {
  return Error{std::error_code(errno, std::system_category()), context};
}

// A freshly created file that is unlinked unless release() is called.
class PendingFile {
 public:
  PendingFile(internal::unique_fd fd, std::filesystem::path path)
      : fd_(std::move(fd)), path_(std::move(path)) {}
  PendingFile(PendingFile&& other) noexcept
      : fd_(std::move(other.fd_)), path_(other.release()) {}
  PendingFile(const PendingFile&) = delete;
  PendingFile& operator=(const PendingFile&) = delete;
  PendingFile& operator=(PendingFile&&) = delete;
  ~PendingFile() {
    fd_.reset(-1);
    if (!path_.empty()) {
      ::unlink(path_.c_str());
    }
  }

  [[nodiscard]] int fd() const noexcept { return fd_.get(); }
  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  Result<void> close() { return fd_.close(); }

  std::filesystem::path release() noexcept {
    std::filesystem::path out = std::move(path_);
    path_.clear();
    return out;
  }

 private:
  internal::unique_fd fd_;
  std::filesystem::path path_;
};

Result<PendingFile> create_unique_file(const std::filesystem::path& dir, const std::string& prefix) {
  std::string pattern = (dir / (prefix + "XXXXXX")).string();
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');
  int fd = ::mkstemp(buffer.data());
  if (fd == -1) {
    return make_unexpected(make_errno_error("mkstemp"));
  }
  return PendingFile(internal::unique_fd(fd), std::filesystem::path(buffer.data()));
}

Result<void> fill_and_close(PendingFile& file, std::uint64_t millis) {
  auto written = internal::write_all(file.fd(), std::to_string(millis));
  if (!written) {
    return written;
  }
  return file.close();
}

}  // namespace

Result<void> write_millis(const std::filesystem::path& path, std::uint64_t millis) {
  if (path.empty() || !path.has_filename()) {
    return make_unexpected(Error{make_error_code(errc::invalid_path), "write_millis"});
  }
  std::filesystem::path dir = path.parent_path();
  if (dir.empty()) {
    dir = ".";
  }

  auto file = create_unique_file(dir, "." + path.filename().string() + ".");
  if (!file) {
    return make_unexpected(std::move(file).error());
  }
  auto filled = fill_and_close(*file, millis);
  if (!filled) {
    return filled;
  }
  if (::rename(file->path().c_str(), path.c_str()) == -1) {
    return make_unexpected(make_errno_error("rename"));
  }
  file->release();
  return {};
}

void write_millis_or_throw(const std::filesystem::path& path, std::uint64_t millis) {
  auto result = write_millis(path, millis);
  if (!result) {
    internal::throw_error(result.error());
  }
}

Result<std::filesystem::path> millis_tempfile(std::uint64_t initial_millis) {
  std::error_code ec;
  std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
  if (ec) {
    return make_unexpected(
        Error{make_error_code(errc::tempfile_failed), "temp_directory_path: " + ec.message()});
  }

  auto file = create_unique_file(dir, "faketime-");
  if (!file) {
    return make_unexpected(std::move(file).error());
  }
  auto filled = fill_and_close(*file, initial_millis);
  if (!filled) {
    return make_unexpected(std::move(filled).error());
  }
  return file->release();
}

std::filesystem::path millis_tempfile_or_throw(std::uint64_t initial_millis) {
  auto result = millis_tempfile(initial_millis);
  if (!result) {
    internal::throw_error(result.error());
  }
  return std::move(result).value();
}

Result<TimestampFile> TimestampFile::create(std::uint64_t millis) {
  auto path = millis_tempfile(millis);
  if (!path) {
    return make_unexpected(std::move(path).error());
  }
  return TimestampFile(std::move(path).value());
}

TimestampFile::TimestampFile(TimestampFile&& other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

TimestampFile& TimestampFile::operator=(TimestampFile&& other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

TimestampFile::~TimestampFile() { remove(); }

Result<void> TimestampFile::write(std::uint64_t millis) const {
  if (path_.empty()) {
    return make_unexpected(Error{make_error_code(errc::invalid_path), "TimestampFile::write"});
  }
  return write_millis(path_, millis);
}

void TimestampFile::remove() noexcept {
  if (path_.empty()) {
    return;
  }
  ::unlink(path_.c_str());
  path_.clear();
}

Result<TimestampFile> enable_and_write_millis(std::uint64_t millis) {
  auto file = TimestampFile::create(millis);
  if (!file) {
    return file;
  }
  auto enabled = enable_faketime(file->path());
  if (!enabled) {
    return make_unexpected(std::move(enabled).error());
  }
  return file;
}

}  // namespace faketime
