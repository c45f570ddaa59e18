#include "faketime/result.hpp"

#include <stdexcept>

namespace faketime {

namespace {

class faketime_error_category : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "faketime"; }

  [[nodiscard]] std::string message(int value) const override {
    switch (static_cast<errc>(value)) {
      case errc::ok:
        return "ok";
      case errc::invalid_path:
        return "invalid timestamp path";
      case errc::invalid_thread_name:
        return "invalid thread name";
      case errc::tempfile_failed:
        return "temporary file creation failed";
      case errc::write_failed:
        return "timestamp write failed";
      case errc::malformed_timestamp:
        return "malformed timestamp";
    }
    return "unknown error";
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static faketime_error_category category;
  return category;
}

std::error_code make_error_code(errc value) noexcept {
  return {static_cast<int>(value), error_category()};
}

namespace internal {

[[noreturn]] void throw_error(const Error& error) {
  if (error.code.category() == std::system_category()) {
    throw std::system_error(error.code, error.context);
  }
  throw std::runtime_error(error.context.empty() ? error.code.message()
                                                 : error.context + ": " + error.code.message());
}

}  // namespace internal

}  // namespace faketime
