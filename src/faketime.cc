#include "faketime/faketime.hpp"

#include <utility>

#include "faketime/internal/resolver.hpp"
#include "faketime/internal/thread_state.hpp"

namespace faketime {

std::chrono::nanoseconds unix_time() noexcept {
  return internal::resolve_current_time().since_epoch();
}

std::uint64_t unix_time_as_millis() noexcept {
  return internal::resolve_current_time().as_millis();
}

Result<void> enable_faketime(std::filesystem::path path) {
  if (path.empty()) {
    return make_unexpected(Error{make_error_code(errc::invalid_path), "enable_faketime"});
  }
  auto& state = internal::current_thread_state();
  state.source_path = std::move(path);
  state.enabled = true;
  return {};
}

void enable_faketime_or_throw(std::filesystem::path path) {
  auto result = enable_faketime(std::move(path));
  if (!result) {
    internal::throw_error(result.error());
  }
}

void disable_faketime() noexcept {
  auto& state = internal::current_thread_state();
  state.enabled = false;
  state.source_path.reset();
}

bool faketime_enabled() noexcept { return internal::current_thread_state().enabled; }

std::optional<std::filesystem::path> faketime_path() {
  const auto& state = internal::current_thread_state();
  if (!state.enabled) {
    return std::nullopt;
  }
  return state.source_path;
}

Result<void> set_thread_name(std::string name) {
  if (name.empty()) {
    return make_unexpected(Error{make_error_code(errc::invalid_thread_name), "set_thread_name"});
  }
  internal::current_thread_state().thread_name = std::move(name);
  return {};
}

void set_thread_name_or_throw(std::string name) {
  auto result = set_thread_name(std::move(name));
  if (!result) {
    internal::throw_error(result.error());
  }
}

void clear_thread_name() noexcept { internal::current_thread_state().thread_name.reset(); }

std::optional<std::string> thread_name() { return internal::current_thread_state().thread_name; }

ScopedFaketime::ScopedFaketime(std::filesystem::path path) {
  const auto& state = internal::current_thread_state();
  previous_enabled_ = state.enabled;
  previous_path_ = state.source_path;
  enable_faketime_or_throw(std::move(path));
}

ScopedFaketime::~ScopedFaketime() {
  auto& state = internal::current_thread_state();
  state.enabled = previous_enabled_;
  state.source_path = std::move(previous_path_);
}

}  // namespace faketime
