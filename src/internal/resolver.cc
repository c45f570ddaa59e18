#include "faketime/internal/resolver.hpp"

#include <charconv>
#include <cstdint>
#include <exception>
#include <string>
#include <utility>

#include "faketime/internal/fd.hpp"
#include "faketime/platform.hpp"

namespace faketime::internal {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

std::string_view trim(std::string_view text) noexcept {
  auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

std::optional<std::filesystem::path> non_empty_var(Environment& environment, const char* name) {
  auto value = environment.get(name);
  if (!value || value->empty()) {
    return std::nullopt;
  }
  return std::filesystem::path(*value);
}

}  // namespace

ResolvedTime ResolvedTime::from_file(std::uint64_t millis) noexcept {
  ResolvedTime time;
  time.faked_ = true;
  time.file_millis_ = millis;
  return time;
}

ResolvedTime ResolvedTime::from_clock(std::chrono::nanoseconds since_epoch) noexcept {
  ResolvedTime time;
  time.clock_reading_ = since_epoch;
  return time;
}

std::chrono::nanoseconds ResolvedTime::since_epoch() const noexcept {
  if (!faked_) {
    return clock_reading_;
  }
  if (file_millis_ > kMaxFakeMillis) {
    return std::chrono::nanoseconds::max();
  }
  return std::chrono::milliseconds(static_cast<std::int64_t>(file_millis_));
}

std::uint64_t ResolvedTime::as_millis() const noexcept {
  if (faked_) {
    return file_millis_;
  }
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(clock_reading_);
  return static_cast<std::uint64_t>(millis.count());
}

std::optional<std::uint64_t> parse_millis(std::string_view text) noexcept {
  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }
  // from_chars rejects '+' and '-' for unsigned targets.
  std::uint64_t value = 0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value, 10);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

Result<std::uint64_t> try_read_millis(const std::filesystem::path& path) {
  auto text = read_small_file(path, kMaxTimestampFileSize);
  if (!text) {
    return make_unexpected(std::move(text).error());
  }
  auto millis = parse_millis(*text);
  if (!millis) {
    return make_unexpected(Error{make_error_code(errc::malformed_timestamp), path.string()});
  }
  return *millis;
}

TimeSource select_source(const ThreadOverrideState& state, Environment& environment) {
  if (state.enabled && state.source_path) {
    return FileOverrideSource{*state.source_path};
  }
  if (auto file = non_empty_var(environment, kFaketimeFileVar)) {
    return FileOverrideSource{std::move(*file)};
  }
  if (!state.thread_name) {
    return RealClockSource{};
  }
  if (auto dir = non_empty_var(environment, kFaketimeDirVar)) {
    return FileOverrideSource{*dir / *state.thread_name};
  }
  std::string_view name = *state.thread_name;
  if (name.starts_with(kFaketimePathPrefix) && name.size() > kFaketimePathPrefix.size()) {
    std::string remainder(name.substr(kFaketimePathPrefix.size()));
    return FileOverrideSource{std::filesystem::path(std::move(remainder))};
  }
  return RealClockSource{};
}

ResolvedTime resolve(const TimeSource& source, SystemClock& clock) noexcept {
  const auto* file = std::get_if<FileOverrideSource>(&source);
  if (file == nullptr) {
    return ResolvedTime::from_clock(clock.since_epoch());
  }
  try {
    auto millis = try_read_millis(file->path);
    if (!millis) {
      return ResolvedTime::from_clock(clock.since_epoch());
    }
    return ResolvedTime::from_file(*millis);
  } catch (const std::exception&) {
    // Allocation failure while reading degrades like any other read error.
    return ResolvedTime::from_clock(clock.since_epoch());
  }
}

ResolvedTime resolve_current_time() noexcept {
  SystemClock& clock = default_system_clock();
#if FAKETIME_ENABLED
  try {
    return resolve(select_source(current_thread_state(), default_environment()), clock);
  } catch (const std::exception&) {
    return ResolvedTime::from_clock(clock.since_epoch());
  }
#else
  return ResolvedTime::from_clock(clock.since_epoch());
#endif
}

}  // namespace faketime::internal
