#include "faketime/internal/environment.hpp"

#include <atomic>
#include <cstdlib>

namespace faketime::internal {

namespace {

// faketime never writes the environment, so concurrent getenv calls only race
// with writers outside the library.
class ProcessEnvironment final : public Environment {
 public:
  std::optional<std::string> get(const char* name) override {
    const char* value = std::getenv(name);
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  }
};

std::atomic<Environment*> g_environment_override{nullptr};

}  // namespace

ScopedEnvironmentOverride::ScopedEnvironmentOverride(Environment& environment)
    : previous_(g_environment_override.exchange(&environment)) {}

ScopedEnvironmentOverride::~ScopedEnvironmentOverride() {
  g_environment_override.store(previous_);
}

Environment& default_environment() noexcept {
  if (auto* override_environment = g_environment_override.load()) {
    return *override_environment;
  }
  static ProcessEnvironment environment;
  return environment;
}

}  // namespace faketime::internal
