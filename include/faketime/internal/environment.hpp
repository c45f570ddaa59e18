#pragma once

#include <optional>
#include <string>

namespace faketime::internal {

/// @brief Name of the variable holding a process-wide timestamp file path.
inline constexpr const char* kFaketimeFileVar = "FAKETIME_FILE";
/// @brief Name of the variable holding a directory of per-thread-name timestamp files.
inline constexpr const char* kFaketimeDirVar = "FAKETIME_DIR";

/// @brief Read-only view of process configuration variables.
class Environment {
 public:
  virtual ~Environment() = default;
  /// @brief Value of the named variable, or nullopt when unset.
  virtual std::optional<std::string> get(const char* name) = 0;
};

class ScopedEnvironmentOverride {
 public:
  explicit ScopedEnvironmentOverride(Environment& environment);
  ~ScopedEnvironmentOverride();
  ScopedEnvironmentOverride(const ScopedEnvironmentOverride&) = delete;
  ScopedEnvironmentOverride& operator=(const ScopedEnvironmentOverride&) = delete;

 private:
  Environment* previous_ = nullptr;
};

Environment& default_environment() noexcept;

}  // namespace faketime::internal
