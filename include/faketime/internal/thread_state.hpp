#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace faketime::internal {

/// @brief Fake time configuration of one thread.
///
/// Lives in thread-local storage; only the owning thread reads or writes it.
/// thread_name is the name given through set_thread_name(), never the OS
/// name, so threads do not inherit it from their creator.
struct ThreadOverrideState {
  bool enabled = false;
  std::optional<std::filesystem::path> source_path;
  std::optional<std::string> thread_name;
};

/// @brief The calling thread's state, Disabled and unnamed on first access.
ThreadOverrideState& current_thread_state() noexcept;

}  // namespace faketime::internal
