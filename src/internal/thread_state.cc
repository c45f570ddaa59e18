#include "faketime/internal/thread_state.hpp"

namespace faketime::internal {

ThreadOverrideState& current_thread_state() noexcept {
  thread_local ThreadOverrideState state;
  return state;
}

}  // namespace faketime::internal
