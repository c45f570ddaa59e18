#include "faketime/system.hpp"

#include "faketime/internal/clock.hpp"

namespace faketime::system {

std::chrono::nanoseconds unix_time() noexcept {
  return internal::default_system_clock().since_epoch();
}

}  // namespace faketime::system
