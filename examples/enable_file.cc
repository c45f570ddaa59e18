#include <chrono>
#include <cstdint>
#include <iostream>

#include "faketime/faketime.hpp"
#include "faketime/timestamp_file.hpp"

int main() {
  auto file = faketime::enable_and_write_millis(100000);
  if (!file) {
    std::cerr << "enable failed: " << file.error().context << " " << file.error().code.message()
              << "\n";
    return 1;
  }

  if (faketime::unix_time_as_millis() != 100000) {
    std::cerr << "fake time not applied\n";
    return 1;
  }

  auto advanced = file->write(160000);
  if (!advanced) {
    std::cerr << "write failed: " << advanced.error().context << " "
              << advanced.error().code.message() << "\n";
    return 1;
  }

  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(faketime::unix_time());
  std::cout << "now: " << seconds.count() << "s since epoch\n";
  return seconds.count() == 160 ? 0 : 1;
}
