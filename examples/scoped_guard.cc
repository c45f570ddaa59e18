#include <filesystem>
#include <iostream>

#include "faketime/faketime.hpp"
#include "faketime/system.hpp"
#include "faketime/timestamp_file.hpp"

int main() {
  auto path = faketime::millis_tempfile(5000);
  if (!path) {
    std::cerr << "tempfile failed: " << path.error().context << " "
              << path.error().code.message() << "\n";
    return 1;
  }

  int rc = 0;
  {
    faketime::ScopedFaketime guard(*path);
    std::cout << "inside guard: " << faketime::unix_time_as_millis() << "ms\n";
    if (faketime::unix_time_as_millis() != 5000) {
      rc = 1;
    }
  }

  auto real = faketime::system::unix_time();
  if (faketime::unix_time() < real) {
    std::cerr << "guard did not restore the real clock\n";
    rc = 1;
  }

  std::error_code ec;
  std::filesystem::remove(*path, ec);
  return rc;
}
