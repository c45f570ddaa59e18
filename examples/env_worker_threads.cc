#include <stdlib.h>

#include <atomic>
#include <iostream>
#include <thread>
#include <vector>

#include "faketime/faketime.hpp"
#include "faketime/timestamp_file.hpp"

int main() {
  auto file = faketime::TimestampFile::create(1234567);
  if (!file) {
    std::cerr << "tempfile failed: " << file.error().context << " "
              << file.error().code.message() << "\n";
    return 1;
  }

  // Workers never call enable_faketime(); they pick the file up from the
  // environment.
  if (::setenv("FAKETIME_FILE", file->path().c_str(), 1) != 0) {
    std::cerr << "setenv failed\n";
    return 1;
  }

  std::atomic<int> faked{0};
  std::vector<std::thread> workers;
  for (int i = 0; i < 4; ++i) {
    workers.emplace_back([&] {
      if (faketime::unix_time_as_millis() == 1234567) {
        faked.fetch_add(1);
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  ::unsetenv("FAKETIME_FILE");
  std::cout << faked.load() << "/" << workers.size() << " workers saw fake time\n";
  return faked.load() == static_cast<int>(workers.size()) ? 0 : 1;
}
