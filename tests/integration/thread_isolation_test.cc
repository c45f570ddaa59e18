#include <gtest/gtest.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "faketime/faketime.hpp"
#include "faketime/internal/environment.hpp"
#include "faketime/system.hpp"
#include "faketime/timestamp_file.hpp"
#include "tests/helpers/fakes.hpp"

namespace faketime {
namespace {

// Cleared environment so inherited FAKETIME_* variables cannot leak in.
class ThreadIsolationTest : public ::testing::Test {
 protected:
  void SetUp() override { disable_faketime(); }
  void TearDown() override { disable_faketime(); }

  support::FakeEnvironment env_;
  internal::ScopedEnvironmentOverride env_override_{env_};
  support::ScopedTempDir dir_;
};

}  // namespace

TEST_F(ThreadIsolationTest, EnableDoesNotLeakToConcurrentThread) {
  auto path = dir_.path() / "ts";
  support::write_text(path, "123456");

  std::mutex mutex;
  std::condition_variable cv;
  bool enabled_on_main = false;
  bool worker_done = false;
  bool worker_enabled = true;
  bool worker_real = false;

  std::thread worker([&] {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [&] { return enabled_on_main; });
    auto before = system::unix_time();
    auto now = unix_time();
    auto after = system::unix_time();
    worker_enabled = faketime_enabled();
    worker_real = now >= before && now <= after;
    worker_done = true;
    cv.notify_all();
  });

  ASSERT_TRUE(enable_faketime(path).has_value());
  {
    std::lock_guard<std::mutex> lock(mutex);
    enabled_on_main = true;
  }
  cv.notify_all();
  {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [&] { return worker_done; });
  }
  worker.join();

  EXPECT_EQ(unix_time_as_millis(), 123456u);
  EXPECT_FALSE(worker_enabled);
  EXPECT_TRUE(worker_real);
}

TEST_F(ThreadIsolationTest, NewThreadsStartDisabled) {
  ASSERT_TRUE(enable_faketime(dir_.path() / "ts").has_value());

  bool child_enabled = true;
  std::thread child([&] { child_enabled = faketime_enabled(); });
  child.join();
  EXPECT_FALSE(child_enabled);
}

TEST_F(ThreadIsolationTest, EachThreadReadsItsOwnFile) {
  constexpr int kThreads = 8;
  constexpr int kQueries = 50;
  std::vector<std::thread> threads;
  std::vector<std::uint64_t> observed(kThreads, 0);
  std::atomic<int> mismatches{0};

  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      std::uint64_t millis = 1000000 + static_cast<std::uint64_t>(i);
      auto file = enable_and_write_millis(millis);
      if (!file) {
        mismatches.fetch_add(1);
        return;
      }
      for (int q = 0; q < kQueries; ++q) {
        if (unix_time_as_millis() != millis) {
          mismatches.fetch_add(1);
        }
      }
      observed[i] = unix_time_as_millis();
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(mismatches.load(), 0);
  for (int i = 0; i < kThreads; ++i) {
    EXPECT_EQ(observed[i], 1000000u + static_cast<std::uint64_t>(i));
  }
}

TEST_F(ThreadIsolationTest, DisableOnOneThreadKeepsOthersEnabled) {
  auto path = dir_.path() / "ts";
  support::write_text(path, "4242");
  ASSERT_TRUE(enable_faketime(path).has_value());

  std::thread worker([&] {
    ASSERT_TRUE(enable_faketime(path).has_value());
    disable_faketime();
  });
  worker.join();

  EXPECT_TRUE(faketime_enabled());
  EXPECT_EQ(unix_time_as_millis(), 4242u);
}

TEST_F(ThreadIsolationTest, WorkersFollowSharedFileRewrites) {
  auto path = dir_.path() / "ts";
  ASSERT_TRUE(write_millis(path, 100).has_value());

  std::mutex mutex;
  std::condition_variable cv;
  int stage = 0;
  std::uint64_t first = 0;
  std::uint64_t second = 0;

  std::thread worker([&] {
    ASSERT_TRUE(enable_faketime(path).has_value());
    std::unique_lock<std::mutex> lock(mutex);
    first = unix_time_as_millis();
    stage = 1;
    cv.notify_all();
    cv.wait(lock, [&] { return stage == 2; });
    second = unix_time_as_millis();
  });

  {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [&] { return stage == 1; });
    ASSERT_TRUE(write_millis(path, 200).has_value());
    stage = 2;
  }
  cv.notify_all();
  worker.join();

  EXPECT_EQ(first, 100u);
  EXPECT_EQ(second, 200u);
}

}  // namespace faketime
