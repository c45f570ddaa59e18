#include "faketime/timestamp_file.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <filesystem>
#include <string>
#include <utility>

#include "tests/helpers/fakes.hpp"

namespace faketime {

namespace fs = std::filesystem;

namespace {

std::size_t entry_count(const fs::path& dir) {
  std::size_t count = 0;
  for ([[maybe_unused]] const auto& entry : fs::directory_iterator(dir)) {
    ++count;
  }
  return count;
}

}  // namespace

TEST(TimestampFileTest, WriteMillisCreatesFile) {
  support::ScopedTempDir dir;
  auto path = dir.path() / "ts";
  ASSERT_TRUE(write_millis(path, 54321).has_value());
  EXPECT_EQ(support::read_text(path), "54321");
}

TEST(TimestampFileTest, WriteMillisReplacesAndLeavesNoTemporaries) {
  support::ScopedTempDir dir;
  auto path = dir.path() / "ts";
  support::write_text(path, "old contents that are longer");

  ASSERT_TRUE(write_millis(path, 7).has_value());
  EXPECT_EQ(support::read_text(path), "7");
  EXPECT_EQ(entry_count(dir.path()), 1u);
}

TEST(TimestampFileTest, WriteMillisRejectsEmptyPath) {
  auto result = write_millis("", 1);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(errc::invalid_path));
}

TEST(TimestampFileTest, WriteMillisRejectsDirectoryPath) {
  support::ScopedTempDir dir;
  auto result = write_millis(dir.path() / "", 1);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(errc::invalid_path));
}

TEST(TimestampFileTest, WriteMillisReportsMissingDirectory) {
  support::ScopedTempDir dir;
  auto result = write_millis(dir.path() / "nope" / "ts", 1);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, std::error_code(ENOENT, std::system_category()));
  EXPECT_EQ(result.error().context, "mkstemp");
}

TEST(TimestampFileTest, MillisTempfileHoldsDecimalValue) {
  auto path = millis_tempfile(18446744073709551615ULL);
  ASSERT_TRUE(path.has_value()) << path.error().context;
  EXPECT_TRUE(fs::is_regular_file(*path));
  EXPECT_EQ(support::read_text(*path), "18446744073709551615");
  fs::remove(*path);
}

TEST(TimestampFileTest, MillisTempfileNamesAreUnique) {
  auto first = millis_tempfile_or_throw(1);
  auto second = millis_tempfile_or_throw(1);
  EXPECT_NE(first.string(), second.string());
  fs::remove(first);
  fs::remove(second);
}

TEST(TimestampFileTest, HandleRemovesFileOnDestruction) {
  fs::path path;
  {
    auto file = TimestampFile::create(99);
    ASSERT_TRUE(file.has_value()) << file.error().context;
    path = file->path();
    EXPECT_EQ(support::read_text(path), "99");
  }
  EXPECT_FALSE(fs::exists(path));
}

TEST(TimestampFileTest, HandleWriteUpdatesContents) {
  auto file = TimestampFile::create(1);
  ASSERT_TRUE(file.has_value());
  ASSERT_TRUE(file->write(2).has_value());
  EXPECT_EQ(support::read_text(file->path()), "2");
}

TEST(TimestampFileTest, MoveTransfersOwnership) {
  auto created = TimestampFile::create(5);
  ASSERT_TRUE(created.has_value());
  TimestampFile first = std::move(created).value();
  fs::path path = first.path();

  TimestampFile second(std::move(first));
  EXPECT_TRUE(first.path().empty());
  EXPECT_EQ(second.path().string(), path.string());
  EXPECT_TRUE(fs::exists(path));

  TimestampFile third;
  third = std::move(second);
  EXPECT_TRUE(fs::exists(path));
  third.remove();
  EXPECT_FALSE(fs::exists(path));
  EXPECT_TRUE(third.path().empty());
}

TEST(TimestampFileTest, MoveAssignRemovesPreviousFile) {
  auto a = TimestampFile::create(1);
  auto b = TimestampFile::create(2);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  fs::path old_path = a->path();

  *a = std::move(*b);
  EXPECT_FALSE(fs::exists(old_path));
  EXPECT_EQ(support::read_text(a->path()), "2");
}

TEST(TimestampFileTest, EmptyHandleWriteFails) {
  TimestampFile empty;
  auto result = empty.write(1);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(errc::invalid_path));
}

}  // namespace faketime
