#include "cfgsmith/watch/watch_source.hpp"

#include "test_utils.hpp"

#include <chrono>
#include <filesystem>
#include <memory>

#include "gtest/gtest.h"

using namespace cfgsmith;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class InotifyWatchSourceTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto source = InotifyWatchSource::create(io_);
    if (!source) {
      GTEST_SKIP() << "inotify unavailable: " << source.error().message();
    }
    source_ = std::move(*source);
  }

  // Arms one wait and runs the loop until it fires or `timeout` passes. A
  // wait that timed out stays armed and only touches its own flag.
  auto wait(std::chrono::milliseconds timeout) -> bool {
    auto ready = std::make_shared<bool>(false);
    source_->async_wait([ready] { *ready = true; });
    io_.restart();
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!*ready && std::chrono::steady_clock::now() < deadline) {
      io_.run_one_for(deadline - std::chrono::steady_clock::now());
    }
    return *ready;
  }

  // Drain until the queue stays quiet, so follow-up events from one write
  // do not leak into the next expectation.
  auto settle() -> std::size_t {
    std::size_t total = 0;
    while (wait(100ms)) {
      total += source_->drain();
    }
    return total;
  }

  io::IoContext io_;
  test::TempDir dir_{"cfgsmith_inotify_test"};
  std::unique_ptr<InotifyWatchSource> source_;
};

TEST_F(InotifyWatchSourceTest, QuietWithoutChanges) {
  test::write_text(dir_ / "app.tmpl", "a");
  ASSERT_TRUE(source_->add({dir_ / "app.tmpl", WatchKind::File}).has_value());

  EXPECT_FALSE(wait(50ms));
  EXPECT_EQ(source_->drain(), 0u);
}

TEST_F(InotifyWatchSourceTest, FileWatchFiresOnCompletedWrite) {
  auto tmpl = dir_ / "app.tmpl";
  test::write_text(tmpl, "a");
  ASSERT_TRUE(source_->add({tmpl, WatchKind::File}).has_value());

  test::write_text(tmpl, "b");
  EXPECT_TRUE(wait(2s));
  EXPECT_GE(settle(), 1u);
  EXPECT_FALSE(wait(50ms));
}

TEST_F(InotifyWatchSourceTest, UndrainedEventsWakeTheNextWait) {
  auto tmpl = dir_ / "app.tmpl";
  test::write_text(tmpl, "a");
  ASSERT_TRUE(source_->add({tmpl, WatchKind::File}).has_value());

  test::write_text(tmpl, "b");
  EXPECT_TRUE(wait(2s));
  // Nothing was read, so the descriptor is still readable.
  EXPECT_TRUE(wait(200ms));
  EXPECT_GE(settle(), 1u);
  EXPECT_FALSE(wait(50ms));
}

TEST_F(InotifyWatchSourceTest, DirectoryWatchIsRecursive) {
  fs::create_directories(dir_ / "sites" / "enabled");
  ASSERT_TRUE(
      source_->add({dir_ / "sites", WatchKind::Directory}).has_value());
  EXPECT_EQ(source_->watch_count(), 2u);

  test::write_text(dir_ / "sites" / "enabled" / "a.conf", "x");
  EXPECT_TRUE(wait(2s));
  EXPECT_GE(settle(), 1u);
}

TEST_F(InotifyWatchSourceTest, NewSubdirectoryIsWatchedToo) {
  ASSERT_TRUE(source_->add({dir_.path(), WatchKind::Directory}).has_value());

  fs::create_directory(dir_ / "late");
  EXPECT_TRUE(wait(2s));
  (void)settle();
  EXPECT_EQ(source_->watch_count(), 2u);

  test::write_text(dir_ / "late" / "b.conf", "y");
  EXPECT_TRUE(wait(2s));
  EXPECT_GE(settle(), 1u);
}

TEST_F(InotifyWatchSourceTest, MissingPathIsReported) {
  auto r = source_->add({dir_ / "missing.tmpl", WatchKind::File});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::FileNotFound));
  EXPECT_EQ(source_->watch_count(), 0u);
}

TEST(NullWatchSourceTest, NeverFires) {
  io::IoContext io;
  NullWatchSource source;
  EXPECT_TRUE(source.add({"/nonexistent", WatchKind::File}).has_value());
  bool fired = false;
  source.async_wait([&] { fired = true; });
  io.run_for(10ms);
  EXPECT_FALSE(fired);
  EXPECT_EQ(source.drain(), 0u);
}

TEST(WatchSourceFactoryTest, AlwaysReturnsASource) {
  io::IoContext io;
  auto source = create_watch_source(io);
  ASSERT_NE(source, nullptr);
  EXPECT_EQ(source->drain(), 0u);
}
