#include "cfgsmith/watch/watch_set.hpp"

#include "test_utils.hpp"

#include <filesystem>

#include "gtest/gtest.h"

using namespace cfgsmith;
namespace fs = std::filesystem;

TEST(WatchSetTest, KindFollowsTheFilesystem) {
  test::TempDir dir("cfgsmith_watchset_test");
  fs::create_directory(dir / "conf.d");
  test::write_text(dir / "base.tmpl", "x");

  WatchSet set;
  set.add(dir / "conf.d").add(dir / "base.tmpl").add(dir / "not-yet");

  ASSERT_EQ(set.size(), 3u);
  auto it = set.begin();
  EXPECT_EQ(it->kind, WatchKind::Directory);
  EXPECT_EQ((++it)->kind, WatchKind::File);
  EXPECT_EQ((++it)->kind, WatchKind::File);
}

TEST(WatchSetTest, DuplicatesAreIgnored) {
  WatchSet set;
  set.add("/etc/app/app.tmpl", WatchKind::File);
  set.add("/etc/app/./app.tmpl", WatchKind::File);
  set.add("/etc/app/../app/app.tmpl", WatchKind::Directory);

  EXPECT_EQ(set.size(), 1u);
  EXPECT_EQ(set.begin()->kind, WatchKind::File);
  EXPECT_TRUE(set.contains("/etc/app//app.tmpl"));
}

TEST(WatchSetTest, MergeKeepsOrderAndDropsOverlap) {
  WatchSet declared{"/srv/templates/a", "/srv/templates/b"};
  WatchSet registered;
  registered.add("/srv/templates/b", WatchKind::File)
      .add("/srv/templates/c", WatchKind::File);

  declared.merge(registered);
  ASSERT_EQ(declared.size(), 3u);

  std::vector<fs::path> paths;
  for (const auto &spec : declared) {
    paths.push_back(spec.path);
  }
  EXPECT_EQ(paths, (std::vector<fs::path>{"/srv/templates/a",
                                          "/srv/templates/b",
                                          "/srv/templates/c"}));
}

TEST(WatchSetTest, EmptyByDefault) {
  WatchSet set;
  EXPECT_TRUE(set.empty());
  EXPECT_FALSE(set.contains("/anything"));
  EXPECT_EQ(to_string_view(WatchKind::Directory), "directory");
}
