#include <stdio.h>
#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include <bully-kv/snap/snapshotter.h>
#include "test_util.h"

using namespace bully;

static proto::Snapshot make_snapshot(uint64_t id, const std::string& data) {
  proto::Snapshot snapshot;
  snapshot.commit_id = id;
  snapshot.data.assign(data.begin(), data.end());
  return snapshot;
}

TEST(Snapshotter, load_empty) {
  TempDir dir;
  Snapshotter snapshotter(dir.sub("snap"));
  ASSERT_TRUE(snapshotter.init().is_ok());
  proto::Snapshot snapshot;
  ASSERT_TRUE(snapshotter.load(snapshot).is_not_found());
}

TEST(Snapshotter, load_newest) {
  TempDir dir;
  Snapshotter snapshotter(dir.sub("snap"));
  ASSERT_TRUE(snapshotter.init().is_ok());
  ASSERT_TRUE(snapshotter.save_snap(make_snapshot(5, "five")).is_ok());
  ASSERT_TRUE(snapshotter.save_snap(make_snapshot(12, "twelve")).is_ok());

  proto::Snapshot snapshot;
  ASSERT_TRUE(snapshotter.load(snapshot).is_ok());
  ASSERT_EQ(snapshot.commit_id, 12);
  ASSERT_EQ(std::string(snapshot.data.begin(), snapshot.data.end()), "twelve");
}

TEST(Snapshotter, broken_snapshot_is_skipped) {
  TempDir dir;
  Snapshotter snapshotter(dir.sub("snap"));
  ASSERT_TRUE(snapshotter.init().is_ok());
  ASSERT_TRUE(snapshotter.save_snap(make_snapshot(5, "five")).is_ok());
  ASSERT_TRUE(snapshotter.save_snap(make_snapshot(12, "twelve")).is_ok());

  std::string newest = (boost::filesystem::path(dir.sub("snap")) / Snapshotter::snap_name(12)).string();
  FILE* fp = fopen(newest.c_str(), "r+");
  ASSERT_TRUE(fp != NULL);
  fseek(fp, -1, SEEK_END);
  fputc('!', fp);
  fclose(fp);

  proto::Snapshot snapshot;
  ASSERT_TRUE(snapshotter.load(snapshot).is_ok());
  ASSERT_EQ(snapshot.commit_id, 5);
  ASSERT_TRUE(boost::filesystem::exists(newest + ".broken"));
  ASSERT_FALSE(boost::filesystem::exists(newest));
}
