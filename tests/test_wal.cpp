#include <stdio.h>
#include <unistd.h>
#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include <bully-kv/wal/wal.h>
#include "test_util.h"

using namespace bully;

static proto::Commit make_commit(uint64_t id, const std::string& command) {
  return proto::Commit(id, std::vector<uint8_t>(command.begin(), command.end()));
}

static std::string segment_path(const std::string& dir) {
  std::vector<std::string> names;
  WAL::get_wal_names(dir, names);
  return (boost::filesystem::path(dir) / names.back()).string();
}

TEST(WAL, wal_name) {
  ASSERT_EQ(WAL::wal_name(0, 1), "0000000000000000-0000000000000001.wal");

  uint64_t seq;
  uint64_t first_id;
  ASSERT_TRUE(WAL::parse_wal_name("000000000000000a-00000000000000ff.wal", &seq, &first_id));
  ASSERT_EQ(seq, 10);
  ASSERT_EQ(first_id, 255);

  ASSERT_FALSE(WAL::parse_wal_name("000000000000000a.wal", &seq, &first_id));
  ASSERT_FALSE(WAL::parse_wal_name("000000000000000a-00000000000000ff.snap", &seq, &first_id));
  ASSERT_FALSE(WAL::parse_wal_name("xyz-00000000000000ff.wal", &seq, &first_id));
}

TEST(WAL, is_valid_seq) {
  std::vector<std::string> names;
  names.push_back(WAL::wal_name(0, 1));
  names.push_back(WAL::wal_name(1, 10));
  ASSERT_TRUE(WAL::is_valid_seq(names));

  names.push_back(WAL::wal_name(3, 20));
  ASSERT_FALSE(WAL::is_valid_seq(names));
}

TEST(WAL, open_missing) {
  TempDir dir;
  WAL_ptr wal;
  ASSERT_TRUE(WAL::open(dir.sub("wal"), wal).is_not_found());
}

TEST(WAL, save_and_read) {
  TempDir dir;
  std::string wal_dir = dir.sub("wal");
  ASSERT_TRUE(WAL::create(wal_dir).is_ok());

  {
    WAL_ptr wal;
    ASSERT_TRUE(WAL::open(wal_dir, wal).is_ok());
    std::vector<proto::CommitPtr> commits;
    ASSERT_TRUE(wal->read_all(commits).is_ok());
    ASSERT_TRUE(commits.empty());
    ASSERT_EQ(wal->last_id(), 0);

    ASSERT_TRUE(wal->save_commit(make_commit(1, "a")).is_ok());
    ASSERT_TRUE(wal->save_commit(make_commit(2, "b")).is_ok());
    ASSERT_TRUE(wal->save_commit(make_commit(4, "d")).is_invalid_argument());
    ASSERT_EQ(wal->last_id(), 2);
  }

  WAL_ptr wal;
  ASSERT_TRUE(WAL::open(wal_dir, wal).is_ok());
  std::vector<proto::CommitPtr> commits;
  ASSERT_TRUE(wal->read_all(commits).is_ok());
  ASSERT_EQ(commits.size(), 2);
  ASSERT_EQ(*commits[0], make_commit(1, "a"));
  ASSERT_EQ(*commits[1], make_commit(2, "b"));

  ASSERT_TRUE(wal->save_commit(make_commit(3, "c")).is_ok());
}

TEST(WAL, torn_tail_is_truncated) {
  TempDir dir;
  std::string wal_dir = dir.sub("wal");
  ASSERT_TRUE(WAL::create(wal_dir).is_ok());
  {
    WAL_ptr wal;
    ASSERT_TRUE(WAL::open(wal_dir, wal).is_ok());
    std::vector<proto::CommitPtr> commits;
    ASSERT_TRUE(wal->read_all(commits).is_ok());
    ASSERT_TRUE(wal->save_commit(make_commit(1, "a")).is_ok());
  }

  // half a record header, as left by a crash in the middle of a write
  std::string path = segment_path(wal_dir);
  uintmax_t size = boost::filesystem::file_size(path);
  FILE* fp = fopen(path.c_str(), "a");
  ASSERT_TRUE(fp != NULL);
  fwrite("\x01\x10", 1, 2, fp);
  fclose(fp);

  WAL_ptr wal;
  ASSERT_TRUE(WAL::open(wal_dir, wal).is_ok());
  std::vector<proto::CommitPtr> commits;
  ASSERT_TRUE(wal->read_all(commits).is_ok());
  ASSERT_EQ(commits.size(), 1);
  ASSERT_EQ(boost::filesystem::file_size(path), size);

  ASSERT_TRUE(wal->save_commit(make_commit(2, "b")).is_ok());
}

TEST(WAL, corrupt_last_record_is_truncated) {
  TempDir dir;
  std::string wal_dir = dir.sub("wal");
  ASSERT_TRUE(WAL::create(wal_dir).is_ok());
  uintmax_t size;
  {
    WAL_ptr wal;
    ASSERT_TRUE(WAL::open(wal_dir, wal).is_ok());
    std::vector<proto::CommitPtr> commits;
    ASSERT_TRUE(wal->read_all(commits).is_ok());
    ASSERT_TRUE(wal->save_commit(make_commit(1, "a")).is_ok());
    size = boost::filesystem::file_size(segment_path(wal_dir));
    ASSERT_TRUE(wal->save_commit(make_commit(2, "bbbb")).is_ok());
  }

  // flip the last payload byte
  std::string path = segment_path(wal_dir);
  uintmax_t full = boost::filesystem::file_size(path);
  FILE* fp = fopen(path.c_str(), "r+");
  ASSERT_TRUE(fp != NULL);
  fseek(fp, static_cast<long>(full - 1), SEEK_SET);
  int c = fgetc(fp);
  fseek(fp, static_cast<long>(full - 1), SEEK_SET);
  fputc(c ^ 0xff, fp);
  fclose(fp);

  WAL_ptr wal;
  ASSERT_TRUE(WAL::open(wal_dir, wal).is_ok());
  std::vector<proto::CommitPtr> commits;
  ASSERT_TRUE(wal->read_all(commits).is_ok());
  ASSERT_EQ(commits.size(), 1);
  ASSERT_EQ(wal->last_id(), 1);
  ASSERT_EQ(boost::filesystem::file_size(path), size);
}

TEST(WAL, rollback_last_commit) {
  TempDir dir;
  std::string wal_dir = dir.sub("wal");
  ASSERT_TRUE(WAL::create(wal_dir).is_ok());
  {
    WAL_ptr wal;
    ASSERT_TRUE(WAL::open(wal_dir, wal).is_ok());
    std::vector<proto::CommitPtr> commits;
    ASSERT_TRUE(wal->read_all(commits).is_ok());
    ASSERT_TRUE(wal->save_commit(make_commit(1, "a")).is_ok());
    ASSERT_TRUE(wal->save_commit(make_commit(2, "b")).is_ok());

    ASSERT_TRUE(wal->rollback(1).is_invalid_argument());
    ASSERT_TRUE(wal->rollback(2).is_ok());
    ASSERT_EQ(wal->last_id(), 1);
    ASSERT_TRUE(wal->save_commit(make_commit(2, "c")).is_ok());
  }

  WAL_ptr wal;
  ASSERT_TRUE(WAL::open(wal_dir, wal).is_ok());
  std::vector<proto::CommitPtr> commits;
  ASSERT_TRUE(wal->read_all(commits).is_ok());
  ASSERT_EQ(commits.size(), 2);
  ASSERT_EQ(*commits[1], make_commit(2, "c"));
}

TEST(WAL, read_across_segments) {
  TempDir dir;
  std::string wal_dir = dir.sub("wal");
  ASSERT_TRUE(WAL::create(wal_dir).is_ok());
  {
    WAL_ptr wal;
    ASSERT_TRUE(WAL::open(wal_dir, wal).is_ok());
    std::vector<proto::CommitPtr> commits;
    ASSERT_TRUE(wal->read_all(commits).is_ok());
    ASSERT_TRUE(wal->save_commit(make_commit(1, "a")).is_ok());
    ASSERT_TRUE(wal->cut().is_ok());
    ASSERT_TRUE(wal->save_commit(make_commit(2, "b")).is_ok());
    ASSERT_TRUE(wal->save_commit(make_commit(3, "c")).is_ok());
  }

  std::vector<std::string> names;
  WAL::get_wal_names(wal_dir, names);
  ASSERT_EQ(names.size(), 2);
  ASSERT_EQ(names[1], WAL::wal_name(1, 2));

  WAL_ptr wal;
  ASSERT_TRUE(WAL::open(wal_dir, wal).is_ok());
  std::vector<proto::CommitPtr> commits;
  ASSERT_TRUE(wal->read_all(commits).is_ok());
  ASSERT_EQ(commits.size(), 3);
  ASSERT_EQ(commits[2]->id, 3);
}
