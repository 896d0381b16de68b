#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include <bully-kv/bully/commit_log.h>
#include "test_util.h"

using namespace bully;

namespace {

// concatenates every applied command, optionally refusing one of them
class RecordingStateMachine : public StateMachine {
 public:
  Status apply(const proto::Commit& commit, std::vector<uint8_t>& result) final {
    std::string command(commit.command.begin(), commit.command.end());
    if (command == refuse) {
      return Status::invalid_argument("refused");
    }
    applied.push_back(command);
    result.assign(command.rbegin(), command.rend());
    return Status::ok();
  }

  Status snapshot(std::vector<uint8_t>& data) final {
    msgpack::sbuffer sbuf;
    msgpack::pack(sbuf, applied);
    data.assign(sbuf.data(), sbuf.data() + sbuf.size());
    snapshots++;
    return Status::ok();
  }

  Status restore(const std::vector<uint8_t>& data) final {
    msgpack::object_handle oh = msgpack::unpack((const char*) data.data(), data.size());
    oh.get().convert(applied);
    return Status::ok();
  }

  std::vector<std::string> applied;
  std::string refuse;
  int snapshots = 0;
};
typedef std::shared_ptr<RecordingStateMachine> RecordingStateMachinePtr;

std::vector<uint8_t> bytes(const std::string& str) {
  return std::vector<uint8_t>(str.begin(), str.end());
}

Status append(CommitLog& log, const std::string& command) {
  proto::Commit commit;
  std::vector<uint8_t> result;
  return log.append(bytes(command), commit, result);
}

}

TEST(CommitLog, ids_start_at_one) {
  TempDir dir;
  RecordingStateMachinePtr sm(new RecordingStateMachine());
  CommitLog log(dir.path(), 1000, sm);
  ASSERT_TRUE(log.open().is_ok());
  ASSERT_EQ(log.latest_id(), 0);
  ASSERT_TRUE(log.get_since(0).empty());

  proto::Commit commit;
  std::vector<uint8_t> result;
  ASSERT_TRUE(log.append(bytes("abc"), commit, result).is_ok());
  ASSERT_EQ(commit.id, 1);
  ASSERT_EQ(result, bytes("cba"));

  ASSERT_TRUE(log.append(bytes("de"), commit, result).is_ok());
  ASSERT_EQ(commit.id, 2);
  ASSERT_EQ(log.latest_id(), 2);

  std::vector<proto::Commit> commits = log.get_since(0);
  ASSERT_EQ(commits.size(), 2);
  ASSERT_EQ(commits[0], proto::Commit(1, bytes("abc")));
  ASSERT_EQ(commits[1], proto::Commit(2, bytes("de")));

  commits = log.get_since(1);
  ASSERT_EQ(commits.size(), 1);
  ASSERT_EQ(commits[0].id, 2);
  ASSERT_TRUE(log.get_since(2).empty());
  ASSERT_TRUE(log.get_since(10).empty());
}

TEST(CommitLog, accept_missing) {
  TempDir dir;
  RecordingStateMachinePtr sm(new RecordingStateMachine());
  CommitLog log(dir.path(), 1000, sm);
  ASSERT_TRUE(log.open().is_ok());
  ASSERT_TRUE(append(log, "a").is_ok());

  std::vector<proto::Commit> history = {
      proto::Commit(1, bytes("a")),
      proto::Commit(2, bytes("b")),
      proto::Commit(3, bytes("c")),
  };
  ASSERT_TRUE(log.accept_missing(history).is_ok());
  ASSERT_EQ(log.latest_id(), 3);
  ASSERT_EQ(sm->applied, std::vector<std::string>({"a", "b", "c"}));

  // known commits are skipped
  ASSERT_TRUE(log.accept_missing(history).is_ok());
  ASSERT_EQ(sm->applied.size(), 3);
  ASSERT_TRUE(log.accept_missing({}).is_ok());

  ASSERT_TRUE(log.accept_missing({proto::Commit(5, bytes("e"))}).is_invalid_argument());
  ASSERT_TRUE(log.accept_missing({proto::Commit(0, bytes("x"))}).is_invalid_argument());
  ASSERT_EQ(log.latest_id(), 3);
  ASSERT_FALSE(log.halted());
}

TEST(CommitLog, divergence_halts_catch_up) {
  TempDir dir;
  RecordingStateMachinePtr sm(new RecordingStateMachine());
  CommitLog log(dir.path(), 1000, sm);
  ASSERT_TRUE(log.open().is_ok());
  ASSERT_TRUE(append(log, "a").is_ok());
  ASSERT_TRUE(append(log, "b").is_ok());

  Status status = log.accept_missing({proto::Commit(2, bytes("x")), proto::Commit(3, bytes("c"))});
  ASSERT_TRUE(status.is_consistency_violation());
  ASSERT_TRUE(log.halted());
  ASSERT_EQ(log.latest_id(), 2);

  ASSERT_TRUE(log.accept_missing({proto::Commit(3, bytes("c"))}).is_consistency_violation());
  ASSERT_EQ(log.latest_id(), 2);

  // local commits stay as they were
  ASSERT_EQ(log.get_since(1)[0], proto::Commit(2, bytes("b")));
}

TEST(CommitLog, failed_apply_is_rolled_back) {
  TempDir dir;
  {
    RecordingStateMachinePtr sm(new RecordingStateMachine());
    sm->refuse = "bad";
    CommitLog log(dir.path(), 1000, sm);
    ASSERT_TRUE(log.open().is_ok());
    ASSERT_TRUE(append(log, "a").is_ok());
    ASSERT_TRUE(append(log, "bad").is_invalid_argument());
    ASSERT_FALSE(log.failed());
    ASSERT_EQ(log.latest_id(), 1);

    // the id of the failed command is reused
    proto::Commit commit;
    std::vector<uint8_t> result;
    ASSERT_TRUE(log.append(bytes("b"), commit, result).is_ok());
    ASSERT_EQ(commit.id, 2);
  }

  RecordingStateMachinePtr sm(new RecordingStateMachine());
  CommitLog log(dir.path(), 1000, sm);
  ASSERT_TRUE(log.open().is_ok());
  ASSERT_EQ(log.latest_id(), 2);
  ASSERT_EQ(sm->applied, std::vector<std::string>({"a", "b"}));
}

TEST(CommitLog, recovers_after_restart) {
  TempDir dir;
  {
    RecordingStateMachinePtr sm(new RecordingStateMachine());
    CommitLog log(dir.path(), 1000, sm);
    ASSERT_TRUE(log.open().is_ok());
    ASSERT_TRUE(append(log, "a").is_ok());
    ASSERT_TRUE(log.accept_missing({proto::Commit(2, bytes("b"))}).is_ok());
  }

  RecordingStateMachinePtr sm(new RecordingStateMachine());
  CommitLog log(dir.path(), 1000, sm);
  ASSERT_TRUE(log.open().is_ok());
  ASSERT_EQ(log.latest_id(), 2);
  ASSERT_EQ(sm->applied, std::vector<std::string>({"a", "b"}));
  ASSERT_TRUE(append(log, "c").is_ok());
  ASSERT_EQ(log.latest_id(), 3);
}

TEST(CommitLog, persisted_commit_is_applied_on_open) {
  TempDir dir;
  std::string wal_dir = dir.sub("wal");
  ASSERT_TRUE(WAL::create(wal_dir).is_ok());
  {
    // a crash right after the wal write, before the apply
    WAL_ptr wal;
    ASSERT_TRUE(WAL::open(wal_dir, wal).is_ok());
    std::vector<proto::CommitPtr> commits;
    ASSERT_TRUE(wal->read_all(commits).is_ok());
    ASSERT_TRUE(wal->save_commit(proto::Commit(1, bytes("a"))).is_ok());
  }

  RecordingStateMachinePtr sm(new RecordingStateMachine());
  CommitLog log(dir.path(), 1000, sm);
  ASSERT_TRUE(log.open().is_ok());
  ASSERT_EQ(log.latest_id(), 1);
  ASSERT_EQ(sm->applied, std::vector<std::string>({"a"}));
}

TEST(CommitLog, last_record_failing_replay_is_dropped) {
  TempDir dir;
  std::string wal_dir = dir.sub("wal");
  ASSERT_TRUE(WAL::create(wal_dir).is_ok());
  {
    // a crash after a failed apply whose wal record could not be rolled back
    WAL_ptr wal;
    ASSERT_TRUE(WAL::open(wal_dir, wal).is_ok());
    std::vector<proto::CommitPtr> commits;
    ASSERT_TRUE(wal->read_all(commits).is_ok());
    ASSERT_TRUE(wal->save_commit(proto::Commit(1, bytes("a"))).is_ok());
    ASSERT_TRUE(wal->save_commit(proto::Commit(2, bytes("bad"))).is_ok());
  }

  {
    RecordingStateMachinePtr sm(new RecordingStateMachine());
    sm->refuse = "bad";
    CommitLog log(dir.path(), 1000, sm);
    ASSERT_TRUE(log.open().is_ok());
    ASSERT_FALSE(log.failed());
    ASSERT_EQ(log.latest_id(), 1);
    ASSERT_EQ(sm->applied, std::vector<std::string>({"a"}));

    proto::Commit commit;
    std::vector<uint8_t> result;
    ASSERT_TRUE(log.append(bytes("b"), commit, result).is_ok());
    ASSERT_EQ(commit.id, 2);
  }

  // the dropped record is gone from disk as well
  RecordingStateMachinePtr sm(new RecordingStateMachine());
  CommitLog log(dir.path(), 1000, sm);
  ASSERT_TRUE(log.open().is_ok());
  ASSERT_EQ(sm->applied, std::vector<std::string>({"a", "b"}));
}

TEST(CommitLog, earlier_record_failing_replay_is_an_error) {
  TempDir dir;
  std::string wal_dir = dir.sub("wal");
  ASSERT_TRUE(WAL::create(wal_dir).is_ok());
  {
    WAL_ptr wal;
    ASSERT_TRUE(WAL::open(wal_dir, wal).is_ok());
    std::vector<proto::CommitPtr> commits;
    ASSERT_TRUE(wal->read_all(commits).is_ok());
    ASSERT_TRUE(wal->save_commit(proto::Commit(1, bytes("bad"))).is_ok());
    ASSERT_TRUE(wal->save_commit(proto::Commit(2, bytes("b"))).is_ok());
  }

  RecordingStateMachinePtr sm(new RecordingStateMachine());
  sm->refuse = "bad";
  CommitLog log(dir.path(), 1000, sm);
  ASSERT_TRUE(log.open().is_invalid_argument());
}

TEST(CommitLog, snapshot_speeds_up_replay) {
  TempDir dir;
  {
    RecordingStateMachinePtr sm(new RecordingStateMachine());
    CommitLog log(dir.path(), 2, sm);
    ASSERT_TRUE(log.open().is_ok());
    for (const char* command : {"a", "b", "c", "d", "e"}) {
      ASSERT_TRUE(append(log, command).is_ok());
    }
    ASSERT_EQ(sm->snapshots, 2);
  }
  ASSERT_FALSE(boost::filesystem::is_empty(dir.sub("snap")));

  RecordingStateMachinePtr sm(new RecordingStateMachine());
  CommitLog log(dir.path(), 2, sm);
  ASSERT_TRUE(log.open().is_ok());
  ASSERT_EQ(log.latest_id(), 5);
  ASSERT_EQ(sm->applied, std::vector<std::string>({"a", "b", "c", "d", "e"}));

  // the history is never compacted
  ASSERT_EQ(log.get_since(0).size(), 5);
}
