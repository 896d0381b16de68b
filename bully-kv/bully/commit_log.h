#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <bully-kv/bully/proto.h>
#include <bully-kv/bully/state_machine.h>
#include <bully-kv/common/status.h>
#include <bully-kv/snap/snapshotter.h>
#include <bully-kv/wal/wal.h>

namespace bully {

// The replicated, durable sequence of commits of one replica. Every commit is
// written to the wal and applied to the state machine as one unit: an apply
// failure rolls the wal record back, so no caller ever sees one without the other.
class CommitLog {
 public:
  explicit CommitLog(const std::string& data_dir, uint64_t snap_count, StateMachinePtr state_machine);

  ~CommitLog() = default;

  // recovers the snapshot and the wal, creating both on the first start
  Status open();

  // assigns the next id, persists and applies the command
  Status append(const std::vector<uint8_t>& command, proto::Commit& commit, std::vector<uint8_t>& result);

  // all commits with an id greater than after_id, ascending
  std::vector<proto::Commit> get_since(uint64_t after_id);

  // 0 for an empty log
  uint64_t latest_id();

  // Appends the commits this log lacks and checks the ones it has. A commit that
  // differs from the local one at the same id is a consistency violation: it is
  // reported and all further catch-up is refused.
  Status accept_missing(const std::vector<proto::Commit>& commits);

  bool halted();

  // a failed apply could not be rolled back, nothing is appended until restart
  bool failed();

 private:
  Status apply_and_save(const proto::Commit& commit, std::vector<uint8_t>& result);

  void maybe_snapshot();

  std::mutex mutex_;
  std::string wal_dir_;
  uint64_t snap_count_;
  StateMachinePtr state_machine_;
  Snapshotter snapshotter_;
  WAL_ptr wal_;
  std::vector<proto::CommitPtr> commits_;  // commits_[i] holds id i + 1
  uint64_t snapshot_id_;
  bool halted_;
  bool failed_;
};
typedef std::shared_ptr<CommitLog> CommitLogPtr;

}
