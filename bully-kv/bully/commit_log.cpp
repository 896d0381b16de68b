#include <boost/filesystem.hpp>
#include <bully-kv/bully/commit_log.h>
#include <bully-kv/common/log.h>

namespace bully {

CommitLog::CommitLog(const std::string& data_dir, uint64_t snap_count, StateMachinePtr state_machine)
    : wal_dir_((boost::filesystem::path(data_dir) / "wal").string()),
      snap_count_(snap_count),
      state_machine_(std::move(state_machine)),
      snapshotter_((boost::filesystem::path(data_dir) / "snap").string()),
      snapshot_id_(0),
      halted_(false),
      failed_(false) {
}

Status CommitLog::open() {
  std::lock_guard<std::mutex> guard(mutex_);

  Status status = snapshotter_.init();
  if (!status.is_ok()) {
    return status;
  }

  proto::Snapshot snapshot;
  status = snapshotter_.load(snapshot);
  if (status.is_ok()) {
    status = state_machine_->restore(snapshot.data);
    if (!status.is_ok()) {
      LOG_ERROR("restore snapshot %lu error %s", snapshot.commit_id, status.to_string().c_str());
      return status;
    }
    snapshot_id_ = snapshot.commit_id;
    LOG_INFO("restored snapshot at commit %lu", snapshot_id_);
  } else if (!status.is_not_found()) {
    return status;
  }

  if (!boost::filesystem::exists(wal_dir_)) {
    status = WAL::create(wal_dir_);
    if (!status.is_ok()) {
      return status;
    }
  }

  status = WAL::open(wal_dir_, wal_);
  if (!status.is_ok()) {
    return status;
  }

  std::vector<proto::CommitPtr> commits;
  status = wal_->read_all(commits);
  if (!status.is_ok()) {
    return status;
  }

  if (commits.size() < snapshot_id_) {
    LOG_ERROR("snapshot at commit %lu is ahead of the wal end %lu", snapshot_id_, commits.size());
    return Status::io_error("snapshot is ahead of the wal");
  }

  // everything up to the snapshot is already in the restored state
  for (size_t i = snapshot_id_; i < commits.size(); ++i) {
    const proto::CommitPtr& commit = commits[i];
    std::vector<uint8_t> result;
    status = state_machine_->apply(*commit, result);
    if (status.is_ok()) {
      continue;
    }

    // the process died after a failed apply, before its record was rolled back
    if (i + 1 == commits.size()) {
      LOG_WARN("dropping last commit %lu, its apply fails: %s", commit->id, status.to_string().c_str());
      status = wal_->rollback(commit->id);
      if (!status.is_ok()) {
        return status;
      }
      commits.pop_back();
      break;
    }
    LOG_ERROR("replay commit %lu error %s", commit->id, status.to_string().c_str());
    return status;
  }
  commits_ = std::move(commits);
  LOG_INFO("commit log recovered, latest commit %lu", commits_.size());
  return Status::ok();
}

Status CommitLog::append(const std::vector<uint8_t>& command, proto::Commit& commit, std::vector<uint8_t>& result) {
  std::lock_guard<std::mutex> guard(mutex_);
  commit = proto::Commit(commits_.size() + 1, command);
  return apply_and_save(commit, result);
}

Status CommitLog::apply_and_save(const proto::Commit& commit, std::vector<uint8_t>& result) {
  if (failed_) {
    return Status::io_error("wal rollback failed, restart required");
  }

  Status status = wal_->save_commit(commit);
  if (!status.is_ok()) {
    LOG_ERROR("persist commit %lu error %s", commit.id, status.to_string().c_str());
    return status;
  }

  status = state_machine_->apply(commit, result);
  if (!status.is_ok()) {
    LOG_ERROR("apply commit %lu error %s", commit.id, status.to_string().c_str());
    Status rollback = wal_->rollback(commit.id);
    if (!rollback.is_ok()) {
      // the wal now runs ahead of memory, open() replays the record on restart
      failed_ = true;
      LOG_ERROR("cannot roll back commit %lu: %s, commit log closed until restart",
                commit.id,
                rollback.to_string().c_str());
      return Status::io_error("wal rollback failed, restart required");
    }
    return status;
  }

  commits_.push_back(std::make_shared<proto::Commit>(commit));
  maybe_snapshot();
  return Status::ok();
}

void CommitLog::maybe_snapshot() {
  uint64_t latest = commits_.size();
  if (latest - snapshot_id_ < snap_count_) {
    return;
  }

  proto::Snapshot snapshot;
  snapshot.commit_id = latest;
  Status status = state_machine_->snapshot(snapshot.data);
  if (status.is_ok()) {
    status = snapshotter_.save_snap(snapshot);
  }
  if (!status.is_ok()) {
    LOG_WARN("snapshot at commit %lu error %s", latest, status.to_string().c_str());
    return;
  }
  snapshot_id_ = latest;
}

std::vector<proto::Commit> CommitLog::get_since(uint64_t after_id) {
  std::lock_guard<std::mutex> guard(mutex_);
  std::vector<proto::Commit> commits;
  for (uint64_t id = after_id + 1; id <= commits_.size(); ++id) {
    commits.push_back(*commits_[id - 1]);
  }
  return commits;
}

uint64_t CommitLog::latest_id() {
  std::lock_guard<std::mutex> guard(mutex_);
  return commits_.size();
}

Status CommitLog::accept_missing(const std::vector<proto::Commit>& commits) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (halted_) {
    return Status::consistency_violation("catch-up halted by an earlier divergence");
  }

  size_t accepted = 0;
  for (const proto::Commit& commit : commits) {
    uint64_t latest = commits_.size();
    if (commit.id == 0) {
      return Status::invalid_argument("commit id 0");
    }

    if (commit.id <= latest) {
      if (*commits_[commit.id - 1] != commit) {
        halted_ = true;
        LOG_ERROR("consistency violation at commit %lu: local and remote commands differ, catch-up halted",
                  commit.id);
        return Status::consistency_violation("commit differs from the local one at the same id");
      }
      continue;
    }

    if (commit.id > latest + 1) {
      LOG_WARN("commit %lu does not follow local commit %lu", commit.id, latest);
      return Status::invalid_argument("gap before commit");
    }

    std::vector<uint8_t> result;
    Status status = apply_and_save(commit, result);
    if (!status.is_ok()) {
      return status;
    }
    accepted++;
  }

  if (accepted > 0) {
    LOG_DEBUG("accepted %lu commits, latest commit %lu", accepted, commits_.size());
  }
  return Status::ok();
}

bool CommitLog::halted() {
  std::lock_guard<std::mutex> guard(mutex_);
  return halted_;
}

bool CommitLog::failed() {
  std::lock_guard<std::mutex> guard(mutex_);
  return failed_;
}

}
