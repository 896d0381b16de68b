#pragma once
#include <stdint.h>
#include <chrono>
#include <functional>
#include <mutex>

namespace bully {

enum class Role {
  Unknown = 0,
  Follower = 1,
  Candidate = 2,
  Leader = 3,
};

const char* role_to_string(Role role);

// What a replica believes about leadership. Its lock is the replica's state
// lock: every read and transition happens under it, and so does every change
// to the commit log, which makes the leader check and the append one step.
// The lock never spans a network call. epoch is bumped by every transition so
// that a decision taken on a stale read can be detected.
class LeaderView {
 public:
  explicit LeaderView(uint64_t id);

  uint64_t id() const {
    return id_;
  }

  Role role() const;

  // 0 if no leader is known
  uint64_t leader_id() const;

  uint64_t epoch() const;

  void get(Role& role, uint64_t& leader_id, uint64_t& epoch) const;

  bool is_leader() const;

  // a new leader serves client commands only after its announcement round
  bool serving() const;

  // runs fn under the state lock
  void run_locked(const std::function<void()>& fn);

  // runs fn under the state lock if the view is still at epoch
  bool run_at_epoch(uint64_t epoch, const std::function<void()>& fn);

  // UNKNOWN or FOLLOWER -> CANDIDATE, returns false if already candidate or
  // leader, or if the view changed since epoch was read
  bool begin_election(uint64_t epoch, uint64_t* election_epoch);

  // a higher replica answered: CANDIDATE -> FOLLOWER waiting for its announcement
  void defer(uint64_t election_epoch);

  // CANDIDATE -> LEADER unless something else happened during the election
  bool become_leader(uint64_t election_epoch);

  // the leader elected at leader_epoch finished synchronizing the cluster
  void start_serving(uint64_t leader_epoch);

  // A leader about to bring peers of another leader into step stops serving
  // without giving up its role. leader_epoch is the epoch to resume at.
  bool pause_serving(uint64_t epoch, uint64_t* leader_epoch);

  // Follows an announced leader; the highest announced id wins. A lower
  // announcement is ignored while this replica leads, runs an election, or
  // follows a higher leader.
  bool adopt_leader(uint64_t leader);

  // FOLLOWER of leader -> UNKNOWN
  bool suspect_leader(uint64_t leader);

  // LEADER -> UNKNOWN, used to settle a conflicting leader
  bool step_down(uint64_t* epoch);

  // a deferred follower got no announcement within timeout_ms
  bool deferred_expired(uint32_t timeout_ms) const;

 private:
  void transition(Role role, uint64_t leader_id);

  mutable std::mutex mutex_;
  const uint64_t id_;
  Role role_;
  uint64_t leader_id_;
  uint64_t epoch_;
  bool serving_;
  std::chrono::steady_clock::time_point deferred_at_;
};

}
