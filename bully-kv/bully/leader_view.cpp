#include <bully-kv/bully/leader_view.h>
#include <bully-kv/common/log.h>

namespace bully {

const char* role_to_string(Role role) {
  switch (role) {
    case Role::Unknown: {
      return "UNKNOWN";
    }
    case Role::Follower: {
      return "FOLLOWER";
    }
    case Role::Candidate: {
      return "CANDIDATE";
    }
    case Role::Leader: {
      return "LEADER";
    }
    default: {
      return "unknown";
    }
  }
}

LeaderView::LeaderView(uint64_t id)
    : id_(id),
      role_(Role::Unknown),
      leader_id_(0),
      epoch_(0),
      serving_(false) {
}

Role LeaderView::role() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return role_;
}

uint64_t LeaderView::leader_id() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return leader_id_;
}

uint64_t LeaderView::epoch() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return epoch_;
}

void LeaderView::get(Role& role, uint64_t& leader_id, uint64_t& epoch) const {
  std::lock_guard<std::mutex> guard(mutex_);
  role = role_;
  leader_id = leader_id_;
  epoch = epoch_;
}

bool LeaderView::is_leader() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return role_ == Role::Leader;
}

bool LeaderView::serving() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return role_ == Role::Leader && serving_;
}

void LeaderView::run_locked(const std::function<void()>& fn) {
  std::lock_guard<std::mutex> guard(mutex_);
  fn();
}

bool LeaderView::run_at_epoch(uint64_t epoch, const std::function<void()>& fn) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (epoch != epoch_) {
    return false;
  }
  fn();
  return true;
}

void LeaderView::transition(Role role, uint64_t leader_id) {
  if (role_ != role || leader_id_ != leader_id) {
    LOG_INFO("%lu: %s(leader %lu) -> %s(leader %lu)",
             id_,
             role_to_string(role_),
             leader_id_,
             role_to_string(role),
             leader_id);
  }
  role_ = role;
  leader_id_ = leader_id;
  serving_ = false;
  epoch_++;
}

bool LeaderView::begin_election(uint64_t epoch, uint64_t* election_epoch) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (epoch != epoch_ || role_ == Role::Candidate || role_ == Role::Leader) {
    return false;
  }
  transition(Role::Candidate, 0);
  *election_epoch = epoch_;
  return true;
}

void LeaderView::defer(uint64_t election_epoch) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (role_ != Role::Candidate || epoch_ != election_epoch) {
    return;
  }
  transition(Role::Follower, 0);
  deferred_at_ = std::chrono::steady_clock::now();
}

bool LeaderView::become_leader(uint64_t election_epoch) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (role_ != Role::Candidate || epoch_ != election_epoch) {
    return false;
  }
  transition(Role::Leader, id_);
  return true;
}

void LeaderView::start_serving(uint64_t leader_epoch) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (role_ == Role::Leader && epoch_ == leader_epoch) {
    serving_ = true;
  }
}

bool LeaderView::pause_serving(uint64_t epoch, uint64_t* leader_epoch) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (role_ != Role::Leader || epoch_ != epoch) {
    return false;
  }
  transition(Role::Leader, id_);
  *leader_epoch = epoch_;
  return true;
}

bool LeaderView::adopt_leader(uint64_t leader) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (leader == 0 || leader == id_) {
    return false;
  }

  if ((role_ == Role::Leader || role_ == Role::Candidate) && leader < id_) {
    return false;
  }

  if (role_ == Role::Follower && leader < leader_id_) {
    return false;
  }

  if (role_ == Role::Follower && leader == leader_id_) {
    return true;
  }

  transition(Role::Follower, leader);
  return true;
}

bool LeaderView::suspect_leader(uint64_t leader) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (role_ != Role::Follower || leader_id_ != leader) {
    return false;
  }
  transition(Role::Unknown, 0);
  return true;
}

bool LeaderView::step_down(uint64_t* epoch) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (role_ != Role::Leader) {
    return false;
  }
  transition(Role::Unknown, 0);
  *epoch = epoch_;
  return true;
}

bool LeaderView::deferred_expired(uint32_t timeout_ms) const {
  std::lock_guard<std::mutex> guard(mutex_);
  if (role_ != Role::Follower || leader_id_ != 0) {
    return false;
  }
  auto elapsed = std::chrono::steady_clock::now() - deferred_at_;
  return elapsed >= std::chrono::milliseconds(timeout_ms);
}

}
