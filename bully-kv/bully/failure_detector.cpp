#include <algorithm>
#include <bully-kv/bully/failure_detector.h>
#include <bully-kv/common/log.h>

namespace bully {

FailureDetector::FailureDetector(const Config& config,
                                 LeaderView& view,
                                 CommitLog& log,
                                 ElectionCoordinatorPtr election,
                                 ReplicationCoordinatorPtr replication,
                                 TransportPtr transport,
                                 boost::asio::io_service& io_service)
    : config_(config),
      view_(view),
      log_(log),
      election_(std::move(election)),
      replication_(std::move(replication)),
      transport_(std::move(transport)),
      timer_(io_service),
      probed_leader_(0),
      missed_(0),
      stopped_(false) {
}

void FailureDetector::start() {
  stopped_ = false;
  start_timer();
}

void FailureDetector::stop() {
  stopped_ = true;
  boost::system::error_code ignored;
  timer_.cancel(ignored);
}

void FailureDetector::start_timer() {
  timer_.expires_from_now(boost::posix_time::millisec(config_.heartbeat_interval_ms));
  timer_.async_wait([this](const boost::system::error_code& err) {
    if (err) {
      if (err != boost::asio::error::operation_aborted) {
        LOG_ERROR("timer waiter error %s", err.message().c_str());
      }
      return;
    }

    this->tick();
    if (!this->stopped_) {
      this->start_timer();
    }
  });
}

void FailureDetector::tick() {
  Role role;
  uint64_t leader;
  uint64_t epoch;
  view_.get(role, leader, epoch);

  switch (role) {
    case Role::Leader: {
      probe_peers(epoch);
      break;
    }
    case Role::Follower: {
      if (leader != 0) {
        probe_leader(leader, epoch);
      } else if (view_.deferred_expired(config_.coordinator_timeout_ms)) {
        LOG_INFO("%lu: no announcement within %u ms, electing again", config_.id, config_.coordinator_timeout_ms);
        election_->run_election(epoch);
      }
      break;
    }
    case Role::Unknown: {
      election_->run_election(epoch);
      break;
    }
    case Role::Candidate: {
      break;
    }
  }
}

void FailureDetector::probe_leader(uint64_t leader, uint64_t epoch) {
  if (leader != probed_leader_) {
    probed_leader_ = leader;
    missed_ = 0;
  }

  proto::Message req;
  req.type = proto::MsgHeartbeat;
  req.from = config_.id;
  req.to = leader;
  req.commit_id = log_.latest_id();

  proto::Message resp;
  Status status = transport_->call(leader, req, config_.heartbeat_timeout_ms, resp);
  if (status.is_ok() && resp.leader_id == leader) {
    missed_ = 0;
    if (resp.commit_id > log_.latest_id()) {
      status = replication_->catch_up(leader);
      if (!status.is_ok()) {
        LOG_WARN("%lu: catch-up from leader %lu failed %s", config_.id, leader, status.to_string().c_str());
      }
    }
    return;
  }

  missed_++;
  LOG_DEBUG("%lu: leader %lu missed heartbeat %u of %u",
            config_.id,
            leader,
            missed_,
            config_.max_missed_heartbeats);
  if (missed_ < config_.max_missed_heartbeats) {
    return;
  }

  missed_ = 0;
  if (view_.suspect_leader(leader)) {
    LOG_WARN("%lu: leader %lu presumed dead", config_.id, leader);
    election_->run_election(view_.epoch());
  }
}

void FailureDetector::probe_peers(uint64_t epoch) {
  std::vector<uint64_t> peers = config_.peer_ids();
  if (peers.empty()) {
    return;
  }

  proto::Message req;
  req.type = proto::MsgHeartbeat;
  req.from = config_.id;
  req.leader_id = config_.id;
  req.commit_id = log_.latest_id();

  std::vector<proto::MessagePtr> responses;
  transport_->multicall(peers,
                        req,
                        config_.heartbeat_timeout_ms,
                        config_.heartbeat_timeout_ms,
                        peers.size(),
                        responses);

  // A higher leader wins through a fresh election. Peers naming a lower
  // leader follow a stale or split-off one and are brought over by announcing.
  bool conflict = false;
  std::vector<uint64_t> stale;
  std::vector<uint64_t> fresher;
  for (const proto::MessagePtr& resp : responses) {
    if (resp->leader_id > config_.id) {
      LOG_WARN("%lu: [%lu] follows higher leader %lu", config_.id, resp->from, resp->leader_id);
      conflict = true;
    } else if (resp->leader_id != 0 && resp->leader_id != config_.id) {
      LOG_INFO("%lu: [%lu] still follows %lu", config_.id, resp->from, resp->leader_id);
      stale.push_back(resp->from);
    }
    if (resp->commit_id > log_.latest_id()) {
      fresher.push_back(resp->from);
    }
  }

  uint64_t next_epoch;
  if (conflict) {
    if (view_.step_down(&next_epoch)) {
      LOG_WARN("%lu: conflicting leader found, electing again", config_.id);
      election_->run_election(next_epoch);
    }
    return;
  }

  if (!stale.empty()) {
    election_->reassert(epoch, stale);
    return;
  }

  for (uint64_t peer : fresher) {
    Status status = replication_->catch_up(peer);
    if (!status.is_ok()) {
      LOG_WARN("%lu: catch-up from [%lu] failed %s", config_.id, peer, status.to_string().c_str());
    }
  }
}

void FailureDetector::join() {
  std::vector<uint64_t> peers = config_.peer_ids();
  uint64_t epoch = view_.epoch();

  proto::Message req;
  req.type = proto::MsgHeartbeat;
  req.from = config_.id;
  req.commit_id = log_.latest_id();

  std::vector<proto::MessagePtr> responses;
  if (!peers.empty()) {
    transport_->multicall(peers,
                          req,
                          config_.heartbeat_timeout_ms,
                          config_.heartbeat_timeout_ms,
                          peers.size(),
                          responses);
  }

  // a leader answering for itself is the strongest evidence
  uint64_t leader = 0;
  for (const proto::MessagePtr& resp : responses) {
    if (resp->leader_id != 0 && resp->leader_id == resp->from) {
      leader = std::max(leader, resp->leader_id);
    }
  }

  if (leader != 0 && view_.adopt_leader(leader)) {
    LOG_INFO("%lu: joined leader %lu", config_.id, leader);
    Status status = replication_->catch_up(leader);
    if (!status.is_ok()) {
      LOG_WARN("%lu: catch-up from leader %lu failed %s", config_.id, leader, status.to_string().c_str());
    }
    return;
  }

  election_->run_election(epoch);
}

}
