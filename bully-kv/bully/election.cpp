#include <bully-kv/bully/election.h>
#include <bully-kv/common/log.h>

namespace bully {

ElectionCoordinator::ElectionCoordinator(const Config& config,
                                         LeaderView& view,
                                         CommitLog& log,
                                         ReplicationCoordinatorPtr replication,
                                         TransportPtr transport,
                                         boost::asio::io_service& io_service)
    : config_(config),
      view_(view),
      log_(log),
      replication_(std::move(replication)),
      transport_(std::move(transport)),
      io_service_(io_service) {
}

void ElectionCoordinator::run_election(uint64_t epoch) {
  uint64_t election_epoch;
  if (!view_.begin_election(epoch, &election_epoch)) {
    return;
  }

  std::vector<uint64_t> higher = config_.higher_ids();
  LOG_INFO("%lu: starting election against %lu higher replicas", config_.id, higher.size());

  if (!higher.empty()) {
    proto::Message req;
    req.type = proto::MsgElection;
    req.from = config_.id;
    req.commit_id = log_.latest_id();

    std::vector<proto::MessagePtr> responses;
    size_t acks = transport_->multicall(higher,
                                        req,
                                        config_.election_timeout_ms,
                                        config_.election_timeout_ms,
                                        1,
                                        responses);
    if (acks > 0) {
      LOG_INFO("%lu: a higher replica answered, waiting for its announcement", config_.id);
      view_.defer(election_epoch);
      return;
    }
  }

  replication_->pull_from_peers();

  if (!view_.become_leader(election_epoch)) {
    LOG_INFO("%lu: election superseded", config_.id);
    return;
  }
  uint64_t leader_epoch = view_.epoch();
  LOG_INFO("%lu: won the election at commit %lu", config_.id, log_.latest_id());
  announce(config_.peer_ids());
  view_.start_serving(leader_epoch);
}

void ElectionCoordinator::announce(const std::vector<uint64_t>& peers) {
  if (peers.empty()) {
    return;
  }

  proto::Message req;
  req.type = proto::MsgCoordinator;
  req.from = config_.id;
  req.leader_id = config_.id;
  req.commits = log_.get_since(0);
  req.commit_id = log_.latest_id();

  std::vector<proto::MessagePtr> responses;
  transport_->multicall(peers,
                        req,
                        config_.election_timeout_ms,
                        config_.election_timeout_ms,
                        peers.size(),
                        responses);

  for (const proto::MessagePtr& resp : responses) {
    if (resp->reject) {
      LOG_WARN("%lu: [%lu] refused the announcement, it follows %lu", config_.id, resp->from, resp->leader_id);
      continue;
    }
    if (resp->code != Status::kOk) {
      LOG_ERROR("%lu: [%lu] failed to accept the history: %s", config_.id, resp->from, resp->error.c_str());
      continue;
    }
    if (resp->commit_id > log_.latest_id()) {
      Status status = replication_->catch_up(resp->from);
      if (!status.is_ok()) {
        LOG_ERROR("%lu: catch-up from [%lu] failed %s", config_.id, resp->from, status.to_string().c_str());
      }
    }
  }
}

void ElectionCoordinator::reassert(uint64_t epoch, const std::vector<uint64_t>& peers) {
  uint64_t leader_epoch;
  if (peers.empty() || !view_.pause_serving(epoch, &leader_epoch)) {
    return;
  }
  LOG_INFO("%lu: announcing again to %lu replicas", config_.id, peers.size());
  replication_->pull_from_peers();
  announce(peers);
  view_.start_serving(leader_epoch);
}

void ElectionCoordinator::on_election(const proto::Message& req, proto::Message& resp) {
  Role role;
  uint64_t leader;
  uint64_t epoch;
  view_.get(role, leader, epoch);

  resp.leader_id = leader;
  resp.commit_id = log_.latest_id();

  uint64_t from = req.from;
  if (role == Role::Leader) {
    io_service_.post([this, from]() {
      this->announce(std::vector<uint64_t>{from});
    });
    return;
  }

  if (role != Role::Candidate) {
    io_service_.post([this, epoch]() {
      this->run_election(epoch);
    });
  }
}

void ElectionCoordinator::on_coordinator(const proto::Message& req, proto::Message& resp) {
  if (!view_.adopt_leader(req.leader_id)) {
    resp.reject = true;
    resp.leader_id = view_.leader_id();
    resp.commit_id = log_.latest_id();
    LOG_INFO("%lu: ignored announcement of %lu", config_.id, req.leader_id);

    Role role;
    uint64_t leader;
    uint64_t epoch;
    view_.get(role, leader, epoch);
    uint64_t from = req.from;
    if (role == Role::Leader && req.leader_id < config_.id) {
      io_service_.post([this, epoch, from]() {
        this->reassert(epoch, std::vector<uint64_t>{from});
      });
    }
    return;
  }

  resp.leader_id = req.leader_id;
  Status status;
  view_.run_locked([this, &req, &status]() {
    status = this->log_.accept_missing(req.commits);
  });
  if (!status.is_ok()) {
    LOG_ERROR("%lu: history from %lu not accepted: %s", config_.id, req.leader_id, status.to_string().c_str());
    resp.code = static_cast<uint8_t>(status.code());
    resp.error = status.message();
  }
  resp.commit_id = log_.latest_id();
}

}
