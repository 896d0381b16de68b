#include <bully-kv/bully/replication.h>
#include <bully-kv/common/log.h>

namespace bully {

ReplicationCoordinator::ReplicationCoordinator(const Config& config,
                                               LeaderView& view,
                                               CommitLog& log,
                                               TransportPtr transport)
    : config_(config),
      view_(view),
      log_(log),
      transport_(std::move(transport)) {
}

Status ReplicationCoordinator::replicate(const proto::Commit& commit, uint32_t wait_ms) {
  size_t required = config_.quorum() - 1;
  if (required == 0) {
    return Status::ok();
  }

  proto::Message req;
  req.type = proto::MsgReplicate;
  req.from = config_.id;
  req.leader_id = config_.id;
  req.commits.push_back(commit);

  std::vector<proto::MessagePtr> responses;
  size_t acks = transport_->multicall(config_.peer_ids(),
                                      req,
                                      config_.replicate_timeout_ms,
                                      wait_ms,
                                      required,
                                      responses);

  for (const proto::MessagePtr& resp : responses) {
    if (resp->reject) {
      LOG_WARN("[%lu] refused commit %lu, it follows %lu", resp->from, commit.id, resp->leader_id);
    } else if (resp->code != Status::kOk) {
      LOG_WARN("[%lu] failed to accept commit %lu: %s", resp->from, commit.id, resp->error.c_str());
    }
  }

  if (acks < required) {
    LOG_WARN("commit %lu reached %lu of %lu followers needed for a quorum", commit.id, acks, required);
    return Status::timed_out("quorum not reached, the commit is durable on the leader only");
  }
  return Status::ok();
}

void ReplicationCoordinator::on_replicate(const proto::Message& req, proto::Message& resp) {
  Role role;
  uint64_t leader;
  uint64_t epoch;
  view_.get(role, leader, epoch);

  resp.leader_id = leader;
  if (role != Role::Follower || leader != req.from) {
    LOG_DEBUG("rejected replicate from [%lu], following %lu as %s", req.from, leader, role_to_string(role));
    resp.reject = true;
    resp.commit_id = log_.latest_id();
    return;
  }

  if (req.commits.empty()) {
    resp.code = Status::kInvalidArgument;
    resp.error = "replicate without commit";
    resp.commit_id = log_.latest_id();
    return;
  }

  // the sender must still be the followed leader when the commit lands
  Status status;
  bool gap = false;
  bool current = view_.run_at_epoch(epoch, [this, &req, &status, &gap]() {
    if (req.commits.front().id > this->log_.latest_id() + 1) {
      gap = true;
      return;
    }
    status = this->log_.accept_missing(req.commits);
  });

  if (!current) {
    LOG_DEBUG("rejected replicate from [%lu], view changed", req.from);
    resp.reject = true;
    resp.leader_id = view_.leader_id();
    resp.commit_id = log_.latest_id();
    return;
  }

  if (gap) {
    status = catch_up(req.from);
  }

  if (!status.is_ok()) {
    resp.code = static_cast<uint8_t>(status.code());
    resp.error = status.message();
  }
  resp.commit_id = log_.latest_id();
}

void ReplicationCoordinator::on_get_commits(const proto::Message& req, proto::Message& resp) {
  resp.commits = log_.get_since(req.commit_id);
  resp.commit_id = log_.latest_id();
  resp.leader_id = view_.leader_id();
}

Status ReplicationCoordinator::catch_up(uint64_t peer) {
  if (log_.halted()) {
    return Status::consistency_violation("catch-up halted by an earlier divergence");
  }

  uint64_t latest = log_.latest_id();
  proto::Message req;
  req.type = proto::MsgGetCommits;
  req.from = config_.id;
  req.to = peer;
  req.commit_id = latest;

  proto::Message resp;
  Status status = transport_->call(peer, req, config_.replicate_timeout_ms, resp);
  if (!status.is_ok()) {
    LOG_DEBUG("catch-up from [%lu] failed %s", peer, status.to_string().c_str());
    return status;
  }

  view_.run_locked([this, &resp, &status]() {
    status = this->log_.accept_missing(resp.commits);
  });
  if (!status.is_ok()) {
    LOG_WARN("catch-up from [%lu] failed %s", peer, status.to_string().c_str());
    return status;
  }

  if (log_.latest_id() > latest) {
    LOG_INFO("caught up from [%lu], commits %lu -> %lu", peer, latest, log_.latest_id());
  }
  return Status::ok();
}

void ReplicationCoordinator::pull_from_peers() {
  std::vector<uint64_t> peers = config_.peer_ids();
  if (peers.empty()) {
    return;
  }

  uint64_t latest = log_.latest_id();
  proto::Message req;
  req.type = proto::MsgGetCommits;
  req.from = config_.id;
  req.commit_id = latest;

  std::vector<proto::MessagePtr> responses;
  transport_->multicall(peers,
                        req,
                        config_.replicate_timeout_ms,
                        config_.election_timeout_ms,
                        peers.size(),
                        responses);

  for (const proto::MessagePtr& resp : responses) {
    if (resp->commits.empty()) {
      continue;
    }
    Status status;
    view_.run_locked([this, &resp, &status]() {
      status = this->log_.accept_missing(resp->commits);
    });
    if (!status.is_ok()) {
      LOG_ERROR("pull from [%lu] failed %s", resp->from, status.to_string().c_str());
    }
  }

  if (log_.latest_id() > latest) {
    LOG_INFO("pulled commits %lu -> %lu from peers", latest, log_.latest_id());
  }
}

}
