#include <bully-kv/bully/pipeline.h>
#include <bully-kv/common/log.h>

namespace bully {

Pipeline::Pipeline(const Config& config,
                   LeaderView& view,
                   CommitLog& log,
                   ReplicationCoordinatorPtr replication,
                   TransportPtr transport)
    : config_(config),
      view_(view),
      log_(log),
      replication_(std::move(replication)),
      transport_(std::move(transport)) {
}

Status Pipeline::execute(const std::vector<uint8_t>& command, std::vector<uint8_t>& result) {
  Role role;
  uint64_t leader;
  uint64_t epoch;
  view_.get(role, leader, epoch);

  switch (role) {
    case Role::Leader: {
      return execute_as_leader(epoch, command, result);
    }
    case Role::Follower: {
      if (leader != 0) {
        return forward(leader, command, result);
      }
      return Status::no_leader("waiting for a coordinator announcement");
    }
    default: {
      return Status::no_leader("no leader known");
    }
  }
}

Status Pipeline::execute_as_leader(uint64_t epoch, const std::vector<uint8_t>& command, std::vector<uint8_t>& result) {
  if (!view_.serving()) {
    return Status::no_leader("leader is still synchronizing the cluster");
  }

  // the commit is created only while this replica still leads at epoch
  proto::Commit commit;
  Status status;
  bool leading = view_.run_at_epoch(epoch, [this, &command, &commit, &result, &status]() {
    status = this->log_.append(command, commit, result);
  });
  if (!leading) {
    return Status::no_leader("leadership changed before the command was committed");
  }
  if (!status.is_ok()) {
    return status;
  }
  return replication_->replicate(commit, config_.execute_timeout_ms);
}

Status Pipeline::forward(uint64_t leader, const std::vector<uint8_t>& command, std::vector<uint8_t>& result) {
  proto::Message req;
  req.type = proto::MsgExecute;
  req.from = config_.id;
  req.to = leader;
  req.payload = command;
  req.forwarded = true;

  proto::Message resp;
  Status status = transport_->call(leader, req, config_.execute_timeout_ms, resp);
  if (!status.is_ok()) {
    LOG_WARN("%lu: forward to leader %lu failed %s", config_.id, leader, status.to_string().c_str());
    return Status::forwarding_failure(status.message().c_str());
  }

  if (resp.code != Status::kOk) {
    return Status::from_code(resp.code, resp.error);
  }
  result = std::move(resp.payload);
  return Status::ok();
}

void Pipeline::on_execute(const proto::Message& req, proto::Message& resp) {
  Status status;
  if (req.forwarded && !view_.is_leader()) {
    status = Status::no_leader("forwarded to a replica that does not lead");
  } else {
    status = execute(req.payload, resp.payload);
  }

  resp.leader_id = view_.leader_id();
  resp.commit_id = log_.latest_id();
  if (!status.is_ok()) {
    resp.code = static_cast<uint8_t>(status.code());
    resp.error = status.message();
  }
}

}
