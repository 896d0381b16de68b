#include <bully-kv/bully/config.h>

namespace bully {

Status Config::validate() const {
  if (id == 0) {
    return Status::invalid_argument("cannot use none as id");
  }

  if (peers.empty()) {
    return Status::invalid_argument("cluster must not be empty");
  }

  if (id > peers.size()) {
    return Status::invalid_argument("id is not a member of the cluster");
  }

  if (data_dir.empty()) {
    return Status::invalid_argument("data dir must not be empty");
  }

  if (heartbeat_interval_ms == 0 || heartbeat_timeout_ms == 0) {
    return Status::invalid_argument("heartbeat interval and timeout must be greater than 0");
  }

  if (max_missed_heartbeats == 0) {
    return Status::invalid_argument("max missed heartbeats must be greater than 0");
  }

  if (election_timeout_ms == 0 || coordinator_timeout_ms == 0) {
    return Status::invalid_argument("election timeouts must be greater than 0");
  }

  if (replicate_timeout_ms == 0 || execute_timeout_ms == 0) {
    return Status::invalid_argument("replication timeouts must be greater than 0");
  }

  if (snap_count == 0) {
    return Status::invalid_argument("snap count must be greater than 0");
  }

  if (rpc_workers == 0) {
    return Status::invalid_argument("rpc workers must be greater than 0");
  }

  return Status::ok();
}

std::vector<uint64_t> Config::peer_ids() const {
  std::vector<uint64_t> ids;
  for (uint64_t peer = 1; peer <= peers.size(); ++peer) {
    if (peer != id) {
      ids.push_back(peer);
    }
  }
  return ids;
}

std::vector<uint64_t> Config::higher_ids() const {
  std::vector<uint64_t> ids;
  for (uint64_t peer = id + 1; peer <= peers.size(); ++peer) {
    ids.push_back(peer);
  }
  return ids;
}

}
