#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include <bully-kv/common/status.h>

namespace bully {

struct Config {
  Config()
      : id(0),
        heartbeat_interval_ms(2000),
        heartbeat_timeout_ms(1000),
        max_missed_heartbeats(2),
        election_timeout_ms(2000),
        coordinator_timeout_ms(6000),
        replicate_timeout_ms(1000),
        execute_timeout_ms(5000),
        snap_count(1000),
        rpc_workers(4) {
  }

  // id is the identity of the local replica. ID cannot be 0.
  uint64_t id;

  // addresses of every replica in the cluster, replica i + 1 listens on peers[i]
  std::vector<std::string> peers;

  // holds the wal/ and snap/ directories
  std::string data_dir;

  // interval between two probes of the failure detector
  uint32_t heartbeat_interval_ms;
  uint32_t heartbeat_timeout_ms;

  // consecutive unanswered probes before the leader is presumed dead
  uint32_t max_missed_heartbeats;

  // how long a candidate waits for higher replicas to answer an election request
  uint32_t election_timeout_ms;

  // how long a replica that deferred to a higher one waits for its announcement
  uint32_t coordinator_timeout_ms;

  // bound of one replicate call
  uint32_t replicate_timeout_ms;

  // bound of a whole client command, including forwarding and quorum wait
  uint32_t execute_timeout_ms;

  // commits applied between two state machine snapshots
  uint64_t snap_count;

  // threads serving inbound calls, and as many issuing outbound ones
  uint32_t rpc_workers;

  Status validate() const;

  size_t cluster_size() const {
    return peers.size();
  }

  // strict majority of the whole cluster, the leader included
  size_t quorum() const {
    return peers.size() / 2 + 1;
  }

  // ids of every other replica
  std::vector<uint64_t> peer_ids() const;

  // ids of the replicas that would win an election against this one
  std::vector<uint64_t> higher_ids() const;
};

}
