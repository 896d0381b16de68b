#pragma once
#include <memory>
#include <bully-kv/bully/commit_log.h>
#include <bully-kv/bully/config.h>
#include <bully-kv/bully/leader_view.h>
#include <bully-kv/transport/transport.h>

namespace bully {

// Moves commits between replicas: the leader pushes every new commit and waits
// for a quorum, a follower pulls whatever it misses.
class ReplicationCoordinator {
 public:
  explicit ReplicationCoordinator(const Config& config, LeaderView& view, CommitLog& log, TransportPtr transport);

  // Leader side. Returns once a quorum, the leader included, holds commit.
  // TimedOut means the commit is durable here but its replication is uncertain.
  Status replicate(const proto::Commit& commit, uint32_t wait_ms);

  // Follower side, only the followed leader may push
  void on_replicate(const proto::Message& req, proto::Message& resp);

  void on_get_commits(const proto::Message& req, proto::Message& resp);

  // fetches and accepts everything peer has after the local latest id
  Status catch_up(uint64_t peer);

  // catch-up against every reachable peer, used by an election winner
  void pull_from_peers();

 private:
  const Config& config_;
  LeaderView& view_;
  CommitLog& log_;
  TransportPtr transport_;
};
typedef std::shared_ptr<ReplicationCoordinator> ReplicationCoordinatorPtr;

}
