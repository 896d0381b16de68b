#pragma once
#include <memory>
#include <vector>
#include <bully-kv/bully/commit_log.h>
#include <bully-kv/bully/config.h>
#include <bully-kv/bully/leader_view.h>
#include <bully-kv/bully/replication.h>
#include <bully-kv/transport/transport.h>

namespace bully {

// Runs a client command on whichever replica received it: the leader commits
// and replicates it, a follower forwards it to the leader, anyone else refuses.
class Pipeline {
 public:
  explicit Pipeline(const Config& config,
                    LeaderView& view,
                    CommitLog& log,
                    ReplicationCoordinatorPtr replication,
                    TransportPtr transport);

  Status execute(const std::vector<uint8_t>& command, std::vector<uint8_t>& result);

  // Execute received from a client or forwarded by a follower
  void on_execute(const proto::Message& req, proto::Message& resp);

 private:
  Status execute_as_leader(uint64_t epoch, const std::vector<uint8_t>& command, std::vector<uint8_t>& result);

  Status forward(uint64_t leader, const std::vector<uint8_t>& command, std::vector<uint8_t>& result);

  const Config& config_;
  LeaderView& view_;
  CommitLog& log_;
  ReplicationCoordinatorPtr replication_;
  TransportPtr transport_;
};
typedef std::shared_ptr<Pipeline> PipelinePtr;

}
