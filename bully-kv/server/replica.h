#pragma once
#include <stdint.h>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <bully-kv/bully/commit_log.h>
#include <bully-kv/bully/config.h>
#include <bully-kv/bully/election.h>
#include <bully-kv/bully/failure_detector.h>
#include <bully-kv/bully/leader_view.h>
#include <bully-kv/bully/pipeline.h>
#include <bully-kv/bully/replication.h>
#include <bully-kv/transport/transport.h>

namespace bully {

// One member of the cluster: its commit log, its view of the leader, and the
// coordinators that keep them in step with the other replicas. Failure
// detection and elections run on a single background thread.
class Replica : public RpcHandler {
 public:
  static void main(const Config& config, uint16_t port);

  explicit Replica(const Config& config, StateMachinePtr state_machine);

  ~Replica() final;

  // recovers the commit log
  Status open();

  // wires the coordinators to transport, must precede start and handle
  void init(TransportPtr transport);

  // joins the cluster, then probes on the background thread
  void start();

  void stop();

  void handle(const proto::Message& req, proto::Message& resp) final;

  uint64_t node_id() const final {
    return config_.id;
  }

  Status execute(const std::vector<uint8_t>& command, std::vector<uint8_t>& result);

  // background work driven by the caller, for replicas without a background thread
  void join();
  void run_election();
  void tick();
  // runs handlers scheduled by inbound calls
  void poll();

  LeaderView& view() {
    return view_;
  }

  CommitLog& log() {
    return log_;
  }

  const Config& config() const {
    return config_;
  }

 private:
  Config config_;
  LeaderView view_;
  CommitLog log_;

  boost::asio::io_service io_service_;
  std::unique_ptr<boost::asio::io_service::work> work_;
  std::thread thread_;

  TransportPtr transport_;
  ReplicationCoordinatorPtr replication_;
  ElectionCoordinatorPtr election_;
  FailureDetectorPtr detector_;
  PipelinePtr pipeline_;
};
typedef std::shared_ptr<Replica> ReplicaPtr;

}
