#pragma once
#include <memory>
#include <boost/asio.hpp>
#include <bully-kv/bully/commit_log.h>
#include <bully-kv/bully/config.h>
#include <bully-kv/bully/election.h>
#include <bully-kv/bully/leader_view.h>
#include <bully-kv/bully/replication.h>
#include <bully-kv/transport/transport.h>

namespace bully {

// Periodic liveness probing. A follower probes its leader and starts an
// election after max_missed_heartbeats unanswered probes; the leader probes
// every peer to find conflicting leaders and fresher logs.
class FailureDetector {
 public:
  explicit FailureDetector(const Config& config,
                           LeaderView& view,
                           CommitLog& log,
                           ElectionCoordinatorPtr election,
                           ReplicationCoordinatorPtr replication,
                           TransportPtr transport,
                           boost::asio::io_service& io_service);

  void start();

  void stop();

  // one probe cycle
  void tick();

  // Asks every peer whom it follows. Adopts and catches up from a live leader
  // if one is reported, otherwise runs an election.
  void join();

 private:
  void start_timer();

  void probe_leader(uint64_t leader, uint64_t epoch);

  void probe_peers(uint64_t epoch);

  const Config& config_;
  LeaderView& view_;
  CommitLog& log_;
  ElectionCoordinatorPtr election_;
  ReplicationCoordinatorPtr replication_;
  TransportPtr transport_;
  boost::asio::deadline_timer timer_;
  uint64_t probed_leader_;
  uint32_t missed_;
  bool stopped_;
};
typedef std::shared_ptr<FailureDetector> FailureDetectorPtr;

}
