#pragma once
#include <memory>
#include <vector>
#include <boost/asio.hpp>
#include <bully-kv/bully/commit_log.h>
#include <bully-kv/bully/config.h>
#include <bully-kv/bully/leader_view.h>
#include <bully-kv/bully/replication.h>
#include <bully-kv/transport/transport.h>

namespace bully {

// Bully election. Elections and announcements run on the replica's background
// io_service; handlers only answer and schedule.
class ElectionCoordinator {
 public:
  explicit ElectionCoordinator(const Config& config,
                               LeaderView& view,
                               CommitLog& log,
                               ReplicationCoordinatorPtr replication,
                               TransportPtr transport,
                               boost::asio::io_service& io_service);

  // Asks every higher replica to take over. Without an answer this replica
  // pulls the freshest log from its peers, becomes leader and announces
  // itself. Nothing happens if the view moved past epoch.
  void run_election(uint64_t epoch);

  // sends the coordinator announcement with the full history to peers
  void announce(const std::vector<uint64_t>& peers);

  // Announces again to peers that follow another leader, after pulling the
  // freshest log. Client writes pause until the round and its catch-up are
  // done, so that a commit the other leader appended is pulled before its id
  // could be reused.
  void reassert(uint64_t epoch, const std::vector<uint64_t>& peers);

  void on_election(const proto::Message& req, proto::Message& resp);

  void on_coordinator(const proto::Message& req, proto::Message& resp);

 private:
  const Config& config_;
  LeaderView& view_;
  CommitLog& log_;
  ReplicationCoordinatorPtr replication_;
  TransportPtr transport_;
  boost::asio::io_service& io_service_;
};
typedef std::shared_ptr<ElectionCoordinator> ElectionCoordinatorPtr;

}
