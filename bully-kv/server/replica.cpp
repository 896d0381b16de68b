#include <signal.h>
#include <bully-kv/server/replica.h>
#include <bully-kv/server/kv_store.h>
#include <bully-kv/server/redis_server.h>
#include <bully-kv/common/log.h>

namespace bully {

Replica::Replica(const Config& config, StateMachinePtr state_machine)
    : config_(config),
      view_(config.id),
      log_(config.data_dir, config.snap_count, std::move(state_machine)) {
}

Replica::~Replica() {
  stop();
  LOG_DEBUG("stopped");
}

Status Replica::open() {
  LOG_DEBUG("replaying commit log of member %lu", config_.id);
  return log_.open();
}

void Replica::init(TransportPtr transport) {
  transport_ = std::move(transport);
  replication_ = std::make_shared<ReplicationCoordinator>(config_, view_, log_, transport_);
  election_ = std::make_shared<ElectionCoordinator>(config_, view_, log_, replication_, transport_, io_service_);
  detector_ = std::make_shared<FailureDetector>(config_,
                                                view_,
                                                log_,
                                                election_,
                                                replication_,
                                                transport_,
                                                io_service_);
  pipeline_ = std::make_shared<Pipeline>(config_, view_, log_, replication_, transport_);
}

void Replica::start() {
  work_.reset(new boost::asio::io_service::work(io_service_));
  io_service_.post([this]() {
    this->detector_->join();
    this->detector_->start();
  });

  thread_ = std::thread([this]() {
    this->io_service_.run();
  });
}

void Replica::stop() {
  if (!thread_.joinable()) {
    return;
  }
  io_service_.post([this]() {
    this->detector_->stop();
  });
  work_.reset();
  io_service_.stop();
  thread_.join();
}

void Replica::handle(const proto::Message& req, proto::Message& resp) {
  resp.type = proto::response_type(req.type);
  resp.from = config_.id;
  resp.to = req.from;

  switch (req.type) {
    case proto::MsgElection: {
      election_->on_election(req, resp);
      break;
    }
    case proto::MsgCoordinator: {
      election_->on_coordinator(req, resp);
      break;
    }
    case proto::MsgHeartbeat: {
      resp.leader_id = view_.leader_id();
      resp.commit_id = log_.latest_id();
      break;
    }
    case proto::MsgExecute: {
      pipeline_->on_execute(req, resp);
      break;
    }
    case proto::MsgGetCommits: {
      replication_->on_get_commits(req, resp);
      break;
    }
    case proto::MsgReplicate: {
      replication_->on_replicate(req, resp);
      break;
    }
    case proto::MsgElectionResp:
    case proto::MsgCoordinatorResp:
    case proto::MsgHeartbeatResp:
    case proto::MsgExecuteResp:
    case proto::MsgGetCommitsResp:
    case proto::MsgReplicateResp: {
      LOG_WARN("unexpected %s from [%lu]", proto::msg_type_to_string(req.type), req.from);
      resp.code = Status::kInvalidArgument;
      resp.error = "not a request";
      break;
    }
    default: {
      LOG_WARN("unknown msg type %d from [%lu]", req.type, req.from);
      resp.code = Status::kNotSupported;
      resp.error = "unknown message type";
      break;
    }
  }
}

Status Replica::execute(const std::vector<uint8_t>& command, std::vector<uint8_t>& result) {
  return pipeline_->execute(command, result);
}

void Replica::join() {
  detector_->join();
}

void Replica::run_election() {
  election_->run_election(view_.epoch());
}

void Replica::tick() {
  detector_->tick();
}

void Replica::poll() {
  io_service_.poll();
  io_service_.restart();
}

static ReplicaPtr g_replica = nullptr;
static RedisServerPtr g_redis = nullptr;

static void on_signal(int) {
  LOG_INFO("catch signal");
  if (g_redis) {
    g_redis->stop();
  }
}

void Replica::main(const Config& config, uint16_t port) {
  ::signal(SIGINT, on_signal);
  ::signal(SIGHUP, on_signal);
  ::signal(SIGTERM, on_signal);

  Status status = config.validate();
  if (!status.is_ok()) {
    LOG_FATAL("invalid configure %s", status.to_string().c_str());
  }

  KvStorePtr store(new KvStore());
  g_replica = std::make_shared<Replica>(config, store);
  status = g_replica->open();
  if (!status.is_ok()) {
    LOG_FATAL("failed to recover commit log %s", status.to_string().c_str());
  }

  TransportPtr transport = Transport::create(g_replica.get(), config.rpc_workers, config.rpc_workers);
  status = transport->start(config.peers[config.id - 1]);
  if (!status.is_ok()) {
    LOG_FATAL("failed to start transport %s", status.to_string().c_str());
  }

  for (uint64_t peer : config.peer_ids()) {
    status = transport->add_peer(peer, config.peers[peer - 1]);
    if (!status.is_ok()) {
      LOG_FATAL("invalid peer %lu: %s", peer, status.to_string().c_str());
    }
  }

  g_replica->init(transport);
  g_replica->start();

  g_redis = std::make_shared<RedisServer>(config.id, g_replica.get(), store, config.rpc_workers);
  status = g_redis->listen(port);
  if (!status.is_ok()) {
    LOG_FATAL("failed to listen for clients %s", status.to_string().c_str());
  }
  g_redis->run();

  g_replica->stop();
  transport->stop();
  g_redis = nullptr;
  g_replica = nullptr;
}

}
