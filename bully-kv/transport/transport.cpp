#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <boost/asio.hpp>
#include <bully-kv/transport/transport.h>
#include <bully-kv/transport/peer.h>
#include <bully-kv/transport/rpc_server.h>
#include <bully-kv/common/log.h>

namespace bully {

// shared between multicall and the callbacks that outlive it
struct CallGroup {
  CallGroup()
      : pending(0),
        accepted(0) {
  }

  std::mutex mutex;
  std::condition_variable cv;
  size_t pending;
  size_t accepted;
  std::vector<proto::MessagePtr> responses;
};

size_t Transport::multicall(const std::vector<uint64_t>& to,
                            const proto::Message& req,
                            uint32_t call_timeout_ms,
                            uint32_t wait_ms,
                            size_t required,
                            std::vector<proto::MessagePtr>& responses) {
  std::shared_ptr<CallGroup> group(new CallGroup());
  group->pending = to.size();

  for (uint64_t id : to) {
    proto::MessagePtr msg(new proto::Message(req));
    msg->to = id;
    async_call(id, msg, call_timeout_ms, [group](const Status& status, proto::MessagePtr resp) {
      std::lock_guard<std::mutex> guard(group->mutex);
      group->pending--;
      if (status.is_ok()) {
        group->responses.push_back(resp);
        if (!resp->reject && resp->code == Status::kOk) {
          group->accepted++;
        }
      }
      group->cv.notify_all();
    });
  }

  std::unique_lock<std::mutex> lock(group->mutex);
  group->cv.wait_for(lock, std::chrono::milliseconds(wait_ms), [group, required]() {
    return group->pending == 0 || group->accepted >= required;
  });
  responses = group->responses;
  return group->accepted;
}

class TransportImpl : public Transport {
 public:
  explicit TransportImpl(RpcHandler* handler, uint32_t server_workers, uint32_t client_workers)
      : handler_(handler),
        id_(handler->node_id()),
        server_workers_(server_workers),
        client_workers_(client_workers),
        stopped_(false) {
  }

  ~TransportImpl() final {
    stop();
  }

  Status start(const std::string& host) final {
    Status status = RpcServer::create((void*) &io_service_, (void*) &workers_, host, handler_, server_);
    if (!status.is_ok()) {
      return status;
    }
    server_->start();

    io_work_.reset(new boost::asio::io_service::work(io_service_));
    worker_work_.reset(new boost::asio::io_service::work(workers_));
    client_work_.reset(new boost::asio::io_service::work(clients_));

    io_thread_ = std::thread([this]() {
      this->io_service_.run();
    });
    for (uint32_t i = 0; i < server_workers_; ++i) {
      threads_.push_back(std::thread([this]() {
        this->workers_.run();
      }));
    }
    for (uint32_t i = 0; i < client_workers_; ++i) {
      threads_.push_back(std::thread([this]() {
        this->clients_.run();
      }));
    }
    return Status::ok();
  }

  Status add_peer(uint64_t id, const std::string& peer) final {
    LOG_DEBUG("node:%lu, peer:%lu, addr:%s", id_, id, peer.c_str());
    std::lock_guard<std::mutex> guard(mutex_);

    auto it = peers_.find(id);
    if (it != peers_.end()) {
      LOG_DEBUG("peer already exists %lu", id);
      return Status::ok();
    }

    PeerPtr p;
    Status status = Peer::create(id, peer, p);
    if (!status.is_ok()) {
      return status;
    }
    peers_[id] = p;
    return Status::ok();
  }

  Status call(uint64_t to, const proto::Message& req, uint32_t timeout_ms, proto::Message& resp) final {
    PeerPtr peer = find_peer(to);
    if (!peer) {
      LOG_DEBUG("ignored message %s (sent to unknown peer %lu)", proto::msg_type_to_string(req.type), to);
      return Status::unreachable("unknown peer");
    }
    return peer->call(req, timeout_ms, resp);
  }

  void async_call(uint64_t to, proto::MessagePtr req, uint32_t timeout_ms, const CallCallback& callback) final {
    PeerPtr peer = find_peer(to);
    if (!peer) {
      callback(Status::unreachable("unknown peer"), nullptr);
      return;
    }

    clients_.post([peer, req, timeout_ms, callback]() {
      proto::MessagePtr resp(new proto::Message());
      Status status = peer->call(*req, timeout_ms, *resp);
      callback(status, resp);
    });
  }

  void stop() final {
    {
      std::lock_guard<std::mutex> guard(mutex_);
      if (stopped_) {
        return;
      }
      stopped_ = true;
    }

    if (server_) {
      server_->stop();
    }
    io_work_.reset();
    worker_work_.reset();
    client_work_.reset();
    io_service_.stop();
    workers_.stop();
    clients_.stop();

    if (io_thread_.joinable()) {
      io_thread_.join();
    }
    for (std::thread& thread : threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
    LOG_DEBUG("transport stopped");
  }

 private:
  PeerPtr find_peer(uint64_t id) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = peers_.find(id);
    if (it == peers_.end()) {
      return nullptr;
    }
    return it->second;
  }

  RpcHandler* handler_;
  uint64_t id_;
  uint32_t server_workers_;
  uint32_t client_workers_;

  boost::asio::io_service io_service_;  // sockets of the rpc server
  boost::asio::io_service workers_;     // inbound request handlers
  boost::asio::io_service clients_;     // outbound async calls
  std::unique_ptr<boost::asio::io_service::work> io_work_;
  std::unique_ptr<boost::asio::io_service::work> worker_work_;
  std::unique_ptr<boost::asio::io_service::work> client_work_;
  std::thread io_thread_;
  std::vector<std::thread> threads_;

  std::mutex mutex_;
  std::unordered_map<uint64_t, PeerPtr> peers_;
  bool stopped_;

  RpcServerPtr server_;
};

std::shared_ptr<Transport> Transport::create(RpcHandler* handler, uint32_t server_workers, uint32_t client_workers) {
  std::shared_ptr<TransportImpl> impl(new TransportImpl(handler, server_workers, client_workers));
  return impl;
}

}
