#include <time.h>
#include <chrono>
#include <bully-kv/server/redis_server.h>
#include <bully-kv/server/redis_session.h>
#include <bully-kv/server/replica.h>
#include <bully-kv/common/log.h>

namespace bully {

static const int kMaxAttempts = 3;
static const uint32_t kRetryIntervalMs = 500;

RedisServer::RedisServer(uint64_t node_id, Replica* replica, KvStorePtr store, uint32_t workers)
    : node_id_(node_id),
      replica_(replica),
      store_(std::move(store)),
      worker_count_(workers),
      // request ids must not repeat across restarts, the store remembers the old ones
      next_request_id_(static_cast<uint64_t>(time(nullptr)) << 24),
      acceptor_(io_service_) {
}

RedisServer::~RedisServer() {
  stop();
}

Status RedisServer::listen(uint16_t port) {
  auto address = boost::asio::ip::address::from_string("0.0.0.0");
  auto endpoint = boost::asio::ip::tcp::endpoint(address, port);

  boost::system::error_code ec;
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor_.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    return Status::io_error(ec.message().c_str());
  }
  LOG_INFO("serving redis clients on port %d", port);
  return Status::ok();
}

void RedisServer::run() {
  work_.reset(new boost::asio::io_service::work(workers_));
  for (uint32_t i = 0; i < worker_count_; ++i) {
    threads_.push_back(std::thread([this]() {
      this->workers_.run();
    }));
  }

  start_accept();
  io_service_.run();
}

void RedisServer::stop() {
  boost::system::error_code ignored;
  acceptor_.close(ignored);
  io_service_.stop();

  work_.reset();
  workers_.stop();
  for (std::thread& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
}

void RedisServer::start_accept() {
  RedisSessionPtr session(new RedisSession(this, io_service_));

  acceptor_.async_accept(session->socket(), [this, session](const boost::system::error_code& error) {
    if (error) {
      LOG_DEBUG("accept error %s", error.message().c_str());
      return;
    }
    this->start_accept();
    session->start();
  });
}

void RedisServer::set(std::string key, std::string value, const ReplyCallback& callback) {
  KvCommand command;
  command.node_id = node_id_;
  command.request_id = next_request_id_++;
  command.type = KvCommand::kSet;
  command.strs.push_back(std::move(key));
  command.strs.push_back(std::move(value));
  submit(command, callback);
}

void RedisServer::del(std::vector<std::string> keys, const ReplyCallback& callback) {
  KvCommand command;
  command.node_id = node_id_;
  command.request_id = next_request_id_++;
  command.type = KvCommand::kDel;
  command.strs = std::move(keys);
  submit(command, callback);
}

void RedisServer::submit(const KvCommand& command, const ReplyCallback& callback) {
  std::vector<uint8_t> data = KvStore::encode(command);
  Replica* replica = replica_;
  boost::asio::io_service& io_service = io_service_;

  workers_.post([replica, data, callback, &io_service]() {
    std::vector<uint8_t> result;
    Status status;
    // a retry reuses the request id, so a command applied before its reply got lost is not applied twice
    for (int attempt = 1; attempt <= kMaxAttempts; ++attempt) {
      result.clear();
      status = replica->execute(data, result);
      if (status.is_ok() || !status.is_retryable() || attempt == kMaxAttempts) {
        break;
      }
      LOG_DEBUG("execute attempt %d failed %s", attempt, status.to_string().c_str());
      std::this_thread::sleep_for(std::chrono::milliseconds(kRetryIntervalMs));
    }

    std::string reply(result.begin(), result.end());
    io_service.post([callback, status, reply]() {
      callback(status, reply);
    });
  });
}

}
