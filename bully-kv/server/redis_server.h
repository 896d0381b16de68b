#pragma once
#include <stdint.h>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <bully-kv/common/status.h>
#include <bully-kv/server/kv_store.h>

namespace bully {

class Replica;

typedef std::function<void(const Status& status, const std::string& reply)> ReplyCallback;

// Redis protocol front end. Reads are served from the local store, writes run
// through the replica's execution pipeline on a worker pool and their replies
// are delivered back on the network thread.
class RedisServer {
 public:
  explicit RedisServer(uint64_t node_id, Replica* replica, KvStorePtr store, uint32_t workers);

  ~RedisServer();

  Status listen(uint16_t port);

  // serves clients until stop
  void run();

  void stop();

  void set(std::string key, std::string value, const ReplyCallback& callback);

  void del(std::vector<std::string> keys, const ReplyCallback& callback);

  bool get(const std::string& key, std::string& value) {
    return store_->get(key, value);
  }

  void keys(const char* pattern, int len, std::vector<std::string>& keys) {
    store_->keys(pattern, len, keys);
  }

  boost::asio::io_service& io_service() {
    return io_service_;
  }

 private:
  void start_accept();

  void submit(const KvCommand& command, const ReplyCallback& callback);

  uint64_t node_id_;
  Replica* replica_;
  KvStorePtr store_;
  uint32_t worker_count_;
  std::atomic<uint64_t> next_request_id_;

  boost::asio::io_service io_service_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::io_service workers_;
  std::unique_ptr<boost::asio::io_service::work> work_;
  std::vector<std::thread> threads_;
};
typedef std::shared_ptr<RedisServer> RedisServerPtr;

}
