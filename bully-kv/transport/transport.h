#pragma once
#include <stdint.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <bully-kv/bully/proto.h>
#include <bully-kv/common/status.h>

namespace bully {

// Serves inbound calls. handle runs on a transport worker thread and may
// itself issue outbound calls.
class RpcHandler {
 public:
  virtual ~RpcHandler() = default;

  virtual void handle(const proto::Message& req, proto::Message& resp) = 0;

  virtual uint64_t node_id() const = 0;
};

typedef std::function<void(const Status& status, proto::MessagePtr resp)> CallCallback;

// Point to point request/response calls between replicas. A peer that does not
// answer within the timeout is reported as unreachable, there is no retry.
class Transport {
 public:
  virtual ~Transport() = default;

  // listens on host ("address:port") for calls from peers
  virtual Status start(const std::string& host) = 0;

  virtual Status add_peer(uint64_t id, const std::string& peer) = 0;

  virtual Status call(uint64_t to, const proto::Message& req, uint32_t timeout_ms, proto::Message& resp) = 0;

  // callback runs on a transport thread
  virtual void async_call(uint64_t to, proto::MessagePtr req, uint32_t timeout_ms, const CallCallback& callback) = 0;

  virtual void stop() = 0;

  // Sends req to every replica in to and waits until `required` of them
  // accepted it, all of them answered, or wait_ms elapsed. A response counts as
  // accepted when the call succeeded and the responder neither rejected the
  // request nor reported an error. responses holds every answer received by
  // then. Late answers are dropped.
  size_t multicall(const std::vector<uint64_t>& to,
                   const proto::Message& req,
                   uint32_t call_timeout_ms,
                   uint32_t wait_ms,
                   size_t required,
                   std::vector<proto::MessagePtr>& responses);

  static std::shared_ptr<Transport> create(RpcHandler* handler, uint32_t server_workers, uint32_t client_workers);
};
typedef std::shared_ptr<Transport> TransportPtr;

}
