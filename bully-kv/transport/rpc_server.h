#pragma once
#include <memory>
#include <string>
#include <bully-kv/common/status.h>
#include <bully-kv/transport/transport.h>

namespace bully {

// accepts peer connections and hands every request to the handler on the worker pool
class RpcServer {
 public:
  virtual ~RpcServer() = default;

  virtual void start() = 0;

  virtual void stop() = 0;

  // io_service runs the sockets, workers runs the handler
  static Status create(void* io_service,
                       void* workers,
                       const std::string& host,
                       RpcHandler* handler,
                       std::shared_ptr<RpcServer>& server);
};
typedef std::shared_ptr<RpcServer> RpcServerPtr;

}
