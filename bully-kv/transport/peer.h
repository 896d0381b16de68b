#pragma once
#include <stdint.h>
#include <memory>
#include <string>
#include <bully-kv/bully/proto.h>
#include <bully-kv/common/status.h>

namespace bully {

// client side of one remote replica
class Peer {
 public:
  virtual ~Peer() = default;

  // one blocking round trip on a fresh connection
  virtual Status call(const proto::Message& req, uint32_t timeout_ms, proto::Message& resp) = 0;

  virtual uint64_t id() const = 0;

  static Status create(uint64_t peer, const std::string& peer_str, std::shared_ptr<Peer>& out);
};
typedef std::shared_ptr<Peer> PeerPtr;

}
