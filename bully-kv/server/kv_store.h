#pragma once
#include <stdint.h>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <msgpack.hpp>
#include <bully-kv/bully/state_machine.h>

namespace bully {

// a client write as stored in the commit log
struct KvCommand {
  enum Type : uint8_t {
    kSet = 0,
    kDel = 1,
  };

  KvCommand()
      : node_id(0),
        request_id(0),
        type(kSet) {
  }

  uint64_t node_id;     // replica that accepted the request from its client
  uint64_t request_id;  // unique per node_id, retries reuse it
  uint8_t type;
  std::vector<std::string> strs;
  MSGPACK_DEFINE (node_id, request_id, type, strs);
};

// The key-value state machine. Results are complete RESP replies so they can
// be relayed to redis clients untouched, whichever replica the write ran on.
class KvStore : public StateMachine {
 public:
  explicit KvStore() = default;

  ~KvStore() final = default;

  // a command whose request id was already applied returns the first reply again
  Status apply(const proto::Commit& commit, std::vector<uint8_t>& result) final;

  Status snapshot(std::vector<uint8_t>& data) final;

  Status restore(const std::vector<uint8_t>& data) final;

  bool get(const std::string& key, std::string& value);

  // keys matching a glob-style pattern
  void keys(const char* pattern, int len, std::vector<std::string>& keys);

  static std::vector<uint8_t> encode(const KvCommand& command);

 private:
  std::mutex mutex_;
  std::unordered_map<std::string, std::string> key_values_;
  // "<node id>:<request id>" -> reply
  std::unordered_map<std::string, std::string> applied_;
};
typedef std::shared_ptr<KvStore> KvStorePtr;

int string_match_len(const char* pattern, int patternLen, const char* string, int stringLen, int nocase);

}
