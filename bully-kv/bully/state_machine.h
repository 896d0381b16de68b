#pragma once
#include <memory>
#include <vector>
#include <bully-kv/common/status.h>
#include <bully-kv/bully/proto.h>

namespace bully {

// The application the commit log drives. apply must be deterministic, every
// replica applies the same commits in the same order. An apply that returns an
// error must leave the state untouched, the commit is then rolled back.
class StateMachine {
 public:
  virtual ~StateMachine() = default;

  virtual Status apply(const proto::Commit& commit, std::vector<uint8_t>& result) = 0;

  virtual Status snapshot(std::vector<uint8_t>& data) = 0;

  virtual Status restore(const std::vector<uint8_t>& data) = 0;
};
typedef std::shared_ptr<StateMachine> StateMachinePtr;

}
