#include <bully-kv/bully/proto.h>
#include <bully-kv/common/log.h>

namespace bully {

namespace proto {

const char* msg_type_to_string(MessageType type) {
  switch (type) {
    case MsgElection: {
      return "MsgElection";
    }
    case MsgElectionResp: {
      return "MsgElectionResp";
    }
    case MsgCoordinator: {
      return "MsgCoordinator";
    }
    case MsgCoordinatorResp: {
      return "MsgCoordinatorResp";
    }
    case MsgHeartbeat: {
      return "MsgHeartbeat";
    }
    case MsgHeartbeatResp: {
      return "MsgHeartbeatResp";
    }
    case MsgExecute: {
      return "MsgExecute";
    }
    case MsgExecuteResp: {
      return "MsgExecuteResp";
    }
    case MsgGetCommits: {
      return "MsgGetCommits";
    }
    case MsgGetCommitsResp: {
      return "MsgGetCommitsResp";
    }
    case MsgReplicate: {
      return "MsgReplicate";
    }
    case MsgReplicateResp: {
      return "MsgReplicateResp";
    }
    default: {
      return "unknown";
    }
  }
}

MessageType response_type(MessageType type) {
  if (type >= MsgTypeSize || type % 2 == 1) {
    LOG_ERROR("not a request message: %s", msg_type_to_string(type));
    return MsgTypeSize;
  }
  return static_cast<MessageType>(type + 1);
}

}
}
