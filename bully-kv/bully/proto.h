#pragma once
#include <stdint.h>
#include <memory>
#include <string>
#include <vector>
#include <msgpack.hpp>

namespace bully {

namespace proto {

typedef uint8_t MessageType;

// every request type is answered by the type right after it
const MessageType MsgElection = 0;          // a lower replica asks higher ones to take over
const MessageType MsgElectionResp = 1;
const MessageType MsgCoordinator = 2;       // the winner announces itself together with its commit history
const MessageType MsgCoordinatorResp = 3;
const MessageType MsgHeartbeat = 4;         // liveness probe, answered with the responder's view and latest commit id
const MessageType MsgHeartbeatResp = 5;
const MessageType MsgExecute = 6;           // client command, possibly forwarded by a follower
const MessageType MsgExecuteResp = 7;
const MessageType MsgGetCommits = 8;        // all commits after commit_id
const MessageType MsgGetCommitsResp = 9;
const MessageType MsgReplicate = 10;        // leader pushes one new commit to a follower
const MessageType MsgReplicateResp = 11;

const MessageType MsgTypeSize = 12;

const char* msg_type_to_string(MessageType type);

MessageType response_type(MessageType type);

struct Commit {
  Commit()
      : id(0) {}

  explicit Commit(uint64_t id, std::vector<uint8_t> command)
      : id(id),
        command(std::move(command)) {}

  bool operator==(const Commit& commit) const {
    return id == commit.id && command == commit.command;
  }
  bool operator!=(const Commit& commit) const {
    return !(*this == commit);
  }

  uint64_t id;
  std::vector<uint8_t> command;
  MSGPACK_DEFINE (id, command);
};
typedef std::shared_ptr<Commit> CommitPtr;

struct Message {
  Message()
      : type(MsgHeartbeat),
        from(0),
        to(0),
        leader_id(0),
        commit_id(0),
        forwarded(false),
        reject(false),
        code(0) {
  }

  bool is_response_msg() const {
    return type % 2 == 1;
  }

  MessageType type;
  uint64_t from;
  uint64_t to;
  // Coordinator: the announced leader; responses: the leader the responder follows, 0 if none
  uint64_t leader_id;
  // GetCommits: fetch commits after this id; responses: the responder's latest commit id
  uint64_t commit_id;
  // Coordinator: full history; Replicate: the new commit; GetCommitsResp: the requested commits
  std::vector<Commit> commits;
  // Execute: the command; ExecuteResp: the result
  std::vector<uint8_t> payload;
  bool forwarded;
  // the responder refused the request, e.g. a replicate from a replica it does not follow
  bool reject;
  // Status::Code of the remote operation and its message
  uint8_t code;
  std::string error;
  MSGPACK_DEFINE (type, from, to, leader_id, commit_id, commits, payload, forwarded, reject, code, error);
};
typedef std::shared_ptr<Message> MessagePtr;

// serialized state machine at commit_id
struct Snapshot {
  Snapshot()
      : commit_id(0) {}

  bool is_empty() const {
    return commit_id == 0;
  }

  uint64_t commit_id;
  std::vector<uint8_t> data;
  MSGPACK_DEFINE (commit_id, data);
};
typedef std::shared_ptr<Snapshot> SnapshotPtr;

}
}
