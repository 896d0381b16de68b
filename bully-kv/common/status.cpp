#include <string.h>
#include <bully-kv/common/status.h>

namespace bully {

Status::Status(Code code, const char* msg) {
  uint32_t len = static_cast<uint32_t>(strlen(msg));
  char* result = new char[len + 5];
  memcpy(result, &len, sizeof(len));
  result[4] = static_cast<char>(code);
  memcpy(result + 5, msg, len);
  state_ = result;
}

const char* Status::copy_state(const char* state) {
  uint32_t size;
  memcpy(&size, state, sizeof(size));
  char* result = new char[size + 5];
  memcpy(result, state, size + 5);
  return result;
}

Status Status::from_code(uint8_t code, const std::string& msg) {
  if (code == kOk) {
    return Status::ok();
  }
  if (code > kTimedOut) {
    std::string str = "unknown status code " + std::to_string(code) + ": " + msg;
    return Status(kInvalidArgument, str.c_str());
  }
  return Status(static_cast<Code>(code), msg.c_str());
}

std::string Status::message() const {
  if (state_ == nullptr) {
    return std::string();
  }
  uint32_t length;
  memcpy(&length, state_, sizeof(length));
  return std::string(state_ + 5, length);
}

std::string Status::to_string() const {
  if (state_ == nullptr) {
    return "OK";
  }

  const char* type;
  switch (code()) {
    case kOk:type = "OK";
      break;
    case kNotFound:type = "NotFound: ";
      break;
    case kNotSupported:type = "Not implemented: ";
      break;
    case kInvalidArgument:type = "Invalid argument: ";
      break;
    case kIOError:type = "IO error: ";
      break;
    case kUnreachable:type = "Unreachable: ";
      break;
    case kNoLeader:type = "No leader: ";
      break;
    case kConsistencyViolation:type = "Consistency violation: ";
      break;
    case kForwardingFailure:type = "Forwarding failure: ";
      break;
    case kTimedOut:type = "Timed out: ";
      break;
    default:type = "Unknown code: ";
      break;
  }
  return std::string(type) + message();
}

}
