#pragma once
#include <stdint.h>
#include <string>
#include <utility>

namespace bully {

class Status {
 public:
  // Create a success status.
  Status()
      : state_(nullptr) {}

  ~Status() { delete[] state_; }

  Status(const Status& s)
      : state_(s.state_ == nullptr ? nullptr : copy_state(s.state_)) {
  }

  Status& operator=(const Status& s) {
    if (state_ != s.state_) {
      delete[] state_;
      state_ = (s.state_ == nullptr) ? nullptr : copy_state(s.state_);
    }
    return *this;
  }

  Status(Status&& s)
      : state_(s.state_) {
    s.state_ = nullptr;
  }

  Status& operator=(Status&& s) {
    std::swap(state_, s.state_);
    return *this;
  }

  // wire codes, do not reorder
  enum Code {
    kOk = 0,
    kNotFound = 1,
    kNotSupported = 2,
    kInvalidArgument = 3,
    kIOError = 4,
    kUnreachable = 5,
    kNoLeader = 6,
    kConsistencyViolation = 7,
    kForwardingFailure = 8,
    kTimedOut = 9,
  };

  static Status ok() { return Status(); }

  static Status not_found(const char* msg) { return Status(kNotFound, msg); }

  static Status not_supported(const char* msg) { return Status(kNotSupported, msg); }

  static Status invalid_argument(const char* msg) { return Status(kInvalidArgument, msg); }

  // durable write or apply failed
  static Status io_error(const char* msg) { return Status(kIOError, msg); }

  static Status unreachable(const char* msg) { return Status(kUnreachable, msg); }

  static Status no_leader(const char* msg) { return Status(kNoLeader, msg); }

  static Status consistency_violation(const char* msg) { return Status(kConsistencyViolation, msg); }

  static Status forwarding_failure(const char* msg) { return Status(kForwardingFailure, msg); }

  static Status timed_out(const char* msg) { return Status(kTimedOut, msg); }

  // rebuilds a status received from a peer
  static Status from_code(uint8_t code, const std::string& msg);

  bool is_ok() const { return code() == kOk; }

  bool is_not_found() const { return code() == kNotFound; }

  bool is_not_supported() const { return code() == kNotSupported; }

  bool is_invalid_argument() const { return code() == kInvalidArgument; }

  bool is_io_error() const { return code() == kIOError; }

  bool is_unreachable() const { return code() == kUnreachable; }

  bool is_no_leader() const { return code() == kNoLeader; }

  bool is_consistency_violation() const { return code() == kConsistencyViolation; }

  bool is_forwarding_failure() const { return code() == kForwardingFailure; }

  bool is_timed_out() const { return code() == kTimedOut; }

  // the client may retry the request, possibly against another replica
  bool is_retryable() const {
    Code c = code();
    return c == kUnreachable || c == kNoLeader || c == kForwardingFailure || c == kTimedOut;
  }

  Code code() const {
    return (state_ == nullptr) ? kOk : static_cast<Code>(state_[4]);
  }

  // message without the code prefix
  std::string message() const;

  std::string to_string() const;

 private:
  Status(Code code, const char* msg);

  static const char* copy_state(const char* s);

  // OK status has a null state_.  Otherwise, state_ is a new[] array
  // of the following form:
  //    state_[0..3] == length of message
  //    state_[4]    == code
  //    state_[5..]  == message
  const char* state_;
};

}
