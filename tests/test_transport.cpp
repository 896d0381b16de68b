#include <chrono>
#include <thread>
#include <gtest/gtest.h>
#include <bully-kv/transport/transport.h>

using namespace bully;

namespace {

// echoes the payload, refuses requests carrying commit id 7
class EchoHandler : public RpcHandler {
 public:
  explicit EchoHandler(uint64_t id, uint32_t delay_ms = 0)
      : id_(id),
        delay_ms_(delay_ms) {
  }

  void handle(const proto::Message& req, proto::Message& resp) final {
    if (delay_ms_ > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
    }
    resp.payload = req.payload;
    resp.commit_id = req.commit_id + 1;
    resp.reject = req.commit_id == 7;
  }

  uint64_t node_id() const final {
    return id_;
  }

 private:
  uint64_t id_;
  uint32_t delay_ms_;
};

const char* kHost1 = "127.0.0.1:29101";
const char* kHost2 = "127.0.0.1:29102";
const char* kSlowHost = "127.0.0.1:29103";
const char* kClosed = "127.0.0.1:29109";

}

class TransportTest : public ::testing::Test {
 protected:
  void SetUp() final {
    transport1_ = Transport::create(&handler1_, 2, 2);
    transport2_ = Transport::create(&handler2_, 2, 2);
    ASSERT_TRUE(transport1_->start(kHost1).is_ok());
    ASSERT_TRUE(transport2_->start(kHost2).is_ok());
    ASSERT_TRUE(transport1_->add_peer(2, kHost2).is_ok());
    ASSERT_TRUE(transport1_->add_peer(3, kClosed).is_ok());
    ASSERT_TRUE(transport2_->add_peer(1, kHost1).is_ok());
  }

  void TearDown() final {
    transport1_->stop();
    transport2_->stop();
  }

  EchoHandler handler1_{1};
  EchoHandler handler2_{2};
  TransportPtr transport1_;
  TransportPtr transport2_;
};

TEST_F(TransportTest, call) {
  proto::Message req;
  req.type = proto::MsgGetCommits;
  req.from = 1;
  req.commit_id = 41;
  req.payload = std::vector<uint8_t>{'p', 'i', 'n', 'g'};

  proto::Message resp;
  Status status = transport1_->call(2, req, 1000, resp);
  ASSERT_TRUE(status.is_ok()) << status.to_string();
  ASSERT_EQ(resp.type, proto::MsgGetCommitsResp);
  ASSERT_EQ(resp.from, 2);
  ASSERT_EQ(resp.commit_id, 42);
  ASSERT_EQ(resp.payload, req.payload);

  // calls flow both ways
  req.from = 2;
  status = transport2_->call(1, req, 1000, resp);
  ASSERT_TRUE(status.is_ok()) << status.to_string();
  ASSERT_EQ(resp.from, 1);
}

TEST_F(TransportTest, unknown_and_closed_peers) {
  proto::Message req;
  req.type = proto::MsgHeartbeat;
  req.from = 1;

  proto::Message resp;
  ASSERT_TRUE(transport1_->call(3, req, 500, resp).is_unreachable());
  ASSERT_TRUE(transport1_->call(9, req, 500, resp).is_unreachable());

  ASSERT_FALSE(transport1_->add_peer(4, "no-port").is_ok());
}

TEST_F(TransportTest, multicall) {
  proto::Message req;
  req.type = proto::MsgHeartbeat;
  req.from = 1;

  std::vector<proto::MessagePtr> responses;
  size_t accepted = transport1_->multicall({2, 3}, req, 500, 2000, 2, responses);
  ASSERT_EQ(accepted, 1);
  ASSERT_EQ(responses.size(), 1);
  ASSERT_EQ(responses[0]->from, 2);

  // a refusal is a response, not an acceptance
  req.commit_id = 7;
  responses.clear();
  accepted = transport1_->multicall({2}, req, 500, 2000, 1, responses);
  ASSERT_EQ(accepted, 0);
  ASSERT_EQ(responses.size(), 1);
  ASSERT_TRUE(responses[0]->reject);
}

TEST_F(TransportTest, multicall_returns_at_quorum) {
  EchoHandler slow_handler(4, 1000);
  TransportPtr slow = Transport::create(&slow_handler, 2, 2);
  ASSERT_TRUE(slow->start(kSlowHost).is_ok());
  ASSERT_TRUE(transport1_->add_peer(4, kSlowHost).is_ok());

  proto::Message req;
  req.type = proto::MsgHeartbeat;
  req.from = 1;

  // the slow peer is alive and will answer, but one acceptance is enough
  std::vector<proto::MessagePtr> responses;
  auto begin = std::chrono::steady_clock::now();
  size_t accepted = transport1_->multicall({4, 2}, req, 3000, 5000, 1, responses);
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin);

  ASSERT_EQ(accepted, 1);
  ASSERT_EQ(responses.size(), 1);
  ASSERT_EQ(responses[0]->from, 2);
  ASSERT_LT(elapsed.count(), 800);

  // waiting for both takes as long as the slow peer
  responses.clear();
  accepted = transport1_->multicall({4, 2}, req, 3000, 5000, 2, responses);
  ASSERT_EQ(accepted, 2);
  ASSERT_EQ(responses.size(), 2);

  slow->stop();
}
