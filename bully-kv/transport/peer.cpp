#include <arpa/inet.h>
#include <boost/asio.hpp>
#include <bully-kv/transport/peer.h>
#include <bully-kv/common/bytebuffer.h>
#include <bully-kv/common/log.h>
#include <bully-kv/common/util.h>
#include <bully-kv/transport/proto.h>

namespace bully {

// One request/response exchange. Everything runs on the caller's private
// io_service, the timer closes the socket when the deadline passes.
class ClientSession {
 public:
  explicit ClientSession(boost::asio::io_service& io_service,
                         const boost::asio::ip::tcp::endpoint& endpoint,
                         uint64_t peer_id)
      : io_service_(io_service),
        socket_(io_service),
        timer_(io_service),
        endpoint_(endpoint),
        peer_id_(peer_id),
        timed_out_(false),
        done_(false) {
    meta_.type = 0;
    meta_.len = 0;
  }

  Status call(const uint8_t* data, uint32_t len, uint32_t timeout_ms, std::vector<uint8_t>& response) {
    buffer_.put_frame(TransportTypeRequest, data, len);

    timer_.expires_from_now(boost::posix_time::milliseconds(timeout_ms));
    timer_.async_wait([this](const boost::system::error_code& err) {
      if (err) {
        return;
      }
      this->timed_out_ = true;
      this->close_session();
    });

    start_connect();
    io_service_.run();

    if (timed_out_) {
      LOG_DEBUG("call [%lu] timed out after %u ms", peer_id_, timeout_ms);
      return Status::unreachable("call timed out");
    }
    if (!done_) {
      return Status::unreachable(error_.c_str());
    }
    response.swap(body_);
    return Status::ok();
  }

 private:
  void start_connect() {
    socket_.async_connect(endpoint_, [this](const boost::system::error_code& err) {
      if (err) {
        this->fail("connect", err);
        return;
      }
      this->start_write();
    });
  }

  void start_write() {
    if (!buffer_.readable()) {
      start_read_meta();
      return;
    }

    uint32_t remaining = buffer_.readable_bytes();
    auto buffer = boost::asio::buffer(buffer_.reader(), remaining);
    auto handler = [this](const boost::system::error_code& error, std::size_t bytes) {
      if (error || bytes == 0) {
        this->fail("send", error);
        return;
      }
      this->buffer_.read_bytes(static_cast<uint32_t>(bytes));
      this->start_write();
    };
    boost::asio::async_write(socket_, buffer, handler);
  }

  void start_read_meta() {
    auto buffer = boost::asio::buffer(&meta_, sizeof(meta_));
    auto handler = [this](const boost::system::error_code& error, std::size_t bytes) {
      if (error || bytes != sizeof(this->meta_)) {
        this->fail("read", error);
        return;
      }

      uint32_t len = ntohl(this->meta_.len);
      if (this->meta_.type != TransportTypeResponse || len > MaxTransportMessageLen) {
        LOG_WARN("invalid response header from [%lu], type %d, len %u", this->peer_id_, this->meta_.type, len);
        this->error_ = "invalid response header";
        this->close_session();
        return;
      }
      this->start_read_message(len);
    };
    boost::asio::async_read(socket_, buffer, boost::asio::transfer_exactly(sizeof(meta_)), handler);
  }

  void start_read_message(uint32_t len) {
    body_.resize(len);
    auto buffer = boost::asio::buffer(body_.data(), len);
    auto handler = [this, len](const boost::system::error_code& error, std::size_t bytes) {
      if (error || bytes != len) {
        this->fail("read", error);
        return;
      }
      this->done_ = true;
      this->close_session();
    };
    boost::asio::async_read(socket_, buffer, boost::asio::transfer_exactly(len), handler);
  }

  void fail(const char* op, const boost::system::error_code& error) {
    LOG_DEBUG("%s [%lu] error %s", op, peer_id_, error.message().c_str());
    error_ = std::string(op) + ": " + error.message();
    close_session();
  }

  void close_session() {
    boost::system::error_code ignored;
    socket_.close(ignored);
    timer_.cancel(ignored);
  }

  boost::asio::io_service& io_service_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::deadline_timer timer_;
  boost::asio::ip::tcp::endpoint endpoint_;
  uint64_t peer_id_;
  ByteBuffer buffer_;
  TransportMeta meta_;
  std::vector<uint8_t> body_;
  std::string error_;
  bool timed_out_;
  bool done_;
};

class PeerImpl : public Peer {
 public:
  explicit PeerImpl(uint64_t peer, const boost::asio::ip::tcp::endpoint& endpoint)
      : peer_(peer),
        endpoint_(endpoint) {
  }

  ~PeerImpl() final {
  }

  Status call(const proto::Message& req, uint32_t timeout_ms, proto::Message& resp) final {
    msgpack::sbuffer sbuf;
    msgpack::pack(sbuf, req);
    if (sbuf.size() > MaxTransportMessageLen) {
      return Status::invalid_argument("message too large");
    }

    boost::asio::io_service io_service;
    ClientSession session(io_service, endpoint_, peer_);
    std::vector<uint8_t> body;
    Status status = session.call((const uint8_t*) sbuf.data(), (uint32_t) sbuf.size(), timeout_ms, body);
    if (!status.is_ok()) {
      return status;
    }

    try {
      msgpack::object_handle oh = msgpack::unpack((const char*) body.data(), body.size());
      oh.get().convert(resp);
    }
    catch (std::exception& e) {
      LOG_ERROR("bad response from [%lu] %s, size = %lu", peer_, e.what(), body.size());
      return Status::invalid_argument("undecodable response");
    }

    if (resp.type != proto::response_type(req.type)) {
      LOG_WARN("unexpected %s from [%lu] for %s",
               proto::msg_type_to_string(resp.type),
               peer_,
               proto::msg_type_to_string(req.type));
      return Status::invalid_argument("unexpected response type");
    }
    return Status::ok();
  }

  uint64_t id() const final {
    return peer_;
  }

 private:
  uint64_t peer_;
  boost::asio::ip::tcp::endpoint endpoint_;
};

Status Peer::create(uint64_t peer, const std::string& peer_str, std::shared_ptr<Peer>& out) {
  std::string host;
  uint16_t port;
  if (!parse_host(peer_str, host, port)) {
    LOG_ERROR("invalid host %s", peer_str.c_str());
    return Status::invalid_argument("invalid peer address");
  }

  boost::system::error_code ec;
  auto address = boost::asio::ip::address::from_string(host, ec);
  if (ec) {
    LOG_ERROR("invalid address %s: %s", host.c_str(), ec.message().c_str());
    return Status::invalid_argument("invalid peer address");
  }

  out.reset(new PeerImpl(peer, boost::asio::ip::tcp::endpoint(address, port)));
  return Status::ok();
}

}
