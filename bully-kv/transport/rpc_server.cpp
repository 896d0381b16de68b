#include <arpa/inet.h>
#include <boost/asio.hpp>
#include <bully-kv/transport/rpc_server.h>
#include <bully-kv/common/bytebuffer.h>
#include <bully-kv/common/log.h>
#include <bully-kv/common/util.h>
#include <bully-kv/transport/proto.h>

namespace bully {

class AsioServer;
class ServerSession : public std::enable_shared_from_this<ServerSession> {
 public:
  explicit ServerSession(boost::asio::io_service& io_service, AsioServer* server)
      : socket(io_service),
        io_service_(io_service),
        server_(server) {
  }

  void start_read_meta() {
    meta_.type = 0;
    meta_.len = 0;
    auto self = shared_from_this();
    auto buffer = boost::asio::buffer(&meta_, sizeof(meta_));
    auto handler = [self](const boost::system::error_code& error, std::size_t bytes) {
      if (bytes == 0) {
        return;
      }
      if (error) {
        LOG_DEBUG("read error %s", error.message().c_str());
        return;
      }

      if (bytes != sizeof(self->meta_)) {
        LOG_DEBUG("invalid data len %lu", bytes);
        return;
      }
      self->start_read_message();
    };

    boost::asio::async_read(socket, buffer, boost::asio::transfer_exactly(sizeof(meta_)), handler);
  }

  void start_read_message() {
    uint32_t len = ntohl(meta_.len);
    if (meta_.type != TransportTypeRequest || len > MaxTransportMessageLen) {
      LOG_WARN("unknown msg type %d, len = %u", meta_.type, len);
      return;
    }

    buffer_.resize(len);
    auto self = shared_from_this();
    auto buffer = boost::asio::buffer(buffer_.data(), len);
    auto handler = [self, len](const boost::system::error_code& error, std::size_t bytes) {
      if (error || bytes == 0) {
        LOG_DEBUG("read error %s", error.message().c_str());
        return;
      }

      if (bytes != len) {
        LOG_DEBUG("invalid data len %lu, %u", bytes, len);
        return;
      }
      self->decode_message(len);
    };
    boost::asio::async_read(socket, buffer, boost::asio::transfer_exactly(len), handler);
  }

  void decode_message(uint32_t len) {
    proto::MessagePtr msg(new proto::Message());
    try {
      msgpack::object_handle oh = msgpack::unpack((const char*) buffer_.data(), len);
      oh.get().convert(*msg);
    }
    catch (std::exception& e) {
      LOG_ERROR("bad message %s, size = %u", e.what(), len);
      return;
    }

    if (msg->is_response_msg() || msg->type >= proto::MsgTypeSize) {
      LOG_WARN("dropped %s from [%lu], not a request", proto::msg_type_to_string(msg->type), msg->from);
      return;
    }
    on_receive_request(std::move(msg));
  }

  void on_receive_request(proto::MessagePtr msg);

  // called from a worker thread, the write itself happens on the socket's io_service
  void send_response(proto::MessagePtr resp) {
    auto self = shared_from_this();
    io_service_.post([self, resp]() {
      msgpack::sbuffer sbuf;
      msgpack::pack(sbuf, *resp);
      self->out_.put_frame(TransportTypeResponse, (const uint8_t*) sbuf.data(), (uint32_t) sbuf.size());
      self->start_write();
    });
  }

  boost::asio::ip::tcp::socket socket;

 private:
  void start_write() {
    if (!out_.readable()) {
      out_.reset();
      start_read_meta();
      return;
    }

    auto self = shared_from_this();
    auto buffer = boost::asio::buffer(out_.reader(), out_.readable_bytes());
    auto handler = [self](const boost::system::error_code& error, std::size_t bytes) {
      if (error || bytes == 0) {
        LOG_DEBUG("send error %s", error.message().c_str());
        return;
      }
      self->out_.read_bytes(static_cast<uint32_t>(bytes));
      self->start_write();
    };
    boost::asio::async_write(socket, buffer, handler);
  }

  boost::asio::io_service& io_service_;
  AsioServer* server_;
  TransportMeta meta_;
  std::vector<uint8_t> buffer_;
  ByteBuffer out_;
};
typedef std::shared_ptr<ServerSession> ServerSessionPtr;

class AsioServer : public RpcServer {
 public:
  explicit AsioServer(boost::asio::io_service& io_service,
                      boost::asio::io_service& workers,
                      RpcHandler* handler)
      : io_service_(io_service),
        workers_(workers),
        acceptor_(io_service),
        handler_(handler) {
  }

  ~AsioServer() final {
  }

  Status listen(const std::string& host) {
    std::string addr;
    uint16_t port;
    if (!parse_host(host, addr, port)) {
      return Status::invalid_argument("invalid listen address");
    }

    boost::system::error_code ec;
    auto address = boost::asio::ip::address::from_string(addr, ec);
    if (ec) {
      return Status::invalid_argument(ec.message().c_str());
    }
    auto endpoint = boost::asio::ip::tcp::endpoint(address, port);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
      acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
      acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
      acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
      LOG_ERROR("listen at %s error %s", host.c_str(), ec.message().c_str());
      return Status::io_error(ec.message().c_str());
    }
    LOG_DEBUG("listen at %s:%d", address.to_string().c_str(), port);
    return Status::ok();
  }

  void start() final {
    ServerSessionPtr session(new ServerSession(io_service_, this));
    acceptor_.async_accept(session->socket, [this, session](const boost::system::error_code& error) {
      if (error) {
        LOG_DEBUG("accept error %s", error.message().c_str());
        return;
      }

      this->start();
      session->start_read_meta();
    });
  }

  void stop() final {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
  }

  void on_request(ServerSessionPtr session, proto::MessagePtr msg) {
    RpcHandler* handler = handler_;
    workers_.post([session, msg, handler]() {
      proto::MessagePtr resp(new proto::Message());
      resp->type = proto::response_type(msg->type);
      resp->from = handler->node_id();
      resp->to = msg->from;
      handler->handle(*msg, *resp);
      session->send_response(resp);
    });
  }

 private:
  boost::asio::io_service& io_service_;
  boost::asio::io_service& workers_;
  boost::asio::ip::tcp::acceptor acceptor_;
  RpcHandler* handler_;
};

void ServerSession::on_receive_request(proto::MessagePtr msg) {
  server_->on_request(shared_from_this(), std::move(msg));
}

Status RpcServer::create(void* io_service,
                         void* workers,
                         const std::string& host,
                         RpcHandler* handler,
                         std::shared_ptr<RpcServer>& server) {
  std::shared_ptr<AsioServer> impl(new AsioServer(*(boost::asio::io_service*) io_service,
                                                  *(boost::asio::io_service*) workers,
                                                  handler));
  Status status = impl->listen(host);
  if (!status.is_ok()) {
    return status;
  }
  server = impl;
  return Status::ok();
}

}
