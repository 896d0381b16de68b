#pragma once
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <hiredis/hiredis.h>
#include <bully-kv/common/bytebuffer.h>
#include <bully-kv/common/status.h>

namespace bully {

class RedisServer;

// One client connection. Requests are parsed with the hiredis reader, each
// command sees its arguments as plain strings.
class RedisSession : public std::enable_shared_from_this<RedisSession> {
 public:
  explicit RedisSession(RedisServer* server, boost::asio::io_service& io_service);

  ~RedisSession() {
    redisReaderFree(reader_);
  }

  boost::asio::ip::tcp::socket& socket() {
    return socket_;
  }

  void start();

 private:
  typedef std::vector<std::string> Args;
  typedef void (RedisSession::*Command)(const Args& args);

  // a parsed command, or the error reply for one that could not be parsed
  struct Request {
    Args args;
    std::string error;
  };

  struct CommandSpec {
    Command command;
    // argument count including the command name, negative means at least -arity
    int arity;
  };

  void feed(size_t bytes);

  void queue_request(const struct redisReply* reply);

  void run_pending();

  void dispatch(const Args& args);

  void ping(const Args& args);
  void get(const Args& args);
  void set(const Args& args);
  void del(const Args& args);
  void keys(const Args& args);

  // delivers a pipeline outcome, an error status becomes an error reply
  void reply_write(const Status& status, const std::string& reply);

  void send(const std::string& data);

  void flush();

  static const CommandSpec* find_command(const std::string& name);

  bool quit_;
  // a write is in the pipeline, later commands wait for its reply
  bool waiting_;
  bool writing_;
  RedisServer* server_;
  boost::asio::ip::tcp::socket socket_;
  std::vector<uint8_t> read_buffer_;
  redisReader* reader_;
  std::deque<Request> pending_;
  ByteBuffer send_buffer_;
  std::string in_flight_;
};
typedef std::shared_ptr<RedisSession> RedisSessionPtr;

}
