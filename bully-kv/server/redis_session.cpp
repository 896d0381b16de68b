#include <map>
#include <utility>
#include <boost/algorithm/string.hpp>
#include <glib.h>
#include <bully-kv/server/redis_session.h>
#include <bully-kv/server/redis_server.h>
#include <bully-kv/common/log.h>

namespace bully {

static const size_t kReadBufferSize = 512 * 1024;

static const char* kPong = "+PONG\r\n";
static const char* kNil = "$-1\r\n";
static const char* kWrongType = "-WRONGTYPE Operation against a key holding the wrong kind of value\r\n";

static std::string format_reply(const char* format, const char* arg) {
  char* str = g_strdup_printf(format, arg);
  std::string reply(str);
  g_free(str);
  return reply;
}

static void append_bulk(const std::string& str, std::string& reply) {
  char* header = g_strdup_printf("$%lu\r\n", str.size());
  reply.append(header);
  g_free(header);
  reply.append(str);
  reply.append("\r\n");
}

const RedisSession::CommandSpec* RedisSession::find_command(const std::string& name) {
  static const std::map<std::string, CommandSpec> commands = {
      {"PING", {&RedisSession::ping, -1}},
      {"GET", {&RedisSession::get, 2}},
      {"SET", {&RedisSession::set, 3}},
      {"DEL", {&RedisSession::del, -2}},
      {"KEYS", {&RedisSession::keys, 2}},
  };
  auto it = commands.find(boost::algorithm::to_upper_copy(name));
  return it == commands.end() ? nullptr : &it->second;
}

RedisSession::RedisSession(RedisServer* server, boost::asio::io_service& io_service)
    : quit_(false),
      waiting_(false),
      writing_(false),
      server_(server),
      socket_(io_service),
      read_buffer_(kReadBufferSize),
      reader_(redisReaderCreate()) {
}

void RedisSession::start() {
  if (quit_) {
    return;
  }
  auto self = shared_from_this();
  auto buffer = boost::asio::buffer(read_buffer_.data(), read_buffer_.size());
  socket_.async_read_some(buffer, [self](const boost::system::error_code& error, size_t bytes) {
    if (error) {
      if (error != boost::asio::error::eof) {
        LOG_DEBUG("read error %s", error.message().c_str());
      }
      return;
    }
    self->feed(bytes);
  });
}

void RedisSession::feed(size_t bytes) {
  if (redisReaderFeed(reader_, (const char*) read_buffer_.data(), bytes) != REDIS_OK) {
    LOG_DEBUG("redis protocol error %s", reader_->errstr);
    quit_ = true;
    return;
  }

  // a request may span several reads, the reader keeps the partial tail
  while (true) {
    void* reply = nullptr;
    if (redisReaderGetReply(reader_, &reply) != REDIS_OK) {
      LOG_DEBUG("redis protocol error %s", reader_->errstr);
      quit_ = true;
      return;
    }
    if (reply == nullptr) {
      break;
    }
    queue_request(static_cast<const struct redisReply*>(reply));
    freeReplyObject(reply);
  }
  run_pending();
  start();
}

void RedisSession::queue_request(const struct redisReply* reply) {
  Request request;
  if (reply->type != REDIS_REPLY_ARRAY || reply->elements == 0) {
    LOG_WARN("request is not a command array, type %d", reply->type);
    request.error = kWrongType;
    pending_.push_back(std::move(request));
    return;
  }

  for (size_t i = 0; i < reply->elements; ++i) {
    const struct redisReply* element = reply->element[i];
    if (element->type != REDIS_REPLY_STRING) {
      request.error = kWrongType;
      break;
    }
    request.args.emplace_back(element->str, element->len);
  }
  pending_.push_back(std::move(request));
}

// commands run one at a time in arrival order, a write holds back everything behind it
void RedisSession::run_pending() {
  while (!waiting_ && !pending_.empty()) {
    Request request = std::move(pending_.front());
    pending_.pop_front();
    if (!request.error.empty()) {
      send(request.error);
    } else {
      dispatch(request.args);
    }
  }
}

void RedisSession::dispatch(const Args& args) {
  const CommandSpec* spec = find_command(args[0]);
  if (!spec) {
    send(format_reply("-ERR unknown command `%s`\r\n", args[0].c_str()));
    return;
  }

  int argc = static_cast<int>(args.size());
  if ((spec->arity > 0 && argc != spec->arity) || (spec->arity < 0 && argc < -spec->arity)) {
    std::string name = boost::algorithm::to_lower_copy(args[0]);
    send(format_reply("-ERR wrong number of arguments for '%s' command\r\n", name.c_str()));
    return;
  }
  (this->*(spec->command))(args);
}

void RedisSession::ping(const Args& args) {
  if (args.size() > 1) {
    std::string reply;
    append_bulk(args[1], reply);
    send(reply);
    return;
  }
  send(kPong);
}

void RedisSession::get(const Args& args) {
  std::string value;
  if (!server_->get(args[1], value)) {
    send(kNil);
    return;
  }
  std::string reply;
  append_bulk(value, reply);
  send(reply);
}

void RedisSession::set(const Args& args) {
  waiting_ = true;
  auto self = shared_from_this();
  server_->set(args[1], args[2], [self](const Status& status, const std::string& reply) {
    self->reply_write(status, reply);
  });
}

void RedisSession::del(const Args& args) {
  waiting_ = true;
  auto self = shared_from_this();
  std::vector<std::string> keys(args.begin() + 1, args.end());
  server_->del(std::move(keys), [self](const Status& status, const std::string& reply) {
    self->reply_write(status, reply);
  });
}

void RedisSession::keys(const Args& args) {
  std::vector<std::string> keys;
  server_->keys(args[1].data(), static_cast<int>(args[1].size()), keys);

  char* header = g_strdup_printf("*%lu\r\n", keys.size());
  std::string reply(header);
  g_free(header);
  for (const std::string& key : keys) {
    append_bulk(key, reply);
  }
  send(reply);
}

void RedisSession::reply_write(const Status& status, const std::string& reply) {
  waiting_ = false;
  if (status.is_ok()) {
    send(reply);
  } else {
    send(format_reply("-ERR %s\r\n", status.to_string().c_str()));
  }
  run_pending();
}

void RedisSession::send(const std::string& data) {
  send_buffer_.put((const uint8_t*) data.data(), static_cast<uint32_t>(data.size()));
  flush();
}

// replies queued during a write go out with the next one
void RedisSession::flush() {
  if (writing_ || !send_buffer_.readable()) {
    return;
  }
  writing_ = true;
  in_flight_.assign((const char*) send_buffer_.reader(), send_buffer_.readable_bytes());
  send_buffer_.read_bytes(send_buffer_.readable_bytes());

  auto self = shared_from_this();
  auto buffer = boost::asio::buffer(in_flight_.data(), in_flight_.size());
  boost::asio::async_write(socket_, buffer, [self](const boost::system::error_code& error, size_t bytes) {
    self->writing_ = false;
    if (error) {
      LOG_DEBUG("send error %s", error.message().c_str());
      return;
    }
    self->flush();
  });
}

}
