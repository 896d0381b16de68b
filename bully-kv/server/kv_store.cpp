#include <ctype.h>
#include <algorithm>
#include <bully-kv/server/kv_store.h>
#include <bully-kv/common/log.h>

namespace bully {

namespace shared {

static const char* ok = "+OK\r\n";

}

struct KvSnapshot {
  std::unordered_map<std::string, std::string> key_values;
  std::unordered_map<std::string, std::string> applied;
  MSGPACK_DEFINE (key_values, applied);
};

static bool char_equal(char a, char b, bool nocase) {
  if (nocase) {
    return tolower((unsigned char) a) == tolower((unsigned char) b);
  }
  return a == b;
}

// Matches c against the class starting after '['. *consumed is set to the
// class length including the closing ']', an unterminated class runs to the
// end of the pattern.
static bool match_class(const char* p, int len, char c, bool nocase, int* consumed) {
  int i = 0;
  bool negate = i < len && p[i] == '^';
  if (negate) {
    i++;
  }

  bool match = false;
  while (i < len && p[i] != ']') {
    if (p[i] == '\\' && i + 1 < len) {
      match |= p[i + 1] == c;
      i += 2;
    } else if (i + 2 < len && p[i + 1] == '-') {
      int lo = p[i];
      int hi = p[i + 2];
      int ch = (unsigned char) c;
      if (lo > hi) {
        std::swap(lo, hi);
      }
      if (nocase) {
        lo = tolower(lo);
        hi = tolower(hi);
        ch = tolower(ch);
      }
      match |= ch >= lo && ch <= hi;
      i += 3;
    } else {
      match |= char_equal(p[i], c, nocase);
      i++;
    }
  }
  *consumed = i < len ? i + 1 : i;
  return negate ? !match : match;
}

// glob matching as in the redis KEYS command, with classes and backslash escapes
int string_match_len(const char* pattern, int patternLen, const char* string, int stringLen, int nocase) {
  int p = 0;
  int s = 0;
  while (p < patternLen) {
    char token = pattern[p];
    if (token == '*') {
      while (p < patternLen && pattern[p] == '*') {
        p++;
      }
      if (p == patternLen) {
        return 1;
      }
      for (int from = s; from < stringLen; ++from) {
        if (string_match_len(pattern + p, patternLen - p, string + from, stringLen - from, nocase)) {
          return 1;
        }
      }
      return 0;
    }

    if (s == stringLen) {
      return 0;
    }

    if (token == '?') {
      p++;
    } else if (token == '[') {
      int consumed = 0;
      if (!match_class(pattern + p + 1, patternLen - p - 1, string[s], nocase != 0, &consumed)) {
        return 0;
      }
      p += 1 + consumed;
    } else {
      if (token == '\\' && p + 1 < patternLen) {
        p++;
      }
      if (!char_equal(pattern[p], string[s], nocase != 0)) {
        return 0;
      }
      p++;
    }
    s++;
  }
  return s == stringLen ? 1 : 0;
}

std::vector<uint8_t> KvStore::encode(const KvCommand& command) {
  msgpack::sbuffer sbuf;
  msgpack::pack(sbuf, command);
  return std::vector<uint8_t>(sbuf.data(), sbuf.data() + sbuf.size());
}

Status KvStore::apply(const proto::Commit& commit, std::vector<uint8_t>& result) {
  KvCommand command;
  try {
    msgpack::object_handle oh = msgpack::unpack((const char*) commit.command.data(), commit.command.size());
    oh.get().convert(command);
  }
  catch (std::exception& e) {
    LOG_ERROR("bad command in commit %lu: %s", commit.id, e.what());
    return Status::invalid_argument("undecodable command");
  }

  std::string request = std::to_string(command.node_id) + ":" + std::to_string(command.request_id);
  std::string reply;

  std::lock_guard<std::mutex> guard(mutex_);
  auto it = applied_.find(request);
  if (it != applied_.end()) {
    LOG_DEBUG("commit %lu repeats request %s", commit.id, request.c_str());
    result.assign(it->second.begin(), it->second.end());
    return Status::ok();
  }

  switch (command.type) {
    case KvCommand::kSet: {
      if (command.strs.size() != 2) {
        return Status::invalid_argument("set takes a key and a value");
      }
      key_values_[command.strs[0]] = command.strs[1];
      reply = shared::ok;
      break;
    }
    case KvCommand::kDel: {
      size_t removed = 0;
      for (const std::string& key : command.strs) {
        removed += key_values_.erase(key);
      }
      reply = ":" + std::to_string(removed) + "\r\n";
      break;
    }
    default: {
      LOG_ERROR("not supported type %d", command.type);
      return Status::not_supported("unknown command type");
    }
  }

  applied_[request] = reply;
  result.assign(reply.begin(), reply.end());
  return Status::ok();
}

Status KvStore::snapshot(std::vector<uint8_t>& data) {
  std::lock_guard<std::mutex> guard(mutex_);
  KvSnapshot snap;
  snap.key_values = key_values_;
  snap.applied = applied_;

  msgpack::sbuffer sbuf;
  msgpack::pack(sbuf, snap);
  data.assign(sbuf.data(), sbuf.data() + sbuf.size());
  return Status::ok();
}

Status KvStore::restore(const std::vector<uint8_t>& data) {
  KvSnapshot snap;
  try {
    msgpack::object_handle oh = msgpack::unpack((const char*) data.data(), data.size());
    oh.get().convert(snap);
  } catch (std::exception& e) {
    LOG_WARN("invalid snapshot %s", e.what());
    return Status::io_error("invalid snapshot");
  }

  std::lock_guard<std::mutex> guard(mutex_);
  std::swap(snap.key_values, key_values_);
  std::swap(snap.applied, applied_);
  return Status::ok();
}

bool KvStore::get(const std::string& key, std::string& value) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = key_values_.find(key);
  if (it == key_values_.end()) {
    return false;
  }
  value = it->second;
  return true;
}

void KvStore::keys(const char* pattern, int len, std::vector<std::string>& keys) {
  std::lock_guard<std::mutex> guard(mutex_);
  for (auto it = key_values_.begin(); it != key_values_.end(); ++it) {
    if (string_match_len(pattern, len, it->first.c_str(), static_cast<int>(it->first.size()), 0)) {
      keys.push_back(it->first);
    }
  }
}

}
