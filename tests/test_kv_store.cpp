#include <algorithm>
#include <gtest/gtest.h>
#include <bully-kv/server/kv_store.h>

using namespace bully;

static proto::Commit make_commit(uint64_t id, uint64_t request, uint8_t type, std::vector<std::string> strs) {
  KvCommand command;
  command.node_id = 1;
  command.request_id = request;
  command.type = type;
  command.strs = std::move(strs);
  return proto::Commit(id, KvStore::encode(command));
}

static std::string apply(KvStore& store, const proto::Commit& commit) {
  std::vector<uint8_t> result;
  Status status = store.apply(commit, result);
  EXPECT_TRUE(status.is_ok()) << status.to_string();
  return std::string(result.begin(), result.end());
}

TEST(KvStore, set_get_del) {
  KvStore store;
  ASSERT_EQ(apply(store, make_commit(1, 1, KvCommand::kSet, {"a", "1"})), "+OK\r\n");
  ASSERT_EQ(apply(store, make_commit(2, 2, KvCommand::kSet, {"b", "2"})), "+OK\r\n");

  std::string value;
  ASSERT_TRUE(store.get("a", value));
  ASSERT_EQ(value, "1");

  ASSERT_EQ(apply(store, make_commit(3, 3, KvCommand::kDel, {"a", "missing"})), ":1\r\n");
  ASSERT_FALSE(store.get("a", value));
  ASSERT_TRUE(store.get("b", value));
}

TEST(KvStore, repeated_request_applies_once) {
  KvStore store;
  ASSERT_EQ(apply(store, make_commit(1, 7, KvCommand::kDel, {"x"})), ":0\r\n");
  ASSERT_EQ(apply(store, make_commit(2, 8, KvCommand::kSet, {"x", "1"})), "+OK\r\n");

  // the retry of request 7 must not delete x again
  ASSERT_EQ(apply(store, make_commit(3, 7, KvCommand::kDel, {"x"})), ":0\r\n");
  std::string value;
  ASSERT_TRUE(store.get("x", value));
}

TEST(KvStore, bad_command_leaves_state_untouched) {
  KvStore store;
  std::vector<uint8_t> result;

  proto::Commit garbage(1, std::vector<uint8_t>{0xc1, 0xc1});
  ASSERT_TRUE(store.apply(garbage, result).is_invalid_argument());

  ASSERT_TRUE(store.apply(make_commit(1, 1, KvCommand::kSet, {"only-key"}), result).is_invalid_argument());
  ASSERT_TRUE(store.apply(make_commit(1, 2, 9, {"k"}), result).is_not_supported());

  std::vector<std::string> keys;
  store.keys("*", 1, keys);
  ASSERT_TRUE(keys.empty());

  // a request that failed may be applied later
  ASSERT_EQ(apply(store, make_commit(1, 1, KvCommand::kSet, {"k", "v"})), "+OK\r\n");
}

TEST(KvStore, snapshot_restore) {
  KvStore store;
  apply(store, make_commit(1, 1, KvCommand::kSet, {"a", "1"}));
  apply(store, make_commit(2, 2, KvCommand::kSet, {"b", "2"}));

  std::vector<uint8_t> data;
  ASSERT_TRUE(store.snapshot(data).is_ok());

  KvStore restored;
  ASSERT_TRUE(restored.restore(data).is_ok());
  std::string value;
  ASSERT_TRUE(restored.get("b", value));
  ASSERT_EQ(value, "2");

  // applied request ids travel with the snapshot
  ASSERT_EQ(apply(restored, make_commit(3, 2, KvCommand::kSet, {"b", "changed"})), "+OK\r\n");
  ASSERT_TRUE(restored.get("b", value));
  ASSERT_EQ(value, "2");

  ASSERT_TRUE(restored.restore(std::vector<uint8_t>{0xc1}).is_io_error());
}

TEST(KvStore, keys_pattern) {
  KvStore store;
  apply(store, make_commit(1, 1, KvCommand::kSet, {"user:1", "a"}));
  apply(store, make_commit(2, 2, KvCommand::kSet, {"user:2", "b"}));
  apply(store, make_commit(3, 3, KvCommand::kSet, {"order:1", "c"}));

  std::vector<std::string> keys;
  store.keys("user:*", 6, keys);
  std::sort(keys.begin(), keys.end());
  ASSERT_EQ(keys, std::vector<std::string>({"user:1", "user:2"}));

  keys.clear();
  store.keys("*:1", 3, keys);
  ASSERT_EQ(keys.size(), 2);
}

TEST(KvStore, string_match) {
  ASSERT_TRUE(string_match_len("h?llo", 5, "hello", 5, 0));
  ASSERT_TRUE(string_match_len("h[ae]llo", 8, "hallo", 5, 0));
  ASSERT_FALSE(string_match_len("h[^e]llo", 8, "hello", 5, 0));
  ASSERT_TRUE(string_match_len("h[a-c]llo", 9, "hbllo", 5, 0));
  ASSERT_TRUE(string_match_len("HELLO", 5, "hello", 5, 1));
  ASSERT_FALSE(string_match_len("hello", 5, "hell", 4, 0));
}
