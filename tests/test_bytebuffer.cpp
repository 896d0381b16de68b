#include <arpa/inet.h>
#include <string.h>
#include <gtest/gtest.h>
#include <bully-kv/common/bytebuffer.h>
#include <bully-kv/transport/proto.h>

using namespace bully;

TEST(ByteBuffer, put_and_read) {
  ByteBuffer buffer;
  ASSERT_FALSE(buffer.readable());

  const char* data = "hello world";
  buffer.put((const uint8_t*) data, 11);
  ASSERT_TRUE(buffer.readable());
  ASSERT_EQ(buffer.readable_bytes(), 11);
  ASSERT_EQ(memcmp(buffer.reader(), data, 11), 0);

  buffer.read_bytes(6);
  ASSERT_EQ(buffer.readable_bytes(), 5);
  ASSERT_EQ(memcmp(buffer.reader(), "world", 5), 0);

  buffer.read_bytes(5);
  ASSERT_FALSE(buffer.readable());
}

TEST(ByteBuffer, grows_past_initial_capacity) {
  ByteBuffer buffer;
  std::vector<uint8_t> data(10000, 'x');
  buffer.put(data.data(), static_cast<uint32_t>(data.size()));
  buffer.put(data.data(), static_cast<uint32_t>(data.size()));
  ASSERT_EQ(buffer.readable_bytes(), 20000);
  ASSERT_EQ(buffer.reader()[19999], 'x');
}

TEST(ByteBuffer, frame_header) {
  ByteBuffer buffer;
  const char* payload = "abc";
  buffer.put_frame(TransportTypeRequest, (const uint8_t*) payload, 3);
  ASSERT_EQ(buffer.readable_bytes(), sizeof(TransportMeta) + 3);

  TransportMeta meta;
  memcpy(&meta, buffer.reader(), sizeof(meta));
  ASSERT_EQ(meta.type, TransportTypeRequest);
  ASSERT_EQ(ntohl(meta.len), 3);
  ASSERT_EQ(memcmp(buffer.reader() + sizeof(meta), payload, 3), 0);
}

TEST(ByteBuffer, reset) {
  ByteBuffer buffer;
  buffer.put((const uint8_t*) "abc", 3);
  buffer.reset();
  ASSERT_FALSE(buffer.readable());
  ASSERT_EQ(buffer.readable_bytes(), 0);
}
