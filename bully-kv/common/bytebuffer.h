#pragma once
#include <stdint.h>
#include <vector>

namespace bully {

// growable buffer for outgoing socket data, bytes between reader_ and writer_ are pending
class ByteBuffer {
 public:
  explicit ByteBuffer();

  void put(const uint8_t* data, uint32_t len);

  // writes a 5 byte transport header followed by the payload
  void put_frame(uint8_t type, const uint8_t* data, uint32_t len);

  void read_bytes(uint32_t bytes);

  bool readable() const {
    return writer_ > reader_;
  }

  uint32_t readable_bytes() const;

  const uint8_t* reader() const {
    return buff_.data() + reader_;
  }

  void reset();

 private:
  void may_shrink_to_fit();

  uint32_t reader_;
  uint32_t writer_;
  std::vector<uint8_t> buff_;
};

}
