#include <string.h>
#include <algorithm>
#include <arpa/inet.h>
#include <bully-kv/common/bytebuffer.h>
#include <bully-kv/transport/proto.h>

namespace bully {
static const uint32_t kInitialCapacity = 4096;

ByteBuffer::ByteBuffer()
    : reader_(0),
      writer_(0),
      buff_(kInitialCapacity) {
}

void ByteBuffer::put(const uint8_t* data, uint32_t len) {
  if (buff_.size() - writer_ < len) {
    // reclaim the consumed prefix before growing
    uint32_t pending = readable_bytes();
    if (reader_ > 0) {
      memmove(buff_.data(), buff_.data() + reader_, pending);
      reader_ = 0;
      writer_ = pending;
    }
    if (buff_.size() - writer_ < len) {
      buff_.resize(std::max<size_t>(buff_.size() * 2, writer_ + len));
    }
  }
  memcpy(buff_.data() + writer_, data, len);
  writer_ += len;
}

void ByteBuffer::put_frame(uint8_t type, const uint8_t* data, uint32_t len) {
  static_assert(sizeof(TransportMeta) == 5, "packed transport header");
  TransportMeta meta;
  meta.type = type;
  meta.len = htonl(len);
  put(reinterpret_cast<const uint8_t*>(&meta), sizeof(meta));
  put(data, len);
}

uint32_t ByteBuffer::readable_bytes() const {
  return writer_ - reader_;
}

void ByteBuffer::read_bytes(uint32_t bytes) {
  reader_ += std::min(bytes, readable_bytes());
  may_shrink_to_fit();
}

void ByteBuffer::may_shrink_to_fit() {
  if (reader_ == writer_) {
    reader_ = 0;
    writer_ = 0;
  }
}

void ByteBuffer::reset() {
  reader_ = 0;
  writer_ = 0;
  if (buff_.size() > kInitialCapacity) {
    std::vector<uint8_t>(kInitialCapacity).swap(buff_);
  }
}

}
