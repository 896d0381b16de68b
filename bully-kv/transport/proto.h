#pragma once
#include <stdint.h>

namespace bully {
const uint8_t TransportTypeRequest = 1;
const uint8_t TransportTypeResponse = 2;

// upper bound for one framed message, a coordinator announcement carries the whole history
const uint32_t MaxTransportMessageLen = 256 * 1024 * 1024;

#pragma pack(1)
struct TransportMeta {
  uint8_t type;
  uint32_t len;  // network byte order
};
#pragma pack()

}
