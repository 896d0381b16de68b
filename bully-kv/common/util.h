#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

namespace bully {

uint32_t compute_crc32(const char* data, size_t len);

// "127.0.0.1:9291,127.0.0.1:9292" -> one entry per replica, replica i + 1 lives at entry i
std::vector<std::string> split_cluster(const std::string& cluster);

// "host:port" -> host, port; false if malformed
bool parse_host(const std::string& host, std::string& address, uint16_t& port);

}
