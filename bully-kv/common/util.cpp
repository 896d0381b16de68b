#include <stdlib.h>
#include <boost/algorithm/string.hpp>
#include <boost/crc.hpp>
#include <bully-kv/common/util.h>

namespace bully {

uint32_t compute_crc32(const char* data, size_t len) {
  boost::crc_32_type crc32;
  crc32.process_bytes(data, len);
  return crc32();
}

std::vector<std::string> split_cluster(const std::string& cluster) {
  std::vector<std::string> peers;
  std::string trimmed = boost::trim_copy(cluster);
  if (trimmed.empty()) {
    return peers;
  }
  boost::split(peers, trimmed, boost::is_any_of(","));
  for (std::string& peer : peers) {
    boost::trim(peer);
  }
  return peers;
}

bool parse_host(const std::string& host, std::string& address, uint16_t& port) {
  std::vector<std::string> strs;
  boost::split(strs, host, boost::is_any_of(":"));
  if (strs.size() != 2 || strs[0].empty() || strs[1].empty()) {
    return false;
  }

  char* end = nullptr;
  long p = strtol(strs[1].c_str(), &end, 10);
  if (*end != '\0' || p <= 0 || p > 65535) {
    return false;
  }
  address = strs[0];
  port = static_cast<uint16_t>(p);
  return true;
}

}
