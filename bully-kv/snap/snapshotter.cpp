#include <errno.h>
#include <string.h>
#include <unistd.h>
#include <inttypes.h>
#include <algorithm>
#include <functional>
#include <boost/filesystem.hpp>
#include <msgpack.hpp>
#include <bully-kv/snap/snapshotter.h>
#include <bully-kv/common/log.h>
#include <bully-kv/common/util.h>

namespace bully {

struct SnapshotRecord {
  uint32_t data_len;
  uint32_t crc32;
};

Status Snapshotter::init() {
  boost::system::error_code ec;
  boost::filesystem::create_directories(dir_, ec);
  if (ec) {
    return Status::io_error(ec.message().c_str());
  }
  return Status::ok();
}

Status Snapshotter::load(proto::Snapshot& snapshot) {
  std::vector<std::string> names;
  get_snap_names(names);

  for (std::string& filename : names) {
    Status status = load_snap(filename, snapshot);
    if (status.is_ok()) {
      return Status::ok();
    }
  }

  return Status::not_found("snap not found");
}

std::string Snapshotter::snap_name(uint64_t commit_id) {
  char buffer[64];
  snprintf(buffer, sizeof(buffer), "%016" PRIx64 ".snap", commit_id);
  return buffer;
}

Status Snapshotter::save_snap(const proto::Snapshot& snapshot) {
  using namespace boost;

  msgpack::sbuffer sbuf;
  msgpack::pack(sbuf, snapshot);

  SnapshotRecord record;
  record.data_len = static_cast<uint32_t>(sbuf.size());
  record.crc32 = compute_crc32(sbuf.data(), sbuf.size());

  filesystem::path path = filesystem::path(dir_) / snap_name(snapshot.commit_id);
  std::string tmp_path = path.string() + ".tmp";

  FILE* fp = fopen(tmp_path.c_str(), "w");
  if (!fp) {
    return Status::io_error(strerror(errno));
  }

  Status status;
  if (fwrite(&record, 1, sizeof(record), fp) != sizeof(record)
      || fwrite(sbuf.data(), 1, sbuf.size(), fp) != sbuf.size()
      || fflush(fp) != 0
      || fsync(fileno(fp)) != 0) {
    status = Status::io_error(strerror(errno));
  }
  fclose(fp);

  system::error_code ec;
  if (!status.is_ok()) {
    filesystem::remove(tmp_path, ec);
    return status;
  }

  filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return Status::io_error(ec.message().c_str());
  }
  LOG_DEBUG("saved snapshot at commit %lu, %lu bytes", snapshot.commit_id, sbuf.size());
  return Status::ok();
}

// newest first
void Snapshotter::get_snap_names(std::vector<std::string>& names) {
  using namespace boost;

  system::error_code ec;
  filesystem::directory_iterator end;
  for (filesystem::directory_iterator it(dir_, ec); !ec && it != end; it.increment(ec)) {
    filesystem::path filename = (*it).path().filename();
    filesystem::path extension = filename.extension();
    if (extension != ".snap") {
      continue;
    }
    names.push_back(filename.string());
  }
  std::sort(names.begin(), names.end(), std::greater<std::string>());
}

Status Snapshotter::read_snap(const std::string& path, proto::Snapshot& snapshot) {
  FILE* fp = fopen(path.c_str(), "r");
  if (!fp) {
    return Status::io_error(strerror(errno));
  }

  SnapshotRecord header;
  std::vector<char> data;
  bool complete = fread(&header, 1, sizeof(header), fp) == sizeof(header) && header.data_len > 0;
  if (complete) {
    data.resize(header.data_len);
    complete = fread(data.data(), 1, data.size(), fp) == data.size();
  }
  fclose(fp);

  if (!complete) {
    return Status::io_error("short snapshot file");
  }
  if (compute_crc32(data.data(), data.size()) != header.crc32) {
    return Status::io_error("snapshot crc mismatch");
  }

  try {
    msgpack::object_handle oh = msgpack::unpack(data.data(), data.size());
    oh.get().convert(snapshot);
  } catch (std::exception& e) {
    return Status::io_error(e.what());
  }
  return Status::ok();
}

Status Snapshotter::load_snap(const std::string& filename, proto::Snapshot& snapshot) {
  using namespace boost;
  std::string path = (filesystem::path(dir_) / filename).string();

  Status status = read_snap(path, snapshot);
  if (status.is_ok() && snap_name(snapshot.commit_id) != filename) {
    status = Status::io_error("snapshot commit id does not match its name");
  }
  if (status.is_ok()) {
    return status;
  }

  LOG_WARN("broken snapshot %s: %s", path.c_str(), status.to_string().c_str());
  system::error_code ec;
  filesystem::rename(path, path + ".broken", ec);
  if (ec) {
    LOG_WARN("rename broken snapshot failed %s", ec.message().c_str());
  }
  return status;
}

}
