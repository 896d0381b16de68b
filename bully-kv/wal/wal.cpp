#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>
#include <inttypes.h>
#include <sstream>
#include <boost/filesystem.hpp>
#include <bully-kv/wal/wal.h>
#include <bully-kv/common/log.h>
#include <bully-kv/common/util.h>

namespace bully {

static const WAL_type wal_InvalidType = 0;
static const WAL_type wal_CommitType = 1;
static const WAL_type wal_MetadataType = 2;
static const long SegmentSizeBytes = 64 * 1000 * 1000; // 64MB

std::string WAL::wal_name(uint64_t seq, uint64_t first_id) {
  char buffer[64];
  snprintf(buffer, sizeof(buffer), "%016" PRIx64 "-%016" PRIx64 ".wal", seq, first_id);
  return buffer;
}

class WAL_File {
 public:
  static Status open(const std::string& path, uint64_t seq, std::shared_ptr<WAL_File>& file) {
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_APPEND, 0644);
    if (fd < 0) {
      return Status::io_error(strerror(errno));
    }

    off_t size = lseek(fd, 0, SEEK_END);
    if (size == -1) {
      Status status = Status::io_error(strerror(errno));
      ::close(fd);
      return status;
    }
    file.reset(new WAL_File(fd, seq, size));
    return Status::ok();
  }

  ~WAL_File() {
    ::close(fd);
  }

  // drops everything after offset
  Status truncate(long offset) {
    data_buffer.clear();
    if (ftruncate(fd, offset) != 0) {
      return Status::io_error(strerror(errno));
    }
    file_size = offset;
    return Status::ok();
  }

  // buffers one record, header first then the payload
  void append(WAL_type type, const uint8_t* data, size_t len) {
    WAL_Record record;
    record.type = type;
    record.crc = compute_crc32((const char*) data, len);
    set_WAL_Record_len(record, static_cast<uint32_t>(len));
    const uint8_t* ptr = (const uint8_t*) &record;
    data_buffer.insert(data_buffer.end(), ptr, ptr + sizeof(record));
    data_buffer.insert(data_buffer.end(), data, data + len);
  }

  // writes the buffered records and waits for the disk, a failed write leaves the file as it was
  Status sync() {
    if (data_buffer.empty()) {
      return Status::ok();
    }

    size_t written = 0;
    while (written < data_buffer.size()) {
      ssize_t n = ::write(fd, data_buffer.data() + written, data_buffer.size() - written);
      if (n < 0 && errno == EINTR) {
        continue;
      }
      if (n <= 0) {
        return abort_write(strerror(errno));
      }
      written += n;
    }

    if (fsync(fd) != 0) {
      return abort_write(strerror(errno));
    }

    file_size += static_cast<long>(data_buffer.size());
    data_buffer.clear();
    return Status::ok();
  }

  Status read_all(std::vector<char>& out) {
    if (lseek(fd, 0, SEEK_SET) == -1) {
      return Status::io_error(strerror(errno));
    }

    char buffer[4096];
    while (true) {
      ssize_t bytes = ::read(fd, buffer, sizeof(buffer));
      if (bytes < 0 && errno == EINTR) {
        continue;
      }
      if (bytes < 0) {
        return Status::io_error(strerror(errno));
      }
      if (bytes == 0) {
        break;
      }
      out.insert(out.end(), buffer, buffer + bytes);
    }
    return Status::ok();
  }

  std::vector<uint8_t> data_buffer;
  uint64_t seq;
  long file_size;
  int fd;

 private:
  explicit WAL_File(int fd, uint64_t seq, long size)
      : seq(seq),
        file_size(size),
        fd(fd) {}

  Status abort_write(const char* err) {
    std::string msg(err);
    Status status = truncate(file_size);
    if (!status.is_ok()) {
      LOG_ERROR("cannot drop partial write of segment %lu: %s", seq, status.to_string().c_str());
    }
    return Status::io_error(msg.c_str());
  }
};

Status WAL::write_segment(const std::string& dir, uint64_t seq, uint64_t first_id) {
  using namespace boost;

  filesystem::path wal_file = filesystem::path(dir) / wal_name(seq, first_id);
  std::string tmp_path = wal_file.string() + ".tmp";

  system::error_code ec;
  if (filesystem::exists(tmp_path, ec)) {
    filesystem::remove(tmp_path, ec);
  }

  {
    std::shared_ptr<WAL_File> file;
    Status status = WAL_File::open(tmp_path, seq, file);
    if (!status.is_ok()) {
      return status;
    }

    WAL_Metadata meta;
    meta.seq = seq;
    meta.first_id = first_id;
    msgpack::sbuffer sbuf;
    msgpack::pack(sbuf, meta);
    file->append(wal_MetadataType, (const uint8_t*) sbuf.data(), sbuf.size());
    status = file->sync();
    if (!status.is_ok()) {
      return status;
    }
  }

  // a segment becomes visible only once its metadata is on disk
  filesystem::rename(tmp_path, wal_file, ec);
  if (ec) {
    return Status::io_error(ec.message().c_str());
  }
  return Status::ok();
}

Status WAL::create(const std::string& dir) {
  boost::system::error_code ec;
  boost::filesystem::create_directories(dir, ec);
  if (ec) {
    return Status::io_error(ec.message().c_str());
  }
  return write_segment(dir, 0, 1);
}

Status WAL::open(const std::string& dir, WAL_ptr& wal) {
  WAL_ptr w(new WAL(dir));

  std::vector<std::string> names;
  get_wal_names(dir, names);
  if (names.empty()) {
    return Status::not_found("wal not found");
  }

  if (!WAL::is_valid_seq(names)) {
    return Status::io_error("invalid wal seq");
  }

  for (const std::string& name: names) {
    uint64_t seq;
    uint64_t first_id;
    if (!parse_wal_name(name, &seq, &first_id)) {
      return Status::io_error("invalid wal name");
    }

    boost::filesystem::path path = boost::filesystem::path(w->dir_) / name;
    std::shared_ptr<WAL_File> file;
    Status status = WAL_File::open(path.string(), seq, file);
    if (!status.is_ok()) {
      return status;
    }
    w->files_.push_back(file);
  }

  wal = w;
  return Status::ok();
}

Status WAL::read_all(std::vector<proto::CommitPtr>& commits) {
  std::vector<char> data;
  for (auto file : files_) {
    data.clear();
    Status status = file->read_all(data);
    if (!status.is_ok()) {
      return status;
    }

    size_t offset = 0;
    bool matchmeta = false;
    last_record_offset_ = -1;

    while (offset < data.size()) {
      size_t left = data.size() - offset;
      size_t record_begin_offset = offset;

      if (left < sizeof(WAL_Record)) {
        LOG_WARN("invalid record len %lu, truncating segment %lu", left, file->seq);
        status = file->truncate(record_begin_offset);
        if (!status.is_ok()) {
          return status;
        }
        break;
      }

      WAL_Record record;
      memcpy(&record, data.data() + offset, sizeof(record));

      left -= sizeof(record);
      offset += sizeof(record);

      if (record.type == wal_InvalidType) {
        LOG_WARN("zeroed record at offset %lu, truncating segment %lu", record_begin_offset, file->seq);
        status = file->truncate(record_begin_offset);
        if (!status.is_ok()) {
          return status;
        }
        break;
      }

      uint32_t record_data_len = WAL_Record_len(record);
      if (left < record_data_len) {
        LOG_WARN("invalid record data len %lu, %u, truncating segment %lu", left, record_data_len, file->seq);
        status = file->truncate(record_begin_offset);
        if (!status.is_ok()) {
          return status;
        }
        break;
      }

      char* data_ptr = data.data() + offset;
      uint32_t crc = compute_crc32(data_ptr, record_data_len);

      left -= record_data_len;
      offset += record_data_len;

      if (crc != record.crc) {
        LOG_WARN("invalid record crc %u, %u, truncating segment %lu", record.crc, crc, file->seq);
        status = file->truncate(record_begin_offset);
        if (!status.is_ok()) {
          return status;
        }
        break;
      }

      status = handle_wal_record(record.type, data_ptr, record_data_len, *file, matchmeta, commits);
      if (!status.is_ok()) {
        return status;
      }

      if (record.type == wal_CommitType) {
        last_record_offset_ = static_cast<long>(record_begin_offset);
      }
    }

    if (!matchmeta) {
      return Status::io_error("wal: segment metadata not found");
    }
  }

  return Status::ok();
}

Status WAL::handle_wal_record(WAL_type type,
                              const char* data,
                              size_t data_len,
                              const WAL_File& file,
                              bool& matchmeta,
                              std::vector<proto::CommitPtr>& commits) {
  switch (type) {
    case wal_CommitType: {
      proto::CommitPtr commit(new proto::Commit());
      try {
        msgpack::object_handle oh = msgpack::unpack(data, data_len);
        oh.get().convert(*commit);
      } catch (std::exception& e) {
        LOG_ERROR("bad commit record %s", e.what());
        return Status::io_error("wal: undecodable commit record");
      }

      if (!matchmeta) {
        return Status::io_error("wal: commit record before segment metadata");
      }

      // commits are stored densely, a hole means a lost segment
      if (commit->id != last_id_ + 1) {
        LOG_ERROR("wal: commit %lu follows commit %lu", commit->id, last_id_);
        return Status::io_error("wal: commit ids are not contiguous");
      }

      last_id_ = commit->id;
      commits.push_back(commit);
      return Status::ok();
    }

    case wal_MetadataType: {
      WAL_Metadata meta;
      try {
        msgpack::object_handle oh = msgpack::unpack(data, data_len);
        oh.get().convert(meta);
      } catch (std::exception& e) {
        LOG_ERROR("bad metadata record %s", e.what());
        return Status::io_error("wal: undecodable metadata record");
      }

      if (meta.seq != file.seq || meta.first_id != last_id_ + 1) {
        LOG_ERROR("wal: metadata mismatch, seq %lu first id %lu, expected seq %lu first id %lu",
                  meta.seq, meta.first_id, file.seq, last_id_ + 1);
        return Status::io_error("wal: metadata mismatch");
      }
      matchmeta = true;
      return Status::ok();
    }

    default: {
      LOG_ERROR("invalid record type %d", type);
      return Status::io_error("wal: invalid record type");
    }
  }
}

Status WAL::save_commit(const proto::Commit& commit) {
  if (commit.id != last_id_ + 1) {
    return Status::invalid_argument("wal: commit id is not the next one");
  }

  msgpack::sbuffer sbuf;
  msgpack::pack(sbuf, commit);
  if (sbuf.size() > MAX_WAL_RECORD_LEN) {
    return Status::invalid_argument("wal: commit too large");
  }

  if (files_.back()->file_size >= SegmentSizeBytes) {
    Status status = cut();
    if (!status.is_ok()) {
      LOG_WARN("cut wal segment failed %s, keep appending", status.to_string().c_str());
    }
  }

  std::shared_ptr<WAL_File> file = files_.back();
  long offset = file->file_size;
  file->append(wal_CommitType, (const uint8_t*) sbuf.data(), sbuf.size());
  Status status = file->sync();
  if (!status.is_ok()) {
    return status;
  }

  last_id_ = commit.id;
  last_record_offset_ = offset;
  return Status::ok();
}

Status WAL::rollback(uint64_t id) {
  if (id != last_id_ || id == 0 || last_record_offset_ < 0) {
    return Status::invalid_argument("wal: only the last saved commit can be rolled back");
  }

  Status status = files_.back()->truncate(last_record_offset_);
  if (!status.is_ok()) {
    return status;
  }
  last_id_--;
  last_record_offset_ = -1;
  return Status::ok();
}

Status WAL::cut() {
  uint64_t seq = files_.back()->seq + 1;
  Status status = write_segment(dir_, seq, last_id_ + 1);
  if (!status.is_ok()) {
    return status;
  }

  boost::filesystem::path path = boost::filesystem::path(dir_) / wal_name(seq, last_id_ + 1);
  std::shared_ptr<WAL_File> file;
  status = WAL_File::open(path.string(), seq, file);
  if (!status.is_ok()) {
    return status;
  }
  files_.push_back(file);
  last_record_offset_ = -1;
  LOG_INFO("wal: started segment %lu at commit %lu", seq, last_id_ + 1);
  return Status::ok();
}

void WAL::get_wal_names(const std::string& dir, std::vector<std::string>& names) {
  using namespace boost;

  system::error_code ec;
  filesystem::directory_iterator end;
  for (filesystem::directory_iterator it(dir, ec); !ec && it != end; it.increment(ec)) {
    filesystem::path filename = (*it).path().filename();
    filesystem::path extension = filename.extension();
    if (extension != ".wal") {
      continue;
    }
    names.push_back(filename.string());
  }
  std::sort(names.begin(), names.end(), std::less<std::string>());
}

// 0000000000000000-0000000000000001.wal
bool WAL::parse_wal_name(const std::string& name, uint64_t* seq, uint64_t* first_id) {
  *seq = 0;
  *first_id = 0;

  boost::filesystem::path path(name);
  if (path.extension() != ".wal") {
    return false;
  }

  std::string filename = name.substr(0, name.size() - 4);
  size_t pos = filename.find('-');
  if (pos == std::string::npos || pos == 0 || pos == filename.size() - 1) {
    return false;
  }

  {
    std::string str = filename.substr(0, pos);
    std::stringstream ss;
    ss << std::hex << str;
    ss >> *seq;
    if (ss.fail() || !ss.eof()) {
      return false;
    }
  }

  {
    std::string str = filename.substr(pos + 1);
    std::stringstream ss;
    ss << std::hex << str;
    ss >> *first_id;
    if (ss.fail() || !ss.eof()) {
      return false;
    }
  }
  return true;
}

bool WAL::is_valid_seq(const std::vector<std::string>& names) {
  bool first = true;
  uint64_t last_seq = 0;
  for (const std::string& name: names) {
    uint64_t cur_seq;
    uint64_t i;
    if (!WAL::parse_wal_name(name, &cur_seq, &i)) {
      LOG_WARN("unparsable wal name %s", name.c_str());
      return false;
    }

    if (!first && last_seq + 1 != cur_seq) {
      return false;
    }
    first = false;
    last_seq = cur_seq;
  }
  return true;
}

}
