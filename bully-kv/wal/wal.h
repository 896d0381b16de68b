#pragma once
#include <stdio.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>
#include <bully-kv/bully/proto.h>
#include <bully-kv/common/status.h>

namespace bully {

// header record at the start of every segment
struct WAL_Metadata {
  WAL_Metadata()
      : seq(0),
        first_id(0) {}

  uint64_t seq;
  uint64_t first_id;  // id of the first commit this segment may hold
  MSGPACK_DEFINE (seq, first_id);
};

typedef uint8_t WAL_type;

#pragma pack(1)
struct WAL_Record {
  WAL_type type;  /*the data type*/
  uint8_t len[3]; /*data length, little endian*/
  uint32_t crc;   /*crc32 for data*/
};
#pragma pack()

#define MAX_WAL_RECORD_LEN (0x00FFFFFF)

static inline uint32_t WAL_Record_len(const WAL_Record& record) {
  return uint32_t(record.len[2]) << 16 | uint32_t(record.len[1]) << 8 | uint32_t(record.len[0]) << 0;
}

static inline void set_WAL_Record_len(WAL_Record& record, uint32_t len) {
  len = std::min(len, (uint32_t) MAX_WAL_RECORD_LEN);
  record.len[2] = (len >> 16) & 0x000000FF;
  record.len[1] = (len >> 8) & 0x000000FF;
  record.len[0] = (len >> 0) & 0x000000FF;
}

class WAL_File;

class WAL;
typedef std::shared_ptr<WAL> WAL_ptr;

// Append-only commit storage. A commit is durable once save_commit returns ok:
// the record has been written, flushed and fsynced.
class WAL {
 public:
  // creates dir with an empty first segment
  static Status create(const std::string& dir);

  static Status open(const std::string& dir, WAL_ptr& wal);

  ~WAL() = default;

  // After read_all, the WAL will be ready for appending new records.
  // A torn or corrupt tail is truncated away.
  Status read_all(std::vector<proto::CommitPtr>& commits);

  // commit.id must be last_id() + 1
  Status save_commit(const proto::Commit& commit);

  // removes the last saved commit, used when applying it failed
  Status rollback(uint64_t id);

  // closes the current segment and starts the next one
  Status cut();

  uint64_t last_id() const {
    return last_id_;
  }

  static void get_wal_names(const std::string& dir, std::vector<std::string>& names);

  static bool parse_wal_name(const std::string& name, uint64_t* seq, uint64_t* first_id);

  // names should have been sorted based on sequence number.
  // is_valid_seq checks whether seq increases continuously.
  static bool is_valid_seq(const std::vector<std::string>& names);

  static std::string wal_name(uint64_t seq, uint64_t first_id);

 private:
  explicit WAL(const std::string& dir)
      : dir_(dir),
        last_id_(0),
        last_record_offset_(-1) {
  }

  Status handle_wal_record(WAL_type type,
                           const char* data,
                           size_t data_len,
                           const WAL_File& file,
                           bool& matchmeta,
                           std::vector<proto::CommitPtr>& commits);

  static Status write_segment(const std::string& dir, uint64_t seq, uint64_t first_id);

  std::string dir_;
  uint64_t last_id_;            // id of the last commit saved to the wal
  long last_record_offset_;     // offset of the last commit record inside the last segment, -1 if unknown
  std::vector<std::shared_ptr<WAL_File>> files_;
};

}
