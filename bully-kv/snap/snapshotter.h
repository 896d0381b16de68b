#pragma once
#include <string>
#include <vector>
#include <bully-kv/common/status.h>
#include <bully-kv/bully/proto.h>

namespace bully {

// Stores serialized state machine images, one file per snapshot, named after
// the commit id they were taken at.
class Snapshotter {
 public:
  explicit Snapshotter(const std::string& dir)
      : dir_(dir) {
  }

  ~Snapshotter() = default;

  // creates the snapshot directory if missing
  Status init();

  // loads the newest valid snapshot, broken ones are renamed and skipped
  Status load(proto::Snapshot& snapshot);

  Status save_snap(const proto::Snapshot& snapshot);

  static std::string snap_name(uint64_t commit_id);

 private:
  void get_snap_names(std::vector<std::string>& names);

  Status load_snap(const std::string& filename, proto::Snapshot& snapshot);

  static Status read_snap(const std::string& path, proto::Snapshot& snapshot);

  std::string dir_;
};

}
