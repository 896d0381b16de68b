#pragma once
#include <string>
#include <boost/filesystem.hpp>

namespace bully {

// scratch directory removed with the fixture
class TempDir {
 public:
  TempDir()
      : path_(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("bully-kv-%%%%-%%%%-%%%%")) {
    boost::filesystem::create_directories(path_);
  }

  ~TempDir() {
    boost::system::error_code ec;
    boost::filesystem::remove_all(path_, ec);
  }

  std::string path() const {
    return path_.string();
  }

  std::string sub(const std::string& name) const {
    return (path_ / name).string();
  }

 private:
  boost::filesystem::path path_;
};

}
