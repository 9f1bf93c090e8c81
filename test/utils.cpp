#include "utils.h"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

void TempDirTest::SetUp() {
  char tmp_path[256] = "/tmp/isobox_test_XXXXXX";
  if (!mkdtemp(tmp_path)) throw std::runtime_error("Failed to create");
  tmp_dir = tmp_path;
}

void TempDirTest::TearDown() {
  fs::remove_all(tmp_dir);
}

fs::path WriteExecutable(const fs::path& path, const std::string& content) {
  {
    std::ofstream fout(path);
    fout << content;
  }
  fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                  fs::perms::others_read | fs::perms::others_exec);
  return path;
}
