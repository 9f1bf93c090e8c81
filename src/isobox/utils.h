#ifndef ISOBOX_UTILS_H_
#define ISOBOX_UTILS_H_

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

#include <isobox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm755 =
    fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;
constexpr fs::perms kPerm644 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::others_read;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool Copy(const fs::path& from, const fs::path& to, fs::perms = fs::perms::unknown);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);

// Reads at most max_bytes (0 = all); sets *truncated if the file is longer.
// A missing file reads as empty.
bool ReadFileBounded(const fs::path&, int64_t max_bytes, std::string* content, bool* truncated);

// Runs a command to completion, capturing stdout (stderr is discarded).
// Returns the exit status, or -1 if it could not be run or was signaled.
int RunCommand(const std::vector<std::string>& argv, std::string* output);

std::string ErrnoMessage(const char* prefix, int err);

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

#endif  // ISOBOX_UTILS_H_
