#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <fmt/ranges.h>

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
#else
#include <dirent.h>
#endif

namespace {

#if __has_include(<linux/close_range.h>)
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

} // namespace

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG3(Verdict, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* VerdictToDesc, Verdict, ENUM_VERDICT_)
#undef X

static const char* kVerdictAbrTable[] = {
#define X(name, abr, desc) abr,
  ENUM_VERDICT_
#undef X
};

const char* VerdictToAbr(Verdict verdict) {
  return kVerdictAbrTable[(int)verdict];
}

bool AbrToVerdict(const std::string& str, Verdict* verdict) {
  for (size_t i = 0; i < sizeof(kVerdictAbrTable) / sizeof(kVerdictAbrTable[0]); i++) {
    if (str == kVerdictAbrTable[i]) {
      *verdict = (Verdict)i;
      return true;
    }
  }
  return false;
}

static const char* kSandboxTypeTable[] = {
#define X(name, str) str,
  ENUM_SANDBOX_TYPE_
#undef X
};

const char* SandboxTypeName(SandboxType type) {
  return kSandboxTypeTable[(int)type];
}

bool GetSandboxType(const std::string& str, SandboxType* type) {
  for (size_t i = 0; i < sizeof(kSandboxTypeTable) / sizeof(kSandboxTypeTable[0]); i++) {
    if (str == kSandboxTypeTable[i]) {
      *type = (SandboxType)i;
      return true;
    }
  }
  return false;
}

#define X(...) X_RETURN_ARG1(ExecuteStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecuteStatusName, ExecuteStatus, ENUM_EXECUTE_STATUS_)
#undef X

#define X(...) X_RETURN_ARG1(TerminationCause, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* TerminationCauseName, TerminationCause, ENUM_TERMINATION_CAUSE_)
#undef X

#define X(...) X_RETURN_ARG1(SlotState, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SlotStateName, SlotState, ENUM_SLOT_STATE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

std::string ErrnoMessage(const char* prefix, int err) {
  return std::string(prefix) + ": " + strerror(err);
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool Copy(const fs::path& from, const fs::path& to, fs::perms perms) {
  spdlog::debug("Copy file {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(to, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed copying {} -> {}: {}", from.c_str(), to.c_str(), ec.message());
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write {} bytes to {}", content.size(), path.c_str());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size())) {
      spdlog::warn("Failed writing {}", path.c_str());
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permissions of {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool ReadFileBounded(const fs::path& path, int64_t max_bytes, std::string* content, bool* truncated) {
  content->clear();
  *truncated = false;
  std::error_code ec;
  if (!fs::exists(path, ec)) return !ec;
  std::ifstream fin(path, std::ios::binary);
  if (!fin) {
    spdlog::warn("Failed opening {}", path.c_str());
    return false;
  }
  constexpr size_t kChunk = 65536;
  char buf[kChunk];
  while (fin) {
    size_t want = kChunk;
    if (max_bytes > 0) {
      // read one byte past the limit to detect truncation
      int64_t left = max_bytes + 1 - (int64_t)content->size();
      if (left <= 0) break;
      want = std::min<int64_t>(want, left);
    }
    fin.read(buf, want);
    content->append(buf, fin.gcount());
  }
  if (fin.bad()) {
    spdlog::warn("Failed reading {}", path.c_str());
    return false;
  }
  if (max_bytes > 0 && (int64_t)content->size() > max_bytes) {
    content->resize(max_bytes);
    *truncated = true;
  }
  return true;
}

int RunCommand(const std::vector<std::string>& argv, std::string* output) {
  spdlog::debug("Run command {}", fmt::format("{}", argv));
  std::vector<char*> args;
  for (auto& i : argv) args.push_back(const_cast<char*>(i.c_str()));
  args.push_back(nullptr);

  int outpipe[2];
  if (pipe2(outpipe, O_CLOEXEC) < 0) {
    spdlog::warn("RunCommand pipe error: {}", strerror(errno));
    return -1;
  }
  pid_t pid = fork();
  if (pid < 0) {
    spdlog::warn("RunCommand fork error: {}", strerror(errno));
    close(outpipe[0]);
    close(outpipe[1]);
    return -1;
  }
  if (pid == 0) {
    int devnull = open("/dev/null", O_RDWR);
    if (devnull < 0) _exit(127);
    dup2(devnull, 0);
    dup2(outpipe[1], 1);
    dup2(devnull, 2);
    CloseFrom(3);
    execvp(args[0], args.data());
    _exit(127);
  }
  close(outpipe[1]);
  if (output) output->clear();
  char buf[4096];
  for (ssize_t n; (n = read(outpipe[0], buf, sizeof(buf))) != 0;) {
    if (n < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (output) output->append(buf, n);
  }
  close(outpipe[0]);
  int status;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      spdlog::warn("RunCommand waitpid error: {}", strerror(errno));
      return -1;
    }
  }
  if (!WIFEXITED(status)) return -1;
  return WEXITSTATUS(status);
}
