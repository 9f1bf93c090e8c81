#ifndef ISOBOX_PROCESS_H_
#define ISOBOX_PROCESS_H_

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>
#include <sys/resource.h>

#include <isobox/limits.h>
#include "utils.h"

struct SpawnOptions {
  // argv[0] is the program; searched in PATH if search_path
  std::vector<std::string> argv;
  std::vector<std::string> envs; // empty for inheriting the environment
  bool search_path;
  fs::path workdir; // empty for not changing
  // empty for /dev/null
  fs::path stdin_file, stdout_file, stderr_file;
  // everything except memory, which the caller has to watch
  bool apply_rlimits;
  LimitSpec limits;

  SpawnOptions() : search_path(false), apply_rlimits(false) {}
};

// A child process in its own session. Not thread-safe: one thread drives it.
class ChildProcess {
 public:
  using Clock = std::chrono::steady_clock;
 private:
  pid_t pid_;
  bool reaped_;
  int status_;
  struct rusage rusage_;
  Clock::time_point start_, end_;

  explicit ChildProcess(pid_t pid) :
      pid_(pid), reaped_(false), status_(0), rusage_{}, start_(Clock::now()) {}
 public:
  // Returns nullptr and sets error_msg if fork or anything before exec fails
  static std::unique_ptr<ChildProcess> Spawn(const SpawnOptions&, std::string* error_msg);
  // kills the whole session and reaps it if still running
  ~ChildProcess();
  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  bool WaitUntil(Clock::time_point deadline);
  // signals the process group; no-op once reaped
  void Signal(int sig);
  // SIGKILL to whatever is left in the process group. Also valid after the
  // leader is reaped: the group id is not reused while members remain.
  void KillGroup();
  // current resident set of the leader in bytes; -1 if unavailable
  int64_t ResidentMemory() const;

  pid_t pid() const { return pid_; }
  bool reaped() const { return reaped_; }
  // below are valid only after reaped
  int status() const { return status_; }
  const struct rusage& rusage() const { return rusage_; }
  int64_t WallTimeUs() const;
  Clock::time_point start() const { return start_; }
};

#endif  // ISOBOX_PROCESS_H_
