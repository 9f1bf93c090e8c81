#include <isobox/local_sandbox.h>

#include <signal.h>
#include <sys/wait.h>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include "process.h"
#include "utils.h"

namespace {

// the program gets a fresh environment with only PATH set
const char kLocalPath[] = "/usr/local/bin:/usr/bin:/bin";

constexpr auto kMemoryPollInterval = std::chrono::milliseconds(1);

inline int64_t TimevalToUs(const struct timeval& tv) {
  return (int64_t)tv.tv_sec * 1'000'000 + tv.tv_usec;
}

class LocalProcess : public SandboxProcess {
  std::unique_ptr<ChildProcess> child_;
  LimitSpec limits_;
  bool time_killed_, memory_killed_;
  int64_t peak_rss_; // sampled while running

  void KillOnLimit_(bool* flag, const char* what) {
    spdlog::debug("pid={} exceeded the {} limit", child_->pid(), what);
    *flag = true;
    child_->Signal(SIGKILL);
  }
 public:
  LocalProcess(std::unique_ptr<ChildProcess>&& child, const LimitSpec& limits) :
      child_(std::move(child)), limits_(limits),
      time_killed_(false), memory_killed_(false), peak_rss_(0) {}
  ~LocalProcess() {
    child_->KillGroup();
  }

  // The wall and memory limits are enforced here; rlimits cover the rest.
  // Memory is the resident set of the program, polled every kMemoryPollInterval.
  bool WaitUntil(Clock::time_point deadline) override {
    const auto wall_deadline = child_->start() + std::chrono::microseconds(limits_.wall_time);
    while (true) {
      const bool watching = !time_killed_ && !memory_killed_;
      auto until = deadline;
      if (watching && limits_.HasMemory()) until = std::min(until, Clock::now() + kMemoryPollInterval);
      if (watching && limits_.HasWallTime()) until = std::min(until, wall_deadline);
      if (child_->WaitUntil(until)) {
        // background processes go down with the program
        child_->KillGroup();
        return true;
      }
      if (watching) {
        if (limits_.HasWallTime() && Clock::now() >= wall_deadline) {
          KillOnLimit_(&time_killed_, "wall time");
        } else if (limits_.HasMemory()) {
          int64_t rss = child_->ResidentMemory();
          peak_rss_ = std::max(peak_rss_, rss);
          if (rss >= limits_.memory) KillOnLimit_(&memory_killed_, "memory");
        }
      }
      if (Clock::now() >= deadline) return false;
    }
  }

  void Kill() override {
    child_->Signal(SIGKILL);
  }

  bool Collect(RunStats* stats, std::string* error_msg) override {
    if (!child_->reaped()) {
      *error_msg = "process is still running";
      return false;
    }
    *stats = RunStats();
    int status = child_->status();
    const struct rusage& ru = child_->rusage();
    stats->wall_time = child_->WallTimeUs();
    stats->cpu_time = TimevalToUs(ru.ru_utime) + TimevalToUs(ru.ru_stime);
    stats->peak_memory = std::max((int64_t)ru.ru_maxrss * 1024, peak_rss_);
    if (WIFEXITED(status)) {
      stats->exited = true;
      stats->exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      stats->signal = WTERMSIG(status);
    }
    stats->time_killed = time_killed_ || (!stats->exited && stats->signal == SIGXCPU);
    stats->memory_killed = memory_killed_;
    return true;
  }
};

} // namespace

fs::path LocalSandbox::BoxDir(int box_id) const {
  return box_root_ / ("box-" + PadInt(box_id, 4));
}

bool LocalSandbox::Init(int box_id, fs::path* box_dir, std::string* error_msg) {
  fs::path dir = BoxDir(box_id);
  std::error_code ec;
  if (fs::exists(dir, ec) && !RemoveAll(dir)) {
    *error_msg = fmt::format("cannot remove leftovers in {}", dir.c_str());
    return false;
  }
  if (!CreateDirs(dir, kPerm755)) {
    *error_msg = fmt::format("cannot create {}", dir.c_str());
    return false;
  }
  *box_dir = dir;
  return true;
}

std::unique_ptr<SandboxProcess> LocalSandbox::Launch(const RunOptions& options, std::string* error_msg) {
  auto in_box = [&](const std::string& name) {
    return name.empty() ? fs::path() : options.box_dir / name;
  };
  SpawnOptions spawn;
  spawn.argv = options.command;
  spawn.envs = {"PATH=" + std::string(kLocalPath)};
  spawn.workdir = options.box_dir;
  spawn.stdin_file = in_box(options.stdin_file);
  spawn.stdout_file = in_box(options.stdout_file);
  spawn.stderr_file = in_box(options.stderr_file);
  spawn.apply_rlimits = true;
  spawn.limits = options.limits;
  auto child = ChildProcess::Spawn(spawn, error_msg);
  if (!child) return nullptr;
  return std::make_unique<LocalProcess>(std::move(child), options.limits);
}

bool LocalSandbox::Cleanup(int box_id, std::string* error_msg) {
  if (!RemoveAll(BoxDir(box_id))) {
    *error_msg = fmt::format("cannot remove {}", BoxDir(box_id).c_str());
    return false;
  }
  return true;
}
