#include <isobox/isolate.h>

#include <signal.h>
#include <sys/wait.h>
#include <cmath>
#include <cctype>
#include <cstdlib>
#include <charconv>
#include <sstream>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include "process.h"
#include "utils.h"

namespace {

// time given to isolate to tear down the box after SIGTERM
constexpr auto kKillGrace = std::chrono::milliseconds(200);

constexpr int64_t kAddressSpaceMargin = 64L << 20;

inline int64_t CeilKib(int64_t bytes) {
  return (bytes + 1023) / 1024;
}

std::vector<std::string> BaseCommand(const IsolateOptions& opt, int box_id) {
  std::vector<std::string> ret = {opt.isolate_path.string(), fmt::format("--box-id={}", box_id)};
  if (opt.use_cgroups) ret.push_back("--cg");
  return ret;
}

class IsolateProcess : public SandboxProcess {
  std::unique_ptr<ChildProcess> child_;
  fs::path meta_file_;
  bool escalate_;
  Clock::time_point kill_deadline_;
 public:
  IsolateProcess(std::unique_ptr<ChildProcess>&& child, const fs::path& meta_file) :
      child_(std::move(child)), meta_file_(meta_file), escalate_(false) {}

  bool WaitUntil(Clock::time_point deadline) override {
    if (escalate_) {
      if (child_->WaitUntil(std::min(deadline, kill_deadline_))) return true;
      if (Clock::now() < kill_deadline_) return false;
      spdlog::warn("isolate pid={} ignored SIGTERM, sending SIGKILL", child_->pid());
      child_->Signal(SIGKILL);
      escalate_ = false;
    }
    return child_->WaitUntil(deadline);
  }

  // isolate kills the whole box when it is terminated
  void Kill() override {
    if (child_->reaped() || escalate_) return;
    child_->Signal(SIGTERM);
    escalate_ = true;
    kill_deadline_ = Clock::now() + kKillGrace;
  }

  bool Collect(RunStats* stats, std::string* error_msg) override {
    if (!child_->reaped()) {
      *error_msg = "isolate is still running";
      return false;
    }
    *stats = RunStats();
    int status = child_->status();
    if (WIFSIGNALED(status) || WEXITSTATUS(status) >= 2) {
      stats->internal_error = true;
      stats->wall_time = child_->WallTimeUs();
      stats->message = WIFSIGNALED(status) ?
          fmt::format("isolate killed by signal {}", WTERMSIG(status)) :
          fmt::format("isolate exited with status {}", WEXITSTATUS(status));
      return true;
    }
    std::string content;
    bool truncated;
    if (!ReadFileBounded(meta_file_, 0, &content, &truncated)) {
      *error_msg = fmt::format("cannot read meta file {}", meta_file_.c_str());
      return false;
    }
    if (!ParseIsolateMeta(content, stats)) {
      *error_msg = fmt::format("malformed meta file {}", meta_file_.c_str());
      return false;
    }
    return true;
  }
};

template <class T> bool ParseInt(const std::string& str, T* value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), *value);
  return ec == std::errc() && ptr == str.data() + str.size();
}

// seconds with a fractional part -> us
bool ParseSeconds(const std::string& str, int64_t* value) {
  if (str.empty()) return false;
  char* end;
  double sec = strtod(str.c_str(), &end);
  if (*end || !std::isfinite(sec) || sec < 0) return false;
  *value = std::llround(sec * 1e6);
  return true;
}

} // namespace

bool ParseIsolateMeta(const std::string& content, RunStats* stats) {
  std::istringstream fin(content);
  std::string line, status;
  int64_t max_rss = 0, cg_mem = 0;
  bool any = false, has_signal = false;
  while (std::getline(fin, line)) {
    if (line.empty()) continue;
    size_t pos = line.find(':');
    if (pos == std::string::npos) return false;
    std::string key = line.substr(0, pos), value = line.substr(pos + 1);
    bool ok = true;
    if (key == "time") {
      ok = ParseSeconds(value, &stats->cpu_time);
    } else if (key == "time-wall") {
      ok = ParseSeconds(value, &stats->wall_time);
    } else if (key == "max-rss") {
      ok = ParseInt(value, &max_rss);
    } else if (key == "cg-mem") {
      ok = ParseInt(value, &cg_mem);
    } else if (key == "exitcode") {
      ok = ParseInt(value, &stats->exit_code);
    } else if (key == "exitsig") {
      ok = ParseInt(value, &stats->signal);
      has_signal = true;
    } else if (key == "status") {
      status = value;
    } else if (key == "message") {
      stats->message = value;
    } else if (key == "cg-oom-killed") {
      stats->memory_killed = true;
    } // killed, csw-*, cg-enabled: not needed
    if (!ok) return false;
    any = true;
  }
  if (!any) return false;
  stats->peak_memory = std::max(max_rss, cg_mem) * 1024;
  stats->time_killed = status == "TO";
  stats->internal_error = status == "XX";
  stats->exited = !has_signal && status != "TO" && status != "XX";
  return true;
}

fs::path IsolateSandbox::MetaFile(int box_id) const {
  return opt_.meta_root / ("box-" + PadInt(box_id, 4) + ".meta");
}

std::vector<std::string> IsolateSandbox::RunCommand(const RunOptions& options) const {
  const LimitSpec& lim = options.limits;
  std::vector<std::string> ret = BaseCommand(opt_, options.box_id);
  ret.push_back("--meta=" + MetaFile(options.box_id).string());
  if (lim.HasCpuTime()) ret.push_back(fmt::format("--time={:.3f}", lim.cpu_time / 1e6));
  if (lim.HasWallTime()) ret.push_back(fmt::format("--wall-time={:.3f}", lim.wall_time / 1e6));
  if (lim.HasMemory()) {
    if (opt_.use_cgroups) {
      ret.push_back(fmt::format("--cg-mem={}", CeilKib(lim.memory)));
    } else {
      // an address space limit fails allocations instead of killing; the room
      // above the limit lets the resident set reach it so that MLE is observable
      ret.push_back(fmt::format("--mem={}", CeilKib(lim.memory * 2 + kAddressSpaceMargin)));
    }
  }
  // bare --processes means no limit
  ret.push_back(lim.processes > 0 ? fmt::format("--processes={}", lim.processes) : "--processes");
  // one extra KiB so that exceeding the limit is observable
  if (lim.HasOutput()) ret.push_back(fmt::format("--fsize={}", CeilKib(lim.output) + 1));
  if (lim.stack > 0) ret.push_back(fmt::format("--stack={}", CeilKib(lim.stack)));
  ret.push_back("--env=PATH=" + opt_.env_path);
  if (options.stdin_file.size()) ret.push_back("--stdin=" + options.stdin_file);
  if (options.stdout_file.size()) ret.push_back("--stdout=" + options.stdout_file);
  if (options.stderr_file.size()) ret.push_back("--stderr=" + options.stderr_file);
  ret.push_back("--run");
  ret.push_back("--");
  ret.insert(ret.end(), options.command.begin(), options.command.end());
  return ret;
}

bool IsolateSandbox::Init(int box_id, fs::path* box_dir, std::string* error_msg) {
  if (!CreateDirs(opt_.meta_root, kPerm755)) {
    *error_msg = fmt::format("cannot create {}", opt_.meta_root.c_str());
    return false;
  }
  std::error_code ec;
  fs::remove(MetaFile(box_id), ec);

  std::vector<std::string> cmd = BaseCommand(opt_, box_id);
  cmd.push_back("--init");
  std::string output;
  int ret = ::RunCommand(cmd, &output);
  if (ret != 0) {
    *error_msg = fmt::format("isolate --init exited with {}", ret);
    return false;
  }
  while (output.size() && isspace((unsigned char)output.back())) output.pop_back();
  if (output.empty()) {
    *error_msg = "isolate --init printed no box path";
    return false;
  }
  *box_dir = fs::path(output) / "box";
  spdlog::debug("Box {} initialized at {}", box_id, box_dir->c_str());
  return true;
}

std::unique_ptr<SandboxProcess> IsolateSandbox::Launch(const RunOptions& options, std::string* error_msg) {
  SpawnOptions spawn;
  spawn.argv = RunCommand(options);
  spawn.search_path = true;
  auto child = ChildProcess::Spawn(spawn, error_msg);
  if (!child) return nullptr;
  return std::make_unique<IsolateProcess>(std::move(child), MetaFile(options.box_id));
}

bool IsolateSandbox::Cleanup(int box_id, std::string* error_msg) {
  std::vector<std::string> cmd = BaseCommand(opt_, box_id);
  cmd.push_back("--cleanup");
  int ret = ::RunCommand(cmd, nullptr);
  std::error_code ec;
  fs::remove(MetaFile(box_id), ec);
  if (ret != 0) {
    *error_msg = fmt::format("isolate --cleanup exited with {}", ret);
    return false;
  }
  return true;
}
