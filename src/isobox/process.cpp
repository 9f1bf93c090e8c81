#include "process.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <limits>
#include <thread>
#include <fstream>

#include <spdlog/spdlog.h>
#include <fmt/ranges.h>

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(1);

#define ENUM_SPAWN_STAGE_ \
  X(SETSID, "setsid") \
  X(OPEN_STDIN, "open stdin") \
  X(OPEN_STDOUT, "open stdout") \
  X(OPEN_STDERR, "open stderr") \
  X(CHDIR, "chdir") \
  X(REDIR, "redir") \
  X(SETRLIMIT, "setrlimit") \
  X(EXEC, "exec")
enum class SpawnStage {
#define X(name, desc) name,
  ENUM_SPAWN_STAGE_
#undef X
};

const char* kSpawnStageTable[] = {
#define X(name, desc) desc,
  ENUM_SPAWN_STAGE_
#undef X
};

struct ChildError {
  SpawnStage stage;
  int err;
};

// Only async-signal-safe calls from here on; everything is prepared before fork
[[noreturn]] void Child(int errfd, const SpawnOptions& opt,
                        char* const* argv, char* const* envp) {
  auto die = [errfd](SpawnStage stage) {
    ChildError error{stage, errno};
    IGNORE_RETURN(write(errfd, &error, sizeof(error)));
    _exit(127);
  };
  // new session so that the whole tree can be killed at once
  if (setsid() < 0) die(SpawnStage::SETSID);

  auto open_or_null = [](const fs::path& path, int flags) {
    if (path.empty()) return open("/dev/null", O_RDWR | O_CLOEXEC);
    return open(path.c_str(), flags | O_CLOEXEC, 0644);
  };
  int fd_input = open_or_null(opt.stdin_file, O_RDONLY);
  if (fd_input < 0) die(SpawnStage::OPEN_STDIN);
  int fd_output = open_or_null(opt.stdout_file, O_WRONLY | O_CREAT | O_TRUNC);
  if (fd_output < 0) die(SpawnStage::OPEN_STDOUT);
  int fd_error = open_or_null(opt.stderr_file, O_WRONLY | O_CREAT | O_TRUNC);
  if (fd_error < 0) die(SpawnStage::OPEN_STDERR);
  if (!opt.workdir.empty() && chdir(opt.workdir.c_str()) < 0) die(SpawnStage::CHDIR);
  if (dup2(fd_input, 0) < 0 || dup2(fd_output, 1) < 0 || dup2(fd_error, 2) < 0) {
    die(SpawnStage::REDIR);
  }

  if (opt.apply_rlimits) {
    const LimitSpec& lim = opt.limits;
    struct rlimit rlim {};
    auto set_rlimit = [&](int resource, rlim_t value) {
      rlim.rlim_cur = rlim.rlim_max = value;
      if (setrlimit(resource, &rlim) < 0) die(SpawnStage::SETRLIMIT);
    };
    if (lim.HasCpuTime()) set_rlimit(RLIMIT_CPU, (lim.cpu_time + 999'999) / 1'000'000);
    // one byte of slack so that exceeding the limit is observable from the file size
    if (lim.HasOutput()) set_rlimit(RLIMIT_FSIZE, lim.output + 1);
    if (lim.processes > 0) set_rlimit(RLIMIT_NPROC, lim.processes);
    if (lim.stack > 0) set_rlimit(RLIMIT_STACK, lim.stack);
    set_rlimit(RLIMIT_CORE, 0);
  }

  if (opt.search_path) {
    execvpe(argv[0], argv, envp);
  } else {
    execve(argv[0], argv, envp);
  }
  die(SpawnStage::EXEC);
  __builtin_unreachable();
}

} // namespace

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const SpawnOptions& opt, std::string* error_msg) {
  if (opt.argv.empty()) {
    *error_msg = "spawn: empty command";
    return nullptr;
  }
  std::vector<char*> argv, envp;
  for (auto& i : opt.argv) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  if (opt.envs.empty()) {
    for (char** env = environ; *env; env++) envp.push_back(*env);
  } else {
    for (auto& i : opt.envs) envp.push_back(const_cast<char*>(i.c_str()));
  }
  envp.push_back(nullptr);

  int errpipe[2];
  if (pipe2(errpipe, O_CLOEXEC) < 0) {
    *error_msg = ErrnoMessage("pipe", errno);
    return nullptr;
  }
  pid_t pid = fork();
  if (pid < 0) {
    *error_msg = ErrnoMessage("fork", errno);
    close(errpipe[0]);
    close(errpipe[1]);
    return nullptr;
  }
  if (pid == 0) {
    close(errpipe[0]);
    Child(errpipe[1], opt, argv.data(), envp.data());
  }
  close(errpipe[1]);
  std::unique_ptr<ChildProcess> ret(new ChildProcess(pid));
  spdlog::debug("Spawned pid={} command={}", pid, fmt::format("{}", opt.argv));

  // the pipe is closed without data on successful exec
  ChildError error;
  ssize_t len;
  while ((len = read(errpipe[0], &error, sizeof(error))) < 0 && errno == EINTR);
  close(errpipe[0]);
  if (len == (ssize_t)sizeof(error)) {
    *error_msg = ErrnoMessage(kSpawnStageTable[(int)error.stage], error.err);
    return nullptr; // the destructor reaps the child
  }
  return ret;
}

ChildProcess::~ChildProcess() {
  if (reaped_) return;
  Signal(SIGKILL);
  while (waitpid(pid_, nullptr, 0) < 0 && errno == EINTR);
}

bool ChildProcess::WaitUntil(Clock::time_point deadline) {
  while (!reaped_) {
    pid_t ret = wait4(pid_, &status_, WNOHANG, &rusage_);
    if (ret == pid_) {
      end_ = Clock::now();
      reaped_ = true;
      break;
    }
    if (ret < 0 && errno != EINTR) {
      // ECHILD: someone else reaped it; nothing can be measured
      spdlog::warn("wait4 pid={} error: {}", pid_, strerror(errno));
      end_ = Clock::now();
      status_ = W_EXITCODE(255, 0);
      reaped_ = true;
      break;
    }
    auto now = Clock::now();
    if (now >= deadline) return false;
    std::this_thread::sleep_for(std::min<Clock::duration>(kPollInterval, deadline - now));
  }
  return true;
}

void ChildProcess::Signal(int sig) {
  if (reaped_) return;
  spdlog::debug("Send signal {} to pid={}", sig, pid_);
  kill(-pid_, sig);
  kill(pid_, sig); // in case setsid failed
}

void ChildProcess::KillGroup() {
  if (kill(-pid_, SIGKILL) == 0) spdlog::debug("Killed leftovers of pid={}", pid_);
}

int64_t ChildProcess::ResidentMemory() const {
  if (reaped_) return -1;
  std::ifstream fin(fmt::format("/proc/{}/status", pid_));
  std::string key;
  while (fin >> key) {
    if (key == "VmRSS:") {
      int64_t kib;
      if (!(fin >> kib)) return -1;
      return kib * 1024;
    }
    fin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
  }
  return -1; // zombies have no VmRSS line
}

int64_t ChildProcess::WallTimeUs() const {
  return std::chrono::duration_cast<std::chrono::microseconds>(end_ - start_).count();
}
