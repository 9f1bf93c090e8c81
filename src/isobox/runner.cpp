#include "runner.h"

#include <csignal>
#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include "utils.h"

namespace {

constexpr auto kSupervisionSlice = std::chrono::milliseconds(10);

// stream files inside the box
const char kStdinName[] = "stdin";
const char kStdoutName[] = "stdout";
const char kStderrName[] = "stderr";

} // namespace

const char* RunnerStateName(RunnerState state) {
  switch (state) {
#define X(name) case RunnerState::name: return #name;
    ENUM_RUNNER_STATE_
#undef X
  }
  __builtin_unreachable();
}

void ExecutionRunner::SetState_(RunnerState state) {
  spdlog::debug("Runner box {}: {} -> {}", lease_.id, RunnerStateName(state_), RunnerStateName(state));
  state_ = state;
}

bool ExecutionRunner::SetupFailed_(const std::string& msg) {
  spdlog::warn("Setup failed on box {}: {}", lease_.id, msg);
  raw_.setup_failed = true;
  raw_.message = msg;
  return false;
}

bool ExecutionRunner::CancelledBeforeStart_() {
  if (!cancel_ || !cancel_->IsCancelled()) return false;
  spdlog::info("Box {}: cancelled before start", lease_.id);
  raw_.cancelled = true;
  raw_.message = "cancelled before start";
  return true;
}

bool ExecutionRunner::Configure_() {
  SetState_(RunnerState::CONFIGURING);
  if (CancelledBeforeStart_()) return false;
  std::string error;
  if (lease_.dirty) {
    spdlog::info("Box {} was left dirty, resetting", lease_.id);
    if (!sandbox_.Cleanup(lease_.id, &error)) return SetupFailed_("reset box: " + error);
  }
  if (!sandbox_.Init(lease_.id, &box_dir_, &error)) return SetupFailed_("init box: " + error);
  pool_.SetWorkdir(lease_, box_dir_);

  std::error_code ec;
  if (!fs::is_regular_file(req_.executable, ec)) {
    return SetupFailed_(fmt::format("executable {} not found", req_.executable.c_str()));
  }
  std::string name = req_.executable.filename();
  if (name == kStdinName || name == kStdoutName || name == kStderrName) name = "prog-" + name;
  if (!Copy(req_.executable, box_dir_ / name, kPerm755)) {
    return SetupFailed_(fmt::format("cannot copy executable {}", req_.executable.c_str()));
  }
  if (!req_.stdin_file.empty()) {
    if (!Copy(req_.stdin_file, box_dir_ / kStdinName, kPerm644)) {
      return SetupFailed_(fmt::format("cannot copy input {}", req_.stdin_file.c_str()));
    }
  } else if (!WriteFile(box_dir_ / kStdinName, req_.stdin_data, kPerm644)) {
    return SetupFailed_("cannot write input");
  }

  run_opt_.box_id = lease_.id;
  run_opt_.box_dir = box_dir_;
  run_opt_.command.push_back("./" + name);
  run_opt_.command.insert(run_opt_.command.end(), req_.args.begin(), req_.args.end());
  run_opt_.stdin_file = kStdinName;
  run_opt_.stdout_file = kStdoutName;
  run_opt_.stderr_file = kStderrName;
  run_opt_.limits = limits_;
  return true;
}

bool ExecutionRunner::Launch_(std::unique_ptr<SandboxProcess>* proc) {
  // configuring can take a while; do not start a program nobody waits for
  if (CancelledBeforeStart_()) return false;
  std::string error;
  *proc = sandbox_.Launch(run_opt_, &error);
  if (!*proc) return SetupFailed_("launch: " + error);
  pool_.Transition(lease_, SlotState::RUNNING);
  SetState_(RunnerState::RUNNING);
  return true;
}

void ExecutionRunner::Supervise_(SandboxProcess& proc) {
  const bool has_deadline = limits_.HasWallTime();
  const auto deadline = Clock::now() + std::chrono::microseconds(limits_.wall_time) + watchdog_margin_;
  bool killed = false;
  while (true) {
    auto until = Clock::now() + kSupervisionSlice;
    if (has_deadline && !killed) until = std::min(until, deadline);
    if (proc.WaitUntil(until)) break;
    if (killed) continue;
    if (cancel_ && cancel_->IsCancelled()) {
      spdlog::info("Box {}: cancelled, killing", lease_.id);
      raw_.cancelled = true;
      raw_.message = "cancelled";
    } else if (has_deadline && Clock::now() >= deadline) {
      spdlog::warn("Box {}: still running {}us past the wall limit, killing",
                   lease_.id, watchdog_margin_.count());
      raw_.watchdog_killed = true;
      raw_.message = "killed by watchdog";
    } else {
      continue;
    }
    proc.Kill();
    killed = true;
  }
  SetState_(killed ? RunnerState::KILLED : RunnerState::EXITED);
}

void ExecutionRunner::CollectMetrics_(SandboxProcess& proc) {
  SetState_(RunnerState::COLLECTING_METRICS);
  std::string error;
  RunStats& st = raw_.stats;
  if (!proc.Collect(&st, &error)) {
    spdlog::warn("Box {}: failed to collect results: {}", lease_.id, error);
    st.internal_error = true;
    if (raw_.message.empty()) raw_.message = "collect: " + error;
  } else if (st.internal_error && raw_.message.empty()) {
    raw_.message = st.message;
  }

  bool out_truncated = false, err_truncated = false;
  if (!ReadFileBounded(box_dir_ / kStdoutName, limits_.output, &raw_.stdout_data, &out_truncated)) {
    spdlog::warn("Box {}: cannot read stdout", lease_.id);
  }
  if (!ReadFileBounded(box_dir_ / kStderrName, limits_.output, &raw_.stderr_data, &err_truncated)) {
    spdlog::warn("Box {}: cannot read stderr", lease_.id);
  }
  raw_.output_truncated = out_truncated || err_truncated || (!st.exited && st.signal == SIGXFSZ);

  if (!req_.stdout_file.empty() && !WriteFile(req_.stdout_file, raw_.stdout_data)) {
    spdlog::warn("Box {}: cannot save stdout to {}", lease_.id, req_.stdout_file.c_str());
  }
  if (!req_.stderr_file.empty() && !WriteFile(req_.stderr_file, raw_.stderr_data)) {
    spdlog::warn("Box {}: cannot save stderr to {}", lease_.id, req_.stderr_file.c_str());
  }
}

bool ExecutionRunner::Clean_() {
  SetState_(RunnerState::CLEANING);
  pool_.Transition(lease_, SlotState::CLEANING);
  std::string error;
  bool clean = sandbox_.Cleanup(lease_.id, &error);
  if (!clean) spdlog::warn("Box {}: cleanup failed: {}", lease_.id, error);
  pool_.Release(lease_, clean);
  SetState_(RunnerState::DONE);
  return clean;
}

const RawOutcome& ExecutionRunner::Run() {
  std::unique_ptr<SandboxProcess> proc;
  try {
    if (Configure_() && Launch_(&proc)) {
      Supervise_(*proc);
      CollectMetrics_(*proc);
    }
  } catch (const std::exception& e) {
    // the slot is still cleaned and released below
    spdlog::error("Box {}: exception in state {}: {}", lease_.id, RunnerStateName(state_), e.what());
    SetupFailed_(fmt::format("internal error: {}", e.what()));
  }
  proc.reset(); // kills the program if it is still running
  Clean_();
  return raw_;
}
