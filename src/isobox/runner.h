#ifndef ISOBOX_RUNNER_H_
#define ISOBOX_RUNNER_H_

#include <chrono>
#include <memory>
#include <string>

#include <isobox/sandbox.h>
#include <isobox/box_pool.h>
#include <isobox/execution.h>
#include <isobox/classifier.h>

#define ENUM_RUNNER_STATE_ \
  X(RESERVED) \
  X(CONFIGURING) \
  X(RUNNING) \
  X(EXITED) \
  X(KILLED) \
  X(COLLECTING_METRICS) \
  X(CLEANING) \
  X(DONE)
enum class RunnerState {
#define X(name) name,
  ENUM_RUNNER_STATE_
#undef X
};

const char* RunnerStateName(RunnerState);

// Drives one execution through a reserved slot. Single use; the slot is always
// released by the time Run() returns.
class ExecutionRunner {
 public:
  using Clock = SandboxProcess::Clock;
 private:
  BoxPool& pool_;
  Sandbox& sandbox_;
  const BoxLease lease_;
  const ExecutionRequest& req_;
  const LimitSpec limits_; // effective
  const std::chrono::microseconds watchdog_margin_;
  const Cancellation* cancel_;

  RunnerState state_;
  std::filesystem::path box_dir_;
  RunOptions run_opt_;
  RawOutcome raw_;

  void SetState_(RunnerState);
  bool SetupFailed_(const std::string& msg);
  bool CancelledBeforeStart_();
  bool Configure_();
  bool Launch_(std::unique_ptr<SandboxProcess>* proc);
  void Supervise_(SandboxProcess& proc);
  void CollectMetrics_(SandboxProcess& proc);
  bool Clean_();
 public:
  ExecutionRunner(BoxPool& pool, Sandbox& sandbox, const BoxLease& lease,
                  const ExecutionRequest& req, const LimitSpec& effective_limits,
                  std::chrono::microseconds watchdog_margin, const Cancellation* cancel) :
      pool_(pool), sandbox_(sandbox), lease_(lease), req_(req), limits_(effective_limits),
      watchdog_margin_(watchdog_margin), cancel_(cancel), state_(RunnerState::RESERVED) {}
  ExecutionRunner(const ExecutionRunner&) = delete;
  ExecutionRunner& operator=(const ExecutionRunner&) = delete;

  const RawOutcome& Run();
};

#endif  // ISOBOX_RUNNER_H_
