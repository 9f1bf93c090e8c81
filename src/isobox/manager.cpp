#include <isobox/manager.h>

#include <spdlog/spdlog.h>
#include <isobox/utils.h>
#include <isobox/classifier.h>
#include "runner.h"

namespace {

struct InFlightGuard {
  std::atomic_int& cnt;
  explicit InFlightGuard(std::atomic_int& c) : cnt(c) { cnt++; }
  ~InFlightGuard() { cnt--; }
};

} // namespace

ExecutionManager::ExecutionManager(BoxPool& pool, Sandbox& sandbox, const ManagerConfig& config) :
    pool_(pool), sandbox_(sandbox), config_(config), request_seq_(0), in_flight_(0) {}

ExecuteStatus ExecutionManager::Execute(const ExecutionRequest& req, ExecutionResult* result,
                                        const Cancellation* cancel) {
  long id = ++request_seq_;
  std::string error;
  if (req.executable.empty()) {
    spdlog::warn("Request {} rejected: no executable", id);
    return ExecuteStatus::INVALID_REQUEST;
  }
  if (!req.limits.Validate(&error)) {
    spdlog::warn("Request {} rejected: {}", id, error);
    return ExecuteStatus::INVALID_REQUEST;
  }
  InFlightGuard guard(in_flight_);

  BoxLease lease;
  ExecuteStatus status = pool_.Acquire(std::chrono::microseconds(config_.acquire_timeout), cancel, &lease);
  if (status != ExecuteStatus::OK) {
    spdlog::info("Request {} did not get a box: {}", id, ExecuteStatusName(status));
    return status;
  }
  LimitSpec limits = ClampLimits(req.limits, config_.max_memory, config_.max_output);
  spdlog::debug("Request {} on box {}: {} {}", id, lease.id, req.executable.c_str(), LimitsToString(limits));

  ExecutionRunner runner(pool_, sandbox_, lease, req, limits,
                         std::chrono::microseconds(config_.watchdog_margin), cancel);
  const RawOutcome& raw = runner.Run();

  *result = ExecutionResult();
  result->verdict = ClassifyVerdict(raw, limits);
  result->cause = TerminationCauseOf(raw);
  result->box_id = lease.id;
  result->message = raw.message;
  if (!raw.setup_failed) {
    const RunStats& st = raw.stats;
    result->exit_code = st.exited ? st.exit_code : 0;
    result->signal = st.exited ? 0 : st.signal;
    result->wall_time = st.wall_time;
    result->cpu_time = st.cpu_time;
    result->peak_memory = st.peak_memory;
    result->stdout_data = raw.stdout_data;
    result->stderr_data = raw.stderr_data;
    result->output_truncated = raw.output_truncated;
  }
  spdlog::info("Request {} on box {}: {} ({}) exit={} sig={} wall={}us cpu={}us mem={}B",
               id, lease.id, VerdictToAbr(result->verdict), TerminationCauseName(result->cause),
               result->exit_code, result->signal, result->wall_time, result->cpu_time,
               result->peak_memory);
  return raw.cancelled ? ExecuteStatus::CANCELLED : ExecuteStatus::OK;
}
