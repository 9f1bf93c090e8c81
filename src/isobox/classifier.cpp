#include <isobox/classifier.h>

#include <csignal>

namespace {

inline bool ForcedKill(const RawOutcome& raw) {
  return raw.setup_failed || raw.watchdog_killed || raw.cancelled || raw.stats.internal_error;
}

} // namespace

Verdict ClassifyVerdict(const RawOutcome& raw, const LimitSpec& lim) {
  // nothing measured is trustworthy if the run did not complete under the primitive's control
  if (ForcedKill(raw)) return Verdict::SE;

  const RunStats& st = raw.stats;
  if (st.time_killed ||
      (lim.HasWallTime() && st.wall_time >= lim.wall_time) ||
      (lim.HasCpuTime() && st.cpu_time >= lim.cpu_time)) {
    return Verdict::TLE;
  }
  if (st.memory_killed || (lim.HasMemory() && st.peak_memory >= lim.memory)) {
    return Verdict::MLE;
  }
  if (raw.output_truncated) return Verdict::OLE;
  if (!st.exited) return Verdict::SIG;
  if (st.exit_code != 0) return Verdict::RE;
  return Verdict::OK;
}

TerminationCause TerminationCauseOf(const RawOutcome& raw) {
  if (raw.setup_failed || raw.stats.internal_error) return TerminationCause::SETUP_FAILED;
  if (raw.cancelled) return TerminationCause::CANCELLED;
  if (raw.watchdog_killed) return TerminationCause::WATCHDOG;
  if (raw.stats.time_killed || raw.stats.memory_killed) return TerminationCause::LIMIT_KILLED;
  if (raw.stats.exited) return TerminationCause::EXITED;
  return TerminationCause::SIGNALED;
}
