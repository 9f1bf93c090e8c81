#include <isobox/limits.h>

#include <fmt/core.h>

bool LimitSpec::Validate(std::string* error_msg) const {
  auto fail = [error_msg](const char* msg) {
    if (error_msg) *error_msg = msg;
    return false;
  };
  if (wall_time < 0) return fail("wall time limit is negative");
  if (cpu_time < 0) return fail("cpu time limit is negative");
  if (memory < 0) return fail("memory limit is negative");
  if (output < 0) return fail("output limit is negative");
  if (processes < 0) return fail("process limit is negative");
  if (stack < 0) return fail("stack limit is negative");
  if (wall_time > kMaxTimeLimit || cpu_time > kMaxTimeLimit) return fail("time limit is too large");
  if (memory > kMaxSizeLimit || output > kMaxSizeLimit || stack > kMaxSizeLimit) {
    return fail("size limit is too large");
  }
  // a process cannot use more cpu time than it is allowed to run
  if (HasWallTime() && HasCpuTime() && wall_time < cpu_time) {
    return fail("wall time limit is less than cpu time limit");
  }
  return true;
}

LimitSpec ClampLimits(const LimitSpec& lim, int64_t max_memory, int64_t max_output) {
  LimitSpec ret = lim;
  if (max_memory > 0 && (!lim.HasMemory() || lim.memory > max_memory)) ret.memory = max_memory;
  if (max_output > 0 && (!lim.HasOutput() || lim.output > max_output)) ret.output = max_output;
  return ret;
}

std::string LimitsToString(const LimitSpec& lim) {
  return fmt::format("wall={}us cpu={}us mem={}B output={}B proc={} stack={}B",
                     lim.wall_time, lim.cpu_time, lim.memory, lim.output, lim.processes, lim.stack);
}
