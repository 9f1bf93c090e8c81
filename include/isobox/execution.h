#ifndef INCLUDE_ISOBOX_EXECUTION_H_
#define INCLUDE_ISOBOX_EXECUTION_H_

#include <mutex>
#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <unordered_map>

#include <nlohmann/json_fwd.hpp>
#include "limits.h"

// resource verdicts are checked before SIG/RE (see classifier.h)
#define ENUM_VERDICT_ \
  X(OK, "OK", "Ok") \
  X(RE, "RE", "Runtime Error (exited with nonzero status)") \
  X(TLE, "TLE", "Time Limit Exceeded") \
  X(MLE, "MLE", "Memory Limit Exceeded") \
  X(OLE, "OLE", "Output Limit Exceeded") \
  X(SE, "SE", "Sandbox Setup Failure") \
  X(SIG, "SIG", "Runtime Error (exited with signal)")
enum class Verdict {
#define X(name, abr, desc) name,
  ENUM_VERDICT_
#undef X
};

#define ENUM_EXECUTE_STATUS_ \
  X(OK) \
  X(POOL_EXHAUSTED_TIMEOUT) \
  X(CANCELLED) \
  X(INVALID_REQUEST)
enum class ExecuteStatus {
#define X(name) name,
  ENUM_EXECUTE_STATUS_
#undef X
};

#define ENUM_TERMINATION_CAUSE_ \
  X(NONE) \
  X(EXITED) \
  X(SIGNALED) \
  X(LIMIT_KILLED) /* killed by the sandbox primitive */ \
  X(WATCHDOG) \
  X(CANCELLED) \
  X(SETUP_FAILED)
enum class TerminationCause {
#define X(name) name,
  ENUM_TERMINATION_CAUSE_
#undef X
};

struct ExecutionRequest {
  std::filesystem::path executable;
  std::vector<std::string> args;
  // stdin_file takes precedence over stdin_data if non-empty
  std::string stdin_data;
  std::filesystem::path stdin_file;
  LimitSpec limits;
  // host paths receiving the captured streams; empty for none
  std::filesystem::path stdout_file, stderr_file;
};

class ExecutionResult {
 public:
  Verdict verdict;
  TerminationCause cause;
  int exit_code; // valid if cause == EXITED
  int signal; // 0 if not signaled
  int64_t wall_time, cpu_time; // us
  int64_t peak_memory; // bytes
  std::string stdout_data, stderr_data;
  bool output_truncated;
  int box_id;
  std::string message;

  ExecutionResult() :
      verdict(Verdict::SE), cause(TerminationCause::NONE),
      exit_code(0), signal(0),
      wall_time(0), cpu_time(0), peak_memory(0),
      output_truncated(false), box_id(-1) {}

  nlohmann::json ToJson() const;
};

// Shared between a caller and the manager; the caller may Cancel() from any thread
// Subscribers are not part of the observable state, thus Subscribe/Unsubscribe are const.
class Cancellation {
  mutable std::mutex mtx_;
  bool cancelled_;
  mutable long next_id_;
  mutable std::unordered_map<long, std::function<void()>> callbacks_;
 public:
  Cancellation() : cancelled_(false), next_id_(0) {}
  Cancellation(const Cancellation&) = delete;
  Cancellation& operator=(const Cancellation&) = delete;

  void Cancel();
  bool IsCancelled() const;
  // callback is invoked once on Cancel() (outside the lock), or never if
  // unsubscribed before; returns -1 without subscribing if already cancelled
  long Subscribe(std::function<void()>&& callback) const;
  void Unsubscribe(long id) const;
};

#endif  // INCLUDE_ISOBOX_EXECUTION_H_
