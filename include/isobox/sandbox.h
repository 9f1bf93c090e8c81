#ifndef INCLUDE_ISOBOX_SANDBOX_H_
#define INCLUDE_ISOBOX_SANDBOX_H_

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

#include "limits.h"

// Settings of one run inside an initialized box.
struct RunOptions {
  int box_id;
  std::filesystem::path box_dir; // as returned by Sandbox::Init
  // relative to box_dir; command[0] is the program
  std::vector<std::string> command;
  std::string stdin_file, stdout_file, stderr_file;
  LimitSpec limits;

  RunOptions() : box_id(-1) {}
};

// Measurements reported by the primitive after the child is gone.
struct RunStats {
  bool exited; // normal exit; exit_code valid
  int exit_code;
  int signal; // 0 if not signaled
  bool time_killed; // killed by the primitive's time limits
  bool memory_killed; // killed by the primitive's memory limit (OOM)
  bool internal_error; // the primitive failed; nothing else here is reliable
  int64_t wall_time, cpu_time; // us
  int64_t peak_memory; // bytes
  std::string message;

  RunStats() :
      exited(false), exit_code(0), signal(0),
      time_killed(false), memory_killed(false), internal_error(false),
      wall_time(0), cpu_time(0), peak_memory(0) {}
};

class SandboxProcess {
 public:
  using Clock = std::chrono::steady_clock;

  virtual ~SandboxProcess() = default;
  // returns true once the child has terminated and was reaped
  virtual bool WaitUntil(Clock::time_point deadline) = 0;
  // force-terminate; the child still has to be reaped by WaitUntil
  virtual void Kill() = 0;
  // only valid after WaitUntil returned true
  virtual bool Collect(RunStats* stats, std::string* error_msg) = 0;
};

// Narrow control surface of an isolation primitive, addressed by box id.
// Implementations must be safe to use concurrently on distinct box ids.
class Sandbox {
 public:
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;

  // Creates an empty box and sets box_dir to the directory the program runs in.
  virtual bool Init(int box_id, std::filesystem::path* box_dir, std::string* error_msg) = 0;
  // Starts the program. Returns nullptr and sets error_msg on failure.
  virtual std::unique_ptr<SandboxProcess> Launch(const RunOptions& options, std::string* error_msg) = 0;
  // Kills leftovers and removes everything inside the box.
  virtual bool Cleanup(int box_id, std::string* error_msg) = 0;
};

#endif  // INCLUDE_ISOBOX_SANDBOX_H_
