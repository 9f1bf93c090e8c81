#ifndef FAKE_SANDBOX_H_
#define FAKE_SANDBOX_H_

#include <set>
#include <mutex>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include <filesystem>

#include <isobox/sandbox.h>
#include <isobox/execution.h>

// What the next launched program does
struct FakeBehavior {
  std::chrono::milliseconds duration{0}; // exits after this long unless killed
  RunStats stats; // reported by Collect; wall_time 0 means measured
  std::string stdout_data, stderr_data;
  bool fail_init = false;
  bool fail_launch = false;
  bool fail_cleanup = false;
  bool throw_on_launch = false;
  Cancellation* cancel_on_init = nullptr; // cancelled once the box is initialized
};

// Scripted primitive recording how boxes are used. A box counts as active from
// Init to Cleanup; two holders being active on the same box is recorded as overlap.
class FakeSandbox : public Sandbox {
  friend class FakeProcess;

  mutable std::mutex mtx_;
  std::filesystem::path root_;
  FakeBehavior behavior_;
  std::set<int> active_;
  std::vector<std::string> calls_;
  int running_, max_running_, launches_;
  bool overlap_;

  void OnExit_();
 public:
  explicit FakeSandbox(const std::filesystem::path& root) :
      root_(root), running_(0), max_running_(0), launches_(0), overlap_(false) {}

  void SetBehavior(const FakeBehavior& behavior);

  bool Init(int box_id, std::filesystem::path* box_dir, std::string* error_msg) override;
  std::unique_ptr<SandboxProcess> Launch(const RunOptions& options, std::string* error_msg) override;
  bool Cleanup(int box_id, std::string* error_msg) override;

  // e.g. "init:0", "launch:0", "cleanup:0"
  std::vector<std::string> Calls() const;
  int Running() const;
  int MaxRunning() const;
  int Launches() const;
  bool Overlapped() const;
  std::filesystem::path BoxDir(int box_id) const;
};

#endif  // FAKE_SANDBOX_H_
