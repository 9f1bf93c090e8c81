#include <thread>
#include <vector>
#include <csignal>

#include <gtest/gtest.h>
#include <isobox/utils.h>
#include <isobox/manager.h>

#include "fake_sandbox.h"
#include "utils.h"

using namespace std::chrono_literals;
namespace fs = std::filesystem;

class ManagerTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    sandbox = std::make_unique<FakeSandbox>(tmp_dir / "boxes");
    config.max_memory = 0;
    config.max_output = 0;
    config.watchdog_margin = 50'000;
    req.executable = WriteExecutable(tmp_dir / "prog", "binary");
    req.limits.wall_time = 1'000'000;
  }

  void Init(size_t boxes) {
    config.boxes = boxes;
    pool = std::make_unique<BoxPool>(boxes);
    manager = std::make_unique<ExecutionManager>(*pool, *sandbox, config);
  }

  std::unique_ptr<FakeSandbox> sandbox;
  std::unique_ptr<BoxPool> pool;
  std::unique_ptr<ExecutionManager> manager;
  ManagerConfig config;
  ExecutionRequest req;
};

TEST_F(ManagerTest, ExitZero) {
  Init(1);
  req.args = {"a", "b"};
  req.stdin_data = "input";
  FakeBehavior behavior;
  behavior.stats.exited = true;
  behavior.stdout_data = "hello";
  behavior.stderr_data = "warning";
  sandbox->SetBehavior(behavior);
  ExecutionResult res;
  ASSERT_EQ(manager->Execute(req, &res), ExecuteStatus::OK);
  EXPECT_EQ(res.verdict, Verdict::OK);
  EXPECT_EQ(res.cause, TerminationCause::EXITED);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.stdout_data, "hello");
  EXPECT_EQ(res.stderr_data, "warning");
  EXPECT_EQ(res.box_id, 0);
  EXPECT_EQ(sandbox->Calls(), (std::vector<std::string>{"init:0", "launch:0", "cleanup:0"}));
  EXPECT_EQ(pool->InUse(), 0);
  EXPECT_EQ(manager->InFlight(), 0);
  // the box is gone after cleaning
  EXPECT_FALSE(fs::exists(sandbox->BoxDir(0)));
}

TEST_F(ManagerTest, Exit42) {
  Init(1);
  FakeBehavior behavior;
  behavior.stats.exited = true;
  behavior.stats.exit_code = 42;
  sandbox->SetBehavior(behavior);
  ExecutionResult res;
  ASSERT_EQ(manager->Execute(req, &res), ExecuteStatus::OK);
  EXPECT_EQ(res.verdict, Verdict::RE);
  EXPECT_EQ(res.exit_code, 42);
}

TEST_F(ManagerTest, TimeOverWallWithinMarginIsTle) {
  Init(1);
  FakeBehavior behavior;
  behavior.stats.exited = false;
  behavior.stats.signal = SIGKILL;
  behavior.stats.wall_time = 1'020'000;
  sandbox->SetBehavior(behavior);
  ExecutionResult res;
  ASSERT_EQ(manager->Execute(req, &res), ExecuteStatus::OK);
  EXPECT_EQ(res.verdict, Verdict::TLE);
}

TEST_F(ManagerTest, MemoryOverLimitIsMle) {
  Init(1);
  req.limits.memory = 64L << 20;
  FakeBehavior behavior;
  behavior.stats.exited = true;
  behavior.stats.exit_code = 1;
  behavior.stats.peak_memory = 64L << 20;
  sandbox->SetBehavior(behavior);
  ExecutionResult res;
  ASSERT_EQ(manager->Execute(req, &res), ExecuteStatus::OK);
  EXPECT_EQ(res.verdict, Verdict::MLE);
  EXPECT_EQ(res.exit_code, 1);
}

TEST_F(ManagerTest, OutputTruncatedToLimit) {
  Init(1);
  req.limits.output = 1000;
  req.stdout_file = tmp_dir / "saved_stdout";
  FakeBehavior behavior;
  behavior.stats.exited = true;
  behavior.stdout_data = std::string(5000, 'a');
  sandbox->SetBehavior(behavior);
  ExecutionResult res;
  ASSERT_EQ(manager->Execute(req, &res), ExecuteStatus::OK);
  EXPECT_EQ(res.verdict, Verdict::OLE);
  EXPECT_TRUE(res.output_truncated);
  EXPECT_EQ(res.stdout_data.size(), 1000);
  EXPECT_EQ(fs::file_size(req.stdout_file), 1000);
}

TEST_F(ManagerTest, HostOutputCap) {
  config.max_output = 10;
  Init(1);
  FakeBehavior behavior;
  behavior.stats.exited = true;
  behavior.stdout_data = "0123456789abc";
  sandbox->SetBehavior(behavior);
  ExecutionResult res;
  ASSERT_EQ(manager->Execute(req, &res), ExecuteStatus::OK);
  EXPECT_EQ(res.verdict, Verdict::OLE);
  EXPECT_EQ(res.stdout_data, "0123456789");
}

TEST_F(ManagerTest, WatchdogIsSetupFailure) {
  Init(1);
  req.limits.wall_time = 50'000;
  FakeBehavior behavior;
  behavior.duration = 10s; // the primitive fails to enforce the wall limit
  behavior.stats.exited = true;
  sandbox->SetBehavior(behavior);
  ExecutionResult res;
  auto start = std::chrono::steady_clock::now();
  ASSERT_EQ(manager->Execute(req, &res), ExecuteStatus::OK);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
  EXPECT_EQ(res.verdict, Verdict::SE);
  EXPECT_EQ(res.cause, TerminationCause::WATCHDOG);
  EXPECT_EQ(pool->InUse(), 0);
}

TEST_F(ManagerTest, InitFailure) {
  Init(1);
  FakeBehavior behavior;
  behavior.fail_init = true;
  sandbox->SetBehavior(behavior);
  ExecutionResult res;
  ASSERT_EQ(manager->Execute(req, &res), ExecuteStatus::OK);
  EXPECT_EQ(res.verdict, Verdict::SE);
  EXPECT_EQ(res.cause, TerminationCause::SETUP_FAILED);
  EXPECT_FALSE(res.message.empty());
  EXPECT_EQ(sandbox->Launches(), 0);
  // cleaning still runs
  EXPECT_EQ(sandbox->Calls(), (std::vector<std::string>{"init:0", "cleanup:0"}));
  EXPECT_EQ(pool->InUse(), 0);
}

TEST_F(ManagerTest, LaunchFailure) {
  Init(1);
  FakeBehavior behavior;
  behavior.fail_launch = true;
  sandbox->SetBehavior(behavior);
  ExecutionResult res;
  ASSERT_EQ(manager->Execute(req, &res), ExecuteStatus::OK);
  EXPECT_EQ(res.verdict, Verdict::SE);
  EXPECT_EQ(sandbox->Calls(), (std::vector<std::string>{"init:0", "launch:0", "cleanup:0"}));
}

TEST_F(ManagerTest, ExceptionStillReleasesBox) {
  Init(1);
  FakeBehavior behavior;
  behavior.throw_on_launch = true;
  sandbox->SetBehavior(behavior);
  ExecutionResult res;
  ASSERT_EQ(manager->Execute(req, &res), ExecuteStatus::OK);
  EXPECT_EQ(res.verdict, Verdict::SE);
  EXPECT_EQ(res.cause, TerminationCause::SETUP_FAILED);
  EXPECT_NE(res.message.find("launch exploded"), std::string::npos);
  EXPECT_EQ(pool->InUse(), 0);
  EXPECT_EQ(pool->Snapshot()[0].state, SlotState::FREE);

  // the only box is usable again
  behavior.throw_on_launch = false;
  behavior.stats.exited = true;
  sandbox->SetBehavior(behavior);
  ASSERT_EQ(manager->Execute(req, &res), ExecuteStatus::OK);
  EXPECT_EQ(res.verdict, Verdict::OK);
  EXPECT_EQ(sandbox->Calls(), (std::vector<std::string>{
    "init:0", "launch:0", "cleanup:0", "init:0", "launch:0", "cleanup:0"}));
}

TEST_F(ManagerTest, CancelBeforeLaunch) {
  Init(1);
  Cancellation cancel;
  FakeBehavior behavior;
  behavior.stats.exited = true;
  behavior.cancel_on_init = &cancel;
  sandbox->SetBehavior(behavior);
  ExecutionResult res;
  EXPECT_EQ(manager->Execute(req, &res, &cancel), ExecuteStatus::CANCELLED);
  EXPECT_EQ(res.verdict, Verdict::SE);
  EXPECT_EQ(res.cause, TerminationCause::CANCELLED);
  EXPECT_EQ(res.box_id, 0);
  EXPECT_EQ(sandbox->Launches(), 0);
  EXPECT_EQ(sandbox->Calls(), (std::vector<std::string>{"init:0", "cleanup:0"}));
  EXPECT_EQ(pool->InUse(), 0);
}

TEST_F(ManagerTest, MissingExecutable) {
  Init(1);
  req.executable = tmp_dir / "no-such-file";
  ExecutionResult res;
  ASSERT_EQ(manager->Execute(req, &res), ExecuteStatus::OK);
  EXPECT_EQ(res.verdict, Verdict::SE);
  EXPECT_EQ(res.cause, TerminationCause::SETUP_FAILED);
  EXPECT_EQ(pool->InUse(), 0);
}

TEST_F(ManagerTest, CleanupFailureKeepsVerdictAndResetsBox) {
  Init(1);
  FakeBehavior behavior;
  behavior.stats.exited = true;
  behavior.fail_cleanup = true;
  sandbox->SetBehavior(behavior);
  ExecutionResult res;
  ASSERT_EQ(manager->Execute(req, &res), ExecuteStatus::OK);
  EXPECT_EQ(res.verdict, Verdict::OK);
  EXPECT_TRUE(pool->Snapshot()[0].dirty);

  behavior.fail_cleanup = false;
  sandbox->SetBehavior(behavior);
  ASSERT_EQ(manager->Execute(req, &res), ExecuteStatus::OK);
  EXPECT_EQ(res.verdict, Verdict::OK);
  EXPECT_FALSE(pool->Snapshot()[0].dirty);
  EXPECT_EQ(sandbox->Calls(), (std::vector<std::string>{
    "init:0", "launch:0", "cleanup:0",
    "cleanup:0", "init:0", "launch:0", "cleanup:0"}));
}

TEST_F(ManagerTest, InvalidRequest) {
  Init(1);
  req.limits.cpu_time = 2'000'000;
  req.limits.wall_time = 1'000'000;
  ExecutionResult res;
  EXPECT_EQ(manager->Execute(req, &res), ExecuteStatus::INVALID_REQUEST);
  req.limits = LimitSpec();
  req.limits.memory = -1;
  EXPECT_EQ(manager->Execute(req, &res), ExecuteStatus::INVALID_REQUEST);
  EXPECT_TRUE(sandbox->Calls().empty());
  EXPECT_EQ(pool->HighWaterMark(), 0);
}

TEST_F(ManagerTest, CancelAfterStart) {
  Init(1);
  req.limits = LimitSpec(); // no watchdog
  FakeBehavior behavior;
  behavior.duration = 30s;
  behavior.stats.exited = true;
  sandbox->SetBehavior(behavior);
  Cancellation cancel;
  ExecutionResult res;
  ExecuteStatus status = ExecuteStatus::OK;
  std::thread thr([&]() { status = manager->Execute(req, &res, &cancel); });
  ASSERT_TRUE(WaitFor([&]() { return sandbox->Running() == 1; }));
  auto start = std::chrono::steady_clock::now();
  cancel.Cancel();
  thr.join();
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
  EXPECT_EQ(status, ExecuteStatus::CANCELLED);
  EXPECT_EQ(res.verdict, Verdict::SE);
  EXPECT_EQ(res.cause, TerminationCause::CANCELLED);
  EXPECT_EQ(res.box_id, 0);
  EXPECT_EQ(pool->InUse(), 0);
  EXPECT_EQ(pool->Snapshot()[0].state, SlotState::FREE);
}

TEST_F(ManagerTest, CancelWhileWaitingForBox) {
  Init(1);
  req.limits = LimitSpec();
  FakeBehavior behavior;
  behavior.duration = 30s;
  behavior.stats.exited = true;
  sandbox->SetBehavior(behavior);
  Cancellation cancel1, cancel2;
  ExecutionResult res1, res2;
  ExecuteStatus status1 = ExecuteStatus::OK, status2 = ExecuteStatus::OK;
  std::thread thr1([&]() { status1 = manager->Execute(req, &res1, &cancel1); });
  ASSERT_TRUE(WaitFor([&]() { return sandbox->Running() == 1; }));
  std::thread thr2([&]() { status2 = manager->Execute(req, &res2, &cancel2); });
  ASSERT_TRUE(WaitFor([&]() { return manager->InFlight() == 2; }));
  cancel2.Cancel();
  thr2.join();
  EXPECT_EQ(status2, ExecuteStatus::CANCELLED);
  EXPECT_EQ(res2.box_id, -1);
  cancel1.Cancel();
  thr1.join();
  EXPECT_EQ(status1, ExecuteStatus::CANCELLED);
  EXPECT_EQ(sandbox->Launches(), 1);
}

TEST_F(ManagerTest, AcquireTimeout) {
  config.acquire_timeout = 50'000;
  Init(1);
  req.limits = LimitSpec();
  FakeBehavior behavior;
  behavior.duration = 30s;
  sandbox->SetBehavior(behavior);
  Cancellation cancel;
  ExecutionResult res1, res2;
  std::thread thr([&]() { manager->Execute(req, &res1, &cancel); });
  ASSERT_TRUE(WaitFor([&]() { return sandbox->Running() == 1; }));
  EXPECT_EQ(manager->Execute(req, &res2), ExecuteStatus::POOL_EXHAUSTED_TIMEOUT);
  EXPECT_EQ(res2.box_id, -1);
  cancel.Cancel();
  thr.join();
}

// pool of 2, three requests using their whole time: the third waits for a box
TEST_F(ManagerTest, ThreeRequestsTwoBoxes) {
  Init(2);
  FakeBehavior behavior;
  behavior.duration = 200ms;
  behavior.stats.exited = true;
  sandbox->SetBehavior(behavior);
  std::vector<ExecutionResult> res(3);
  std::vector<ExecuteStatus> status(3);
  std::vector<std::thread> threads;
  auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < 3; i++) {
    threads.emplace_back([&, i]() { status[i] = manager->Execute(req, &res[i]); });
  }
  for (auto& i : threads) i.join();
  // two rounds of 200ms
  EXPECT_GE(std::chrono::steady_clock::now() - start, 400ms);
  for (int i = 0; i < 3; i++) {
    EXPECT_EQ(status[i], ExecuteStatus::OK);
    EXPECT_EQ(res[i].verdict, Verdict::OK);
    EXPECT_TRUE(res[i].box_id == 0 || res[i].box_id == 1);
  }
  EXPECT_EQ(sandbox->MaxRunning(), 2);
  EXPECT_EQ(pool->HighWaterMark(), 2);
  EXPECT_FALSE(sandbox->Overlapped());
}

TEST_F(ManagerTest, ManyConcurrentRequests) {
  constexpr int kBoxes = 3, kRequests = 24;
  Init(kBoxes);
  FakeBehavior behavior;
  behavior.duration = 5ms;
  behavior.stats.exited = true;
  sandbox->SetBehavior(behavior);
  std::vector<std::thread> threads;
  std::atomic_int ok = 0;
  for (int i = 0; i < kRequests; i++) {
    threads.emplace_back([&]() {
      ExecutionResult res;
      if (manager->Execute(req, &res) == ExecuteStatus::OK && res.verdict == Verdict::OK) ok++;
    });
  }
  for (auto& i : threads) i.join();
  EXPECT_EQ(ok.load(), kRequests);
  EXPECT_EQ(sandbox->Launches(), kRequests);
  EXPECT_LE(sandbox->MaxRunning(), kBoxes);
  EXPECT_LE(pool->HighWaterMark(), (size_t)kBoxes);
  EXPECT_FALSE(sandbox->Overlapped());
  EXPECT_EQ(manager->InFlight(), 0);
}
