#ifndef INCLUDE_ISOBOX_MANAGER_H_
#define INCLUDE_ISOBOX_MANAGER_H_

#include <atomic>

#include "config.h"
#include "sandbox.h"
#include "box_pool.h"
#include "execution.h"

class ExecutionManager {
  BoxPool& pool_;
  Sandbox& sandbox_;
  const ManagerConfig config_;
  std::atomic_long request_seq_;
  std::atomic_int in_flight_;
 public:
  // pool & sandbox must outlive the manager
  ExecutionManager(BoxPool& pool, Sandbox& sandbox, const ManagerConfig& config);
  ExecutionManager(const ExecutionManager&) = delete;
  ExecutionManager& operator=(const ExecutionManager&) = delete;

  // Called from any thread. result is filled if the request got a slot, that is,
  // when OK is returned, or CANCELLED is returned after the program started
  // (result->cause == TerminationCause::CANCELLED).
  ExecuteStatus Execute(const ExecutionRequest& req, ExecutionResult* result,
                        const Cancellation* cancel = nullptr);

  int InFlight() const { return in_flight_; }
};

#endif  // INCLUDE_ISOBOX_MANAGER_H_
