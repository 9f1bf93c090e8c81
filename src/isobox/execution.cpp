#include <isobox/execution.h>

#include <vector>

#include <nlohmann/json.hpp>
#include <isobox/utils.h>

nlohmann::json ExecutionResult::ToJson() const {
  return {
    {"verdict", VerdictToAbr(verdict)},
    {"verdict_long", VerdictToDesc(verdict)},
    {"termination", TerminationCauseName(cause)},
    {"exit_code", exit_code},
    {"signal", signal},
    {"stats", {
      {"wall_us", wall_time},
      {"cpu_us", cpu_time},
      {"peak_memory_bytes", peak_memory},
    }},
    {"stdout", stdout_data},
    {"stderr", stderr_data},
    {"output_truncated", output_truncated},
    {"box_id", box_id},
    {"message", message},
  };
}

void Cancellation::Cancel() {
  std::vector<std::function<void()>> to_call;
  {
    std::lock_guard lck(mtx_);
    if (cancelled_) return;
    cancelled_ = true;
    for (auto& i : callbacks_) to_call.push_back(std::move(i.second));
    callbacks_.clear();
  }
  // outside of the lock: callbacks may take other locks that are held while subscribing
  for (auto& i : to_call) i();
}

bool Cancellation::IsCancelled() const {
  std::lock_guard lck(mtx_);
  return cancelled_;
}

long Cancellation::Subscribe(std::function<void()>&& callback) const {
  std::lock_guard lck(mtx_);
  if (cancelled_) return -1;
  long id = next_id_++;
  callbacks_.emplace(id, std::move(callback));
  return id;
}

void Cancellation::Unsubscribe(long id) const {
  if (id < 0) return;
  std::lock_guard lck(mtx_);
  callbacks_.erase(id);
}
