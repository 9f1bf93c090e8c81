#ifndef INCLUDE_ISOBOX_LIMITS_H_
#define INCLUDE_ISOBOX_LIMITS_H_

#include <string>
#include <cstdint>

// 0 for any limit means unlimited
constexpr int64_t kUnlimited = 0;
// upper bounds accepted by LimitSpec::Validate
constexpr int64_t kMaxTimeLimit = 86'400L * 1'000'000; // us
constexpr int64_t kMaxSizeLimit = 1L << 50; // bytes

struct LimitSpec {
  int64_t wall_time; // us
  int64_t cpu_time; // us
  int64_t memory; // bytes
  int64_t output; // bytes, applied to stdout and stderr separately
  int processes;
  int64_t stack; // bytes

  LimitSpec() :
      wall_time(kUnlimited), cpu_time(kUnlimited),
      memory(kUnlimited), output(kUnlimited),
      processes(kUnlimited), stack(kUnlimited) {}

  bool HasWallTime() const { return wall_time > 0; }
  bool HasCpuTime() const { return cpu_time > 0; }
  bool HasMemory() const { return memory > 0; }
  bool HasOutput() const { return output > 0; }

  // returns false and sets error_msg on the first violated invariant
  bool Validate(std::string* error_msg) const;
};

// Clamp memory & output to host-wide caps (0 = no cap); unlimited values become the cap
LimitSpec ClampLimits(const LimitSpec&, int64_t max_memory, int64_t max_output);

std::string LimitsToString(const LimitSpec&);

#endif  // INCLUDE_ISOBOX_LIMITS_H_
