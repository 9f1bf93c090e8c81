#ifndef INCLUDE_ISOBOX_BOX_POOL_H_
#define INCLUDE_ISOBOX_BOX_POOL_H_

#include <mutex>
#include <chrono>
#include <vector>
#include <cstdint>
#include <filesystem>
#include <condition_variable>

#include "execution.h"

#define ENUM_SLOT_STATE_ \
  X(FREE) \
  X(RESERVED) \
  X(RUNNING) \
  X(CLEANING)
enum class SlotState {
#define X(name) name,
  ENUM_SLOT_STATE_
#undef X
};

struct Slot {
  int id;
  SlotState state;
  uint64_t ticket; // 0 when free
  bool dirty; // last cleanup failed; must be reset before reuse
  std::filesystem::path workdir;
};

// Proof of ownership of one slot; obtained from Acquire, consumed by Release
struct BoxLease {
  int id;
  uint64_t ticket;
  bool dirty;

  BoxLease() : id(-1), ticket(0), dirty(false) {}
};

class BoxPool {
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::vector<Slot> slots_;
  uint64_t ticket_seq_;
  size_t in_use_, high_water_mark_;

  // caller must hold mtx_; throws std::logic_error if the lease does not own the slot
  Slot& OwnedSlot_(const BoxLease&);
 public:
  // slot ids are first_id .. first_id + size - 1
  explicit BoxPool(size_t size, int first_id = 0);
  BoxPool(const BoxPool&) = delete;
  BoxPool& operator=(const BoxPool&) = delete;

  // timeout 0 means wait forever; cancel may be nullptr
  ExecuteStatus Acquire(std::chrono::microseconds timeout, const Cancellation* cancel, BoxLease* lease);
  // RESERVED -> RUNNING, RESERVED -> CLEANING, RUNNING -> CLEANING
  void Transition(const BoxLease&, SlotState to);
  void SetWorkdir(const BoxLease&, const std::filesystem::path&);
  // CLEANING -> FREE; clean = false marks the slot to be reset by its next holder
  void Release(const BoxLease&, bool clean = true);

  size_t size() const { return slots_.size(); }
  size_t InUse() const;
  // max number of slots held at the same time since construction
  size_t HighWaterMark() const;
  std::vector<Slot> Snapshot() const;
};

#endif  // INCLUDE_ISOBOX_BOX_POOL_H_
