#include <isobox/box_pool.h>

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include "utils.h"

namespace {

[[noreturn]] void OwnershipError(const std::string& msg) {
  spdlog::critical("BoxPool: {}", msg);
  throw std::logic_error(msg);
}

inline bool ValidTransition(SlotState from, SlotState to) {
  switch (from) {
    case SlotState::RESERVED: return to == SlotState::RUNNING || to == SlotState::CLEANING;
    case SlotState::RUNNING: return to == SlotState::CLEANING;
    case SlotState::FREE: [[fallthrough]];
    case SlotState::CLEANING: return false;
  }
  __builtin_unreachable();
}

} // namespace

BoxPool::BoxPool(size_t size, int first_id) : ticket_seq_(0), in_use_(0), high_water_mark_(0) {
  if (size == 0) throw std::invalid_argument("BoxPool size must be positive");
  if (first_id < 0) throw std::invalid_argument("BoxPool first id must not be negative");
  for (size_t i = 0; i < size; i++) {
    slots_.push_back({first_id + (int)i, SlotState::FREE, 0, false, {}});
  }
  spdlog::debug("BoxPool created: ids {}..{}", first_id, first_id + (int)size - 1);
}

Slot& BoxPool::OwnedSlot_(const BoxLease& lease) {
  int index = lease.id - slots_.front().id;
  if (index < 0 || index >= (int)slots_.size()) {
    OwnershipError(fmt::format("box {} is not in this pool", lease.id));
  }
  Slot& slot = slots_[index];
  if (slot.state == SlotState::FREE || slot.ticket != lease.ticket) {
    OwnershipError(fmt::format("box {} is not owned by ticket {}", lease.id, lease.ticket));
  }
  return slot;
}

ExecuteStatus BoxPool::Acquire(std::chrono::microseconds timeout, const Cancellation* cancel, BoxLease* lease) {
  std::unique_lock lck(mtx_);
  long sub = -1;
  if (cancel) {
    sub = cancel->Subscribe([this]() {
      std::lock_guard cb_lck(mtx_);
      cv_.notify_all();
    });
  }
  auto find_free = [this]() {
    for (auto& slot : slots_) {
      if (slot.state == SlotState::FREE) return &slot;
    }
    return (Slot*)nullptr;
  };
  auto ready = [&]() {
    return (cancel && cancel->IsCancelled()) || in_use_ < slots_.size();
  };
  bool acquired;
  if (timeout.count() > 0) {
    acquired = cv_.wait_for(lck, timeout, ready);
  } else {
    cv_.wait(lck, ready);
    acquired = true;
  }
  // unsubscribe while holding mtx_ is fine: Cancel() never holds its lock while calling us
  if (cancel) cancel->Unsubscribe(sub);
  if (cancel && cancel->IsCancelled()) {
    spdlog::debug("BoxPool acquire cancelled");
    return ExecuteStatus::CANCELLED;
  }
  if (!acquired) {
    spdlog::warn("BoxPool exhausted: no box freed within {}us, {} in use", timeout.count(), in_use_);
    return ExecuteStatus::POOL_EXHAUSTED_TIMEOUT;
  }
  Slot* slot = find_free();
  if (!slot) __builtin_unreachable(); // in_use_ < size
  slot->state = SlotState::RESERVED;
  slot->ticket = ++ticket_seq_;
  in_use_++;
  high_water_mark_ = std::max(high_water_mark_, in_use_);
  lease->id = slot->id;
  lease->ticket = slot->ticket;
  lease->dirty = slot->dirty;
  spdlog::debug("Box {} reserved, ticket={} dirty={} in_use={}", slot->id, slot->ticket, slot->dirty, in_use_);
  return ExecuteStatus::OK;
}

void BoxPool::Transition(const BoxLease& lease, SlotState to) {
  std::lock_guard lck(mtx_);
  Slot& slot = OwnedSlot_(lease);
  if (!ValidTransition(slot.state, to)) {
    OwnershipError(fmt::format("box {}: invalid transition {} -> {}",
                               slot.id, SlotStateName(slot.state), SlotStateName(to)));
  }
  spdlog::debug("Box {}: {} -> {}", slot.id, SlotStateName(slot.state), SlotStateName(to));
  slot.state = to;
}

void BoxPool::SetWorkdir(const BoxLease& lease, const std::filesystem::path& workdir) {
  std::lock_guard lck(mtx_);
  OwnedSlot_(lease).workdir = workdir;
}

void BoxPool::Release(const BoxLease& lease, bool clean) {
  {
    std::lock_guard lck(mtx_);
    Slot& slot = OwnedSlot_(lease);
    if (slot.state != SlotState::CLEANING) {
      OwnershipError(fmt::format("box {} released in state {}", slot.id, SlotStateName(slot.state)));
    }
    slot.state = SlotState::FREE;
    slot.ticket = 0;
    slot.dirty = !clean;
    slot.workdir.clear();
    in_use_--;
    spdlog::debug("Box {} released, dirty={} in_use={}", slot.id, slot.dirty, in_use_);
  }
  cv_.notify_one();
}

size_t BoxPool::InUse() const {
  std::lock_guard lck(mtx_);
  return in_use_;
}

size_t BoxPool::HighWaterMark() const {
  std::lock_guard lck(mtx_);
  return high_water_mark_;
}

std::vector<Slot> BoxPool::Snapshot() const {
  std::lock_guard lck(mtx_);
  return slots_;
}
