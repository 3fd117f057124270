#pragma once

#include "cfgsmith/io/context.hpp"

#include <atomic>
#include <cstdint>

namespace cfgsmith {

// Requests for a forced regeneration. Any number of notify() calls made before
// the engine drains the channel collapse into one regeneration. The first
// pending notification posts a wake-up onto the io_context, so a loop blocked
// in run_one() returns and sees it.
class TriggerChannel {
public:
  explicit TriggerChannel(io::IoContext &io) noexcept : io_(io) {}

  TriggerChannel(const TriggerChannel &) = delete;
  auto operator=(const TriggerChannel &) -> TriggerChannel & = delete;

  // Safe from any thread.
  auto notify() -> void;

  // Number of notifications consumed; 0 when none were pending.
  auto drain() noexcept -> std::uint64_t {
    return pending_.exchange(0, std::memory_order_acq_rel);
  }

  [[nodiscard]] auto pending() const noexcept -> bool {
    return pending_.load(std::memory_order_acquire) > 0;
  }

private:
  io::IoContext &io_;
  std::atomic<std::uint64_t> pending_{0};
};

// Sticky shutdown flag. Once requested it stays set; the first request posts
// a wake-up onto the io_context.
class TerminationChannel {
public:
  explicit TerminationChannel(io::IoContext &io) noexcept : io_(io) {}

  TerminationChannel(const TerminationChannel &) = delete;
  auto operator=(const TerminationChannel &) -> TerminationChannel & = delete;

  // Safe from any thread; later calls are no-ops.
  auto request() -> void;

  [[nodiscard]] auto requested() const noexcept -> bool {
    return requested_.load(std::memory_order_acquire);
  }

private:
  io::IoContext &io_;
  std::atomic<bool> requested_{false};
};

} // namespace cfgsmith
