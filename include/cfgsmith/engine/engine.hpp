#pragma once

#include "cfgsmith/core/error.hpp"
#include "cfgsmith/engine/channel.hpp"
#include "cfgsmith/engine/cycle.hpp"
#include "cfgsmith/engine/generator.hpp"
#include "cfgsmith/engine/signal_source.hpp"
#include "cfgsmith/io/context.hpp"
#include "cfgsmith/metrics/metrics.hpp"
#include "cfgsmith/watch/watch_set.hpp"
#include "cfgsmith/watch/watch_source.hpp"

#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

namespace cfgsmith {

enum class EngineState : std::uint8_t {
  Starting,
  Bootstrapping,
  Running,
  Terminated
};

enum class WakeReason : std::uint8_t { Watch, Trigger, Timeout, Terminate };

[[nodiscard]] constexpr auto to_string_view(EngineState state) noexcept
    -> std::string_view {
  switch (state) {
  case EngineState::Starting:
    return "starting";
  case EngineState::Bootstrapping:
    return "bootstrapping";
  case EngineState::Running:
    return "running";
  case EngineState::Terminated:
    return "terminated";
  }
  return "unknown";
}

[[nodiscard]] constexpr auto to_string_view(WakeReason reason) noexcept
    -> std::string_view {
  switch (reason) {
  case WakeReason::Watch:
    return "watch";
  case WakeReason::Trigger:
    return "trigger";
  case WakeReason::Timeout:
    return "timeout";
  case WakeReason::Terminate:
    return "terminate";
  }
  return "unknown";
}

struct EngineOptions {
  // Stop after the startup regeneration instead of entering the loop.
  bool one_shot{false};
  // Handle HUP/INT/TERM/USR1/USR2 through a signal_set on the engine's
  // io_context.
  bool handle_signals{false};
  // When both are set, the registry is written to `metrics_file` after every
  // regeneration.
  const metrics::MetricsRegistry *registry{nullptr};
  std::filesystem::path metrics_file;
};

// Single-threaded regeneration loop around a ConfigGenerator.
//
// run() bootstraps the live file, then drives a private io_context whose
// sources are the watch source, the trigger and termination channels, the
// sleep timer and (optionally) a signal_set, regenerating on every wake.
// request_shutdown() and request_regeneration() may be called from any thread.
class RegenerationEngine {
public:
  ~RegenerationEngine() = default;

  RegenerationEngine(const RegenerationEngine &) = delete;
  auto operator=(const RegenerationEngine &) -> RegenerationEngine & = delete;

  // Fails with Error::InvalidArgument for negative durations, a cooldown
  // longer than the sleep, or a config file that is not an absolute path.
  [[nodiscard]] static auto create(ConfigGenerator &generator,
                                   metrics::IMetricsRecorder &metrics,
                                   EngineOptions options = {})
      -> Result<std::unique_ptr<RegenerationEngine>>;

  // Instance-level watch registrations; rejected with Error::InvalidState once
  // run() has been called.
  [[nodiscard]] auto watch(const std::filesystem::path &path) -> Result<void>;
  [[nodiscard]] auto watch(const std::filesystem::path &path, WatchKind kind)
      -> Result<void>;

  // Returns once termination is observed (or after bootstrap in one-shot
  // mode). An error is a filesystem fault and is fatal.
  [[nodiscard]] auto run() -> Result<void>;

  auto request_shutdown() -> void { termination_.request(); }
  auto request_regeneration() -> void { trigger_.notify(); }

  // True while a requested regeneration has not been picked up by the loop.
  [[nodiscard]] auto regeneration_pending() const noexcept -> bool {
    return trigger_.pending();
  }

  [[nodiscard]] auto state() const noexcept -> EngineState {
    return state_.load(std::memory_order_acquire);
  }

  // One regeneration pass outside the loop. A missing live file is written
  // from scratch, without a reload. Fails with Error::InvalidState while run()
  // is bootstrapping or looping.
  [[nodiscard]] auto cycle(bool force_reload) -> Result<CycleReport>;

  [[nodiscard]] auto watches() const noexcept -> const WatchSet & {
    return watches_;
  }

private:
  RegenerationEngine(ConfigGenerator &generator,
                     metrics::IMetricsRecorder &metrics, EngineOptions options);

  auto run_cycle(bool force_reload) -> Result<CycleReport>;
  auto bootstrap() -> Result<void>;
  auto write_initial() -> Result<CycleReport>;
  auto install_watches() -> void;
  auto loop() -> Result<void>;
  auto cooldown(std::chrono::milliseconds duration) -> bool;
  auto wait_for_wake(std::chrono::milliseconds timeout) -> WakeReason;
  [[nodiscard]] auto ready_reason() const noexcept -> std::optional<WakeReason>;
  auto arm_timer(std::chrono::milliseconds duration) -> void;
  auto arm_watch() -> void;
  auto handle_signal(int signo) -> void;
  auto write_metrics_file() -> void;

  ConfigGenerator &generator_;
  metrics::IMetricsRecorder &metrics_;
  EngineOptions options_;
  CycleProtocol protocol_;

  // Everything bound to io_ is declared after it, so it is torn down first.
  io::IoContext io_{1};
  io::WorkGuard work_;
  boost::asio::steady_timer timer_;
  TriggerChannel trigger_;
  TerminationChannel termination_;
  std::unique_ptr<SignalSource> signals_;
  std::unique_ptr<IWatchSource> watch_source_;

  // Readiness flags, only touched on the loop thread.
  std::uint64_t timer_epoch_{0};
  bool timer_fired_{false};
  bool watch_armed_{false};
  bool watch_ready_{false};

  // Held for the whole of every Cycle Protocol run.
  std::mutex cycle_mu_;
  std::mutex watches_mu_;
  WatchSet watches_;
  std::chrono::milliseconds sleep_;
  std::chrono::milliseconds cooldown_;
  std::atomic<EngineState> state_{EngineState::Starting};
};

} // namespace cfgsmith
