#include "cfgsmith/engine/engine.hpp"

#include "cfgsmith/util/fs.hpp"
#include "cfgsmith/util/log.hpp"

#include <utility>

namespace cfgsmith {

RegenerationEngine::RegenerationEngine(ConfigGenerator &generator,
                                       metrics::IMetricsRecorder &metrics,
                                       EngineOptions options)
    : generator_(generator), metrics_(metrics), options_(std::move(options)),
      protocol_(generator, metrics), work_(boost::asio::make_work_guard(io_)),
      timer_(io_), trigger_(io_), termination_(io_),
      watch_source_(create_watch_source(io_)), watches_(generator.watches()),
      sleep_(generator.sleep_duration()),
      cooldown_(generator.cooldown_duration()) {}

auto RegenerationEngine::create(ConfigGenerator &generator,
                                metrics::IMetricsRecorder &metrics,
                                EngineOptions options)
    -> Result<std::unique_ptr<RegenerationEngine>> {
  const auto sleep = generator.sleep_duration();
  const auto cooldown = generator.cooldown_duration();
  if (sleep < std::chrono::milliseconds::zero()) {
    log::error("sleep_duration must not be negative (got {}ms)",
               sleep.count());
    return fail(Error::InvalidArgument);
  }
  if (cooldown < std::chrono::milliseconds::zero()) {
    log::error("cooldown_duration must not be negative (got {}ms)",
               cooldown.count());
    return fail(Error::InvalidArgument);
  }
  if (cooldown > sleep) {
    log::error("cooldown_duration ({}ms) must not exceed sleep_duration ({}ms)",
               cooldown.count(), sleep.count());
    return fail(Error::InvalidArgument);
  }
  const auto live = generator.config_file();
  if (live.empty() || !live.is_absolute()) {
    log::error("config_file must be an absolute path (got '{}')",
               live.string());
    return fail(Error::InvalidArgument);
  }

  const bool handle_signals = options.handle_signals;
  std::unique_ptr<RegenerationEngine> engine(
      new RegenerationEngine(generator, metrics, std::move(options)));

  if (handle_signals) {
    if (auto s = SignalSource::create(engine->io_); s) {
      engine->signals_ = std::move(*s);
      engine->signals_->start(
          [raw = engine.get()](int signo) { raw->handle_signal(signo); });
    } else {
      log::warn("Signal handling unavailable: {}", s.error().message());
    }
  }
  return ok(std::move(engine));
}

auto RegenerationEngine::watch(const std::filesystem::path &path)
    -> Result<void> {
  std::lock_guard lock(watches_mu_);
  if (state() != EngineState::Starting) {
    return fail(Error::InvalidState);
  }
  watches_.add(path);
  return ok();
}

auto RegenerationEngine::watch(const std::filesystem::path &path,
                               WatchKind kind) -> Result<void> {
  std::lock_guard lock(watches_mu_);
  if (state() != EngineState::Starting) {
    return fail(Error::InvalidState);
  }
  watches_.add(path, kind);
  return ok();
}

auto RegenerationEngine::run() -> Result<void> {
  {
    // Closes watch registration before the set is installed.
    std::lock_guard lock(watches_mu_);
    auto expected = EngineState::Starting;
    if (!state_.compare_exchange_strong(expected, EngineState::Bootstrapping,
                                        std::memory_order_acq_rel)) {
      return fail(Error::InvalidState);
    }
  }
  log::info("Commencing config management for {}",
            generator_.config_file().string());

  install_watches();

  auto r = bootstrap();
  if (r) {
    r = [this]() -> Result<void> {
      if (options_.one_shot) {
        log::info("One-shot mode; not entering the regeneration loop");
        return ok();
      }
      state_.store(EngineState::Running, std::memory_order_release);
      return loop();
    }();
  }

  state_.store(EngineState::Terminated, std::memory_order_release);
  if (signals_) {
    signals_->cancel();
  }
  if (!r) {
    log::error("Config management aborted: {}", r.error().message());
    return r;
  }
  log::info("Config management stopped");
  return ok();
}

auto RegenerationEngine::cycle(bool force_reload) -> Result<CycleReport> {
  // The state is checked first: generator callbacks run on the loop thread,
  // which already holds cycle_mu_.
  const auto current = state();
  if (current == EngineState::Bootstrapping ||
      current == EngineState::Running) {
    log::warn("Refusing a regeneration outside the loop while {}",
              to_string_view(current));
    return fail(Error::InvalidState);
  }
  std::unique_lock lock(cycle_mu_, std::try_to_lock);
  if (!lock.owns_lock()) {
    log::warn("Refusing a regeneration while another one is in progress");
    return fail(Error::InvalidState);
  }
  return run_cycle(force_reload);
}

auto RegenerationEngine::run_cycle(bool force_reload) -> Result<CycleReport> {
  auto report = fs_util::file_exists(generator_.config_file())
                    ? protocol_.run(force_reload)
                    : write_initial();
  if (report) {
    log::debug("Regeneration finished: outcome={}, different={}, cycled={}",
               to_string_view(report->outcome), report->config_was_different,
               report->config_was_cycled);
  }
  write_metrics_file();
  return report;
}

auto RegenerationEngine::write_initial() -> Result<CycleReport> {
  auto written = protocol_.write_initial();
  if (!written) {
    return fail(written.error());
  }
  return ok(CycleReport{
      .outcome = RegenOutcome::Unchanged,
      .generation_failed = !*written,
      .config_was_different = *written,
  });
}

auto RegenerationEngine::install_watches() -> void {
  for (const auto &spec : watches_) {
    // The loop still runs on the remaining watches and on timeouts.
    if (auto added = watch_source_->add(spec); !added) {
      log::warn("Skipping watch on {}: {}", spec.path.string(),
                added.error().message());
    }
  }
}

auto RegenerationEngine::bootstrap() -> Result<void> {
  if (fs_util::file_exists(generator_.config_file())) {
    log::info("Triggering a config regen on startup to ensure config is "
              "up-to-date");
  }
  std::lock_guard lock(cycle_mu_);
  auto report = run_cycle(false);
  if (!report) {
    return fail(report.error());
  }
  return ok();
}

auto RegenerationEngine::loop() -> Result<void> {
  const auto wait_time = sleep_ - cooldown_;
  while (true) {
    if (cooldown_ > std::chrono::milliseconds::zero() && cooldown(cooldown_)) {
      log::debug("Termination requested during cooldown");
      return ok();
    }

    log::debug("Sleeping for {}ms", wait_time.count());
    const auto reason = wait_for_wake(wait_time);
    log::debug("Woken by {}", to_string_view(reason));

    bool force_reload = true;
    switch (reason) {
    case WakeReason::Terminate:
      return ok();
    case WakeReason::Watch:
      watch_ready_ = false;
      watch_source_->drain();
      break;
    case WakeReason::Trigger:
      log::debug("Coalesced {} regeneration request(s)", trigger_.drain());
      break;
    case WakeReason::Timeout:
      force_reload = false;
      break;
    }

    std::lock_guard lock(cycle_mu_);
    if (auto report = run_cycle(force_reload); !report) {
      return fail(report.error());
    }
  }
}

auto RegenerationEngine::cooldown(std::chrono::milliseconds duration) -> bool {
  // Watch and trigger handlers may run here, but they only raise flags; the
  // notifications themselves stay queued for the next wait.
  arm_timer(duration);
  io_.poll();
  while (!termination_.requested() && !timer_fired_) {
    io_.run_one();
  }
  timer_.cancel();
  return termination_.requested();
}

auto RegenerationEngine::wait_for_wake(std::chrono::milliseconds timeout)
    -> WakeReason {
  arm_timer(timeout);
  arm_watch();

  // Everything already ready is run before a reason is picked, so sources
  // that became ready together are ranked rather than raced.
  io_.poll();
  auto reason = ready_reason();
  while (!reason) {
    io_.run_one();
    io_.poll();
    reason = ready_reason();
  }
  timer_.cancel();
  return *reason;
}

auto RegenerationEngine::ready_reason() const noexcept
    -> std::optional<WakeReason> {
  if (termination_.requested()) {
    return WakeReason::Terminate;
  }
  if (watch_ready_) {
    return WakeReason::Watch;
  }
  if (trigger_.pending()) {
    return WakeReason::Trigger;
  }
  if (timer_fired_) {
    return WakeReason::Timeout;
  }
  return std::nullopt;
}

auto RegenerationEngine::arm_timer(std::chrono::milliseconds duration)
    -> void {
  timer_fired_ = false;
  timer_.expires_after(duration);
  // A completion already queued when the timer is re-armed carries a stale
  // epoch and is ignored.
  timer_.async_wait([this, epoch = ++timer_epoch_](
                        const boost::system::error_code &ec) {
    if (!ec && epoch == timer_epoch_) {
      timer_fired_ = true;
    }
  });
}

auto RegenerationEngine::arm_watch() -> void {
  if (watch_armed_) {
    return;
  }
  watch_armed_ = true;
  watch_source_->async_wait([this] {
    watch_armed_ = false;
    watch_ready_ = true;
  });
}

auto RegenerationEngine::handle_signal(int signo) -> void {
  const auto name = signal_name(signo);
  metrics_.signal(name);
  switch (signo) {
  case SIGHUP:
    log::info("received SIGHUP, triggering config regeneration");
    request_regeneration();
    break;
  case SIGINT:
  case SIGTERM:
    log::info("received SIG{}, shutting down", name);
    request_shutdown();
    break;
  case SIGUSR1:
    log::info("received SIGUSR1, log level now {}",
              log::level_name(log::increase_verbosity()));
    break;
  case SIGUSR2:
    log::info("received SIGUSR2, log level now {}",
              log::level_name(log::decrease_verbosity()));
    break;
  default:
    log::warn("Ignoring unexpected signal {}", signo);
    break;
  }
}

auto RegenerationEngine::write_metrics_file() -> void {
  if (options_.registry == nullptr || options_.metrics_file.empty()) {
    return;
  }
  if (auto r = metrics::write_textfile(*options_.registry,
                                       options_.metrics_file);
      !r) {
    log::warn("Cannot write metrics to {}: {}", options_.metrics_file.string(),
              r.error().message());
  }
}

} // namespace cfgsmith
