#include "cfgsmith/cli/commands.hpp"
#include "cfgsmith/config/config.hpp"
#include "cfgsmith/engine/engine.hpp"
#include "cfgsmith/generator/command_generator.hpp"
#include "cfgsmith/metrics/metrics.hpp"
#include "cfgsmith/util/daemon.hpp"
#include "cfgsmith/util/log.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace cfgsmith::cli {
namespace {

auto load_config_or_print(std::string_view path) -> Result<DaemonConfig> {
  auto res = ConfigLoader::load_from_file(path);
  if (!res) {
    const std::error_code ec = res.error();
    fmt::print(stderr, "Error: {}\n", ec.message());
    return fail(ec);
  }
  return res;
}

} // namespace

auto cmd_serve(const ServeOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  auto config = std::move(*config_res);

  if (opts.log_level.has_value()) {
    config.service.log_level = *opts.log_level;
  }
  if (opts.one_shot) {
    config.service.one_shot = true;
  }

  const auto log_file = opts.log_file.value_or(config.service.log_file);
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    fmt::print(stderr, "Error: Failed to open log file: {}\n", log_file);
    return 1;
  }
  log::set_level(config.service.log_level);

  auto pid_guard = PidFileGuard::acquire(config.service.pid_file);
  if (!pid_guard) {
    if (pid_guard.error() == make_error_code(Error::AlreadyExists)) {
      fmt::print(stderr,
                 "Error: cfgsmith is already running (pid file locked: {})\n",
                 config.service.pid_file);
    } else {
      fmt::print(stderr, "Error: Failed to acquire pid file '{}': {}\n",
                 config.service.pid_file, pid_guard.error().message());
    }
    return 1;
  }

  CommandGenerator generator(to_generator_options(config));
  metrics::MetricsRegistry registry;
  metrics::PrometheusRecorder recorder(registry, config.service.name);

  std::signal(SIGPIPE, SIG_IGN);
  log::start();
  auto engine = RegenerationEngine::create(
      generator, recorder,
      EngineOptions{
          .one_shot = config.service.one_shot,
          .handle_signals = true,
          .registry = &registry,
          .metrics_file = config.service.metrics_file,
      });
  if (!engine) {
    log::error("Failed to start: {}", engine.error().message());
    log::stop();
    return 1;
  }

  log::info("cfgsmith started (config_file={}, pid_file={})",
            config.generator.config_file, config.service.pid_file);
  if (auto r = (*engine)->run(); !r) {
    log::error("cfgsmith stopped with an error: {}", r.error().message());
    log::stop();
    return 1;
  }
  log::info("cfgsmith stopped.");
  log::stop();
  return 0;
}

auto cmd_trigger(const TriggerOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  const auto &pid_file = config_res->service.pid_file;

  auto pid = read_pid_file(pid_file);
  if (!pid || !is_process_alive(*pid)) {
    fmt::print(stderr, "Error: cfgsmith is not running (pid file: {})\n",
               pid_file);
    return 1;
  }
  if (auto r = send_signal(*pid, SIGHUP); !r) {
    fmt::print(stderr, "Error: Failed to send SIGHUP to pid {}: {}\n", *pid,
               r.error().message());
    return 1;
  }
  fmt::print("Regeneration requested (pid={}).\n", *pid);
  return 0;
}

auto cmd_stop(const StopOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  const auto &pid_file = config_res->service.pid_file;

  auto pid_res = read_pid_file(pid_file);
  if (!pid_res) {
    if (pid_res.error() == make_error_code(Error::FileNotFound)) {
      fmt::print("cfgsmith is not running (no pid file: {}).\n", pid_file);
      return 0;
    }
    fmt::print(stderr, "Error: Failed to read pid file '{}': {}\n", pid_file,
               pid_res.error().message());
    return 1;
  }
  const std::int64_t pid = *pid_res;

  if (!is_process_alive(pid)) {
    fmt::print("cfgsmith is not running (stale pid file).\n");
    return 0;
  }

  if (auto r = send_signal(pid, SIGTERM); !r) {
    fmt::print(stderr, "Error: Failed to send SIGTERM to pid {}: {}\n", pid,
               r.error().message());
    return 1;
  }

  const auto timeout = std::chrono::seconds(std::max(opts.timeout_sec, 1));
  if (wait_for_process_exit(pid, timeout)) {
    fmt::print("cfgsmith stopped (pid={}).\n", pid);
    return 0;
  }

  if (!opts.force) {
    fmt::print(stderr,
               "Error: Timed out waiting for cfgsmith to stop (pid={}). "
               "Retry with --force.\n",
               pid);
    return 1;
  }

  if (auto r = send_signal(pid, SIGKILL); !r) {
    fmt::print(stderr, "Error: Failed to send SIGKILL to pid {}: {}\n", pid,
               r.error().message());
    return 1;
  }
  if (!wait_for_process_exit(pid, std::chrono::seconds(2))) {
    fmt::print(stderr, "Error: Process {} did not exit after SIGKILL.\n", pid);
    return 1;
  }
  fmt::print("cfgsmith killed (pid={}).\n", pid);
  return 0;
}

} // namespace cfgsmith::cli
