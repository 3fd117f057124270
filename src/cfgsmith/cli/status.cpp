#include "cfgsmith/cli/commands.hpp"
#include "cfgsmith/config/config.hpp"
#include "cfgsmith/util/daemon.hpp"
#include "cfgsmith/util/fs.hpp"
#include "cfgsmith/util/log.hpp"

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <glaze/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace cfgsmith::cli {
namespace {

struct StatusReport {
  bool running{false};
  std::int64_t pid{0};
  bool stale_pid_file{false};
  std::string pid_file;
  std::string config_file;
  bool config_exists{false};
  std::string config_modified;
};

} // namespace

auto cmd_status(const StatusOptions &opts) -> int {
  log::set_output_stderr();
  auto config_res = ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    fmt::print(stderr, "Error: {}\n", config_res.error().message());
    return 1;
  }

  StatusReport report{
      .pid_file = config_res->service.pid_file,
      .config_file = config_res->generator.config_file,
  };

  auto pid_res = read_pid_file(report.pid_file);
  if (pid_res) {
    report.pid = *pid_res;
    report.running = is_process_alive(report.pid);
    report.stale_pid_file = !report.running;
  } else if (pid_res.error() != make_error_code(Error::FileNotFound)) {
    fmt::print(stderr, "Error: Failed to read pid file '{}': {}\n",
               report.pid_file, pid_res.error().message());
    return 1;
  }

  if (auto mtime = fs_util::modification_time(report.config_file); mtime) {
    report.config_exists = true;
    report.config_modified =
        fmt::format("{:%Y-%m-%dT%H:%M:%SZ}",
                    fmt::gmtime(std::chrono::system_clock::to_time_t(*mtime)));
  }

  if (opts.json) {
    auto out = glz::write_json(report);
    fmt::print("{}\n", out ? *out : std::string{"null"});
    return report.running ? 0 : 1;
  }

  fmt::print("cfgsmith is {}.\n", report.running ? "running" : "stopped");
  if (report.running) {
    fmt::print("  pid: {}\n", report.pid);
  } else if (report.stale_pid_file) {
    fmt::print("  stale_pid: {}\n", report.pid);
  }
  fmt::print("  pid_file: {}\n", report.pid_file);
  fmt::print("  config_file: {}\n", report.config_file);
  if (report.config_exists) {
    fmt::print("  config_modified: {}\n", report.config_modified);
  } else {
    fmt::print("  config_modified: (missing)\n");
  }
  return report.running ? 0 : 1;
}

} // namespace cfgsmith::cli
