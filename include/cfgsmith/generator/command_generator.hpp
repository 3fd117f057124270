#pragma once

#include "cfgsmith/core/constants.hpp"
#include "cfgsmith/core/error.hpp"
#include "cfgsmith/engine/generator.hpp"
#include "cfgsmith/watch/watch_set.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace cfgsmith {

struct CommandResult {
  int exit_code{-1};
  std::string output;
};

// Runs `command` through /bin/sh -c and waits for it. stdout is captured when
// requested; stderr goes to the daemon's stderr. A non-zero exit is not an
// error here, only a failure to start the shell is.
[[nodiscard]] auto run_shell_command(std::string_view command,
                                     bool capture_output = false)
    -> Result<CommandResult>;

struct CommandGeneratorOptions {
  std::filesystem::path config_file;
  std::string command;        // stdout becomes the config
  std::string reload_command; // empty: nothing to reload
  std::string health_command; // empty: always healthy
  std::chrono::milliseconds sleep_duration{timing::kDefaultSleepDuration};
  std::chrono::milliseconds cooldown_duration{
      timing::kDefaultCooldownDuration};
  std::string service_name{"cfgsmith"};
  WatchSet watches;
};

// ConfigGenerator driven by shell commands, so a daemon can be assembled from
// configuration alone.
class CommandGenerator final : public ConfigGenerator {
public:
  explicit CommandGenerator(CommandGeneratorOptions options)
      : options_(std::move(options)) {}

  [[nodiscard]] auto config_file() const -> std::filesystem::path override {
    return options_.config_file;
  }
  [[nodiscard]] auto config_data() -> Result<std::string> override;
  [[nodiscard]] auto reload_server() -> Result<void> override;
  [[nodiscard]] auto config_ok() -> bool override;

  [[nodiscard]] auto sleep_duration() const
      -> std::chrono::milliseconds override {
    return options_.sleep_duration;
  }
  [[nodiscard]] auto cooldown_duration() const
      -> std::chrono::milliseconds override {
    return options_.cooldown_duration;
  }
  [[nodiscard]] auto service_name() const -> std::string override {
    return options_.service_name;
  }
  [[nodiscard]] auto watches() const -> WatchSet override {
    return options_.watches;
  }

private:
  CommandGeneratorOptions options_;
};

} // namespace cfgsmith
