#pragma once

#include <optional>
#include <string>

namespace cfgsmith::cli {

struct ServeOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  bool one_shot{false};
};

struct GenerateOptions {
  std::string config_file;
};

struct TriggerOptions {
  std::string config_file;
};

struct StopOptions {
  std::string config_file;
  int timeout_sec{10};
  bool force{false};
};

struct StatusOptions {
  std::string config_file;
  bool json{false};
};

struct ValidateOptions {
  std::string config_file;
};

[[nodiscard]] auto cmd_serve(const ServeOptions &opts) -> int;
[[nodiscard]] auto cmd_generate(const GenerateOptions &opts) -> int;
[[nodiscard]] auto cmd_trigger(const TriggerOptions &opts) -> int;
[[nodiscard]] auto cmd_stop(const StopOptions &opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions &opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;

} // namespace cfgsmith::cli
