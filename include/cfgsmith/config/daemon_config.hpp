#pragma once

#include <string>
#include <vector>

namespace cfgsmith {

struct ServiceConfig {
  std::string name{"cfgsmith"};
  std::string log_level{"info"};
  std::string log_file;
  std::string pid_file; // defaults to <generator.config_file>.pid
  std::string metrics_file;
  bool one_shot{false};

  auto operator==(const ServiceConfig &) const -> bool = default;
};

struct GeneratorConfig {
  std::string config_file;
  std::string command;
  std::string reload_command;
  std::string health_command;
  int sleep_duration_sec{60};
  int cooldown_duration_sec{5};
  std::vector<std::string> watch;

  auto operator==(const GeneratorConfig &) const -> bool = default;
};

struct DaemonConfig {
  ServiceConfig service;
  GeneratorConfig generator;

  auto operator==(const DaemonConfig &) const -> bool = default;
};

} // namespace cfgsmith
