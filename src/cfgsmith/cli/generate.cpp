#include "cfgsmith/cli/commands.hpp"
#include "cfgsmith/config/config.hpp"
#include "cfgsmith/generator/command_generator.hpp"
#include "cfgsmith/util/digest.hpp"
#include "cfgsmith/util/log.hpp"

#include <fmt/core.h>

#include <cstdio>

namespace cfgsmith::cli {

auto cmd_generate(const GenerateOptions &opts) -> int {
  log::set_output_stderr();
  auto config_res = ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    fmt::print(stderr, "Error: {}\n", config_res.error().message());
    return 1;
  }

  CommandGenerator generator(to_generator_options(*config_res));
  auto data = generator.config_data();
  if (!data) {
    fmt::print(stderr, "Error: {}\n", data.error().message());
    return 1;
  }
  std::fwrite(data->data(), 1, data->size(), stdout);
  std::fflush(stdout);
  log::info("Generated {} bytes (sha256 {})", data->size(),
            util::content_hash(*data));
  return 0;
}

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();
  auto config_res = ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    fmt::print(stderr, "Invalid configuration {}: {}\n", opts.config_file,
               config_res.error().message());
    return 1;
  }

  const auto &cfg = *config_res;
  fmt::print("Configuration OK: {}\n", opts.config_file);
  fmt::print("  service: {}\n", cfg.service.name);
  fmt::print("  config_file: {}\n", cfg.generator.config_file);
  fmt::print("  sleep: {}s, cooldown: {}s\n", cfg.generator.sleep_duration_sec,
             cfg.generator.cooldown_duration_sec);
  fmt::print("  watches: {}\n", cfg.generator.watch.size());
  return 0;
}

} // namespace cfgsmith::cli
