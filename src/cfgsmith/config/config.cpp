#include "cfgsmith/config/config.hpp"

#include "cfgsmith/core/error.hpp"
#include "cfgsmith/util/fs.hpp"
#include "cfgsmith/util/log.hpp"

#include <boost/lexical_cast.hpp>
#include <glaze/toml.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cfgsmith {
namespace detail {

struct ServiceToml {
  std::string name{"cfgsmith"};
  std::string log_level{"info"};
  std::string log_file;
  std::string pid_file;
  std::string metrics_file;
  bool one_shot{false};
};

struct GeneratorToml {
  std::string config_file;
  std::string command;
  std::string reload_command;
  std::string health_command;
  int sleep_duration_sec{60};
  int cooldown_duration_sec{5};
  std::vector<std::string> watch;
};

struct DaemonToml {
  ServiceToml service{};
  GeneratorToml generator{};
};

} // namespace detail
} // namespace cfgsmith

namespace glz {
template <> struct meta<cfgsmith::detail::ServiceToml> {
  using T = cfgsmith::detail::ServiceToml;
  static constexpr auto value =
      object("name", &T::name, "log_level", &T::log_level, "log_file",
             &T::log_file, "pid_file", &T::pid_file, "metrics_file",
             &T::metrics_file, "one_shot", &T::one_shot);
};

template <> struct meta<cfgsmith::detail::GeneratorToml> {
  using T = cfgsmith::detail::GeneratorToml;
  static constexpr auto value = object(
      "config_file", &T::config_file, "command", &T::command,
      "reload_command", &T::reload_command, "health_command",
      &T::health_command, "sleep_duration_sec", &T::sleep_duration_sec,
      "cooldown_duration_sec", &T::cooldown_duration_sec, "watch", &T::watch);
};

template <> struct meta<cfgsmith::detail::DaemonToml> {
  using T = cfgsmith::detail::DaemonToml;
  static constexpr auto value =
      object("service", &T::service, "generator", &T::generator);
};
} // namespace glz

namespace cfgsmith {
namespace {

[[nodiscard]] auto parse_toml(std::string_view text)
    -> Result<detail::DaemonToml> {
  detail::DaemonToml raw{};
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    log::error("TOML parse error: {}", glz::format_error(ec, text));
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

[[nodiscard]] auto env_flag(const char *v) -> bool {
  return std::string_view(v) == "1" || std::string_view(v) == "true";
}

auto apply_env_overrides(DaemonConfig &cfg) -> void {
  if (const char *v = std::getenv("CFGSMITH_LOG_LEVEL"); v != nullptr) {
    cfg.service.log_level = v;
  }
  if (const char *v = std::getenv("CFGSMITH_LOG_FILE"); v != nullptr) {
    cfg.service.log_file = v;
  }
  if (const char *v = std::getenv("CFGSMITH_ONE_SHOT"); v != nullptr) {
    cfg.service.one_shot = env_flag(v);
  }
  if (const char *v = std::getenv("CFGSMITH_METRICS_FILE"); v != nullptr) {
    cfg.service.metrics_file = v;
  }
  if (const char *v = std::getenv("CFGSMITH_CONFIG_FILE"); v != nullptr) {
    cfg.generator.config_file = v;
  }
  if (const char *v = std::getenv("CFGSMITH_SLEEP_DURATION"); v != nullptr) {
    cfg.generator.sleep_duration_sec = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("CFGSMITH_COOLDOWN_DURATION");
      v != nullptr) {
    cfg.generator.cooldown_duration_sec = boost::lexical_cast<int>(v);
  }
}

[[nodiscard]] auto validate(const DaemonConfig &cfg) -> Result<void> {
  const auto &gen = cfg.generator;
  if (gen.config_file.empty() ||
      !std::filesystem::path(gen.config_file).is_absolute()) {
    log::error("generator.config_file must be an absolute path");
    return fail(Error::InvalidArgument);
  }
  if (gen.command.empty()) {
    log::error("generator.command is required");
    return fail(Error::InvalidArgument);
  }
  if (gen.sleep_duration_sec < 0 || gen.cooldown_duration_sec < 0 ||
      gen.cooldown_duration_sec > gen.sleep_duration_sec) {
    log::error("Durations must satisfy 0 <= cooldown_duration_sec ({}) <= "
               "sleep_duration_sec ({})",
               gen.cooldown_duration_sec, gen.sleep_duration_sec);
    return fail(Error::InvalidArgument);
  }
  if (std::ranges::find(log::level_names, cfg.service.log_level) ==
      log::level_names.end()) {
    log::error("Unknown log level '{}'", cfg.service.log_level);
    return fail(Error::InvalidArgument);
  }
  if (cfg.service.name.empty()) {
    log::error("service.name must not be empty");
    return fail(Error::InvalidArgument);
  }
  return ok();
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<DaemonConfig> {
  auto raw_result = parse_toml(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  DaemonConfig cfg{};
  cfg.service.name = std::move(raw.service.name);
  cfg.service.log_level = std::move(raw.service.log_level);
  cfg.service.log_file = std::move(raw.service.log_file);
  cfg.service.pid_file = std::move(raw.service.pid_file);
  cfg.service.metrics_file = std::move(raw.service.metrics_file);
  cfg.service.one_shot = raw.service.one_shot;

  cfg.generator.config_file = std::move(raw.generator.config_file);
  cfg.generator.command = std::move(raw.generator.command);
  cfg.generator.reload_command = std::move(raw.generator.reload_command);
  cfg.generator.health_command = std::move(raw.generator.health_command);
  cfg.generator.sleep_duration_sec = raw.generator.sleep_duration_sec;
  cfg.generator.cooldown_duration_sec = raw.generator.cooldown_duration_sec;
  cfg.generator.watch = std::move(raw.generator.watch);

  apply_env_overrides(cfg);

  if (cfg.service.pid_file.empty() && !cfg.generator.config_file.empty()) {
    cfg.service.pid_file = cfg.generator.config_file + ".pid";
  }

  if (auto r = validate(cfg); !r) {
    return fail(r.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<DaemonConfig> {
  auto text = fs_util::read_file(std::filesystem::path(path));
  if (!text) {
    log::error("Cannot read configuration {}: {}", path,
               text.error().message());
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<DaemonConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid numeric environment override: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto to_generator_options(const DaemonConfig &config)
    -> CommandGeneratorOptions {
  CommandGeneratorOptions options{
      .config_file = config.generator.config_file,
      .command = config.generator.command,
      .reload_command = config.generator.reload_command,
      .health_command = config.generator.health_command,
      .sleep_duration = std::chrono::seconds(config.generator.sleep_duration_sec),
      .cooldown_duration =
          std::chrono::seconds(config.generator.cooldown_duration_sec),
      .service_name = config.service.name,
      .watches = {},
  };
  for (const auto &path : config.generator.watch) {
    options.watches.add(path);
  }
  return options;
}

} // namespace cfgsmith
