#include "cfgsmith/cli/commands.hpp"
#include "cfgsmith/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("CFGSMITH_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

auto add_config_option(CLI::App *cmd, std::string &target,
                       const std::string &env_config) -> void {
  target = env_config;
  auto *opt = cmd->add_option("-c,--config", target, "Daemon config file")
                  ->check(CLI::ExistingFile);
  if (env_config.empty())
    opt->required();
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep non-serve CLI output clean by default.
  cfgsmith::log::set_output_stderr();
  cfgsmith::log::set_level(cfgsmith::log::Level::Warn);

  CLI::App app{"cfgsmith", "Regenerate a config file and reload its server"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  cfgsmith serve -c cfgsmith.toml\n"
             "  cfgsmith trigger -c cfgsmith.toml\n"
             "\nTip: Set CFGSMITH_CONFIG=cfgsmith.toml to skip -c on every "
             "command.");

  const std::string env_config = default_config();

  cfgsmith::cli::ServeOptions serve_opts;
  auto *serve = app.add_subcommand("serve", "Run the regeneration daemon");
  serve->footer("\nExamples:\n"
                "  cfgsmith serve -c cfgsmith.toml\n"
                "  cfgsmith serve -c cfgsmith.toml --one-shot\n"
                "  cfgsmith serve -c cfgsmith.toml --log-file cfgsmith.log "
                "--log-level debug");
  add_config_option(serve, serve_opts.config_file, env_config);
  serve->add_flag("--one-shot", serve_opts.one_shot,
                  "Generate once at startup, then exit");
  serve->add_option("--log-file", serve_opts.log_file, "Log file path");
  serve
      ->add_option("--log-level", serve_opts.log_level,
                   "Log level override: trace|debug|info|warn|error")
      ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
  serve->callback(
      [&serve_opts]() { std::exit(cfgsmith::cli::cmd_serve(serve_opts)); });

  cfgsmith::cli::GenerateOptions generate_opts;
  auto *generate = app.add_subcommand(
      "generate", "Print the config the daemon would write, without writing");
  add_config_option(generate, generate_opts.config_file, env_config);
  generate->callback([&generate_opts]() {
    std::exit(cfgsmith::cli::cmd_generate(generate_opts));
  });

  cfgsmith::cli::TriggerOptions trigger_opts;
  auto *trigger = app.add_subcommand(
      "trigger", "Ask the running daemon for a forced regeneration");
  add_config_option(trigger, trigger_opts.config_file, env_config);
  trigger->callback([&trigger_opts]() {
    std::exit(cfgsmith::cli::cmd_trigger(trigger_opts));
  });

  cfgsmith::cli::StopOptions stop_opts;
  auto *stop = app.add_subcommand("stop", "Stop the running daemon");
  add_config_option(stop, stop_opts.config_file, env_config);
  stop->add_option("--timeout", stop_opts.timeout_sec,
                   "Seconds to wait before failing or forcing stop");
  stop->add_flag("--force", stop_opts.force,
                 "Send SIGKILL if graceful stop times out");
  stop->callback(
      [&stop_opts]() { std::exit(cfgsmith::cli::cmd_stop(stop_opts)); });

  cfgsmith::cli::StatusOptions status_opts;
  auto *status = app.add_subcommand("status", "Show daemon status");
  add_config_option(status, status_opts.config_file, env_config);
  status->add_flag("--json", status_opts.json, "Output JSON");
  status->callback(
      [&status_opts]() { std::exit(cfgsmith::cli::cmd_status(status_opts)); });

  cfgsmith::cli::ValidateOptions validate_opts;
  auto *validate =
      app.add_subcommand("validate", "Check a daemon config file");
  add_config_option(validate, validate_opts.config_file, env_config);
  validate->callback([&validate_opts]() {
    std::exit(cfgsmith::cli::cmd_validate(validate_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
