#include "cfgsmith/generator/command_generator.hpp"

#include "cfgsmith/util/log.hpp"

#include <boost/process/args.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/pipe.hpp>

#include <iterator>
#include <utility>
#include <vector>

namespace cfgsmith {

namespace bp = boost::process;

auto run_shell_command(std::string_view command, bool capture_output)
    -> Result<CommandResult> {
  if (command.empty()) {
    return fail(Error::InvalidArgument);
  }

  std::vector<std::string> args{"-c", std::string(command)};
  std::error_code ec;
  CommandResult result;

  if (capture_output) {
    bp::ipstream out;
    bp::child child(bp::exe = "/bin/sh", bp::args = args,
                    bp::std_in.close(), bp::std_out > out, ec);
    if (ec) {
      log::error("Failed to start '{}': {}", command, ec.message());
      return fail(Error::ProcessSpawnFailed);
    }
    result.output.assign(std::istreambuf_iterator<char>(out),
                         std::istreambuf_iterator<char>());
    child.wait(ec);
    if (ec) {
      return fail(ec);
    }
    result.exit_code = child.exit_code();
  } else {
    bp::child child(bp::exe = "/bin/sh", bp::args = args,
                    bp::std_in.close(), ec);
    if (ec) {
      log::error("Failed to start '{}': {}", command, ec.message());
      return fail(Error::ProcessSpawnFailed);
    }
    child.wait(ec);
    if (ec) {
      return fail(ec);
    }
    result.exit_code = child.exit_code();
  }

  log::debug("'{}' exited with {}", command, result.exit_code);
  return ok(std::move(result));
}

auto CommandGenerator::config_data() -> Result<std::string> {
  auto r = run_shell_command(options_.command, true);
  if (!r) {
    return fail(r.error());
  }
  if (r->exit_code != 0) {
    log::error("Config command '{}' exited with {}", options_.command,
               r->exit_code);
    return fail(Error::GenerationFailed);
  }
  return ok(std::move(r->output));
}

auto CommandGenerator::reload_server() -> Result<void> {
  if (options_.reload_command.empty()) {
    log::debug("No reload command configured");
    return ok();
  }
  auto r = run_shell_command(options_.reload_command);
  if (!r) {
    return fail(r.error());
  }
  if (r->exit_code != 0) {
    log::error("Reload command '{}' exited with {}", options_.reload_command,
               r->exit_code);
    return fail(Error::ReloadFailed);
  }
  return ok();
}

auto CommandGenerator::config_ok() -> bool {
  if (options_.health_command.empty()) {
    return true;
  }
  auto r = run_shell_command(options_.health_command);
  if (!r) {
    log::warn("Health command '{}' could not run: {}", options_.health_command,
              r.error().message());
    return false;
  }
  return r->exit_code == 0;
}

} // namespace cfgsmith
