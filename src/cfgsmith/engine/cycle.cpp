#include "cfgsmith/engine/cycle.hpp"

#include "cfgsmith/util/diff.hpp"
#include "cfgsmith/util/digest.hpp"
#include "cfgsmith/util/fs.hpp"
#include "cfgsmith/util/log.hpp"

#include <boost/core/demangle.hpp>

#include <chrono>
#include <exception>
#include <typeinfo>
#include <utility>

namespace cfgsmith {

auto CycleProtocol::run(bool force_reload) -> Result<CycleReport> {
  CycleReport report;
  auto r = run_cycle(force_reload, report);
  finish();
  if (!r) {
    return fail(r.error());
  }
  return ok(std::move(report));
}

auto CycleProtocol::run_cycle(bool force_reload, CycleReport &report)
    -> Result<void> {
  log::debug("Regenerating config (force_reload={})", force_reload);
  const auto live = generator_.config_file();

  auto existing = fs_util::read_file(live);
  if (!existing) {
    log::error("Cannot read {}: {}", live.string(), existing.error().message());
    return fail(existing.error());
  }
  report.existing_hash = util::content_hash(*existing);
  report.new_hash = report.existing_hash;

  generator_.before_regenerate_config(BeforeRegenerate{
      .force_reload = force_reload,
      .existing_hash = report.existing_hash,
      .existing_content = *existing,
  });

  auto candidate = generate();
  if (!candidate) {
    report.generation_failed = true;
    log::warn("Config generation failed ({}); leaving {} untouched",
              candidate.error().message(), live.string());
    generator_.after_regenerate_config(AfterRegenerate{
        .force_reload = force_reload,
        .config_was_different = false,
        .config_was_cycled = false,
        .new_hash = report.existing_hash,
    });
    return ok();
  }
  report.new_hash = util::content_hash(*candidate);

  auto tmp = fs_util::TempFile::create(live.parent_path(),
                                       generator_.service_name());
  if (!tmp) {
    log::error("Cannot create temp file next to {}: {}", live.string(),
               tmp.error().message());
    return fail(tmp.error());
  }
  log::debug("Tempfile is {}", tmp->path().string());
  if (auto r = tmp->write(*candidate); !r) {
    log::error("Cannot write {}: {}", tmp->path().string(),
               r.error().message());
    return r;
  }
  log::debug("Existing config hash: {}, new config hash: {}",
             report.existing_hash, report.new_hash);

  if (auto r = fs_util::match_permissions(live, tmp->path()); !r) {
    return r;
  }

  const auto diff = util::unified_diff(*existing, *candidate, live.string(),
                                       tmp->path().string());
  report.config_was_different = !diff.empty();
  if (report.config_was_different) {
    log::info("Config has changed.  Diff:\n{}", diff);
  }
  if (force_reload) {
    log::debug("Forcing config reload because force_reload is set");
  }

  if (force_reload || report.config_was_different) {
    auto outcome = cycle_into_place(*tmp);
    if (!outcome) {
      return fail(outcome.error());
    }
    report.outcome = *outcome;
    report.config_was_cycled = true;
  }

  generator_.after_regenerate_config(AfterRegenerate{
      .force_reload = force_reload,
      .config_was_different = report.config_was_different,
      .config_was_cycled = report.config_was_cycled,
      .new_hash = report.new_hash,
  });
  return ok();
}

auto CycleProtocol::cycle_into_place(fs_util::TempFile &candidate)
    -> Result<RegenOutcome> {
  const auto live = generator_.config_file();
  log::debug("Cycling {} into operation", candidate.path().string());

  const fs_util::ScopedRemoval backup{candidate.path().string() + ".old"};
  if (auto r = fs_util::copy_file(live, backup.path()); !r) {
    return fail(r.error());
  }
  if (auto r = candidate.commit_to(live); !r) {
    return fail(r.error());
  }

  // Only a regression is rolled back: when the server was already unhappy a
  // new config cannot make things worse, and keeping it helps bootstrapping.
  const bool was_ok = generator_.config_ok();
  log::debug("Current config is {}", was_ok ? "OK" : "broken");

  log::debug("Reloading the server...");
  if (auto r = reload(); !r) {
    log::error("Server reload failed: {}", r.error().message());
    if (was_ok) {
      if (auto restored = fs_util::rename_file(backup.path(), live);
          !restored) {
        return fail(restored.error());
      }
      log::info("Restored previous config file {}", live.string());
    }
    metrics_.reload(to_string_view(RegenOutcome::ReloadFailure));
    return RegenOutcome::ReloadFailure;
  }
  log::debug("Server reloaded successfully");

  if (generator_.config_ok()) {
    metrics_.config_ok(true);
    metrics_.reload(to_string_view(RegenOutcome::Success));
    log::info("Configuration successfully updated");
    return RegenOutcome::Success;
  }

  metrics_.config_ok(false);
  if (!was_ok) {
    log::warn("New config failed the health check; leaving it in place "
              "because the old config is broken too");
    metrics_.reload(to_string_view(RegenOutcome::EverythingIsAwful));
    return RegenOutcome::EverythingIsAwful;
  }

  log::warn("New config failed the health check; rolling back to the "
            "previous known-good config");
  if (auto r = fs_util::rename_file(backup.path(), live); !r) {
    return fail(r.error());
  }
  if (auto r = reload(); !r) {
    log::error("Reload of the restored config failed: {}",
               r.error().message());
  }
  metrics_.reload(to_string_view(RegenOutcome::BadConfigRolledBack));
  return RegenOutcome::BadConfigRolledBack;
}

auto CycleProtocol::write_initial() -> Result<bool> {
  const auto live = generator_.config_file();
  log::info("No existing config file {} found; writing one", live.string());

  auto data = generate();
  if (!data) {
    log::error("Initial config generation failed ({}); {} not written",
               data.error().message(), live.string());
    metrics_.last_generation(std::chrono::system_clock::now());
    return ok(false);
  }
  if (auto r = fs_util::atomic_write(live, *data); !r) {
    log::error("Cannot write {}: {}", live.string(), r.error().message());
    return fail(r.error());
  }
  const auto now = std::chrono::system_clock::now();
  metrics_.last_generation(now);
  metrics_.last_change(now);
  return ok(true);
}

auto CycleProtocol::generate() -> Result<std::string> {
  metrics_.generation_started();
  const auto started = std::chrono::steady_clock::now();

  Result<std::string> data = fail(Error::GenerationFailed);
  try {
    data = generator_.config_data();
    if (!data) {
      log::error("Call to config_data failed: {}", data.error().message());
      metrics_.generation_exception(data.error().message());
    }
  } catch (const std::exception &e) {
    const auto error_class = boost::core::demangle(typeid(e).name());
    log::error("Call to config_data raised {}: {}", error_class, e.what());
    metrics_.generation_exception(error_class);
    data = fail(Error::GenerationFailed);
  }

  metrics_.generation_finished(std::chrono::steady_clock::now() - started,
                               data.has_value());
  return data;
}

auto CycleProtocol::reload() -> Result<void> {
  try {
    return generator_.reload_server();
  } catch (const std::exception &e) {
    log::error("Call to reload_server raised {}: {}",
               boost::core::demangle(typeid(e).name()), e.what());
    return fail(Error::ReloadFailed);
  }
}

auto CycleProtocol::finish() -> void {
  metrics_.last_generation(std::chrono::system_clock::now());
  const auto live = generator_.config_file();
  if (auto mtime = fs_util::modification_time(live); mtime) {
    metrics_.last_change(*mtime);
  } else {
    log::warn("Cannot stat {}: {}", live.string(), mtime.error().message());
  }
}

} // namespace cfgsmith
