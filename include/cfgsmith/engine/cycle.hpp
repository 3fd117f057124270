#pragma once

#include "cfgsmith/core/error.hpp"
#include "cfgsmith/engine/generator.hpp"
#include "cfgsmith/metrics/metrics.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace cfgsmith {

namespace fs_util {
class TempFile;
}

enum class RegenOutcome : std::uint8_t {
  Unchanged,
  Success,
  ReloadFailure,
  BadConfigRolledBack,
  EverythingIsAwful,
};

// Label used for reload_total{status=...}.
[[nodiscard]] constexpr auto to_string_view(RegenOutcome outcome) noexcept
    -> std::string_view {
  switch (outcome) {
  case RegenOutcome::Unchanged:
    return "unchanged";
  case RegenOutcome::Success:
    return "success";
  case RegenOutcome::ReloadFailure:
    return "failure";
  case RegenOutcome::BadConfigRolledBack:
    return "bad-config";
  case RegenOutcome::EverythingIsAwful:
    return "everything-is-awful";
  }
  return "unknown";
}

struct CycleReport {
  RegenOutcome outcome{RegenOutcome::Unchanged};
  bool generation_failed{false};
  bool config_was_different{false};
  bool config_was_cycled{false};
  std::string existing_hash;
  std::string new_hash;
};

// One regeneration pass: generate, compare with the live file, swap the new
// content in atomically, reload and roll back when the reload or the health
// check says so.
//
// Generator and reload failures are part of the report. Only filesystem
// errors come back as an error, and they leave no temp or backup files
// behind.
class CycleProtocol {
public:
  CycleProtocol(ConfigGenerator &generator, metrics::IMetricsRecorder &metrics)
      : generator_(generator), metrics_(metrics) {}

  [[nodiscard]] auto run(bool force_reload) -> Result<CycleReport>;

  // Creates a missing live file from freshly generated content without
  // reloading the server. Returns false when generation failed and nothing
  // was written.
  [[nodiscard]] auto write_initial() -> Result<bool>;

private:
  auto run_cycle(bool force_reload, CycleReport &report) -> Result<void>;
  auto cycle_into_place(fs_util::TempFile &candidate) -> Result<RegenOutcome>;
  auto generate() -> Result<std::string>;
  auto reload() -> Result<void>;
  auto finish() -> void;

  ConfigGenerator &generator_;
  metrics::IMetricsRecorder &metrics_;
};

} // namespace cfgsmith
