#pragma once

#include "cfgsmith/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cfgsmith::metrics {

enum class MetricType : std::uint8_t { Counter, Gauge, Summary };

using Labels = std::vector<std::pair<std::string, std::string>>;

// In-process store of counter, gauge and summary families, rendered in the
// Prometheus text exposition format. Thread-safe.
class MetricsRegistry {
public:
  auto describe(std::string_view name, std::string_view help, MetricType type)
      -> void;

  auto increment(std::string_view name, const Labels &labels = {},
                 double by = 1.0) -> void;
  auto set(std::string_view name, double value, const Labels &labels = {})
      -> void;
  // Adds one observation to a summary family (its `_sum` and `_count`).
  auto observe(std::string_view name, double value, const Labels &labels = {})
      -> void;

  // A summary's samples are addressed as `<name>_sum` and `<name>_count`.
  [[nodiscard]] auto value(std::string_view name,
                           const Labels &labels = {}) const
      -> std::optional<double>;

  [[nodiscard]] auto render() const -> std::string;

private:
  struct Family {
    std::string help;
    MetricType type{MetricType::Gauge};
    std::map<Labels, double> samples;
    std::map<Labels, std::pair<double, std::uint64_t>> observations;
  };

  auto family(std::string_view name) -> Family &;

  mutable std::mutex mutex_;
  std::map<std::string, Family, std::less<>> families_;
};

// Rewrites `path` with the registry's current text (textfile collector).
[[nodiscard]] auto write_textfile(const MetricsRegistry &registry,
                                  const std::filesystem::path &path)
    -> Result<void>;

// The events the engine reports. Implementations decide how (or whether) to
// record them.
class IMetricsRecorder {
public:
  virtual ~IMetricsRecorder() = default;

  virtual auto generation_started() -> void = 0;
  virtual auto generation_finished(std::chrono::duration<double> elapsed,
                                   bool succeeded) -> void = 0;
  virtual auto generation_exception(std::string_view error_class) -> void = 0;
  virtual auto reload(std::string_view status) -> void = 0;
  virtual auto signal(std::string_view name) -> void = 0;
  virtual auto config_ok(bool healthy) -> void = 0;
  virtual auto last_generation(std::chrono::system_clock::time_point when)
      -> void = 0;
  virtual auto last_change(std::chrono::system_clock::time_point when)
      -> void = 0;
};

class NullMetricsRecorder final : public IMetricsRecorder {
public:
  auto generation_started() -> void override {}
  auto generation_finished(std::chrono::duration<double>, bool)
      -> void override {}
  auto generation_exception(std::string_view) -> void override {}
  auto reload(std::string_view) -> void override {}
  auto signal(std::string_view) -> void override {}
  auto config_ok(bool) -> void override {}
  auto last_generation(std::chrono::system_clock::time_point)
      -> void override {}
  auto last_change(std::chrono::system_clock::time_point) -> void override {}
};

// Records into a MetricsRegistry under `<prefix>_...` names.
class PrometheusRecorder final : public IMetricsRecorder {
public:
  PrometheusRecorder(MetricsRegistry &registry, std::string prefix);

  auto generation_started() -> void override;
  auto generation_finished(std::chrono::duration<double> elapsed,
                           bool succeeded) -> void override;
  auto generation_exception(std::string_view error_class) -> void override;
  auto reload(std::string_view status) -> void override;
  auto signal(std::string_view name) -> void override;
  auto config_ok(bool healthy) -> void override;
  auto last_generation(std::chrono::system_clock::time_point when)
      -> void override;
  auto last_change(std::chrono::system_clock::time_point when)
      -> void override;

  [[nodiscard]] auto name(std::string_view suffix) const -> std::string;

private:
  MetricsRegistry &registry_;
  std::string prefix_;
};

} // namespace cfgsmith::metrics
