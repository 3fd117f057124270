#include "cfgsmith/metrics/metrics.hpp"

#include "cfgsmith/util/fs.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <sstream>
#include <utility>

namespace cfgsmith::metrics {

namespace {

auto escape_label(std::string_view value) -> std::string {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\n':
      out += "\\n";
      break;
    default:
      out += c;
    }
  }
  return out;
}

auto type_name(MetricType type) -> std::string_view {
  switch (type) {
  case MetricType::Counter:
    return "counter";
  case MetricType::Gauge:
    return "gauge";
  case MetricType::Summary:
    return "summary";
  }
  return "untyped";
}

auto write_labels(std::ostringstream &out, const Labels &labels) -> void {
  if (labels.empty()) {
    return;
  }
  out << '{';
  for (std::size_t i = 0; i < labels.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << labels[i].first << "=\"" << escape_label(labels[i].second) << '"';
  }
  out << '}';
}

auto normalized(Labels labels) -> Labels {
  std::ranges::sort(labels);
  return labels;
}

auto to_seconds(std::chrono::system_clock::time_point when) -> double {
  return std::chrono::duration<double>(when.time_since_epoch()).count();
}

} // namespace

auto MetricsRegistry::family(std::string_view name) -> Family & {
  auto it = families_.find(name);
  if (it == families_.end()) {
    it = families_.emplace(std::string(name), Family{}).first;
  }
  return it->second;
}

auto MetricsRegistry::describe(std::string_view name, std::string_view help,
                               MetricType type) -> void {
  std::lock_guard lock(mutex_);
  auto &f = family(name);
  f.help = std::string(help);
  f.type = type;
}

auto MetricsRegistry::increment(std::string_view name, const Labels &labels,
                                double by) -> void {
  std::lock_guard lock(mutex_);
  family(name).samples[normalized(labels)] += by;
}

auto MetricsRegistry::set(std::string_view name, double value,
                          const Labels &labels) -> void {
  std::lock_guard lock(mutex_);
  family(name).samples[normalized(labels)] = value;
}

auto MetricsRegistry::observe(std::string_view name, double value,
                              const Labels &labels) -> void {
  std::lock_guard lock(mutex_);
  auto &f = family(name);
  f.type = MetricType::Summary;
  auto &[sum, count] = f.observations[normalized(labels)];
  sum += value;
  ++count;
}

auto MetricsRegistry::value(std::string_view name, const Labels &labels) const
    -> std::optional<double> {
  std::lock_guard lock(mutex_);
  if (auto it = families_.find(name); it != families_.end()) {
    auto sample = it->second.samples.find(normalized(labels));
    if (sample == it->second.samples.end()) {
      return std::nullopt;
    }
    return sample->second;
  }

  for (std::string_view suffix : {"_sum", "_count"}) {
    if (!name.ends_with(suffix)) {
      continue;
    }
    auto it = families_.find(name.substr(0, name.size() - suffix.size()));
    if (it == families_.end()) {
      return std::nullopt;
    }
    auto obs = it->second.observations.find(normalized(labels));
    if (obs == it->second.observations.end()) {
      return std::nullopt;
    }
    return suffix == "_sum" ? obs->second.first
                            : static_cast<double>(obs->second.second);
  }
  return std::nullopt;
}

auto MetricsRegistry::render() const -> std::string {
  std::lock_guard lock(mutex_);
  std::ostringstream out;
  for (const auto &[name, f] : families_) {
    if (!f.help.empty()) {
      out << "# HELP " << name << ' ' << f.help << '\n';
    }
    out << "# TYPE " << name << ' ' << type_name(f.type) << '\n';
    for (const auto &[labels, v] : f.samples) {
      out << name;
      write_labels(out, labels);
      out << ' ' << fmt::format("{}", v) << '\n';
    }
    for (const auto &[labels, obs] : f.observations) {
      out << name << "_sum";
      write_labels(out, labels);
      out << ' ' << fmt::format("{}", obs.first) << '\n';
      out << name << "_count";
      write_labels(out, labels);
      out << ' ' << obs.second << '\n';
    }
  }
  return out.str();
}

auto write_textfile(const MetricsRegistry &registry,
                    const std::filesystem::path &path) -> Result<void> {
  return fs_util::atomic_write(path, registry.render());
}

PrometheusRecorder::PrometheusRecorder(MetricsRegistry &registry,
                                       std::string prefix)
    : registry_(registry), prefix_(std::move(prefix)) {
  registry_.describe(name("generation_requests_total"),
                     "Number of config generation requests",
                     MetricType::Counter);
  registry_.describe(name("generation_request_duration_seconds"),
                     "Time spent generating config", MetricType::Summary);
  registry_.describe(name("generation_exceptions_total"),
                     "Config generations that failed, by error class",
                     MetricType::Counter);
  registry_.describe(name("generation_in_progress_count"),
                     "Config generations currently running", MetricType::Gauge);
  registry_.describe(name("generation_ok"),
                     "Whether the last config generation succeeded",
                     MetricType::Gauge);
  registry_.describe(name("last_generation_timestamp"),
                     "When the last config generation run was made",
                     MetricType::Gauge);
  registry_.describe(name("last_change_timestamp"),
                     "When the config file was last written to",
                     MetricType::Gauge);
  registry_.describe(name("reload_total"),
                     "How many times we've asked the server to reload",
                     MetricType::Counter);
  registry_.describe(name("signals_total"),
                     "How many signals have been received (and handled)",
                     MetricType::Counter);
  registry_.describe(name("config_ok"),
                     "Whether the last config change was accepted by the server",
                     MetricType::Gauge);

  registry_.set(name("generation_in_progress_count"), 0);
  registry_.set(name("last_generation_timestamp"), 0);
  registry_.set(name("last_change_timestamp"), 0);
  registry_.set(name("config_ok"), 0);
}

auto PrometheusRecorder::name(std::string_view suffix) const -> std::string {
  return fmt::format("{}_{}", prefix_, suffix);
}

auto PrometheusRecorder::generation_started() -> void {
  registry_.increment(name("generation_requests_total"));
  registry_.increment(name("generation_in_progress_count"));
}

auto PrometheusRecorder::generation_finished(
    std::chrono::duration<double> elapsed, bool succeeded) -> void {
  registry_.increment(name("generation_in_progress_count"), {}, -1.0);
  registry_.observe(name("generation_request_duration_seconds"),
                    elapsed.count());
  registry_.set(name("generation_ok"), succeeded ? 1.0 : 0.0);
}

auto PrometheusRecorder::generation_exception(std::string_view error_class)
    -> void {
  registry_.increment(name("generation_exceptions_total"),
                      {{"class", std::string(error_class)}});
}

auto PrometheusRecorder::reload(std::string_view status) -> void {
  registry_.increment(name("reload_total"), {{"status", std::string(status)}});
}

auto PrometheusRecorder::signal(std::string_view signal_name) -> void {
  registry_.increment(name("signals_total"),
                      {{"signal", std::string(signal_name)}});
}

auto PrometheusRecorder::config_ok(bool healthy) -> void {
  registry_.set(name("config_ok"), healthy ? 1.0 : 0.0);
}

auto PrometheusRecorder::last_generation(
    std::chrono::system_clock::time_point when) -> void {
  registry_.set(name("last_generation_timestamp"), to_seconds(when));
}

auto PrometheusRecorder::last_change(std::chrono::system_clock::time_point when)
    -> void {
  registry_.set(name("last_change_timestamp"), to_seconds(when));
}

} // namespace cfgsmith::metrics
