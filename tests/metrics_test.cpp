#include "cfgsmith/metrics/metrics.hpp"

#include "test_utils.hpp"

#include <chrono>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace cfgsmith;
using namespace std::chrono_literals;

TEST(MetricsRegistryTest, CountersAccumulatePerLabelSet) {
  metrics::MetricsRegistry registry;
  registry.describe("app_reload_total", "Reloads", metrics::MetricType::Counter);
  registry.increment("app_reload_total", {{"status", "success"}});
  registry.increment("app_reload_total", {{"status", "success"}});
  registry.increment("app_reload_total", {{"status", "failure"}});

  EXPECT_EQ(registry.value("app_reload_total", {{"status", "success"}})
                .value_or(0.0),
            2.0);
  EXPECT_EQ(registry.value("app_reload_total", {{"status", "failure"}})
                .value_or(0.0),
            1.0);
  EXPECT_FALSE(registry.value("app_reload_total").has_value());
  EXPECT_FALSE(registry.value("nonexistent").has_value());
}

TEST(MetricsRegistryTest, LabelOrderDoesNotMatter) {
  metrics::MetricsRegistry registry;
  registry.set("app_info", 1.0, {{"b", "2"}, {"a", "1"}});
  EXPECT_EQ(registry.value("app_info", {{"a", "1"}, {"b", "2"}}).value_or(0.0),
            1.0);
}

TEST(MetricsRegistryTest, RenderTextExposition) {
  metrics::MetricsRegistry registry;
  registry.describe("app_config_ok", "Whether the config is OK",
                    metrics::MetricType::Gauge);
  registry.describe("app_signals_total", "Signals received",
                    metrics::MetricType::Counter);
  registry.set("app_config_ok", 1.0);
  registry.increment("app_signals_total", {{"signal", "HUP"}});
  registry.set("app_duration_seconds_sum", 0.25);

  EXPECT_EQ(registry.render(),
            "# HELP app_config_ok Whether the config is OK\n"
            "# TYPE app_config_ok gauge\n"
            "app_config_ok 1\n"
            "# TYPE app_duration_seconds_sum gauge\n"
            "app_duration_seconds_sum 0.25\n"
            "# HELP app_signals_total Signals received\n"
            "# TYPE app_signals_total counter\n"
            "app_signals_total{signal=\"HUP\"} 1\n");
}

TEST(MetricsRegistryTest, SummaryRendersAsOneFamily) {
  metrics::MetricsRegistry registry;
  registry.describe("app_generation_seconds", "Time spent generating",
                    metrics::MetricType::Summary);
  registry.observe("app_generation_seconds", 0.25);
  registry.observe("app_generation_seconds", 0.5);

  EXPECT_EQ(registry.render(),
            "# HELP app_generation_seconds Time spent generating\n"
            "# TYPE app_generation_seconds summary\n"
            "app_generation_seconds_sum 0.75\n"
            "app_generation_seconds_count 2\n");
  EXPECT_EQ(registry.value("app_generation_seconds_sum").value_or(0.0), 0.75);
  EXPECT_EQ(registry.value("app_generation_seconds_count").value_or(0.0), 2.0);
  EXPECT_FALSE(registry.value("app_generation_seconds_max").has_value());
}

TEST(MetricsRegistryTest, LabelValuesAreEscaped) {
  metrics::MetricsRegistry registry;
  registry.increment("app_errors_total", {{"class", "say \"hi\"\\\n"}});
  EXPECT_NE(registry.render().find(
                "app_errors_total{class=\"say \\\"hi\\\"\\\\\\n\"} 1\n"),
            std::string::npos);
}

TEST(MetricsRegistryTest, TextfileIsWrittenAtomically) {
  test::TempDir dir("cfgsmith_metrics_test");
  metrics::MetricsRegistry registry;
  registry.set("app_up", 1.0);

  ASSERT_TRUE(metrics::write_textfile(registry, dir / "app.prom").has_value());
  EXPECT_EQ(test::read_text(dir / "app.prom"), "# TYPE app_up gauge\napp_up 1\n");
  EXPECT_EQ(test::directory_entries(dir.path()),
            std::vector<std::string>{"app.prom"});
}

class PrometheusRecorderTest : public ::testing::Test {
protected:
  [[nodiscard]] auto metric(std::string_view suffix,
                            const metrics::Labels &labels = {}) const
      -> double {
    return registry_.value(recorder_.name(suffix), labels).value_or(-1.0);
  }

  metrics::MetricsRegistry registry_;
  metrics::PrometheusRecorder recorder_{registry_, "nginx"};
};

TEST_F(PrometheusRecorderTest, FamiliesStartAtZero) {
  EXPECT_EQ(recorder_.name("config_ok"), "nginx_config_ok");
  EXPECT_EQ(metric("generation_in_progress_count"), 0.0);
  EXPECT_EQ(metric("last_generation_timestamp"), 0.0);
  EXPECT_EQ(metric("last_change_timestamp"), 0.0);
  EXPECT_EQ(metric("config_ok"), 0.0);
  EXPECT_NE(registry_.render().find("# TYPE nginx_reload_total counter"),
            std::string::npos);
  EXPECT_NE(registry_.render().find(
                "# TYPE nginx_generation_request_duration_seconds summary"),
            std::string::npos);
  EXPECT_EQ(registry_.render().find("duration_seconds_sum counter"),
            std::string::npos);
}

TEST_F(PrometheusRecorderTest, GenerationLifecycle) {
  recorder_.generation_started();
  EXPECT_EQ(metric("generation_in_progress_count"), 1.0);
  EXPECT_EQ(metric("generation_requests_total"), 1.0);

  recorder_.generation_finished(250ms, true);
  EXPECT_EQ(metric("generation_in_progress_count"), 0.0);
  EXPECT_DOUBLE_EQ(metric("generation_request_duration_seconds_sum"), 0.25);
  EXPECT_EQ(metric("generation_request_duration_seconds_count"), 1.0);
  EXPECT_EQ(metric("generation_ok"), 1.0);

  recorder_.generation_started();
  recorder_.generation_exception("std::runtime_error");
  recorder_.generation_finished(0ms, false);
  EXPECT_EQ(metric("generation_ok"), 0.0);
  EXPECT_EQ(metric("generation_exceptions_total",
                   {{"class", "std::runtime_error"}}),
            1.0);
}

TEST_F(PrometheusRecorderTest, ReloadSignalAndTimestamps) {
  recorder_.reload("success");
  recorder_.reload("bad-config");
  recorder_.signal("HUP");
  recorder_.config_ok(true);
  recorder_.last_change(std::chrono::system_clock::time_point(1700000000s));

  EXPECT_EQ(metric("reload_total", {{"status", "success"}}), 1.0);
  EXPECT_EQ(metric("reload_total", {{"status", "bad-config"}}), 1.0);
  EXPECT_EQ(metric("signals_total", {{"signal", "HUP"}}), 1.0);
  EXPECT_EQ(metric("config_ok"), 1.0);
  EXPECT_EQ(metric("last_change_timestamp"), 1700000000.0);
}
