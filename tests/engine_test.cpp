#include "cfgsmith/engine/engine.hpp"
#include "cfgsmith/metrics/metrics.hpp"

#include "test_utils.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <optional>
#include <thread>
#include <unistd.h>
#include <vector>

#include "gtest/gtest.h"

using namespace cfgsmith;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class EngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    live_ = dir_ / "app.conf";
    generator_ = std::make_unique<test::ScriptedGenerator>(live_);
    recorder_ = std::make_unique<metrics::PrometheusRecorder>(registry_,
                                                              "testgen");
  }

  void TearDown() override {
    if (engine_) {
      engine_->request_shutdown();
    }
    if (runner_.joinable()) {
      runner_.join();
    }
  }

  auto make_engine(EngineOptions options = {}) -> void {
    auto engine = RegenerationEngine::create(*generator_, *recorder_,
                                             std::move(options));
    ASSERT_TRUE(engine.has_value()) << engine.error().message();
    engine_ = std::move(*engine);
  }

  auto start() -> void {
    runner_ = std::thread([this] { result_ = engine_->run(); });
  }

  auto stop() -> void {
    engine_->request_shutdown();
    runner_.join();
  }

  [[nodiscard]] auto wait_for_generations(int expected,
                                          std::chrono::milliseconds timeout =
                                              5s) -> bool {
    return test::poll_until(
        [this, expected] {
          return generator_->generate_calls.load() >= expected;
        },
        timeout);
  }

  test::TempDir dir_{"cfgsmith_engine_test"};
  fs::path live_;
  metrics::MetricsRegistry registry_;
  std::unique_ptr<test::ScriptedGenerator> generator_;
  std::unique_ptr<metrics::PrometheusRecorder> recorder_;
  std::unique_ptr<RegenerationEngine> engine_;
  std::thread runner_;
  std::optional<Result<void>> result_;
};

TEST_F(EngineTest, OneShotWritesMissingFileAndExits) {
  generator_->set_data("upstream a;\n");
  make_engine({.one_shot = true});

  auto r = engine_->run();
  ASSERT_TRUE(r.has_value()) << r.error().message();
  EXPECT_EQ(engine_->state(), EngineState::Terminated);
  EXPECT_EQ(test::read_text(live_), "upstream a;\n");
  EXPECT_EQ(generator_->generate_calls.load(), 1);
  EXPECT_EQ(generator_->reload_calls.load(), 0);
}

TEST_F(EngineTest, OneShotRegeneratesExistingFileWithoutForce) {
  test::write_text(live_, "upstream old;\n");
  generator_->set_data("upstream new;\n");
  make_engine({.one_shot = true});

  ASSERT_TRUE(engine_->run().has_value());
  EXPECT_EQ(test::read_text(live_), "upstream new;\n");
  EXPECT_EQ(generator_->reload_calls.load(), 1);
  EXPECT_EQ(generator_->force_flags(), std::vector<bool>{false});
}

TEST_F(EngineTest, OneShotUnchangedFileIsNotReloaded) {
  test::write_text(live_, "listen 80;\n");
  make_engine({.one_shot = true});

  ASSERT_TRUE(engine_->run().has_value());
  EXPECT_EQ(generator_->reload_calls.load(), 0);
}

TEST_F(EngineTest, BootstrapGenerationFailureKeepsRunning) {
  // Only the first generation fails; the callback runs on the loop thread.
  generator_->on_generate = [this](int n) {
    generator_->fail_generation = (n == 1);
  };
  generator_->sleep = 200ms;
  make_engine();
  start();

  ASSERT_TRUE(wait_for_generations(1));
  ASSERT_TRUE(test::poll_until(
      [this] { return engine_->state() == EngineState::Running; }, 2s));

  // The next timeout writes the file that bootstrap could not.
  ASSERT_TRUE(test::poll_until([this] { return fs::exists(live_); }, 3s));
  stop();

  ASSERT_TRUE(result_.has_value());
  EXPECT_TRUE(result_->has_value());
  EXPECT_EQ(test::read_text(live_), "listen 80;\n");
  EXPECT_EQ(generator_->reload_calls.load(), 0);
}

TEST_F(EngineTest, TriggerForcesRegeneration) {
  test::write_text(live_, "listen 80;\n");
  make_engine();
  start();
  ASSERT_TRUE(wait_for_generations(1));

  engine_->request_regeneration();
  ASSERT_TRUE(wait_for_generations(2));
  ASSERT_TRUE(test::poll_until(
      [this] { return generator_->reload_calls.load() == 1; }, 2s));

  stop();
  EXPECT_EQ(generator_->force_flags(), (std::vector<bool>{false, true}));
}

TEST_F(EngineTest, TriggersDuringCycleCoalesceIntoOne) {
  test::write_text(live_, "listen 80;\n");
  generator_->on_generate = [this](int n) {
    if (n == 2) {
      for (int i = 0; i < 5; ++i) {
        engine_->request_regeneration();
      }
    }
  };
  make_engine();
  start();
  ASSERT_TRUE(wait_for_generations(1));

  engine_->request_regeneration();
  ASSERT_TRUE(wait_for_generations(3));
  std::this_thread::sleep_for(300ms);

  stop();
  EXPECT_EQ(generator_->generate_calls.load(), 3);
}

TEST_F(EngineTest, ShutdownDuringCycleLetsItFinish) {
  test::write_text(live_, "listen 80;\n");
  generator_->set_data("listen 8080;\n");
  generator_->on_generate = [this](int n) {
    if (n == 2) {
      engine_->request_shutdown();
    }
  };
  make_engine();
  start();
  ASSERT_TRUE(wait_for_generations(1));

  // Bootstrap already installed the new content; make the second cycle
  // differ again so we can see it completed.
  generator_->set_data("listen 9090;\n");
  engine_->request_regeneration();
  runner_.join();

  ASSERT_TRUE(result_.has_value());
  EXPECT_TRUE(result_->has_value());
  EXPECT_EQ(engine_->state(), EngineState::Terminated);
  EXPECT_EQ(generator_->generate_calls.load(), 2);
  EXPECT_EQ(test::read_text(live_), "listen 9090;\n");
}

TEST_F(EngineTest, ShutdownDuringBootstrapSkipsTheLoop) {
  test::write_text(live_, "listen 80;\n");
  generator_->on_generate = [this](int) { engine_->request_shutdown(); };
  make_engine();

  ASSERT_TRUE(engine_->run().has_value());
  EXPECT_EQ(generator_->generate_calls.load(), 1);
  EXPECT_EQ(engine_->state(), EngineState::Terminated);
}

TEST_F(EngineTest, TimeoutRegeneratesWithoutForce) {
  test::write_text(live_, "listen 80;\n");
  generator_->sleep = 400ms;
  make_engine();
  start();

  ASSERT_TRUE(wait_for_generations(2, 3s));
  // Halfway through the next window: no extra cycle yet.
  std::this_thread::sleep_for(200ms);
  EXPECT_EQ(generator_->generate_calls.load(), 2);
  stop();

  EXPECT_EQ(generator_->generate_calls.load(), 2);
  EXPECT_EQ(generator_->force_flags(), (std::vector<bool>{false, false}));
  ASSERT_EQ(generator_->generate_times.size(), 2u);
  EXPECT_GE(generator_->generate_times[1] - generator_->generate_times[0],
            350ms);
  EXPECT_EQ(generator_->reload_calls.load(), 0);
}

TEST_F(EngineTest, TerminationOutranksPendingWatchAndTrigger) {
  test::write_text(live_, "listen 80;\n");
  auto tmpl = dir_ / "app.conf.tmpl";
  test::write_text(tmpl, "listen {{port}};\n");
  generator_->on_generate = [this, tmpl](int n) {
    if (n == 2) {
      test::write_text(tmpl, "listen {{ port }};\n");
      engine_->request_regeneration();
      engine_->request_shutdown();
    }
  };
  make_engine();
  ASSERT_TRUE(engine_->watch(tmpl).has_value());
  start();
  ASSERT_TRUE(wait_for_generations(1));

  engine_->request_regeneration();
  runner_.join();

  ASSERT_TRUE(result_.has_value());
  EXPECT_TRUE(result_->has_value());
  EXPECT_EQ(generator_->generate_calls.load(), 2);
  EXPECT_EQ(engine_->state(), EngineState::Terminated);
}

TEST_F(EngineTest, TerminationPendingAfterBootstrapSkipsEveryOtherSource) {
  test::write_text(live_, "listen 80;\n");
  auto tmpl = dir_ / "app.conf.tmpl";
  test::write_text(tmpl, "listen {{port}};\n");
  generator_->on_generate = [this, tmpl](int) {
    test::write_text(tmpl, "listen {{ port }};\n");
    engine_->request_regeneration();
    engine_->request_shutdown();
  };
  make_engine();
  ASSERT_TRUE(engine_->watch(tmpl).has_value());

  ASSERT_TRUE(engine_->run().has_value());
  EXPECT_EQ(generator_->generate_calls.load(), 1);
}

TEST_F(EngineTest, WatchIsHandledBeforePendingTrigger) {
  test::write_text(live_, "listen 80;\n");
  auto tmpl = dir_ / "app.conf.tmpl";
  test::write_text(tmpl, "listen {{port}};\n");
  auto trigger_pending_in_watch_cycle = std::make_shared<std::optional<bool>>();
  generator_->on_generate = [this, tmpl,
                             trigger_pending_in_watch_cycle](int n) {
    if (n == 1) {
      test::write_text(tmpl, "listen {{ port }};\n");
      engine_->request_regeneration();
    } else if (n == 2) {
      // Handling the watch must leave the trigger queued.
      *trigger_pending_in_watch_cycle = engine_->regeneration_pending();
    }
  };
  make_engine();
  ASSERT_TRUE(engine_->watch(tmpl).has_value());
  start();

  ASSERT_TRUE(wait_for_generations(3));
  std::this_thread::sleep_for(200ms);
  stop();

  EXPECT_EQ(generator_->generate_calls.load(), 3);
  ASSERT_TRUE(trigger_pending_in_watch_cycle->has_value());
  EXPECT_TRUE(**trigger_pending_in_watch_cycle);
  EXPECT_FALSE(engine_->regeneration_pending());
  EXPECT_EQ(generator_->force_flags(),
            (std::vector<bool>{false, true, true}));
}

TEST_F(EngineTest, CooldownDelaysNextCycle) {
  test::write_text(live_, "listen 80;\n");
  generator_->cooldown = 300ms;
  make_engine();
  start();
  ASSERT_TRUE(wait_for_generations(1));

  engine_->request_regeneration();
  ASSERT_TRUE(wait_for_generations(2));
  stop();

  ASSERT_EQ(generator_->generate_times.size(), 2u);
  EXPECT_GE(generator_->generate_times[1] - generator_->generate_times[0],
            250ms);
}

TEST_F(EngineTest, TriggerBurstDuringCooldownCoalesces) {
  test::write_text(live_, "listen 80;\n");
  generator_->cooldown = 300ms;
  make_engine();
  start();
  ASSERT_TRUE(wait_for_generations(1));

  for (int i = 0; i < 10; ++i) {
    engine_->request_regeneration();
  }
  ASSERT_TRUE(wait_for_generations(2));
  std::this_thread::sleep_for(600ms);

  stop();
  EXPECT_EQ(generator_->generate_calls.load(), 2);
}

TEST_F(EngineTest, WatchedFileChangeForcesRegeneration) {
  test::write_text(live_, "listen 80;\n");
  auto tmpl = dir_ / "app.conf.tmpl";
  test::write_text(tmpl, "listen {{port}};\n");
  make_engine();
  ASSERT_TRUE(engine_->watch(tmpl).has_value());
  start();
  ASSERT_TRUE(wait_for_generations(1));

  test::write_text(tmpl, "listen {{ port }};\n");
  ASSERT_TRUE(wait_for_generations(2));

  stop();
  EXPECT_EQ(generator_->force_flags(), (std::vector<bool>{false, true}));
}

TEST_F(EngineTest, NewFileInWatchedDirectoryForcesRegeneration) {
  test::write_text(live_, "listen 80;\n");
  auto sites = dir_ / "sites";
  fs::create_directories(sites / "enabled");
  generator_->class_watches.add(sites);
  make_engine();
  start();
  ASSERT_TRUE(wait_for_generations(1));

  test::write_text(sites / "enabled" / "example.org", "server example.org;\n");
  ASSERT_TRUE(wait_for_generations(2));
  stop();

  auto flags = generator_->force_flags();
  ASSERT_GE(flags.size(), 2u);
  EXPECT_TRUE(flags[1]);
}

TEST_F(EngineTest, ClassAndInstanceWatchesAreMerged) {
  auto a = dir_ / "a.tmpl";
  auto b = dir_ / "b.tmpl";
  generator_->class_watches.add(a, WatchKind::File);
  make_engine();

  ASSERT_TRUE(engine_->watch(b, WatchKind::File).has_value());
  ASSERT_TRUE(engine_->watch(a, WatchKind::File).has_value());

  EXPECT_EQ(engine_->watches().size(), 2u);
  EXPECT_TRUE(engine_->watches().contains(a));
  EXPECT_TRUE(engine_->watches().contains(b));
}

TEST_F(EngineTest, WatchDuringBootstrapIsRejected) {
  test::write_text(live_, "listen 80;\n");
  std::optional<EngineState> state_in_bootstrap;
  std::optional<Result<void>> late_watch;
  generator_->on_generate = [&, this](int) {
    state_in_bootstrap = engine_->state();
    late_watch = engine_->watch(dir_ / "late.tmpl");
  };
  make_engine({.one_shot = true});

  ASSERT_TRUE(engine_->run().has_value());
  EXPECT_EQ(state_in_bootstrap, EngineState::Bootstrapping);
  ASSERT_TRUE(late_watch.has_value());
  ASSERT_FALSE(late_watch->has_value());
  EXPECT_EQ(late_watch->error(), make_error_code(Error::InvalidState));
  EXPECT_FALSE(engine_->watches().contains(dir_ / "late.tmpl"));
}

TEST_F(EngineTest, WatchAfterRunIsRejected) {
  make_engine({.one_shot = true});
  ASSERT_TRUE(engine_->run().has_value());

  auto r = engine_->watch(dir_ / "late.tmpl");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidState));

  auto again = engine_->run();
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), make_error_code(Error::InvalidState));
}

TEST_F(EngineTest, CreateRejectsCooldownLongerThanSleep) {
  generator_->sleep = 1s;
  generator_->cooldown = 2s;

  auto engine = RegenerationEngine::create(*generator_, *recorder_);
  ASSERT_FALSE(engine.has_value());
  EXPECT_EQ(engine.error(), make_error_code(Error::InvalidArgument));
}

TEST_F(EngineTest, CreateRejectsNegativeDurations) {
  generator_->sleep = -1ms;
  generator_->cooldown = -2ms;

  auto engine = RegenerationEngine::create(*generator_, *recorder_);
  ASSERT_FALSE(engine.has_value());
  EXPECT_EQ(engine.error(), make_error_code(Error::InvalidArgument));
}

TEST_F(EngineTest, CreateRejectsRelativeConfigPath) {
  test::ScriptedGenerator relative("app.conf");

  auto engine = RegenerationEngine::create(relative, *recorder_);
  ASSERT_FALSE(engine.has_value());
  EXPECT_EQ(engine.error(), make_error_code(Error::InvalidArgument));
}

TEST_F(EngineTest, CycleCanBeRunDirectly) {
  test::write_text(live_, "listen 80;\n");
  make_engine();

  auto report = engine_->cycle(true);
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->outcome, RegenOutcome::Success);
  EXPECT_EQ(engine_->state(), EngineState::Starting);
}

TEST_F(EngineTest, CycleIsRejectedWhileTheLoopRuns) {
  test::write_text(live_, "listen 80;\n");
  make_engine();
  start();
  ASSERT_TRUE(wait_for_generations(1));
  ASSERT_TRUE(test::poll_until(
      [this] { return engine_->state() == EngineState::Running; }, 2s));

  auto report = engine_->cycle(true);
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), make_error_code(Error::InvalidState));
  EXPECT_EQ(generator_->generate_calls.load(), 1);
  stop();
}

TEST_F(EngineTest, CycleIsRejectedDuringBootstrap) {
  test::write_text(live_, "listen 80;\n");
  std::optional<Result<CycleReport>> nested;
  generator_->on_generate = [&, this](int n) {
    if (n == 1) {
      nested = engine_->cycle(false);
    }
  };
  make_engine({.one_shot = true});

  ASSERT_TRUE(engine_->run().has_value());
  ASSERT_TRUE(nested.has_value());
  ASSERT_FALSE(nested->has_value());
  EXPECT_EQ(nested->error(), make_error_code(Error::InvalidState));
  EXPECT_EQ(generator_->generate_calls.load(), 1);
}

TEST_F(EngineTest, CycleIsAllowedAfterTermination) {
  make_engine({.one_shot = true});
  ASSERT_TRUE(engine_->run().has_value());

  auto report = engine_->cycle(false);
  ASSERT_TRUE(report.has_value()) << report.error().message();
}

TEST_F(EngineTest, MetricsFileIsWrittenAfterEachCycle) {
  test::write_text(live_, "listen 80;\n");
  auto metrics_file = dir_ / "cfgsmith.prom";
  make_engine({.one_shot = true,
               .registry = &registry_,
               .metrics_file = metrics_file});

  ASSERT_TRUE(engine_->run().has_value());
  auto text = test::read_text(metrics_file);
  EXPECT_NE(text.find("testgen_generation_requests_total 1\n"),
            std::string::npos);
  EXPECT_NE(text.find("# TYPE testgen_reload_total counter"),
            std::string::npos);
}

TEST_F(EngineTest, SignalsTriggerAndStopTheLoop) {
  test::write_text(live_, "listen 80;\n");
  make_engine({.handle_signals = true});
  start();
  ASSERT_TRUE(wait_for_generations(1));

  ASSERT_EQ(::kill(::getpid(), SIGHUP), 0);
  ASSERT_TRUE(wait_for_generations(2));

  ASSERT_EQ(::kill(::getpid(), SIGTERM), 0);
  runner_.join();

  ASSERT_TRUE(result_.has_value());
  EXPECT_TRUE(result_->has_value());
  EXPECT_EQ(generator_->force_flags(), (std::vector<bool>{false, true}));
  EXPECT_EQ(registry_.value("testgen_signals_total", {{"signal", "HUP"}})
                .value_or(0.0),
            1.0);
  EXPECT_EQ(registry_.value("testgen_signals_total", {{"signal", "TERM"}})
                .value_or(0.0),
            1.0);
}
