#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace cfgsmith::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m"  // error: red
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name,
                                      Level fallback = Level::Info) noexcept
    -> Level {
  const auto *it = std::ranges::find(level_names, name);
  return (it != level_names.end())
             ? static_cast<Level>(std::distance(level_names.begin(), it))
             : fallback;
}

// Thread-local buffer to reduce allocation
struct alignas(64) ThreadBuffer {
  std::string buffer;
  ThreadBuffer() noexcept { buffer.reserve(4096); }
};

inline thread_local ThreadBuffer t_buffer;

// Async logger. Records are formatted on the calling thread and posted to a
// writer thread that runs its own io_context. Before start() and after stop()
// records are written synchronously.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;
  using WorkGuard = boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> accepting_{false};
  std::atomic<FILE *> output_{stdout};
  std::atomic<std::uint64_t> dropped_messages_{0};
  std::atomic<std::size_t> queued_{0};
  FILE *file_{nullptr};
  std::mutex control_mu_;
  boost::asio::io_context queue_ctx_{1};
  std::optional<WorkGuard> work_;
  std::jthread writer_;

  auto write_now(std::string_view msg) -> void {
    auto *out = output_.load(std::memory_order_acquire);
    if (!out) {
      out = stdout;
    }
    std::fwrite(msg.data(), 1, msg.size(), out);
    std::fflush(out);
  }

  // Runs on the writer thread while started, on the caller otherwise.
  auto open_output(const std::string &path) -> bool {
    if (path.empty()) {
      output_.store(stdout, std::memory_order_release);
      if (file_) {
        std::fclose(file_);
        file_ = nullptr;
      }
      return true;
    }
    FILE *f = std::fopen(path.c_str(), "a");
    if (!f)
      return false;
    std::setvbuf(f, nullptr, _IOLBF, 0);
    output_.store(f, std::memory_order_release);
    if (file_)
      std::fclose(file_);
    file_ = f;
    return true;
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    std::lock_guard lock(control_mu_);
    if (accepting_.load(std::memory_order_acquire))
      return;
    queue_ctx_.restart();
    work_.emplace(boost::asio::make_work_guard(queue_ctx_));
    writer_ = std::jthread([this] { queue_ctx_.run(); });
    accepting_.store(true, std::memory_order_release);
  }

  // Flushes every queued record before returning.
  auto stop() -> void {
    std::lock_guard lock(control_mu_);
    if (!accepting_.exchange(false, std::memory_order_acq_rel))
      return;
    work_.reset();
    if (writer_.joinable()) {
      writer_.join();
    }
    // Records posted while the writer was winding down.
    queue_ctx_.restart();
    queue_ctx_.poll();
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto dropped_messages() const noexcept -> std::uint64_t {
    return dropped_messages_.load(std::memory_order_relaxed);
  }

  // SIGUSR1: one step more verbose (towards trace).
  auto increase_verbosity() noexcept -> Level {
    auto current = level_.load(std::memory_order_acquire);
    if (current != Level::Trace) {
      current = static_cast<Level>(std::to_underlying(current) - 1);
      level_.store(current, std::memory_order_release);
    }
    return current;
  }

  // SIGUSR2: one step less verbose (towards error).
  auto decrease_verbosity() noexcept -> Level {
    auto current = level_.load(std::memory_order_acquire);
    if (current != Level::Error) {
      current = static_cast<Level>(std::to_underlying(current) + 1);
      level_.store(current, std::memory_order_release);
    }
    return current;
  }

  auto set_output_stderr() noexcept -> void {
    output_.store(stderr, std::memory_order_release);
  }

  // Once started the switch is queued behind earlier records; an open failure
  // is written to the current output instead of being returned.
  auto set_output_file(std::string_view path) -> bool {
    std::lock_guard lock(control_mu_);
    if (!accepting_.load(std::memory_order_acquire)) {
      return open_output(std::string(path));
    }
    boost::asio::post(queue_ctx_, [this, target = std::string(path)] {
      if (!open_output(target)) {
        write_now(fmt::format("Failed to open log file {}; keeping the "
                              "current output\n",
                              target));
      }
    });
    return true;
  }

  [[nodiscard]] auto should_drop_on_overflow(FILE *out) const noexcept -> bool {
    if (out == nullptr) {
      return true;
    }
    const int fd = ::fileno(out);
    if (fd < 0) {
      return true;
    }
    return ::isatty(fd) == 0;
  }

  template <typename... Args>
  auto log(Level level, fmt::format_string<Args...> format, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::seconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;

    auto &buf = t_buffer.buffer;
    buf.clear();
    fmt::format_to(std::back_inserter(buf),
                   "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] ", time,
                   level_color(level), level_name(level), "\o{33}[0m", tid);
    fmt::format_to(std::back_inserter(buf), format,
                   std::forward<Args>(args)...);
    buf.push_back('\n');

    if (!accepting_.load(std::memory_order_acquire)) {
      write_now(buf);
      return;
    }

    if (queued_.fetch_add(1, std::memory_order_acq_rel) >= QUEUE_CAPACITY) {
      queued_.fetch_sub(1, std::memory_order_acq_rel);
      // Avoid pipe backpressure deadlocks: if not attached to a TTY, prefer
      // dropping logs over blocking the regeneration loop.
      if (should_drop_on_overflow(output_.load(std::memory_order_acquire))) {
        dropped_messages_.fetch_add(1, std::memory_order_relaxed);
        return;
      }
      write_now(buf);
      return;
    }
    boost::asio::post(queue_ctx_, [this, msg = std::string(buf)] {
      queued_.fetch_sub(1, std::memory_order_acq_rel);
      write_now(msg);
    });
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

inline auto increase_verbosity() noexcept -> Level {
  return logger().increase_verbosity();
}

inline auto decrease_verbosity() noexcept -> Level {
  return logger().decrease_verbosity();
}

template <typename... Args>
auto trace(fmt::format_string<Args...> format, Args &&...args) -> void {
  logger().log(Level::Trace, format, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(fmt::format_string<Args...> format, Args &&...args) -> void {
  logger().log(Level::Debug, format, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(fmt::format_string<Args...> format, Args &&...args) -> void {
  logger().log(Level::Info, format, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(fmt::format_string<Args...> format, Args &&...args) -> void {
  logger().log(Level::Warn, format, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(fmt::format_string<Args...> format, Args &&...args) -> void {
  logger().log(Level::Error, format, std::forward<Args>(args)...);
}

} // namespace cfgsmith::log
