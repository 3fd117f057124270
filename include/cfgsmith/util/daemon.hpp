#pragma once

#include "cfgsmith/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace cfgsmith {

// Exclusive lock on a pid file holding this process's pid. Two daemons
// pointed at the same pid file cannot both hold it; the file is removed when
// the guard goes away.
class PidFileGuard {
public:
  PidFileGuard() = default;
  ~PidFileGuard();

  PidFileGuard(const PidFileGuard &) = delete;
  auto operator=(const PidFileGuard &) -> PidFileGuard & = delete;
  PidFileGuard(PidFileGuard &&other) noexcept;
  auto operator=(PidFileGuard &&other) noexcept -> PidFileGuard &;

  // Error::AlreadyExists when another process holds the lock.
  [[nodiscard]] static auto acquire(const std::filesystem::path &path)
      -> Result<PidFileGuard>;

  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path & {
    return path_;
  }

private:
  std::filesystem::path path_;
  std::unique_ptr<void, void (*)(void *)> lock_{nullptr, nullptr};
  bool owns_{false};

  PidFileGuard(std::filesystem::path path,
               std::unique_ptr<void, void (*)(void *)> lock) noexcept;
  auto release() noexcept -> void;
};

[[nodiscard]] auto read_pid_file(const std::filesystem::path &path)
    -> Result<std::int64_t>;
[[nodiscard]] auto is_process_alive(std::int64_t pid) -> bool;
[[nodiscard]] auto send_signal(std::int64_t pid, int signal_no)
    -> Result<void>;
[[nodiscard]] auto wait_for_process_exit(std::int64_t pid,
                                         std::chrono::milliseconds timeout)
    -> bool;

} // namespace cfgsmith
