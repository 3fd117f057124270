#pragma once

#include "cfgsmith/core/error.hpp"

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace cfgsmith::fs_util {

[[nodiscard]] auto read_file(const std::filesystem::path &path)
    -> Result<std::string>;

[[nodiscard]] auto file_exists(const std::filesystem::path &path) -> bool;

[[nodiscard]] auto copy_file(const std::filesystem::path &from,
                             const std::filesystem::path &to) -> Result<void>;

// rename(2): atomic replacement when both paths are on one filesystem.
[[nodiscard]] auto rename_file(const std::filesystem::path &from,
                               const std::filesystem::path &to)
    -> Result<void>;

// Copy mode, owner and group from `source` onto `target`. An EPERM from the
// ownership change is logged and tolerated (unprivileged daemons).
[[nodiscard]] auto match_permissions(const std::filesystem::path &source,
                                     const std::filesystem::path &target)
    -> Result<void>;

[[nodiscard]] auto modification_time(const std::filesystem::path &path)
    -> Result<std::chrono::system_clock::time_point>;

// The calling process's umask, read without modifying it.
[[nodiscard]] auto process_umask() -> mode_t;

// Write `content` to a sibling temp file and rename it over `target`.
[[nodiscard]] auto atomic_write(const std::filesystem::path &target,
                                std::string_view content) -> Result<void>;

// A mkostemp(3) file that is unlinked on destruction unless it was renamed
// away or released.
class TempFile {
public:
  TempFile() = default;
  ~TempFile();

  TempFile(const TempFile &) = delete;
  auto operator=(const TempFile &) -> TempFile & = delete;
  TempFile(TempFile &&other) noexcept;
  auto operator=(TempFile &&other) noexcept -> TempFile &;

  [[nodiscard]] static auto create(const std::filesystem::path &directory,
                                   std::string_view prefix) -> Result<TempFile>;

  // Writes the whole buffer, flushes it to disk and closes the descriptor.
  [[nodiscard]] auto write(std::string_view content) -> Result<void>;

  // Renames the file onto `target`; afterwards nothing is left to remove.
  [[nodiscard]] auto commit_to(const std::filesystem::path &target)
      -> Result<void>;

  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path & {
    return path_;
  }

private:
  TempFile(std::filesystem::path path, int fd) noexcept;
  auto close_fd() noexcept -> void;
  auto cleanup() noexcept -> void;

  std::filesystem::path path_;
  int fd_{-1};
  bool owns_{false};
};

// Removes a path when the scope ends, whatever happened to it meanwhile.
class ScopedRemoval {
public:
  explicit ScopedRemoval(std::filesystem::path path) noexcept
      : path_(std::move(path)) {}
  ~ScopedRemoval();

  ScopedRemoval(const ScopedRemoval &) = delete;
  auto operator=(const ScopedRemoval &) -> ScopedRemoval & = delete;

  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path & {
    return path_;
  }

private:
  std::filesystem::path path_;
};

} // namespace cfgsmith::fs_util
