#pragma once

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string_view>
#include <vector>

namespace cfgsmith {

enum class WatchKind : std::uint8_t {
  File,      // fires on a completed write to this exact file
  Directory, // recursive; fires on create/modify/delete/move of any entry
};

[[nodiscard]] constexpr auto to_string_view(WatchKind kind) noexcept
    -> std::string_view {
  switch (kind) {
  case WatchKind::File:
    return "file";
  case WatchKind::Directory:
    return "directory";
  }
  return "unknown";
}

struct WatchSpec {
  std::filesystem::path path;
  WatchKind kind{WatchKind::File};

  auto operator==(const WatchSpec &) const -> bool = default;
};

// Ordered, duplicate-free list of watch registrations. Class-level watches
// (declared by a generator type) and instance-level watches (registered on an
// engine) are two WatchSets merged before the loop starts.
class WatchSet {
public:
  WatchSet() = default;
  WatchSet(std::initializer_list<std::filesystem::path> paths);

  // Kind is taken from the filesystem: directories are watched recursively,
  // anything else (including paths that do not exist yet) as a file.
  auto add(const std::filesystem::path &path) -> WatchSet &;
  auto add(std::filesystem::path path, WatchKind kind) -> WatchSet &;
  auto merge(const WatchSet &other) -> WatchSet &;

  [[nodiscard]] auto contains(const std::filesystem::path &path) const -> bool;
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return specs_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return specs_.empty(); }

  [[nodiscard]] auto begin() const noexcept { return specs_.begin(); }
  [[nodiscard]] auto end() const noexcept { return specs_.end(); }

private:
  std::vector<WatchSpec> specs_;
};

} // namespace cfgsmith
