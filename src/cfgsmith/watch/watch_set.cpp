#include "cfgsmith/watch/watch_set.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace cfgsmith {

WatchSet::WatchSet(std::initializer_list<std::filesystem::path> paths) {
  for (const auto &p : paths) {
    add(p);
  }
}

auto WatchSet::add(const std::filesystem::path &path) -> WatchSet & {
  std::error_code ec;
  const auto kind = std::filesystem::is_directory(path, ec)
                        ? WatchKind::Directory
                        : WatchKind::File;
  return add(path, kind);
}

auto WatchSet::add(std::filesystem::path path, WatchKind kind) -> WatchSet & {
  path = path.lexically_normal();
  if (!contains(path)) {
    specs_.push_back(WatchSpec{.path = std::move(path), .kind = kind});
  }
  return *this;
}

auto WatchSet::merge(const WatchSet &other) -> WatchSet & {
  for (const auto &spec : other) {
    add(spec.path, spec.kind);
  }
  return *this;
}

auto WatchSet::contains(const std::filesystem::path &path) const -> bool {
  const auto normal = path.lexically_normal();
  return std::ranges::any_of(
      specs_, [&](const WatchSpec &s) { return s.path == normal; });
}

} // namespace cfgsmith
