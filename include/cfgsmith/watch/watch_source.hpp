#pragma once

#include "cfgsmith/core/error.hpp"
#include "cfgsmith/io/context.hpp"
#include "cfgsmith/watch/watch_set.hpp"

#include <boost/asio/posix/stream_descriptor.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace cfgsmith {

class IWatchSource {
public:
  using ReadyHandler = std::function<void()>;

  virtual ~IWatchSource() = default;

  virtual auto add(const WatchSpec &spec) -> Result<void> = 0;

  // Arms a one-shot wait; `on_ready` runs on the io_context once a
  // notification is queued. Nothing is consumed.
  virtual auto async_wait(ReadyHandler on_ready) -> void = 0;

  // Consumes (and logs) every queued notification. Returns how many there
  // were.
  virtual auto drain() -> std::size_t = 0;
};

// Stand-in for environments without inotify: never fires, never fails.
class NullWatchSource final : public IWatchSource {
public:
  auto add(const WatchSpec &spec) -> Result<void> override;
  auto async_wait(ReadyHandler) -> void override {}
  auto drain() -> std::size_t override { return 0; }
};

// inotify descriptor read through a boost::asio::posix::stream_descriptor.
class InotifyWatchSource final : public IWatchSource {
public:
  InotifyWatchSource(const InotifyWatchSource &) = delete;
  auto operator=(const InotifyWatchSource &) -> InotifyWatchSource & = delete;

  [[nodiscard]] static auto create(io::IoContext &io)
      -> Result<std::unique_ptr<InotifyWatchSource>>;

  auto add(const WatchSpec &spec) -> Result<void> override;
  auto async_wait(ReadyHandler on_ready) -> void override;
  auto drain() -> std::size_t override;

  [[nodiscard]] auto watch_count() const noexcept -> std::size_t {
    return watches_.size();
  }

private:
  struct WatchEntry {
    std::filesystem::path path;
    bool recursive{false};
  };

  // Takes ownership of `fd`.
  InotifyWatchSource(io::IoContext &io, int fd) : stream_(io, fd) {}

  auto add_watch(const std::filesystem::path &path, std::uint32_t mask,
                 bool recursive) -> Result<void>;
  auto add_directory_tree(const std::filesystem::path &root) -> Result<void>;
  auto process_events(const char *buf, std::size_t len) -> std::size_t;

  boost::asio::posix::stream_descriptor stream_;
  std::unordered_map<int, WatchEntry> watches_;
};

// inotify when available, otherwise a NullWatchSource.
[[nodiscard]] auto create_watch_source(io::IoContext &io)
    -> std::unique_ptr<IWatchSource>;

} // namespace cfgsmith
