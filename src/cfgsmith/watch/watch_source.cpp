#include "cfgsmith/watch/watch_source.hpp"

#include "cfgsmith/core/constants.hpp"
#include "cfgsmith/util/log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>

#include <sys/inotify.h>

#include <array>
#include <string_view>
#include <system_error>
#include <utility>

namespace cfgsmith {

namespace {

constexpr std::uint32_t kDirectoryMask =
    IN_CREATE | IN_MODIFY | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO;
constexpr std::uint32_t kFileMask = IN_CLOSE_WRITE;

auto describe_mask(std::uint32_t mask) -> std::string {
  constexpr std::array<std::pair<std::uint32_t, std::string_view>, 9> kNames{{
      {IN_CREATE, "create"},
      {IN_MODIFY, "modify"},
      {IN_DELETE, "delete"},
      {IN_MOVED_FROM, "moved_from"},
      {IN_MOVED_TO, "moved_to"},
      {IN_CLOSE_WRITE, "close_write"},
      {IN_DELETE_SELF, "delete_self"},
      {IN_MOVE_SELF, "move_self"},
      {IN_ISDIR, "isdir"},
  }};
  std::string out;
  for (const auto &[bit, name] : kNames) {
    if ((mask & bit) != 0) {
      if (!out.empty()) {
        out += ", ";
      }
      out += name;
    }
  }
  return out.empty() ? std::string{"unknown"} : out;
}

} // namespace

auto NullWatchSource::add(const WatchSpec &spec) -> Result<void> {
  log::debug("File watching unavailable; ignoring {} watch on {}",
             to_string_view(spec.kind), spec.path.string());
  return ok();
}

auto InotifyWatchSource::create(io::IoContext &io)
    -> Result<std::unique_ptr<InotifyWatchSource>> {
  auto fd = sys_check(inotify_init1(IN_NONBLOCK | IN_CLOEXEC));
  if (!fd) {
    return fail(fd.error());
  }
  std::unique_ptr<InotifyWatchSource> source(new InotifyWatchSource(io, *fd));
  // drain() reads until the queue is empty and must never block.
  boost::system::error_code ec;
  source->stream_.non_blocking(true, ec);
  if (ec) {
    return fail(std::error_code(ec.value(), std::system_category()));
  }
  return ok(std::move(source));
}

auto InotifyWatchSource::add(const WatchSpec &spec) -> Result<void> {
  std::error_code ec;
  if (!std::filesystem::exists(spec.path, ec)) {
    log::warn("Cannot watch {}: no such file or directory",
              spec.path.string());
    return fail(Error::FileNotFound);
  }

  if (spec.kind == WatchKind::Directory) {
    log::info("Watching directory {} (recursive)", spec.path.string());
    return add_directory_tree(spec.path);
  }
  log::info("Watching file {}", spec.path.string());
  return add_watch(spec.path, kFileMask, false);
}

auto InotifyWatchSource::add_watch(const std::filesystem::path &path,
                                   std::uint32_t mask, bool recursive)
    -> Result<void> {
  auto wd = sys_check(
      inotify_add_watch(stream_.native_handle(), path.c_str(), mask));
  if (!wd) {
    log::error("Failed to add watch on {}: {}", path.string(),
               wd.error().message());
    return fail(wd.error());
  }
  watches_[*wd] = WatchEntry{.path = path, .recursive = recursive};
  return ok();
}

auto InotifyWatchSource::add_directory_tree(const std::filesystem::path &root)
    -> Result<void> {
  if (auto r = add_watch(root, kDirectoryMask, true); !r) {
    return r;
  }

  std::error_code ec;
  auto it = std::filesystem::recursive_directory_iterator(
      root, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    log::warn("Cannot scan {} for subdirectories: {}", root.string(),
              ec.message());
    return ok();
  }
  for (auto end = std::filesystem::recursive_directory_iterator();
       it != end; it.increment(ec)) {
    if (ec) {
      log::warn("Stopped scanning {}: {}", root.string(), ec.message());
      break;
    }
    std::error_code type_ec;
    if (it->is_directory(type_ec) && !it->is_symlink(type_ec)) {
      // A subdirectory that vanished meanwhile is not fatal.
      (void)add_watch(it->path(), kDirectoryMask, true);
    }
  }
  return ok();
}

auto InotifyWatchSource::async_wait(ReadyHandler on_ready) -> void {
  stream_.async_wait(
      boost::asio::posix::stream_descriptor::wait_read,
      [on_ready = std::move(on_ready)](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        if (ec) {
          log::warn("inotify wait failed: {}", ec.message());
          return;
        }
        on_ready();
      });
}

auto InotifyWatchSource::drain() -> std::size_t {
  alignas(inotify_event) std::array<char, io::kEventBufferSize> buffer{};
  std::size_t total = 0;

  while (true) {
    boost::system::error_code ec;
    auto len = stream_.read_some(boost::asio::buffer(buffer), ec);
    if (ec == boost::asio::error::would_block ||
        ec == boost::asio::error::try_again) {
      break;
    }
    if (ec) {
      log::warn("inotify read failed: {}", ec.message());
      break;
    }
    if (len == 0) {
      break;
    }
    total += process_events(buffer.data(), len);
  }
  return total;
}

auto InotifyWatchSource::process_events(const char *buf, std::size_t len)
    -> std::size_t {
  std::size_t count = 0;
  std::size_t i = 0;
  while (i < len) {
    const auto *event = reinterpret_cast<const inotify_event *>(buf + i);
    i += sizeof(inotify_event) + event->len;
    ++count;

    if ((event->mask & IN_Q_OVERFLOW) != 0) {
      log::warn("inotify queue overflowed; some change events were lost");
      continue;
    }

    auto it = watches_.find(event->wd);
    if (it == watches_.end()) {
      continue;
    }
    if ((event->mask & IN_IGNORED) != 0) {
      log::debug("Watch on {} removed", it->second.path.string());
      watches_.erase(it);
      continue;
    }

    const auto &entry = it->second;
    if (event->len > 0) {
      const auto child = entry.path / event->name;
      log::info("detected {} on {}; regenerating config",
                describe_mask(event->mask), child.string());

      if (entry.recursive && (event->mask & IN_ISDIR) != 0 &&
          (event->mask & (IN_CREATE | IN_MOVED_TO)) != 0) {
        (void)add_directory_tree(child);
      }
    } else {
      log::info("detected {} on {}; regenerating config",
                describe_mask(event->mask), entry.path.string());
    }
  }
  return count;
}

auto create_watch_source(io::IoContext &io) -> std::unique_ptr<IWatchSource> {
  auto source = InotifyWatchSource::create(io);
  if (!source) {
    log::warn("inotify unavailable ({}); file watches are disabled",
              source.error().message());
    return std::make_unique<NullWatchSource>();
  }
  return std::move(*source);
}

} // namespace cfgsmith
