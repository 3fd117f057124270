#include "cfgsmith/util/daemon.hpp"

#include "cfgsmith/core/constants.hpp"
#include "cfgsmith/util/log.hpp"

#include <boost/filesystem.hpp>
#include <boost/interprocess/sync/file_lock.hpp>

#include <cerrno>
#include <charconv>
#include <csignal>
#include <fstream>
#include <string>
#include <thread>
#include <utility>
#include <unistd.h>

namespace cfgsmith {

namespace {
auto delete_file_lock(void *ptr) -> void {
  delete static_cast<boost::interprocess::file_lock *>(ptr);
}

auto ensure_parent_directory(const std::filesystem::path &path)
    -> Result<void> {
  boost::system::error_code ec;
  const boost::filesystem::path parent =
      boost::filesystem::path(path.string()).parent_path();
  if (parent.empty() || boost::filesystem::exists(parent, ec)) {
    return ok();
  }
  boost::filesystem::create_directories(parent, ec);
  if (ec) {
    return fail(std::error_code(ec.value(), std::system_category()));
  }
  return ok();
}

auto write_pid_to_file(const std::filesystem::path &path, std::int64_t pid)
    -> Result<void> {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    return fail(Error::FileOpenFailed);
  }
  out << pid << '\n';
  out.flush();
  if (!out.good()) {
    return fail(Error::FileWriteFailed);
  }
  return ok();
}
} // namespace

PidFileGuard::PidFileGuard(
    std::filesystem::path path,
    std::unique_ptr<void, void (*)(void *)> lock) noexcept
    : path_(std::move(path)), lock_(std::move(lock)), owns_(true) {}

PidFileGuard::~PidFileGuard() { release(); }

PidFileGuard::PidFileGuard(PidFileGuard &&other) noexcept
    : path_(std::move(other.path_)), lock_(std::move(other.lock_)),
      owns_(std::exchange(other.owns_, false)) {}

auto PidFileGuard::operator=(PidFileGuard &&other) noexcept -> PidFileGuard & {
  if (this == &other) {
    return *this;
  }
  release();
  path_ = std::move(other.path_);
  lock_ = std::move(other.lock_);
  owns_ = std::exchange(other.owns_, false);
  return *this;
}

auto PidFileGuard::acquire(const std::filesystem::path &path)
    -> Result<PidFileGuard> {
  if (path.empty()) {
    return fail(Error::InvalidArgument);
  }

  if (auto r = ensure_parent_directory(path); !r) {
    return fail(r.error());
  }
  {
    std::ofstream touch(path, std::ios::app);
    if (!touch.is_open()) {
      return fail(Error::FileOpenFailed);
    }
  }

  auto *raw_lock = new boost::interprocess::file_lock(path.c_str());
  std::unique_ptr<void, void (*)(void *)> lock(raw_lock, delete_file_lock);
  if (!raw_lock->try_lock()) {
    log::error("{} is locked by another cfgsmith instance", path.string());
    return fail(Error::AlreadyExists);
  }

  if (auto r = write_pid_to_file(path, static_cast<std::int64_t>(::getpid()));
      !r) {
    raw_lock->unlock();
    return fail(r.error());
  }

  return ok(PidFileGuard(path, std::move(lock)));
}

auto PidFileGuard::release() noexcept -> void {
  if (!owns_) {
    return;
  }
  owns_ = false;

  // Remove while still holding the lock so a waiting instance never sees a
  // stale pid.
  std::error_code ec;
  std::filesystem::remove(path_, ec);

  if (lock_) {
    static_cast<boost::interprocess::file_lock *>(lock_.get())->unlock();
  }
  lock_.reset();
}

auto read_pid_file(const std::filesystem::path &path) -> Result<std::int64_t> {
  std::ifstream in{path};
  if (!in.is_open()) {
    return fail(Error::FileNotFound);
  }
  std::string line;
  std::getline(in, line);
  if (line.empty()) {
    return fail(Error::ParseError);
  }
  std::int64_t pid = 0;
  const auto [ptr, ec] =
      std::from_chars(line.data(), line.data() + line.size(), pid);
  if (ec != std::errc{} || ptr != line.data() + line.size() || pid <= 0) {
    return fail(Error::ParseError);
  }
  return ok(pid);
}

auto is_process_alive(std::int64_t pid) -> bool {
  if (pid <= 0) {
    return false;
  }
  if (::kill(static_cast<pid_t>(pid), 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

auto send_signal(std::int64_t pid, int signal_no) -> Result<void> {
  if (pid <= 0) {
    return fail(Error::InvalidArgument);
  }
  auto r = sys_check(::kill(static_cast<pid_t>(pid), signal_no));
  if (!r) {
    return fail(r.error());
  }
  return ok();
}

auto wait_for_process_exit(std::int64_t pid, std::chrono::milliseconds timeout)
    -> bool {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (!is_process_alive(pid)) {
      return true;
    }
    std::this_thread::sleep_for(timing::kDaemonPollInterval);
  }
  return !is_process_alive(pid);
}

} // namespace cfgsmith
