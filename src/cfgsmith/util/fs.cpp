#include "cfgsmith/util/fs.hpp"

#include "cfgsmith/util/log.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace cfgsmith::fs_util {

namespace {

auto write_all(int fd, std::string_view content) -> Result<void> {
  const char *data = content.data();
  std::size_t remaining = content.size();
  while (remaining > 0) {
    auto n = ::write(fd, data, remaining);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return fail(last_system_error());
    }
    data += n;
    remaining -= static_cast<std::size_t>(n);
  }
  return ok();
}

} // namespace

auto read_file(const std::filesystem::path &path) -> Result<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail(file_exists(path) ? Error::FileOpenFailed
                                  : Error::FileNotFound);
  }
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  if (in.bad()) {
    return fail(Error::FileOpenFailed);
  }
  return ok(std::move(content));
}

auto file_exists(const std::filesystem::path &path) -> bool {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

auto copy_file(const std::filesystem::path &from,
               const std::filesystem::path &to) -> Result<void> {
  std::error_code ec;
  std::filesystem::copy_file(
      from, to, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    log::error("Failed to copy {} to {}: {}", from.string(), to.string(),
               ec.message());
    return fail(ec);
  }
  return ok();
}

auto rename_file(const std::filesystem::path &from,
                 const std::filesystem::path &to) -> Result<void> {
  if (auto r = sys_check(::rename(from.c_str(), to.c_str())); !r) {
    log::error("Failed to rename {} to {}: {}", from.string(), to.string(),
               r.error().message());
    return fail(r.error());
  }
  return ok();
}

auto match_permissions(const std::filesystem::path &source,
                       const std::filesystem::path &target) -> Result<void> {
  struct stat st {};
  if (auto r = sys_check(::stat(source.c_str(), &st)); !r) {
    return fail(r.error());
  }
  if (auto r = sys_check(::chmod(target.c_str(), st.st_mode & 07777)); !r) {
    return fail(r.error());
  }
  if (::chown(target.c_str(), st.st_uid, st.st_gid) < 0) {
    auto ec = last_system_error();
    if (ec != std::errc::operation_not_permitted) {
      return fail(ec);
    }
    log::warn("Cannot copy ownership {}:{} of {} onto {}: {}", st.st_uid,
              st.st_gid, source.string(), target.string(), ec.message());
  }
  return ok();
}

auto modification_time(const std::filesystem::path &path)
    -> Result<std::chrono::system_clock::time_point> {
  struct stat st {};
  if (auto r = sys_check(::stat(path.c_str(), &st)); !r) {
    return fail(r.error());
  }
  auto since_epoch = std::chrono::seconds(st.st_mtim.tv_sec) +
                     std::chrono::nanoseconds(st.st_mtim.tv_nsec);
  return ok(std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          since_epoch)));
}

auto process_umask() -> mode_t {
  std::ifstream status("/proc/self/status");
  std::string line;
  while (std::getline(status, line)) {
    if (!line.starts_with("Umask:")) {
      continue;
    }
    const auto start = line.find_first_not_of(" \t", 6);
    unsigned mask = 0;
    if (start != std::string::npos &&
        std::from_chars(line.data() + start, line.data() + line.size(), mask,
                        8)
                .ec == std::errc{}) {
      return static_cast<mode_t>(mask);
    }
    break;
  }
  // Kernels before 4.7 do not report the umask; reading it means setting it,
  // so do that only once.
  static const mode_t fallback = [] {
    const auto mask = ::umask(0);
    ::umask(mask);
    return mask;
  }();
  return fallback;
}

auto atomic_write(const std::filesystem::path &target, std::string_view content)
    -> Result<void> {
  auto dir = target.parent_path();
  if (dir.empty()) {
    dir = ".";
  }
  auto tmp = TempFile::create(dir, target.filename().string());
  if (!tmp) {
    return fail(tmp.error());
  }
  if (auto r = tmp->write(content); !r) {
    return fail(r.error());
  }
  // mkostemp creates 0600; give the new file the mode open(2) would have.
  const auto mode = 0666 & ~process_umask();
  if (auto r = sys_check(::chmod(tmp->path().c_str(), mode)); !r) {
    return fail(r.error());
  }
  return tmp->commit_to(target);
}

// TempFile

TempFile::TempFile(std::filesystem::path path, int fd) noexcept
    : path_(std::move(path)), fd_(fd), owns_(true) {}

TempFile::~TempFile() { cleanup(); }

TempFile::TempFile(TempFile &&other) noexcept
    : path_(std::move(other.path_)), fd_(other.fd_), owns_(other.owns_) {
  other.fd_ = -1;
  other.owns_ = false;
}

auto TempFile::operator=(TempFile &&other) noexcept -> TempFile & {
  if (this == &other) {
    return *this;
  }
  cleanup();
  path_ = std::move(other.path_);
  fd_ = other.fd_;
  owns_ = other.owns_;
  other.fd_ = -1;
  other.owns_ = false;
  return *this;
}

auto TempFile::create(const std::filesystem::path &directory,
                      std::string_view prefix) -> Result<TempFile> {
  auto pattern = (directory / (std::string(prefix) + ".XXXXXX")).string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');

  auto fd = sys_check(::mkostemp(buf.data(), O_CLOEXEC));
  if (!fd) {
    log::error("Failed to create temp file in {}: {}", directory.string(),
               fd.error().message());
    return fail(fd.error());
  }
  return ok(TempFile(std::filesystem::path(buf.data()), *fd));
}

auto TempFile::write(std::string_view content) -> Result<void> {
  if (fd_ < 0) {
    return fail(Error::InvalidState);
  }
  if (auto r = write_all(fd_, content); !r) {
    return fail(r.error());
  }
  if (auto r = sys_check(::fsync(fd_)); !r) {
    return fail(r.error());
  }
  close_fd();
  return ok();
}

auto TempFile::commit_to(const std::filesystem::path &target) -> Result<void> {
  if (!owns_) {
    return fail(Error::InvalidState);
  }
  close_fd();
  if (auto r = rename_file(path_, target); !r) {
    return fail(r.error());
  }
  owns_ = false;
  return ok();
}

auto TempFile::close_fd() noexcept -> void {
  if (fd_ >= 0) {
    (void)::close(fd_);
    fd_ = -1;
  }
}

auto TempFile::cleanup() noexcept -> void {
  close_fd();
  if (owns_) {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    owns_ = false;
  }
}

ScopedRemoval::~ScopedRemoval() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
}

} // namespace cfgsmith::fs_util
