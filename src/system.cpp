/**
 * @file system.cpp
 * @brief Process, memory-file and work-area utilities implementation
 *
 * @details Provides:
 *
 *          - popen-based command capture
 *
 *          - memfd_create wrapper exposed through /proc/<pid>/fd
 *
 *          - Scoped per-job directories and the startup orphan sweep
 *
 *          - Time formatting utilities
 */

#include "reel_cutter/system.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <system_error>

#include <sys/mman.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "reel_cutter/logging.hpp"

namespace reel_cutter {

namespace fs = std::filesystem;

// **---- Process Helpers ----**

std::string shell_quote(const std::string &arg) {
  std::string out;
  out.reserve(arg.size() + 2);
  out += '\'';
  for (char c : arg) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += '\'';
  return out;
}

int exit_code_of(int status) {
  if (status == -1)
    return -1;
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  return -1;
}

CommandResult run_capture(const std::string &cmd) {
  FILE *pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    throw std::system_error(errno, std::generic_category(),
                            "popen failed: " + cmd);
  }

  CommandResult result;
  std::array<char, 4096> buf;
  size_t n;
  while ((n = fread(buf.data(), 1, buf.size(), pipe)) > 0) {
    result.output.append(buf.data(), n);
  }

  result.exit_code = exit_code_of(pclose(pipe));
  return result;
}

std::string with_timeout(const std::string &cmd, int seconds) {
  if (seconds <= 0)
    return cmd;
  return fmt::format("timeout {} {}", seconds, cmd);
}

// **---- MemFile ----**

MemFile::MemFile(const char *name, const std::string &content) {
  fd_ = static_cast<int>(syscall(SYS_memfd_create, name, MFD_CLOEXEC));
  if (fd_ == -1) {
    throw std::system_error(errno, std::generic_category(),
                            "memfd_create failed (kernel >= 3.17 required)");
  }

  size_t written = 0;
  while (written < content.size()) {
    ssize_t n =
        write(fd_, content.data() + written, content.size() - written);
    if (n == -1) {
      int err = errno;
      close(fd_);
      fd_ = -1;
      throw std::system_error(err, std::generic_category(),
                              "write to memory file failed");
    }
    written += static_cast<size_t>(n);
  }

  path_ = fmt::format("/proc/{}/fd/{}", getpid(), fd_);
}

MemFile::~MemFile() {
  if (fd_ != -1) {
    close(fd_);
  }
}

// **---- WorkArea ----**

namespace {

std::string unique_suffix() {
  static std::atomic<unsigned> counter{0};
  auto ticks = std::chrono::system_clock::now().time_since_epoch().count();
  return fmt::format("{:x}{:02x}", static_cast<unsigned long long>(ticks),
                     counter.fetch_add(1) & 0xFF);
}

} // anonymous namespace

WorkArea::WorkArea(const fs::path &root, const std::string &job_id) {
  path_ = root / fmt::format("job-{}-{}", job_id.substr(0, 8), unique_suffix());
  fs::create_directories(path_);
}

WorkArea::~WorkArea() { release(); }

void WorkArea::release() noexcept {
  if (released_)
    return;
  released_ = true;

  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    LOG_WARN("Failed to remove work area {}: {}", path_.string(),
             ec.message());
  }
}

int sweep_orphaned_work_areas(const fs::path &root) {
  std::error_code ec;
  if (!fs::is_directory(root, ec))
    return 0;

  int removed = 0;
  fs::directory_iterator it(root, ec), end;
  for (; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    std::error_code type_ec;
    if (!it->is_directory(type_ec) || name.rfind("job-", 0) != 0)
      continue;

    std::error_code rm_ec;
    fs::remove_all(it->path(), rm_ec);
    if (rm_ec) {
      LOG_WARN("Failed to remove orphaned work area {}: {}", name,
               rm_ec.message());
    } else {
      ++removed;
    }
  }
  if (ec) {
    LOG_WARN("Work area sweep of {} stopped early: {}", root.string(),
             ec.message());
  }
  return removed;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace reel_cutter
