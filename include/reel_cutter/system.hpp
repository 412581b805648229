/**
 * @file system.hpp
 * @brief Process, memory-file and work-area utilities
 *
 * @details Provides:
 *
 *          - Shell quoting and exit-status decoding for std::system / popen
 *
 *          - MemFile: RAII in-memory file (memfd_create) reachable by path
 *
 *          - WorkArea: RAII per-job temporary directory
 *
 *          - Orphaned work-area sweep for crash recovery
 *
 *          - Time formatting utilities
 *
 * @note memfd_create is Linux-specific (kernel >= 3.17).
 */

#ifndef REEL_CUTTER_SYSTEM_HPP
#define REEL_CUTTER_SYSTEM_HPP

#include <filesystem>
#include <string>

namespace reel_cutter {

// **---- Process Helpers ----**

/**
 * @brief Quote an argument for /bin/sh.
 * @return The argument wrapped in single quotes, embedded quotes escaped
 */
std::string shell_quote(const std::string &arg);

/**
 * @brief Decode a std::system / pclose status into an exit code.
 * @return Exit code (0..255), or -1 if the process did not exit normally
 */
int exit_code_of(int status);

/**
 * @struct CommandResult
 * @brief Exit code and captured stdout of a finished command.
 */
struct CommandResult {
  int exit_code = -1;
  std::string output;
};

/**
 * @brief Run a shell command and capture its standard output.
 * @throws std::system_error if the process could not be started
 */
CommandResult run_capture(const std::string &cmd);

/**
 * @brief Prefix a command with coreutils `timeout` when seconds > 0.
 * @note `timeout` exits with 124 when the limit is hit.
 */
std::string with_timeout(const std::string &cmd, int seconds);

/// Exit status reported by `timeout` on expiry
constexpr int kTimeoutExitCode = 124;

// **---- MemFile ----**

/**
 * @class MemFile
 * @brief Anonymous in-memory file addressed through /proc/<pid>/fd/<fd>.
 *
 * @details Used to hand filter scripts and request bodies to child processes
 *          without touching the disk. The descriptor is closed on destruction.
 */
class MemFile {
public:
  /**
   * @brief Create the memory file and write content into it.
   * @throws std::system_error on memfd_create or write failure
   */
  MemFile(const char *name, const std::string &content);
  ~MemFile();

  MemFile(const MemFile &) = delete;
  MemFile &operator=(const MemFile &) = delete;

  /// Path usable by child processes while this object lives
  const std::string &path() const { return path_; }

private:
  int fd_ = -1;
  std::string path_;
};

// **---- WorkArea ----**

/**
 * @class WorkArea
 * @brief Job-scoped temporary directory, removed on destruction.
 *
 * @note Directory name: `<root>/job-<id8>-<suffix>`. The suffix keeps two
 *       runs of the same job id apart.
 */
class WorkArea {
public:
  /**
   * @brief Create the directory.
   * @throws std::filesystem::filesystem_error if it cannot be created
   */
  WorkArea(const std::filesystem::path &root, const std::string &job_id);
  ~WorkArea();

  WorkArea(const WorkArea &) = delete;
  WorkArea &operator=(const WorkArea &) = delete;

  const std::filesystem::path &path() const { return path_; }

  /// Remove the directory now (idempotent, never throws)
  void release() noexcept;

private:
  std::filesystem::path path_;
  bool released_ = false;
};

/**
 * @brief Remove leftover `job-*` directories under root.
 * @note Run once at startup, before any worker creates a work area.
 * @return Number of directories removed
 */
int sweep_orphaned_work_areas(const std::filesystem::path &root);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

} // namespace reel_cutter

#endif // REEL_CUTTER_SYSTEM_HPP
