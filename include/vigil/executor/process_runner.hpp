#pragma once

#include "vigil/core/cancellation.hpp"

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vigil {

inline constexpr std::size_t kDefaultMaxOutputBytes = 10 * 1024 * 1024;

struct ProcessLimits {
  std::size_t address_space_mb{0};  // 0 = unlimited
  std::size_t max_file_bytes{0};    // 0 = unlimited
  bool no_new_privs{true};
};

struct ProcessSpec {
  // argv[0] is resolved against PATH unless it contains a slash. The vector
  // is passed to execve as-is; nothing is interpreted by a shell.
  std::vector<std::string> argv;
  std::string working_dir;
  std::chrono::milliseconds timeout{std::chrono::seconds(300)};
  // Applies to stdout and stderr separately
  std::size_t max_output_bytes{kDefaultMaxOutputBytes};
  // nullopt inherits the parent environment
  std::optional<std::vector<std::string>> env;
  // Applied in the child before exec when set
  std::optional<ProcessLimits> limits;
};

struct ProcessResult {
  int exit_code{-1};
  std::string stdout_output;
  std::string stderr_output;
  // Set when the process could not be started
  std::string error;
  bool timed_out{false};
  bool cancelled{false};
  bool truncated{false};
  std::chrono::milliseconds duration{0};

  [[nodiscard]] auto launched() const noexcept -> bool {
    return error.empty();
  }
  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return launched() && !timed_out && !cancelled && exit_code == 0;
  }
};

class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  // Blocks until the process exits, times out or the token is cancelled.
  virtual auto run(const ProcessSpec& spec, const CancellationToken& token)
      -> ProcessResult = 0;
};

class ProcessRunner : public IProcessRunner {
public:
  ProcessRunner() = default;
  ~ProcessRunner() override;

  ProcessRunner(const ProcessRunner&) = delete;
  ProcessRunner& operator=(const ProcessRunner&) = delete;

  auto run(const ProcessSpec& spec, const CancellationToken& token)
      -> ProcessResult override;

  // SIGKILL to every live process group; used at shutdown.
  auto terminate_all() -> void;

  // Number of fork() calls made so far
  [[nodiscard]] auto launch_count() const noexcept -> std::uint64_t {
    return launches_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto active_count() const -> std::size_t;

private:
  auto register_process(pid_t pid) -> std::uint64_t;
  auto unregister_process(std::uint64_t id) -> void;

  mutable std::mutex mutex_;
  std::unordered_map<std::uint64_t, pid_t> active_;
  std::uint64_t next_id_{0};
  std::atomic<std::uint64_t> launches_{0};
};

// PATH lookup in the style of execvp; empty when nothing executable matches.
[[nodiscard]] auto resolve_executable(const std::string& name)
    -> std::optional<std::string>;

}  // namespace vigil
