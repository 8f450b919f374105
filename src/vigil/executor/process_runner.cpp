#include "vigil/executor/process_runner.hpp"

#include "vigil/util/log.hpp"

#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

extern char** environ;

namespace vigil {

namespace {

inline constexpr std::size_t READ_BUFFER_SIZE = 4096;
inline constexpr auto POLL_SLICE = std::chrono::milliseconds(100);
// After the direct child exits, how long stragglers holding the pipes may
// keep writing before the group is killed.
inline constexpr auto DRAIN_GRACE = std::chrono::milliseconds(200);

struct Pipe {
  int read_fd{-1};
  int write_fd{-1};

  auto close_read() -> void {
    if (read_fd >= 0) {
      ::close(read_fd);
      read_fd = -1;
    }
  }
  auto close_write() -> void {
    if (write_fd >= 0) {
      ::close(write_fd);
      write_fd = -1;
    }
  }
  ~Pipe() {
    close_read();
    close_write();
  }
};

auto create_pipe(Pipe& p) -> bool {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    return false;
  }
  p.read_fd = fds[0];
  p.write_fd = fds[1];
  return true;
}

auto set_nonblocking(int fd) -> void {
  int flags = fcntl(fd, F_GETFL);
  if (flags >= 0) {
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

auto is_executable(const std::string& path) -> bool {
  struct stat st{};
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
         ::access(path.c_str(), X_OK) == 0;
}

auto to_cstrings(const std::vector<std::string>& values)
    -> std::vector<char*> {
  std::vector<char*> out;
  out.reserve(values.size() + 1);
  for (const auto& v : values) {
    out.push_back(const_cast<char*>(v.c_str()));
  }
  out.push_back(nullptr);
  return out;
}

auto apply_limit(int resource, rlim_t value) -> void {
  struct rlimit rl{value, value};
  setrlimit(resource, &rl);
}

// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] auto exec_child(const char* path, char* const* argv,
                             char* const* envp, const char* working_dir,
                             int null_fd, int out_fd, int err_fd, int report_fd,
                             const ProcessLimits* limits,
                             rlim_t cpu_seconds) -> void {
  setpgid(0, 0);

  dup2(null_fd, STDIN_FILENO);
  dup2(out_fd, STDOUT_FILENO);
  dup2(err_fd, STDERR_FILENO);

  auto report = [report_fd](int err) {
    ssize_t n = write(report_fd, &err, sizeof(err));
    (void)n;
    _exit(127);
  };

  if (working_dir && working_dir[0] != '\0' && chdir(working_dir) < 0) {
    report(errno);
  }

  if (limits) {
    if (limits->no_new_privs && prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
      report(errno);
    }
    if (limits->address_space_mb > 0) {
      apply_limit(RLIMIT_AS,
                  static_cast<rlim_t>(limits->address_space_mb) * 1024 * 1024);
    }
    if (limits->max_file_bytes > 0) {
      apply_limit(RLIMIT_FSIZE, static_cast<rlim_t>(limits->max_file_bytes));
    }
    apply_limit(RLIMIT_CORE, 0);
    if (cpu_seconds > 0) {
      apply_limit(RLIMIT_CPU, cpu_seconds);
    }
  }

  execve(path, argv, envp);
  report(errno);
  _exit(127);
}

// Appends up to the cap; the rest is read and discarded so the child
// never blocks on a full pipe.
auto drain(int fd, std::string& sink, std::size_t cap, bool& truncated)
    -> bool {
  std::array<char, READ_BUFFER_SIZE> buffer;
  while (true) {
    ssize_t n = read(fd, buffer.data(), buffer.size());
    if (n > 0) {
      auto room = sink.size() < cap ? cap - sink.size() : 0;
      auto take = std::min(room, static_cast<std::size_t>(n));
      sink.append(buffer.data(), take);
      if (take < static_cast<std::size_t>(n)) {
        truncated = true;
      }
      continue;
    }
    if (n == 0) {
      return false;  // EOF
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

}  // namespace

auto resolve_executable(const std::string& name) -> std::optional<std::string> {
  if (name.empty()) {
    return std::nullopt;
  }
  if (name.find('/') != std::string::npos) {
    if (is_executable(name)) {
      return name;
    }
    return std::nullopt;
  }

  const char* path_env = std::getenv("PATH");
  std::string_view path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
  while (!path.empty()) {
    auto sep = path.find(':');
    auto dir = path.substr(0, sep);
    std::string candidate =
        (dir.empty() ? std::string(".") : std::string(dir)) + "/" + name;
    if (is_executable(candidate)) {
      return candidate;
    }
    if (sep == std::string_view::npos) {
      break;
    }
    path.remove_prefix(sep + 1);
  }
  return std::nullopt;
}

ProcessRunner::~ProcessRunner() {
  terminate_all();
}

auto ProcessRunner::register_process(pid_t pid) -> std::uint64_t {
  std::lock_guard lock(mutex_);
  auto id = ++next_id_;
  active_[id] = pid;
  return id;
}

auto ProcessRunner::unregister_process(std::uint64_t id) -> void {
  std::lock_guard lock(mutex_);
  active_.erase(id);
}

auto ProcessRunner::active_count() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return active_.size();
}

auto ProcessRunner::terminate_all() -> void {
  std::lock_guard lock(mutex_);
  for (const auto& [id, pid] : active_) {
    if (pid > 0) {
      kill(-pid, SIGKILL);
      log::info("Killed process group {}", pid);
    }
  }
}

auto ProcessRunner::run(const ProcessSpec& spec, const CancellationToken& token)
    -> ProcessResult {
  ProcessResult result;
  auto start = std::chrono::steady_clock::now();

  if (spec.argv.empty()) {
    result.error = "Empty command";
    return result;
  }
  if (token.is_cancelled()) {
    result.cancelled = true;
    result.error = "Cancelled before launch";
    return result;
  }

  auto path = resolve_executable(spec.argv.front());
  if (!path) {
    result.error = std::format("Executable not found: {}", spec.argv.front());
    result.exit_code = 127;
    return result;
  }

  Pipe out, err, report;
  if (!create_pipe(out) || !create_pipe(err) || !create_pipe(report)) {
    result.error = std::format("Failed to create pipe: {}", strerror(errno));
    return result;
  }
  int null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (null_fd < 0) {
    result.error = std::format("Failed to open /dev/null: {}", strerror(errno));
    return result;
  }

  // Everything the child touches is built before fork
  auto argv = to_cstrings(spec.argv);
  auto envp = spec.env ? to_cstrings(*spec.env) : std::vector<char*>{};
  char* const* env_ptr = spec.env ? envp.data() : environ;
  const ProcessLimits* limits = spec.limits ? &*spec.limits : nullptr;
  auto cpu_seconds = static_cast<rlim_t>(
      std::chrono::ceil<std::chrono::seconds>(spec.timeout).count() + 1);

  pid_t pid = fork();
  if (pid < 0) {
    ::close(null_fd);
    result.error = std::format("Failed to fork: {}", strerror(errno));
    return result;
  }
  if (pid == 0) {
    exec_child(path->c_str(), argv.data(), env_ptr, spec.working_dir.c_str(),
               null_fd, out.write_fd, err.write_fd, report.write_fd, limits,
               cpu_seconds);
  }

  launches_.fetch_add(1, std::memory_order_acq_rel);
  setpgid(pid, pid);
  ::close(null_fd);
  out.close_write();
  err.close_write();
  report.close_write();

  // The report pipe closes on a successful exec (O_CLOEXEC); otherwise the
  // child sends errno before exiting.
  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(report.read_fd, &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    result.error = std::format("Failed to execute {}: {}", spec.argv.front(),
                               strerror(exec_errno));
    result.exit_code = 127;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
  }

  auto id = register_process(pid);
  set_nonblocking(out.read_fd);
  set_nonblocking(err.read_fd);

  auto deadline = start + spec.timeout;
  bool out_open = true;
  bool err_open = true;
  bool reaped = false;
  int status = 0;
  std::optional<std::chrono::steady_clock::time_point> exited_at;

  while (out_open || err_open) {
    if (token.is_cancelled()) {
      kill(-pid, SIGKILL);
      result.cancelled = true;
      break;
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      kill(-pid, SIGKILL);
      result.timed_out = true;
      break;
    }
    if (!reaped && waitpid(pid, &status, WNOHANG) == pid) {
      reaped = true;
      exited_at = now;
    }
    if (exited_at && now - *exited_at > DRAIN_GRACE) {
      // Background descendants still hold the pipes
      kill(-pid, SIGKILL);
      break;
    }

    std::array<pollfd, 2> fds{};
    nfds_t count = 0;
    if (out_open) fds[count++] = {out.read_fd, POLLIN, 0};
    if (err_open) fds[count++] = {err.read_fd, POLLIN, 0};

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - now);
    auto slice = std::min(remaining, POLL_SLICE);
    int rc = poll(fds.data(), count, static_cast<int>(slice.count()) + 1);
    if (rc < 0) {
      if (errno == EINTR) continue;
      log::warn("poll failed for pid {}: {}", pid, strerror(errno));
      kill(-pid, SIGKILL);
      break;
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) continue;
      bool is_out = fds[i].fd == out.read_fd;
      auto& sink = is_out ? result.stdout_output : result.stderr_output;
      bool still_open =
          drain(fds[i].fd, sink, spec.max_output_bytes, result.truncated);
      if (!still_open) {
        (is_out ? out_open : err_open) = false;
      }
    }
  }

  out.close_read();
  err.close_read();

  if (!reaped) {
    while (waitpid(pid, &status, 0) < 0) {
      if (errno != EINTR) {
        log::warn("waitpid failed for pid {}: {}", pid, strerror(errno));
        status = -1;
        break;
      }
    }
  }
  unregister_process(id);

  result.exit_code = status == -1 ? -1 : get_exit_code(status);
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  if (result.truncated) {
    log::warn("Output of {} truncated at {} bytes", spec.argv.front(),
              spec.max_output_bytes);
  }
  return result;
}

}  // namespace vigil
