#include "vigil/util/daemon.hpp"

#include "vigil/util/log.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace vigil {

std::atomic<bool> g_shutdown_requested{false};

namespace {
void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
  g_shutdown_requested.notify_one();
}
}  // namespace

auto daemonize() -> bool {
  pid_t pid = fork();
  if (pid < 0) return false;
  if (pid > 0) std::exit(0);

  if (setsid() < 0) return false;

  pid = fork();
  if (pid < 0) return false;
  if (pid > 0) std::exit(0);

  close(STDIN_FILENO);
  close(STDOUT_FILENO);
  close(STDERR_FILENO);
  return true;
}

void setup_signal_handlers() {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  // Tools closing their stdout early must not take the service down
  std::signal(SIGPIPE, SIG_IGN);
}

void wait_for_shutdown() {
  g_shutdown_requested.wait(false, std::memory_order_acquire);
}

PidFile::~PidFile() {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    log::warn("Failed to remove pid file {}: {}", path_, ec.message());
  }
}

auto PidFile::write(const std::string& path) -> Result<void> {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    log::error("Failed to write pid file: {}", path);
    return fail(Error::FileOpenFailed);
  }
  out << getpid() << '\n';
  path_ = path;
  return ok();
}

}  // namespace vigil
