#pragma once

#include "vigil/core/error.hpp"

#include <atomic>
#include <string>

namespace vigil {

extern std::atomic<bool> g_shutdown_requested;

[[nodiscard]] auto daemonize() -> bool;
void setup_signal_handlers();
void wait_for_shutdown();

// Writes the current pid; the file is removed by PidFile's destructor.
class PidFile {
public:
  PidFile() = default;
  ~PidFile();

  PidFile(const PidFile&) = delete;
  PidFile& operator=(const PidFile&) = delete;

  [[nodiscard]] auto write(const std::string& path) -> Result<void>;

private:
  std::string path_;
};

}  // namespace vigil
