#pragma once

#include "vigil/tools/tool_spec.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace vigil {

struct StorageConfig {
  std::string db_file{"vigil.db"};
  int busy_retries{5};
  int busy_backoff_ms{20};
};

struct RetryConfig {
  int max_attempts{3};
  int backoff_ms{2000};
};

struct SchedulerConfig {
  std::string log_level{"info"};
  std::string log_file;
  std::string pid_file;
  int max_concurrency{5};
  std::size_t queue_capacity{1024};
  RetryConfig retry;
  int shutdown_timeout_ms{3000};
};

struct ApiConfig {
  bool enabled{true};
  uint16_t port{3001};
  std::string host{"127.0.0.1"};
};

struct SandboxConfig {
  std::string directory{"./sandbox"};
  std::chrono::seconds default_timeout{30};
  std::chrono::seconds max_timeout{120};
  std::size_t max_output_bytes{1024 * 1024};
  std::size_t memory_limit_mb{512};
  bool purge_after_run{true};
  // language -> runtime executable
  std::map<std::string, std::string, std::less<>> runtimes{
      {"python", "python3"},
      {"javascript", "node"},
      {"bash", "bash"},
      {"shell", "bash"},
  };
};

struct ReportConfig {
  std::string directory{"./reports"};
  std::string default_format{"json"};
};

struct SystemConfig {
  StorageConfig storage;
  SchedulerConfig scheduler;
  ApiConfig api;
  SandboxConfig sandbox;
  ReportConfig reports;
  // Added to, or overriding, the built-in tool defaults
  std::vector<ToolSpec> tools;
};

}  // namespace vigil
