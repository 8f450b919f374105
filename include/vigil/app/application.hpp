#pragma once

#include "vigil/config/system_config.hpp"
#include "vigil/core/error.hpp"
#include "vigil/storage/recovery.hpp"

#include <atomic>
#include <memory>

namespace vigil {

class ApiServer;
class ConcurrencyLimiter;
class FileReportAssembler;
class Orchestrator;
class Persistence;
class PriorityJobQueue;
class ProcessRunner;
class SandboxExecutor;
class TaskApi;
class TemplateVerificationGenerator;
class ToolChainExecutor;
class ToolManager;
class WorkerPool;

// Wires the store, tool layer, sandbox, scheduler and API together and owns
// their lifetimes.
class Application {
public:
  explicit Application(SystemConfig config);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  // Opens the store and builds every component; nothing runs yet.
  [[nodiscard]] auto init() -> Result<void>;
  // Must run after init() and before start().
  [[nodiscard]] auto recover_from_crash() -> Result<RecoveryResult>;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig& {
    return config_;
  }
  [[nodiscard]] auto orchestrator() -> Orchestrator&;
  [[nodiscard]] auto tools() -> ToolManager&;
  [[nodiscard]] auto persistence() -> Persistence&;
  [[nodiscard]] auto api() -> TaskApi&;

private:
  std::atomic<bool> running_{false};
  SystemConfig config_;

  std::unique_ptr<Persistence> store_;
  std::unique_ptr<ProcessRunner> runner_;
  std::unique_ptr<ToolManager> tools_;
  std::unique_ptr<SandboxExecutor> sandbox_;
  std::unique_ptr<TemplateVerificationGenerator> generator_;
  std::unique_ptr<ToolChainExecutor> chain_;
  std::unique_ptr<FileReportAssembler> reports_;
  std::unique_ptr<PriorityJobQueue> queue_;
  std::unique_ptr<ConcurrencyLimiter> limiter_;
  std::unique_ptr<Orchestrator> orchestrator_;
  std::unique_ptr<WorkerPool> pool_;
  std::unique_ptr<TaskApi> task_api_;
  std::unique_ptr<ApiServer> api_server_;
};

}  // namespace vigil
