#include "vigil/app/application.hpp"

#include "vigil/app/api/api_server.hpp"
#include "vigil/app/api/task_api.hpp"
#include "vigil/app/orchestrator.hpp"
#include "vigil/chain/chain_executor.hpp"
#include "vigil/executor/process_runner.hpp"
#include "vigil/report/report_assembler.hpp"
#include "vigil/sandbox/sandbox_executor.hpp"
#include "vigil/sandbox/verification_generator.hpp"
#include "vigil/scheduler/concurrency_limiter.hpp"
#include "vigil/scheduler/job_queue.hpp"
#include "vigil/scheduler/worker_pool.hpp"
#include "vigil/storage/persistence.hpp"
#include "vigil/tools/tool_manager.hpp"
#include "vigil/util/log.hpp"

#include <algorithm>

namespace vigil {

namespace {

// Config entries replace built-in tools of the same name.
auto merge_tools(std::vector<ToolSpec> configured) -> std::vector<ToolSpec> {
  auto specs = default_tool_specs();
  for (auto& spec : configured) {
    auto it = std::ranges::find(specs, spec.name, &ToolSpec::name);
    if (it != specs.end()) {
      *it = std::move(spec);
    } else {
      specs.push_back(std::move(spec));
    }
  }
  return specs;
}

}  // namespace

Application::Application(SystemConfig config) : config_(std::move(config)) {
}

Application::~Application() {
  stop();
}

auto Application::init() -> Result<void> {
  if (store_) {
    return ok();
  }

  const auto& sched = config_.scheduler;
  auto store = std::make_unique<Persistence>(
      config_.storage.db_file, config_.storage.busy_retries,
      std::chrono::milliseconds(config_.storage.busy_backoff_ms));
  if (auto r = store->open(); !r) {
    log::error("Failed to open database {}: {}", config_.storage.db_file,
               r.error().message());
    return fail(r.error());
  }
  store_ = std::move(store);

  runner_ = std::make_unique<ProcessRunner>();
  tools_ = std::make_unique<ToolManager>(*runner_, merge_tools(config_.tools));
  sandbox_ = std::make_unique<SandboxExecutor>(*runner_, config_.sandbox);
  generator_ = std::make_unique<TemplateVerificationGenerator>();
  chain_ = std::make_unique<ToolChainExecutor>(*tools_);
  reports_ = std::make_unique<FileReportAssembler>(config_.reports.directory);

  auto concurrency =
      static_cast<std::size_t>(std::max(1, sched.max_concurrency));
  queue_ = std::make_unique<PriorityJobQueue>(sched.queue_capacity);
  limiter_ = std::make_unique<ConcurrencyLimiter>(concurrency);

  RetryPolicy retry{
      .max_attempts = std::max(1, sched.retry.max_attempts),
      .base_backoff = std::chrono::milliseconds(sched.retry.backoff_ms)};
  OrchestratorOptions options{
      .retry = retry,
      .report_format = parse_report_format(config_.reports.default_format)
                           .value_or(ReportFormat::Json),
      .verification_timeout = config_.sandbox.default_timeout};
  orchestrator_ = std::make_unique<Orchestrator>(
      *store_, *queue_, *limiter_, *chain_, *sandbox_, *reports_,
      generator_.get(), options);

  pool_ = std::make_unique<WorkerPool>(
      concurrency, *queue_,
      [this](const QueuedJob& job) {
        return orchestrator_->run_pipeline(job.job_id);
      },
      retry);
  pool_->set_on_exhausted([this](const QueuedJob& job, std::error_code ec) {
    orchestrator_->abandon(job.job_id, ec);
  });

  task_api_ = std::make_unique<TaskApi>(
      *orchestrator_, *tools_, *reports_,
      [this] { return pool_->stats(); });
  if (config_.api.enabled) {
    api_server_ = std::make_unique<ApiServer>(
        *task_api_, [this] { return is_running(); }, config_.api.port,
        config_.api.host);
  }

  log::info("Vigil initialized: {} workers, {} tools, database {}",
            concurrency, tools_->list_tools().size(), config_.storage.db_file);
  return ok();
}

auto Application::recover_from_crash() -> Result<RecoveryResult> {
  if (!store_ || !store_->is_open()) {
    return fail(Error::DatabaseOpenFailed);
  }
  Recovery recovery(*store_);
  return recovery.recover(
      [this](const ExecutionRecord& rec, const TaskDefinition& def) {
        return orchestrator_->enqueue_recovered(rec, def);
      });
}

auto Application::start() -> void {
  if (!store_) {
    log::error("Application started before init()");
    return;
  }
  if (running_.exchange(true)) {
    return;
  }
  pool_->start();
  if (api_server_) {
    api_server_->start();
  }
  log::info("Vigil started");
}

auto Application::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }

  log::info("Stopping Vigil...");

  if (api_server_) {
    api_server_->stop();
  }
  queue_->close();
  orchestrator_->shutdown(
      std::chrono::milliseconds(config_.scheduler.shutdown_timeout_ms));
  pool_->stop();
  runner_->terminate_all();
  store_->close();

  log::info("Vigil stopped");
}

auto Application::is_running() const noexcept -> bool {
  return running_.load();
}

auto Application::orchestrator() -> Orchestrator& {
  return *orchestrator_;
}

auto Application::tools() -> ToolManager& {
  return *tools_;
}

auto Application::persistence() -> Persistence& {
  return *store_;
}

auto Application::api() -> TaskApi& {
  return *task_api_;
}

}  // namespace vigil
