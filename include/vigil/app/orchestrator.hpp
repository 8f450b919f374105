#pragma once

#include "vigil/chain/chain_executor.hpp"
#include "vigil/core/cancellation.hpp"
#include "vigil/core/error.hpp"
#include "vigil/report/report_assembler.hpp"
#include "vigil/sandbox/sandbox_executor.hpp"
#include "vigil/sandbox/verification_generator.hpp"
#include "vigil/scheduler/concurrency_limiter.hpp"
#include "vigil/scheduler/job_queue.hpp"
#include "vigil/scheduler/retry_policy.hpp"
#include "vigil/storage/persistence.hpp"
#include "vigil/task/execution_record.hpp"
#include "vigil/task/task_definition.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vigil {

struct SubmitResult {
  TaskId task_id;
  JobId job_id;
};

struct SchedulerStats {
  std::size_t waiting{0};
  std::size_t delayed{0};
  std::size_t active{0};
  std::uint64_t completed{0};
  std::uint64_t failed{0};
  std::uint64_t cancelled{0};
  std::uint64_t inline_runs{0};
};

struct OrchestratorOptions {
  RetryPolicy retry;
  ReportFormat report_format{ReportFormat::Json};
  std::chrono::seconds verification_timeout{30};
  // Terminal jobs kept in memory; older ones are served from the store.
  std::size_t retained_terminal{1024};
};

// Drives each job through init -> chain -> verification -> report. Every
// stage boundary is one store write (record plus log line) followed by the
// in-memory update, so the store is never behind what callers have seen.
class Orchestrator {
public:
  Orchestrator(Persistence& store, IJobQueue& queue,
               ConcurrencyLimiter& limiter, IChainExecutor& chain,
               SandboxExecutor& sandbox, IReportAssembler& reports,
               IVerificationGenerator* generator = nullptr,
               OrchestratorOptions options = {});
  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  // ValidationError before anything is stored; PersistenceFailure when the
  // initial write fails. Falls back to an inline run when the queue refuses.
  [[nodiscard]] auto submit(TaskDefinition def) -> Result<SubmitResult>;

  // Entry point for workers and inline runs, both for new jobs and for jobs
  // resumed after parking at a boundary. Returns an error only when the job
  // could not be taken over (the caller may retry); stage failures are
  // recorded on the job and reported as success here. A paused job parks at
  // its next boundary and the call returns, releasing worker and permit.
  [[nodiscard]] auto run_pipeline(const JobId& job_id) -> Result<void>;

  [[nodiscard]] auto pause(const JobId& job_id) -> bool;
  [[nodiscard]] auto resume(const JobId& job_id) -> bool;
  [[nodiscard]] auto cancel(const JobId& job_id) -> bool;

  [[nodiscard]] auto get_status(const JobId& job_id)
      -> std::optional<ExecutionRecord>;
  [[nodiscard]] auto get_logs(const JobId& job_id)
      -> Result<std::vector<LogEntry>>;
  [[nodiscard]] auto get_definition(const TaskId& task_id)
      -> Result<TaskDefinition>;
  // Newest first; logs truncated to the most recent kListLogLimit entries.
  [[nodiscard]] auto list_all() -> Result<std::vector<ExecutionRecord>>;

  [[nodiscard]] auto remove_task(const TaskId& task_id) -> Result<void>;

  // Retries exhausted before the job started: a pending job becomes failed.
  auto abandon(const JobId& job_id, std::error_code ec) -> void;

  // Used by crash recovery for jobs that were still pending.
  [[nodiscard]] auto enqueue_recovered(const ExecutionRecord& rec,
                                       const TaskDefinition& def)
      -> Result<void>;

  // Trips every job's token without recording a cancellation; interrupted
  // jobs stay non-terminal in the store for the next recovery pass. Waits up
  // to `timeout` for inline runs.
  auto shutdown(std::chrono::milliseconds timeout) -> void;

  [[nodiscard]] auto stats() const -> SchedulerStats;

  static constexpr std::size_t kListLogLimit = 10;

private:
  // A stage boundary write: progress, the next stage label and whatever the
  // finished stage contributes to the record.
  struct StageBoundary {
    int progress{0};
    std::string stage;
    std::string message;
    std::function<void(ExecutionRecord&)> mutate;
  };

  struct TrackedJob {
    std::mutex mu;
    ExecutionRecord record;
    TaskDefinition definition;
    CancellationSource cancel;
    std::int64_t next_seq{1};
    // Set when the pipeline reached a boundary while paused; resume hands
    // the job back to the queue and the next run writes it.
    std::optional<StageBoundary> parked;
  };
  using JobPtr = std::shared_ptr<TrackedJob>;

  [[nodiscard]] auto find(const JobId& job_id) const -> JobPtr;
  // Tracked job, or one rebuilt from the store and tracked.
  [[nodiscard]] auto find_or_load(const JobId& job_id) -> Result<JobPtr>;
  // Returns the already-tracked job when one exists
  auto track(JobPtr job) -> JobPtr;

  auto dispatch(const QueuedJob& queued) -> void;
  auto run_inline(QueuedJob queued) -> void;

  [[nodiscard]] auto execute_stages(TrackedJob& job) -> Result<void>;
  [[nodiscard]] auto verify_findings(TrackedJob& job,
                                     std::vector<Finding> findings)
      -> Result<std::vector<Finding>>;

  // Caller holds job.mu. Store first, memory second.
  [[nodiscard]] auto commit(TrackedJob& job, ExecutionRecord next,
                            LogLevel level, std::string message)
      -> Result<void>;
  // Caller holds job.mu.
  [[nodiscard]] auto write_boundary(TrackedJob& job, StageBoundary boundary)
      -> Result<void>;
  // true once written, false when the job parked because it is paused;
  // Cancelled once the token trips or the job ended.
  [[nodiscard]] auto checkpoint(TrackedJob& job, StageBoundary boundary)
      -> Result<bool>;
  auto append_log(TrackedJob& job, LogLevel level, std::string message)
      -> void;
  auto fail_job(TrackedJob& job, std::string message) -> void;
  // Caller must not hold the job's mutex
  auto on_terminal(const JobId& job_id, ExecutionStatus status) -> void;

  Persistence& store_;
  IJobQueue& queue_;
  ConcurrencyLimiter& limiter_;
  IChainExecutor& chain_;
  SandboxExecutor& sandbox_;
  IReportAssembler& reports_;
  IVerificationGenerator* generator_;
  OrchestratorOptions options_;

  mutable std::mutex jobs_mu_;
  std::unordered_map<JobId, JobPtr> jobs_;
  std::deque<JobId> terminal_order_;

  std::mutex inline_mu_;
  std::condition_variable inline_cv_;
  std::size_t inline_active_{0};

  std::atomic<bool> stopping_{false};
  std::atomic<std::uint64_t> completed_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::atomic<std::uint64_t> cancelled_{0};
  std::atomic<std::uint64_t> inline_runs_{0};
};

}  // namespace vigil
