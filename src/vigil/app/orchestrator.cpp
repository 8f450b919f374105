#include "vigil/app/orchestrator.hpp"

#include "vigil/task/state_strings.hpp"
#include "vigil/util/log.hpp"
#include "vigil/util/util.hpp"

#include <algorithm>
#include <format>
#include <thread>

namespace vigil {

Orchestrator::Orchestrator(Persistence& store, IJobQueue& queue,
                           ConcurrencyLimiter& limiter, IChainExecutor& chain,
                           SandboxExecutor& sandbox, IReportAssembler& reports,
                           IVerificationGenerator* generator,
                           OrchestratorOptions options)
    : store_(store),
      queue_(queue),
      limiter_(limiter),
      chain_(chain),
      sandbox_(sandbox),
      reports_(reports),
      generator_(generator),
      options_(options) {
}

Orchestrator::~Orchestrator() {
  shutdown(std::chrono::milliseconds(0));
  // Inline threads capture this; they end quickly once their tokens trip.
  std::unique_lock lock(inline_mu_);
  inline_cv_.wait(lock, [this] { return inline_active_ == 0; });
}

auto Orchestrator::find(const JobId& job_id) const -> JobPtr {
  std::lock_guard lock(jobs_mu_);
  auto it = jobs_.find(job_id);
  return it == jobs_.end() ? nullptr : it->second;
}

auto Orchestrator::track(JobPtr job) -> JobPtr {
  std::lock_guard lock(jobs_mu_);
  auto it = jobs_.try_emplace(job->record.job_id, job).first;
  return it->second;
}

auto Orchestrator::find_or_load(const JobId& job_id) -> Result<JobPtr> {
  if (auto job = find(job_id)) {
    return job;
  }
  auto rec = store_.get_execution(job_id);
  if (!rec) {
    return fail(rec.error());
  }
  auto def = store_.get_task(rec->task_id);
  if (!def) {
    return fail(def.error());
  }
  auto job = std::make_shared<TrackedJob>();
  job->next_seq = rec->logs.empty() ? 1 : rec->logs.back().seq + 1;
  job->record = std::move(*rec);
  job->definition = std::move(*def);
  if (is_terminal(job->record.status)) {
    return job;  // nothing left to drive; keep serving it from the store
  }
  return track(std::move(job));
}

auto Orchestrator::submit(TaskDefinition def) -> Result<SubmitResult> {
  if (def.task_id.empty()) {
    def.task_id = TaskId{generate_uuid()};
  }
  if (def.strategy.scope.empty()) {
    def.strategy.scope = {def.target};
  }
  if (auto r = validate_definition(def); !r) {
    return fail(r.error());
  }
  if (stopping_.load()) {
    return fail(Error::QueueUnavailable);
  }

  auto now = now_ms();
  if (def.created_at == 0) {
    def.created_at = now;
  }

  ExecutionRecord rec;
  rec.job_id = JobId{generate_uuid()};
  rec.task_id = def.task_id;
  rec.status = ExecutionStatus::Pending;
  rec.progress = progress::kQueued;
  rec.stage = std::string(stage::kQueued);
  rec.created_at = now;

  LogEntry entry{.seq = 1,
                 .timestamp = now,
                 .level = LogLevel::Info,
                 .message = std::format("Task created: {} targeting {}",
                                        def.name, def.target)};

  if (auto r = store_.save_submission(def, rec, entry); !r) {
    log::error("Failed to store submission {}: {}", def.name,
               r.error().message());
    return fail(r.error());
  }

  auto job = std::make_shared<TrackedJob>();
  job->record = rec;
  job->record.logs.push_back(entry);
  job->definition = def;
  job->next_seq = 2;
  track(std::move(job));

  log::info("Task {} ({}) submitted as job {} with priority {}", def.task_id,
            def.name, rec.job_id, priority_name(def.priority));

  dispatch(QueuedJob{.job_id = rec.job_id,
                     .task_id = def.task_id,
                     .priority = def.priority,
                     .not_before = def.scheduled_at.value_or(0),
                     .attempt = 1});
  return SubmitResult{.task_id = def.task_id, .job_id = rec.job_id};
}

auto Orchestrator::dispatch(const QueuedJob& queued) -> void {
  auto pushed = queue_.push(queued);
  if (pushed) {
    return;
  }
  if (stopping_.load()) {
    log::info("Job {} not started, service is stopping", queued.job_id);
    return;
  }
  log::warn("Queue unavailable for job {}, running inline", queued.job_id);
  run_inline(queued);
}

auto Orchestrator::run_inline(QueuedJob queued) -> void {
  inline_runs_.fetch_add(1);
  {
    std::lock_guard lock(inline_mu_);
    ++inline_active_;
  }

  std::thread([this, queued]() mutable {
    // false once the service starts stopping
    auto sleep_until = [this](std::int64_t until_ms) {
      std::unique_lock lock(inline_mu_);
      while (!stopping_.load()) {
        auto now = now_ms();
        if (now >= until_ms) {
          return true;
        }
        inline_cv_.wait_for(lock, std::chrono::milliseconds(until_ms - now));
      }
      return false;
    };

    bool proceed = queued.not_before <= 0 || sleep_until(queued.not_before);
    while (proceed) {
      auto r = run_pipeline(queued.job_id);
      if (r) {
        break;
      }
      if (!options_.retry.should_retry(r.error(), queued.attempt)) {
        abandon(queued.job_id, r.error());
        break;
      }
      auto delay = options_.retry.backoff(queued.attempt);
      log::warn("Inline run of job {} failed ({}), retrying in {}ms",
                queued.job_id, r.error().message(), delay.count());
      ++queued.attempt;
      proceed = sleep_until(now_ms() + delay.count());
    }

    std::lock_guard lock(inline_mu_);
    --inline_active_;
    inline_cv_.notify_all();
  }).detach();
}

auto Orchestrator::commit(TrackedJob& job, ExecutionRecord next,
                          LogLevel level, std::string message)
    -> Result<void> {
  LogEntry entry{.seq = job.next_seq,
                 .timestamp = now_ms(),
                 .level = level,
                 .message = std::move(message)};
  if (auto r = store_.save_execution_with_log(next, entry); !r) {
    log::error("Failed to persist job {} at {}: {}", next.job_id, next.stage,
               r.error().message());
    return r;
  }
  log::debug("[{}] {} ({}%)", next.job_id, entry.message, next.progress);
  next.logs.push_back(std::move(entry));
  job.record = std::move(next);
  ++job.next_seq;
  return ok();
}

auto Orchestrator::append_log(TrackedJob& job, LogLevel level,
                              std::string message) -> void {
  std::lock_guard lock(job.mu);
  if (is_terminal(job.record.status)) {
    return;
  }
  LogEntry entry{.seq = job.next_seq,
                 .timestamp = now_ms(),
                 .level = level,
                 .message = std::move(message)};
  if (auto r = store_.append_log(job.record.job_id, entry); !r) {
    log::warn("Failed to persist log line for job {}: {}", job.record.job_id,
              r.error().message());
    return;
  }
  log::debug("[{}] {}", job.record.job_id, entry.message);
  job.record.logs.push_back(std::move(entry));
  ++job.next_seq;
}

auto Orchestrator::write_boundary(TrackedJob& job, StageBoundary boundary)
    -> Result<void> {
  auto next = job.record;
  next.progress = std::max(next.progress, boundary.progress);
  next.stage = std::move(boundary.stage);
  if (boundary.mutate) {
    boundary.mutate(next);
  }
  return commit(job, std::move(next), LogLevel::Info,
                std::move(boundary.message));
}

auto Orchestrator::checkpoint(TrackedJob& job, StageBoundary boundary)
    -> Result<bool> {
  std::lock_guard lock(job.mu);
  if (job.cancel.is_cancelled() || is_terminal(job.record.status)) {
    return fail(Error::Cancelled);
  }
  if (job.record.status == ExecutionStatus::Paused) {
    log::info("Job {} parked before {}", job.record.job_id, boundary.stage);
    job.parked = std::move(boundary);
    return false;
  }
  if (auto r = write_boundary(job, std::move(boundary)); !r) {
    return fail(r.error());
  }
  return true;
}

auto Orchestrator::fail_job(TrackedJob& job, std::string message) -> void {
  JobId job_id;
  {
    std::lock_guard lock(job.mu);
    if (is_terminal(job.record.status)) {
      return;
    }
    job_id = job.record.job_id;
    if (job.cancel.is_cancelled()) {
      log::info("Job {} stopped: {}", job_id, message);
      return;
    }

    auto now = now_ms();
    auto next = job.record;
    next.status = ExecutionStatus::Failed;
    next.stage = std::string(stage::kFailed);
    next.error = message;
    if (next.started_at == 0) {
      next.started_at = now;
    }
    next.completed_at = now;
    log::error("Job {} failed: {}", job_id, message);

    if (auto r = commit(job, next, LogLevel::Error,
                        std::format("Task execution failed: {}", message));
        !r) {
      // The store still shows the job as active; the next recovery pass
      // fails it there.
      job.record = std::move(next);
    }
  }
  on_terminal(job_id, ExecutionStatus::Failed);
}

auto Orchestrator::on_terminal(const JobId& job_id, ExecutionStatus status)
    -> void {
  switch (status) {
    case ExecutionStatus::Completed: completed_.fetch_add(1); break;
    case ExecutionStatus::Failed: failed_.fetch_add(1); break;
    case ExecutionStatus::Cancelled: cancelled_.fetch_add(1); break;
    default: break;
  }

  std::lock_guard lock(jobs_mu_);
  terminal_order_.push_back(job_id);
  while (terminal_order_.size() > options_.retained_terminal) {
    jobs_.erase(terminal_order_.front());
    terminal_order_.pop_front();
  }
}

auto Orchestrator::run_pipeline(const JobId& job_id) -> Result<void> {
  auto loaded = find_or_load(job_id);
  if (!loaded) {
    log::warn("Cannot run job {}: {}", job_id, loaded.error().message());
    return fail(loaded.error());
  }
  auto job = std::move(*loaded);

  ConcurrencyLimiter::Permit permit(limiter_);
  {
    std::lock_guard lock(job->mu);
    if (job->cancel.is_cancelled()) {
      log::debug("Job {} is cancelled, nothing to run", job_id);
      return ok();
    }
    if (job->record.status == ExecutionStatus::Running && job->parked) {
      // Resumed after parking at a boundary; kept until written so a retry
      // finds it again
      if (auto r = write_boundary(*job, *job->parked); !r) {
        return r;
      }
      job->parked.reset();
      log::info("Job {} continues at {}", job_id, job->record.stage);
    } else if (job->record.status != ExecutionStatus::Pending) {
      log::debug("Job {} is {}, nothing to run", job_id,
                 status_name(job->record.status));
      return ok();
    } else {
      auto next = job->record;
      next.status = ExecutionStatus::Running;
      next.started_at = now_ms();
      next.progress = progress::kQueued;
      next.stage = std::string(stage::kInitializing);
      if (auto r = commit(*job, std::move(next), LogLevel::Info,
                          "Task execution started");
          !r) {
        return r;
      }
      log::info("Job {} started", job_id);
    }
  }

  Result<void> result;
  try {
    result = execute_stages(*job);
  } catch (const std::exception& e) {
    fail_job(*job, std::format("Unexpected error: {}", e.what()));
    return ok();
  }

  if (!result && result.error() == make_error_code(Error::Cancelled)) {
    std::lock_guard lock(job->mu);
    if (!is_terminal(job->record.status)) {
      log::info("Job {} interrupted at {}, left for recovery", job_id,
                job->record.stage);
    }
  }
  return ok();
}

// Runs stages from the one the record names until the job completes, fails,
// is cancelled or parks at a boundary because it was paused.
auto Orchestrator::execute_stages(TrackedJob& job) -> Result<void> {
  const auto& def = job.definition;

  // Boundary writes that fail for any reason other than cancellation end
  // the job.
  auto boundary = [this, &job](Result<bool> r) -> Result<bool> {
    if (!r && r.error() != make_error_code(Error::Cancelled)) {
      fail_job(job, std::format("Failed to record progress: {}",
                                r.error().message()));
    }
    return r;
  };

  while (true) {
    JobId job_id;
    ExecutionRecord snapshot;
    {
      std::lock_guard lock(job.mu);
      job_id = job.record.job_id;
      snapshot = job.record;
    }
    const auto& current = snapshot.stage;

    if (current == stage::kCompleted) {
      log::info("Job {} completed", job_id);
      on_terminal(job_id, ExecutionStatus::Completed);
      return ok();
    }

    Result<bool> passed;
    if (current == stage::kInitializing) {
      // AI service initialization
      if (auto r = chain_.initialize(def.model); !r) {
        fail_job(job, std::format("AI service initialization failed: {}",
                                  r.error().message()));
        return r;
      }
      passed = boundary(checkpoint(
          job, StageBoundary{
                   .progress = progress::kInitialized,
                   .stage = std::string(stage::kChainExecution),
                   .message = std::format("AI service initialized ({} {})",
                                          provider_name(def.model.provider),
                                          def.model.model),
                   .mutate = {}}));
    } else if (current == stage::kChainExecution) {
      // Analysis chain
      ChainRequest request{.task_id = def.task_id,
                           .job_id = job_id,
                           .target = def.target,
                           .model = def.model,
                           .tools = def.tools,
                           .strategy = def.strategy};
      ChainContext context{
          .log = [this, &job](LogLevel level,
                              std::string message) {
            append_log(job, level, std::move(message));
          },
          .token = job.cancel.token()};
      auto chain = chain_.execute(request, context);
      if (!chain) {
        if (chain.error() == make_error_code(Error::Cancelled) ||
            job.cancel.is_cancelled()) {
          return fail(Error::Cancelled);
        }
        fail_job(job, std::format("Chain execution failed: {}",
                                  chain.error().message()));
        return fail(chain.error());
      }
      auto count = chain->findings.size();
      passed = boundary(checkpoint(
          job, StageBoundary{
                   .progress = progress::kChainDone,
                   .stage = std::string(stage::kVerification),
                   .message = std::format(
                       "Chain execution completed with {} findings", count),
                   .mutate = [findings = std::move(chain->findings)](
                                 ExecutionRecord& rec) {
                     rec.findings = findings;
                   }}));
    } else if (current == stage::kVerification) {
      auto findings = std::move(snapshot.findings);
      if (def.verify) {
        auto verified = verify_findings(job, std::move(findings));
        if (!verified) {
          return fail(verified.error());
        }
        findings = std::move(*verified);
      } else {
        append_log(job, LogLevel::Info, "Verification disabled for this task");
      }
      auto confirmed = std::ranges::count_if(
          findings, [](const Finding& f) { return f.confirmed; });
      auto message =
          std::format("Verification completed: {} of {} findings confirmed",
                      confirmed, findings.size());
      passed = boundary(checkpoint(
          job, StageBoundary{.progress = progress::kVerificationDone,
                             .stage = std::string(stage::kReportAssembly),
                             .message = std::move(message),
                             .mutate = [findings = std::move(findings)](
                                           ExecutionRecord& rec) {
                               rec.findings = findings;
                             }}));
    } else if (current == stage::kReportAssembly) {
      snapshot.status = ExecutionStatus::Completed;
      snapshot.completed_at = now_ms();
      auto artifact = reports_.assemble(def, snapshot, options_.report_format);
      if (!artifact) {
        fail_job(job, std::format("Report assembly failed: {}",
                                  artifact.error().message()));
        return fail(artifact.error());
      }
      passed = boundary(checkpoint(
          job, StageBoundary{
                   .progress = progress::kCompleted,
                   .stage = std::string(stage::kCompleted),
                   .message = std::format(
                       "Task completed, report written to {}", artifact->path),
                   .mutate = [path = artifact->path](ExecutionRecord& rec) {
                     rec.status = ExecutionStatus::Completed;
                     rec.completed_at = now_ms();
                     rec.report_path = path;
                   }}));
    } else {
      fail_job(job, std::format("Unknown stage '{}'", current));
      return fail(Error::InvalidTransition);
    }

    if (!passed) {
      return fail(passed.error());
    }
    if (!*passed) {
      // Parked; the worker and its permit go back to other jobs
      return ok();
    }
  }
}

auto Orchestrator::verify_findings(TrackedJob& job,
                                   std::vector<Finding> findings)
    -> Result<std::vector<Finding>> {
  const auto& target = job.definition.target;
  auto token = job.cancel.token();
  JobId job_id;
  {
    std::lock_guard lock(job.mu);
    job_id = job.record.job_id;
  }

  for (auto& finding : findings) {
    if (token.is_cancelled()) {
      return fail(Error::Cancelled);
    }

    auto code = finding.verification;
    if (!code && generator_) {
      code = generator_->generate(finding, target);
    }
    if (!code) {
      continue;
    }
    finding.verification = code;

    VerificationJob vj{.id = make_verification_id(job_id, finding.id),
                       .finding_id = finding.id.str(),
                       .code = code->code,
                       .language = code->language,
                       .target = target,
                       .parameters = code->parameters,
                       .timeout = options_.verification_timeout,
                       .sandboxed = true};
    auto result = sandbox_.execute(vj, token);
    if (token.is_cancelled()) {
      return fail(Error::Cancelled);
    }
    if (!result) {
      append_log(job, LogLevel::Warn,
                 std::format("Verification of {} skipped: {}", finding.id,
                             result.error().message()));
      continue;
    }

    finding.verified = result->reliability_score > kScoreNotRun;
    finding.confirmed = result->confirmed;
    finding.reliability_score = result->reliability_score;
    finding.verification_output =
        result->output.empty() ? result->error : result->output;
    append_log(job, result->confirmed ? LogLevel::Warn : LogLevel::Info,
               std::format("Finding {} {} (score {})", finding.id,
                           result->confirmed ? "confirmed" : "not confirmed",
                           result->reliability_score));
  }
  return findings;
}

auto Orchestrator::pause(const JobId& job_id) -> bool {
  auto job = find(job_id);
  if (!job) {
    return false;
  }
  std::lock_guard lock(job->mu);
  if (job->record.status != ExecutionStatus::Running) {
    return false;
  }
  auto next = job->record;
  next.status = ExecutionStatus::Paused;
  if (!commit(*job, std::move(next), LogLevel::Info, "Task paused")) {
    return false;
  }
  log::info("Job {} paused", job_id);
  return true;
}

auto Orchestrator::resume(const JobId& job_id) -> bool {
  auto job = find(job_id);
  if (!job) {
    return false;
  }
  bool parked = false;
  {
    std::lock_guard lock(job->mu);
    if (job->record.status != ExecutionStatus::Paused) {
      return false;
    }
    auto next = job->record;
    next.status = ExecutionStatus::Running;
    if (!commit(*job, std::move(next), LogLevel::Info, "Task resumed")) {
      return false;
    }
    parked = job->parked.has_value();
  }
  log::info("Job {} resumed", job_id);
  if (parked) {
    dispatch(QueuedJob{.job_id = job_id,
                       .task_id = job->definition.task_id,
                       .priority = job->definition.priority,
                       .not_before = 0,
                       .attempt = 1});
  }
  return true;
}

auto Orchestrator::cancel(const JobId& job_id) -> bool {
  auto loaded = find_or_load(job_id);
  if (!loaded) {
    return false;
  }
  auto job = std::move(*loaded);
  {
    std::lock_guard lock(job->mu);
    if (is_terminal(job->record.status)) {
      return false;
    }
    auto next = job->record;
    next.status = ExecutionStatus::Cancelled;
    next.stage = std::string(stage::kCancelled);
    auto now = now_ms();
    if (next.started_at == 0) {
      next.started_at = now;
    }
    next.completed_at = now;
    if (!commit(*job, std::move(next), LogLevel::Warn, "Task cancelled")) {
      return false;
    }
    job->cancel.cancel("cancelled by user");
    job->parked.reset();
  }
  queue_.remove(job_id);
  log::info("Job {} cancelled", job_id);
  on_terminal(job_id, ExecutionStatus::Cancelled);
  return true;
}

auto Orchestrator::abandon(const JobId& job_id, std::error_code ec) -> void {
  auto loaded = find_or_load(job_id);
  if (!loaded) {
    log::error("Cannot abandon job {}: {}", job_id, loaded.error().message());
    return;
  }
  auto job = std::move(*loaded);
  {
    std::lock_guard lock(job->mu);
    if (job->record.status != ExecutionStatus::Pending) {
      return;
    }
  }
  fail_job(*job,
           std::format("Scheduling failed after retries: {}", ec.message()));
}

auto Orchestrator::get_status(const JobId& job_id)
    -> std::optional<ExecutionRecord> {
  if (auto job = find(job_id)) {
    std::lock_guard lock(job->mu);
    return job->record;
  }
  auto rec = store_.get_execution(job_id);
  if (!rec) {
    if (rec.error() != make_error_code(Error::NotFound)) {
      log::warn("Failed to load job {}: {}", job_id, rec.error().message());
    }
    return std::nullopt;
  }
  return std::move(*rec);
}

auto Orchestrator::get_logs(const JobId& job_id)
    -> Result<std::vector<LogEntry>> {
  if (auto job = find(job_id)) {
    std::lock_guard lock(job->mu);
    return job->record.logs;
  }
  auto rec = store_.get_execution(job_id);
  if (!rec) {
    return fail(rec.error());
  }
  return std::move(rec->logs);
}

auto Orchestrator::get_definition(const TaskId& task_id)
    -> Result<TaskDefinition> {
  return store_.get_task(task_id);
}

auto Orchestrator::list_all() -> Result<std::vector<ExecutionRecord>> {
  auto stored = store_.list_executions(kListLogLimit);
  if (!stored) {
    return fail(stored.error());
  }
  auto records = std::move(*stored);
  std::unordered_map<JobId, std::size_t> index;
  for (std::size_t i = 0; i < records.size(); ++i) {
    index.emplace(records[i].job_id, i);
  }

  std::vector<JobPtr> tracked;
  {
    std::lock_guard lock(jobs_mu_);
    tracked.reserve(jobs_.size());
    for (const auto& [_, job] : jobs_) {
      tracked.push_back(job);
    }
  }

  for (const auto& job : tracked) {
    ExecutionRecord rec;
    {
      std::lock_guard lock(job->mu);
      rec = job->record;
    }
    if (rec.logs.size() > kListLogLimit) {
      rec.logs.erase(rec.logs.begin(),
                     rec.logs.end() - static_cast<std::ptrdiff_t>(kListLogLimit));
    }
    if (auto it = index.find(rec.job_id); it != index.end()) {
      records[it->second] = std::move(rec);
    } else {
      records.push_back(std::move(rec));
    }
  }

  std::ranges::stable_sort(records, [](const auto& a, const auto& b) {
    return a.created_at > b.created_at;
  });
  return records;
}

auto Orchestrator::remove_task(const TaskId& task_id) -> Result<void> {
  std::vector<JobPtr> related;
  {
    std::lock_guard lock(jobs_mu_);
    for (const auto& [_, job] : jobs_) {
      if (job->definition.task_id == task_id) {
        related.push_back(job);
      }
    }
  }
  for (const auto& job : related) {
    std::lock_guard lock(job->mu);
    if (!is_terminal(job->record.status)) {
      log::warn("Refusing to delete task {}: job {} is {}", task_id,
                job->record.job_id, status_name(job->record.status));
      return fail(Error::HasActiveRuns);
    }
  }

  if (auto r = store_.delete_task(task_id); !r) {
    return r;
  }

  std::lock_guard lock(jobs_mu_);
  std::erase_if(jobs_, [&task_id](const auto& entry) {
    return entry.second->definition.task_id == task_id;
  });
  log::info("Deleted task {} with its executions and logs", task_id);
  return ok();
}

auto Orchestrator::enqueue_recovered(const ExecutionRecord& rec,
                                     const TaskDefinition& def)
    -> Result<void> {
  auto seq = store_.last_log_seq(rec.job_id);
  if (!seq) {
    return fail(seq.error());
  }
  auto job = std::make_shared<TrackedJob>();
  job->record = rec;
  job->definition = def;
  job->next_seq = *seq + 1;
  job = track(std::move(job));
  append_log(*job, LogLevel::Info, "Requeued after service restart");

  dispatch(QueuedJob{.job_id = rec.job_id,
                     .task_id = def.task_id,
                     .priority = def.priority,
                     .not_before = def.scheduled_at.value_or(0),
                     .attempt = rec.attempt});
  return ok();
}

auto Orchestrator::shutdown(std::chrono::milliseconds timeout) -> void {
  {
    std::lock_guard lock(inline_mu_);
    stopping_.store(true);
  }
  inline_cv_.notify_all();

  std::vector<JobPtr> all;
  {
    std::lock_guard lock(jobs_mu_);
    for (const auto& [_, job] : jobs_) {
      all.push_back(job);
    }
  }
  for (const auto& job : all) {
    std::lock_guard lock(job->mu);
    if (!is_terminal(job->record.status)) {
      job->cancel.cancel("shutdown");
    }
  }

  std::unique_lock lock(inline_mu_);
  if (!inline_cv_.wait_for(lock, timeout,
                           [this] { return inline_active_ == 0; })) {
    log::warn("{} inline runs still active at shutdown", inline_active_);
  }
}

auto Orchestrator::stats() const -> SchedulerStats {
  auto queued = queue_.stats();
  return SchedulerStats{.waiting = queued.waiting,
                        .delayed = queued.delayed,
                        .active = limiter_.in_use(),
                        .completed = completed_.load(),
                        .failed = failed_.load(),
                        .cancelled = cancelled_.load(),
                        .inline_runs = inline_runs_.load()};
}

}  // namespace vigil
