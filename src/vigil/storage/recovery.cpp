#include "vigil/storage/recovery.hpp"

#include "vigil/util/log.hpp"
#include "vigil/util/util.hpp"

#include <array>

namespace vigil {

namespace {
constexpr std::string_view kInterruptedMessage =
    "Execution interrupted by service restart";
}

Recovery::Recovery(Persistence& persistence) : persistence_(persistence) {
}

auto Recovery::recover(
    std::move_only_function<Result<void>(const ExecutionRecord&,
                                         const TaskDefinition&)>
        requeue) -> Result<RecoveryResult> {
  RecoveryResult result;

  constexpr std::array kIncomplete = {ExecutionStatus::Pending,
                                      ExecutionStatus::Running,
                                      ExecutionStatus::Paused};
  auto incomplete = persistence_.list_executions_by_status(kIncomplete);
  if (!incomplete) {
    log::error("Failed to list incomplete executions");
    return fail(incomplete.error());
  }
  log::info("Found {} incomplete executions to recover", incomplete->size());

  for (auto& rec : *incomplete) {
    if (rec.status != ExecutionStatus::Pending) {
      log::info("Job {} was {} during shutdown, marking failed", rec.job_id,
                rec.stage);
      auto job_id = rec.job_id;
      if (auto r = mark_interrupted(persistence_, std::move(rec)); !r) {
        return fail(r.error());
      }
      result.interrupted.push_back(std::move(job_id));
      continue;
    }

    auto def = persistence_.get_task(rec.task_id);
    if (!def) {
      log::warn("Definition {} for pending job {} is missing", rec.task_id,
                rec.job_id);
      rec.error = "Task definition missing during recovery";
      auto job_id = rec.job_id;
      if (auto r = mark_interrupted(persistence_, std::move(rec)); !r) {
        return fail(r.error());
      }
      result.interrupted.push_back(std::move(job_id));
      continue;
    }

    if (auto r = requeue(rec, *def); !r) {
      log::warn("Failed to requeue job {}: {}", rec.job_id,
                r.error().message());
      continue;
    }
    result.requeued.push_back(rec.job_id);
  }

  log::info("Recovery complete: {} requeued, {} interrupted",
            result.requeued.size(), result.interrupted.size());
  return ok(std::move(result));
}

auto Recovery::mark_interrupted(Persistence& persistence,
                                ExecutionRecord record) -> Result<void> {
  auto seq = persistence.last_log_seq(record.job_id);
  if (!seq) {
    return fail(seq.error());
  }

  auto now = now_ms();
  record.status = ExecutionStatus::Failed;
  record.stage = std::string(stage::kFailed);
  if (record.error.empty()) {
    record.error = std::string(kInterruptedMessage);
  }
  if (record.started_at == 0) {
    record.started_at = now;
  }
  record.completed_at = now;
  record.logs.clear();

  LogEntry entry{.seq = *seq + 1,
                 .timestamp = now,
                 .level = LogLevel::Error,
                 .message = record.error};
  return persistence.save_execution_with_log(record, entry);
}

}  // namespace vigil
