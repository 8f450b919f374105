#pragma once

#include "vigil/core/error.hpp"
#include "vigil/task/execution_record.hpp"
#include "vigil/task/task_definition.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace vigil {

// Durable store for task definitions, execution records and job logs.
// One connection, serialized by a mutex; SQLITE_BUSY is retried with
// exponential backoff and reported as PersistenceFailure once exhausted.
class Persistence {
public:
  static constexpr std::size_t kAllLogs = std::numeric_limits<std::size_t>::max();

  explicit Persistence(std::string_view db_path, int busy_retries = 5,
                       std::chrono::milliseconds busy_backoff =
                           std::chrono::milliseconds(20));
  ~Persistence();

  Persistence(const Persistence&) = delete;
  Persistence& operator=(const Persistence&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const -> bool;

  // Task definitions
  [[nodiscard]] auto save_task(const TaskDefinition& def) -> Result<void>;
  [[nodiscard]] auto get_task(const TaskId& task_id) -> Result<TaskDefinition>;
  [[nodiscard]] auto list_tasks() -> Result<std::vector<TaskDefinition>>;
  // Removes the definition with its executions and logs. Refused with
  // HasActiveRuns while any execution of the task is non-terminal.
  [[nodiscard]] auto delete_task(const TaskId& task_id) -> Result<void>;

  // Execution records. Status, progress, stage and timestamps are written
  // by one statement. Rows already in a terminal state are never updated.
  [[nodiscard]] auto save_execution(const ExecutionRecord& rec)
      -> Result<void>;
  // Record and log line commit together or not at all.
  [[nodiscard]] auto save_execution_with_log(const ExecutionRecord& rec,
                                             const LogEntry& entry)
      -> Result<void>;
  // Definition plus initial record plus first log line, in one transaction.
  [[nodiscard]] auto save_submission(const TaskDefinition& def,
                                     const ExecutionRecord& rec,
                                     const LogEntry& entry) -> Result<void>;
  [[nodiscard]] auto get_execution(const JobId& job_id,
                                   std::size_t log_limit = kAllLogs)
      -> Result<ExecutionRecord>;
  [[nodiscard]] auto list_executions(std::size_t log_limit = kAllLogs)
      -> Result<std::vector<ExecutionRecord>>;
  [[nodiscard]] auto list_executions_by_status(
      std::span<const ExecutionStatus> statuses)
      -> Result<std::vector<ExecutionRecord>>;

  // Logs
  [[nodiscard]] auto append_log(const JobId& job_id, const LogEntry& entry)
      -> Result<void>;
  // The most recent `tail` entries, oldest first.
  [[nodiscard]] auto get_logs(const JobId& job_id, std::size_t tail = kAllLogs)
      -> Result<std::vector<LogEntry>>;
  [[nodiscard]] auto last_log_seq(const JobId& job_id) -> Result<std::int64_t>;

  [[nodiscard]] auto begin_transaction() -> Result<void>;
  [[nodiscard]] auto commit_transaction() -> Result<void>;
  [[nodiscard]] auto rollback_transaction() -> Result<void>;

private:
  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  // Callers hold mu_ for everything below.
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<Statement>;
  // sqlite3_step with busy retry; returns the final sqlite result code or
  // PersistenceFailure when the database stayed busy.
  [[nodiscard]] auto step(Statement& stmt) -> Result<int>;
  [[nodiscard]] auto step_done(Statement& stmt) -> Result<void>;
  [[nodiscard]] auto in_transaction(auto&& body) -> Result<void>;

  [[nodiscard]] auto save_task_locked(const TaskDefinition& def)
      -> Result<void>;
  [[nodiscard]] auto save_execution_locked(const ExecutionRecord& rec)
      -> Result<void>;
  [[nodiscard]] auto append_log_locked(const JobId& job_id,
                                       const LogEntry& entry) -> Result<void>;
  [[nodiscard]] auto get_logs_locked(const JobId& job_id, std::size_t tail)
      -> Result<std::vector<LogEntry>>;
  [[nodiscard]] auto read_executions(Statement& stmt, std::size_t log_limit)
      -> Result<std::vector<ExecutionRecord>>;

  std::string db_path_;
  int busy_retries_;
  std::chrono::milliseconds busy_backoff_;
  mutable std::mutex mu_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace vigil
