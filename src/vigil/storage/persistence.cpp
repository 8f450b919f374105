#include "vigil/storage/persistence.hpp"

#include "vigil/task/json_codec.hpp"
#include "vigil/task/state_strings.hpp"
#include "vigil/util/log.hpp"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <algorithm>
#include <format>
#include <thread>

namespace vigil {

using json = nlohmann::json;

namespace {

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view value) -> void {
  sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

auto is_busy(int rc) -> bool {
  return rc == SQLITE_BUSY || rc == SQLITE_LOCKED;
}

constexpr auto kExecutionColumns = R"(
  job_id, task_id, status, progress, stage, created_at, started_at,
  completed_at, error, findings, report_path, attempt
)";

}  // namespace

auto Persistence::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

Persistence::Statement::~Statement() {
  reset();
}

auto Persistence::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

Persistence::Persistence(std::string_view db_path, int busy_retries,
                         std::chrono::milliseconds busy_backoff)
    : db_path_(db_path),
      busy_retries_(busy_retries),
      busy_backoff_(busy_backoff) {
}

Persistence::~Persistence() {
  close();
}

auto Persistence::open() -> Result<void> {
  std::lock_guard lock(mu_);
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open_v2(db_path_.c_str(), &raw_db,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                               SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database: {}",
               raw_db ? sqlite3_errmsg(raw_db) : "out of memory");
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);

  // PRAGMA statements may fail on some configurations, but we continue anyway
  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA foreign_keys=ON;"); !r) {
    log::warn("Failed to enable foreign keys: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    db_.reset();
    return r;
  }

  log::info("Database opened: {}", db_path_);
  return ok();
}

auto Persistence::close() -> void {
  std::lock_guard lock(mu_);
  db_.reset();
}

auto Persistence::is_open() const -> bool {
  std::lock_guard lock(mu_);
  return db_ != nullptr;
}

auto Persistence::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS tasks (
      id TEXT PRIMARY KEY,
      name TEXT NOT NULL,
      target TEXT NOT NULL,
      provider TEXT NOT NULL,
      model TEXT NOT NULL,
      priority INTEGER NOT NULL DEFAULT 2,
      user_id TEXT NOT NULL DEFAULT 'anonymous',
      scheduled_at INTEGER,
      created_at INTEGER NOT NULL,
      definition TEXT NOT NULL
    );

    CREATE TABLE IF NOT EXISTS executions (
      job_id TEXT PRIMARY KEY,
      task_id TEXT NOT NULL,
      status TEXT NOT NULL DEFAULT 'pending',
      progress INTEGER NOT NULL DEFAULT 0,
      stage TEXT NOT NULL DEFAULT 'queued',
      created_at INTEGER NOT NULL,
      started_at INTEGER NOT NULL DEFAULT 0,
      completed_at INTEGER NOT NULL DEFAULT 0,
      error TEXT NOT NULL DEFAULT '',
      findings TEXT NOT NULL DEFAULT '[]',
      report_path TEXT NOT NULL DEFAULT '',
      attempt INTEGER NOT NULL DEFAULT 1,
      FOREIGN KEY (task_id) REFERENCES tasks(id)
    );

    CREATE INDEX IF NOT EXISTS idx_executions_task
      ON executions(task_id);
    CREATE INDEX IF NOT EXISTS idx_executions_status
      ON executions(status);

    CREATE TABLE IF NOT EXISTS logs (
      job_id TEXT NOT NULL,
      seq INTEGER NOT NULL,
      timestamp INTEGER NOT NULL,
      level TEXT NOT NULL DEFAULT 'info',
      message TEXT NOT NULL,
      PRIMARY KEY (job_id, seq)
    );
  )";

  return execute(sql);
}

auto Persistence::execute(std::string_view sql) -> Result<void> {
  if (!db_) {
    return fail(Error::PersistenceFailure);
  }
  std::string sql_str{sql};
  for (int attempt = 0;; ++attempt) {
    char* err_msg = nullptr;
    int rc =
        sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
    if (rc == SQLITE_OK) {
      return ok();
    }
    std::string message = err_msg ? err_msg : sqlite3_errstr(rc);
    sqlite3_free(err_msg);
    if (!is_busy(rc) || attempt >= busy_retries_) {
      log::error("SQL error: {}", message);
      return fail(Error::PersistenceFailure);
    }
    std::this_thread::sleep_for(busy_backoff_ * (1 << attempt));
  }
}

auto Persistence::prepare(const char* sql) -> Result<Statement> {
  if (!db_) {
    log::error("Database is not open: {}", db_path_);
    return fail(Error::PersistenceFailure);
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::PersistenceFailure);
  }
  return Statement{stmt};
}

auto Persistence::step(Statement& stmt) -> Result<int> {
  for (int attempt = 0;; ++attempt) {
    int rc = sqlite3_step(stmt.get());
    if (!is_busy(rc)) {
      return rc;
    }
    if (attempt >= busy_retries_) {
      log::error("Database busy after {} retries: {}", attempt,
                 sqlite3_errmsg(db_.get()));
      return fail(Error::PersistenceFailure);
    }
    sqlite3_reset(stmt.get());
    std::this_thread::sleep_for(busy_backoff_ * (1 << attempt));
  }
}

auto Persistence::step_done(Statement& stmt) -> Result<void> {
  auto rc = step(stmt);
  if (!rc) {
    return fail(rc.error());
  }
  if (*rc != SQLITE_DONE) {
    log::error("SQL step failed: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::PersistenceFailure);
  }
  return ok();
}

auto Persistence::in_transaction(auto&& body) -> Result<void> {
  if (auto r = execute("BEGIN IMMEDIATE;"); !r) {
    return r;
  }
  auto result = body();
  if (!result) {
    if (auto r = execute("ROLLBACK;"); !r) {
      log::error("Rollback failed: {}", r.error().message());
    }
    return result;
  }
  if (auto r = execute("COMMIT;"); !r) {
    if (auto rb = execute("ROLLBACK;"); !rb) {
      log::error("Rollback after failed commit failed: {}",
                 rb.error().message());
    }
    return r;
  }
  return ok();
}

auto Persistence::save_task(const TaskDefinition& def) -> Result<void> {
  std::lock_guard lock(mu_);
  return save_task_locked(def);
}

auto Persistence::save_task_locked(const TaskDefinition& def) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO tasks (id, name, target, provider, model, priority, user_id,
                       scheduled_at, created_at, definition)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(id) DO NOTHING;
  )";

  auto stmt = prepare(sql);
  if (!stmt)
    return fail(stmt.error());

  auto* s = stmt->get();
  bind_text(s, 1, def.task_id.value());
  bind_text(s, 2, def.name);
  bind_text(s, 3, def.target);
  bind_text(s, 4, provider_name(def.model.provider));
  bind_text(s, 5, def.model.model);
  sqlite3_bind_int(s, 6, def.priority);
  bind_text(s, 7, def.user_id);
  if (def.scheduled_at) {
    sqlite3_bind_int64(s, 8, *def.scheduled_at);
  } else {
    sqlite3_bind_null(s, 8);
  }
  sqlite3_bind_int64(s, 9, def.created_at);
  auto definition = json(def).dump();
  bind_text(s, 10, definition);

  return step_done(*stmt);
}

auto Persistence::get_task(const TaskId& task_id) -> Result<TaskDefinition> {
  std::lock_guard lock(mu_);
  auto stmt = prepare("SELECT definition FROM tasks WHERE id = ?;");
  if (!stmt)
    return fail(stmt.error());
  bind_text(stmt->get(), 1, task_id.value());

  auto rc = step(*stmt);
  if (!rc)
    return fail(rc.error());
  if (*rc != SQLITE_ROW)
    return fail(Error::NotFound);

  try {
    return json::parse(col_text(stmt->get(), 0)).get<TaskDefinition>();
  } catch (const json::exception& e) {
    log::error("Corrupt task definition {}: {}", task_id, e.what());
    return fail(Error::ParseError);
  }
}

auto Persistence::list_tasks() -> Result<std::vector<TaskDefinition>> {
  std::lock_guard lock(mu_);
  auto stmt =
      prepare("SELECT id, definition FROM tasks ORDER BY created_at ASC;");
  if (!stmt)
    return fail(stmt.error());

  std::vector<TaskDefinition> tasks;
  while (true) {
    auto rc = step(*stmt);
    if (!rc)
      return fail(rc.error());
    if (*rc != SQLITE_ROW)
      break;
    try {
      tasks.push_back(
          json::parse(col_text(stmt->get(), 1)).get<TaskDefinition>());
    } catch (const json::exception& e) {
      log::warn("Skipping corrupt task definition {}: {}",
                col_text(stmt->get(), 0), e.what());
    }
  }
  return tasks;
}

auto Persistence::delete_task(const TaskId& task_id) -> Result<void> {
  std::lock_guard lock(mu_);

  auto exists = prepare("SELECT 1 FROM tasks WHERE id = ?;");
  if (!exists)
    return fail(exists.error());
  bind_text(exists->get(), 1, task_id.value());
  auto found = step(*exists);
  if (!found)
    return fail(found.error());
  if (*found != SQLITE_ROW)
    return fail(Error::NotFound);

  auto active = prepare(R"(
    SELECT COUNT(*) FROM executions
    WHERE task_id = ? AND status IN ('pending', 'running', 'paused');
  )");
  if (!active)
    return fail(active.error());
  bind_text(active->get(), 1, task_id.value());
  auto rc = step(*active);
  if (!rc)
    return fail(rc.error());
  if (*rc == SQLITE_ROW && sqlite3_column_int(active->get(), 0) > 0) {
    return fail(Error::HasActiveRuns);
  }

  return in_transaction([&]() -> Result<void> {
    constexpr const char* statements[] = {
        "DELETE FROM logs WHERE job_id IN "
        "(SELECT job_id FROM executions WHERE task_id = ?);",
        "DELETE FROM executions WHERE task_id = ?;",
        "DELETE FROM tasks WHERE id = ?;",
    };
    for (const char* sql : statements) {
      auto stmt = prepare(sql);
      if (!stmt)
        return fail(stmt.error());
      bind_text(stmt->get(), 1, task_id.value());
      if (auto r = step_done(*stmt); !r)
        return r;
    }
    return ok();
  });
}

auto Persistence::save_execution(const ExecutionRecord& rec) -> Result<void> {
  std::lock_guard lock(mu_);
  return save_execution_locked(rec);
}

auto Persistence::save_execution_locked(const ExecutionRecord& rec)
    -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO executions (job_id, task_id, status, progress, stage,
                            created_at, started_at, completed_at, error,
                            findings, report_path, attempt)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(job_id) DO UPDATE SET
      status = excluded.status,
      progress = excluded.progress,
      stage = excluded.stage,
      started_at = excluded.started_at,
      completed_at = excluded.completed_at,
      error = excluded.error,
      findings = excluded.findings,
      report_path = excluded.report_path,
      attempt = excluded.attempt
    WHERE executions.status NOT IN ('completed', 'failed', 'cancelled');
  )";

  auto stmt = prepare(sql);
  if (!stmt)
    return fail(stmt.error());

  auto* s = stmt->get();
  bind_text(s, 1, rec.job_id.value());
  bind_text(s, 2, rec.task_id.value());
  bind_text(s, 3, status_name(rec.status));
  sqlite3_bind_int(s, 4, rec.progress);
  bind_text(s, 5, rec.stage);
  sqlite3_bind_int64(s, 6, rec.created_at);
  sqlite3_bind_int64(s, 7, rec.started_at);
  sqlite3_bind_int64(s, 8, rec.completed_at);
  bind_text(s, 9, rec.error);
  auto findings = findings_to_json(rec.findings).dump();
  bind_text(s, 10, findings);
  bind_text(s, 11, rec.report_path);
  sqlite3_bind_int(s, 12, rec.attempt);

  return step_done(*stmt);
}

auto Persistence::save_execution_with_log(const ExecutionRecord& rec,
                                          const LogEntry& entry)
    -> Result<void> {
  std::lock_guard lock(mu_);
  return in_transaction([&]() -> Result<void> {
    if (auto r = save_execution_locked(rec); !r)
      return r;
    return append_log_locked(rec.job_id, entry);
  });
}

auto Persistence::save_submission(const TaskDefinition& def,
                                  const ExecutionRecord& rec,
                                  const LogEntry& entry) -> Result<void> {
  std::lock_guard lock(mu_);
  return in_transaction([&]() -> Result<void> {
    if (auto r = save_task_locked(def); !r)
      return r;
    if (auto r = save_execution_locked(rec); !r)
      return r;
    return append_log_locked(rec.job_id, entry);
  });
}

auto Persistence::read_executions(Statement& stmt, std::size_t log_limit)
    -> Result<std::vector<ExecutionRecord>> {
  std::vector<ExecutionRecord> records;
  while (true) {
    auto rc = step(stmt);
    if (!rc)
      return fail(rc.error());
    if (*rc != SQLITE_ROW)
      break;

    auto* s = stmt.get();
    ExecutionRecord rec;
    rec.job_id = JobId{col_text(s, 0)};
    rec.task_id = TaskId{col_text(s, 1)};
    rec.status = parse_status(col_text(s, 2)).value_or(ExecutionStatus::Failed);
    rec.progress = sqlite3_column_int(s, 3);
    rec.stage = col_text(s, 4);
    rec.created_at = sqlite3_column_int64(s, 5);
    rec.started_at = sqlite3_column_int64(s, 6);
    rec.completed_at = sqlite3_column_int64(s, 7);
    rec.error = col_text(s, 8);
    try {
      rec.findings = findings_from_json(json::parse(col_text(s, 9)));
    } catch (const json::exception& e) {
      log::warn("Corrupt findings for job {}: {}", rec.job_id, e.what());
    }
    rec.report_path = col_text(s, 10);
    rec.attempt = sqlite3_column_int(s, 11);
    records.push_back(std::move(rec));
  }

  if (log_limit == 0) {
    return records;
  }
  for (auto& rec : records) {
    auto logs = get_logs_locked(rec.job_id, log_limit);
    if (!logs)
      return fail(logs.error());
    rec.logs = std::move(*logs);
  }
  return records;
}

auto Persistence::get_execution(const JobId& job_id, std::size_t log_limit)
    -> Result<ExecutionRecord> {
  std::lock_guard lock(mu_);
  auto sql = std::format("SELECT {} FROM executions WHERE job_id = ?;",
                         kExecutionColumns);
  auto stmt = prepare(sql.c_str());
  if (!stmt)
    return fail(stmt.error());
  bind_text(stmt->get(), 1, job_id.value());

  auto records = read_executions(*stmt, log_limit);
  if (!records)
    return fail(records.error());
  if (records->empty())
    return fail(Error::NotFound);
  return std::move(records->front());
}

auto Persistence::list_executions(std::size_t log_limit)
    -> Result<std::vector<ExecutionRecord>> {
  std::lock_guard lock(mu_);
  auto sql = std::format("SELECT {} FROM executions ORDER BY created_at ASC;",
                         kExecutionColumns);
  auto stmt = prepare(sql.c_str());
  if (!stmt)
    return fail(stmt.error());
  return read_executions(*stmt, log_limit);
}

auto Persistence::list_executions_by_status(
    std::span<const ExecutionStatus> statuses)
    -> Result<std::vector<ExecutionRecord>> {
  if (statuses.empty()) {
    return std::vector<ExecutionRecord>{};
  }
  std::string placeholders;
  for (std::size_t i = 0; i < statuses.size(); ++i) {
    placeholders += i == 0 ? "?" : ", ?";
  }

  std::lock_guard lock(mu_);
  auto sql = std::format(
      "SELECT {} FROM executions WHERE status IN ({}) ORDER BY created_at ASC;",
      kExecutionColumns, placeholders);
  auto stmt = prepare(sql.c_str());
  if (!stmt)
    return fail(stmt.error());
  for (std::size_t i = 0; i < statuses.size(); ++i) {
    bind_text(stmt->get(), static_cast<int>(i) + 1, status_name(statuses[i]));
  }
  return read_executions(*stmt, kAllLogs);
}

auto Persistence::append_log(const JobId& job_id, const LogEntry& entry)
    -> Result<void> {
  std::lock_guard lock(mu_);
  return append_log_locked(job_id, entry);
}

auto Persistence::append_log_locked(const JobId& job_id,
                                    const LogEntry& entry) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO logs (job_id, seq, timestamp, level, message)
    VALUES (?, ?, ?, ?, ?);
  )";

  auto stmt = prepare(sql);
  if (!stmt)
    return fail(stmt.error());

  auto* s = stmt->get();
  bind_text(s, 1, job_id.value());
  sqlite3_bind_int64(s, 2, entry.seq);
  sqlite3_bind_int64(s, 3, entry.timestamp);
  bind_text(s, 4, log_level_name(entry.level));
  bind_text(s, 5, entry.message);

  return step_done(*stmt);
}

auto Persistence::get_logs(const JobId& job_id, std::size_t tail)
    -> Result<std::vector<LogEntry>> {
  std::lock_guard lock(mu_);
  return get_logs_locked(job_id, tail);
}

auto Persistence::get_logs_locked(const JobId& job_id, std::size_t tail)
    -> Result<std::vector<LogEntry>> {
  // Newest first with a limit, then reversed to chronological order
  constexpr auto sql = R"(
    SELECT seq, timestamp, level, message FROM logs
    WHERE job_id = ? ORDER BY seq DESC LIMIT ?;
  )";

  auto stmt = prepare(sql);
  if (!stmt)
    return fail(stmt.error());
  bind_text(stmt->get(), 1, job_id.value());
  sqlite3_bind_int64(stmt->get(), 2,
                     tail == kAllLogs ? -1 : static_cast<sqlite3_int64>(tail));

  std::vector<LogEntry> logs;
  while (true) {
    auto rc = step(*stmt);
    if (!rc)
      return fail(rc.error());
    if (*rc != SQLITE_ROW)
      break;
    auto* s = stmt->get();
    logs.push_back({.seq = sqlite3_column_int64(s, 0),
                    .timestamp = sqlite3_column_int64(s, 1),
                    .level = parse_log_level(col_text(s, 2)),
                    .message = col_text(s, 3)});
  }
  std::ranges::reverse(logs);
  return logs;
}

auto Persistence::last_log_seq(const JobId& job_id) -> Result<std::int64_t> {
  std::lock_guard lock(mu_);
  auto stmt =
      prepare("SELECT COALESCE(MAX(seq), 0) FROM logs WHERE job_id = ?;");
  if (!stmt)
    return fail(stmt.error());
  bind_text(stmt->get(), 1, job_id.value());
  auto rc = step(*stmt);
  if (!rc)
    return fail(rc.error());
  if (*rc != SQLITE_ROW)
    return std::int64_t{0};
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt->get(), 0));
}

auto Persistence::begin_transaction() -> Result<void> {
  std::lock_guard lock(mu_);
  return execute("BEGIN TRANSACTION;");
}

auto Persistence::commit_transaction() -> Result<void> {
  std::lock_guard lock(mu_);
  return execute("COMMIT;");
}

auto Persistence::rollback_transaction() -> Result<void> {
  std::lock_guard lock(mu_);
  return execute("ROLLBACK;");
}

}  // namespace vigil
