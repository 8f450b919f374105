#include "load.hpp"

#include "vigil/cli/commands.hpp"
#include "vigil/storage/persistence.hpp"
#include "vigil/task/state_strings.hpp"
#include "vigil/util/util.hpp"

#include <print>

namespace vigil::cli {

auto cmd_status(const StatusOptions& opts) -> int {
  auto config = load_config(opts.overrides);
  if (!config) {
    std::println(stderr, "Error: Failed to load config: {}",
                 config.error().message());
    return 1;
  }

  Persistence db(config->storage.db_file);
  if (auto r = db.open(); !r) {
    std::println(stderr, "Error: Failed to open database: {}",
                 r.error().message());
    return 1;
  }

  auto rec = db.get_execution(JobId{opts.job_id}, 20);
  if (!rec) {
    std::println(stderr, "Error: Job not found: {}", opts.job_id);
    return 1;
  }

  std::println("Job:       {}", rec->job_id);
  std::println("Task:      {}", rec->task_id);
  std::println("Status:    {}", status_name(rec->status));
  std::println("Progress:  {}%", rec->progress);
  std::println("Stage:     {}", rec->stage);
  std::println("Created:   {}", format_timestamp(rec->created_at));
  if (rec->started_at > 0) {
    std::println("Started:   {}", format_timestamp(rec->started_at));
  }
  if (rec->completed_at > 0) {
    std::println("Finished:  {}", format_timestamp(rec->completed_at));
  }
  if (!rec->error.empty()) {
    std::println("Error:     {}", rec->error);
  }
  if (!rec->report_path.empty()) {
    std::println("Report:    {}", rec->report_path);
  }
  std::println("Findings:  {}", rec->findings.size());
  for (const auto& f : rec->findings) {
    std::println("  [{}] {}{}", severity_name(f.severity), f.title,
                 f.confirmed ? " (confirmed)" : "");
  }
  if (!rec->logs.empty()) {
    std::println("Recent logs:");
    for (const auto& entry : rec->logs) {
      std::println("  {} {:<5} {}", format_timestamp(entry.timestamp),
                   log_level_name(entry.level), entry.message);
    }
  }
  return 0;
}

}  // namespace vigil::cli
