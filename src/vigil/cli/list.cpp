#include "load.hpp"

#include "vigil/cli/commands.hpp"
#include "vigil/storage/persistence.hpp"
#include "vigil/task/state_strings.hpp"
#include "vigil/util/util.hpp"

#include <print>

namespace vigil::cli {

auto cmd_list(const ListOptions& opts) -> int {
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

  auto records = db.list_executions(0);
  if (!records) {
    std::println(stderr, "Error: {}", records.error().message());
    return 1;
  }
  if (records->empty()) {
    std::println("No tasks found.");
    return 0;
  }

  std::println("{:<36} {:<36} {:<10} {:>4} {:<16} {:<24}", "JOB_ID", "TASK_ID",
               "STATUS", "PCT", "STAGE", "CREATED");
  for (const auto& rec : *records) {
    std::println("{:<36} {:<36} {:<10} {:>3}% {:<16} {:<24}", rec.job_id.str(),
                 rec.task_id.str(), status_name(rec.status), rec.progress,
                 rec.stage, format_timestamp(rec.created_at));
  }
  return 0;
}

}  // namespace vigil::cli
