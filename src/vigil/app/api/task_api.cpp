#include "vigil/app/api/task_api.hpp"

#include "vigil/app/orchestrator.hpp"
#include "vigil/report/report_assembler.hpp"
#include "vigil/scheduler/worker_pool.hpp"
#include "vigil/task/json_codec.hpp"
#include "vigil/task/state_strings.hpp"
#include "vigil/tools/tool_manager.hpp"
#include "vigil/util/log.hpp"
#include "vigil/util/util.hpp"

#include <format>

namespace vigil {

using json = nlohmann::json;

namespace {

auto success(json body = json::object()) -> ApiResponse {
  body["success"] = true;
  return ApiResponse{.status = 200, .body = std::move(body)};
}

auto tool_to_json(const ToolSpec& spec) -> json {
  return {{"name", spec.name},
          {"command", spec.command},
          {"timeout", spec.timeout.count()},
          {"allowed_args", spec.allowed_args},
          {"default_args", spec.default_args},
          {"version_args", spec.version_args},
          {"output_format", std::string(output_format_name(spec.output_format))},
          {"description", spec.description}};
}

auto tool_from_json(const json& j) -> ToolSpec {
  ToolSpec spec;
  spec.name = j.at("name").get<std::string>();
  spec.command = j.value("command", spec.name);
  spec.timeout = std::chrono::seconds(j.value("timeout", 300));
  spec.allowed_args = j.value("allowed_args", std::vector<std::string>{});
  spec.default_args = j.value("default_args", std::vector<std::string>{});
  spec.version_args =
      j.value("version_args", std::vector<std::string>{"--version"});
  spec.output_format = parse_output_format(j.value("output_format", "text"));
  spec.description = j.value("description", "");
  return spec;
}

auto not_found(std::string_view job_id) -> ApiResponse {
  return TaskApi::error(404, "NOT_FOUND",
                        std::format("Task {} not found", job_id));
}

}  // namespace

TaskApi::TaskApi(Orchestrator& orchestrator, ToolManager& tools,
                 IReportAssembler& reports, PoolStatsFn pool_stats)
    : orchestrator_(orchestrator),
      tools_(tools),
      reports_(reports),
      pool_stats_(std::move(pool_stats)) {
}

auto TaskApi::error_status(std::error_code ec) -> int {
  if (ec.category() != error_category()) {
    return 500;
  }
  switch (static_cast<Error>(ec.value())) {
    case Error::ValidationError:
    case Error::ParseError:
    case Error::UnsafeArgument:
    case Error::UnsupportedLanguage:
      return 400;
    case Error::DisallowedArgument:
      return 403;
    case Error::NotFound:
    case Error::FileNotFound:
      return 404;
    case Error::HasActiveRuns:
    case Error::InvalidTransition:
    case Error::AlreadyExists:
      return 409;
    case Error::NotSupported:
      return 501;
    case Error::PersistenceFailure:
    case Error::QueueUnavailable:
      return 503;
    default:
      return 500;
  }
}

auto TaskApi::error_code_name(std::error_code ec) -> std::string_view {
  if (ec.category() != error_category()) {
    return "INTERNAL_ERROR";
  }
  switch (static_cast<Error>(ec.value())) {
    case Error::ValidationError: return "VALIDATION_ERROR";
    case Error::ParseError: return "PARSE_ERROR";
    case Error::UnsafeArgument: return "UNSAFE_ARGUMENT";
    case Error::DisallowedArgument: return "DISALLOWED_ARGUMENT";
    case Error::UnsupportedLanguage: return "UNSUPPORTED_LANGUAGE";
    case Error::NotFound:
    case Error::FileNotFound: return "NOT_FOUND";
    case Error::HasActiveRuns: return "HAS_ACTIVE_RUNS";
    case Error::InvalidTransition: return "INVALID_TRANSITION";
    case Error::AlreadyExists: return "ALREADY_EXISTS";
    case Error::NotSupported: return "NOT_SUPPORTED";
    case Error::PersistenceFailure: return "PERSISTENCE_FAILURE";
    case Error::QueueUnavailable: return "QUEUE_UNAVAILABLE";
    default: return "INTERNAL_ERROR";
  }
}

auto TaskApi::error(int status, std::string_view code, std::string_view message)
    -> ApiResponse {
  return ApiResponse{
      .status = status,
      .body = {{"success", false},
               {"error",
                {{"code", std::string(code)},
                 {"message", std::string(message)}}}}};
}

auto TaskApi::error(std::error_code ec) -> ApiResponse {
  return error(error_status(ec), error_code_name(ec), ec.message());
}

auto TaskApi::parse_submission(const json& body) -> Result<TaskDefinition> {
  if (!body.is_object()) {
    return fail(Error::ValidationError);
  }
  TaskDefinition def;
  try {
    if (auto id = body.value("id", ""); !id.empty()) {
      def.task_id = TaskId{id};
    }
    def.name = body.value("name", "");
    def.target = body.value("target", "");
    def.model.model = body.value("ai_model", body.value("model", ""));

    auto provider_text = body.value("provider", "");
    std::optional<Provider> provider;
    if (!provider_text.empty()) {
      provider = parse_provider(provider_text);
      if (!provider) {
        log::warn("Rejected submission: unknown provider {}", provider_text);
        return fail(Error::ValidationError);
      }
    } else {
      provider = infer_provider(def.model.model);
      if (!provider) {
        log::warn("Rejected submission: cannot infer provider for model '{}'",
                  def.model.model);
        return fail(Error::ValidationError);
      }
    }
    def.model.provider = *provider;

    def.tools = body.value("tools", std::vector<std::string>{});

    auto strategy = parse_strategy(body.value("strategy", "comprehensive"));
    if (!strategy) {
      return fail(Error::ValidationError);
    }
    def.strategy.kind = *strategy;
    def.strategy.depth = body.value("depth", 1);
    def.strategy.scope = body.value("scope", std::vector<std::string>{});

    if (auto it = body.find("priority"); it != body.end() && !it->is_null()) {
      if (it->is_number_integer()) {
        def.priority = it->get<int>();
      } else {
        auto parsed = parse_priority(it->get<std::string>());
        if (!parsed) {
          return fail(Error::ValidationError);
        }
        def.priority = *parsed;
      }
    }

    if (auto it = body.find("scheduled_time");
        it != body.end() && !it->is_null()) {
      auto when = parse_timestamp(it->get<std::string>());
      if (!when) {
        return fail(Error::ValidationError);
      }
      def.scheduled_at = *when;
    }

    def.verify = body.value("verify", true);
    def.user_id = body.value("user_id", "anonymous");
  } catch (const json::exception& e) {
    log::warn("Rejected submission: {}", e.what());
    return fail(Error::ValidationError);
  }
  return def;
}

auto TaskApi::health(bool running) const -> ApiResponse {
  return success({{"status", running ? "healthy" : "stopped"},
                  {"timestamp", format_timestamp()}});
}

auto TaskApi::submit(std::string_view body) -> ApiResponse {
  try {
    auto parsed = json::parse(body);
    auto def = parse_submission(parsed);
    if (!def) {
      return error(400, "VALIDATION_ERROR",
                   "name, target and a recognised ai_model are required");
    }
    auto result = orchestrator_.submit(std::move(*def));
    if (!result) {
      return error(result.error());
    }
    return success({{"taskId", result->task_id.str()},
                    {"jobId", result->job_id.str()},
                    {"message", "Task created successfully"}});
  } catch (const json::exception& e) {
    return error(400, "PARSE_ERROR", e.what());
  } catch (const std::exception& e) {
    log::error("submit failed: {}", e.what());
    return error(500, "INTERNAL_ERROR", e.what());
  }
}

auto TaskApi::list() -> ApiResponse {
  try {
    auto records = orchestrator_.list_all();
    if (!records) {
      return error(records.error());
    }
    json tasks = json::array();
    for (const auto& rec : *records) {
      tasks.push_back(record_to_json(rec, Orchestrator::kListLogLimit));
    }
    return success({{"tasks", std::move(tasks)}});
  } catch (const std::exception& e) {
    return error(500, "INTERNAL_ERROR", e.what());
  }
}

auto TaskApi::get(std::string_view job_id) -> ApiResponse {
  try {
    auto rec = orchestrator_.get_status(JobId{std::string(job_id)});
    if (!rec) {
      return not_found(job_id);
    }
    return success({{"task", record_to_json(*rec)}});
  } catch (const std::exception& e) {
    return error(500, "INTERNAL_ERROR", e.what());
  }
}

auto TaskApi::logs(std::string_view job_id) -> ApiResponse {
  try {
    auto entries = orchestrator_.get_logs(JobId{std::string(job_id)});
    if (!entries) {
      return entries.error() == make_error_code(Error::NotFound)
                 ? not_found(job_id)
                 : error(entries.error());
    }
    return success({{"logs", *entries}});
  } catch (const std::exception& e) {
    return error(500, "INTERNAL_ERROR", e.what());
  }
}

auto TaskApi::pause(std::string_view job_id) -> ApiResponse {
  try {
    if (!orchestrator_.pause(JobId{std::string(job_id)})) {
      return error(409, "INVALID_TRANSITION",
                   "Task not found or not running");
    }
    return success({{"message", "Task paused successfully"}});
  } catch (const std::exception& e) {
    return error(500, "INTERNAL_ERROR", e.what());
  }
}

auto TaskApi::resume(std::string_view job_id) -> ApiResponse {
  try {
    if (!orchestrator_.resume(JobId{std::string(job_id)})) {
      return error(409, "INVALID_TRANSITION", "Task not found or not paused");
    }
    return success({{"message", "Task resumed successfully"}});
  } catch (const std::exception& e) {
    return error(500, "INTERNAL_ERROR", e.what());
  }
}

auto TaskApi::cancel(std::string_view job_id) -> ApiResponse {
  try {
    JobId id{std::string(job_id)};
    if (!orchestrator_.cancel(id)) {
      if (!orchestrator_.get_status(id)) {
        return not_found(job_id);
      }
      return error(409, "INVALID_TRANSITION", "Task already finished");
    }
    return success({{"message", "Task cancelled successfully"}});
  } catch (const std::exception& e) {
    return error(500, "INTERNAL_ERROR", e.what());
  }
}

auto TaskApi::report(std::string_view job_id, std::string_view format)
    -> ApiResponse {
  try {
    auto fmt = parse_report_format(format.empty() ? "json" : format);
    if (!fmt) {
      return error(400, "VALIDATION_ERROR",
                   std::format("Unknown report format '{}'", format));
    }
    if (*fmt == ReportFormat::Pdf) {
      return error(make_error_code(Error::NotSupported));
    }

    auto rec = orchestrator_.get_status(JobId{std::string(job_id)});
    if (!rec) {
      return not_found(job_id);
    }
    auto def = orchestrator_.get_definition(rec->task_id);
    if (!def) {
      return error(def.error());
    }

    if (*fmt == ReportFormat::Json) {
      auto payload = reports_.render(*def, *rec);
      payload["report_path"] =
          rec->report_path.empty() ? json(nullptr) : json(rec->report_path);
      return success({{"report", std::move(payload)}});
    }

    auto artifact = reports_.assemble(*def, *rec, *fmt);
    if (!artifact) {
      return error(artifact.error());
    }
    return success({{"report",
                     {{"path", artifact->path},
                      {"format", std::string(report_format_name(*fmt))},
                      {"size", artifact->size}}}});
  } catch (const std::exception& e) {
    return error(500, "INTERNAL_ERROR", e.what());
  }
}

auto TaskApi::delete_definition(std::string_view task_id) -> ApiResponse {
  try {
    auto r = orchestrator_.remove_task(TaskId{std::string(task_id)});
    if (!r) {
      return error(r.error());
    }
    return success({{"message", "Task definition deleted"}});
  } catch (const std::exception& e) {
    return error(500, "INTERNAL_ERROR", e.what());
  }
}

auto TaskApi::list_tools() -> ApiResponse {
  json tools = json::array();
  for (const auto& spec : tools_.list_tools()) {
    tools.push_back(tool_to_json(spec));
  }
  return success({{"tools", std::move(tools)}});
}

auto TaskApi::add_tool(std::string_view body) -> ApiResponse {
  try {
    auto spec = tool_from_json(json::parse(body));
    auto name = spec.name;
    if (auto r = tools_.add_tool(std::move(spec)); !r) {
      return error(r.error());
    }
    return success({{"message", std::format("Tool {} registered", name)}});
  } catch (const json::exception& e) {
    return error(400, "PARSE_ERROR", e.what());
  } catch (const std::exception& e) {
    return error(500, "INTERNAL_ERROR", e.what());
  }
}

auto TaskApi::remove_tool(std::string_view name) -> ApiResponse {
  if (auto r = tools_.remove_tool(name); !r) {
    return error(r.error());
  }
  return success({{"message", std::format("Tool {} removed", name)}});
}

auto TaskApi::tools_status() -> ApiResponse {
  try {
    auto health = tools_.health();
    json tools = json::object();
    for (const auto& status : health.tools) {
      json entry = {{"available", status.available}};
      entry["version"] =
          status.version.empty() ? json(nullptr) : json(status.version);
      entry["error"] = status.error.empty() ? json(nullptr) : json(status.error);
      tools[status.name] = std::move(entry);
    }
    return success({{"status", health.healthy ? "healthy" : "degraded"},
                    {"tools", std::move(tools)}});
  } catch (const std::exception& e) {
    return error(500, "INTERNAL_ERROR", e.what());
  }
}

auto TaskApi::stats() -> ApiResponse {
  auto s = orchestrator_.stats();
  json queue = {{"waiting", s.waiting},     {"delayed", s.delayed},
                {"active", s.active},       {"completed", s.completed},
                {"failed", s.failed},       {"cancelled", s.cancelled},
                {"inline_runs", s.inline_runs}};
  json body = {{"queue", std::move(queue)}, {"timestamp", format_timestamp()}};
  if (pool_stats_) {
    auto p = pool_stats_();
    body["workers"] = {{"size", p.workers},
                       {"busy", p.busy},
                       {"processed", p.processed},
                       {"retried", p.retried},
                       {"exhausted", p.exhausted}};
  }
  return success(std::move(body));
}

}  // namespace vigil
