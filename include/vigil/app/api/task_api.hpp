#pragma once

#include "vigil/core/error.hpp"
#include "vigil/task/task_definition.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace vigil {

class Orchestrator;
class ToolManager;
class IReportAssembler;
struct PoolStats;

struct ApiResponse {
  int status{200};
  nlohmann::json body;
};

// Request handling behind the REST routes, independent of the HTTP server.
// Every response carries `success`; failures add {"error": {code, message}}.
// No handler lets an exception escape.
class TaskApi {
public:
  using PoolStatsFn = std::function<PoolStats()>;

  TaskApi(Orchestrator& orchestrator, ToolManager& tools,
          IReportAssembler& reports, PoolStatsFn pool_stats = {});

  [[nodiscard]] auto health(bool running) const -> ApiResponse;

  [[nodiscard]] auto submit(std::string_view body) -> ApiResponse;
  [[nodiscard]] auto list() -> ApiResponse;
  [[nodiscard]] auto get(std::string_view job_id) -> ApiResponse;
  [[nodiscard]] auto logs(std::string_view job_id) -> ApiResponse;
  [[nodiscard]] auto pause(std::string_view job_id) -> ApiResponse;
  [[nodiscard]] auto resume(std::string_view job_id) -> ApiResponse;
  [[nodiscard]] auto cancel(std::string_view job_id) -> ApiResponse;
  [[nodiscard]] auto report(std::string_view job_id, std::string_view format)
      -> ApiResponse;
  [[nodiscard]] auto delete_definition(std::string_view task_id)
      -> ApiResponse;

  [[nodiscard]] auto list_tools() -> ApiResponse;
  [[nodiscard]] auto add_tool(std::string_view body) -> ApiResponse;
  [[nodiscard]] auto remove_tool(std::string_view name) -> ApiResponse;
  [[nodiscard]] auto tools_status() -> ApiResponse;

  [[nodiscard]] auto stats() -> ApiResponse;

  // Submission body -> definition. Accepts the dashboard's field names
  // (ai_model, scheduled_time, priority as a name).
  [[nodiscard]] static auto parse_submission(const nlohmann::json& body)
      -> Result<TaskDefinition>;

  [[nodiscard]] static auto error_status(std::error_code ec) -> int;
  [[nodiscard]] static auto error_code_name(std::error_code ec)
      -> std::string_view;
  [[nodiscard]] static auto error(int status, std::string_view code,
                                  std::string_view message) -> ApiResponse;
  [[nodiscard]] static auto error(std::error_code ec) -> ApiResponse;

private:
  Orchestrator& orchestrator_;
  ToolManager& tools_;
  IReportAssembler& reports_;
  PoolStatsFn pool_stats_;
};

}  // namespace vigil
