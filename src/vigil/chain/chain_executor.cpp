#include "vigil/chain/chain_executor.hpp"

#include "vigil/task/state_strings.hpp"
#include "vigil/tools/tool_manager.hpp"
#include "vigil/util/log.hpp"

#include <algorithm>
#include <format>
#include <iterator>

namespace vigil {

using json = nlohmann::json;

namespace {

auto next_finding_id(std::string_view tool, int& next_id) -> FindingId {
  return FindingId{std::format("{}-{}", tool, next_id++)};
}

auto emit(const ChainContext& ctx, LogLevel level, std::string message)
    -> void {
  if (ctx.log) {
    ctx.log(level, std::move(message));
  }
}

}  // namespace

auto findings_from_output(std::string_view tool, const json& structured,
                          int& next_id) -> std::vector<Finding> {
  std::vector<Finding> out;
  auto source = std::string(tool);

  if (tool == "nmap") {
    for (const auto& port : structured.value("ports", json::array())) {
      if (port.value("state", "") != "open") {
        continue;
      }
      Finding f;
      f.id = next_finding_id(tool, next_id);
      f.type = "open_port";
      f.severity = Severity::Info;
      f.source = source;
      f.title = std::format("Open port {}/{} ({})", port.value("port", 0),
                            port.value("protocol", "tcp"),
                            port.value("service", "unknown"));
      f.description = port.value("version", "");
      f.evidence = port;
      out.push_back(std::move(f));
    }
  } else if (tool == "sqlmap") {
    if (!structured.value("vulnerable", false)) {
      return out;
    }
    auto params = structured.value("parameters", json::array());
    if (params.empty()) {
      params.push_back({{"parameter", "unknown"}, {"place", "unknown"}});
    }
    for (const auto& p : params) {
      Finding f;
      f.id = next_finding_id(tool, next_id);
      f.type = "sql_injection";
      f.severity = Severity::High;
      f.source = source;
      f.title = std::format("SQL injection in parameter {}",
                            p.value("parameter", "unknown"));
      f.description = std::format("Injectable via {}", p.value("place", "?"));
      f.evidence = p;
      if (structured.contains("databases")) {
        f.evidence["databases"] = structured["databases"];
      }
      out.push_back(std::move(f));
    }
  } else if (tool == "nikto") {
    for (const auto& item : structured.value("items", json::array())) {
      Finding f;
      f.id = next_finding_id(tool, next_id);
      f.type = "web_issue";
      f.severity = Severity::Medium;
      f.source = source;
      f.title = std::format("Web server issue at {}", item.value("path", "/"));
      f.description = item.value("description", "");
      f.evidence = item;
      out.push_back(std::move(f));
    }
  } else if (tool == "dirb") {
    for (const auto* key : {"directories", "files"}) {
      for (const auto& entry : structured.value(key, json::array())) {
        Finding f;
        f.id = next_finding_id(tool, next_id);
        f.type = "exposed_path";
        f.severity = Severity::Low;
        f.source = source;
        f.title = std::format("Exposed path {}", entry.value("url", ""));
        f.description = entry.value("info", "");
        f.evidence = entry;
        out.push_back(std::move(f));
      }
    }
  }
  return out;
}

ToolChainExecutor::ToolChainExecutor(ToolManager& tools) : tools_(tools) {
}

auto ToolChainExecutor::tools_for(const StrategySpec& strategy)
    -> std::vector<std::string> {
  switch (strategy.kind) {
    case Strategy::Fast:
      return {"nmap"};
    case Strategy::Comprehensive:
      return {"nmap", "nikto", "dirb"};
    case Strategy::Deep:
      return {"nmap", "nikto", "dirb", "sqlmap"};
    case Strategy::Custom:
      break;
  }
  return {};
}

auto ToolChainExecutor::initialize(const ModelSpec& model) -> Result<void> {
  if (model.model.empty()) {
    return fail(Error::ValidationError);
  }
  log::info("Analysis chain ready for {} model {}", provider_name(model.provider),
            model.model);
  return ok();
}

auto ToolChainExecutor::execute(const ChainRequest& request,
                                const ChainContext& context)
    -> Result<ChainResult> {
  auto selected = request.tools.empty() ? tools_for(request.strategy)
                                        : request.tools;
  if (selected.empty()) {
    emit(context, LogLevel::Error, "No tools selected for custom strategy");
    return fail(Error::ChainExecutionFailure);
  }

  ChainResult result;
  int next_id = 1;
  for (const auto& name : selected) {
    if (context.token.is_cancelled()) {
      return fail(Error::Cancelled);
    }
    auto spec = tools_.get_tool(name);
    if (!spec) {
      emit(context, LogLevel::Warn, std::format("Tool {} is not configured", name));
      result.tool_runs.push_back(
          ToolRun{.tool = name, .error = "not configured"});
      continue;
    }

    emit(context, LogLevel::Info, std::format("Running {}", name));
    auto run = tools_.execute(name, spec->default_args, request.target,
                              std::nullopt, context.token);
    if (!run) {
      emit(context, LogLevel::Warn,
           std::format("{} rejected: {}", name, run.error().message()));
      result.tool_runs.push_back(
          ToolRun{.tool = name, .error = run.error().message()});
      continue;
    }
    if (context.token.is_cancelled()) {
      return fail(Error::Cancelled);
    }

    result.tool_runs.push_back(ToolRun{.tool = name,
                                       .success = run->success,
                                       .exit_code = run->exit_code,
                                       .duration = run->duration,
                                       .error = run->error});
    if (!run->success) {
      emit(context, LogLevel::Warn, std::format("{} failed: {}", name, run->error));
      continue;
    }

    std::vector<Finding> found;
    if (run->structured) {
      found = findings_from_output(name, *run->structured, next_id);
    }
    emit(context, LogLevel::Info,
         std::format("{} completed in {}ms with {} findings", name,
                     run->duration.count(), found.size()));
    std::ranges::move(found, std::back_inserter(result.findings));
  }

  bool any_ok = std::ranges::any_of(result.tool_runs,
                                    [](const ToolRun& r) { return r.success; });
  if (!any_ok) {
    emit(context, LogLevel::Error, "Every selected tool failed");
    return fail(Error::ChainExecutionFailure);
  }
  return result;
}

}  // namespace vigil
