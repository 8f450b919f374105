#include "load.hpp"

#include "vigil/cli/commands.hpp"
#include "vigil/executor/process_runner.hpp"
#include "vigil/tools/tool_manager.hpp"

#include <algorithm>
#include <print>

namespace vigil::cli {

auto cmd_check_tools(const CheckToolsOptions& opts) -> int {
  auto config = load_config(opts.overrides);
  if (!config) {
    std::println(stderr, "Error: Failed to load config: {}",
                 config.error().message());
    return 1;
  }

  auto specs = default_tool_specs();
  for (auto& spec : config->tools) {
    auto it = std::ranges::find(specs, spec.name, &ToolSpec::name);
    if (it != specs.end()) {
      *it = std::move(spec);
    } else {
      specs.push_back(std::move(spec));
    }
  }

  ProcessRunner runner;
  ToolManager tools(runner, std::move(specs));
  auto health = tools.health();

  std::println("{:<10} {:<10} {}", "TOOL", "STATUS", "DETAIL");
  for (const auto& status : health.tools) {
    std::println("{:<10} {:<10} {}", status.name,
                 status.available ? "ok" : "missing",
                 status.available ? status.version : status.error);
  }
  std::println("Overall: {}", health.healthy ? "healthy" : "degraded");
  return health.healthy ? 0 : 2;
}

}  // namespace vigil::cli
