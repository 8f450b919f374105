#pragma once

#include "vigil/core/cancellation.hpp"
#include "vigil/core/error.hpp"
#include "vigil/task/execution_record.hpp"
#include "vigil/task/task_definition.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace vigil {

class ToolManager;

struct ChainRequest {
  TaskId task_id;
  JobId job_id;
  std::string target;
  ModelSpec model;
  std::vector<std::string> tools;
  StrategySpec strategy;
};

using ChainLogSink = std::function<void(LogLevel, std::string)>;

struct ChainContext {
  ChainLogSink log;
  CancellationToken token;
};

struct ToolRun {
  std::string tool;
  bool success{false};
  int exit_code{-1};
  std::chrono::milliseconds duration{0};
  std::string error;
};

struct ChainResult {
  std::vector<Finding> findings;
  std::vector<ToolRun> tool_runs;
};

// Analysis chain as seen by the orchestrator: an AI-service initialization
// step followed by one opaque call that yields findings.
class IChainExecutor {
public:
  virtual ~IChainExecutor() = default;

  [[nodiscard]] virtual auto initialize(const ModelSpec& model)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto execute(const ChainRequest& request,
                                     const ChainContext& context)
      -> Result<ChainResult> = 0;
};

// Runs the selected tools in order with their default arguments and turns
// their structured output into findings.
class ToolChainExecutor : public IChainExecutor {
public:
  explicit ToolChainExecutor(ToolManager& tools);

  [[nodiscard]] auto initialize(const ModelSpec& model) -> Result<void> override;
  [[nodiscard]] auto execute(const ChainRequest& request,
                             const ChainContext& context)
      -> Result<ChainResult> override;

  // Tools a strategy selects when the task names none
  [[nodiscard]] static auto tools_for(const StrategySpec& strategy)
      -> std::vector<std::string>;

private:
  ToolManager& tools_;
};

// Exposed for tests; `next_id` numbers findings within one chain run.
[[nodiscard]] auto findings_from_output(std::string_view tool,
                                        const nlohmann::json& structured,
                                        int& next_id) -> std::vector<Finding>;

}  // namespace vigil
