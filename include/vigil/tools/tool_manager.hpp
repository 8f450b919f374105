#pragma once

#include "vigil/core/cancellation.hpp"
#include "vigil/core/error.hpp"
#include "vigil/executor/process_runner.hpp"
#include "vigil/tools/tool_spec.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vigil {

inline constexpr std::size_t kToolMaxOutputBytes = 50 * 1024 * 1024;
inline constexpr auto kVersionProbeTimeout = std::chrono::seconds(10);

struct ToolResult {
  bool success{false};
  std::string raw_output;
  std::optional<nlohmann::json> structured;
  int exit_code{-1};
  std::chrono::milliseconds duration{0};
  std::string error;
  bool timed_out{false};
};

struct ToolStatus {
  std::string name;
  bool available{false};
  std::string version;
  std::string error;
};

struct ToolHealth {
  bool healthy{false};
  std::vector<ToolStatus> tools;
};

// Sole path by which external security tools are launched. Arguments are
// checked before anything is spawned; a rejected argument never reaches
// the process runner.
class ToolManager {
public:
  explicit ToolManager(IProcessRunner& runner,
                       std::vector<ToolSpec> specs = default_tool_specs(),
                       std::size_t max_output_bytes = kToolMaxOutputBytes);

  ToolManager(const ToolManager&) = delete;
  ToolManager& operator=(const ToolManager&) = delete;

  // Runs `<command> <args...> <target>`. A timeout override is clamped to
  // [1s, the tool's configured limit].
  [[nodiscard]] auto execute(std::string_view tool,
                             std::span<const std::string> args,
                             std::string_view target,
                             std::optional<std::chrono::seconds> timeout =
                                 std::nullopt,
                             const CancellationToken& token = {})
      -> Result<ToolResult>;

  // UnsafeArgument for shell metacharacters anywhere in args or target,
  // DisallowedArgument for a flag no allow-listed prefix covers.
  [[nodiscard]] static auto validate_arguments(
      const ToolSpec& spec, std::span<const std::string> args,
      std::string_view target) -> Result<void>;

  [[nodiscard]] auto validate_tool(std::string_view tool) -> Result<ToolStatus>;
  [[nodiscard]] auto health() -> ToolHealth;

  [[nodiscard]] auto add_tool(ToolSpec spec) -> Result<void>;
  [[nodiscard]] auto remove_tool(std::string_view tool) -> Result<void>;
  [[nodiscard]] auto get_tool(std::string_view tool) const
      -> std::optional<ToolSpec>;
  [[nodiscard]] auto list_tools() const -> std::vector<ToolSpec>;

private:
  IProcessRunner& runner_;
  std::size_t max_output_bytes_;
  mutable std::mutex mu_;
  std::map<std::string, ToolSpec, std::less<>> specs_;
};

}  // namespace vigil
