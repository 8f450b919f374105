#pragma once

#include "vigil/util/id.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vigil {

enum class ExecutionStatus : std::uint8_t {
  Pending,
  Running,
  Paused,
  Completed,
  Failed,
  Cancelled,
};

[[nodiscard]] constexpr auto is_terminal(ExecutionStatus s) noexcept -> bool {
  return s == ExecutionStatus::Completed || s == ExecutionStatus::Failed ||
         s == ExecutionStatus::Cancelled;
}

enum class Severity : std::uint8_t { Critical, High, Medium, Low, Info };

enum class LogLevel : std::uint8_t { Info, Warn, Error };

// Code a finding carries so the sandbox can try to reproduce it.
struct VerificationCode {
  std::string language;
  std::string code;
  // Passed positionally after the target, in order
  std::vector<std::pair<std::string, std::string>> parameters;

  [[nodiscard]] auto operator==(const VerificationCode&) const
      -> bool = default;
};

struct Finding {
  FindingId id;
  std::string type;
  std::string title;
  std::string description;
  Severity severity{Severity::Info};
  std::string source;
  nlohmann::json evidence = nlohmann::json::object();
  std::optional<VerificationCode> verification;

  bool verified{false};
  bool confirmed{false};
  int reliability_score{0};
  std::string verification_output;

  [[nodiscard]] auto operator==(const Finding&) const -> bool = default;
};

struct LogEntry {
  std::int64_t seq{0};
  std::int64_t timestamp{0};
  LogLevel level{LogLevel::Info};
  std::string message;

  [[nodiscard]] auto operator==(const LogEntry&) const -> bool = default;
};

// Stage labels written at each pipeline boundary
namespace stage {
inline constexpr std::string_view kQueued = "queued";
inline constexpr std::string_view kInitializing = "initializing";
inline constexpr std::string_view kChainExecution = "chain_execution";
inline constexpr std::string_view kVerification = "verification";
inline constexpr std::string_view kReportAssembly = "report_assembly";
inline constexpr std::string_view kCompleted = "completed";
inline constexpr std::string_view kFailed = "failed";
inline constexpr std::string_view kCancelled = "cancelled";
}  // namespace stage

// Progress checkpoints; dashboards poll on these values.
namespace progress {
inline constexpr int kQueued = 0;
inline constexpr int kInitialized = 10;
inline constexpr int kChainDone = 60;
inline constexpr int kVerificationDone = 80;
inline constexpr int kCompleted = 100;
}  // namespace progress

struct ExecutionRecord {
  JobId job_id;
  TaskId task_id;
  ExecutionStatus status{ExecutionStatus::Pending};
  int progress{0};
  std::string stage{stage::kQueued};
  std::int64_t created_at{0};
  std::int64_t started_at{0};
  std::int64_t completed_at{0};
  std::vector<Finding> findings;
  std::vector<LogEntry> logs;
  std::string error;
  std::string report_path;
  int attempt{1};

  [[nodiscard]] auto operator==(const ExecutionRecord&) const
      -> bool = default;
};

}  // namespace vigil
