#pragma once

#include "vigil/config/system_config.hpp"
#include "vigil/core/cancellation.hpp"
#include "vigil/core/error.hpp"
#include "vigil/executor/process_runner.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vigil {

inline constexpr int kScoreConfirmed = 80;
inline constexpr int kScoreUnconfirmed = 20;
inline constexpr int kScoreNotRun = 0;

struct VerificationJob {
  // <job_id>_<finding_id>; also the sandbox directory name
  std::string id;
  std::string finding_id;
  std::string code;
  std::string language;
  std::string target;
  std::vector<std::pair<std::string, std::string>> parameters;
  std::chrono::seconds timeout{30};
  bool sandboxed{true};
};

struct VerificationResult {
  bool success{false};
  // Heuristic: an indicator token appeared on stdout
  bool confirmed{false};
  std::string output;
  std::string error;
  std::chrono::milliseconds duration{0};
  int reliability_score{kScoreNotRun};
};

// Runs generated verification code in a fresh per-job directory with a
// scrubbed environment, resource limits and a hard timeout.
class SandboxExecutor {
public:
  SandboxExecutor(IProcessRunner& runner, SandboxConfig config);

  SandboxExecutor(const SandboxExecutor&) = delete;
  SandboxExecutor& operator=(const SandboxExecutor&) = delete;

  // Errors: UnsupportedLanguage before anything is written, AlreadyExists
  // when the sandbox directory is present, SandboxExecutionFailure when the
  // directory or script cannot be created. A program that ran and failed is
  // a successful return with success=false.
  [[nodiscard]] auto execute(const VerificationJob& job,
                             const CancellationToken& token = {})
      -> Result<VerificationResult>;

  // Removes the job's directory. Failures are logged only.
  auto purge(std::string_view verification_id) -> void;

  [[nodiscard]] auto supports(std::string_view language) const -> bool;

  [[nodiscard]] static auto script_extension(std::string_view language)
      -> std::string_view;
  [[nodiscard]] static auto indicators(std::string_view language)
      -> std::vector<std::string_view>;
  [[nodiscard]] static auto is_confirmed(std::string_view language,
                                         std::string_view output) -> bool;

  [[nodiscard]] auto config() const noexcept -> const SandboxConfig& {
    return config_;
  }

private:
  IProcessRunner& runner_;
  SandboxConfig config_;
};

}  // namespace vigil
