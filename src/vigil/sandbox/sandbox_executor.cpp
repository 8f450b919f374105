#include "vigil/sandbox/sandbox_executor.hpp"

#include "vigil/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>

namespace vigil {

namespace fs = std::filesystem;

namespace {

auto is_safe_component(std::string_view id) -> bool {
  if (id.empty() || id == "." || id == "..") {
    return false;
  }
  return std::ranges::all_of(id, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' ||
           c == '_' || c == '.';
  });
}

}  // namespace

SandboxExecutor::SandboxExecutor(IProcessRunner& runner, SandboxConfig config)
    : runner_(runner), config_(std::move(config)) {
}

auto SandboxExecutor::script_extension(std::string_view language)
    -> std::string_view {
  if (language == "python") return "py";
  if (language == "javascript") return "js";
  return "sh";
}

auto SandboxExecutor::indicators(std::string_view language)
    -> std::vector<std::string_view> {
  if (language == "python") return {"vulnerable", "VULNERABILITY", "[+]"};
  if (language == "javascript") return {"vulnerability", "VULNERABILITY", "[!]"};
  return {"VULNERABLE", "vulnerable", "detected"};
}

auto SandboxExecutor::is_confirmed(std::string_view language,
                                   std::string_view output) -> bool {
  return std::ranges::any_of(indicators(language), [output](auto token) {
    return output.find(token) != std::string_view::npos;
  });
}

auto SandboxExecutor::supports(std::string_view language) const -> bool {
  return config_.runtimes.find(language) != config_.runtimes.end();
}

auto SandboxExecutor::execute(const VerificationJob& job,
                              const CancellationToken& token)
    -> Result<VerificationResult> {
  auto runtime = config_.runtimes.find(job.language);
  if (runtime == config_.runtimes.end()) {
    log::warn("Verification {}: unsupported language '{}'", job.id,
              job.language);
    return fail(Error::UnsupportedLanguage);
  }
  if (!is_safe_component(job.id)) {
    log::warn("Verification id '{}' is not a valid directory name", job.id);
    return fail(Error::ValidationError);
  }

  std::error_code ec;
  fs::path root = fs::absolute(config_.directory, ec);
  if (ec) {
    return fail(Error::SandboxExecutionFailure);
  }
  fs::create_directories(root, ec);
  if (ec) {
    log::error("Cannot create sandbox root {}: {}", root.string(),
               ec.message());
    return fail(Error::SandboxExecutionFailure);
  }

  auto dir = root / job.id;
  // create_directory reports false for an existing path; a sandbox is
  // never reused.
  if (!fs::create_directory(dir, ec)) {
    if (ec) {
      log::error("Cannot create sandbox {}: {}", dir.string(), ec.message());
      return fail(Error::SandboxExecutionFailure);
    }
    log::warn("Sandbox {} already exists, refusing to reuse it", dir.string());
    return fail(Error::AlreadyExists);
  }
  fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);

  auto script = dir / std::format("verify.{}", script_extension(job.language));
  {
    std::ofstream out(script, std::ios::binary | std::ios::trunc);
    if (!out) {
      log::error("Cannot write {}", script.string());
      return fail(Error::SandboxExecutionFailure);
    }
    out << job.code;
    if (!out) {
      return fail(Error::SandboxExecutionFailure);
    }
  }

  ProcessSpec spec;
  spec.argv = {runtime->second, script.string(), job.target};
  for (const auto& [_, value] : job.parameters) {
    spec.argv.push_back(value);
  }
  spec.working_dir = dir.string();
  auto timeout = job.timeout > std::chrono::seconds::zero()
                     ? job.timeout
                     : config_.default_timeout;
  spec.timeout = std::min(timeout, config_.max_timeout);
  spec.max_output_bytes = config_.max_output_bytes;

  const char* path_env = std::getenv("PATH");
  spec.env = std::vector<std::string>{
      std::format("PATH={}", path_env ? path_env : "/usr/local/bin:/usr/bin:/bin"),
      std::format("HOME={}", dir.string()),
      std::format("TARGET_URL={}", job.target),
  };
  spec.limits = ProcessLimits{.address_space_mb = config_.memory_limit_mb,
                              .max_file_bytes = config_.max_output_bytes,
                              .no_new_privs = true};

  log::info("Verification {} running {} ({}s limit)", job.id, runtime->second,
            std::chrono::duration_cast<std::chrono::seconds>(spec.timeout)
                .count());
  auto proc = runner_.run(spec, token);

  VerificationResult result;
  result.duration = proc.duration;
  result.output = proc.stdout_output;
  if (!proc.launched()) {
    result.error = proc.error.empty()
                       ? std::format("{} could not run", runtime->second)
                       : proc.error;
    result.reliability_score = kScoreNotRun;
  } else if (proc.cancelled) {
    result.error = "Cancelled";
    result.reliability_score = kScoreNotRun;
  } else if (proc.timed_out) {
    result.error = std::format(
        "Verification timed out after {}s",
        std::chrono::duration_cast<std::chrono::seconds>(spec.timeout).count());
    result.reliability_score = kScoreNotRun;
  } else {
    result.success = proc.exit_code == 0;
    if (!result.success) {
      result.error = proc.stderr_output.empty()
                         ? std::format("Exited with code {}", proc.exit_code)
                         : proc.stderr_output;
    }
    result.confirmed = is_confirmed(job.language, result.output);
    result.reliability_score =
        result.confirmed ? kScoreConfirmed : kScoreUnconfirmed;
  }

  log::info("Verification {} finished: confirmed={} score={}", job.id,
            result.confirmed, result.reliability_score);

  if (config_.purge_after_run) {
    purge(job.id);
  }
  return result;
}

auto SandboxExecutor::purge(std::string_view verification_id) -> void {
  if (!is_safe_component(verification_id)) {
    return;
  }
  std::error_code ec;
  auto dir = fs::path(config_.directory) / verification_id;
  fs::remove_all(dir, ec);
  if (ec) {
    log::warn("Failed to purge sandbox {}: {}", dir.string(), ec.message());
  }
}

}  // namespace vigil
