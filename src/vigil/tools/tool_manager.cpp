#include "vigil/tools/tool_manager.hpp"

#include "vigil/task/task_definition.hpp"
#include "vigil/tools/output_parser.hpp"
#include "vigil/util/log.hpp"

#include <algorithm>
#include <format>

namespace vigil {

auto default_tool_specs() -> std::vector<ToolSpec> {
  return {
      ToolSpec{.name = "nmap",
               .command = "nmap",
               .timeout = std::chrono::seconds(300),
               .allowed_args = {"-sS", "-sT", "-sU", "-O", "-sV", "-p", "-Pn",
                                "-A", "-T4"},
               .default_args = {"-sV", "-T4"},
               .version_args = {"--version"},
               .output_format = OutputFormat::Text,
               .description = "Network port scanner"},
      ToolSpec{.name = "sqlmap",
               .command = "sqlmap",
               .timeout = std::chrono::seconds(600),
               .allowed_args = {"--batch", "--random-agent", "--level",
                                "--risk", "--threads", "-u"},
               .default_args = {"--batch", "--random-agent", "-u"},
               .version_args = {"--version"},
               .output_format = OutputFormat::Text,
               .description = "SQL injection detection"},
      ToolSpec{.name = "nikto",
               .command = "nikto",
               .timeout = std::chrono::seconds(300),
               .allowed_args = {"-h", "-p", "-Tuning", "-Plugins"},
               .default_args = {"-h"},
               .version_args = {"-Version"},
               .output_format = OutputFormat::Text,
               .description = "Web server scanner"},
      ToolSpec{.name = "dirb",
               .command = "dirb",
               .timeout = std::chrono::seconds(300),
               .allowed_args = {"-w", "-t", "-r", "-l"},
               .default_args = {},
               .version_args = {},
               .output_format = OutputFormat::Text,
               .description = "Web content discovery"},
  };
}

namespace {

auto first_line(std::string_view text) -> std::string {
  auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  text.remove_prefix(begin);
  auto end = text.find_first_of("\r\n");
  return std::string(text.substr(0, end));
}

auto has_control_chars(std::string_view s) -> bool {
  return std::ranges::any_of(s, [](char c) {
    return c == '\n' || c == '\r' || c == '\0';
  });
}

}  // namespace

ToolManager::ToolManager(IProcessRunner& runner, std::vector<ToolSpec> specs,
                         std::size_t max_output_bytes)
    : runner_(runner), max_output_bytes_(max_output_bytes) {
  for (auto& spec : specs) {
    auto name = spec.name;
    specs_.insert_or_assign(std::move(name), std::move(spec));
  }
}

auto ToolManager::validate_arguments(const ToolSpec& spec,
                                     std::span<const std::string> args,
                                     std::string_view target) -> Result<void> {
  if (target.empty()) {
    log::warn("Security: empty target rejected for {}", spec.name);
    return fail(Error::ValidationError);
  }
  if (contains_shell_metachar(target) || has_control_chars(target)) {
    log::warn("Security: unsafe target rejected for {}: {}", spec.name, target);
    return fail(Error::UnsafeArgument);
  }
  if (target.starts_with('-')) {
    log::warn("Security: flag-shaped target rejected for {}: {}", spec.name,
              target);
    return fail(Error::DisallowedArgument);
  }
  for (const auto& arg : args) {
    if (contains_shell_metachar(arg) || has_control_chars(arg)) {
      log::warn("Security: unsafe argument rejected for {}: {}", spec.name,
                arg);
      return fail(Error::UnsafeArgument);
    }
    if (!arg.starts_with('-')) {
      continue;
    }
    bool allowed = std::ranges::any_of(
        spec.allowed_args,
        [&arg](const std::string& prefix) { return arg.starts_with(prefix); });
    if (!allowed) {
      log::warn("Security: argument {} is not allowed for {}", arg, spec.name);
      return fail(Error::DisallowedArgument);
    }
  }
  return ok();
}

auto ToolManager::execute(std::string_view tool,
                          std::span<const std::string> args,
                          std::string_view target,
                          std::optional<std::chrono::seconds> timeout,
                          const CancellationToken& token)
    -> Result<ToolResult> {
  auto spec = get_tool(tool);
  if (!spec) {
    log::warn("Unknown tool requested: {}", tool);
    return fail(Error::NotFound);
  }
  if (auto r = validate_arguments(*spec, args, target); !r) {
    return std::unexpected(r.error());
  }

  ProcessSpec ps;
  ps.argv.reserve(args.size() + 2);
  ps.argv.push_back(spec->command);
  ps.argv.insert(ps.argv.end(), args.begin(), args.end());
  ps.argv.emplace_back(target);
  ps.timeout = timeout ? std::clamp(*timeout, std::chrono::seconds(1),
                                    spec->timeout)
                       : spec->timeout;
  ps.max_output_bytes = max_output_bytes_;

  log::info("Running {} against {} ({} args, timeout {}s)", spec->name, target,
            args.size(),
            std::chrono::duration_cast<std::chrono::seconds>(ps.timeout)
                .count());

  auto proc = runner_.run(ps, token);

  ToolResult result;
  result.exit_code = proc.exit_code;
  result.duration = proc.duration;
  result.timed_out = proc.timed_out;
  result.raw_output = std::move(proc.stdout_output);

  if (!proc.launched()) {
    result.error = proc.error;
  } else if (proc.cancelled) {
    result.error = "Cancelled";
  } else if (proc.timed_out) {
    result.error = std::format("{} timed out after {}s", spec->name,
                               std::chrono::duration_cast<std::chrono::seconds>(
                                   ps.timeout)
                                   .count());
  } else if (proc.exit_code != 0) {
    auto detail = first_line(proc.stderr_output);
    result.error = detail.empty()
                       ? std::format("{} exited with code {}", spec->name,
                                     proc.exit_code)
                       : std::format("{} exited with code {}: {}", spec->name,
                                     proc.exit_code, detail);
  }
  result.success = result.error.empty();

  if (result.success) {
    if (spec->output_format == OutputFormat::Json) {
      auto parsed = nlohmann::json::parse(result.raw_output, nullptr, false);
      if (!parsed.is_discarded()) {
        result.structured = std::move(parsed);
      }
    } else {
      result.structured = parse_tool_output(spec->name, result.raw_output);
    }
    log::info("{} finished in {}ms", spec->name, result.duration.count());
  } else {
    log::warn("{} failed: {}", spec->name, result.error);
  }
  return result;
}

auto ToolManager::validate_tool(std::string_view tool) -> Result<ToolStatus> {
  auto spec = get_tool(tool);
  if (!spec) {
    return fail(Error::NotFound);
  }

  ToolStatus status;
  status.name = spec->name;

  if (!resolve_executable(spec->command)) {
    status.error = std::format("{} not found in PATH", spec->command);
    return status;
  }

  ProcessSpec ps;
  ps.argv.push_back(spec->command);
  ps.argv.insert(ps.argv.end(), spec->version_args.begin(),
                 spec->version_args.end());
  ps.timeout = kVersionProbeTimeout;
  ps.max_output_bytes = 64 * 1024;

  auto proc = runner_.run(ps, CancellationToken::none());
  if (!proc.launched()) {
    status.error = proc.error;
    return status;
  }
  if (proc.timed_out) {
    status.error = "Version probe timed out";
    return status;
  }
  // Several tools print a banner on stderr or exit non-zero for a bare
  // version flag; a process that ran at all counts as present.
  status.available = true;
  status.version = first_line(proc.stdout_output);
  if (status.version.empty()) {
    status.version = first_line(proc.stderr_output);
  }
  return status;
}

auto ToolManager::health() -> ToolHealth {
  ToolHealth health{.healthy = true, .tools = {}};
  for (const auto& spec : list_tools()) {
    auto status = validate_tool(spec.name);
    if (!status) {
      continue;  // removed concurrently
    }
    if (!status->available) {
      health.healthy = false;
    }
    health.tools.push_back(std::move(*status));
  }
  return health;
}

auto ToolManager::add_tool(ToolSpec spec) -> Result<void> {
  if (spec.name.empty() || spec.command.empty() ||
      spec.timeout <= std::chrono::seconds::zero()) {
    return fail(Error::ValidationError);
  }
  if (contains_shell_metachar(spec.command) ||
      contains_shell_metachar(spec.name)) {
    log::warn("Security: rejected tool {} with unsafe command", spec.name);
    return fail(Error::UnsafeArgument);
  }
  std::lock_guard lock(mu_);
  log::info("Registered tool {} -> {}", spec.name, spec.command);
  auto name = spec.name;
  specs_.insert_or_assign(std::move(name), std::move(spec));
  return ok();
}

auto ToolManager::remove_tool(std::string_view tool) -> Result<void> {
  std::lock_guard lock(mu_);
  auto it = specs_.find(tool);
  if (it == specs_.end()) {
    return fail(Error::NotFound);
  }
  specs_.erase(it);
  log::info("Removed tool {}", tool);
  return ok();
}

auto ToolManager::get_tool(std::string_view tool) const
    -> std::optional<ToolSpec> {
  std::lock_guard lock(mu_);
  auto it = specs_.find(tool);
  if (it == specs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ToolManager::list_tools() const -> std::vector<ToolSpec> {
  std::lock_guard lock(mu_);
  std::vector<ToolSpec> out;
  out.reserve(specs_.size());
  for (const auto& [_, spec] : specs_) {
    out.push_back(spec);
  }
  return out;
}

}  // namespace vigil
