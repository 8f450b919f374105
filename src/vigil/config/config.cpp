#include "vigil/config/config.hpp"

#include "vigil/config/yaml_utils.hpp"
#include "vigil/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<vigil::StorageConfig> {
  static bool decode(const Node& node, vigil::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.db_file = vigil::yaml_get_or<std::string>(node, "db_file", "vigil.db");
    s.busy_retries = vigil::yaml_get_or(node, "busy_retries", 5);
    s.busy_backoff_ms = vigil::yaml_get_or(node, "busy_backoff_ms", 20);
    return true;
  }
};

template <>
struct convert<vigil::RetryConfig> {
  static bool decode(const Node& node, vigil::RetryConfig& r) {
    if (!node.IsMap()) {
      return false;
    }
    r.max_attempts = vigil::yaml_get_or(node, "max_attempts", 3);
    r.backoff_ms = vigil::yaml_get_or(node, "backoff_ms", 2000);
    return r.max_attempts >= 1 && r.backoff_ms >= 0;
  }
};

template <>
struct convert<vigil::SchedulerConfig> {
  static bool decode(const Node& node, vigil::SchedulerConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.log_level = vigil::yaml_get_or<std::string>(node, "log_level", "info");
    s.log_file = vigil::yaml_get_or<std::string>(node, "log_file", "");
    s.pid_file = vigil::yaml_get_or<std::string>(node, "pid_file", "");
    s.max_concurrency = vigil::yaml_get_or(node, "max_concurrency", 5);
    s.queue_capacity =
        vigil::yaml_get_or<std::size_t>(node, "queue_capacity", 1024);
    s.shutdown_timeout_ms = vigil::yaml_get_or(node, "shutdown_timeout_ms", 3000);
    if (auto retry = node["retry"]) {
      s.retry = retry.as<vigil::RetryConfig>();
    }
    return s.max_concurrency >= 1;
  }
};

template <>
struct convert<vigil::ApiConfig> {
  static bool decode(const Node& node, vigil::ApiConfig& a) {
    if (!node.IsMap()) {
      return false;
    }
    a.enabled = vigil::yaml_get_or(node, "enabled", true);
    a.port = vigil::yaml_get_or<uint16_t>(node, "port", 3001);
    a.host = vigil::yaml_get_or<std::string>(node, "host", "127.0.0.1");
    return true;
  }
};

template <>
struct convert<vigil::SandboxConfig> {
  static bool decode(const Node& node, vigil::SandboxConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.directory = vigil::yaml_get_or<std::string>(node, "directory", "./sandbox");
    s.default_timeout = vigil::yaml_get_or(node, "default_timeout",
                                           std::chrono::seconds(30));
    s.max_timeout =
        vigil::yaml_get_or(node, "max_timeout", std::chrono::seconds(120));
    s.max_output_bytes =
        vigil::yaml_get_or<std::size_t>(node, "max_output_bytes", 1024 * 1024);
    s.memory_limit_mb =
        vigil::yaml_get_or<std::size_t>(node, "memory_limit_mb", 512);
    s.purge_after_run = vigil::yaml_get_or(node, "purge_after_run", true);
    if (auto runtimes = node["runtimes"]; runtimes && runtimes.IsMap()) {
      for (const auto& entry : runtimes) {
        s.runtimes.insert_or_assign(entry.first.as<std::string>(),
                                    entry.second.as<std::string>());
      }
    }
    return s.default_timeout.count() > 0 &&
           s.max_timeout >= s.default_timeout;
  }
};

template <>
struct convert<vigil::ReportConfig> {
  static bool decode(const Node& node, vigil::ReportConfig& r) {
    if (!node.IsMap()) {
      return false;
    }
    r.directory = vigil::yaml_get_or<std::string>(node, "directory", "./reports");
    r.default_format =
        vigil::yaml_get_or<std::string>(node, "default_format", "json");
    return true;
  }
};

template <>
struct convert<vigil::ToolSpec> {
  static bool decode(const Node& node, vigil::ToolSpec& t) {
    if (!node.IsMap()) {
      return false;
    }
    t.name = vigil::yaml_get_or<std::string>(node, "name", "");
    t.command = vigil::yaml_get_or<std::string>(node, "command", t.name);
    t.timeout =
        vigil::yaml_get_or(node, "timeout", std::chrono::seconds(300));
    t.allowed_args = vigil::yaml_get_or(node, "allowed_args",
                                        std::vector<std::string>{});
    t.default_args = vigil::yaml_get_or(node, "default_args",
                                        std::vector<std::string>{});
    t.version_args = vigil::yaml_get_or(
        node, "version_args", std::vector<std::string>{"--version"});
    t.output_format = vigil::parse_output_format(
        vigil::yaml_get_or<std::string>(node, "output_format", "text"));
    t.description = vigil::yaml_get_or<std::string>(node, "description", "");
    return !t.name.empty() && !t.command.empty() && t.timeout.count() > 0;
  }
};

template <>
struct convert<vigil::SystemConfig> {
  static bool decode(const Node& node, vigil::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<vigil::StorageConfig>();
    }
    if (auto scheduler = node["scheduler"]) {
      c.scheduler = scheduler.as<vigil::SchedulerConfig>();
    }
    if (auto api = node["api"]) {
      c.api = api.as<vigil::ApiConfig>();
    }
    if (auto sandbox = node["sandbox"]) {
      c.sandbox = sandbox.as<vigil::SandboxConfig>();
    }
    if (auto reports = node["reports"]) {
      c.reports = reports.as<vigil::ReportConfig>();
    }
    if (auto tools = node["tools"]; tools && tools.IsSequence()) {
      for (const auto& t : tools) {
        c.tools.push_back(t.as<vigil::ToolSpec>());
      }
    }
    return true;
  }
};

}  // namespace YAML

namespace vigil {

namespace {

void to_yaml(YAML::Emitter& out, const SchedulerConfig& s) {
  out << YAML::BeginMap;
  yaml_emit(out, "log_level", s.log_level);
  yaml_emit_if_not_empty(out, "log_file", s.log_file);
  yaml_emit_if_not_empty(out, "pid_file", s.pid_file);
  yaml_emit(out, "max_concurrency", s.max_concurrency);
  yaml_emit(out, "queue_capacity", s.queue_capacity);
  out << YAML::Key << "retry" << YAML::Value << YAML::BeginMap;
  yaml_emit(out, "max_attempts", s.retry.max_attempts);
  yaml_emit(out, "backoff_ms", s.retry.backoff_ms);
  out << YAML::EndMap;
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const SandboxConfig& s) {
  out << YAML::BeginMap;
  yaml_emit(out, "directory", s.directory);
  yaml_emit(out, "default_timeout", s.default_timeout.count());
  yaml_emit(out, "max_timeout", s.max_timeout.count());
  yaml_emit(out, "max_output_bytes", s.max_output_bytes);
  yaml_emit(out, "memory_limit_mb", s.memory_limit_mb);
  out << YAML::Key << "runtimes" << YAML::Value << YAML::BeginMap;
  for (const auto& [lang, runtime] : s.runtimes) {
    yaml_emit(out, lang, runtime);
  }
  out << YAML::EndMap;
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const ToolSpec& t) {
  out << YAML::BeginMap;
  yaml_emit(out, "name", t.name);
  yaml_emit(out, "command", t.command);
  yaml_emit(out, "timeout", t.timeout.count());
  yaml_emit_list(out, "allowed_args", t.allowed_args);
  if (!t.default_args.empty()) {
    yaml_emit_list(out, "default_args", t.default_args);
  }
  yaml_emit(out, "output_format",
            std::string(output_format_name(t.output_format)));
  out << YAML::EndMap;
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    SystemConfig config = root.as<SystemConfig>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::to_string(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "storage" << YAML::Value << YAML::BeginMap;
  yaml_emit(out, "db_file", config.storage.db_file);
  out << YAML::EndMap;

  out << YAML::Key << "scheduler" << YAML::Value;
  to_yaml(out, config.scheduler);

  out << YAML::Key << "api" << YAML::Value << YAML::BeginMap;
  yaml_emit(out, "enabled", config.api.enabled);
  yaml_emit(out, "host", config.api.host);
  yaml_emit(out, "port", config.api.port);
  out << YAML::EndMap;

  out << YAML::Key << "sandbox" << YAML::Value;
  to_yaml(out, config.sandbox);

  out << YAML::Key << "reports" << YAML::Value << YAML::BeginMap;
  yaml_emit(out, "directory", config.reports.directory);
  yaml_emit(out, "default_format", config.reports.default_format);
  out << YAML::EndMap;

  if (!config.tools.empty()) {
    out << YAML::Key << "tools" << YAML::Value << YAML::BeginSeq;
    for (const auto& t : config.tools) {
      to_yaml(out, t);
    }
    out << YAML::EndSeq;
  }

  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace vigil
