#include "vigil/task/json_codec.hpp"

#include "vigil/task/state_strings.hpp"
#include "vigil/util/util.hpp"

namespace vigil {

using json = nlohmann::json;

void to_json(json& j, const ModelSpec& m) {
  j = {{"provider", std::string(provider_name(m.provider))}, {"model", m.model}};
}

void from_json(const json& j, ModelSpec& m) {
  m.model = j.at("model").get<std::string>();
  auto provider = parse_provider(j.value("provider", ""));
  if (!provider) {
    provider = infer_provider(m.model);
  }
  m.provider = provider.value_or(Provider::OpenAI);
}

void to_json(json& j, const StrategySpec& s) {
  j = {{"kind", std::string(strategy_name(s.kind))},
       {"depth", s.depth},
       {"scope", s.scope}};
}

void from_json(const json& j, StrategySpec& s) {
  s.kind = parse_strategy(j.value("kind", "comprehensive"))
               .value_or(Strategy::Comprehensive);
  s.depth = j.value("depth", 1);
  s.scope = j.value("scope", std::vector<std::string>{});
}

void to_json(json& j, const TaskDefinition& d) {
  j = {{"task_id", d.task_id.str()},
       {"name", d.name},
       {"target", d.target},
       {"model", d.model},
       {"tools", d.tools},
       {"strategy", d.strategy},
       {"user_id", d.user_id},
       {"priority", d.priority},
       {"verify", d.verify},
       {"created_at", d.created_at}};
  if (d.scheduled_at) {
    j["scheduled_at"] = *d.scheduled_at;
  } else {
    j["scheduled_at"] = nullptr;
  }
}

void from_json(const json& j, TaskDefinition& d) {
  d.task_id = TaskId{j.at("task_id").get<std::string>()};
  d.name = j.at("name").get<std::string>();
  d.target = j.at("target").get<std::string>();
  d.model = j.at("model").get<ModelSpec>();
  d.tools = j.value("tools", std::vector<std::string>{});
  if (j.contains("strategy")) {
    d.strategy = j.at("strategy").get<StrategySpec>();
  }
  d.user_id = j.value("user_id", "anonymous");
  d.priority = j.value("priority", kPriorityMedium);
  d.verify = j.value("verify", true);
  d.created_at = j.value("created_at", std::int64_t{0});
  if (auto it = j.find("scheduled_at"); it != j.end() && !it->is_null()) {
    d.scheduled_at = it->get<std::int64_t>();
  } else {
    d.scheduled_at.reset();
  }
}

void to_json(json& j, const VerificationCode& v) {
  json params = json::array();
  for (const auto& [name, value] : v.parameters) {
    params.push_back({{"name", name}, {"value", value}});
  }
  j = {{"language", v.language}, {"code", v.code}, {"parameters", params}};
}

void from_json(const json& j, VerificationCode& v) {
  v.language = j.at("language").get<std::string>();
  v.code = j.at("code").get<std::string>();
  v.parameters.clear();
  if (auto it = j.find("parameters"); it != j.end()) {
    if (it->is_array()) {
      for (const auto& p : *it) {
        v.parameters.emplace_back(p.at("name").get<std::string>(),
                                  p.at("value").get<std::string>());
      }
    } else if (it->is_object()) {
      for (const auto& [name, value] : it->items()) {
        v.parameters.emplace_back(
            name, value.is_string() ? value.get<std::string>() : value.dump());
      }
    }
  }
}

void to_json(json& j, const Finding& f) {
  j = {{"id", f.id.str()},
       {"type", f.type},
       {"title", f.title},
       {"description", f.description},
       {"severity", std::string(severity_name(f.severity))},
       {"source", f.source},
       {"evidence", f.evidence},
       {"verified", f.verified},
       {"confirmed", f.confirmed},
       {"reliability_score", f.reliability_score},
       {"verification_output", f.verification_output}};
  if (f.verification) {
    j["verification"] = *f.verification;
  }
}

void from_json(const json& j, Finding& f) {
  f.id = FindingId{j.at("id").get<std::string>()};
  f.type = j.value("type", "");
  f.title = j.value("title", "");
  f.description = j.value("description", "");
  f.severity = parse_severity(j.value("severity", "info"));
  f.source = j.value("source", "");
  f.evidence = j.value("evidence", json::object());
  f.verified = j.value("verified", false);
  f.confirmed = j.value("confirmed", false);
  f.reliability_score = j.value("reliability_score", 0);
  f.verification_output = j.value("verification_output", "");
  if (auto it = j.find("verification"); it != j.end() && !it->is_null()) {
    f.verification = it->get<VerificationCode>();
  } else {
    f.verification.reset();
  }
}

void to_json(json& j, const LogEntry& l) {
  j = {{"seq", l.seq},
       {"timestamp", l.timestamp},
       {"time", format_timestamp(l.timestamp)},
       {"level", std::string(log_level_name(l.level))},
       {"message", l.message}};
}

void from_json(const json& j, LogEntry& l) {
  l.seq = j.at("seq").get<std::int64_t>();
  l.timestamp = j.value("timestamp", std::int64_t{0});
  l.level = parse_log_level(j.value("level", "info"));
  l.message = j.value("message", "");
}

auto record_to_json(const ExecutionRecord& rec, std::size_t max_logs) -> json {
  json logs = json::array();
  auto skip = rec.logs.size() > max_logs ? rec.logs.size() - max_logs : 0;
  for (auto i = skip; i < rec.logs.size(); ++i) {
    logs.push_back(rec.logs[i]);
  }

  json j = {{"job_id", rec.job_id.str()},
            {"task_id", rec.task_id.str()},
            {"status", std::string(status_name(rec.status))},
            {"progress", rec.progress},
            {"stage", rec.stage},
            {"created_at", rec.created_at},
            {"started_at", rec.started_at},
            {"completed_at", rec.completed_at},
            {"findings", findings_to_json(rec.findings)},
            {"logs", std::move(logs)},
            {"attempt", rec.attempt}};
  j["error"] = rec.error.empty() ? json(nullptr) : json(rec.error);
  j["report_path"] =
      rec.report_path.empty() ? json(nullptr) : json(rec.report_path);
  return j;
}

auto findings_to_json(const std::vector<Finding>& findings) -> json {
  json arr = json::array();
  for (const auto& f : findings) {
    arr.push_back(f);
  }
  return arr;
}

auto findings_from_json(const json& j) -> std::vector<Finding> {
  std::vector<Finding> findings;
  if (!j.is_array()) {
    return findings;
  }
  findings.reserve(j.size());
  for (const auto& item : j) {
    findings.push_back(item.get<Finding>());
  }
  return findings;
}

}  // namespace vigil
