#pragma once

#include "vigil/task/execution_record.hpp"
#include "vigil/task/task_definition.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <limits>

namespace vigil {

// nlohmann ADL hooks. Records use snake_case keys and epoch-millisecond
// timestamps; from_json throws nlohmann::json::exception on malformed input.
void to_json(nlohmann::json& j, const ModelSpec& m);
void from_json(const nlohmann::json& j, ModelSpec& m);
void to_json(nlohmann::json& j, const StrategySpec& s);
void from_json(const nlohmann::json& j, StrategySpec& s);
void to_json(nlohmann::json& j, const TaskDefinition& d);
void from_json(const nlohmann::json& j, TaskDefinition& d);
void to_json(nlohmann::json& j, const VerificationCode& v);
void from_json(const nlohmann::json& j, VerificationCode& v);
void to_json(nlohmann::json& j, const Finding& f);
void from_json(const nlohmann::json& j, Finding& f);
void to_json(nlohmann::json& j, const LogEntry& l);
void from_json(const nlohmann::json& j, LogEntry& l);

// Only the most recent max_logs entries are rendered.
[[nodiscard]] auto record_to_json(
    const ExecutionRecord& rec,
    std::size_t max_logs = std::numeric_limits<std::size_t>::max())
    -> nlohmann::json;

[[nodiscard]] auto findings_to_json(const std::vector<Finding>& findings)
    -> nlohmann::json;
[[nodiscard]] auto findings_from_json(const nlohmann::json& j)
    -> std::vector<Finding>;

}  // namespace vigil
