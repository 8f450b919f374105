#pragma once

#include "vigil/core/error.hpp"
#include "vigil/util/id.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vigil {

enum class Provider : std::uint8_t { OpenAI, Anthropic, Gemini };

struct ModelSpec {
  Provider provider{Provider::OpenAI};
  std::string model;

  [[nodiscard]] auto operator==(const ModelSpec&) const -> bool = default;
};

enum class Strategy : std::uint8_t { Comprehensive, Fast, Deep, Custom };

struct StrategySpec {
  Strategy kind{Strategy::Comprehensive};
  int depth{1};
  std::vector<std::string> scope;

  [[nodiscard]] auto operator==(const StrategySpec&) const -> bool = default;
};

inline constexpr int kPriorityLow = 1;
inline constexpr int kPriorityMedium = 2;
inline constexpr int kPriorityHigh = 3;
inline constexpr int kPriorityUrgent = 4;

struct TaskDefinition {
  TaskId task_id;
  std::string name;
  std::string target;
  ModelSpec model;
  std::vector<std::string> tools;
  StrategySpec strategy;
  std::string user_id{"anonymous"};
  int priority{kPriorityMedium};
  std::optional<std::int64_t> scheduled_at;
  bool verify{true};
  std::int64_t created_at{0};

  [[nodiscard]] auto operator==(const TaskDefinition&) const -> bool = default;
};

// Checks the fields a submission must carry. Nothing is created when this
// fails.
[[nodiscard]] auto validate_definition(const TaskDefinition& def)
    -> Result<void>;

// Compatibility shim for submissions that only name a model. Recognised
// prefixes: gpt/o1/o3/chatgpt, claude, gemini.
[[nodiscard]] auto infer_provider(std::string_view model)
    -> std::optional<Provider>;

// "low|medium|high|urgent" -> 1..4
[[nodiscard]] auto parse_priority(std::string_view name) -> std::optional<int>;
[[nodiscard]] auto priority_name(int priority) -> std::string_view;

[[nodiscard]] auto contains_shell_metachar(std::string_view s) noexcept
    -> bool;

}  // namespace vigil
