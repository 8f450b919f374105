#include "vigil/task/task_definition.hpp"

#include "vigil/util/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <span>

namespace vigil {

namespace {

constexpr std::array<std::string_view, 4> kOpenAIPrefixes = {"gpt", "o1", "o3",
                                                             "chatgpt"};

auto starts_with_any(std::string_view s, std::span<const std::string_view> p)
    -> bool {
  return std::ranges::any_of(p, [s](auto prefix) { return s.starts_with(prefix); });
}

}  // namespace

auto contains_shell_metachar(std::string_view s) noexcept -> bool {
  return s.find_first_of(";&|`$") != std::string_view::npos;
}

auto validate_definition(const TaskDefinition& def) -> Result<void> {
  if (def.name.empty()) {
    log::warn("Rejected submission: name is empty");
    return fail(Error::ValidationError);
  }
  if (def.target.empty()) {
    log::warn("Rejected submission '{}': target is empty", def.name);
    return fail(Error::ValidationError);
  }
  if (contains_shell_metachar(def.target) ||
      def.target.find_first_of("\n\r") != std::string::npos) {
    log::warn("Rejected submission '{}': target contains shell metacharacters",
              def.name);
    return fail(Error::ValidationError);
  }
  if (def.target.starts_with('-')) {
    log::warn("Rejected submission '{}': target looks like a flag", def.name);
    return fail(Error::ValidationError);
  }
  if (def.model.model.empty()) {
    log::warn("Rejected submission '{}': model is empty", def.name);
    return fail(Error::ValidationError);
  }
  if (def.priority < kPriorityLow || def.priority > kPriorityUrgent) {
    log::warn("Rejected submission '{}': priority {} out of range", def.name,
              def.priority);
    return fail(Error::ValidationError);
  }
  if (def.strategy.depth < 1) {
    return fail(Error::ValidationError);
  }
  return ok();
}

auto infer_provider(std::string_view model) -> std::optional<Provider> {
  std::string lowered(model);
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (starts_with_any(lowered, kOpenAIPrefixes)) {
    return Provider::OpenAI;
  }
  if (lowered.starts_with("claude")) {
    return Provider::Anthropic;
  }
  if (lowered.starts_with("gemini")) {
    return Provider::Gemini;
  }
  return std::nullopt;
}

auto parse_priority(std::string_view name) -> std::optional<int> {
  if (name == "low") return kPriorityLow;
  if (name == "medium") return kPriorityMedium;
  if (name == "high") return kPriorityHigh;
  if (name == "urgent") return kPriorityUrgent;
  return std::nullopt;
}

auto priority_name(int priority) -> std::string_view {
  switch (priority) {
    case kPriorityLow: return "low";
    case kPriorityMedium: return "medium";
    case kPriorityHigh: return "high";
    case kPriorityUrgent: return "urgent";
    default: return "medium";
  }
}

}  // namespace vigil
