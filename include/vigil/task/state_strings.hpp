#pragma once

#include "vigil/task/execution_record.hpp"
#include "vigil/task/task_definition.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace vigil {

namespace detail {

constexpr std::array<std::string_view, 6> kStatusNames = {
    "pending", "running", "paused", "completed", "failed", "cancelled",
};

constexpr std::array<std::string_view, 4> kStrategyNames = {
    "comprehensive",
    "fast",
    "deep",
    "custom",
};

constexpr std::array<std::string_view, 3> kProviderNames = {
    "openai",
    "anthropic",
    "gemini",
};

constexpr std::array<std::string_view, 5> kSeverityNames = {
    "critical", "high", "medium", "low", "info",
};

constexpr std::array<std::string_view, 3> kLogLevelNames = {
    "info",
    "warn",
    "error",
};

template <typename Enum, std::size_t N>
[[nodiscard]] constexpr auto enum_name(
    const std::array<std::string_view, N>& names, Enum value,
    std::string_view fallback) noexcept -> std::string_view {
  auto idx = static_cast<std::size_t>(std::to_underlying(value));
  return idx < names.size() ? names[idx] : fallback;
}

template <typename Enum, std::size_t N>
[[nodiscard]] constexpr auto enum_parse(
    const std::array<std::string_view, N>& names, std::string_view name)
    -> std::optional<Enum> {
  auto it = std::ranges::find(names, name);
  if (it == names.end()) {
    return std::nullopt;
  }
  return static_cast<Enum>(std::ranges::distance(names.begin(), it));
}

}  // namespace detail

[[nodiscard]] inline auto status_name(ExecutionStatus s) noexcept
    -> std::string_view {
  return detail::enum_name(detail::kStatusNames, s, "unknown");
}

[[nodiscard]] inline auto parse_status(std::string_view name)
    -> std::optional<ExecutionStatus> {
  return detail::enum_parse<ExecutionStatus>(detail::kStatusNames, name);
}

[[nodiscard]] inline auto strategy_name(Strategy s) noexcept
    -> std::string_view {
  return detail::enum_name(detail::kStrategyNames, s, "comprehensive");
}

// "quick" is the submission-side alias for the fast strategy.
[[nodiscard]] inline auto parse_strategy(std::string_view name)
    -> std::optional<Strategy> {
  if (name == "quick") {
    return Strategy::Fast;
  }
  return detail::enum_parse<Strategy>(detail::kStrategyNames, name);
}

[[nodiscard]] inline auto provider_name(Provider p) noexcept
    -> std::string_view {
  return detail::enum_name(detail::kProviderNames, p, "unknown");
}

[[nodiscard]] inline auto parse_provider(std::string_view name)
    -> std::optional<Provider> {
  return detail::enum_parse<Provider>(detail::kProviderNames, name);
}

[[nodiscard]] inline auto severity_name(Severity s) noexcept
    -> std::string_view {
  return detail::enum_name(detail::kSeverityNames, s, "info");
}

[[nodiscard]] inline auto parse_severity(std::string_view name) -> Severity {
  return detail::enum_parse<Severity>(detail::kSeverityNames, name)
      .value_or(Severity::Info);
}

[[nodiscard]] inline auto log_level_name(LogLevel l) noexcept
    -> std::string_view {
  return detail::enum_name(detail::kLogLevelNames, l, "info");
}

[[nodiscard]] inline auto parse_log_level(std::string_view name) -> LogLevel {
  return detail::enum_parse<LogLevel>(detail::kLogLevelNames, name)
      .value_or(LogLevel::Info);
}

}  // namespace vigil
