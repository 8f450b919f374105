#pragma once

#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace vigil {

// Phantom type tags for type-safe ID disambiguation
struct TaskTag {};
struct JobTag {};
struct FindingTag {};

template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }
  [[nodiscard]] auto c_str() const -> const char* { return value_.c_str(); }

  [[nodiscard]] explicit operator std::string() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs,
                                        const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs,
                                       const TypedId& rhs) -> bool = default;

private:
  std::string value_;
};

// One assessment definition, immutable once accepted.
using TaskId = TypedId<TaskTag>;
// One execution attempt of a task.
using JobId = TypedId<JobTag>;
using FindingId = TypedId<FindingTag>;

// Sandbox directories are keyed by job and finding so two jobs never
// collide and a rerun of the same finding is refused.
inline auto make_verification_id(const JobId& job, const FindingId& finding)
    -> std::string {
  return std::format("{}_{}", job.value(), finding.value());
}

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id)
    -> std::ostream& {
  return os << id.value();
}

}  // namespace vigil

template <typename Tag>
struct std::hash<vigil::TypedId<Tag>> {
  auto operator()(const vigil::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<vigil::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const vigil::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
