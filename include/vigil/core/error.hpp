#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace vigil {

enum class Error : int {
  Success,
  FileNotFound,
  FileOpenFailed,
  ParseError,
  DatabaseOpenFailed,
  PersistenceFailure,
  ValidationError,
  UnsafeArgument,
  DisallowedArgument,
  ExternalToolFailure,
  ChainExecutionFailure,
  SandboxExecutionFailure,
  UnsupportedLanguage,
  QueueUnavailable,
  NotSupported,
  InvalidTransition,
  NotFound,
  AlreadyExists,
  HasActiveRuns,
  Timeout,
  Cancelled,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "file not found",
      "failed to open file",
      "parse error",
      "failed to open database",
      "persistence failure",
      "validation error",
      "unsafe argument",
      "argument not allowed for tool",
      "external tool failure",
      "chain execution failure",
      "sandbox execution failure",
      "unsupported language",
      "queue unavailable",
      "not supported",
      "invalid state transition",
      "not found",
      "already exists",
      "task has active runs",
      "timeout",
      "cancelled",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "vigil";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages[idx]};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

// Errors the scheduler backend may retry; everything else is final.
[[nodiscard]] inline auto is_transient(std::error_code ec) noexcept -> bool {
  return ec == make_error_code(Error::PersistenceFailure) ||
         ec == make_error_code(Error::QueueUnavailable);
}

}  // namespace vigil

template <>
struct std::is_error_code_enum<vigil::Error> : std::true_type {};

namespace vigil {

struct StringHash {
  using is_transparent = void;

  [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
    return std::hash<std::string_view>{}(sv);
  }

  [[nodiscard]] std::size_t operator()(const std::string& s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }

  [[nodiscard]] std::size_t operator()(const char* s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }
};

using StringEqual = std::equal_to<>;

}  // namespace vigil
