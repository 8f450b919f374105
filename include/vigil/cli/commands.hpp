#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace vigil::cli {

// Command-line values that override the config file when set
struct Overrides {
  std::string config_file;
  std::optional<std::string> db_file;
  std::optional<std::string> host;
  std::optional<std::uint16_t> port;
};

struct ServeOptions {
  Overrides overrides;
  bool daemon{false};
};

struct ListOptions {
  Overrides overrides;
};

struct StatusOptions {
  Overrides overrides;
  std::string job_id;
};

struct CheckToolsOptions {
  Overrides overrides;
};

[[nodiscard]] auto cmd_serve(const ServeOptions& opts) -> int;
[[nodiscard]] auto cmd_list(const ListOptions& opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions& opts) -> int;
[[nodiscard]] auto cmd_check_tools(const CheckToolsOptions& opts) -> int;

}  // namespace vigil::cli
