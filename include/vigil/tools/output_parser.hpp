#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>

namespace vigil {

// Best-effort structured extraction. Returns nullopt when the tool has no
// parser or the parser failed; callers then fall back to the raw text.
[[nodiscard]] auto parse_tool_output(std::string_view tool,
                                     std::string_view raw)
    -> std::optional<nlohmann::json>;

// Per-tool parsers; each returns an object even when nothing matched.
[[nodiscard]] auto parse_nmap(std::string_view raw) -> nlohmann::json;
[[nodiscard]] auto parse_sqlmap(std::string_view raw) -> nlohmann::json;
[[nodiscard]] auto parse_nikto(std::string_view raw) -> nlohmann::json;
[[nodiscard]] auto parse_dirb(std::string_view raw) -> nlohmann::json;

}  // namespace vigil
