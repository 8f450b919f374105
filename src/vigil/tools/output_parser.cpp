#include "vigil/tools/output_parser.hpp"

#include "vigil/util/log.hpp"

#include <algorithm>
#include <regex>
#include <string>
#include <vector>

namespace vigil {

using json = nlohmann::json;

namespace {

auto split_lines(std::string_view raw) -> std::vector<std::string> {
  std::vector<std::string> lines;
  std::size_t pos = 0;
  while (pos <= raw.size()) {
    auto end = raw.find('\n', pos);
    auto line = raw.substr(pos, end == std::string_view::npos
                                    ? std::string_view::npos
                                    : end - pos);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.emplace_back(line);
    if (end == std::string_view::npos) {
      break;
    }
    pos = end + 1;
  }
  return lines;
}

auto trim(std::string s) -> std::string {
  auto begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = s.find_last_not_of(" \t");
  return s.substr(begin, end - begin + 1);
}

}  // namespace

auto parse_nmap(std::string_view raw) -> json {
  static const std::regex port_re(
      R"(^(\d+)/(tcp|udp)\s+(open|closed|filtered|open\|filtered)\s+(\S+)(?:\s+(.+))?$)");
  static const std::regex host_re(R"(^Nmap scan report for (.+)$)");

  json ports = json::array();
  json result = json::object();
  for (const auto& line : split_lines(raw)) {
    std::smatch m;
    if (std::regex_match(line, m, port_re)) {
      json port = {{"port", std::stoi(m[1].str())},
                   {"protocol", m[2].str()},
                   {"state", m[3].str()},
                   {"service", m[4].str()}};
      if (m[5].matched) {
        port["version"] = trim(m[5].str());
      }
      ports.push_back(std::move(port));
    } else if (line.starts_with("OS details:")) {
      result["os"] = trim(line.substr(11));
    } else if (std::regex_match(line, m, host_re)) {
      result["host"] = trim(m[1].str());
    }
  }
  result["ports"] = std::move(ports);
  return result;
}

auto parse_sqlmap(std::string_view raw) -> json {
  static const std::regex param_re(R"(Parameter:\s+(.+?)\s+\((.+?)\))");
  static const std::regex db_re(R"(^\[\*\]\s+(\S+)$)");

  json result = {{"vulnerable", false},
                 {"parameters", json::array()},
                 {"databases", json::array()}};

  std::string text(raw);
  auto has = [&text](std::string_view needle) {
    return text.find(needle) != std::string::npos;
  };
  bool vulnerable =
      has("Parameter:") &&
      (has("is vulnerable") ||
       (has("injectable") && !has("do not appear to be injectable")));
  result["vulnerable"] = vulnerable;
  if (vulnerable) {
    for (std::sregex_iterator it(text.begin(), text.end(), param_re), end;
         it != end; ++it) {
      result["parameters"].push_back(
          {{"parameter", (*it)[1].str()}, {"place", (*it)[2].str()}});
    }
  }

  bool in_databases = false;
  for (const auto& line : split_lines(raw)) {
    if (line.starts_with("available databases")) {
      in_databases = true;
      continue;
    }
    if (!in_databases) {
      continue;
    }
    std::smatch m;
    if (std::regex_match(line, m, db_re)) {
      result["databases"].push_back(m[1].str());
    } else if (!line.empty()) {
      in_databases = false;
    }
  }
  return result;
}

auto parse_nikto(std::string_view raw) -> json {
  static const std::regex item_re(R"(^\+\s+(.+?):\s+(.+)$)");
  static const std::vector<std::string> kMetadata = {
      "Target IP", "Target Hostname", "Target Port", "Start Time",
      "End Time",  "Server"};

  json result = {{"items", json::array()}};
  for (const auto& line : split_lines(raw)) {
    std::smatch m;
    if (!std::regex_match(line, m, item_re)) {
      continue;
    }
    auto key = trim(m[1].str());
    auto value = trim(m[2].str());
    if (key == "Server") {
      result["server"] = value;
      continue;
    }
    if (std::ranges::find(kMetadata, key) != kMetadata.end()) {
      continue;
    }
    result["items"].push_back({{"path", key}, {"description", value}});
  }
  return result;
}

auto parse_dirb(std::string_view raw) -> json {
  static const std::regex file_re(R"(^\+\s+(https?://\S+)\s+\((.+?)\)$)");
  static const std::regex dir_re(R"(^==> DIRECTORY:\s+(https?://\S+)$)");

  json result = {{"directories", json::array()}, {"files", json::array()}};
  for (const auto& line : split_lines(raw)) {
    std::smatch m;
    if (std::regex_match(line, m, dir_re)) {
      result["directories"].push_back({{"url", m[1].str()}});
    } else if (std::regex_match(line, m, file_re)) {
      auto url = m[1].str();
      json entry = {{"url", url}, {"info", m[2].str()}};
      if (url.ends_with("/")) {
        result["directories"].push_back(std::move(entry));
      } else {
        result["files"].push_back(std::move(entry));
      }
    }
  }
  return result;
}

auto parse_tool_output(std::string_view tool, std::string_view raw)
    -> std::optional<json> {
  try {
    if (tool == "nmap") return parse_nmap(raw);
    if (tool == "sqlmap") return parse_sqlmap(raw);
    if (tool == "nikto") return parse_nikto(raw);
    if (tool == "dirb") return parse_dirb(raw);
  } catch (const std::exception& e) {
    log::warn("Failed to parse {} output: {}", tool, e.what());
  }
  return std::nullopt;
}

}  // namespace vigil
