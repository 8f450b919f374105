#include "vigil/sandbox/verification_generator.hpp"

#include <optional>
#include <string>

namespace vigil {

namespace {

// $1 = target, $2 = port
constexpr std::string_view kPortScript = R"(#!/usr/bin/env bash
host="${1#*://}"
host="${host%%/*}"
host="${host%%:*}"
if timeout 5 bash -c "exec 3<>/dev/tcp/${host}/$2" 2>/dev/null; then
  echo "VULNERABLE: port $2 open on ${host}"
else
  echo "port $2 closed on ${host}"
fi
)";

// $1 = target, $2 = url
constexpr std::string_view kPathScript = R"sh(#!/usr/bin/env bash
code=$(curl -s -o /dev/null -m 10 -w '%{http_code}' "$2")
if [ "$code" = "200" ]; then
  echo "VULNERABLE: $2 reachable (HTTP $code)"
else
  echo "$2 returned HTTP $code"
fi
)sh";

// argv[1] = target, argv[2] = injectable parameter
constexpr std::string_view kSqlInjectionScript = R"py(import sys
import urllib.error
import urllib.parse
import urllib.request

target = sys.argv[1]
parameter = sys.argv[2]
if "://" not in target:
    target = "http://" + target

payloads = ["'", "' OR '1'='1", "' OR 1=1--", "' UNION SELECT null--"]
signatures = [
    "SQL syntax",
    "mysql_fetch",
    "ORA-01756",
    "SQLite3::",
    "PostgreSQL query failed",
    "Unclosed quotation mark",
    "SQLSTATE",
]


def fetch(value):
    sep = "&" if urllib.parse.urlsplit(target).query else "?"
    url = target + sep + urllib.parse.urlencode({parameter: value})
    try:
        with urllib.request.urlopen(url, timeout=10) as resp:
            return resp.read().decode("utf-8", "replace")
    except urllib.error.HTTPError as e:
        return e.read().decode("utf-8", "replace")
    except Exception as e:
        print(f"[-] request failed: {e}")
        return ""


baseline = fetch("1")
for payload in payloads:
    body = fetch(payload)
    for sig in signatures:
        if sig in body and sig not in baseline:
            print(f"[+] SQL error '{sig}' for parameter {parameter} with payload {payload!r}")
            sys.exit(0)
print(f"[-] no SQL error signature for parameter {parameter}")
)py";

// argv[1] = target, argv[2] = url or path reported by the tool
constexpr std::string_view kHttpScript = R"py(import sys
import urllib.error
import urllib.parse
import urllib.request

target = sys.argv[1]
location = sys.argv[2]
if "://" not in target:
    target = "http://" + target
if "://" in location:
    url = location
else:
    url = urllib.parse.urljoin(target.rstrip("/") + "/", location.lstrip("/"))

try:
    with urllib.request.urlopen(url, timeout=10) as resp:
        code = resp.status
except urllib.error.HTTPError as e:
    code = e.code
except Exception as e:
    print(f"[-] {url} unreachable: {e}")
    sys.exit(1)

if code < 400:
    print(f"[+] {url} responded HTTP {code}")
else:
    print(f"[-] {url} responded HTTP {code}")
)py";

auto string_evidence(const Finding& finding, const char* key)
    -> std::optional<std::string> {
  auto it = finding.evidence.find(key);
  if (it == finding.evidence.end() || !it->is_string() ||
      it->get<std::string>().empty()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

}  // namespace

auto TemplateVerificationGenerator::generate(const Finding& finding,
                                             std::string_view /*target*/)
    -> std::optional<VerificationCode> {
  if (finding.type == "open_port") {
    auto port = finding.evidence.find("port");
    if (port == finding.evidence.end() || !port->is_number_integer()) {
      return std::nullopt;
    }
    return VerificationCode{
        .language = "bash",
        .code = std::string(kPortScript),
        .parameters = {{"port", std::to_string(port->get<int>())}}};
  }
  if (finding.type == "exposed_path") {
    auto url = finding.evidence.find("url");
    if (url == finding.evidence.end() || !url->is_string()) {
      return std::nullopt;
    }
    return VerificationCode{.language = "bash",
                            .code = std::string(kPathScript),
                            .parameters = {{"url", url->get<std::string>()}}};
  }
  if (finding.type == "sql_injection") {
    auto parameter = string_evidence(finding, "parameter");
    if (!parameter || *parameter == "unknown") {
      return std::nullopt;
    }
    return VerificationCode{.language = "python",
                            .code = std::string(kSqlInjectionScript),
                            .parameters = {{"parameter", *parameter}}};
  }

  // Anything else that points at a web location gets a reachability check
  auto location = string_evidence(finding, "url");
  if (!location) {
    location = string_evidence(finding, "path");
  }
  if (!location) {
    return std::nullopt;
  }
  return VerificationCode{.language = "python",
                          .code = std::string(kHttpScript),
                          .parameters = {{"location", *location}}};
}

}  // namespace vigil
