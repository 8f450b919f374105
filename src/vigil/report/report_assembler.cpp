#include "vigil/report/report_assembler.hpp"

#include "vigil/task/json_codec.hpp"
#include "vigil/task/state_strings.hpp"
#include "vigil/util/log.hpp"
#include "vigil/util/util.hpp"

#include <filesystem>
#include <format>
#include <fstream>

namespace vigil {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

auto html_escape(std::string_view in) -> std::string {
  std::string out;
  out.reserve(in.size());
  for (char c : in) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&#39;"; break;
      default: out += c;
    }
  }
  return out;
}

auto text_of(const json& j, const char* key) -> std::string {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return {};
  }
  return it->is_string() ? it->get<std::string>() : it->dump();
}

}  // namespace

auto report_format_name(ReportFormat f) noexcept -> std::string_view {
  switch (f) {
    case ReportFormat::Json: return "json";
    case ReportFormat::Html: return "html";
    case ReportFormat::Pdf: return "pdf";
  }
  return "json";
}

auto parse_report_format(std::string_view s) -> std::optional<ReportFormat> {
  if (s == "json") return ReportFormat::Json;
  if (s == "html") return ReportFormat::Html;
  if (s == "pdf") return ReportFormat::Pdf;
  return std::nullopt;
}

FileReportAssembler::FileReportAssembler(std::string directory)
    : directory_(std::move(directory)) {
}

auto FileReportAssembler::render(const TaskDefinition& def,
                                 const ExecutionRecord& rec) -> json {
  json by_severity = json::object();
  int verified = 0;
  int confirmed = 0;
  for (const auto& f : rec.findings) {
    auto key = std::string(severity_name(f.severity));
    by_severity[key] = by_severity.value(key, 0) + 1;
    verified += f.verified ? 1 : 0;
    confirmed += f.confirmed ? 1 : 0;
  }

  return json{
      {"task", def},
      {"job",
       {{"job_id", rec.job_id.str()},
        {"status", std::string(status_name(rec.status))},
        {"started_at", format_timestamp(rec.started_at)},
        {"completed_at", format_timestamp(rec.completed_at)}}},
      {"summary",
       {{"total", rec.findings.size()},
        {"by_severity", std::move(by_severity)},
        {"verified", verified},
        {"confirmed", confirmed}}},
      {"findings", findings_to_json(rec.findings)},
      {"generated_at", format_timestamp()},
  };
}

auto FileReportAssembler::render_html(const json& report) -> std::string {
  const auto& task = report["task"];
  std::string rows;
  for (const auto& f : report["findings"]) {
    rows += std::format(
        "<tr><td>{}</td><td>{}</td><td>{}</td><td>{}</td><td>{}</td></tr>\n",
        html_escape(text_of(f, "severity")), html_escape(text_of(f, "type")),
        html_escape(text_of(f, "title")), html_escape(text_of(f, "source")),
        f.value("confirmed", false) ? "yes" : "no");
  }
  return std::format(
      "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\">"
      "<title>{0}</title></head>\n<body>\n<h1>{0}</h1>\n"
      "<p>Target: {1}</p>\n<p>Generated: {2}</p>\n<p>Findings: {3}</p>\n"
      "<table border=\"1\">\n<tr><th>Severity</th><th>Type</th><th>Title</th>"
      "<th>Source</th><th>Confirmed</th></tr>\n{4}</table>\n</body></html>\n",
      html_escape(text_of(task, "name")), html_escape(text_of(task, "target")),
      html_escape(text_of(report, "generated_at")),
      report["summary"].value("total", 0), rows);
}

auto FileReportAssembler::assemble(const TaskDefinition& def,
                                   const ExecutionRecord& rec,
                                   ReportFormat format)
    -> Result<ReportArtifact> {
  if (format == ReportFormat::Pdf) {
    return fail(Error::NotSupported);
  }

  std::error_code ec;
  fs::create_directories(directory_, ec);
  if (ec) {
    log::error("Cannot create report directory {}: {}", directory_,
               ec.message());
    return fail(Error::FileOpenFailed);
  }

  auto report = render(def, rec);
  auto path = fs::path(directory_) /
              std::format("report_{}_{}.{}", rec.job_id.value(), now_ms(),
                          report_format_name(format));

  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    log::error("Cannot open report file {}", path.string());
    return fail(Error::FileOpenFailed);
  }
  if (format == ReportFormat::Html) {
    out << render_html(report);
  } else {
    out << report.dump(2);
  }
  out.close();
  if (!out) {
    return fail(Error::FileOpenFailed);
  }

  ReportArtifact artifact{.path = path.string(),
                          .format = format,
                          .size = fs::file_size(path, ec)};
  log::info("Report for job {} written to {} ({} bytes)", rec.job_id,
            artifact.path, artifact.size);
  return artifact;
}

}  // namespace vigil
