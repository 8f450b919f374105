#include "vigil/report/report_assembler.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace vigil;
using json = nlohmann::json;
namespace fs = std::filesystem;

class ReportAssemblerTest : public ::testing::Test {
protected:
  void SetUp() override {
    def_ = test::make_definition("quarterly <audit>", "https://shop.test");
    def_.task_id = test::task_id("task-r");

    rec_.job_id = test::job_id("job-r");
    rec_.task_id = def_.task_id;
    rec_.status = ExecutionStatus::Completed;
    rec_.started_at = 1'700'000'000'000;
    rec_.completed_at = 1'700'000'060'000;

    auto high = test::make_finding("sqlmap-1", "sql_injection", Severity::High);
    high.verified = true;
    high.confirmed = true;
    high.reliability_score = 80;
    auto info = test::make_finding("nmap-1", "open_port", Severity::Info);
    info.title = "<script>alert(1)</script>";
    auto info2 = test::make_finding("nmap-2", "open_port", Severity::Info);
    rec_.findings = {high, info, info2};
  }

  static auto read_file(const std::string& path) -> std::string {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
  }

  test::TempDir dir_{"vigil_reports"};
  TaskDefinition def_;
  ExecutionRecord rec_;
};

TEST_F(ReportAssemblerTest, Render_SummarisesFindings) {
  FileReportAssembler assembler(dir_.path());

  auto report = assembler.render(def_, rec_);

  EXPECT_EQ(report["task"]["name"], "quarterly <audit>");
  EXPECT_EQ(report["job"]["job_id"], "job-r");
  EXPECT_EQ(report["job"]["status"], "completed");
  EXPECT_EQ(report["summary"]["total"], 3);
  EXPECT_EQ(report["summary"]["by_severity"]["info"], 2);
  EXPECT_EQ(report["summary"]["by_severity"]["high"], 1);
  EXPECT_EQ(report["summary"]["verified"], 1);
  EXPECT_EQ(report["summary"]["confirmed"], 1);
  ASSERT_TRUE(report["findings"].is_array());
  EXPECT_EQ(report["findings"].size(), 3u);
  EXPECT_TRUE(report.contains("generated_at"));
}

TEST_F(ReportAssemblerTest, AssembleJson_WritesParsableFile) {
  FileReportAssembler assembler(dir_.file("nested/reports"));

  auto artifact = assembler.assemble(def_, rec_, ReportFormat::Json);

  ASSERT_TRUE(artifact.has_value());
  EXPECT_EQ(artifact->format, ReportFormat::Json);
  EXPECT_TRUE(fs::exists(artifact->path));
  EXPECT_GT(artifact->size, 0u);
  auto filename = fs::path(artifact->path).filename().string();
  EXPECT_TRUE(filename.starts_with("report_job-r_"));
  EXPECT_TRUE(filename.ends_with(".json"));

  auto parsed = json::parse(read_file(artifact->path));
  EXPECT_EQ(parsed["findings"].size(), 3u);
  EXPECT_EQ(parsed["findings"][0]["id"], "sqlmap-1");
}

TEST_F(ReportAssemblerTest, AssembleHtml_EscapesContent) {
  FileReportAssembler assembler(dir_.path());

  auto artifact = assembler.assemble(def_, rec_, ReportFormat::Html);

  ASSERT_TRUE(artifact.has_value());
  auto html = read_file(artifact->path);
  EXPECT_NE(html.find("<!DOCTYPE html>"), std::string::npos);
  EXPECT_NE(html.find("quarterly &lt;audit&gt;"), std::string::npos);
  EXPECT_EQ(html.find("<script>"), std::string::npos);
  EXPECT_NE(html.find("&lt;script&gt;"), std::string::npos);
}

TEST_F(ReportAssemblerTest, AssemblePdf_NotSupported) {
  FileReportAssembler assembler(dir_.path());

  auto artifact = assembler.assemble(def_, rec_, ReportFormat::Pdf);

  ASSERT_FALSE(artifact.has_value());
  EXPECT_EQ(artifact.error(), make_error_code(Error::NotSupported));
  EXPECT_TRUE(fs::is_empty(dir_.path()));
}

TEST_F(ReportAssemblerTest, UnwritableDirectory_FailsCleanly) {
  auto blocker = dir_.file("blocker");
  { std::ofstream(blocker) << "x"; }
  FileReportAssembler assembler(blocker + "/sub");

  auto artifact = assembler.assemble(def_, rec_, ReportFormat::Json);

  ASSERT_FALSE(artifact.has_value());
  EXPECT_EQ(artifact.error(), make_error_code(Error::FileOpenFailed));
}

TEST(ReportFormatTest, ParseAndName) {
  EXPECT_EQ(parse_report_format("json"), ReportFormat::Json);
  EXPECT_EQ(parse_report_format("html"), ReportFormat::Html);
  EXPECT_EQ(parse_report_format("pdf"), ReportFormat::Pdf);
  EXPECT_FALSE(parse_report_format("docx").has_value());
  EXPECT_EQ(report_format_name(ReportFormat::Html), "html");
}
