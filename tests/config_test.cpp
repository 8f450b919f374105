#include "vigil/config/config.hpp"
#include "vigil/tools/tool_spec.hpp"

#include <fstream>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace vigil;

TEST(ConfigTest, Defaults) {
  SystemConfig config;

  EXPECT_EQ(config.storage.db_file, "vigil.db");
  EXPECT_EQ(config.scheduler.max_concurrency, 5);
  EXPECT_EQ(config.scheduler.retry.max_attempts, 3);
  EXPECT_EQ(config.scheduler.retry.backoff_ms, 2000);
  EXPECT_EQ(config.api.port, 3001);
  EXPECT_TRUE(config.api.enabled);
  EXPECT_EQ(config.sandbox.default_timeout, std::chrono::seconds(30));
  EXPECT_EQ(config.sandbox.runtimes.at("python"), "python3");
  EXPECT_EQ(config.reports.default_format, "json");
  EXPECT_TRUE(config.tools.empty());
}

TEST(ConfigTest, LoadFromString_ReadsEverySection) {
  constexpr auto yaml = R"(
storage:
  db_file: /var/lib/vigil/vigil.db
  busy_retries: 8
scheduler:
  log_level: debug
  max_concurrency: 2
  queue_capacity: 16
  retry:
    max_attempts: 5
    backoff_ms: 100
api:
  enabled: false
  port: 9000
  host: 0.0.0.0
sandbox:
  directory: /tmp/vigil-sandbox
  default_timeout: 10
  max_timeout: 60
  purge_after_run: false
  runtimes:
    ruby: ruby
reports:
  directory: /tmp/vigil-reports
  default_format: html
)";

  auto result = ConfigLoader::load_from_string(yaml);

  ASSERT_TRUE(result.has_value());
  const auto& c = *result;
  EXPECT_EQ(c.storage.db_file, "/var/lib/vigil/vigil.db");
  EXPECT_EQ(c.storage.busy_retries, 8);
  EXPECT_EQ(c.scheduler.log_level, "debug");
  EXPECT_EQ(c.scheduler.max_concurrency, 2);
  EXPECT_EQ(c.scheduler.queue_capacity, 16u);
  EXPECT_EQ(c.scheduler.retry.max_attempts, 5);
  EXPECT_EQ(c.scheduler.retry.backoff_ms, 100);
  EXPECT_FALSE(c.api.enabled);
  EXPECT_EQ(c.api.port, 9000);
  EXPECT_EQ(c.api.host, "0.0.0.0");
  EXPECT_EQ(c.sandbox.directory, "/tmp/vigil-sandbox");
  EXPECT_EQ(c.sandbox.default_timeout, std::chrono::seconds(10));
  EXPECT_EQ(c.sandbox.max_timeout, std::chrono::seconds(60));
  EXPECT_FALSE(c.sandbox.purge_after_run);
  EXPECT_EQ(c.sandbox.runtimes.at("ruby"), "ruby");
  EXPECT_EQ(c.sandbox.runtimes.at("bash"), "bash");
  EXPECT_EQ(c.reports.directory, "/tmp/vigil-reports");
  EXPECT_EQ(c.reports.default_format, "html");
}

TEST(ConfigTest, LoadFromString_PartialConfigKeepsDefaults) {
  auto result = ConfigLoader::load_from_string("api:\n  port: 4000\n");

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->api.port, 4000);
  EXPECT_EQ(result->api.host, "127.0.0.1");
  EXPECT_EQ(result->storage.db_file, "vigil.db");
}

TEST(ConfigTest, LoadFromString_ToolEntries) {
  constexpr auto yaml = R"(
tools:
  - name: whatweb
    command: /usr/bin/whatweb
    timeout: 120
    allowed_args: ["-a", "--color"]
    default_args: ["-a", "3"]
    output_format: json
  - name: nmap
    command: /opt/nmap/bin/nmap
    allowed_args: ["-sV"]
)";

  auto result = ConfigLoader::load_from_string(yaml);

  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->tools.size(), 2u);
  const auto& whatweb = result->tools[0];
  EXPECT_EQ(whatweb.name, "whatweb");
  EXPECT_EQ(whatweb.command, "/usr/bin/whatweb");
  EXPECT_EQ(whatweb.timeout, std::chrono::seconds(120));
  EXPECT_EQ(whatweb.allowed_args.size(), 2u);
  EXPECT_EQ(whatweb.default_args.size(), 2u);
  EXPECT_EQ(whatweb.output_format, OutputFormat::Json);
  EXPECT_EQ(result->tools[1].timeout, std::chrono::seconds(300));
}

TEST(ConfigTest, LoadFromString_ToolWithoutName_IsParseError) {
  auto result =
      ConfigLoader::load_from_string("tools:\n  - command: /bin/true\n");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadFromString_InvalidConcurrency_IsParseError) {
  auto result =
      ConfigLoader::load_from_string("scheduler:\n  max_concurrency: 0\n");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadFromString_SandboxMaxBelowDefault_IsParseError) {
  auto result = ConfigLoader::load_from_string(
      "sandbox:\n  default_timeout: 60\n  max_timeout: 30\n");

  EXPECT_FALSE(result.has_value());
}

TEST(ConfigTest, LoadFromString_Empty_IsParseError) {
  auto result = ConfigLoader::load_from_string("");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadFromString_Malformed_IsParseError) {
  auto result = ConfigLoader::load_from_string("api: [unclosed");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadFromFile_Missing_IsFileNotFound) {
  auto result = ConfigLoader::load_from_file("/nonexistent/vigil.yaml");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::FileNotFound));
}

TEST(ConfigTest, LoadFromFile_ReadsYaml) {
  test::TempDir dir;
  auto path = dir.file("vigil.yaml");
  {
    std::ofstream out(path);
    out << "storage:\n  db_file: from-file.db\n";
  }

  auto result = ConfigLoader::load_from_file(path);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->storage.db_file, "from-file.db");
}

TEST(ConfigTest, ToString_ReloadsToSameValues) {
  SystemConfig config;
  config.storage.db_file = "round.db";
  config.scheduler.max_concurrency = 7;
  config.api.port = 8123;
  config.sandbox.max_timeout = std::chrono::seconds(90);
  config.tools.push_back(ToolSpec{.name = "whatweb",
                                  .command = "whatweb",
                                  .allowed_args = {"-a"}});

  auto yaml = ConfigLoader::to_string(config);
  auto reloaded = ConfigLoader::load_from_string(yaml);

  ASSERT_TRUE(reloaded.has_value()) << yaml;
  EXPECT_EQ(reloaded->storage.db_file, "round.db");
  EXPECT_EQ(reloaded->scheduler.max_concurrency, 7);
  EXPECT_EQ(reloaded->api.port, 8123);
  EXPECT_EQ(reloaded->sandbox.max_timeout, std::chrono::seconds(90));
  ASSERT_EQ(reloaded->tools.size(), 1u);
  EXPECT_EQ(reloaded->tools[0].name, "whatweb");
}
