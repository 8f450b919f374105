#include "vigil/tools/output_parser.hpp"

#include "gtest/gtest.h"

using namespace vigil;

TEST(OutputParserTest, Nmap_ExtractsPortsHostAndOs) {
  constexpr auto raw =
      "Nmap scan report for scanme.nmap.org (45.33.32.156)\n"
      "PORT      STATE    SERVICE VERSION\r\n"
      "22/tcp    open     ssh     OpenSSH 6.6.1p1 Ubuntu\n"
      "53/udp    open|filtered domain\n"
      "9929/tcp  filtered nping-echo\n"
      "OS details: Linux 4.15 - 5.6\n";

  auto result = parse_nmap(raw);

  EXPECT_EQ(result["host"], "scanme.nmap.org (45.33.32.156)");
  EXPECT_EQ(result["os"], "Linux 4.15 - 5.6");
  const auto& ports = result["ports"];
  ASSERT_EQ(ports.size(), 3u);
  EXPECT_EQ(ports[0]["port"], 22);
  EXPECT_EQ(ports[0]["protocol"], "tcp");
  EXPECT_EQ(ports[0]["version"], "OpenSSH 6.6.1p1 Ubuntu");
  EXPECT_EQ(ports[1]["protocol"], "udp");
  EXPECT_EQ(ports[1]["state"], "open|filtered");
  EXPECT_FALSE(ports[2].contains("version"));
}

TEST(OutputParserTest, Nmap_NoPorts_ReturnsEmptyArray) {
  auto result = parse_nmap("Note: Host seems down.\n");

  ASSERT_TRUE(result["ports"].is_array());
  EXPECT_TRUE(result["ports"].empty());
  EXPECT_FALSE(result.contains("host"));
}

TEST(OutputParserTest, Sqlmap_VulnerableParametersAndDatabases) {
  constexpr auto raw =
      "[INFO] GET parameter 'id' is vulnerable.\n"
      "---\n"
      "Parameter: id (GET)\n"
      "    Type: boolean-based blind\n"
      "---\n"
      "available databases [2]:\n"
      "[*] information_schema\n"
      "[*] shop\n"
      "\n"
      "[*] ending\n";

  auto result = parse_sqlmap(raw);

  EXPECT_TRUE(result["vulnerable"]);
  ASSERT_EQ(result["parameters"].size(), 1u);
  EXPECT_EQ(result["parameters"][0]["parameter"], "id");
  EXPECT_EQ(result["parameters"][0]["place"], "GET");
  ASSERT_EQ(result["databases"].size(), 2u);
  EXPECT_EQ(result["databases"][1], "shop");
}

TEST(OutputParserTest, Sqlmap_CleanTarget_NotVulnerable) {
  auto result = parse_sqlmap(
      "[WARNING] all tested parameters do not appear to be injectable\n"
      "Parameter: q (GET)\n");

  EXPECT_FALSE(result["vulnerable"]);
  EXPECT_TRUE(result["parameters"].empty());

  auto banner_only = parse_sqlmap("[INFO] GET parameter 'id' is vulnerable\n");
  EXPECT_FALSE(banner_only["vulnerable"]);
}

TEST(OutputParserTest, Nikto_SkipsMetadataKeepsItems) {
  constexpr auto raw =
      "+ Target IP:          10.0.0.5\n"
      "+ Target Hostname:    intranet\n"
      "+ Target Port:        80\n"
      "+ Server: Apache/2.4.41 (Ubuntu)\n"
      "+ /admin/: Admin login page found.\n"
      "+ /phpinfo.php: Output from the phpinfo() function was found.\n";

  auto result = parse_nikto(raw);

  EXPECT_EQ(result["server"], "Apache/2.4.41 (Ubuntu)");
  ASSERT_EQ(result["items"].size(), 2u);
  EXPECT_EQ(result["items"][0]["path"], "/admin/");
  EXPECT_EQ(result["items"][1]["description"],
            "Output from the phpinfo() function was found.");
}

TEST(OutputParserTest, Dirb_SplitsDirectoriesAndFiles) {
  constexpr auto raw =
      "---- Scanning URL: http://target/ ----\n"
      "==> DIRECTORY: http://target/images/\n"
      "+ http://target/admin/ (CODE:403|SIZE:277)\n"
      "+ http://target/index.php (CODE:200|SIZE:1024)\n";

  auto result = parse_dirb(raw);

  ASSERT_EQ(result["directories"].size(), 2u);
  EXPECT_EQ(result["directories"][0]["url"], "http://target/images/");
  EXPECT_EQ(result["directories"][1]["info"], "CODE:403|SIZE:277");
  ASSERT_EQ(result["files"].size(), 1u);
  EXPECT_EQ(result["files"][0]["url"], "http://target/index.php");
}

TEST(OutputParserTest, ParseToolOutput_UnknownTool_IsNullopt) {
  EXPECT_FALSE(parse_tool_output("whatweb", "anything").has_value());
  EXPECT_TRUE(parse_tool_output("dirb", "").has_value());
}
