#include "vigil/cli/commands.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <print>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  std::println("Vigil - Security assessment task orchestrator");
  std::println("Usage: {} [OPTIONS]", prog);
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  --port <port>         API server port (default: 3001)");
  std::println("  --host <host>         API server host (default: 127.0.0.1)");
  std::println("  --db <file>           Database file (default: vigil.db)");
  std::println("  -d, --daemon          Run as daemon (needs scheduler.log_file)");
  std::println("  -l, --list            List all jobs and exit");
  std::println("  -s, --status <job>    Show one job with its recent logs");
  std::println("  --check-tools         Probe the configured scanners and exit");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} -c vigil.yaml               # serve", prog);
  std::println("  {} -c vigil.yaml --port 8080   # serve on another port", prog);
  std::println("  {} --db vigil.db -l            # inspect stored jobs", prog);
}

void print_version() {
  std::println("Vigil v0.1.0");
}

enum class Mode { Serve, List, Status, CheckTools };

struct Options {
  vigil::cli::Overrides overrides;
  Mode mode{Mode::Serve};
  std::string job_id;
  bool daemon{false};
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> const char* {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_port(std::string_view text) -> std::uint16_t {
  std::uint16_t port = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
  if (ec != std::errc{} || ptr != text.data() + text.size() || port == 0) {
    std::println(stderr, "Error: invalid port: {}", text);
    std::exit(1);
  }
  return port;
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.overrides.config_file = require_value(i, argc, argv, "--config");
    } else if (arg == "--port") {
      opts.overrides.port = parse_port(require_value(i, argc, argv, "--port"));
    } else if (arg == "--host") {
      opts.overrides.host = require_value(i, argc, argv, "--host");
    } else if (arg == "--db") {
      opts.overrides.db_file = require_value(i, argc, argv, "--db");
    } else if (arg == "-d" || arg == "--daemon") {
      opts.daemon = true;
    } else if (arg == "-l" || arg == "--list") {
      opts.mode = Mode::List;
    } else if (arg == "-s" || arg == "--status") {
      opts.mode = Mode::Status;
      opts.job_id = require_value(i, argc, argv, "--status");
    } else if (arg == "--check-tools") {
      opts.mode = Mode::CheckTools;
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  switch (opts.mode) {
    case Mode::List:
      return vigil::cli::cmd_list({.overrides = opts.overrides});
    case Mode::Status:
      return vigil::cli::cmd_status(
          {.overrides = opts.overrides, .job_id = opts.job_id});
    case Mode::CheckTools:
      return vigil::cli::cmd_check_tools({.overrides = opts.overrides});
    case Mode::Serve:
      break;
  }
  return vigil::cli::cmd_serve(
      {.overrides = opts.overrides, .daemon = opts.daemon});
}
