#include "load.hpp"

#include "vigil/app/application.hpp"
#include "vigil/cli/commands.hpp"
#include "vigil/util/daemon.hpp"
#include "vigil/util/log.hpp"

#include <print>

namespace vigil::cli {

auto cmd_serve(const ServeOptions& opts) -> int {
  auto result = load_config(opts.overrides);
  if (!result) {
    std::println(stderr, "Error: Failed to load config: {}",
                 result.error().message());
    return 1;
  }
  auto config = std::move(*result);

  const auto& log_file = config.scheduler.log_file;
  if (opts.daemon && log_file.empty()) {
    std::println(stderr,
                 "Error: --daemon requires scheduler.log_file in the config");
    return 1;
  }
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }

  if (opts.daemon && !daemonize()) {
    std::println(stderr, "Error: Failed to daemonize");
    return 1;
  }

  log::set_level(config.scheduler.log_level);
  log::start();

  PidFile pid_file;
  if (!config.scheduler.pid_file.empty()) {
    if (auto r = pid_file.write(config.scheduler.pid_file); !r) {
      log::error("Failed to write pid file {}: {}", config.scheduler.pid_file,
                 r.error().message());
      log::stop();
      return 1;
    }
  }

  Application app(std::move(config));

  if (auto r = app.init(); !r) {
    log::error("Initialization failed: {}", r.error().message());
    log::stop();
    return 1;
  }

  setup_signal_handlers();

  if (auto r = app.recover_from_crash(); !r) {
    log::warn("Recovery failed: {}", r.error().message());
  }

  const auto& cfg = app.config();
  if (cfg.api.enabled) {
    log::info("Vigil starting on {}:{}...", cfg.api.host, cfg.api.port);
  } else {
    log::info("Vigil starting (scheduler only)...");
  }
  app.start();

  wait_for_shutdown();
  log::info("Received shutdown signal, stopping...");
  app.stop();

  log::info("Vigil stopped.");
  log::stop();
  return 0;
}

}  // namespace vigil::cli
