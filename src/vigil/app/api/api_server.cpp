#include "vigil/app/api/api_server.hpp"

#include "vigil/app/api/task_api.hpp"
#include "vigil/util/log.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

#include <crow.h>

namespace vigil {

namespace {

auto to_response(const ApiResponse& r) -> crow::response {
  crow::response resp(r.status, r.body.dump());
  resp.set_header("Content-Type", "application/json");
  return resp;
}

}  // namespace

struct ApiServer::Impl {
  TaskApi& api;
  RunningFn app_running;
  uint16_t port;
  std::string host;

  std::unique_ptr<crow::SimpleApp> crow_app;
  std::thread server_thread;
  std::atomic<bool> running{false};

  Impl(TaskApi& a, RunningFn r, uint16_t p, const std::string& h)
      : api(a), app_running(std::move(r)), port(p), host(h) {
  }

  auto setup_routes() -> void;
};

ApiServer::ApiServer(TaskApi& api, RunningFn is_running, uint16_t port,
                     const std::string& host)
    : impl_(std::make_unique<Impl>(api, std::move(is_running), port, host)) {
}

ApiServer::~ApiServer() {
  stop();
}

auto ApiServer::start() -> void {
  if (impl_->running.exchange(true)) {
    return;
  }

  impl_->crow_app = std::make_unique<crow::SimpleApp>();
  impl_->crow_app->loglevel(crow::LogLevel::Warning);
  impl_->setup_routes();
  impl_->crow_app->signal_clear();

  impl_->server_thread = std::thread([this]() {
    log::info("API server starting on {}:{}", impl_->host, impl_->port);
    impl_->crow_app->bindaddr(impl_->host)
        .port(impl_->port)
        .multithreaded()
        .run();
  });
}

auto ApiServer::stop() -> void {
  if (!impl_->running.exchange(false)) {
    return;
  }

  log::info("Stopping API server...");

  if (impl_->crow_app) {
    impl_->crow_app->stop();
  }

  if (impl_->server_thread.joinable()) {
    auto future = std::async(std::launch::async,
                             [this]() { impl_->server_thread.join(); });

    if (future.wait_for(std::chrono::seconds(3)) ==
        std::future_status::timeout) {
      log::warn("API server thread did not stop in time, detaching...");
      impl_->server_thread.detach();
    }
  }

  log::info("API server stopped");
}

auto ApiServer::is_running() const noexcept -> bool {
  return impl_->running.load();
}

auto ApiServer::Impl::setup_routes() -> void {
  CROW_ROUTE((*crow_app), "/api/health")
  ([this]() { return to_response(api.health(app_running && app_running())); });

  CROW_ROUTE((*crow_app), "/api/tasks")
  ([this]() { return to_response(api.list()); });

  CROW_ROUTE((*crow_app), "/api/tasks")
      .methods(crow::HTTPMethod::POST)([this](const crow::request& req) {
        return to_response(api.submit(req.body));
      });

  CROW_ROUTE((*crow_app), "/api/tasks/<string>")
  ([this](const std::string& job_id) { return to_response(api.get(job_id)); });

  CROW_ROUTE((*crow_app), "/api/tasks/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const std::string& job_id) {
        return to_response(api.cancel(job_id));
      });

  CROW_ROUTE((*crow_app), "/api/tasks/<string>/logs")
  ([this](const std::string& job_id) {
    return to_response(api.logs(job_id));
  });

  CROW_ROUTE((*crow_app), "/api/tasks/<string>/pause")
      .methods(crow::HTTPMethod::POST)([this](const std::string& job_id) {
        return to_response(api.pause(job_id));
      });

  CROW_ROUTE((*crow_app), "/api/tasks/<string>/resume")
      .methods(crow::HTTPMethod::POST)([this](const std::string& job_id) {
        return to_response(api.resume(job_id));
      });

  CROW_ROUTE((*crow_app), "/api/tasks/<string>/report")
  ([this](const crow::request& req, const std::string& job_id) {
    const char* format = req.url_params.get("format");
    return to_response(api.report(job_id, format ? format : "json"));
  });

  CROW_ROUTE((*crow_app), "/api/definitions/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const std::string& task_id) {
        return to_response(api.delete_definition(task_id));
      });

  CROW_ROUTE((*crow_app), "/api/tools")
  ([this]() { return to_response(api.list_tools()); });

  CROW_ROUTE((*crow_app), "/api/tools")
      .methods(crow::HTTPMethod::POST)([this](const crow::request& req) {
        return to_response(api.add_tool(req.body));
      });

  CROW_ROUTE((*crow_app), "/api/tools/status")
  ([this]() { return to_response(api.tools_status()); });

  CROW_ROUTE((*crow_app), "/api/tools/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const std::string& name) {
        return to_response(api.remove_tool(name));
      });

  CROW_ROUTE((*crow_app), "/api/system/stats")
  ([this]() { return to_response(api.stats()); });
}

}  // namespace vigil
