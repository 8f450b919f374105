#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace vigil {

class TaskApi;

class ApiServer {
public:
  using RunningFn = std::function<bool()>;

  ApiServer(TaskApi& api, RunningFn is_running, uint16_t port = 3001,
            const std::string& host = "127.0.0.1");
  ~ApiServer();

  ApiServer(const ApiServer&) = delete;
  auto operator=(const ApiServer&) -> ApiServer& = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace vigil
