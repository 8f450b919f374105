#pragma once

#include "vigil/core/error.hpp"
#include "vigil/scheduler/job_queue.hpp"
#include "vigil/scheduler/retry_policy.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <thread>
#include <vector>

namespace vigil {

struct PoolStats {
  std::size_t workers{0};
  std::size_t busy{0};
  std::uint64_t processed{0};
  std::uint64_t retried{0};
  std::uint64_t exhausted{0};
};

// Fixed set of threads draining an IJobQueue. Transient handler errors are
// pushed back with backoff; anything else, or the last attempt, goes to the
// exhausted callback.
class WorkerPool {
public:
  using Handler = std::function<Result<void>(const QueuedJob&)>;
  using ExhaustedCallback =
      std::function<void(const QueuedJob&, std::error_code)>;

  WorkerPool(std::size_t workers, IJobQueue& queue, Handler handler,
             RetryPolicy retry = {});
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  auto set_on_exhausted(ExhaustedCallback cb) -> void;

  auto start() -> void;
  // Closes the queue and joins every worker.
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load();
  }

  [[nodiscard]] auto stats() const -> PoolStats;

private:
  auto worker_loop() -> void;
  auto handle(const QueuedJob& job) -> void;

  std::size_t size_;
  IJobQueue& queue_;
  Handler handler_;
  RetryPolicy retry_;
  ExhaustedCallback on_exhausted_;
  std::vector<std::thread> threads_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> busy_{0};
  std::atomic<std::uint64_t> processed_{0};
  std::atomic<std::uint64_t> retried_{0};
  std::atomic<std::uint64_t> exhausted_{0};
};

}  // namespace vigil
