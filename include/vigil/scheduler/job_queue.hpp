#pragma once

#include "vigil/core/error.hpp"
#include "vigil/util/id.hpp"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>

namespace vigil {

struct QueuedJob {
  JobId job_id;
  TaskId task_id;
  int priority{2};
  // Epoch ms before which the job must not start; 0 = immediately
  std::int64_t not_before{0};
  int attempt{1};
};

struct QueueStats {
  std::size_t waiting{0};
  std::size_t delayed{0};
};

class IJobQueue {
public:
  virtual ~IJobQueue() = default;

  // QueueUnavailable when closed or at capacity
  [[nodiscard]] virtual auto push(QueuedJob job) -> Result<void> = 0;
  // Blocks until a job is due; nullopt once the queue is closed.
  [[nodiscard]] virtual auto pop() -> std::optional<QueuedJob> = 0;
  virtual auto remove(const JobId& job_id) -> bool = 0;
  virtual auto close() -> void = 0;
  [[nodiscard]] virtual auto stats() const -> QueueStats = 0;
};

// Highest priority first, FIFO among equals; a job whose not_before lies in
// the future is skipped until it is due.
class PriorityJobQueue : public IJobQueue {
public:
  explicit PriorityJobQueue(std::size_t capacity = 1024);

  [[nodiscard]] auto push(QueuedJob job) -> Result<void> override;
  [[nodiscard]] auto pop() -> std::optional<QueuedJob> override;
  auto remove(const JobId& job_id) -> bool override;
  auto close() -> void override;
  [[nodiscard]] auto stats() const -> QueueStats override;

  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto is_closed() const -> bool;

private:
  struct Entry {
    QueuedJob job;
    std::uint64_t seq;

    [[nodiscard]] auto operator<(const Entry& other) const -> bool {
      if (job.priority != other.job.priority) {
        return job.priority > other.job.priority;
      }
      return seq < other.seq;
    }
  };

  std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::set<Entry> entries_;
  std::uint64_t next_seq_{0};
  bool closed_{false};
};

}  // namespace vigil
