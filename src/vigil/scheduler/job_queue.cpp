#include "vigil/scheduler/job_queue.hpp"

#include "vigil/util/util.hpp"

#include <algorithm>
#include <chrono>

namespace vigil {

PriorityJobQueue::PriorityJobQueue(std::size_t capacity)
    : capacity_(capacity) {
}

auto PriorityJobQueue::push(QueuedJob job) -> Result<void> {
  {
    std::lock_guard lock(mu_);
    if (closed_ || entries_.size() >= capacity_) {
      return fail(Error::QueueUnavailable);
    }
    entries_.insert(Entry{std::move(job), next_seq_++});
  }
  cv_.notify_one();
  return ok();
}

auto PriorityJobQueue::pop() -> std::optional<QueuedJob> {
  std::unique_lock lock(mu_);
  while (true) {
    if (closed_) {
      return std::nullopt;
    }
    auto now = now_ms();
    std::int64_t earliest = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
      if (it->job.not_before <= now) {
        auto job = std::move(entries_.extract(it).value().job);
        return job;
      }
      if (earliest == 0 || it->job.not_before < earliest) {
        earliest = it->job.not_before;
      }
    }
    if (earliest == 0) {
      cv_.wait(lock);
    } else {
      cv_.wait_for(lock, std::chrono::milliseconds(earliest - now));
    }
  }
}

auto PriorityJobQueue::remove(const JobId& job_id) -> bool {
  std::lock_guard lock(mu_);
  auto it = std::ranges::find_if(
      entries_, [&](const Entry& e) { return e.job.job_id == job_id; });
  if (it == entries_.end()) {
    return false;
  }
  entries_.erase(it);
  return true;
}

auto PriorityJobQueue::close() -> void {
  {
    std::lock_guard lock(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

auto PriorityJobQueue::stats() const -> QueueStats {
  std::lock_guard lock(mu_);
  QueueStats stats;
  auto now = now_ms();
  for (const auto& e : entries_) {
    if (e.job.not_before > now) {
      ++stats.delayed;
    } else {
      ++stats.waiting;
    }
  }
  return stats;
}

auto PriorityJobQueue::size() const -> std::size_t {
  std::lock_guard lock(mu_);
  return entries_.size();
}

auto PriorityJobQueue::is_closed() const -> bool {
  std::lock_guard lock(mu_);
  return closed_;
}

}  // namespace vigil
