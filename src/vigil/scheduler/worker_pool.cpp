#include "vigil/scheduler/worker_pool.hpp"

#include "vigil/util/log.hpp"
#include "vigil/util/util.hpp"

namespace vigil {

WorkerPool::WorkerPool(std::size_t workers, IJobQueue& queue, Handler handler,
                       RetryPolicy retry)
    : size_(workers == 0 ? 1 : workers),
      queue_(queue),
      handler_(std::move(handler)),
      retry_(retry) {
}

WorkerPool::~WorkerPool() {
  stop();
}

auto WorkerPool::set_on_exhausted(ExhaustedCallback cb) -> void {
  on_exhausted_ = std::move(cb);
}

auto WorkerPool::start() -> void {
  if (running_.exchange(true)) {
    return;
  }
  threads_.reserve(size_);
  for (std::size_t i = 0; i < size_; ++i) {
    threads_.emplace_back([this] { worker_loop(); });
  }
  log::info("Worker pool started with {} workers", size_);
}

auto WorkerPool::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }
  queue_.close();
  for (auto& t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
  threads_.clear();
  log::info("Worker pool stopped");
}

auto WorkerPool::stats() const -> PoolStats {
  return PoolStats{.workers = size_,
                   .busy = busy_.load(),
                   .processed = processed_.load(),
                   .retried = retried_.load(),
                   .exhausted = exhausted_.load()};
}

auto WorkerPool::worker_loop() -> void {
  while (auto job = queue_.pop()) {
    busy_.fetch_add(1);
    handle(*job);
    busy_.fetch_sub(1);
  }
}

auto WorkerPool::handle(const QueuedJob& job) -> void {
  Result<void> result = fail(Error::Unknown);
  try {
    result = handler_(job);
  } catch (const std::exception& e) {
    log::error("Handler threw for job {}: {}", job.job_id, e.what());
  }
  processed_.fetch_add(1);
  if (result) {
    return;
  }

  if (retry_.should_retry(result.error(), job.attempt)) {
    auto delay = retry_.backoff(job.attempt);
    QueuedJob next = job;
    next.attempt = job.attempt + 1;
    next.not_before = now_ms() + delay.count();
    log::warn("Job {} attempt {} failed ({}), retrying in {}ms", job.job_id,
              job.attempt, result.error().message(), delay.count());
    if (queue_.push(next)) {
      retried_.fetch_add(1);
      return;
    }
    log::warn("Job {} could not be requeued", job.job_id);
  }

  exhausted_.fetch_add(1);
  log::error("Job {} gave up after {} attempts: {}", job.job_id, job.attempt,
             result.error().message());
  if (on_exhausted_) {
    on_exhausted_(job, result.error());
  }
}

}  // namespace vigil
