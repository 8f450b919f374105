#include "vigil/scheduler/job_queue.hpp"
#include "vigil/scheduler/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace vigil;
using namespace std::chrono_literals;

namespace {

auto queued(std::string_view id) -> QueuedJob {
  return QueuedJob{.job_id = test::job_id(id), .task_id = test::task_id(id)};
}

}  // namespace

TEST(WorkerPoolTest, ProcessesEveryJob) {
  PriorityJobQueue queue;
  std::mutex mu;
  std::set<std::string> seen;
  WorkerPool pool(3, queue, [&](const QueuedJob& job) -> Result<void> {
    std::lock_guard lock(mu);
    seen.insert(job.job_id.str());
    return ok();
  });
  pool.start();

  for (int i = 0; i < 20; ++i) {
    ASSERT_TRUE(queue.push(queued(std::format("job-{}", i))).has_value());
  }

  ASSERT_TRUE(test::wait_until([&] { return pool.stats().processed == 20; }));
  pool.stop();

  EXPECT_EQ(seen.size(), 20u);
  EXPECT_EQ(pool.stats().workers, 3u);
  EXPECT_EQ(pool.stats().retried, 0u);
}

TEST(WorkerPoolTest, TransientFailure_RetriedWithIncrementedAttempt) {
  PriorityJobQueue queue;
  std::atomic<int> calls{0};
  std::atomic<int> last_attempt{0};
  WorkerPool pool(
      1, queue,
      [&](const QueuedJob& job) -> Result<void> {
        last_attempt = job.attempt;
        if (calls.fetch_add(1) == 0) {
          return fail(Error::PersistenceFailure);
        }
        return ok();
      },
      RetryPolicy{.max_attempts = 3, .base_backoff = 20ms});
  pool.start();

  ASSERT_TRUE(queue.push(queued("flaky")).has_value());

  ASSERT_TRUE(test::wait_until([&] { return calls.load() == 2; }));
  pool.stop();

  EXPECT_EQ(last_attempt.load(), 2);
  EXPECT_EQ(pool.stats().retried, 1u);
  EXPECT_EQ(pool.stats().exhausted, 0u);
}

TEST(WorkerPoolTest, PermanentFailure_GoesStraightToExhausted) {
  PriorityJobQueue queue;
  std::atomic<int> calls{0};
  std::mutex mu;
  std::error_code reported;
  WorkerPool pool(1, queue, [&](const QueuedJob&) -> Result<void> {
    calls.fetch_add(1);
    return fail(Error::NotFound);
  });
  pool.set_on_exhausted([&](const QueuedJob&, std::error_code ec) {
    std::lock_guard lock(mu);
    reported = ec;
  });
  pool.start();

  ASSERT_TRUE(queue.push(queued("gone")).has_value());

  ASSERT_TRUE(test::wait_until([&] { return pool.stats().exhausted == 1; }));
  pool.stop();

  EXPECT_EQ(calls.load(), 1);
  std::lock_guard lock(mu);
  EXPECT_EQ(reported, make_error_code(Error::NotFound));
}

TEST(WorkerPoolTest, RetriesStopAtMaxAttempts) {
  PriorityJobQueue queue;
  std::atomic<int> calls{0};
  WorkerPool pool(
      1, queue,
      [&](const QueuedJob&) -> Result<void> {
        calls.fetch_add(1);
        return fail(Error::QueueUnavailable);
      },
      RetryPolicy{.max_attempts = 3, .base_backoff = 10ms});
  std::atomic<int> exhausted_attempt{0};
  pool.set_on_exhausted([&](const QueuedJob& job, std::error_code) {
    exhausted_attempt = job.attempt;
  });
  pool.start();

  ASSERT_TRUE(queue.push(queued("never")).has_value());

  ASSERT_TRUE(test::wait_until([&] { return exhausted_attempt.load() != 0; }));
  pool.stop();

  EXPECT_EQ(calls.load(), 3);
  EXPECT_EQ(exhausted_attempt.load(), 3);
  EXPECT_EQ(pool.stats().retried, 2u);
}

TEST(WorkerPoolTest, HandlerException_TreatedAsFailure) {
  PriorityJobQueue queue;
  std::atomic<bool> exhausted{false};
  WorkerPool pool(1, queue, [](const QueuedJob&) -> Result<void> {
    throw std::runtime_error("boom");
  });
  pool.set_on_exhausted(
      [&](const QueuedJob&, std::error_code) { exhausted = true; });
  pool.start();

  ASSERT_TRUE(queue.push(queued("throws")).has_value());

  EXPECT_TRUE(test::wait_until([&] { return exhausted.load(); }));
  pool.stop();
}

TEST(WorkerPoolTest, Stop_ClosesQueueAndJoins) {
  PriorityJobQueue queue;
  WorkerPool pool(4, queue, [](const QueuedJob&) -> Result<void> {
    return ok();
  });
  pool.start();
  EXPECT_TRUE(pool.is_running());

  pool.stop();

  EXPECT_FALSE(pool.is_running());
  EXPECT_TRUE(queue.is_closed());
  pool.stop();
}
