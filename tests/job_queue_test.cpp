#include "vigil/scheduler/concurrency_limiter.hpp"
#include "vigil/scheduler/job_queue.hpp"
#include "vigil/scheduler/retry_policy.hpp"
#include "vigil/util/util.hpp"

#include <atomic>
#include <chrono>
#include <thread>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace vigil;
using namespace std::chrono_literals;

namespace {

auto queued(std::string_view id, int priority = kPriorityMedium,
            std::int64_t not_before = 0) -> QueuedJob {
  return QueuedJob{.job_id = test::job_id(id),
                   .task_id = test::task_id(id),
                   .priority = priority,
                   .not_before = not_before,
                   .attempt = 1};
}

}  // namespace

TEST(PriorityJobQueueTest, HigherPriorityFirstThenFifo) {
  PriorityJobQueue queue;
  ASSERT_TRUE(queue.push(queued("low", kPriorityLow)).has_value());
  ASSERT_TRUE(queue.push(queued("med-1", kPriorityMedium)).has_value());
  ASSERT_TRUE(queue.push(queued("urgent", kPriorityUrgent)).has_value());
  ASSERT_TRUE(queue.push(queued("med-2", kPriorityMedium)).has_value());

  std::vector<std::string> order;
  for (int i = 0; i < 4; ++i) {
    auto job = queue.pop();
    ASSERT_TRUE(job.has_value());
    order.push_back(job->job_id.str());
  }

  EXPECT_EQ(order, (std::vector<std::string>{"urgent", "med-1", "med-2",
                                             "low"}));
}

TEST(PriorityJobQueueTest, DelayedJobWaitsUntilDue) {
  PriorityJobQueue queue;
  auto due = now_ms() + 200;
  ASSERT_TRUE(queue.push(queued("later", kPriorityUrgent, due)).has_value());
  ASSERT_TRUE(queue.push(queued("now", kPriorityLow)).has_value());

  auto stats = queue.stats();
  EXPECT_EQ(stats.waiting, 1u);
  EXPECT_EQ(stats.delayed, 1u);

  auto first = queue.pop();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->job_id.value(), "now");

  auto second = queue.pop();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->job_id.value(), "later");
  EXPECT_GE(now_ms(), due);
}

TEST(PriorityJobQueueTest, CapacityExceeded_IsQueueUnavailable) {
  PriorityJobQueue queue(2);
  ASSERT_TRUE(queue.push(queued("a")).has_value());
  ASSERT_TRUE(queue.push(queued("b")).has_value());

  auto result = queue.push(queued("c"));

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::QueueUnavailable));
}

TEST(PriorityJobQueueTest, Close_WakesBlockedPopAndRefusesPush) {
  PriorityJobQueue queue;
  std::atomic<bool> returned{false};
  std::thread consumer([&] {
    auto job = queue.pop();
    EXPECT_FALSE(job.has_value());
    returned = true;
  });

  test::sleep_ms(50ms);
  queue.close();
  consumer.join();

  EXPECT_TRUE(returned);
  EXPECT_TRUE(queue.is_closed());
  EXPECT_FALSE(queue.push(queued("late")).has_value());
}

TEST(PriorityJobQueueTest, Remove_DropsWaitingJob) {
  PriorityJobQueue queue;
  ASSERT_TRUE(queue.push(queued("keep")).has_value());
  ASSERT_TRUE(queue.push(queued("drop")).has_value());

  EXPECT_TRUE(queue.remove(test::job_id("drop")));
  EXPECT_FALSE(queue.remove(test::job_id("drop")));

  EXPECT_EQ(queue.size(), 1u);
  auto job = queue.pop();
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->job_id.value(), "keep");
}

TEST(PriorityJobQueueTest, PushWakesBlockedConsumer) {
  PriorityJobQueue queue;
  std::optional<QueuedJob> received;
  std::thread consumer([&] { received = queue.pop(); });

  test::sleep_ms(50ms);
  ASSERT_TRUE(queue.push(queued("wake")).has_value());
  consumer.join();

  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(received->job_id.value(), "wake");
}

TEST(RetryPolicyTest, OnlyTransientErrorsWithinBudget) {
  RetryPolicy policy{.max_attempts = 3, .base_backoff = 100ms};

  EXPECT_TRUE(policy.should_retry(make_error_code(Error::PersistenceFailure), 1));
  EXPECT_TRUE(policy.should_retry(make_error_code(Error::QueueUnavailable), 2));
  EXPECT_FALSE(policy.should_retry(make_error_code(Error::PersistenceFailure), 3));
  EXPECT_FALSE(policy.should_retry(make_error_code(Error::ValidationError), 1));
  EXPECT_FALSE(policy.should_retry(make_error_code(Error::NotFound), 1));
}

TEST(RetryPolicyTest, BackoffDoubles) {
  RetryPolicy policy{.max_attempts = 5, .base_backoff = 2000ms};

  EXPECT_EQ(policy.backoff(1), 2000ms);
  EXPECT_EQ(policy.backoff(2), 4000ms);
  EXPECT_EQ(policy.backoff(3), 8000ms);
}

TEST(ConcurrencyLimiterTest, BlocksAtCapacity) {
  ConcurrencyLimiter limiter(2);
  limiter.acquire();
  limiter.acquire();

  EXPECT_EQ(limiter.in_use(), 2u);
  EXPECT_FALSE(limiter.try_acquire_for(20ms));

  limiter.release();
  EXPECT_TRUE(limiter.try_acquire_for(20ms));
  EXPECT_EQ(limiter.in_use(), 2u);
}

TEST(ConcurrencyLimiterTest, PermitReleasesOnScopeExit) {
  ConcurrencyLimiter limiter(1);
  {
    ConcurrencyLimiter::Permit permit(limiter);
    EXPECT_EQ(limiter.in_use(), 1u);
  }
  EXPECT_EQ(limiter.in_use(), 0u);
  EXPECT_EQ(limiter.capacity(), 1u);
}
