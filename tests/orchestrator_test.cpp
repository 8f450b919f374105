#include "vigil/app/orchestrator.hpp"
#include "vigil/scheduler/worker_pool.hpp"
#include "vigil/sandbox/verification_generator.hpp"
#include "vigil/task/state_strings.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <thread>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace vigil;
using namespace std::chrono_literals;

class OrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_FALSE(dir_.path().empty());
    store_ = std::make_unique<Persistence>(dir_.file("vigil.db"));
    ASSERT_TRUE(store_->open().has_value());

    SandboxConfig sandbox_config;
    sandbox_config.directory = dir_.file("sandbox");
    sandbox_ = std::make_unique<SandboxExecutor>(runner_, sandbox_config);
    reports_ = std::make_unique<FileReportAssembler>(dir_.file("reports"));

    auto port = test::make_finding("nmap-1", "open_port", Severity::Info);
    port.evidence = {{"port", 443}, {"service", "https"}};
    chain_.findings = {port, test::make_finding("nikto-2", "web_issue")};

    orch_ = std::make_unique<Orchestrator>(*store_, queue_, limiter_, chain_,
                                           *sandbox_, *reports_, &generator_);
  }

  void TearDown() override {
    chain_.release();
    orch_.reset();
    store_->close();
  }

  auto submit(std::string name = "scan") -> SubmitResult {
    auto r = orch_->submit(test::make_definition(std::move(name)));
    EXPECT_TRUE(r.has_value());
    return r.value_or(SubmitResult{});
  }

  auto status_of(const JobId& job) -> ExecutionStatus {
    auto rec = orch_->get_status(job);
    return rec ? rec->status : ExecutionStatus::Pending;
  }

  // Runs the pipeline on a background thread; joined by the caller.
  auto run_async(const JobId& job) -> std::thread {
    return std::thread([this, job] {
      EXPECT_TRUE(orch_->run_pipeline(job).has_value());
    });
  }

  test::TempDir dir_{"vigil_orch"};
  std::unique_ptr<Persistence> store_;
  PriorityJobQueue queue_;
  ConcurrencyLimiter limiter_{4};
  test::FakeChainExecutor chain_;
  test::FakeProcessRunner runner_{[](const ProcessSpec&) {
    ProcessResult r;
    r.exit_code = 0;
    r.stdout_output = "VULNERABLE: port reachable\n";
    return r;
  }};
  std::unique_ptr<SandboxExecutor> sandbox_;
  std::unique_ptr<FileReportAssembler> reports_;
  TemplateVerificationGenerator generator_;
  std::unique_ptr<Orchestrator> orch_;
};

TEST_F(OrchestratorTest, Submit_StoresPendingJobAtZero) {
  auto submitted = submit();

  auto rec = orch_->get_status(submitted.job_id);
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->status, ExecutionStatus::Pending);
  EXPECT_EQ(rec->progress, 0);
  EXPECT_EQ(rec->stage, "queued");
  EXPECT_FALSE(submitted.task_id.empty());
  EXPECT_EQ(queue_.size(), 1u);

  auto stored = store_->get_execution(submitted.job_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, ExecutionStatus::Pending);
  ASSERT_EQ(stored->logs.size(), 1u);
  EXPECT_NE(stored->logs[0].message.find("Task created"), std::string::npos);

  auto def = orch_->get_definition(submitted.task_id);
  ASSERT_TRUE(def.has_value());
  EXPECT_EQ(def->strategy.scope, (std::vector<std::string>{"example.com"}));
}

TEST_F(OrchestratorTest, Submit_InvalidDefinitionStoresNothing) {
  auto def = test::make_definition();
  def.target = "example.com; rm -rf /";

  auto r = orch_->submit(def);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::ValidationError));
  auto all = orch_->list_all();
  ASSERT_TRUE(all.has_value());
  EXPECT_TRUE(all->empty());
  EXPECT_EQ(queue_.size(), 0u);
}

TEST_F(OrchestratorTest, Submit_FlagShapedTargetRejected) {
  for (const auto* bad : {"-iL/etc/shadow", "--script=/tmp/x.nse"}) {
    auto def = test::make_definition();
    def.target = bad;

    auto r = orch_->submit(def);

    ASSERT_FALSE(r.has_value()) << bad;
    EXPECT_EQ(r.error(), make_error_code(Error::ValidationError)) << bad;
  }
  EXPECT_EQ(queue_.size(), 0u);
  EXPECT_EQ(chain_.calls.load(), 0);
}

TEST_F(OrchestratorTest, RunPipeline_CompletesWithVerifiedFindingsAndReport) {
  auto submitted = submit();

  ASSERT_TRUE(orch_->run_pipeline(submitted.job_id).has_value());

  auto rec = orch_->get_status(submitted.job_id);
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->status, ExecutionStatus::Completed);
  EXPECT_EQ(rec->progress, 100);
  EXPECT_EQ(rec->stage, "completed");
  EXPECT_GT(rec->started_at, 0);
  EXPECT_GE(rec->completed_at, rec->started_at);
  EXPECT_EQ(chain_.initialized_model, "gpt-4");
  ASSERT_EQ(rec->findings.size(), 2u);

  // Only the open port has a verification template
  const auto& port = rec->findings[0];
  EXPECT_TRUE(port.verified);
  EXPECT_TRUE(port.confirmed);
  EXPECT_EQ(port.reliability_score, kScoreConfirmed);
  EXPECT_FALSE(rec->findings[1].verified);
  EXPECT_EQ(runner_.specs().size(), 1u);

  ASSERT_FALSE(rec->report_path.empty());
  EXPECT_TRUE(std::filesystem::exists(rec->report_path));

  auto stored = store_->get_execution(submitted.job_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, ExecutionStatus::Completed);
  EXPECT_EQ(stored->findings.size(), 2u);
  EXPECT_EQ(stored->report_path, rec->report_path);
  EXPECT_TRUE(std::ranges::any_of(stored->logs, [](const LogEntry& e) {
    return e.message == "Analysing example.com";
  }));
  EXPECT_EQ(orch_->stats().completed, 1u);
}

TEST_F(OrchestratorTest, RunPipeline_VerificationDisabledSkipsSandbox) {
  auto def = test::make_definition();
  def.verify = false;
  auto submitted = orch_->submit(def);
  ASSERT_TRUE(submitted.has_value());

  ASSERT_TRUE(orch_->run_pipeline(submitted->job_id).has_value());

  auto rec = orch_->get_status(submitted->job_id);
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->status, ExecutionStatus::Completed);
  EXPECT_TRUE(runner_.specs().empty());
  EXPECT_FALSE(rec->findings[0].verified);
}

TEST_F(OrchestratorTest, Progress_NeverDecreases) {
  auto submitted = submit();
  std::atomic<bool> done{false};
  std::vector<int> seen;
  std::thread sampler([&] {
    while (!done.load()) {
      if (auto rec = orch_->get_status(submitted.job_id)) {
        seen.push_back(rec->progress);
      }
      std::this_thread::sleep_for(1ms);
    }
  });

  chain_.hold();
  auto worker = run_async(submitted.job_id);
  ASSERT_TRUE(chain_.wait_entered());
  test::sleep_ms(20ms);
  chain_.release();
  worker.join();
  done = true;
  sampler.join();

  ASSERT_FALSE(seen.empty());
  EXPECT_TRUE(std::ranges::is_sorted(seen));
  EXPECT_EQ(seen.back(), 100);
}

TEST_F(OrchestratorTest, PauseAndResume_KeepsFindingsAndLogs) {
  auto submitted = submit();
  chain_.hold();
  auto worker = run_async(submitted.job_id);
  ASSERT_TRUE(chain_.wait_entered());

  ASSERT_TRUE(orch_->pause(submitted.job_id));
  EXPECT_FALSE(orch_->pause(submitted.job_id));
  chain_.release();

  // The chain result is held back at the next stage boundary and the run
  // hands its permit back
  worker.join();
  EXPECT_EQ(limiter_.in_use(), 0u);
  auto paused = orch_->get_status(submitted.job_id);
  ASSERT_TRUE(paused.has_value());
  EXPECT_EQ(paused->status, ExecutionStatus::Paused);
  EXPECT_EQ(paused->progress, 10);
  auto stored = store_->get_execution(submitted.job_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, ExecutionStatus::Paused);

  auto before_resume = queue_.size();
  ASSERT_TRUE(orch_->resume(submitted.job_id));
  EXPECT_FALSE(orch_->resume(submitted.job_id));
  EXPECT_EQ(queue_.size(), before_resume + 1);
  ASSERT_TRUE(orch_->run_pipeline(submitted.job_id).has_value());

  auto rec = orch_->get_status(submitted.job_id);
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->status, ExecutionStatus::Completed);
  EXPECT_EQ(rec->findings.size(), 2u);
  auto logs = orch_->get_logs(submitted.job_id);
  ASSERT_TRUE(logs.has_value());
  auto has = [&logs](std::string_view text) {
    return std::ranges::any_of(*logs, [text](const LogEntry& e) {
      return e.message == text;
    });
  };
  EXPECT_TRUE(has("Task paused"));
  EXPECT_TRUE(has("Task resumed"));
  EXPECT_TRUE(has("Analysing example.com"));
  EXPECT_TRUE(std::ranges::is_sorted(*logs, {}, &LogEntry::seq));
}

TEST_F(OrchestratorTest, PausedJobsDoNotHoldWorkersOrPermits) {
  PriorityJobQueue queue;
  ConcurrencyLimiter limiter{2};
  Orchestrator orch(*store_, queue, limiter, chain_, *sandbox_, *reports_,
                    &generator_);
  WorkerPool pool(2, queue, [&orch](const QueuedJob& job) -> Result<void> {
    return orch.run_pipeline(job.job_id);
  });
  chain_.hold();
  pool.start();

  auto first = orch.submit(test::make_definition("first"));
  auto second = orch.submit(test::make_definition("second"));
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  ASSERT_TRUE(test::wait_until([&] { return chain_.calls.load() == 2; }));
  ASSERT_TRUE(orch.pause(first->job_id));
  ASSERT_TRUE(orch.pause(second->job_id));
  chain_.release();
  ASSERT_TRUE(test::wait_until([&] { return limiter.in_use() == 0; }));

  auto third = orch.submit(test::make_definition("third"));
  ASSERT_TRUE(third.has_value());
  ASSERT_TRUE(test::wait_until([&] {
    auto rec = orch.get_status(third->job_id);
    return rec && rec->status == ExecutionStatus::Completed;
  }));
  for (const auto& job : {first->job_id, second->job_id}) {
    auto rec = orch.get_status(job);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, ExecutionStatus::Paused);
    EXPECT_EQ(rec->progress, 10);
  }

  ASSERT_TRUE(orch.resume(first->job_id));
  ASSERT_TRUE(orch.resume(second->job_id));
  ASSERT_TRUE(test::wait_until([&] {
    auto a = orch.get_status(first->job_id);
    auto b = orch.get_status(second->job_id);
    return a && b && a->status == ExecutionStatus::Completed &&
           b->status == ExecutionStatus::Completed;
  }));
  EXPECT_EQ(orch.get_status(first->job_id)->findings.size(), 2u);
  pool.stop();
}

TEST_F(OrchestratorTest, PausePending_IsRejected) {
  auto submitted = submit();

  EXPECT_FALSE(orch_->pause(submitted.job_id));
  EXPECT_FALSE(orch_->resume(submitted.job_id));
  EXPECT_EQ(status_of(submitted.job_id), ExecutionStatus::Pending);
}

TEST_F(OrchestratorTest, CancelDuringChain_EndsCancelled) {
  auto submitted = submit();
  chain_.hold();
  auto worker = run_async(submitted.job_id);
  ASSERT_TRUE(chain_.wait_entered());

  ASSERT_TRUE(orch_->cancel(submitted.job_id));
  chain_.release();
  worker.join();

  auto rec = orch_->get_status(submitted.job_id);
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->status, ExecutionStatus::Cancelled);
  EXPECT_EQ(rec->stage, "cancelled");
  EXPECT_TRUE(rec->report_path.empty());
  EXPECT_FALSE(orch_->cancel(submitted.job_id));
  EXPECT_FALSE(orch_->resume(submitted.job_id));

  auto stored = store_->get_execution(submitted.job_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, ExecutionStatus::Cancelled);
  EXPECT_EQ(orch_->stats().cancelled, 1u);
}

TEST_F(OrchestratorTest, CancelPending_RemovesFromQueueAndSkipsRun) {
  auto submitted = submit();

  ASSERT_TRUE(orch_->cancel(submitted.job_id));

  EXPECT_EQ(queue_.size(), 0u);
  ASSERT_TRUE(orch_->run_pipeline(submitted.job_id).has_value());
  EXPECT_EQ(chain_.calls.load(), 0);
  EXPECT_EQ(status_of(submitted.job_id), ExecutionStatus::Cancelled);

  auto rec = orch_->get_status(submitted.job_id);
  ASSERT_TRUE(rec.has_value());
  EXPECT_GT(rec->started_at, 0);
  EXPECT_GE(rec->completed_at, rec->started_at);
  auto stored = store_->get_execution(submitted.job_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->started_at, rec->started_at);
}

TEST_F(OrchestratorTest, CancelCompletedJob_ChangesNothing) {
  auto submitted = submit();
  ASSERT_TRUE(orch_->run_pipeline(submitted.job_id).has_value());
  auto before = orch_->get_status(submitted.job_id);
  auto stored_before = store_->get_execution(submitted.job_id);
  ASSERT_TRUE(before.has_value());
  ASSERT_TRUE(stored_before.has_value());
  ASSERT_EQ(before->status, ExecutionStatus::Completed);

  EXPECT_FALSE(orch_->cancel(submitted.job_id));

  EXPECT_EQ(orch_->get_status(submitted.job_id), before);
  auto stored_after = store_->get_execution(submitted.job_id);
  ASSERT_TRUE(stored_after.has_value());
  EXPECT_EQ(*stored_after, *stored_before);
  EXPECT_EQ(orch_->stats().cancelled, 0u);
}

TEST_F(OrchestratorTest, CancelFailedJob_ChangesNothing) {
  chain_.fail_execute = true;
  auto submitted = submit();
  ASSERT_TRUE(orch_->run_pipeline(submitted.job_id).has_value());
  auto before = orch_->get_status(submitted.job_id);
  auto stored_before = store_->get_execution(submitted.job_id);
  ASSERT_TRUE(before.has_value());
  ASSERT_TRUE(stored_before.has_value());
  ASSERT_EQ(before->status, ExecutionStatus::Failed);

  EXPECT_FALSE(orch_->cancel(submitted.job_id));

  EXPECT_EQ(orch_->get_status(submitted.job_id), before);
  auto stored_after = store_->get_execution(submitted.job_id);
  ASSERT_TRUE(stored_after.has_value());
  EXPECT_EQ(*stored_after, *stored_before);
}

TEST_F(OrchestratorTest, ChainFailure_FailsJobWithMessage) {
  chain_.fail_execute = true;
  auto submitted = submit();

  ASSERT_TRUE(orch_->run_pipeline(submitted.job_id).has_value());

  auto rec = orch_->get_status(submitted.job_id);
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->status, ExecutionStatus::Failed);
  EXPECT_NE(rec->error.find("Chain execution failed"), std::string::npos);
  EXPECT_GT(rec->completed_at, 0);
  auto stored = store_->get_execution(submitted.job_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, ExecutionStatus::Failed);
  EXPECT_EQ(stored->logs.back().level, LogLevel::Error);
}

TEST_F(OrchestratorTest, InitializationFailure_FailsBeforeChain) {
  chain_.fail_initialize = true;
  auto submitted = submit();

  ASSERT_TRUE(orch_->run_pipeline(submitted.job_id).has_value());

  EXPECT_EQ(status_of(submitted.job_id), ExecutionStatus::Failed);
  EXPECT_EQ(chain_.calls.load(), 0);
}

TEST_F(OrchestratorTest, ClosedQueue_RunsInline) {
  queue_.close();

  auto submitted = submit();

  ASSERT_TRUE(test::wait_until([&] {
    return status_of(submitted.job_id) == ExecutionStatus::Completed;
  }));
  EXPECT_EQ(orch_->stats().inline_runs, 1u);
}

TEST_F(OrchestratorTest, RemoveTask_RefusedWhileJobActive) {
  auto submitted = submit();

  auto refused = orch_->remove_task(submitted.task_id);
  ASSERT_FALSE(refused.has_value());
  EXPECT_EQ(refused.error(), make_error_code(Error::HasActiveRuns));

  ASSERT_TRUE(orch_->run_pipeline(submitted.job_id).has_value());
  ASSERT_TRUE(orch_->remove_task(submitted.task_id).has_value());

  EXPECT_FALSE(orch_->get_status(submitted.job_id).has_value());
  auto def = orch_->get_definition(submitted.task_id);
  ASSERT_FALSE(def.has_value());
  EXPECT_EQ(def.error(), make_error_code(Error::NotFound));
}

TEST_F(OrchestratorTest, ListAll_NewestFirst) {
  auto first = submit("first");
  test::sleep_ms(5ms);
  auto second = submit("second");
  test::sleep_ms(5ms);
  auto third = submit("third");

  auto all = orch_->list_all();

  ASSERT_TRUE(all.has_value());
  ASSERT_EQ(all->size(), 3u);
  EXPECT_EQ((*all)[0].job_id, third.job_id);
  EXPECT_EQ((*all)[1].job_id, second.job_id);
  EXPECT_EQ((*all)[2].job_id, first.job_id);
}

TEST_F(OrchestratorTest, Abandon_FailsPendingJob) {
  auto submitted = submit();

  orch_->abandon(submitted.job_id, make_error_code(Error::PersistenceFailure));

  auto rec = orch_->get_status(submitted.job_id);
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->status, ExecutionStatus::Failed);
  EXPECT_NE(rec->error.find("Scheduling failed after retries"),
            std::string::npos);
}

TEST_F(OrchestratorTest, UnknownJob_IsReportedMissing) {
  auto ghost = test::job_id("no-such-job");

  EXPECT_FALSE(orch_->get_status(ghost).has_value());
  EXPECT_FALSE(orch_->cancel(ghost));
  EXPECT_FALSE(orch_->pause(ghost));
  auto run = orch_->run_pipeline(ghost);
  ASSERT_FALSE(run.has_value());
  EXPECT_EQ(run.error(), make_error_code(Error::NotFound));
}

TEST_F(OrchestratorTest, Shutdown_LeavesRunningJobForRecovery) {
  auto submitted = submit();
  chain_.hold();
  auto worker = run_async(submitted.job_id);
  ASSERT_TRUE(chain_.wait_entered());

  orch_->shutdown(100ms);
  chain_.release();
  worker.join();

  auto stored = store_->get_execution(submitted.job_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, ExecutionStatus::Running);
  auto after = orch_->submit(test::make_definition());
  ASSERT_FALSE(after.has_value());
  EXPECT_EQ(after.error(), make_error_code(Error::QueueUnavailable));
}
