#include "vigil/storage/persistence.hpp"
#include "vigil/task/execution_record.hpp"
#include "vigil/task/task_definition.hpp"

#include <benchmark/benchmark.h>

#include <array>
#include <filesystem>
#include <format>

#include <unistd.h>

using namespace vigil;

class PersistenceBenchFixture : public benchmark::Fixture {
public:
  void SetUp(const ::benchmark::State& state) override {
    (void)state;
    std::string pattern = "/tmp/vigil_bench_XXXXXX";
    int fd = ::mkstemp(pattern.data());
    if (fd >= 0) {
      ::close(fd);
    }
    test_db_path_ = pattern;
    persistence_ = std::make_unique<Persistence>(test_db_path_);
    auto opened = persistence_->open();
    benchmark::DoNotOptimize(opened);

    def_.task_id = TaskId{"bench-task"};
    def_.name = "bench";
    def_.target = "example.com";
    def_.model = ModelSpec{.provider = Provider::OpenAI, .model = "gpt-4"};
    auto saved = persistence_->save_task(def_);
    benchmark::DoNotOptimize(saved);

    // 50 finished jobs with 20 log lines each
    for (int i = 0; i < 50; ++i) {
      ExecutionRecord rec;
      rec.job_id = JobId{std::format("seed-{}", i)};
      rec.task_id = def_.task_id;
      rec.status = i % 10 == 0 ? ExecutionStatus::Running
                               : ExecutionStatus::Completed;
      rec.created_at = 1000 + i;
      auto stored = persistence_->save_execution(rec);
      benchmark::DoNotOptimize(stored);
      for (int seq = 1; seq <= 20; ++seq) {
        auto appended = persistence_->append_log(
            rec.job_id, LogEntry{.seq = seq,
                                 .timestamp = 1000 + seq,
                                 .level = LogLevel::Info,
                                 .message = "stage progress"});
        benchmark::DoNotOptimize(appended);
      }
    }
  }

  void TearDown(const ::benchmark::State& state) override {
    (void)state;
    persistence_->close();
    persistence_.reset();
    if (!test_db_path_.empty()) {
      std::filesystem::remove(test_db_path_);
    }
  }

  std::string test_db_path_;
  std::unique_ptr<Persistence> persistence_;
  TaskDefinition def_;
};

BENCHMARK_F(PersistenceBenchFixture,
            BM_PersistenceListExecutions)(benchmark::State& state) {
  for (auto _ : state) {
    auto result = persistence_->list_executions(10);
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(PersistenceBenchFixture,
            BM_PersistenceListIncomplete)(benchmark::State& state) {
  constexpr std::array kIncomplete = {ExecutionStatus::Pending,
                                      ExecutionStatus::Running,
                                      ExecutionStatus::Paused};
  for (auto _ : state) {
    auto result = persistence_->list_executions_by_status(kIncomplete);
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(PersistenceBenchFixture,
            BM_PersistenceGetExecution)(benchmark::State& state) {
  JobId job{"seed-25"};
  for (auto _ : state) {
    auto result = persistence_->get_execution(job);
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(PersistenceBenchFixture,
            BM_PersistenceStageCheckpoint)(benchmark::State& state) {
  ExecutionRecord rec;
  rec.job_id = JobId{"checkpoint"};
  rec.task_id = def_.task_id;
  rec.status = ExecutionStatus::Running;
  auto stored = persistence_->save_execution(rec);
  benchmark::DoNotOptimize(stored);

  std::int64_t seq = 0;
  for (auto _ : state) {
    ++seq;
    rec.progress = static_cast<int>(seq % 100);
    auto result = persistence_->save_execution_with_log(
        rec, LogEntry{.seq = seq,
                      .timestamp = seq,
                      .level = LogLevel::Info,
                      .message = "checkpoint"});
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(PersistenceBenchFixture,
            BM_PersistenceBeginCommitTransaction)(benchmark::State& state) {
  for (auto _ : state) {
    auto began = persistence_->begin_transaction();
    auto committed = persistence_->commit_transaction();
    benchmark::DoNotOptimize(began);
    benchmark::DoNotOptimize(committed);
  }
}

BENCHMARK_F(PersistenceBenchFixture,
            BM_PersistenceBeginRollbackTransaction)(benchmark::State& state) {
  for (auto _ : state) {
    auto began = persistence_->begin_transaction();
    auto rolled = persistence_->rollback_transaction();
    benchmark::DoNotOptimize(began);
    benchmark::DoNotOptimize(rolled);
  }
}
