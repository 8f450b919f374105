#pragma once

#include "vigil/core/error.hpp"
#include "vigil/storage/persistence.hpp"

#include <functional>
#include <vector>

namespace vigil {

struct RecoveryResult {
  std::vector<JobId> requeued;
  std::vector<JobId> interrupted;
};

// Reconciles the store after an unclean shutdown. Jobs that never started
// are handed back for queuing; jobs caught mid-pipeline are failed, since
// their external processes died with the previous instance.
class Recovery {
public:
  explicit Recovery(Persistence& persistence);

  [[nodiscard]] auto recover(
      std::move_only_function<Result<void>(const ExecutionRecord&,
                                           const TaskDefinition&)>
          requeue) -> Result<RecoveryResult>;

  [[nodiscard]] static auto mark_interrupted(Persistence& persistence,
                                             ExecutionRecord record)
      -> Result<void>;

private:
  Persistence& persistence_;
};

}  // namespace vigil
