#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace vigil {

class CancellationToken;

// Shared cancel flag for one job. The orchestrator owns the source; every
// child process and stage loop the job starts observes a token.
class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<State>()) {
  }

  [[nodiscard]] auto token() const noexcept -> CancellationToken;

  // First reason wins; later calls only keep the flag set.
  auto cancel(std::string reason = "cancelled") -> void {
    std::lock_guard lock(state_->mu);
    if (state_->cancelled.load(std::memory_order_relaxed)) {
      return;
    }
    state_->reason = std::move(reason);
    state_->cancelled.store(true, std::memory_order_release);
  }

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_->cancelled.load(std::memory_order_acquire);
  }

private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::mutex mu;
    std::string reason;
  };
  std::shared_ptr<State> state_;

  friend class CancellationToken;
};

class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto reason() const -> std::string {
    if (!state_) {
      return {};
    }
    std::lock_guard lock(state_->mu);
    return state_->reason;
  }

  [[nodiscard]] explicit operator bool() const noexcept {
    return !is_cancelled();
  }

  [[nodiscard]] static auto none() noexcept -> CancellationToken {
    return {};
  }

private:
  explicit CancellationToken(std::shared_ptr<CancellationSource::State> state)
      : state_(std::move(state)) {
  }

  std::shared_ptr<CancellationSource::State> state_;

  friend class CancellationSource;
};

inline auto CancellationSource::token() const noexcept -> CancellationToken {
  return CancellationToken{state_};
}

}  // namespace vigil
