#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace vigil {

// Process-wide cap on concurrently running pipelines, shared by the worker
// pool and inline fallback runs.
class ConcurrencyLimiter {
public:
  explicit ConcurrencyLimiter(std::size_t permits) : permits_(permits) {
  }

  ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
  ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

  auto acquire() -> void {
    std::unique_lock lock(mu_);
    cv_.wait(lock, [this] { return in_use_ < permits_; });
    ++in_use_;
  }

  [[nodiscard]] auto try_acquire_for(std::chrono::milliseconds timeout)
      -> bool {
    std::unique_lock lock(mu_);
    if (!cv_.wait_for(lock, timeout, [this] { return in_use_ < permits_; })) {
      return false;
    }
    ++in_use_;
    return true;
  }

  auto release() -> void {
    {
      std::lock_guard lock(mu_);
      if (in_use_ > 0) {
        --in_use_;
      }
    }
    cv_.notify_one();
  }

  [[nodiscard]] auto in_use() const -> std::size_t {
    std::lock_guard lock(mu_);
    return in_use_;
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return permits_;
  }

  class Permit {
  public:
    explicit Permit(ConcurrencyLimiter& limiter) : limiter_(&limiter) {
      limiter_->acquire();
    }
    ~Permit() {
      if (limiter_) {
        limiter_->release();
      }
    }
    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

  private:
    ConcurrencyLimiter* limiter_;
  };

private:
  const std::size_t permits_;
  std::size_t in_use_{0};
  mutable std::mutex mu_;
  std::condition_variable cv_;
};

}  // namespace vigil
