#pragma once

#include "vigil/core/error.hpp"

#include <algorithm>
#include <chrono>

namespace vigil {

// Bounded retries for scheduling failures. Only transient errors qualify;
// a stage failure inside the pipeline is final.
struct RetryPolicy {
  int max_attempts{3};
  std::chrono::milliseconds base_backoff{2000};

  [[nodiscard]] auto should_retry(std::error_code ec, int attempt) const
      -> bool {
    return attempt < max_attempts && is_transient(ec);
  }

  // Delay before attempt + 1: base, 2*base, 4*base, ...
  [[nodiscard]] auto backoff(int attempt) const -> std::chrono::milliseconds {
    auto shift = std::clamp(attempt - 1, 0, 16);
    return base_backoff * (1LL << shift);
  }
};

}  // namespace vigil
