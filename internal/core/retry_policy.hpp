#pragma once

#include <chrono>
#include <cstdint>

namespace notify::runtime::config {
class AllocationConfig;
}

namespace notify::core {

/*
  Bounded retry with randomized exponential backoff.

  Attempt n (1-based) that failed waits a uniformly random duration in
  [0, min(max_backoff, initial_backoff * 2^(n-1))] before attempt n+1.
*/
struct RetryPolicy {
  static constexpr uint32_t kDefaultMaxAttempts      = 16;
  static constexpr uint32_t kDefaultInitialBackoffMs = 2;
  static constexpr uint32_t kDefaultMaxBackoffMs     = 100;

  uint32_t                  max_attempts    = kDefaultMaxAttempts;
  std::chrono::milliseconds initial_backoff = std::chrono::milliseconds(kDefaultInitialBackoffMs);
  std::chrono::milliseconds max_backoff     = std::chrono::milliseconds(kDefaultMaxBackoffMs);

  // zero-valued fields fall back to the defaults above
  static RetryPolicy FromConfig(const notify::runtime::config::AllocationConfig& config);

  std::chrono::milliseconds BackoffFor(uint32_t attempt) const;
};

} // namespace notify::core
