#include "retry_policy.hpp"

#include <algorithm>
#include <random>

#include "config/config.pb.h"

namespace notify::core {

RetryPolicy RetryPolicy::FromConfig(const notify::runtime::config::AllocationConfig& config) {
  RetryPolicy policy;
  if (config.max_attempts() > 0) {
    policy.max_attempts = config.max_attempts();
  }
  if (config.initial_backoff_ms() > 0) {
    policy.initial_backoff = std::chrono::milliseconds(config.initial_backoff_ms());
  }
  if (config.max_backoff_ms() > 0) {
    policy.max_backoff = std::chrono::milliseconds(config.max_backoff_ms());
  }
  policy.max_backoff = std::max(policy.max_backoff, policy.initial_backoff);
  return policy;
}

std::chrono::milliseconds RetryPolicy::BackoffFor(uint32_t attempt) const {
  if (attempt == 0 || max_backoff.count() <= 0) {
    return std::chrono::milliseconds(0);
  }

  // cap the shift so the multiply cannot overflow
  const uint32_t shift   = std::min<uint32_t>(attempt - 1, 20);
  const int64_t  ceiling = std::min<int64_t>(max_backoff.count(), initial_backoff.count() << shift);

  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<int64_t> dist(0, std::max<int64_t>(ceiling, 0));
  return std::chrono::milliseconds(dist(rng));
}

} // namespace notify::core
