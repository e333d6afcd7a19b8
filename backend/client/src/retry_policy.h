#ifndef CONVERTHUB_CLIENT_RETRY_POLICY_H
#define CONVERTHUB_CLIENT_RETRY_POLICY_H

#include <algorithm>
#include <chrono>
#include <random>

namespace converthub::client {

struct RetryPolicy {
  int max_attempts = 4;
  std::chrono::milliseconds initial_backoff{500};
  double multiplier = 2.0;
  std::chrono::milliseconds max_backoff{8000};
  // When set, the actual delay is drawn uniformly from [delay / 2, delay].
  bool jitter = true;

  // Delay before retry number `retry` (1-based).
  std::chrono::milliseconds BackoffFor(int retry) const {
    double delay = static_cast<double>(initial_backoff.count());
    for (int i = 1; i < retry; ++i) {
      delay *= multiplier;
      if (delay >= static_cast<double>(max_backoff.count())) {
        break;
      }
    }
    auto capped = std::min<long long>(static_cast<long long>(delay), max_backoff.count());
    if (jitter && capped > 1) {
      thread_local std::mt19937 rng{std::random_device{}()};
      std::uniform_int_distribution<long long> dist(capped / 2, capped);
      capped = dist(rng);
    }
    return std::chrono::milliseconds(capped);
  }
};

}  // namespace converthub::client

#endif  // CONVERTHUB_CLIENT_RETRY_POLICY_H
