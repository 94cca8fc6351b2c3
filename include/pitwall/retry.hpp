#pragma once
#include <algorithm>
#include <chrono>
#include <string_view>
#include <thread>
#include <pitwall/errors.hpp>
#include <pitwall/log.hpp>

namespace pitwall {

struct RetryPolicy {
  int attempts = 5;                          // total tries, >= 1
  std::chrono::milliseconds initial{100};
  std::chrono::milliseconds max{2000};
};

// Delay before retry number n (0-based): initial * 2^n, capped at max.
inline std::chrono::milliseconds backoff_delay(const RetryPolicy& p, int n) {
  auto d = p.initial;
  for (int i = 0; i < n && d < p.max; ++i) d *= 2;
  return std::min(d, p.max);
}

// Calls fn until it returns without throwing TransportError, sleeping with
// exponential backoff in between. Rethrows the last error once the policy's
// attempts are used up.
template <class Fn>
auto retry_with_backoff(const RetryPolicy& p, std::string_view what, Fn&& fn) -> decltype(fn()) {
  const int attempts = std::max(1, p.attempts);
  for (int n = 0;; ++n) {
    try {
      return fn();
    } catch (const TransportError& e) {
      if (n + 1 >= attempts) {
        PW_ERROR("[RETRY] " << what << " failed after " << attempts << " attempts: " << e.what());
        throw;
      }
      const auto d = backoff_delay(p, n);
      PW_WARN("[RETRY] " << what << " attempt " << (n + 1) << "/" << attempts
              << " failed (" << e.what() << "), retrying in " << d.count() << "ms");
      std::this_thread::sleep_for(d);
    }
  }
}

} // namespace pitwall
