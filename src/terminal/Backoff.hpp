#ifndef __ST_BACKOFF__
#define __ST_BACKOFF__

#include "Headers.hpp"

namespace st {
/**
 * @brief Reconnect delay policy: 1, 2, 4, 8, then 16 units between
 * failures. An attempt that lasted RESET_AFTER_SECONDS or longer starts the
 * sequence over.
 */
class Backoff {
 public:
  static constexpr int MAX_EXPONENT = 4;
  static constexpr int RESET_AFTER_SECONDS = 10;

  explicit Backoff(std::chrono::steady_clock::time_point start)
      : retries(0), lastAttempt(start) {}

  /** @brief Returns the number of units to wait after a failure at `now`. */
  int onFailure(std::chrono::steady_clock::time_point now) {
    if (now - lastAttempt >= std::chrono::seconds(RESET_AFTER_SECONDS)) {
      retries = 0;
    }
    int delay = 1 << std::min(retries, MAX_EXPONENT);
    retries++;
    return delay;
  }

  /** @brief Marks the start of the next attempt. */
  void onAttemptFinished(std::chrono::steady_clock::time_point now) {
    lastAttempt = now;
  }

  int getRetries() const { return retries; }

 protected:
  int retries;
  std::chrono::steady_clock::time_point lastAttempt;
};
}  // namespace st

#endif  // __ST_BACKOFF__
