#ifndef __ST_CANCELLATION_TOKEN__
#define __ST_CANCELLATION_TOKEN__

#include "Headers.hpp"

namespace st {
/**
 * @brief Shared stop flag that blocking operations poll or wait on.
 *
 * A child token reports cancellation when either it or any ancestor has been
 * cancelled, so one streaming attempt can be torn down without stopping the
 * whole controller.
 */
class CancellationToken {
 public:
  CancellationToken() : cancelled(false) {}
  explicit CancellationToken(shared_ptr<CancellationToken> _parent)
      : parent(_parent), cancelled(false) {}

  void cancel() {
    {
      lock_guard<std::mutex> guard(waitMutex);
      cancelled = true;
    }
    waitCondition.notify_all();
  }

  bool isCancelled() const {
    if (cancelled) {
      return true;
    }
    return parent && parent->isCancelled();
  }

  /**
   * @brief Sleeps for up to `duration`, returning early on cancellation.
   * @return true if the token was cancelled.
   */
  template <class Rep, class Period>
  bool waitFor(const std::chrono::duration<Rep, Period>& duration) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    std::unique_lock<std::mutex> lock(waitMutex);
    while (!isCancelled()) {
      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        return false;
      }
      // Wake up periodically so a cancelled parent is noticed
      auto slice = std::min<std::chrono::steady_clock::duration>(
          deadline - now, std::chrono::milliseconds(50));
      waitCondition.wait_for(lock, slice);
    }
    return true;
  }

 protected:
  shared_ptr<CancellationToken> parent;
  std::atomic<bool> cancelled;
  std::mutex waitMutex;
  std::condition_variable waitCondition;
};
}  // namespace st

#endif  // __ST_CANCELLATION_TOKEN__
