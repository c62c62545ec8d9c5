#ifndef __ST_MESSAGE_QUEUE__
#define __ST_MESSAGE_QUEUE__

#include "CancellationToken.hpp"
#include "Headers.hpp"

namespace st {
/**
 * @brief Bounded, closable multi-producer queue between threads.
 *
 * The capacity creates backpressure: blocking pushes wait for the consumer,
 * while tryPush lets latency sensitive producers drop instead. Closing the
 * queue wakes every waiter; consumers may still drain what was queued before
 * the close.
 */
template <typename T>
class MessageQueue {
 public:
  explicit MessageQueue(size_t _capacity) : maxItems(_capacity), closed(false) {
    if (maxItems == 0) {
      STFATAL << "MessageQueue capacity must be positive";
    }
  }

  /**
   * @brief Blocks until there is room for `item`.
   * @return false if the queue was closed or `token` was cancelled first.
   */
  bool push(T item, const shared_ptr<CancellationToken>& token) {
    std::unique_lock<std::mutex> lock(queueMutex);
    while (!closed && items.size() >= maxItems) {
      if (token && token->isCancelled()) {
        return false;
      }
      notFull.wait_for(lock, std::chrono::milliseconds(10));
    }
    if (closed || (token && token->isCancelled())) {
      return false;
    }
    items.push_back(std::move(item));
    lock.unlock();
    notEmpty.notify_one();
    return true;
  }

  /**
   * @brief Enqueues `item` only if there is room right now.
   */
  bool tryPush(T item) {
    {
      lock_guard<std::mutex> guard(queueMutex);
      if (closed || items.size() >= maxItems) {
        return false;
      }
      items.push_back(std::move(item));
    }
    notEmpty.notify_one();
    return true;
  }

  /**
   * @brief Blocks until an item is available.
   * @return false once the queue is closed and empty, or on cancellation.
   */
  bool pop(T* item, const shared_ptr<CancellationToken>& token) {
    std::unique_lock<std::mutex> lock(queueMutex);
    while (items.empty()) {
      if (closed || (token && token->isCancelled())) {
        return false;
      }
      notEmpty.wait_for(lock, std::chrono::milliseconds(10));
    }
    *item = std::move(items.front());
    items.pop_front();
    lock.unlock();
    notFull.notify_one();
    return true;
  }

  /**
   * @brief Waits at most `timeout` for an item.
   */
  template <class Rep, class Period>
  bool popFor(T* item, const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(queueMutex);
    if (!notEmpty.wait_for(lock, timeout,
                           [this] { return !items.empty() || closed; })) {
      return false;
    }
    if (items.empty()) {
      return false;
    }
    *item = std::move(items.front());
    items.pop_front();
    lock.unlock();
    notFull.notify_one();
    return true;
  }

  bool tryPop(T* item) {
    {
      lock_guard<std::mutex> guard(queueMutex);
      if (items.empty()) {
        return false;
      }
      *item = std::move(items.front());
      items.pop_front();
    }
    notFull.notify_one();
    return true;
  }

  void close() {
    {
      lock_guard<std::mutex> guard(queueMutex);
      closed = true;
    }
    notEmpty.notify_all();
    notFull.notify_all();
  }

  bool isClosed() const {
    lock_guard<std::mutex> guard(queueMutex);
    return closed;
  }

  /** @brief True when closed and nothing is left to consume. */
  bool isDrained() const {
    lock_guard<std::mutex> guard(queueMutex);
    return closed && items.empty();
  }

  size_t size() const {
    lock_guard<std::mutex> guard(queueMutex);
    return items.size();
  }

  size_t capacity() const { return maxItems; }

 protected:
  const size_t maxItems;
  bool closed;
  deque<T> items;
  mutable std::mutex queueMutex;
  std::condition_variable notEmpty;
  std::condition_variable notFull;
};
}  // namespace st

#endif  // __ST_MESSAGE_QUEUE__
