#ifndef __ST_PENDING_REQUESTS__
#define __ST_PENDING_REQUESTS__

#include "CancellationToken.hpp"
#include "Headers.hpp"

namespace st {
/**
 * @brief Correlates WebSocket requests with their responses.
 *
 * Each outstanding request owns a one-shot slot keyed by its id. The table
 * belongs to a single transport instance.
 */
class PendingRequests {
 public:
  PendingRequests() : nextId(0), failed(false) {}

  /** @brief Allocates a fresh "req_<n>" id and registers its slot. */
  string registerRequest();

  /**
   * @brief Waits for the response to `id` and removes the slot.
   * @throws runtime_error on timeout, cancellation of `token`, or if the
   * table was failed.
   */
  sshx::CliResponse waitFor(
      const string& id, std::chrono::milliseconds timeout,
      shared_ptr<CancellationToken> token = shared_ptr<CancellationToken>());

  /**
   * @brief Hands `response` to its waiter.
   * @return false if no request with that id is outstanding.
   */
  bool deliver(const sshx::CliResponse& response);

  /** @brief Drops a slot whose request could not be sent. */
  void cancel(const string& id);

  /** @brief Wakes every waiter with `reason`; later waits fail at once. */
  void failAll(const string& reason);

  size_t size() const;

 protected:
  struct Slot {
    Slot() : ready(false) {}
    bool ready;
    sshx::CliResponse response;
  };

  uint64_t nextId;
  bool failed;
  string failure;
  map<string, shared_ptr<Slot>> slots;
  mutable std::mutex slotMutex;
  std::condition_variable slotReady;
};
}  // namespace st

#endif  // __ST_PENDING_REQUESTS__
