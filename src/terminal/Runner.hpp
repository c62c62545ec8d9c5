#ifndef __ST_RUNNER__
#define __ST_RUNNER__

#include "CancellationToken.hpp"
#include "Headers.hpp"
#include "MessageQueue.hpp"
#include "ShellData.hpp"
#include "StreamCipher.hpp"

namespace st {
typedef MessageQueue<ShellData> ShellQueue;
typedef MessageQueue<sshx::ClientUpdate> OutputQueue;

/**
 * @brief Drives one shell of a session.
 */
class Runner {
 public:
  virtual ~Runner() {}

  /**
   * @brief Runs shell `id` until it ends, `input` is closed, or `token` is
   * cancelled.
   * @param cipher Session cipher, used to encrypt the shell's output stream.
   * @param input Items routed to this shell by the controller.
   * @param output Shared queue of messages bound for the server.
   * @throws runtime_error if the shell fails or its process exits.
   */
  virtual void run(uint32_t id, shared_ptr<StreamCipher> cipher,
                   shared_ptr<ShellQueue> input, shared_ptr<OutputQueue> output,
                   shared_ptr<CancellationToken> token) = 0;
};
}  // namespace st

#endif  // __ST_RUNNER__
