#ifndef __ST_ECHO_RUNNER__
#define __ST_ECHO_RUNNER__

#include "Runner.hpp"

namespace st {
/**
 * @brief Shell stand-in that echoes viewer input back as output.
 *
 * Exercises the framing and encryption path without spawning a process.
 * Sync and resize items are ignored.
 */
class EchoRunner : public Runner {
 public:
  virtual void run(uint32_t id, shared_ptr<StreamCipher> cipher,
                   shared_ptr<ShellQueue> input, shared_ptr<OutputQueue> output,
                   shared_ptr<CancellationToken> token);
};
}  // namespace st

#endif  // __ST_ECHO_RUNNER__
