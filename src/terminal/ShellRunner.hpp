#ifndef __ST_SHELL_RUNNER__
#define __ST_SHELL_RUNNER__

#include "Runner.hpp"
#include "ShellState.hpp"
#include "UserTerminal.hpp"

namespace st {
/**
 * @brief Runs a real shell on a pseudo terminal and streams its output.
 *
 * A single thread multiplexes terminal reads and inbound items, then flushes
 * at most one chunk and prunes the backlog on every pass.
 */
class ShellRunner : public Runner {
 public:
  static constexpr uint16_t INITIAL_ROWS = 24;
  static constexpr uint16_t INITIAL_COLS = 80;

  typedef function<shared_ptr<UserTerminal>()> TerminalFactory;

  /**
   * @param _shell Path of the shell to launch.
   * @param _terminalFactory Creates the terminal for each shell. Defaults to a
   * forkpty backed terminal.
   */
  explicit ShellRunner(const string& _shell,
                       TerminalFactory _terminalFactory = TerminalFactory());

  virtual void run(uint32_t id, shared_ptr<StreamCipher> cipher,
                   shared_ptr<ShellQueue> input, shared_ptr<OutputQueue> output,
                   shared_ptr<CancellationToken> token);

  const string& getShell() const { return shell; }

  /** @brief $SHELL, else the first of /bin/bash and /bin/sh that exists. */
  static string defaultShell();

 protected:
  /**
   * @brief Sends the next pending chunk, if any.
   * @return false if the output queue was closed or cancelled.
   */
  bool flush(uint32_t id, ShellState* state, const StreamCipher& cipher,
             const shared_ptr<OutputQueue>& output,
             const shared_ptr<CancellationToken>& token);

  string shell;
  TerminalFactory terminalFactory;
};
}  // namespace st

#endif  // __ST_SHELL_RUNNER__
