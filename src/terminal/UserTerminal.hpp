#ifndef __ST_USER_TERMINAL_HPP__
#define __ST_USER_TERMINAL_HPP__

#include "Headers.hpp"

namespace st {
/**
 * @brief Abstract terminal that runs a shell and is observed through a fd.
 *
 * Failures are reported by throwing std::runtime_error.
 */
class UserTerminal {
 public:
  virtual ~UserTerminal() {}

  /**
   * @brief Starts `shell` attached to a new terminal of the given size.
   */
  virtual void setup(const string& shell, uint16_t rows, uint16_t cols) = 0;
  /** @brief Returns the descriptor that can be polled for terminal output.
   * A read of 0 bytes or EIO means the shell has exited. */
  virtual int getFd() = 0;
  /** @brief Writes all of `data` to the terminal input. */
  virtual void write(const string& data) = 0;
  /** @brief Applies a new window geometry to the running terminal. */
  virtual void setWinsize(uint16_t rows, uint16_t cols) = 0;
  /** @brief Ends the shell and reclaims the terminal. Safe to call twice. */
  virtual void close() = 0;
};
}  // namespace st

#endif  // __ST_USER_TERMINAL_HPP__
