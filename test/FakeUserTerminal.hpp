#ifndef __ST_FAKE_USER_TERMINAL_HPP__
#define __ST_FAKE_USER_TERMINAL_HPP__

#include "UserTerminal.hpp"

namespace st {
/**
 * @brief Terminal backed by a socketpair. The test plays the shell on the
 * other end: what it writes shows up as output, and input written by the
 * runner can be read back from it.
 */
class FakeUserTerminal : public UserTerminal {
 public:
  FakeUserTerminal()
      : shellFd(-1), terminalFd(-1), rows(0), cols(0), closed(false),
        failResize(false) {
    int fds[2];
    FATAL_FAIL(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    terminalFd = fds[0];
    shellFd = fds[1];
  }

  virtual ~FakeUserTerminal() {
    close();
    closeShellSide();
  }

  virtual void setup(const string& shell, uint16_t _rows, uint16_t _cols) {
    lock_guard<std::mutex> guard(stateMutex);
    shellPath = shell;
    rows = _rows;
    cols = _cols;
  }

  virtual int getFd() { return terminalFd; }

  virtual void write(const string& data) {
    size_t written = 0;
    while (written < data.length()) {
      ssize_t rc = ::write(terminalFd, data.data() + written,
                           data.length() - written);
      if (rc < 0) {
        throw runtime_error(string("fake terminal write failed: ") +
                            strerror(errno));
      }
      written += rc;
    }
  }

  virtual void setWinsize(uint16_t _rows, uint16_t _cols) {
    lock_guard<std::mutex> guard(stateMutex);
    if (failResize) {
      throw runtime_error("resize rejected");
    }
    rows = _rows;
    cols = _cols;
  }

  virtual void close() {
    lock_guard<std::mutex> guard(stateMutex);
    if (terminalFd >= 0) {
      ::close(terminalFd);
      terminalFd = -1;
    }
    closed = true;
  }

  /** @brief Emits `data` as if the shell printed it. */
  void shellPrints(const string& data) {
    FATAL_FAIL(::write(shellFd, data.data(), data.length()));
  }

  /** @brief Reads exactly `length` bytes of input sent to the shell. */
  string shellReads(size_t length) {
    string result;
    char buf[1024];
    while (result.length() < length) {
      ssize_t rc = ::read(shellFd, buf,
                          std::min(sizeof(buf), length - result.length()));
      if (rc <= 0) {
        break;
      }
      result.append(buf, rc);
    }
    return result;
  }

  /** @brief Simulates the shell exiting. */
  void closeShellSide() {
    if (shellFd >= 0) {
      ::close(shellFd);
      shellFd = -1;
    }
  }

  bool isClosed() {
    lock_guard<std::mutex> guard(stateMutex);
    return closed;
  }

  pair<uint16_t, uint16_t> getSize() {
    lock_guard<std::mutex> guard(stateMutex);
    return make_pair(rows, cols);
  }

  void setFailResize(bool fail) {
    lock_guard<std::mutex> guard(stateMutex);
    failResize = fail;
  }

  string getShellPath() {
    lock_guard<std::mutex> guard(stateMutex);
    return shellPath;
  }

 protected:
  std::mutex stateMutex;
  int shellFd;
  int terminalFd;
  string shellPath;
  uint16_t rows;
  uint16_t cols;
  bool closed;
  bool failResize;
};
}  // namespace st

#endif  // __ST_FAKE_USER_TERMINAL_HPP__
