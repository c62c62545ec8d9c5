#ifndef __ST_PSEUDO_USER_TERMINAL_HPP__
#define __ST_PSEUDO_USER_TERMINAL_HPP__

#include "UserTerminal.hpp"

namespace st {
/**
 * @brief UserTerminal backed by forkpty(3).
 */
class PseudoUserTerminal : public UserTerminal {
 public:
  PseudoUserTerminal() : pid(-1), masterFd(-1) {}
  virtual ~PseudoUserTerminal() { close(); }

  virtual void setup(const string& shell, uint16_t rows, uint16_t cols) {
    winsize initialSize;
    memset(&initialSize, 0, sizeof(winsize));
    initialSize.ws_row = rows;
    initialSize.ws_col = cols;

    pid_t childPid = forkpty(&masterFd, NULL, NULL, &initialSize);
    switch (childPid) {
      case -1:
        throw runtime_error(string("forkpty failed: ") + strerror(errno));
      case 0: {
        runTerminal(shell);
        _exit(127);
      }
      default: {
        // parent
        pid = childPid;
        break;
      }
    }
    FATAL_FAIL(fcntl(masterFd, F_SETFD, FD_CLOEXEC));
    VLOG(1) << "Spawned " << shell << " as pid " << pid;
  }

  virtual int getFd() { return masterFd; }

  virtual void write(const string& data) {
    size_t written = 0;
    while (written < data.length()) {
      ssize_t rc =
          ::write(masterFd, data.data() + written, data.length() - written);
      if (rc < 0) {
        if (errno == EINTR || errno == EAGAIN) {
          continue;
        }
        throw runtime_error(string("terminal write failed: ") +
                            strerror(errno));
      }
      written += rc;
    }
  }

  virtual void setWinsize(uint16_t rows, uint16_t cols) {
    winsize tmpwin;
    memset(&tmpwin, 0, sizeof(winsize));
    tmpwin.ws_row = rows;
    tmpwin.ws_col = cols;
    if (ioctl(masterFd, TIOCSWINSZ, &tmpwin) == -1) {
      throw runtime_error(string("terminal resize failed: ") +
                          strerror(errno));
    }
  }

  virtual void close() {
    if (masterFd >= 0) {
      ::close(masterFd);
      masterFd = -1;
    }
    if (pid <= 0) {
      return;
    }
    ::kill(pid, SIGHUP);
    int status;
    // Give the shell two seconds to exit before killing it
    for (int a = 0; a < 200; a++) {
      pid_t rc = waitpid(pid, &status, WNOHANG);
      if (rc == pid || (rc == -1 && errno == ECHILD)) {
        pid = -1;
        return;
      }
      usleep(10 * 1000);
    }
    LOG(WARNING) << "Shell " << pid << " ignored SIGHUP, killing";
    ::kill(pid, SIGKILL);
    waitpid(pid, &status, 0);
    pid = -1;
  }

  pid_t getPid() { return pid; }

 protected:
  void runTerminal(const string& shell) {
    setenv("TERM", "xterm-256color", 1);
    setenv("COLORTERM", "truecolor", 1);
    setenv("TERM_PROGRAM", "shareterm", 1);
    setenv("TERM_PROGRAM_VERSION", ST_VERSION, 1);
    // Shells remember the inherited SIGCHLD disposition as the "original
    // value", so make sure it is the default before exec.
    signal(SIGCHLD, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
    sigset_t emptySet;
    sigemptyset(&emptySet);
    sigprocmask(SIG_SETMASK, &emptySet, NULL);
    execl(shell.c_str(), shell.c_str(), (char*)NULL);
    fprintf(stderr, "Could not start %s: %s\n", shell.c_str(),
            strerror(errno));
  }

  pid_t pid;
  int masterFd;
};
}  // namespace st

#endif  // __ST_PSEUDO_USER_TERMINAL_HPP__
