#include "ShellRunner.hpp"

#include "PseudoUserTerminal.hpp"

namespace st {
namespace {
const int READ_BUFFER_SIZE = 4096;
const int POLL_INTERVAL_US = 10 * 1000;
}  // namespace

ShellRunner::ShellRunner(const string& _shell,
                         TerminalFactory _terminalFactory)
    : shell(_shell), terminalFactory(_terminalFactory) {
  if (!terminalFactory) {
    terminalFactory = []() {
      return shared_ptr<UserTerminal>(new PseudoUserTerminal());
    };
  }
}

string ShellRunner::defaultShell() {
  const char* envShell = ::getenv("SHELL");
  if (envShell != NULL && envShell[0] != '\0') {
    return string(envShell);
  }
  for (const char* candidate :
       {"/bin/bash", "/bin/sh", "/usr/local/bin/bash", "/usr/local/bin/sh"}) {
    if (::access(candidate, X_OK) == 0) {
      return string(candidate);
    }
  }
  return "sh";
}

void ShellRunner::run(uint32_t id, shared_ptr<StreamCipher> cipher,
                      shared_ptr<ShellQueue> input,
                      shared_ptr<OutputQueue> output,
                      shared_ptr<CancellationToken> token) {
  shared_ptr<UserTerminal> terminal = terminalFactory();
  terminal->setup(shell, INITIAL_ROWS, INITIAL_COLS);

  ShellState state;
  char buf[READ_BUFFER_SIZE];
  bool exited = false;
  bool closedByServer = false;
  try {
    while (!exited && !closedByServer && !token->isCancelled()) {
      int fd = terminal->getFd();
      fd_set rfd;
      FD_ZERO(&rfd);
      FD_SET(fd, &rfd);
      timeval tv;
      tv.tv_sec = 0;
      // Keep draining the backlog without waiting when the server is behind
      tv.tv_usec = state.hasPendingOutput() ? 0 : POLL_INTERVAL_US;
      int rc = ::select(fd + 1, &rfd, NULL, NULL, &tv);
      if (rc < 0 && errno != EINTR) {
        throw runtime_error(string("select failed: ") + strerror(errno));
      }

      if (rc > 0 && FD_ISSET(fd, &rfd)) {
        ssize_t bytesRead = ::read(fd, buf, sizeof(buf));
        if (bytesRead > 0) {
          state.appendOutput(buf, bytesRead);
        } else if (bytesRead == 0 || errno == EIO) {
          // Linux reports EIO on the master once the child is gone
          VLOG(1) << "Shell " << id << " exited";
          exited = true;
        } else if (errno != EINTR && errno != EAGAIN) {
          throw runtime_error(string("terminal read failed: ") +
                              strerror(errno));
        }
      }

      ShellData item;
      while (input->tryPop(&item)) {
        switch (item.type) {
          case ShellData::DATA:
            terminal->write(item.data);
            break;
          case ShellData::SYNC:
            state.applySync(item.seq);
            break;
          case ShellData::SIZE:
            try {
              terminal->setWinsize(uint16_t(item.rows), uint16_t(item.cols));
            } catch (const runtime_error& err) {
              LOG(WARNING) << "Shell " << id << ": " << err.what();
            }
            break;
        }
      }
      if (input->isDrained()) {
        VLOG(1) << "Shell " << id << " closed by server";
        closedByServer = true;
      }

      if (!flush(id, &state, *cipher, output, token)) {
        break;
      }
      state.prune();
    }

    if (exited) {
      // Send whatever the shell printed last
      while (state.hasPendingOutput() &&
             flush(id, &state, *cipher, output, token)) {
      }
      throw runtime_error("shell process exited");
    }
  } catch (const runtime_error& err) {
    terminal->close();
    throw;
  }
  terminal->close();
}

bool ShellRunner::flush(uint32_t id, ShellState* state,
                        const StreamCipher& cipher,
                        const shared_ptr<OutputQueue>& output,
                        const shared_ptr<CancellationToken>& token) {
  string plaintext;
  uint64_t offset;
  if (!state->nextChunk(&plaintext, &offset)) {
    return true;
  }
  sshx::ClientUpdate update;
  sshx::TerminalData* data = update.mutable_data();
  data->set_id(id);
  data->set_data(
      cipher.segment(SHELL_OUTPUT_STREAM_BASE | id, offset, plaintext));
  data->set_seq(offset);
  return output->push(update, token);
}
}  // namespace st
