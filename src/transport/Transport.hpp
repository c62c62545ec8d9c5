#ifndef __ST_TRANSPORT__
#define __ST_TRANSPORT__

#include "CancellationToken.hpp"
#include "Headers.hpp"
#include "MessageQueue.hpp"

namespace st {
enum class ConnectionMethod { GRPC, WEBSOCKET };

inline string connectionMethodName(ConnectionMethod method) {
  switch (method) {
    case ConnectionMethod::GRPC:
      return "grpc";
    case ConnectionMethod::WEBSOCKET:
      return "websocket";
  }
  return "unknown";
}

/**
 * @brief The two halves of one streaming attempt.
 *
 * The controller pops from serverMessages and pushes to clientMessages. The
 * transport closes serverMessages when the server side ends or fails, and
 * stops forwarding once clientMessages is closed.
 */
class TransportChannel {
 public:
  TransportChannel()
      : serverMessages(new MessageQueue<sshx::ServerUpdate>(
            TRANSPORT_QUEUE_CAPACITY)),
        clientMessages(new MessageQueue<sshx::ClientUpdate>(
            TRANSPORT_QUEUE_CAPACITY)) {}

  virtual ~TransportChannel() {}

  shared_ptr<MessageQueue<sshx::ServerUpdate>> serverMessages;
  shared_ptr<MessageQueue<sshx::ClientUpdate>> clientMessages;
};

/**
 * @brief Session RPCs over one kind of wire connection.
 *
 * All methods report failures by throwing runtime_error.
 */
class Transport {
 public:
  virtual ~Transport() {}

  virtual sshx::OpenResponse open(const sshx::OpenRequest& request) = 0;

  /**
   * @brief Starts a bidirectional stream.
   *
   * The returned channel stops forwarding when `token` is cancelled. The
   * first client message is expected to be a Hello.
   */
  virtual shared_ptr<TransportChannel> channel(
      shared_ptr<CancellationToken> token) = 0;

  /**
   * @brief Ends the session on the server, giving up after `timeout`.
   */
  virtual void close(const sshx::CloseRequest& request,
                     std::chrono::milliseconds timeout) = 0;

  virtual ConnectionMethod connectionType() const = 0;

  /** @brief Releases the connection. Safe to call more than once. */
  virtual void cleanup() = 0;
};
}  // namespace st

#endif  // __ST_TRANSPORT__
