#ifndef __ST_WEB_SOCKET_CONNECTION__
#define __ST_WEB_SOCKET_CONNECTION__

#include "Headers.hpp"

namespace st {
/**
 * @brief An established client WebSocket.
 *
 * Frames are delivered on an internal io thread, so handlers must not call
 * close() and should return quickly.
 */
class WebSocketConnection {
 public:
  typedef function<void(const string& frame, bool binary)> MessageHandler;
  typedef function<void(const string& reason)> CloseHandler;

  virtual ~WebSocketConnection() {}

  /**
   * @brief Begins reading. `onClose` runs once when the connection dies,
   * whether from the peer, a failed write or a missed keepalive.
   */
  virtual void start(MessageHandler onMessage, CloseHandler onClose) = 0;

  /**
   * @brief Queues a text frame. Frames are written in call order.
   * @throws runtime_error if the connection is already closed.
   */
  virtual void send(const string& frame) = 0;

  /** @brief Sends a close frame and stops the io thread. Idempotent. */
  virtual void close() = 0;

  virtual bool isOpen() const = 0;
};

typedef function<shared_ptr<WebSocketConnection>(
    const string& url, std::chrono::milliseconds timeout)>
    WebSocketConnector;
}  // namespace st

#endif  // __ST_WEB_SOCKET_CONNECTION__
