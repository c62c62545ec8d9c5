#ifndef __ST_WEB_SOCKET_TRANSPORT__
#define __ST_WEB_SOCKET_TRANSPORT__

#include "PendingRequests.hpp"
#include "Transport.hpp"
#include "WebSocketConnection.hpp"

namespace st {
class WebSocketTransport;

/**
 * @brief Channel half of the WebSocket transport.
 *
 * A sender thread turns the Hello into a startChannel request, waits for the
 * server to accept it, then streams every other client update. Heartbeats
 * are dropped. Server pushes are routed into serverMessages by the
 * transport.
 */
class WebSocketTransportChannel : public TransportChannel {
 public:
  WebSocketTransportChannel(WebSocketTransport* _transport,
                            shared_ptr<CancellationToken> _token);
  virtual ~WebSocketTransportChannel();

  const shared_ptr<CancellationToken>& getToken() const { return token; }

 protected:
  void sendLoop();
  bool startChannel(const sshx::ClientUpdate& hello);

  WebSocketTransport* transport;
  shared_ptr<CancellationToken> token;
  std::thread senderThread;
};

class WebSocketTransport : public Transport {
 public:
  static constexpr int REQUEST_TIMEOUT_MS = 30 * 1000;

  /**
   * @param _url Full ws:// or wss:// url, including /api/cli/<name>.
   * @param _timeout Bound for establishing the connection.
   * @param _connector Dials the socket. Defaults to Boost.Beast.
   */
  WebSocketTransport(const string& _url, std::chrono::milliseconds _timeout,
                     WebSocketConnector _connector = WebSocketConnector());
  virtual ~WebSocketTransport() { cleanup(); }

  /**
   * @brief Dials the server and starts receiving.
   * @throws runtime_error if the connection cannot be established.
   */
  void connect();

  virtual sshx::OpenResponse open(const sshx::OpenRequest& request);
  virtual shared_ptr<TransportChannel> channel(
      shared_ptr<CancellationToken> token);
  virtual void close(const sshx::CloseRequest& request,
                     std::chrono::milliseconds closeTimeout);
  virtual ConnectionMethod connectionType() const {
    return ConnectionMethod::WEBSOCKET;
  }
  virtual void cleanup();

  const string& getUrl() const { return url; }

 protected:
  friend class WebSocketTransportChannel;

  /**
   * @brief Sends `request` under a fresh correlation id and waits for the
   * answer.
   */
  sshx::CliResponse request(sshx::CliRequest request,
                            std::chrono::milliseconds timeout,
                            shared_ptr<CancellationToken> token =
                                shared_ptr<CancellationToken>());
  void sendFrame(const string& frame);
  void handleFrame(const string& frame, bool binary);
  void handleClose(const string& reason);

  string url;
  std::chrono::milliseconds timeout;
  WebSocketConnector connector;
  PendingRequests pending;

  std::mutex transportMutex;
  shared_ptr<WebSocketConnection> connection;
  // Destination of server pushes for the active channel
  shared_ptr<MessageQueue<sshx::ServerUpdate>> inbox;
  shared_ptr<CancellationToken> inboxToken;
};
}  // namespace st

#endif  // __ST_WEB_SOCKET_TRANSPORT__
