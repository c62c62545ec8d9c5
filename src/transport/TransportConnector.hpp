#ifndef __ST_TRANSPORT_CONNECTOR__
#define __ST_TRANSPORT_CONNECTOR__

#include "Transport.hpp"

namespace st {
struct ConnectionConfig {
  ConnectionConfig()
      : verboseErrors(false), grpcTimeout(3000), webSocketTimeout(5000) {}

  bool verboseErrors;
  std::chrono::milliseconds grpcTimeout;
  std::chrono::milliseconds webSocketTimeout;
};

/**
 * @brief Creates connected transports. Overridden in tests.
 */
class TransportFactory {
 public:
  virtual ~TransportFactory() {}

  /** @brief Dials gRPC and waits until the channel is ready. */
  virtual shared_ptr<Transport> createGrpc(const string& origin,
                                           std::chrono::milliseconds timeout);

  /** @brief Dials the WebSocket endpoint at `url`. */
  virtual shared_ptr<Transport> createWebSocket(
      const string& url, std::chrono::milliseconds timeout);
};

/**
 * @brief Picks a transport for a server and remembers which one worked.
 *
 * The first connection tries gRPC and falls back to WebSocket. Later
 * connections use the remembered method directly.
 */
class TransportConnector {
 public:
  TransportConnector(const string& _origin, const string& _sessionName,
                     const ConnectionConfig& _config,
                     shared_ptr<TransportFactory> _factory =
                         shared_ptr<TransportFactory>(new TransportFactory()));

  /**
   * @brief Opens the session over gRPC, or over WebSocket if gRPC fails.
   *
   * The Open call doubles as the reachability check, so no throwaway
   * session is created on the server.
   * @throws runtime_error if both transports fail.
   */
  shared_ptr<Transport> connectWithFallback(const sshx::OpenRequest& request,
                                            sshx::OpenResponse* response);

  /**
   * @brief Creates a fresh transport with the remembered method.
   * @throws runtime_error if no method is known yet or dialing fails.
   */
  shared_ptr<Transport> reconnect();

  bool hasMethod() const { return method.has_value(); }
  ConnectionMethod getMethod() const;
  const string& getWebSocketUrl() const { return webSocketUrl; }

  /**
   * @brief https becomes wss, http becomes ws, and /api/cli/<name> is
   * appended after trimming a trailing slash.
   */
  static string grpcToWebSocketUrl(const string& origin,
                                   const string& sessionName);

 protected:
  shared_ptr<Transport> tryGrpc(const sshx::OpenRequest& request,
                                sshx::OpenResponse* response);
  shared_ptr<Transport> tryWebSocket(const sshx::OpenRequest& request,
                                     sshx::OpenResponse* response);

  string origin;
  string webSocketUrl;
  ConnectionConfig config;
  shared_ptr<TransportFactory> factory;
  optional<ConnectionMethod> method;
};
}  // namespace st

#endif  // __ST_TRANSPORT_CONNECTOR__
