#ifndef __ST_BEAST_WEB_SOCKET_CONNECTION__
#define __ST_BEAST_WEB_SOCKET_CONNECTION__

#include "WebSocketConnection.hpp"

namespace st {
struct WebSocketUrl {
  bool secure;
  string host;
  string port;
  string target;
};

/**
 * @brief Splits a ws:// or wss:// url. Ports default to 80 and 443.
 * @throws runtime_error for other schemes or a missing host.
 */
WebSocketUrl parseWebSocketUrl(const string& url);

/**
 * @brief Dials `url` with Boost.Beast, completing TCP, TLS and the WebSocket
 * handshake within `timeout`.
 *
 * The connection pings every 30 seconds and is considered dead when nothing
 * arrives for 120 seconds.
 * @throws runtime_error if any step fails or times out.
 */
shared_ptr<WebSocketConnection> connectWebSocket(
    const string& url, std::chrono::milliseconds timeout);
}  // namespace st

#endif  // __ST_BEAST_WEB_SOCKET_CONNECTION__
