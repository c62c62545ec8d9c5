#include "TransportConnector.hpp"

#include "GrpcTransport.hpp"
#include "WebSocketTransport.hpp"

namespace st {
shared_ptr<Transport> TransportFactory::createGrpc(
    const string& origin, std::chrono::milliseconds timeout) {
  shared_ptr<GrpcTransport> transport(new GrpcTransport(origin, timeout));
  transport->connect();
  return transport;
}

shared_ptr<Transport> TransportFactory::createWebSocket(
    const string& url, std::chrono::milliseconds timeout) {
  shared_ptr<WebSocketTransport> transport(
      new WebSocketTransport(url, timeout));
  transport->connect();
  return transport;
}

TransportConnector::TransportConnector(const string& _origin,
                                       const string& _sessionName,
                                       const ConnectionConfig& _config,
                                       shared_ptr<TransportFactory> _factory)
    : origin(_origin),
      webSocketUrl(grpcToWebSocketUrl(_origin, _sessionName)),
      config(_config),
      factory(_factory) {}

shared_ptr<Transport> TransportConnector::connectWithFallback(
    const sshx::OpenRequest& request, sshx::OpenResponse* response) {
  LOG(INFO) << "Connecting to " << origin;
  shared_ptr<Transport> transport = tryGrpc(request, response);
  if (transport.get() == NULL) {
    transport = tryWebSocket(request, response);
  }
  method = transport->connectionType();
  LOG(INFO) << "Connected to " << origin << " using "
            << connectionMethodName(*method);
  return transport;
}

shared_ptr<Transport> TransportConnector::tryGrpc(
    const sshx::OpenRequest& request, sshx::OpenResponse* response) {
  VLOG(1) << "Trying gRPC with a timeout of " << config.grpcTimeout.count()
          << "ms";
  shared_ptr<Transport> transport;
  try {
    transport = factory->createGrpc(origin, config.grpcTimeout);
    *response = transport->open(request);
    return transport;
  } catch (const runtime_error& err) {
    if (transport) {
      transport->cleanup();
    }
    if (config.verboseErrors) {
      LOG(WARNING) << "gRPC connection to " << origin
                   << " failed, trying WebSocket: " << err.what();
    } else {
      LOG(INFO) << "gRPC unavailable, trying WebSocket: " << err.what();
    }
  }
  return shared_ptr<Transport>();
}

shared_ptr<Transport> TransportConnector::tryWebSocket(
    const sshx::OpenRequest& request, sshx::OpenResponse* response) {
  VLOG(1) << "Trying WebSocket at " << webSocketUrl << " with a timeout of "
          << config.webSocketTimeout.count() << "ms";
  shared_ptr<Transport> transport;
  try {
    transport = factory->createWebSocket(webSocketUrl, config.webSocketTimeout);
    *response = transport->open(request);
    return transport;
  } catch (const runtime_error& err) {
    if (transport) {
      transport->cleanup();
    }
    if (config.verboseErrors) {
      LOG(ERROR) << "WebSocket fallback to " << webSocketUrl
                 << " also failed: " << err.what();
    }
    throw runtime_error("Both gRPC and WebSocket connections failed for " +
                        origin + ": " + err.what());
  }
}

shared_ptr<Transport> TransportConnector::reconnect() {
  switch (getMethod()) {
    case ConnectionMethod::GRPC:
      return factory->createGrpc(origin, config.grpcTimeout);
    case ConnectionMethod::WEBSOCKET:
      return factory->createWebSocket(webSocketUrl, config.webSocketTimeout);
  }
  throw runtime_error("Unknown connection method");
}

ConnectionMethod TransportConnector::getMethod() const {
  if (!method) {
    throw runtime_error("No connection method has been established");
  }
  return *method;
}

string TransportConnector::grpcToWebSocketUrl(const string& origin,
                                              const string& sessionName) {
  string url = origin;
  if (startsWith(url, "https://")) {
    url = "wss://" + url.substr(8);
  } else if (startsWith(url, "http://")) {
    url = "ws://" + url.substr(7);
  }
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url + "/api/cli/" + sessionName;
}
}  // namespace st
