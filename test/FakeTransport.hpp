#ifndef __ST_FAKE_TRANSPORT_HPP__
#define __ST_FAKE_TRANSPORT_HPP__

#include "Transport.hpp"
#include "TransportConnector.hpp"

namespace st {
/**
 * @brief In-memory transport. Every channel it hands out is recorded so a
 * test can play the server: push ServerUpdates into serverMessages and read
 * what the client sent from clientMessages.
 */
class FakeTransport : public Transport {
 public:
  FakeTransport(ConnectionMethod _method, const sshx::OpenResponse& _response)
      : method(_method), response(_response), failOpen(false),
        failChannel(false), closeCalls(0), cleanupCalls(0) {}

  virtual sshx::OpenResponse open(const sshx::OpenRequest& request) {
    lock_guard<std::mutex> guard(fakeMutex);
    openRequests.push_back(request);
    if (failOpen) {
      throw runtime_error("open rejected");
    }
    return response;
  }

  virtual shared_ptr<TransportChannel> channel(
      shared_ptr<CancellationToken>) {
    lock_guard<std::mutex> guard(fakeMutex);
    if (failChannel) {
      throw runtime_error("channel rejected");
    }
    shared_ptr<TransportChannel> newChannel(new TransportChannel());
    channels.push_back(newChannel);
    return newChannel;
  }

  virtual void close(const sshx::CloseRequest& request,
                     std::chrono::milliseconds) {
    lock_guard<std::mutex> guard(fakeMutex);
    closeCalls++;
    closeRequests.push_back(request);
  }

  virtual ConnectionMethod connectionType() const { return method; }

  virtual void cleanup() {
    lock_guard<std::mutex> guard(fakeMutex);
    cleanupCalls++;
  }

  /** @brief Waits until channel number `index` has been opened. */
  shared_ptr<TransportChannel> waitForChannel(size_t index) {
    for (int a = 0; a < 500; a++) {
      {
        lock_guard<std::mutex> guard(fakeMutex);
        if (channels.size() > index) {
          return channels[index];
        }
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return shared_ptr<TransportChannel>();
  }

  size_t numChannels() {
    lock_guard<std::mutex> guard(fakeMutex);
    return channels.size();
  }

  vector<sshx::OpenRequest> getOpenRequests() {
    lock_guard<std::mutex> guard(fakeMutex);
    return openRequests;
  }

  vector<sshx::CloseRequest> getCloseRequests() {
    lock_guard<std::mutex> guard(fakeMutex);
    return closeRequests;
  }

  int getCloseCalls() {
    lock_guard<std::mutex> guard(fakeMutex);
    return closeCalls;
  }

  int getCleanupCalls() {
    lock_guard<std::mutex> guard(fakeMutex);
    return cleanupCalls;
  }

  void setFailOpen(bool fail) {
    lock_guard<std::mutex> guard(fakeMutex);
    failOpen = fail;
  }

  void setFailChannel(bool fail) {
    lock_guard<std::mutex> guard(fakeMutex);
    failChannel = fail;
  }

 protected:
  std::mutex fakeMutex;
  ConnectionMethod method;
  sshx::OpenResponse response;
  bool failOpen;
  bool failChannel;
  int closeCalls;
  int cleanupCalls;
  vector<sshx::OpenRequest> openRequests;
  vector<sshx::CloseRequest> closeRequests;
  vector<shared_ptr<TransportChannel>> channels;
};

/**
 * @brief Hands out FakeTransports and counts dial attempts per method.
 */
class FakeTransportFactory : public TransportFactory {
 public:
  FakeTransportFactory()
      : grpcAvailable(true), webSocketAvailable(true), failNextOpen(false),
        grpcCalls(0), webSocketCalls(0) {
    response.set_name("fake-session");
    response.set_token("fake-token");
    response.set_url("https://sshx.example/s/fake-session");
  }

  virtual shared_ptr<Transport> createGrpc(const string& origin,
                                           std::chrono::milliseconds) {
    lock_guard<std::mutex> guard(factoryMutex);
    grpcCalls++;
    lastOrigin = origin;
    if (!grpcAvailable) {
      throw runtime_error("gRPC unreachable");
    }
    return record(ConnectionMethod::GRPC);
  }

  virtual shared_ptr<Transport> createWebSocket(const string& url,
                                                std::chrono::milliseconds) {
    lock_guard<std::mutex> guard(factoryMutex);
    webSocketCalls++;
    lastWebSocketUrl = url;
    if (!webSocketAvailable) {
      throw runtime_error("WebSocket unreachable");
    }
    return record(ConnectionMethod::WEBSOCKET);
  }

  shared_ptr<FakeTransport> waitForTransport(size_t index) {
    for (int a = 0; a < 500; a++) {
      {
        lock_guard<std::mutex> guard(factoryMutex);
        if (transports.size() > index) {
          return transports[index];
        }
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return shared_ptr<FakeTransport>();
  }

  size_t numTransports() {
    lock_guard<std::mutex> guard(factoryMutex);
    return transports.size();
  }

  int getGrpcCalls() {
    lock_guard<std::mutex> guard(factoryMutex);
    return grpcCalls;
  }

  int getWebSocketCalls() {
    lock_guard<std::mutex> guard(factoryMutex);
    return webSocketCalls;
  }

  string getLastWebSocketUrl() {
    lock_guard<std::mutex> guard(factoryMutex);
    return lastWebSocketUrl;
  }

  void setGrpcAvailable(bool available) {
    lock_guard<std::mutex> guard(factoryMutex);
    grpcAvailable = available;
  }

  void setWebSocketAvailable(bool available) {
    lock_guard<std::mutex> guard(factoryMutex);
    webSocketAvailable = available;
  }

  /** @brief Makes the next transport of either kind reject Open. */
  void setFailNextOpen(bool fail) {
    lock_guard<std::mutex> guard(factoryMutex);
    failNextOpen = fail;
  }

  sshx::OpenResponse response;

 protected:
  shared_ptr<Transport> record(ConnectionMethod method) {
    shared_ptr<FakeTransport> transport(new FakeTransport(method, response));
    if (failNextOpen) {
      transport->setFailOpen(true);
      failNextOpen = false;
    }
    transports.push_back(transport);
    return transport;
  }

  std::mutex factoryMutex;
  bool grpcAvailable;
  bool webSocketAvailable;
  bool failNextOpen;
  int grpcCalls;
  int webSocketCalls;
  string lastOrigin;
  string lastWebSocketUrl;
  vector<shared_ptr<FakeTransport>> transports;
};
}  // namespace st

#endif  // __ST_FAKE_TRANSPORT_HPP__
