#ifndef __ST_CONTROLLER__
#define __ST_CONTROLLER__

#include "CancellationToken.hpp"
#include "Headers.hpp"
#include "MessageQueue.hpp"
#include "Runner.hpp"
#include "StreamCipher.hpp"
#include "Transport.hpp"
#include "TransportConnector.hpp"

namespace st {
struct ControllerConfig {
  ControllerConfig()
      : enableReaders(false),
        heartbeatInterval(HEARTBEAT_INTERVAL * 1000),
        reconnectInterval(RECONNECT_INTERVAL * 1000),
        backoffUnit(1000) {}

  string origin;
  // Requested session name, usually user@host
  string name;
  bool enableReaders;
  shared_ptr<Runner> runner;
  ConnectionConfig connection;

  std::chrono::milliseconds heartbeatInterval;
  std::chrono::milliseconds reconnectInterval;
  // Duration of one backoff step
  std::chrono::milliseconds backoffUnit;
};

/**
 * @brief Owns a shared session: opens it, keeps a channel to the server
 * alive and runs one shell per CreateShell request.
 *
 * run() reconnects with backoff until close() is called. Shell threads push
 * into a shared output queue which run() forwards to the active channel.
 */
class Controller {
 public:
  explicit Controller(const ControllerConfig& _config,
                      shared_ptr<TransportFactory> _factory =
                          shared_ptr<TransportFactory>(new TransportFactory()));
  virtual ~Controller();

  /**
   * @brief Generates the session keys, connects and opens the session.
   * @throws runtime_error if neither transport can open the session.
   */
  void open();

  /** @brief Streams until close() is called. */
  void run();

  /**
   * @brief Stops run() and every shell, then ends the session on the server.
   * Best effort and idempotent.
   */
  void close();

  /** @brief Viewer url including the encryption key fragment. */
  const string& url() const { return sessionUrl; }
  /** @brief Url with write access, present when readers are enabled. */
  const optional<string>& writeUrl() const { return writeSessionUrl; }
  const string& encryptionKey() const { return encryptionKeyValue; }
  /** @brief Session name assigned by the server. */
  const string& name() const { return sessionName; }
  ConnectionMethod connectionMethod() const;

  size_t numShells();
  /** @brief Shell threads that have not been joined yet. */
  size_t numShellThreads();

 protected:
  /**
   * @brief One streaming attempt. Returns normally when the reconnect
   * interval elapses or on cancellation.
   * @throws runtime_error when the channel fails.
   */
  void tryChannel(const shared_ptr<CancellationToken>& attemptToken);
  void handleServerMessage(const sshx::ServerUpdate& message,
                           const shared_ptr<TransportChannel>& channel,
                           const shared_ptr<CancellationToken>& attemptToken);
  void sendToChannel(const shared_ptr<TransportChannel>& channel,
                     const sshx::ClientUpdate& update,
                     const shared_ptr<CancellationToken>& attemptToken);
  void sendClosedShell(uint32_t id,
                       const shared_ptr<TransportChannel>& channel,
                       const shared_ptr<CancellationToken>& attemptToken);
  /** @brief Must be called with shellMutex held. */
  void spawnShellTask(uint32_t id, int32_t x, int32_t y);
  void runShell(uint32_t id, int32_t x, int32_t y,
                shared_ptr<ShellQueue> queue);
  shared_ptr<ShellQueue> findShell(uint32_t id);
  void refreshTransport();
  shared_ptr<Transport> currentTransport();
  /** @brief Joins shell threads that have finished running. */
  void reapShellThreads();
  void joinShells();

  ControllerConfig config;
  shared_ptr<TransportFactory> factory;
  shared_ptr<TransportConnector> connector;
  shared_ptr<CancellationToken> cancellationToken;
  shared_ptr<OutputQueue> outputQueue;
  shared_ptr<StreamCipher> cipher;

  string encryptionKeyValue;
  optional<string> writePassword;
  string sessionName;
  string sessionToken;
  string sessionUrl;
  optional<string> writeSessionUrl;

  std::mutex transportMutex;
  shared_ptr<Transport> transport;
  bool transportStale;

  std::mutex shellMutex;
  map<uint32_t, shared_ptr<ShellQueue>> shells;

  std::mutex threadMutex;
  map<std::thread::id, std::thread> shellThreads;
  vector<std::thread::id> finishedShellThreads;

  std::mutex runMutex;
  std::condition_variable runFinished;
  bool running;
  std::atomic<bool> closed;
};
}  // namespace st

#endif  // __ST_CONTROLLER__
