#include "Controller.hpp"

#include "Backoff.hpp"

namespace st {
Controller::Controller(const ControllerConfig& _config,
                       shared_ptr<TransportFactory> _factory)
    : config(_config),
      factory(_factory),
      cancellationToken(new CancellationToken()),
      outputQueue(new OutputQueue(OUTPUT_QUEUE_CAPACITY)),
      transportStale(false),
      running(false),
      closed(false) {
  if (!config.runner) {
    STFATAL << "Controller needs a runner";
  }
}

Controller::~Controller() { close(); }

void Controller::open() {
  encryptionKeyValue = genRandomAlphaNum(SESSION_KEY_LENGTH);
  cipher.reset(new StreamCipher(encryptionKeyValue));

  sshx::OpenRequest request;
  request.set_origin(config.origin);
  request.set_encrypted_zeros(cipher->zeroBlock());
  request.set_name(config.name);
  if (config.enableReaders) {
    writePassword = genRandomAlphaNum(SESSION_KEY_LENGTH);
    StreamCipher writeCipher(*writePassword);
    request.set_write_password_hash(writeCipher.zeroBlock());
  }

  connector.reset(new TransportConnector(config.origin, config.name,
                                         config.connection, factory));
  sshx::OpenResponse response;
  shared_ptr<Transport> newTransport =
      connector->connectWithFallback(request, &response);
  {
    lock_guard<std::mutex> guard(transportMutex);
    transport = newTransport;
  }

  sessionName = response.name();
  sessionToken = response.token();
  sessionUrl = response.url() + "#" + encryptionKeyValue;
  if (writePassword) {
    writeSessionUrl = sessionUrl + "," + *writePassword;
  }
  LOG(INFO) << "Opened session " << sessionName << " over "
            << connectionMethodName(connectionMethod());
}

ConnectionMethod Controller::connectionMethod() const {
  if (!connector) {
    throw runtime_error("Session is not open");
  }
  return connector->getMethod();
}

size_t Controller::numShells() {
  lock_guard<std::mutex> guard(shellMutex);
  return shells.size();
}

size_t Controller::numShellThreads() {
  reapShellThreads();
  lock_guard<std::mutex> guard(threadMutex);
  return shellThreads.size();
}

void Controller::run() {
  {
    lock_guard<std::mutex> guard(runMutex);
    running = true;
  }
  Backoff backoff(std::chrono::steady_clock::now());
  while (!cancellationToken->isCancelled()) {
    shared_ptr<CancellationToken> attemptToken(
        new CancellationToken(cancellationToken));
    try {
      refreshTransport();
      tryChannel(attemptToken);
    } catch (const runtime_error& err) {
      attemptToken->cancel();
      if (cancellationToken->isCancelled()) {
        break;
      }
      int delay = backoff.onFailure(std::chrono::steady_clock::now());
      LOG(WARNING) << "Disconnected, retrying in " << delay
                   << "s: " << err.what();
      if (cancellationToken->waitFor(config.backoffUnit * delay)) {
        break;
      }
    }
    attemptToken->cancel();
    backoff.onAttemptFinished(std::chrono::steady_clock::now());
    lock_guard<std::mutex> guard(transportMutex);
    transportStale = true;
  }
  VLOG(1) << "Controller stopped";
  {
    lock_guard<std::mutex> guard(runMutex);
    running = false;
  }
  runFinished.notify_all();
}

void Controller::refreshTransport() {
  shared_ptr<Transport> oldTransport;
  {
    lock_guard<std::mutex> guard(transportMutex);
    // gRPC keeps one connection for the whole session
    if (!transportStale || !transport ||
        transport->connectionType() != ConnectionMethod::WEBSOCKET) {
      return;
    }
    oldTransport = transport;
  }
  oldTransport->cleanup();
  VLOG(1) << "Recreating " << connectionMethodName(connector->getMethod())
          << " transport";
  shared_ptr<Transport> newTransport = connector->reconnect();
  lock_guard<std::mutex> guard(transportMutex);
  transport = newTransport;
  transportStale = false;
}

shared_ptr<Transport> Controller::currentTransport() {
  lock_guard<std::mutex> guard(transportMutex);
  return transport;
}

void Controller::tryChannel(const shared_ptr<CancellationToken>& attemptToken) {
  shared_ptr<Transport> activeTransport = currentTransport();
  if (!activeTransport) {
    throw runtime_error("Session is not open");
  }
  shared_ptr<TransportChannel> channel = activeTransport->channel(attemptToken);

  sshx::ClientUpdate hello;
  hello.set_hello(sessionName + "," + sessionToken);
  sendToChannel(channel, hello, attemptToken);

  auto now = std::chrono::steady_clock::now();
  auto nextHeartbeat = now + config.heartbeatInterval;
  auto reconnectAt = now + config.reconnectInterval;
  while (!attemptToken->isCancelled()) {
    now = std::chrono::steady_clock::now();
    if (now >= reconnectAt) {
      VLOG(1) << "Refreshing the channel";
      return;
    }
    if (now >= nextHeartbeat) {
      sendToChannel(channel, sshx::ClientUpdate(), attemptToken);
      nextHeartbeat = now + config.heartbeatInterval;
    }

    bool busy = false;
    sshx::ClientUpdate outgoing;
    for (size_t a = 0; a < OUTPUT_QUEUE_CAPACITY && outputQueue->tryPop(&outgoing);
         a++) {
      sendToChannel(channel, outgoing, attemptToken);
      busy = true;
    }

    sshx::ServerUpdate incoming;
    if (channel->serverMessages->popFor(
            &incoming, std::chrono::milliseconds(busy ? 0 : 10))) {
      handleServerMessage(incoming, channel, attemptToken);
    } else if (channel->serverMessages->isDrained()) {
      throw runtime_error("Server closed the channel");
    }
  }
}

void Controller::sendToChannel(
    const shared_ptr<TransportChannel>& channel,
    const sshx::ClientUpdate& update,
    const shared_ptr<CancellationToken>& attemptToken) {
  if (!channel->clientMessages->push(update, attemptToken)) {
    if (attemptToken->isCancelled()) {
      throw runtime_error("Channel cancelled");
    }
    throw runtime_error("Failed to send to the server");
  }
}

void Controller::sendClosedShell(
    uint32_t id, const shared_ptr<TransportChannel>& channel,
    const shared_ptr<CancellationToken>& attemptToken) {
  sshx::ClientUpdate closedShell;
  closedShell.set_closed_shell(id);
  sendToChannel(channel, closedShell, attemptToken);
}

shared_ptr<ShellQueue> Controller::findShell(uint32_t id) {
  lock_guard<std::mutex> guard(shellMutex);
  auto it = shells.find(id);
  if (it == shells.end()) {
    return shared_ptr<ShellQueue>();
  }
  return it->second;
}

void Controller::handleServerMessage(
    const sshx::ServerUpdate& message,
    const shared_ptr<TransportChannel>& channel,
    const shared_ptr<CancellationToken>& attemptToken) {
  switch (message.server_message_case()) {
    case sshx::ServerUpdate::kInput: {
      const sshx::TerminalInput& input = message.input();
      string data =
          cipher->segment(CLIENT_INPUT_STREAM_ID, input.offset(), input.data());
      shared_ptr<ShellQueue> queue = findShell(input.id());
      if (!queue) {
        LOG(WARNING) << "Received data for non-existing shell " << input.id();
      } else if (!queue->tryPush(ShellData::input(data))) {
        LOG(WARNING) << "Shell " << input.id() << " is busy, dropping input";
      }
      break;
    }
    case sshx::ServerUpdate::kCreateShell: {
      const sshx::NewShell& newShell = message.create_shell();
      lock_guard<std::mutex> guard(shellMutex);
      if (shells.find(newShell.id()) != shells.end()) {
        LOG(WARNING) << "Server asked to create duplicate shell "
                     << newShell.id();
      } else {
        spawnShellTask(newShell.id(), newShell.x(), newShell.y());
      }
      break;
    }
    case sshx::ServerUpdate::kCloseShell: {
      uint32_t id = message.close_shell();
      {
        lock_guard<std::mutex> guard(shellMutex);
        auto it = shells.find(id);
        if (it != shells.end()) {
          it->second->close();
          shells.erase(it);
        }
      }
      sendClosedShell(id, channel, attemptToken);
      break;
    }
    case sshx::ServerUpdate::kSync: {
      // Handle shells in a stable order
      map<uint32_t, uint64_t> sequenceNumbers(message.sync().map().begin(),
                                              message.sync().map().end());
      for (const auto& it : sequenceNumbers) {
        shared_ptr<ShellQueue> queue = findShell(it.first);
        if (!queue) {
          LOG(WARNING) << "Received sequence number for non-existing shell "
                       << it.first;
          sendClosedShell(it.first, channel, attemptToken);
        } else if (!queue->tryPush(ShellData::sync(it.second))) {
          VLOG(1) << "Shell " << it.first << " is busy, skipping sync";
        }
      }
      break;
    }
    case sshx::ServerUpdate::kResize: {
      const sshx::TerminalSize& size = message.resize();
      shared_ptr<ShellQueue> queue = findShell(size.id());
      if (!queue) {
        LOG(WARNING) << "Received resize for non-existing shell " << size.id();
      } else if (!queue->tryPush(ShellData::size(size.rows(), size.cols()))) {
        VLOG(1) << "Shell " << size.id() << " is busy, skipping resize";
      }
      break;
    }
    case sshx::ServerUpdate::kPing: {
      sshx::ClientUpdate pong;
      pong.set_pong(message.ping());
      sendToChannel(channel, pong, attemptToken);
      break;
    }
    case sshx::ServerUpdate::kError:
      LOG(ERROR) << "Error received from server: " << message.error();
      break;
    case sshx::ServerUpdate::SERVER_MESSAGE_NOT_SET:
      VLOG(1) << "Ignoring empty server message";
      break;
  }
}

void Controller::spawnShellTask(uint32_t id, int32_t x, int32_t y) {
  shared_ptr<ShellQueue> queue(new ShellQueue(SHELL_QUEUE_CAPACITY));
  shells[id] = queue;
  reapShellThreads();
  lock_guard<std::mutex> guard(threadMutex);
  std::thread shellThread(&Controller::runShell, this, id, x, y, queue);
  std::thread::id threadId = shellThread.get_id();
  shellThreads[threadId] = std::move(shellThread);
}

void Controller::runShell(uint32_t id, int32_t x, int32_t y,
                          shared_ptr<ShellQueue> queue) {
  el::Helpers::setThreadName("shell-" + to_string(id));
  LOG(INFO) << "Spawning shell " << id;

  sshx::ClientUpdate created;
  sshx::NewShell* newShell = created.mutable_created_shell();
  newShell->set_id(id);
  newShell->set_x(x);
  newShell->set_y(y);
  if (outputQueue->push(created, cancellationToken)) {
    try {
      config.runner->run(id, cipher, queue, outputQueue, cancellationToken);
    } catch (const runtime_error& err) {
      if (!cancellationToken->isCancelled()) {
        LOG(WARNING) << "Shell " << id << " failed: " << err.what();
        sshx::ClientUpdate error;
        error.set_error("shell " + to_string(id) + ": " + err.what());
        if (!outputQueue->push(error, cancellationToken)) {
          VLOG(1) << "Could not report failure of shell " << id;
        }
      }
    }
  }

  {
    lock_guard<std::mutex> guard(shellMutex);
    auto it = shells.find(id);
    // The server may have closed and recreated this id already
    if (it != shells.end() && it->second == queue) {
      shells.erase(it);
    }
  }
  queue->close();

  sshx::ClientUpdate closedShell;
  closedShell.set_closed_shell(id);
  if (!outputQueue->push(closedShell, cancellationToken)) {
    VLOG(1) << "Could not report closing of shell " << id;
  }
  LOG(INFO) << "Shell " << id << " finished";

  lock_guard<std::mutex> guard(threadMutex);
  finishedShellThreads.push_back(std::this_thread::get_id());
}

void Controller::close() {
  if (closed.exchange(true)) {
    return;
  }
  cancellationToken->cancel();
  {
    std::unique_lock<std::mutex> lock(runMutex);
    runFinished.wait(lock, [this] { return !running; });
  }
  joinShells();

  shared_ptr<Transport> activeTransport = currentTransport();
  if (!activeTransport) {
    return;
  }
  LOG(INFO) << "Closing session " << sessionName;
  sshx::CloseRequest request;
  request.set_name(sessionName);
  request.set_token(sessionToken);
  try {
    activeTransport->close(request, std::chrono::seconds(CLOSE_TIMEOUT));
  } catch (const runtime_error& err) {
    LOG(WARNING) << "Failed to close session: " << err.what();
  }
  activeTransport->cleanup();
}

void Controller::reapShellThreads() {
  vector<std::thread> finished;
  {
    lock_guard<std::mutex> guard(threadMutex);
    for (const auto& threadId : finishedShellThreads) {
      auto it = shellThreads.find(threadId);
      if (it != shellThreads.end()) {
        finished.push_back(std::move(it->second));
        shellThreads.erase(it);
      }
    }
    finishedShellThreads.clear();
  }
  for (auto& thread : finished) {
    thread.join();
  }
}

void Controller::joinShells() {
  map<std::thread::id, std::thread> threads;
  {
    lock_guard<std::mutex> guard(threadMutex);
    threads.swap(shellThreads);
    finishedShellThreads.clear();
  }
  for (auto& it : threads) {
    it.second.join();
  }
}
}  // namespace st
