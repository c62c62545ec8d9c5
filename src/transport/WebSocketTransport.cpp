#include "WebSocketTransport.hpp"

#include "BeastWebSocketConnection.hpp"
#include "CliJson.hpp"

namespace st {
WebSocketTransportChannel::WebSocketTransportChannel(
    WebSocketTransport* _transport, shared_ptr<CancellationToken> _token)
    : transport(_transport), token(new CancellationToken(_token)) {
  senderThread = std::thread(&WebSocketTransportChannel::sendLoop, this);
}

WebSocketTransportChannel::~WebSocketTransportChannel() {
  token->cancel();
  clientMessages->close();
  serverMessages->close();
  senderThread.join();
}

void WebSocketTransportChannel::sendLoop() {
  el::Helpers::setThreadName("websocket-sender");
  bool started = false;
  uint64_t sent = 0;
  sshx::ClientUpdate update;
  while (clientMessages->pop(&update, token)) {
    if (!started) {
      if (update.client_message_case() ==
          sshx::ClientUpdate::CLIENT_MESSAGE_NOT_SET) {
        continue;
      }
      if (update.client_message_case() != sshx::ClientUpdate::kHello) {
        LOG(ERROR) << "Expected hello as the first message on the channel";
        break;
      }
      if (!startChannel(update)) {
        break;
      }
      started = true;
      continue;
    }

    string id =
        "stream_" +
        to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count());
    sshx::CliRequest request;
    try {
      if (!CliJson::toCliRequest(update, id, &request)) {
        continue;
      }
      transport->sendFrame(CliJson::encodeRequest(request));
    } catch (const runtime_error& err) {
      LOG(WARNING) << "WebSocket send failed after " << sent
                   << " messages: " << err.what();
      break;
    }
    sent++;
  }
  VLOG(1) << "WebSocket sender exiting after " << sent << " messages";
  serverMessages->close();
}

bool WebSocketTransportChannel::startChannel(const sshx::ClientUpdate& hello) {
  try {
    sshx::CliRequest request;
    CliJson::toCliRequest(hello, "", &request);
    sshx::CliResponse response = transport->request(
        request,
        std::chrono::milliseconds(WebSocketTransport::REQUEST_TIMEOUT_MS),
        token);
    switch (response.cli_response_message_case()) {
      case sshx::CliResponse::kStartChannel:
        VLOG(1) << "WebSocket channel started";
        return true;
      case sshx::CliResponse::kError:
        LOG(WARNING) << "Server refused the channel: " << response.error();
        return false;
      default:
        LOG(WARNING) << "Unexpected response to startChannel";
        return false;
    }
  } catch (const runtime_error& err) {
    LOG(WARNING) << "Failed to start WebSocket channel: " << err.what();
    return false;
  }
}

WebSocketTransport::WebSocketTransport(const string& _url,
                                       std::chrono::milliseconds _timeout,
                                       WebSocketConnector _connector)
    : url(_url), timeout(_timeout), connector(_connector) {
  if (!connector) {
    connector = connectWebSocket;
  }
}

void WebSocketTransport::connect() {
  shared_ptr<WebSocketConnection> newConnection = connector(url, timeout);
  {
    lock_guard<std::mutex> guard(transportMutex);
    connection = newConnection;
  }
  newConnection->start(
      [this](const string& frame, bool binary) { handleFrame(frame, binary); },
      [this](const string& reason) { handleClose(reason); });
  VLOG(1) << "WebSocket connected to " << url;
}

sshx::OpenResponse WebSocketTransport::open(const sshx::OpenRequest& request) {
  sshx::CliRequest cliRequest;
  *cliRequest.mutable_open_session() = request;
  sshx::CliResponse response = this->request(
      cliRequest, std::chrono::milliseconds(REQUEST_TIMEOUT_MS));
  switch (response.cli_response_message_case()) {
    case sshx::CliResponse::kOpenSession:
      return response.open_session();
    case sshx::CliResponse::kError:
      throw runtime_error("Server error: " + response.error());
    default:
      throw runtime_error("Unexpected response to openSession");
  }
}

shared_ptr<TransportChannel> WebSocketTransport::channel(
    shared_ptr<CancellationToken> token) {
  {
    lock_guard<std::mutex> guard(transportMutex);
    if (!connection || !connection->isOpen()) {
      throw runtime_error("WebSocket is not connected");
    }
  }
  shared_ptr<WebSocketTransportChannel> newChannel(
      new WebSocketTransportChannel(this, token));
  lock_guard<std::mutex> guard(transportMutex);
  inbox = newChannel->serverMessages;
  inboxToken = newChannel->getToken();
  return newChannel;
}

void WebSocketTransport::close(const sshx::CloseRequest& request,
                               std::chrono::milliseconds closeTimeout) {
  sshx::CliRequest cliRequest;
  *cliRequest.mutable_close_session() = request;
  sshx::CliResponse response = this->request(cliRequest, closeTimeout);
  switch (response.cli_response_message_case()) {
    case sshx::CliResponse::kCloseSession:
      return;
    case sshx::CliResponse::kError:
      throw runtime_error("Server error: " + response.error());
    default:
      throw runtime_error("Unexpected response to closeSession");
  }
}

void WebSocketTransport::cleanup() {
  shared_ptr<WebSocketConnection> oldConnection;
  {
    lock_guard<std::mutex> guard(transportMutex);
    oldConnection.swap(connection);
    if (inbox) {
      // Unblocks the io thread if it is waiting on a full inbox
      inbox->close();
    }
    inbox.reset();
    inboxToken.reset();
  }
  pending.failAll("transport closed");
  if (oldConnection) {
    oldConnection->close();
  }
}

sshx::CliResponse WebSocketTransport::request(
    sshx::CliRequest request, std::chrono::milliseconds requestTimeout,
    shared_ptr<CancellationToken> token) {
  string id = pending.registerRequest();
  request.set_id(id);
  try {
    sendFrame(CliJson::encodeRequest(request));
  } catch (const runtime_error& err) {
    pending.cancel(id);
    throw;
  }
  return pending.waitFor(id, requestTimeout, token);
}

void WebSocketTransport::sendFrame(const string& frame) {
  shared_ptr<WebSocketConnection> current;
  {
    lock_guard<std::mutex> guard(transportMutex);
    current = connection;
  }
  if (!current) {
    throw runtime_error("WebSocket is not connected");
  }
  current->send(frame);
}

void WebSocketTransport::handleFrame(const string& frame, bool binary) {
  sshx::CliResponse response;
  if (binary) {
    if (!response.ParseFromString(frame)) {
      LOG(WARNING) << "Dropping undecodable binary frame of " << frame.size()
                   << " bytes";
      return;
    }
  } else {
    try {
      response = CliJson::decodeResponse(frame);
    } catch (const runtime_error& err) {
      LOG(WARNING) << "Dropping malformed frame: " << err.what();
      return;
    }
  }

  if (pending.deliver(response)) {
    return;
  }
  sshx::ServerUpdate update;
  if (!CliJson::toServerUpdate(response, &update)) {
    LOG(WARNING) << "Dropping unmatched response " << response.id();
    return;
  }
  shared_ptr<MessageQueue<sshx::ServerUpdate>> target;
  shared_ptr<CancellationToken> targetToken;
  {
    lock_guard<std::mutex> guard(transportMutex);
    target = inbox;
    targetToken = inboxToken;
  }
  if (!target) {
    VLOG(1) << "Dropping server update outside of a channel";
    return;
  }
  if (!target->push(update, targetToken)) {
    VLOG(1) << "Channel closed, dropping server update";
  }
}

void WebSocketTransport::handleClose(const string& reason) {
  LOG(INFO) << "WebSocket connection lost: " << reason;
  pending.failAll(reason);
  lock_guard<std::mutex> guard(transportMutex);
  if (inbox) {
    inbox->close();
  }
}
}  // namespace st
