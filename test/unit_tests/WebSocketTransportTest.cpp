#include "WebSocketTransport.hpp"

#include "CliJson.hpp"
#include "FakeWebSocketConnection.hpp"
#include "TestHeaders.hpp"

using namespace st;

namespace {
// Answers requests the way the server does when everything succeeds
vector<string> acceptEverything(const string& frame) {
  sshx::CliRequest request = CliJson::decodeRequest(frame);
  sshx::CliResponse response;
  response.set_id(request.id());
  switch (request.cli_message_case()) {
    case sshx::CliRequest::kOpenSession:
      response.mutable_open_session()->set_name("ws-session");
      response.mutable_open_session()->set_token("ws-token");
      response.mutable_open_session()->set_url("https://sshx.example/s/ws");
      break;
    case sshx::CliRequest::kStartChannel:
      response.mutable_start_channel();
      break;
    case sshx::CliRequest::kCloseSession:
      response.mutable_close_session();
      break;
    default:
      return vector<string>();
  }
  return vector<string>({CliJson::encodeResponse(response)});
}

vector<string> rejectEverything(const string& frame) {
  sshx::CliRequest request = CliJson::decodeRequest(frame);
  if (!startsWith(request.id(), "req_")) {
    return vector<string>();
  }
  sshx::CliResponse response;
  response.set_id(request.id());
  response.set_error("not allowed");
  return vector<string>({CliJson::encodeResponse(response)});
}

sshx::CliRequest sentRequest(const shared_ptr<FakeWebSocketConnection>& ws,
                             size_t index) {
  return CliJson::decodeRequest(ws->getSent().at(index));
}
}  // namespace

TEST_CASE("WebSocketTransport", "[WebSocketTransport]") {
  shared_ptr<FakeWebSocketConnection> connection(
      new FakeWebSocketConnection());
  string dialedUrl;
  shared_ptr<WebSocketTransport> transport(new WebSocketTransport(
      "ws://localhost:8051/api/cli/me", std::chrono::seconds(1),
      [connection, &dialedUrl](const string& url, std::chrono::milliseconds) {
        dialedUrl = url;
        return connection;
      }));
  transport->connect();
  REQUIRE(dialedUrl == "ws://localhost:8051/api/cli/me");
  REQUIRE(transport->connectionType() == ConnectionMethod::WEBSOCKET);

  SECTION("Open session") {
    connection->setResponder(acceptEverything);
    sshx::OpenRequest request;
    request.set_name("me");
    request.set_encrypted_zeros(string(16, '\0'));
    sshx::OpenResponse response = transport->open(request);
    REQUIRE(response.name() == "ws-session");
    REQUIRE(response.url() == "https://sshx.example/s/ws");
    sshx::CliRequest sent = sentRequest(connection, 0);
    REQUIRE(sent.id() == "req_1");
    REQUIRE(sent.open_session().name() == "me");
  }

  SECTION("Server errors fail the request") {
    connection->setResponder(rejectEverything);
    REQUIRE_THROWS_WITH(transport->open(sshx::OpenRequest()),
                        Catch::Contains("not allowed"));
    sshx::CloseRequest close;
    REQUIRE_THROWS_AS(transport->close(close, std::chrono::seconds(1)),
                      runtime_error);
  }

  SECTION("Unanswered requests time out") {
    sshx::CloseRequest close;
    REQUIRE_THROWS_AS(
        transport->close(close, std::chrono::milliseconds(50)),
        runtime_error);
  }

  SECTION("Close session") {
    connection->setResponder(acceptEverything);
    sshx::CloseRequest close;
    close.set_name("ws-session");
    close.set_token("ws-token");
    transport->close(close, std::chrono::seconds(1));
    REQUIRE(sentRequest(connection, 0).close_session().token() == "ws-token");
  }

  SECTION("Channel") {
    connection->setResponder(acceptEverything);
    shared_ptr<CancellationToken> token(new CancellationToken());
    shared_ptr<TransportChannel> channel = transport->channel(token);

    sshx::ClientUpdate hello;
    hello.set_hello("ws-session,ws-token");
    REQUIRE(channel->clientMessages->push(hello, token));
    REQUIRE(connection->waitForSent(1));
    sshx::CliRequest start = sentRequest(connection, 0);
    REQUIRE(startsWith(start.id(), "req_"));
    REQUIRE(start.start_channel().name() == "ws-session");
    REQUIRE(start.start_channel().token() == "ws-token");

    SECTION("Updates are streamed and heartbeats dropped") {
      REQUIRE(channel->clientMessages->push(sshx::ClientUpdate(), token));
      sshx::ClientUpdate data;
      data.mutable_data()->set_id(1);
      data.mutable_data()->set_data("abc");
      data.mutable_data()->set_seq(10);
      REQUIRE(channel->clientMessages->push(data, token));
      sshx::ClientUpdate closed;
      closed.set_closed_shell(1);
      REQUIRE(channel->clientMessages->push(closed, token));

      REQUIRE(connection->waitForSent(3));
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      REQUIRE(connection->getSent().size() == 3);
      sshx::CliRequest sentData = sentRequest(connection, 1);
      REQUIRE(startsWith(sentData.id(), "stream_"));
      REQUIRE(sentData.terminal_data().data() == "abc");
      REQUIRE(sentData.terminal_data().seq() == 10);
      REQUIRE(sentRequest(connection, 2).closed_shell() == 1);
    }

    SECTION("Server pushes reach the channel") {
      sshx::CliResponse push;
      push.set_id("server_update");
      push.mutable_create_shell()->set_id(4);
      push.mutable_create_shell()->set_x(1);
      push.mutable_create_shell()->set_y(2);
      connection->receive(CliJson::encodeResponse(push), false);

      sshx::CliResponse binaryPush;
      binaryPush.set_id("server_update");
      binaryPush.set_ping(77);
      connection->receive(binaryPush.SerializeAsString(), true);

      connection->receive("garbage", false);

      sshx::ServerUpdate update;
      REQUIRE(channel->serverMessages->popFor(&update, std::chrono::seconds(1)));
      REQUIRE(update.create_shell().id() == 4);
      REQUIRE(update.create_shell().y() == 2);
      REQUIRE(channel->serverMessages->popFor(&update, std::chrono::seconds(1)));
      REQUIRE(update.ping() == 77);
      REQUIRE(channel->serverMessages->popFor(
                  &update, std::chrono::milliseconds(50)) == false);
    }

    SECTION("Dropped connection ends the channel") {
      connection->drop("closed by server");
      sshx::ServerUpdate update;
      REQUIRE(channel->serverMessages->popFor(
                  &update, std::chrono::seconds(1)) == false);
      REQUIRE(channel->serverMessages->isDrained());
      REQUIRE_THROWS_AS(transport->open(sshx::OpenRequest()), runtime_error);
      REQUIRE_THROWS_AS(transport->channel(token), runtime_error);
    }

    channel.reset();
  }

  SECTION("Refused channel ends the stream") {
    connection->setResponder(rejectEverything);
    shared_ptr<CancellationToken> token(new CancellationToken());
    shared_ptr<TransportChannel> channel = transport->channel(token);
    sshx::ClientUpdate hello;
    hello.set_hello("ws-session,ws-token");
    REQUIRE(channel->clientMessages->push(hello, token));
    for (int a = 0; a < 100 && !channel->serverMessages->isDrained(); a++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(channel->serverMessages->isDrained());
    channel.reset();
  }

  SECTION("Cleanup closes the socket") {
    transport->cleanup();
    REQUIRE(connection->isClosed());
    REQUIRE_THROWS_AS(transport->open(sshx::OpenRequest()), runtime_error);
  }
}

TEST_CASE("WebSocketTransport dial failure", "[WebSocketTransport]") {
  WebSocketTransport transport(
      "wss://unreachable.example/api/cli/me", std::chrono::milliseconds(10),
      [](const string& url,
         std::chrono::milliseconds) -> shared_ptr<WebSocketConnection> {
        throw runtime_error("could not dial " + url);
      });
  REQUIRE_THROWS_WITH(transport.connect(),
                      Catch::Contains("unreachable.example"));
  REQUIRE_THROWS_AS(transport.channel(shared_ptr<CancellationToken>(
                        new CancellationToken())),
                    runtime_error);
}
