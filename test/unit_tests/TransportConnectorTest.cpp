#include "TransportConnector.hpp"

#include "FakeTransport.hpp"
#include "TestHeaders.hpp"

using namespace st;

TEST_CASE("TransportConnector fallback", "[TransportConnector]") {
  shared_ptr<FakeTransportFactory> factory(new FakeTransportFactory());
  ConnectionConfig config;
  TransportConnector connector("https://sshx.example", "me@host", config,
                               factory);
  sshx::OpenRequest request;
  request.set_name("me@host");
  sshx::OpenResponse response;

  REQUIRE(connector.hasMethod() == false);
  REQUIRE_THROWS_AS(connector.getMethod(), runtime_error);
  REQUIRE(connector.getWebSocketUrl() == "wss://sshx.example/api/cli/me@host");

  SECTION("gRPC preferred") {
    shared_ptr<Transport> transport =
        connector.connectWithFallback(request, &response);
    REQUIRE(transport->connectionType() == ConnectionMethod::GRPC);
    REQUIRE(connector.getMethod() == ConnectionMethod::GRPC);
    REQUIRE(response.name() == "fake-session");
    REQUIRE(factory->getGrpcCalls() == 1);
    REQUIRE(factory->getWebSocketCalls() == 0);
    REQUIRE(factory->waitForTransport(0)->getOpenRequests().size() == 1);
  }

  SECTION("Unreachable gRPC falls back to WebSocket") {
    factory->setGrpcAvailable(false);
    shared_ptr<Transport> transport =
        connector.connectWithFallback(request, &response);
    REQUIRE(transport->connectionType() == ConnectionMethod::WEBSOCKET);
    REQUIRE(connector.getMethod() == ConnectionMethod::WEBSOCKET);
    REQUIRE(factory->getLastWebSocketUrl() ==
            "wss://sshx.example/api/cli/me@host");
    REQUIRE(response.token() == "fake-token");

    SECTION("Reconnect reuses the method without probing") {
      shared_ptr<Transport> again = connector.reconnect();
      REQUIRE(again->connectionType() == ConnectionMethod::WEBSOCKET);
      REQUIRE(factory->getGrpcCalls() == 1);
      REQUIRE(factory->getWebSocketCalls() == 2);
      REQUIRE(again != transport);
    }
  }

  SECTION("Rejected gRPC open falls back and releases the connection") {
    factory->setFailNextOpen(true);
    shared_ptr<Transport> transport =
        connector.connectWithFallback(request, &response);
    REQUIRE(transport->connectionType() == ConnectionMethod::WEBSOCKET);
    shared_ptr<FakeTransport> grpcTransport = factory->waitForTransport(0);
    REQUIRE(grpcTransport->connectionType() == ConnectionMethod::GRPC);
    REQUIRE(grpcTransport->getCleanupCalls() == 1);
  }

  SECTION("Both transports failing") {
    factory->setGrpcAvailable(false);
    factory->setWebSocketAvailable(false);
    REQUIRE_THROWS_WITH(connector.connectWithFallback(request, &response),
                        Catch::Contains("Both gRPC and WebSocket"));
    REQUIRE(connector.hasMethod() == false);
    REQUIRE_THROWS_AS(connector.reconnect(), runtime_error);
  }

  SECTION("gRPC reconnect") {
    connector.connectWithFallback(request, &response);
    connector.reconnect();
    REQUIRE(factory->getGrpcCalls() == 2);
    REQUIRE(factory->getWebSocketCalls() == 0);
  }
}
