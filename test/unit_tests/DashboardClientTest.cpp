#include "DashboardClient.hpp"

#include "TestHeaders.hpp"

using namespace st;

namespace {
class FakeDashboardServer {
 public:
  FakeDashboardServer() : status(200) {
    server.Post("/api/dashboards/register",
                [this](const httplib::Request& req, httplib::Response& res) {
                  {
                    lock_guard<std::mutex> guard(requestMutex);
                    requests.push_back(json::parse(req.body));
                  }
                  res.status = status.load();
                  res.set_content(
                      R"({"dashboardKey":"dash-1","dashboardUrl":"/d/dash-1"})",
                      "application/json");
                });
    port = server.bind_to_any_port("127.0.0.1");
    serverThread = std::thread([this]() { server.listen_after_bind(); });
    while (!server.is_running()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  ~FakeDashboardServer() {
    server.stop();
    serverThread.join();
  }

  string origin() const { return "http://127.0.0.1:" + to_string(port); }

  vector<json> getRequests() {
    lock_guard<std::mutex> guard(requestMutex);
    return requests;
  }

  std::atomic<int> status;

 protected:
  httplib::Server server;
  int port;
  std::thread serverThread;
  std::mutex requestMutex;
  vector<json> requests;
};
}  // namespace

TEST_CASE("Dashboard urls are relative", "[Dashboard]") {
  REQUIRE(DashboardClient::relativeUrl("https://sshx.io/s/abc#key") ==
          "/s/abc#key");
  REQUIRE(DashboardClient::relativeUrl("https://sshx.io/s/abc#key,pw") ==
          "/s/abc#key,pw");
  REQUIRE(DashboardClient::relativeUrl("http://host:8051/s/x?a=1") ==
          "/s/x?a=1");
  REQUIRE(DashboardClient::relativeUrl("https://sshx.io") == "");
  REQUIRE(DashboardClient::relativeUrl("/s/abc") == "/s/abc");
}

TEST_CASE("Dashboard registration", "[Dashboard]") {
  SECTION("Optional fields are omitted") {
    json request = DashboardClient::encodeRequest(
        "name", "https://sshx.io/s/name#k", optional<string>(), "me@host",
        optional<string>());
    REQUIRE(request["sessionName"] == "name");
    REQUIRE(request["url"] == "/s/name#k");
    REQUIRE(request["displayName"] == "me@host");
    REQUIRE(request.contains("writeUrl") == false);
    REQUIRE(request.contains("dashboardKey") == false);
  }

  SECTION("Malformed responses are rejected") {
    REQUIRE_THROWS_AS(DashboardClient::decodeResponse("not json"),
                      runtime_error);
    REQUIRE_THROWS_AS(DashboardClient::decodeResponse(R"({"dashboardKey":1})"),
                      runtime_error);
  }

  SECTION("Joining an existing dashboard") {
    FakeDashboardServer server;
    DashboardClient client(server.origin() + "/");
    DashboardRegistration registration = client.registerSession(
        "name", "https://sshx.io/s/name#k",
        optional<string>("https://sshx.io/s/name#k,pw"), "me@host",
        optional<string>("dash-1"));
    REQUIRE(registration.key == "dash-1");
    REQUIRE(registration.url == "/d/dash-1");

    vector<json> requests = server.getRequests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0]["writeUrl"] == "/s/name#k,pw");
    REQUIRE(requests[0]["dashboardKey"] == "dash-1");
  }

  SECTION("Refused registrations throw") {
    FakeDashboardServer server;
    server.status = 403;
    DashboardClient client(server.origin());
    REQUIRE_THROWS_WITH(
        client.registerSession("name", "https://sshx.io/s/name#k",
                               optional<string>(), "me@host",
                               optional<string>()),
        Catch::Contains("403"));
  }

  SECTION("Unreachable servers throw") {
    DashboardClient client("http://127.0.0.1:1");
    REQUIRE_THROWS_AS(
        client.registerSession("name", "https://sshx.io/s/name#k",
                               optional<string>(), "me@host",
                               optional<string>()),
        runtime_error);
  }
}
