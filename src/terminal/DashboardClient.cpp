#include "DashboardClient.hpp"

namespace st {
DashboardClient::DashboardClient(const string& _origin) : origin(_origin) {
  while (!origin.empty() && origin.back() == '/') {
    origin.pop_back();
  }
}

DashboardRegistration DashboardClient::registerSession(
    const string& sessionName, const string& url,
    const optional<string>& writeUrl, const string& displayName,
    const optional<string>& dashboardKey) {
  string payload =
      encodeRequest(sessionName, url, writeUrl, displayName, dashboardKey)
          .dump(-1, ' ', false, json::error_handler_t::replace);

  httplib::Client client(origin);
  client.set_connection_timeout(TIMEOUT_SECONDS, 0);
  client.set_read_timeout(TIMEOUT_SECONDS, 0);
  client.set_write_timeout(TIMEOUT_SECONDS, 0);
  auto result =
      client.Post("/api/dashboards/register", payload, "application/json");
  if (!result) {
    throw runtime_error("Could not reach the dashboard on " + origin +
                        " (error " + to_string(int(result.error())) + ")");
  }
  if (result->status < 200 || result->status >= 300) {
    throw runtime_error("Dashboard registration failed with status " +
                        to_string(result->status));
  }
  return decodeResponse(result->body);
}

json DashboardClient::encodeRequest(const string& sessionName,
                                    const string& url,
                                    const optional<string>& writeUrl,
                                    const string& displayName,
                                    const optional<string>& dashboardKey) {
  json request = {{"sessionName", sessionName},
                  {"url", relativeUrl(url)},
                  {"displayName", displayName}};
  if (writeUrl) {
    request["writeUrl"] = relativeUrl(*writeUrl);
  }
  if (dashboardKey) {
    request["dashboardKey"] = *dashboardKey;
  }
  return request;
}

DashboardRegistration DashboardClient::decodeResponse(const string& body) {
  DashboardRegistration registration;
  try {
    json response = json::parse(body);
    registration.key = response.at("dashboardKey").get<string>();
    registration.url = response.at("dashboardUrl").get<string>();
  } catch (const json::exception& ex) {
    throw runtime_error(string("Invalid dashboard response: ") + ex.what());
  }
  return registration;
}

string DashboardClient::relativeUrl(const string& url) {
  size_t scheme = url.find("://");
  if (scheme == string::npos) {
    return url;
  }
  size_t start = url.find_first_of("/?#", scheme + 3);
  if (start == string::npos) {
    return "";
  }
  return url.substr(start);
}
}  // namespace st
