#ifndef __ST_DASHBOARD_CLIENT__
#define __ST_DASHBOARD_CLIENT__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace st {
struct DashboardRegistration {
  string key;
  string url;
};

/**
 * @brief Lists a running session on a dashboard hosted by the same server.
 *
 * Links are registered relative to the server so dashboards keep working
 * behind reverse proxies.
 */
class DashboardClient {
 public:
  static constexpr int TIMEOUT_SECONDS = 5;

  explicit DashboardClient(const string& _origin);

  /**
   * @brief Posts the session to /api/dashboards/register.
   * @param dashboardKey Existing dashboard to join, or empty to create one.
   * @throws runtime_error if the request fails or is refused.
   */
  DashboardRegistration registerSession(const string& sessionName,
                                        const string& url,
                                        const optional<string>& writeUrl,
                                        const string& displayName,
                                        const optional<string>& dashboardKey);

  static json encodeRequest(const string& sessionName, const string& url,
                            const optional<string>& writeUrl,
                            const string& displayName,
                            const optional<string>& dashboardKey);
  static DashboardRegistration decodeResponse(const string& body);

  /** @brief Path, query and fragment of `url`. */
  static string relativeUrl(const string& url);

 protected:
  string origin;
};
}  // namespace st

#endif  // __ST_DASHBOARD_CLIENT__
