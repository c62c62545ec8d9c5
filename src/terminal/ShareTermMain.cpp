#include <cxxopts.hpp>

#include "Controller.hpp"
#include "DashboardClient.hpp"
#include "EchoRunner.hpp"
#include "Headers.hpp"
#include "LogHandler.hpp"
#include "ShellRunner.hpp"

using namespace st;

namespace {
const char* DEFAULT_SERVER = "https://sshx.io";

string envOrDefault(const char* name, const string& defaultValue) {
  const char* value = ::getenv(name);
  if (value == NULL || value[0] == '\0') {
    return defaultValue;
  }
  return string(value);
}

void printGreeting(const Controller& controller, const string& shell,
                   const optional<DashboardRegistration>& dashboard) {
  CLOG(INFO, "stdout") << endl
                       << "  shareterm " << ST_VERSION << endl
                       << endl;
  if (controller.writeUrl()) {
    CLOG(INFO, "stdout") << "  -> Read-only link: " << controller.url()
                         << endl;
    CLOG(INFO, "stdout") << "  -> Writable link:  " << *controller.writeUrl()
                         << endl;
  } else {
    CLOG(INFO, "stdout") << "  -> Link:  " << controller.url() << endl;
  }
  if (dashboard) {
    CLOG(INFO, "stdout") << "  -> Dashboard:    " << dashboard->url << endl;
    CLOG(INFO, "stdout") << "  -> Dashboard ID: " << dashboard->key << endl;
  }
  CLOG(INFO, "stdout") << "  -> Shell: " << shell << endl;
  CLOG(INFO, "stdout") << "  -> Transport: "
                       << connectionMethodName(controller.connectionMethod())
                       << endl
                       << endl;
}
}  // namespace

int main(int argc, char** argv) {
  string tmpDir = GetTempDirectory();

  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  st::HandleTerminate();

  cxxopts::Options options("shareterm",
                           "Share your terminal over the web, end to end "
                           "encrypted");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("server", "Address of the remote server",
         cxxopts::value<std::string>()->default_value(
             envOrDefault("SHARETERM_SERVER", DEFAULT_SERVER)))  //
        ("shell", "Shell to run, defaults to $SHELL",
         cxxopts::value<std::string>())  //
        ("name", "Name of the session, defaults to user@hostname",
         cxxopts::value<std::string>())                        //
        ("q,quiet", "Only print the session link")             //
        ("enable-readers", "Also create a read-only link")     //
        ("echo", "Echo viewer input instead of running a shell")  //
        ("dashboard", "Register the session with a new dashboard")  //
        ("dashboard-key", "Join the existing dashboard with this key",
         cxxopts::value<std::string>())  //
        ("grpc-timeout", "Seconds to wait for the gRPC transport",
         cxxopts::value<int>()->default_value("3"))  //
        ("websocket-timeout", "Seconds to wait for the WebSocket fallback",
         cxxopts::value<int>()->default_value("5"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value(
             envOrDefault("SHARETERM_VERBOSE", "0")))  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>()->default_value(tmpDir))  //
        ("logtostdout", "Write log to stdout");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "shareterm version " << ST_VERSION << endl;
      exit(0);
    }

    LogHandler::setVerbosity(result["verbose"].as<int>());
    LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                              "shareterm", result.count("logtostdout") > 0);

    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("shareterm-main");

    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    if (::sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }

    int grpcTimeout = result["grpc-timeout"].as<int>();
    int webSocketTimeout = result["websocket-timeout"].as<int>();
    if (grpcTimeout < 1 || webSocketTimeout < 1) {
      CLOG(INFO, "stdout") << "Timeouts must be at least one second" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    string shell = result.count("shell") ? result["shell"].as<string>()
                                         : ShellRunner::defaultShell();
    string name = result.count("name")
                      ? result["name"].as<string>()
                      : GetOsUserName() + "@" + GetShortHostName();

    ControllerConfig config;
    config.origin = result["server"].as<string>();
    config.name = name;
    config.enableReaders = result.count("enable-readers") > 0;
    if (result.count("echo")) {
      config.runner.reset(new EchoRunner());
    } else {
      config.runner.reset(new ShellRunner(shell));
    }
    config.connection.verboseErrors = result["verbose"].as<int>() > 0;
    config.connection.grpcTimeout = std::chrono::seconds(grpcTimeout);
    config.connection.webSocketTimeout = std::chrono::seconds(webSocketTimeout);

    // Shells must not inherit our signal handling, and SIGINT/SIGTERM are
    // consumed by the signal thread below
    ::signal(SIGPIPE, SIG_IGN);
    sigset_t shutdownSignals;
    sigemptyset(&shutdownSignals);
    sigaddset(&shutdownSignals, SIGINT);
    sigaddset(&shutdownSignals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &shutdownSignals, NULL) != 0) {
      STFATAL << "Could not block shutdown signals";
    }

    shared_ptr<Controller> controller(new Controller(config));
    try {
      controller->open();
    } catch (const runtime_error& err) {
      LOG(ERROR) << "Could not open session: " << err.what();
      CLOG(INFO, "stdout") << "Could not open a session on " << config.origin
                           << ": " << err.what() << endl;
      exit(1);
    }

    optional<DashboardRegistration> dashboard;
    if (result.count("dashboard") || result.count("dashboard-key")) {
      optional<string> dashboardKey;
      if (result.count("dashboard-key")) {
        dashboardKey = result["dashboard-key"].as<string>();
      }
      try {
        DashboardClient dashboardClient(config.origin);
        dashboard = dashboardClient.registerSession(
            controller->name(), controller->url(), controller->writeUrl(),
            name, dashboardKey);
        LOG(INFO) << "Registered with dashboard " << dashboard->key;
      } catch (const runtime_error& err) {
        LOG(WARNING) << "Dashboard registration failed: " << err.what();
      }
    }

    if (result.count("quiet")) {
      CLOG(INFO, "stdout") << controller->writeUrl().value_or(controller->url())
                           << endl;
    } else {
      printGreeting(*controller, result.count("echo") ? "echo" : shell,
                    dashboard);
    }

    std::thread signalThread([controller, shutdownSignals]() {
      el::Helpers::setThreadName("signal-handler");
      int signum = 0;
      sigwait(&shutdownSignals, &signum);
      LOG(INFO) << "Got signal " << signum << ", closing the session";
      controller->close();
    });

    el::Helpers::setThreadName("controller");
    controller->run();
    signalThread.join();
    LOG(INFO) << "Session closed";
  } catch (cxxopts::exceptions::exception& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
