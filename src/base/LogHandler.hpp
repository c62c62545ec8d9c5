#ifndef __ST_LOG_HANDLER__
#define __ST_LOG_HANDLER__

#include "Headers.hpp"

namespace st {
/**
 * @brief Configures easylogging++ for the sharing client and its tests.
 *
 * Diagnostics go to a log file so they never interleave with the shell
 * session banner. User facing text goes through the "stdout" logger.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes easylogging from `argc/argv`.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the default logger at a fresh file in `path`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @param filenamePrefix Prefix of the log file, followed by a timestamp.
   * @param logToStdout Also echo log lines to the terminal.
   * @return Full path of the created log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool logToStdout = false,
                              const string &maxlogsize = "20971520");

  /**
   * @brief Maps the numeric `--verbose` flag onto easylogging's VLOG level.
   */
  static void setVerbosity(int level);

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the "stdout" logger so it just writes messages.
   */
  static void setupStdoutLogger();

 private:
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace st
#endif  // __ST_LOG_HANDLER__
