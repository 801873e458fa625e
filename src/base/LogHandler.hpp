#ifndef __LGNC_LOG_HANDLER__
#define __LGNC_LOG_HANDLER__

#include "Headers.hpp"

namespace lgnc {
/**
 * @brief Configures easylogging++ for the lgnetcast tool and its tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sends the default logger to a fresh file in `path`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @return Full name of the log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool logToStdout = false,
                              string maxlogsize = "2097152");

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages. This is the logger for everything the user is meant to read.
   */
  static void setupStdoutLogger();

 private:
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace lgnc
#endif  // __LGNC_LOG_HANDLER__
