#ifndef __TH_LOG_HANDLER__
#define __TH_LOG_HANDLER__

#include "Headers.hpp"

namespace th {
/**
 * @brief Where and how a termhub binary writes its log.
 */
struct LogOptions {
  /** @brief Created if missing. */
  string directory;
  /** @brief Binary name, e.g. "termhub-server". */
  string prefix;
  bool toStdout = false;
  /** @brief Also send stderr to a "<prefix>-stderr-..." file. */
  bool redirectStderr = false;
  /** @brief Needed when several copies of the binary share a directory. */
  bool appendPid = false;
  string maxFileSize = "20971520";
};

/**
 * @brief easylogging++ setup shared by the daemon, the client and the tests.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging with the process arguments.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /** @brief Configures the "stdout" logger used for user-facing messages. */
  static void setupStdoutLogger();

  /**
   * @brief Creates a fresh log file and points every level of @p conf at it.
   *
   * The caller still has to apply @p conf to the default logger.
   * @return The full path of the new log file.
   */
  static string setupLogFiles(el::Configurations *conf,
                              const LogOptions &options);

  /** @brief "<prefix>-<kind>-<local time>[_<pid>].log"; @p kind may be empty. */
  static string logFileName(const string &prefix, const string &kind,
                            bool appendPid);

  /** @brief Sets the global VLOG level; values outside 0-9 are ignored. */
  static void setupVerbosity(int level);

 private:
  static void rolloutHandler(const char *filename, std::size_t size);
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace th
#endif  // __TH_LOG_HANDLER__
