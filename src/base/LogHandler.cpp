#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace th {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  // %thread prints the name set with el::Helpers::setThreadName
  conf.setGlobally(el::ConfigurationType::Format,
                   "[%level %datetime %thread %fbase:%line] %msg");
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
  return conf;
}

void LogHandler::setupStdoutLogger() {
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(el::Loggers::getLogger("stdout"), stdoutConf);
}

string LogHandler::setupLogFiles(el::Configurations *conf,
                                 const LogOptions &options) {
  string logPath = createLogFile(
      options.directory, logFileName(options.prefix, "", options.appendPid));

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  conf->setGlobally(el::ConfigurationType::Filename, logPath);
  conf->setGlobally(el::ConfigurationType::ToFile, "true");
  conf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                    options.maxFileSize);
  conf->setGlobally(el::ConfigurationType::ToStandardOutput,
                    options.toStdout ? "true" : "false");

  if (options.redirectStderr) {
    string stderrPath =
        createLogFile(options.directory,
                      logFileName(options.prefix, "stderr", options.appendPid));
    FILE *stderrStream = freopen(stderrPath.c_str(), "w", stderr);
    if (!stderrStream) {
      STFATAL << "Could not redirect stderr to " << stderrPath;
    }
    setvbuf(stderrStream, NULL, _IOLBF, BUFSIZ);
  }
  return logPath;
}

string LogHandler::logFileName(const string &prefix, const string &kind,
                               bool appendPid) {
  time_t rawtime = time(NULL);
  struct tm timeinfo;
  localtime_r(&rawtime, &timeinfo);
  char buffer[80];
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &timeinfo);

  string name = prefix + "-";
  if (!kind.empty()) {
    name += kind + "-";
  }
  name += buffer;
  if (appendPid) {
    name += "_" + std::to_string(getpid());
  }
  return name + ".log";
}

void LogHandler::setupVerbosity(int level) {
  if (level < 0 || level > 9) {
    CLOG(WARNING, "stdout") << "Ignoring invalid verbosity " << level << endl;
    return;
  }
  el::Loggers::setVerboseLevel(level);
}

void LogHandler::rolloutHandler(const char *filename, std::size_t) {
  // The log file is closed at this point, so nothing may be logged here.
  remove(filename);
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  try {
    fs::create_directories(path);
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create log directory: " << fse.what()
                          << endl;
    exit(1);
  }
  string fullPath = path + "/" + filename;
  int fd = ::open(fullPath.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullPath;
}
}  // namespace th
