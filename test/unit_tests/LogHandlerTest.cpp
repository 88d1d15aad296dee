#include "LogHandler.hpp"

#include "TestHeaders.hpp"

using namespace th;

TEST_CASE("Log file names", "[LogHandler]") {
  string name = LogHandler::logFileName("termhub-server", "", false);
  REQUIRE(name.find("termhub-server-") == 0);
  REQUIRE(name.find("stderr") == string::npos);
  REQUIRE(name.substr(name.size() - 4) == ".log");

  string stderrName = LogHandler::logFileName("termhub-server", "stderr", true);
  REQUIRE(stderrName.find("termhub-server-stderr-") == 0);
  string pidSuffix = "_" + std::to_string(getpid()) + ".log";
  REQUIRE(stderrName.substr(stderrName.size() - pidSuffix.size()) ==
          pidSuffix);
}

TEST_CASE("Log files are created inside a new directory", "[LogHandler]") {
  string directory =
      GetTempDirectory() + "th_logs_" + genRandomAlphaNum(8) + "/nested";
  LogOptions options;
  options.directory = directory;
  options.prefix = "termhub-test";
  options.appendPid = true;
  options.maxFileSize = "4096";

  el::Configurations conf;
  conf.setToDefault();
  string path = LogHandler::setupLogFiles(&conf, options);
  REQUIRE(path.find(directory + "/termhub-test-") == 0);
  REQUIRE(fs::exists(path));
  REQUIRE(fs::file_size(path) == 0);
  REQUIRE(conf.get(el::Level::Info, el::ConfigurationType::Filename)->value() ==
          path);
  REQUIRE(conf.get(el::Level::Error, el::ConfigurationType::ToFile)->value() ==
          "true");
  REQUIRE(conf.get(el::Level::Info, el::ConfigurationType::MaxLogFileSize)
              ->value() == "4096");
  REQUIRE(conf.get(el::Level::Info, el::ConfigurationType::ToStandardOutput)
              ->value() == "false");

  fs::remove_all(fs::path(directory).parent_path());
}

TEST_CASE("Out of range verbosity is ignored", "[LogHandler]") {
  auto original = el::Loggers::verboseLevel();
  LogHandler::setupVerbosity(3);
  REQUIRE(el::Loggers::verboseLevel() == 3);
  LogHandler::setupVerbosity(12);
  REQUIRE(el::Loggers::verboseLevel() == 3);
  LogHandler::setupVerbosity(-1);
  REQUIRE(el::Loggers::verboseLevel() == 3);
  el::Loggers::setVerboseLevel(original);
}
