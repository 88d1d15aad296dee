#include <cxxopts.hpp>

#include "ConnectionMultiplexer.hpp"
#include "Headers.hpp"
#include "LocalConsole.hpp"
#include "LogHandler.hpp"
#include "OrchestratorConfig.hpp"
#include "PipeSocketHandler.hpp"

using namespace th;

namespace {
std::atomic<bool> windowChanged(true);

void handleWindowChange(int) { windowChanged = true; }

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

int listSessions(ConnectionMultiplexer& multiplexer, const string& projectId) {
  json sessions =
      multiplexer.sendControl("list", json{{"projectId", projectId}}).get();
  if (sessions.empty()) {
    CLOG(INFO, "stdout") << "No sessions for project " << projectId << endl;
    return 0;
  }
  for (const auto& info : sessions) {
    const json& session = info["session"];
    CLOG(INFO, "stdout") << session["id"].get<string>() << "\t"
                         << session["tabName"].get<string>() << "\t"
                         << session["status"].get<string>() << "\t"
                         << session["mode"].get<string>() << endl;
  }
  return 0;
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  th::HandleTerminate();

  cxxopts::Options options("termhub-client",
                           "Interactive client for the termhub daemon");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("socket", "UNIX socket of the termhub daemon",
         cxxopts::value<string>()->default_value(GetTempDirectory() +
                                                 "termhub.sock"))  //
        ("p,project", "Project the session belongs to",
         cxxopts::value<string>()->default_value("default"))  //
        ("path", "Working directory for a new session",
         cxxopts::value<string>()->default_value(""))  //
        ("mode", "Mode for a new session (normal, claude, system)",
         cxxopts::value<string>()->default_value("normal"))  //
        ("s,session", "Attach to an existing session instead of creating one",
         cxxopts::value<string>()->default_value(""))  //
        ("l,list", "List the project's sessions and exit")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<string>()->default_value(""))  //
        ("logtostdout", "log to stdout")             //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "termhub-client version " << TH_VERSION << endl;
      exit(0);
    }

    OrchestratorConfig config;
    if (!result["cfgfile"].as<string>().empty()) {
      try {
        config.loadFromIni(result["cfgfile"].as<string>());
      } catch (const std::runtime_error& e) {
        STFATAL << e.what();
      }
    }

    LogOptions logOptions;
    logOptions.directory = GetTempDirectory() + "termhub";
    logOptions.prefix = "termhub-client";
    logOptions.toStdout = result.count("logtostdout") > 0;
    logOptions.appendPid = true;
    LogHandler::setupLogFiles(&defaultConf, logOptions);
    el::Loggers::reconfigureLogger("default", defaultConf);
    LogHandler::setupVerbosity(result["verbose"].as<int>());

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }
    ::signal(SIGPIPE, SIG_IGN);

    // Declared ahead of the multiplexer: its threads call into these until it
    // is destroyed.
    LocalConsole console;
    atomic<bool> done(false);
    string exitReason;
    mutex exitReasonMutex;

    MultiplexerOptions multiplexerOptions;
    multiplexerOptions.endpoint.set_name(result["socket"].as<string>());
    multiplexerOptions.circuitBreaker = config.circuitBreaker;
    multiplexerOptions.ackTimeout = config.connectTimeout;
    ConnectionMultiplexer multiplexer(
        shared_ptr<SocketHandler>(new PipeSocketHandler()),
        multiplexerOptions);

    try {
      multiplexer.connect();
    } catch (const TermhubError& e) {
      CLOG(INFO, "stdout") << "Could not reach termhub-server at "
                           << multiplexerOptions.endpoint << ": " << e.what()
                           << endl;
      exit(1);
    }

    string projectId = result["project"].as<string>();
    if (result.count("list")) {
      int retval = 0;
      try {
        retval = listSessions(multiplexer, projectId);
      } catch (const std::runtime_error& e) {
        CLOG(INFO, "stdout") << "Could not list sessions: " << e.what() << endl;
        retval = 1;
      }
      multiplexer.destroy();
      return retval;
    }

    string sessionId = result["session"].as<string>();
    string mode = result["mode"].as<string>();
    if (sessionId.empty()) {
      string path = result["path"].as<string>();
      if (path.empty()) {
        path = fs::current_path().string();
      }
      try {
        json info = multiplexer.createSession(projectId, path, mode).get();
        sessionId = info["session"]["id"].get<string>();
      } catch (const TermhubError& e) {
        CLOG(INFO, "stdout") << "Could not create a session ("
                             << e.getCodeName() << "): " << e.what() << endl;
        exit(1);
      } catch (const std::runtime_error& e) {
        CLOG(INFO, "stdout") << "Could not create a session: " << e.what()
                             << endl;
        exit(1);
      }
      CLOG(INFO, "stdout") << "Created session " << sessionId << endl;
    }

    multiplexer.events().subscribe([&](const MultiplexerEvent& event) {
      if (event.sessionId != sessionId &&
          event.type != MultiplexerEventType::PRIMARY_DISCONNECTED) {
        return;
      }
      switch (event.type) {
        case MultiplexerEventType::SESSION_DATA:
          console.write(event.data);
          break;
        case MultiplexerEventType::SESSION_ERROR:
          LOG(WARNING) << "Session error: " << event.data;
          break;
        case MultiplexerEventType::PRIMARY_DISCONNECTED:
          LOG(WARNING) << "Lost the daemon, reconnecting: " << event.data;
          break;
        case MultiplexerEventType::SESSION_CLOSED: {
          lock_guard<mutex> guard(exitReasonMutex);
          exitReason = "Session closed";
          done = true;
          break;
        }
        case MultiplexerEventType::SESSION_RECONNECT_FAILED: {
          lock_guard<mutex> guard(exitReasonMutex);
          exitReason = "Gave up reconnecting to the session";
          done = true;
          break;
        }
        default:
          break;
      }
    });

    ::signal(SIGWINCH, handleWindowChange);
    multiplexer.connectSession(sessionId, projectId, mode);
    console.setup();

    WindowSize lastWindowSize;
    char buf[16 * 1024];
    bool detached = false;
    while (!done) {
      if (windowChanged.exchange(false)) {
        WindowSize ti = console.getWindowSize();
        if (ti.row() != lastWindowSize.row() ||
            ti.column() != lastWindowSize.column()) {
          LOG(INFO) << "Window size changed: row: " << ti.row()
                    << " column: " << ti.column();
          lastWindowSize = ti;
          try {
            multiplexer.resizeSession(sessionId, ti.column(), ti.row());
          } catch (const TermhubError& e) {
            VLOG(1) << "Resize dropped: " << e.what();
          }
        }
      }

      fd_set rfd;
      FD_ZERO(&rfd);
      FD_SET(console.getFd(), &rfd);
      timeval tv;
      tv.tv_sec = 0;
      tv.tv_usec = 10000;
      int numFdsSet = select(console.getFd() + 1, &rfd, NULL, NULL, &tv);
      if (numFdsSet < 0 && errno == EINTR) {
        continue;
      }
      FATAL_FAIL(numFdsSet);
      if (numFdsSet == 0) {
        continue;
      }
      ssize_t rc = ::read(console.getFd(), buf, sizeof(buf));
      if (rc < 0 && (errno == EAGAIN || errno == EINTR)) {
        continue;
      }
      if (rc <= 0) {
        // stdin closed: leave the session running on the daemon.
        detached = true;
        break;
      }
      try {
        multiplexer.sendInput(sessionId, string(buf, rc));
      } catch (const TermhubError& e) {
        // The session was closed under us; the event sets done.
        VLOG(1) << "Input dropped: " << e.what();
      }
    }

    console.teardown();
    if (detached) {
      multiplexer.destroy();
      CLOG(INFO, "stdout") << "Detached from " << sessionId << endl;
    } else {
      lock_guard<mutex> guard(exitReasonMutex);
      CLOG(INFO, "stdout") << exitReason << endl;
    }
  } catch (cxxopts::OptionException& oe) {
    handleParseException(oe, options);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
