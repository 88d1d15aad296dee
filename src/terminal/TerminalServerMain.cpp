#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "MetricsHttpServer.hpp"
#include "PipeSocketHandler.hpp"
#include "SessionServer.hpp"
#include "TerminalOrchestrator.hpp"

using namespace th;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  th::HandleTerminate();

  cxxopts::Options options("termhub-server",
                           "Multiplexed terminal session daemon");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("socket", "UNIX socket to listen on",
         cxxopts::value<string>()->default_value(""))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("metricsport", "Serve /metrics and /health on this port",
         cxxopts::value<int>()->default_value("0"))  //
        ("logtostdout", "log to stdout")             //
        ("logdir", "Directory for log files",
         cxxopts::value<string>()->default_value(GetTempDirectory() +
                                                 "termhub"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "termhub-server version " << TH_VERSION << endl;
      exit(0);
    }

    OrchestratorConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      try {
        config.loadFromIni(cfgfilename);
      } catch (const std::runtime_error &e) {
        STFATAL << e.what();
      }
    }
    if (!result["socket"].as<string>().empty()) {
      config.socketPath = result["socket"].as<string>();
    }
    if (config.socketPath.empty()) {
      config.socketPath = GetTempDirectory() + "termhub.sock";
    }
    if (result.count("metricsport")) {
      config.metricsPort = result["metricsport"].as<int>();
    }

    LogOptions logOptions;
    logOptions.directory = result["logdir"].as<string>();
    logOptions.prefix = "termhub-server";
    logOptions.toStdout = result.count("logtostdout") > 0;
    logOptions.redirectStderr = !logOptions.toStdout;
    LogHandler::setupLogFiles(&defaultConf, logOptions);
    el::Loggers::reconfigureLogger("default", defaultConf);
    LogHandler::setupVerbosity(result["verbose"].as<int>());
    el::Helpers::setThreadName("termhub-main");

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }
    ::signal(SIGPIPE, SIG_IGN);

    // Every thread created from here on inherits the mask, so only the
    // waiter below ever sees these signals.
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);
    FATAL_FAIL(pthread_sigmask(SIG_BLOCK, &stopSignals, NULL));

    LOG(INFO) << "Starting with config " << config.toJson().dump();
    shared_ptr<SocketHandler> transportHandler(new PipeSocketHandler());
    shared_ptr<SocketHandler> serverHandler(new PipeSocketHandler());
    shared_ptr<TerminalOrchestrator> orchestrator(
        new TerminalOrchestrator(config, transportHandler));
    orchestrator->start();

    unique_ptr<MetricsHttpServer> metricsServer;
    if (config.metricsPort > 0) {
      metricsServer.reset(
          new MetricsHttpServer(orchestrator, "127.0.0.1", config.metricsPort));
      metricsServer->start();
    }

    SocketEndpoint serverEndpoint;
    serverEndpoint.set_name(config.socketPath);
    SessionServer sessionServer(serverHandler, serverEndpoint, orchestrator);

    thread signalWaiter([&sessionServer, stopSignals]() {
      el::Helpers::setThreadName("signal-waiter");
      int signum = 0;
      sigwait(&stopSignals, &signum);
      LOG(INFO) << "Got signal " << signum << ", shutting down";
      sessionServer.shutdown();
    });

    CLOG(INFO, "stdout") << "termhub-server listening on " << config.socketPath
                         << endl;
    sessionServer.run();
    signalWaiter.join();

    if (metricsServer) {
      metricsServer->stop();
    }
    orchestrator->shutdown();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
