#include "OrchestratorConfig.hpp"

#include "TestHeaders.hpp"

using namespace th;

namespace {
string writeConfig(const string& contents) {
  string tmpPath = GetTempDirectory() + string("th_test_config_XXXXXXXX");
  string directory = string(mkdtemp(&tmpPath[0]));
  string path = directory + "/termhub.ini";
  ofstream out(path);
  out << contents;
  out.close();
  return path;
}

void removeConfig(const string& path) {
  fs::remove_all(fs::path(path).parent_path());
}
}  // namespace

TEST_CASE("OrchestratorConfig defaults", "[OrchestratorConfig]") {
  OrchestratorConfig config;
  REQUIRE(config.maxTotalSessions == 50);
  REQUIRE(config.maxSessionsPerProject == 10);
  REQUIRE(config.maxFocusedPerProject == 4);
  REQUIRE(config.sessionTimeout == std::chrono::minutes(30));
  REQUIRE(config.suspensionTimeout == std::chrono::hours(24));
  REQUIRE(config.streamBufferSize == 500);
  REQUIRE(config.reconnectAttempts == 3);
  REQUIRE(config.circuitBreaker.failureThreshold == 2);
  REQUIRE(config.circuitBreaker.recoveryTimeout == std::chrono::seconds(30));
  REQUIRE(config.metricsInterval == std::chrono::seconds(10));
  REQUIRE(config.healthInterval == std::chrono::seconds(30));
}

TEST_CASE("OrchestratorConfig overrides from an INI file",
          "[OrchestratorConfig]") {
  string path = writeConfig(
      "[sessions]\n"
      "max_per_project = 2\n"
      "max_focused_per_project = 1\n"
      "timeout_ms = 1500\n"
      "unknown_key = ignored\n"
      "[streams]\n"
      "buffer_size = 16\n"
      "shell = /bin/sh\n"
      "assistant_endpoint = /tmp/assistant.sock\n"
      "[metrics]\n"
      "cpu_threshold = 55.5\n"
      "[circuit_breaker]\n"
      "failure_threshold = 5\n"
      "backoff_max_ms = 8000\n"
      "[server]\n"
      "socket = /tmp/th.sock\n"
      "metrics_port = 9100\n");

  OrchestratorConfig config;
  config.loadFromIni(path);
  REQUIRE(config.maxSessionsPerProject == 2);
  REQUIRE(config.maxFocusedPerProject == 1);
  REQUIRE(config.sessionTimeout == std::chrono::milliseconds(1500));
  REQUIRE(config.maxTotalSessions == 50);
  REQUIRE(config.streamBufferSize == 16);
  REQUIRE(config.resolveShell() == "/bin/sh");
  REQUIRE(config.assistantEndpoint == "/tmp/assistant.sock");
  REQUIRE(config.thresholds.cpuPercent == Approx(55.5));
  REQUIRE(config.circuitBreaker.failureThreshold == 5);
  REQUIRE(config.circuitBreaker.backoffMax == std::chrono::seconds(8));
  REQUIRE(config.socketPath == "/tmp/th.sock");
  REQUIRE(config.metricsPort == 9100);

  json j = config.toJson();
  REQUIRE(j.is_object());
  removeConfig(path);
}

TEST_CASE("OrchestratorConfig rejects malformed values",
          "[OrchestratorConfig]") {
  SECTION("Not a number") {
    string path = writeConfig("[sessions]\nmax_total = lots\n");
    OrchestratorConfig config;
    REQUIRE_THROWS_AS(config.loadFromIni(path), std::runtime_error);
    removeConfig(path);
  }

  SECTION("Zero quota") {
    string path = writeConfig("[sessions]\nmax_per_project = 0\n");
    OrchestratorConfig config;
    REQUIRE_THROWS_AS(config.loadFromIni(path), std::runtime_error);
    removeConfig(path);
  }

  SECTION("Missing file") {
    OrchestratorConfig config;
    REQUIRE_THROWS_AS(
        config.loadFromIni(GetTempDirectory() + "th_no_such_config.ini"),
        std::runtime_error);
  }
}
