#include "MetricsCollector.hpp"

#include "FakeTerminalProcess.hpp"
#include "PipeSocketHandler.hpp"
#include "TestHeaders.hpp"

using namespace th;

namespace {
vector<string> splitLines(const string& text) {
  vector<string> lines;
  std::istringstream iss(text);
  string line;
  while (std::getline(iss, line)) {
    lines.push_back(line);
  }
  return lines;
}

const HealthCheck& findCheck(const HealthStatus& health, const string& name) {
  for (const auto& check : health.checks) {
    if (check.name == name) {
      return check;
    }
  }
  FAIL("Missing health check " << name);
  return health.checks.front();
}

struct MetricsFixture {
  MetricsFixture()
      : sessions(config()),
        streams(config(), make_shared<PipeSocketHandler>(), fakes.factory()),
        collector(config(), &sessions, &streams) {}

  static OrchestratorConfig config() {
    OrchestratorConfig config;
    config.metricsHistorySize = 4;
    config.closeGraceDelay = std::chrono::milliseconds(60 * 1000);
    return config;
  }

  FakeProcessFactory fakes;
  SessionManager sessions;
  StreamManager streams;
  MetricsCollector collector;
};
}  // namespace

TEST_CASE("Prometheus export uses the documented series", "[MetricsCollector]") {
  MetricsFixture fixture;
  auto a = fixture.sessions.createSession("p1");
  fixture.sessions.updateSessionStatus(a.id, SessionStatus::CONNECTING);
  fixture.sessions.updateSessionStatus(a.id, SessionStatus::ACTIVE);
  fixture.sessions.createSession("p1");
  TerminalStreamOptions options;
  options.sessionId = a.id;
  fixture.streams.createTerminalStream(options);
  fixture.collector.recordError("stream", "boom");

  auto lines = splitLines(fixture.collector.exportPrometheusMetrics());
  REQUIRE(lines.size() == 21);
  REQUIRE(lines[0] == "# HELP terminal_cpu_usage CPU usage percentage");
  REQUIRE(lines[1] == "# TYPE terminal_cpu_usage gauge");
  REQUIRE(lines[2].find("terminal_cpu_usage ") == 0);
  REQUIRE(lines[5].find("terminal_memory_usage{type=\"heap\"} ") == 0);
  REQUIRE(lines[6].find("terminal_memory_usage{type=\"rss\"} ") == 0);
  REQUIRE(lines[9] == "terminal_sessions_total 2");
  REQUIRE(lines[10] == "terminal_sessions_active 1");
  REQUIRE(lines[13] == "terminal_streams_total 1");
  REQUIRE(lines[14] == "terminal_streams_connected 1");
  REQUIRE(lines[16] == "# TYPE terminal_errors_total counter");
  REQUIRE(lines[17] == "terminal_errors_total 1");
  REQUIRE(lines[20] == "terminal_latency_ms 0");
}

TEST_CASE("A burst of errors makes the daemon unhealthy", "[MetricsCollector]") {
  MetricsFixture fixture;
  auto health = fixture.collector.getHealthStatus();
  REQUIRE(health.healthy);
  REQUIRE(health.checks.size() == 6);
  REQUIRE(findCheck(health, "Error Rate").status == CheckStatus::PASS);
  REQUIRE(findCheck(health, "Stream Connectivity").status == CheckStatus::PASS);

  int unhealthyEvents = 0;
  fixture.collector.events().subscribe([&](const MetricsEvent& event) {
    if (event.type == MetricsEventType::UNHEALTHY) {
      unhealthyEvents++;
    }
  });
  for (int i = 0; i < 11; i++) {
    fixture.collector.recordError("stream", "transport lost " + to_string(i));
  }
  health = fixture.collector.checkHealthNow();
  REQUIRE(!health.healthy);
  const auto& errorCheck = findCheck(health, "Error Rate");
  REQUIRE(errorCheck.status == CheckStatus::FAIL);
  REQUIRE(errorCheck.value == "11.0/min");
  REQUIRE(unhealthyEvents == 1);

  auto report = fixture.collector.getPerformanceReport();
  REQUIRE(report.summary == "System has issues that require attention.");
  REQUIRE(report.recommendations.size() >= 1);
  REQUIRE(toJson(report)["metrics"]["errors"] == 11);
}

TEST_CASE("Disconnected streams fail the connectivity check",
          "[MetricsCollector]") {
  MetricsFixture fixture;
  TerminalStreamOptions options;
  options.sessionId = "session_one";
  fixture.streams.createTerminalStream(options);
  options.sessionId = "session_two";
  fixture.streams.createTerminalStream(options);
  fixture.fakes.last()->exit(0);
  REQUIRE(waitFor([&]() { return fixture.streams.getActiveStreams().size() == 1; }));

  // One of two disconnected is past the warning ratio only
  auto health = fixture.collector.getHealthStatus();
  REQUIRE(findCheck(health, "Stream Connectivity").status == CheckStatus::WARN);
  REQUIRE(health.healthy);

  REQUIRE(fixture.streams.closeStream("session_one"));
  health = fixture.collector.getHealthStatus();
  REQUIRE(findCheck(health, "Stream Connectivity").status == CheckStatus::FAIL);
  REQUIRE(!health.healthy);
}

TEST_CASE("Errors are learned from manager events", "[MetricsCollector]") {
  MetricsFixture fixture;
  auto a = fixture.sessions.createSession("p1");
  fixture.sessions.updateSessionStatus(a.id, SessionStatus::ERROR,
                                       "spawn failed");
  auto metrics = fixture.collector.getCurrentMetrics();
  REQUIRE(metrics.errors.total == 1);
  REQUIRE(metrics.errors.byType["session"] == 1);
  REQUIRE(metrics.errors.lastError->message == "spawn failed");
  REQUIRE(metrics.sessions.error == 1);
  REQUIRE(metrics.sessions.creationRate == 1);
  REQUIRE(metrics.sessions.byProject["p1"] == 1);

  fixture.sessions.closeSession(a.id);
  metrics = fixture.collector.getCurrentMetrics();
  REQUIRE(metrics.sessions.total == 0);
  REQUIRE(metrics.sessions.averageLifetime >= 0);
  REQUIRE(toJson(metrics)["errors"]["total"] == 1);
}

TEST_CASE("Metrics history is bounded", "[MetricsCollector]") {
  MetricsFixture fixture;
  for (int i = 0; i < 10; i++) {
    fixture.collector.collectNow();
    REQUIRE(fixture.collector.getMetricsHistory().size() <= 4);
  }
  REQUIRE(!fixture.collector.getMetricsHistory().empty());
  REQUIRE(fixture.collector.getMetricsHistory(std::chrono::milliseconds(60000))
              .size() == fixture.collector.getMetricsHistory().size());

  auto sample = fixture.collector.getCurrentMetrics();
  REQUIRE(sample.memory.rss > 0);
  REQUIRE(sample.cpu.cores > 0);
}

TEST_CASE("The error counter survives log trimming", "[MetricsCollector]") {
  MetricsFixture fixture;
  for (int i = 0; i < 1001; i++) {
    fixture.collector.recordError("stream", "flap " + to_string(i));
  }
  auto metrics = fixture.collector.getCurrentMetrics();
  REQUIRE(metrics.errors.total == 1001);
  // Only the newest entries are kept for the breakdown
  REQUIRE(metrics.errors.byType["stream"] == 500);
  REQUIRE(metrics.errors.lastError->message == "flap 1000");

  fixture.collector.recordError("session", "spawn failed");
  auto lines = splitLines(fixture.collector.exportPrometheusMetrics());
  REQUIRE(std::find(lines.begin(), lines.end(),
                    "terminal_errors_total 1002") != lines.end());
  REQUIRE(fixture.collector.getCurrentMetrics().errors.total == 1002);
}
