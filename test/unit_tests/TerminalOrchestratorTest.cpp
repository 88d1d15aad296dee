#include "TerminalOrchestrator.hpp"

#include "FakeTerminalProcess.hpp"
#include "FakeTransportBackend.hpp"
#include "PipeSocketHandler.hpp"
#include "TestHeaders.hpp"

using namespace th;

namespace {
OrchestratorConfig orchestratorConfig() {
  OrchestratorConfig config;
  config.shell = "/bin/sh";
  config.closeGraceDelay = std::chrono::milliseconds(0);
  config.connectTimeout = std::chrono::milliseconds(1000);
  return config;
}

CreateTerminalParams paramsFor(const string& projectId) {
  CreateTerminalParams params;
  params.projectId = projectId;
  params.projectPath = GetTempDirectory();
  return params;
}

bool isGone(const optional<TerminalInfo>& info) {
  return !info || info->session.status == SessionStatus::CLOSED;
}
}  // namespace

TEST_CASE("Terminals are created active with a live backend",
          "[TerminalOrchestrator]") {
  FakeProcessFactory fakes;
  TerminalOrchestrator orchestrator(orchestratorConfig(),
                                    make_shared<PipeSocketHandler>(),
                                    fakes.factory());
  auto params = paramsFor("p1");
  params.dimensions = Dimensions{40, 120};
  params.environment["EDITOR"] = "vi";
  auto info = orchestrator.createTerminal(params);

  REQUIRE(info.session.status == SessionStatus::ACTIVE);
  REQUIRE(info.session.metadata.dimensions == Dimensions({40, 120}));
  REQUIRE(info.stream);
  REQUIRE(info.stream->processBacked);
  REQUIRE(info.stream->status == StreamStatus::CONNECTED);
  auto process = fakes.last();
  REQUIRE(process->options.dimensions == Dimensions({40, 120}));
  REQUIRE(process->options.environment["EDITOR"] == "vi");
  REQUIRE(process->options.workingDirectory == GetTempDirectory());

  string id = info.session.id;
  orchestrator.writeToTerminal(id, "pwd\n");
  REQUIRE(process->readInput(4) == "pwd\n");

  process->emitOutput("/tmp\r\n");
  REQUIRE(waitFor([&]() {
    return orchestrator.getTerminal(id)->buffer ==
           vector<string>({"/tmp\r\n"});
  }));
  REQUIRE(waitFor([&]() {
    return orchestrator.getTerminal(id)->session.metrics.outputBytes == 6;
  }));
  REQUIRE(orchestrator.getTerminal(id)->session.metrics.inputBytes == 4);

  orchestrator.resizeTerminal(id, Dimensions{50, 160});
  REQUIRE(process->getResizes().size() == 1);
  REQUIRE(orchestrator.getTerminal(id)->session.metadata.dimensions.cols ==
          160);

  REQUIRE(orchestrator.listProjectTerminals("p1").size() == 1);
  REQUIRE(orchestrator.closeTerminal(id));
  REQUIRE(!orchestrator.closeTerminal(id));
  REQUIRE(process->wasTerminated());
  REQUIRE(orchestrator.listProjectTerminals("p1").empty());
}

TEST_CASE("A failed spawn leaves no session behind", "[TerminalOrchestrator]") {
  FakeProcessFactory fakes;
  TerminalOrchestrator orchestrator(orchestratorConfig(),
                                    make_shared<PipeSocketHandler>(),
                                    fakes.factory());
  fakes.failSpawns = true;
  REQUIRE_THROWS_AS(orchestrator.createTerminal(paramsFor("p1")),
                    std::runtime_error);
  REQUIRE(orchestrator.listProjectTerminals("p1").empty());
  REQUIRE(orchestrator.getStatus().sessions == 0);

  // Assistant sessions need an endpoint
  auto params = paramsFor("p1");
  params.mode = SessionMode::CLAUDE;
  fakes.failSpawns = false;
  REQUIRE_THROWS_AS(orchestrator.createTerminal(params), std::invalid_argument);
  REQUIRE(orchestrator.listProjectTerminals("p1").empty());
}

TEST_CASE("Assistant sessions run over the transport",
          "[TerminalOrchestrator]") {
  string path =
      GetTempDirectory() + "th_assistant_" + genRandomAlphaNum(8) + ".sock";
  FakeTransportBackend backend(path);
  OrchestratorConfig config = orchestratorConfig();
  config.assistantEndpoint = path;
  FakeProcessFactory fakes;
  TerminalOrchestrator orchestrator(config, make_shared<PipeSocketHandler>(),
                                    fakes.factory());

  auto params = paramsFor("p1");
  params.mode = SessionMode::CLAUDE;
  auto info = orchestrator.createTerminal(params);
  REQUIRE(info.session.mode == SessionMode::CLAUDE);
  REQUIRE(info.stream->type == StreamType::CLAUDE);
  REQUIRE(!info.stream->processBacked);
  REQUIRE(fakes.count() == 0);

  orchestrator.writeToTerminal(info.session.id, "explain this");
  REQUIRE(waitFor([&]() { return backend.receivedData() == "explain this"; }));
  REQUIRE(orchestrator.closeTerminal(info.session.id));
}

TEST_CASE("Suspending a project keeps its output for the resume",
          "[TerminalOrchestrator]") {
  FakeProcessFactory fakes;
  TerminalOrchestrator orchestrator(orchestratorConfig(),
                                    make_shared<PipeSocketHandler>(),
                                    fakes.factory());
  auto info = orchestrator.createTerminal(paramsFor("p1"));
  string id = info.session.id;
  fakes.last()->emitOutput("$ ");
  REQUIRE(waitFor([&]() { return !orchestrator.getTerminal(id)->buffer.empty(); }));

  REQUIRE(orchestrator.suspendProject("p1") == 1);
  REQUIRE(orchestrator.getTerminal(id)->session.status ==
          SessionStatus::SUSPENDED);
  REQUIRE(fakes.last()->wasTerminated());

  auto resumed = orchestrator.resumeProject("p1");
  REQUIRE(resumed.size() == 1);
  REQUIRE(resumed[0].session.id == id);
  REQUIRE(resumed[0].session.status == SessionStatus::ACTIVE);
  REQUIRE(resumed[0].buffer == vector<string>({"$ "}));
  REQUIRE(resumed[0].stream->status == StreamStatus::CONNECTED);
  REQUIRE(fakes.count() == 2);

  orchestrator.writeToTerminal(id, "ls\n");
  REQUIRE(fakes.last()->readInput(3) == "ls\n");
}

TEST_CASE("A backend exit closes its session", "[TerminalOrchestrator]") {
  FakeProcessFactory fakes;
  TerminalOrchestrator orchestrator(orchestratorConfig(),
                                    make_shared<PipeSocketHandler>(),
                                    fakes.factory());
  auto info = orchestrator.createTerminal(paramsFor("p1"));
  fakes.last()->exit(0);
  REQUIRE(waitFor([&]() { return isGone(orchestrator.getTerminal(info.session.id)); }));
  REQUIRE(orchestrator.listProjectTerminals("p1").empty());

  REQUIRE_THROWS_AS(orchestrator.writeToTerminal("session_0_missing0", "x"),
                    TermhubError);
}

TEST_CASE("Sessions swept by the session manager release their backend",
          "[TerminalOrchestrator]") {
  FakeProcessFactory fakes;
  auto config = orchestratorConfig();
  config.sessionTimeout = std::chrono::milliseconds(10);
  TerminalOrchestrator orchestrator(config, make_shared<PipeSocketHandler>(),
                                    fakes.factory());
  auto info = orchestrator.createTerminal(paramsFor("p1"));
  string id = info.session.id;
  auto process = fakes.last();

  orchestrator.sessions()->updateSessionStatus(id, SessionStatus::ERROR,
                                               "backend wedged");
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(orchestrator.sessions()->cleanupInactiveSessions() == 1);

  REQUIRE(process->wasTerminated());
  orchestrator.streams()->purgeClosedStreams();
  REQUIRE(!orchestrator.streams()->getStream(id));
  REQUIRE(orchestrator.streams()->getActiveStreams().empty());
}

TEST_CASE("Metrics export formats", "[TerminalOrchestrator]") {
  FakeProcessFactory fakes;
  TerminalOrchestrator orchestrator(orchestratorConfig(),
                                    make_shared<PipeSocketHandler>(),
                                    fakes.factory());
  orchestrator.createTerminal(paramsFor("p1"));
  orchestrator.createTerminal(paramsFor("p2"));

  REQUIRE(orchestrator.exportMetrics("prometheus")
              .find("terminal_sessions_total 2") != string::npos);
  json metrics = json::parse(orchestrator.exportMetrics("json"));
  REQUIRE(metrics["sessions"]["active"] == 2);
  REQUIRE(metrics["streams"]["connected"] == 2);
  REQUIRE_THROWS_AS(orchestrator.exportMetrics("xml"), std::invalid_argument);

  auto status = orchestrator.getStatus();
  REQUIRE(status.ready);
  REQUIRE(status.sessions == 2);
  REQUIRE(status.streams == 2);
  REQUIRE(status.projects == 2);
  REQUIRE(toJson(status)["statistics"]["projects"] == 2);

  orchestrator.cleanup();
  REQUIRE(orchestrator.getStatus().sessions == 0);
  REQUIRE(!orchestrator.getStatus().ready);
  REQUIRE_THROWS_AS(orchestrator.createTerminal(paramsFor("p1")),
                    std::runtime_error);
}
