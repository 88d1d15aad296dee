#include "StreamManager.hpp"

#include "FakeTerminalProcess.hpp"
#include "FakeTransportBackend.hpp"
#include "PipeSocketHandler.hpp"
#include "PtyTerminalProcess.hpp"
#include "TestHeaders.hpp"

using namespace th;

namespace {
OrchestratorConfig streamConfig() {
  OrchestratorConfig config;
  config.shell = "/bin/sh";
  config.streamBufferSize = 16;
  config.connectTimeout = std::chrono::milliseconds(1000);
  config.reconnectAttempts = 100;
  config.reconnectDelay = std::chrono::milliseconds(20);
  config.closeGraceDelay = std::chrono::milliseconds(0);
  return config;
}

string tempSocketPath() {
  return GetTempDirectory() + "th_stream_" + genRandomAlphaNum(8) + ".sock";
}

/** Collects events published on the stream readers. The record is shared
 * with the listener so late events after the test body are harmless. */
class EventLog {
 public:
  explicit EventLog(StreamManager& manager) : record(new Record()) {
    auto target = record;
    manager.events().subscribe([target](const StreamEvent& event) {
      lock_guard<mutex> guard(target->logMutex);
      target->events.push_back(event);
    });
  }

  int count(StreamEventType type) {
    lock_guard<mutex> guard(record->logMutex);
    int n = 0;
    for (const auto& event : record->events) {
      if (event.type == type) {
        n++;
      }
    }
    return n;
  }

  string data() {
    lock_guard<mutex> guard(record->logMutex);
    string retval;
    for (const auto& event : record->events) {
      if (event.type == StreamEventType::DATA) {
        retval += event.data;
      }
    }
    return retval;
  }

  optional<StreamEvent> last(StreamEventType type) {
    lock_guard<mutex> guard(record->logMutex);
    for (auto it = record->events.rbegin(); it != record->events.rend();
         ++it) {
      if (it->type == type) {
        return *it;
      }
    }
    return nullopt;
  }

 protected:
  struct Record {
    mutex logMutex;
    vector<StreamEvent> events;
  };
  shared_ptr<Record> record;
};

string joined(const vector<string>& chunks) {
  string retval;
  for (const auto& chunk : chunks) {
    retval += chunk;
  }
  return retval;
}

void requireErrorCode(const std::function<void()>& fn, ErrorCode code) {
  try {
    fn();
    FAIL("Expected a TermhubError");
  } catch (const TermhubError& e) {
    REQUIRE(e.getCode() == code);
  }
}
}  // namespace

TEST_CASE("A shell runs on a real pseudo-terminal", "[StreamManager]") {
  StreamManager manager(streamConfig(), make_shared<PipeSocketHandler>(),
                        &PtyTerminalProcess::create);
  EventLog log(manager);

  TerminalStreamOptions options;
  options.sessionId = "session_pty";
  options.workingDirectory = GetTempDirectory();
  options.dimensions = Dimensions{30, 100};
  auto snapshot = manager.createTerminalStream(options);
  REQUIRE(snapshot.processBacked);
  REQUIRE(snapshot.status == StreamStatus::CONNECTED);

  manager.write("session_pty", "echo hello_$((40+2))\n");
  REQUIRE(waitFor([&]() {
    return joined(manager.readBuffer("session_pty")).find("hello_42") !=
           string::npos;
  }));
  REQUIRE(log.data().find("hello_42") != string::npos);

  manager.write("session_pty", "exit 3\n");
  REQUIRE(waitFor([&]() { return log.count(StreamEventType::EXIT) == 1; }));
  REQUIRE(log.last(StreamEventType::EXIT)->exitCode == 3);
  REQUIRE(manager.getStream("session_pty")->status ==
          StreamStatus::DISCONNECTED);
  REQUIRE(manager.closeStream("session_pty"));
}

TEST_CASE("Process streams carry input, output and resizes",
          "[StreamManager]") {
  FakeProcessFactory fakes;
  StreamManager manager(streamConfig(), make_shared<PipeSocketHandler>(),
                        fakes.factory());
  EventLog log(manager);

  TerminalStreamOptions options;
  options.sessionId = "session_fake";
  options.environment["FOO"] = "bar";
  manager.createTerminalStream(options);
  auto process = fakes.last();
  REQUIRE(process->options.shell == "/bin/sh");
  REQUIRE(process->options.environment["FOO"] == "bar");
  REQUIRE(log.count(StreamEventType::CREATED) == 1);

  requireErrorCode([&]() { manager.createTerminalStream(options); },
                   ErrorCode::INVALID_STATE);

  manager.write("session_fake", "ls\n");
  REQUIRE(process->readInput(3) == "ls\n");

  process->emitOutput("total 0\r\n");
  REQUIRE(waitFor([&]() { return log.data() == "total 0\r\n"; }));
  REQUIRE(manager.readBuffer("session_fake") ==
          vector<string>({"total 0\r\n"}));

  auto metrics = *manager.getMetrics("session_fake");
  REQUIRE(metrics.bytesIn == 3);
  REQUIRE(metrics.messagesIn == 1);
  REQUIRE(metrics.bytesOut == 9);
  REQUIRE(metrics.connectTime);

  manager.resize("session_fake", Dimensions{50, 132});
  REQUIRE(process->getResizes().size() == 1);
  REQUIRE(process->getResizes()[0].cols == 132);
  REQUIRE_THROWS_AS(manager.resize("session_fake", Dimensions{0, 80}),
                    std::invalid_argument);

  requireErrorCode([&]() { manager.write("session_missing", "x"); },
                   ErrorCode::NOT_FOUND);
  requireErrorCode([&]() { manager.resize("session_missing", Dimensions()); },
                   ErrorCode::NOT_FOUND);
  REQUIRE(manager.readBuffer("session_missing").empty());
}

TEST_CASE("Process exit is reported once", "[StreamManager]") {
  FakeProcessFactory fakes;
  StreamManager manager(streamConfig(), make_shared<PipeSocketHandler>(),
                        fakes.factory());
  EventLog log(manager);

  TerminalStreamOptions options;
  options.sessionId = "session_exit";
  manager.createTerminalStream(options);
  fakes.last()->exit(7);

  REQUIRE(waitFor([&]() { return log.count(StreamEventType::EXIT) == 1; }));
  REQUIRE(log.last(StreamEventType::EXIT)->exitCode == 7);
  auto snapshot = *manager.getStream("session_exit");
  REQUIRE(snapshot.status == StreamStatus::DISCONNECTED);
  REQUIRE(snapshot.metrics.disconnectTime);
  REQUIRE(manager.getActiveStreams().empty());

  // Input for a dead process is held, not thrown away
  manager.write("session_exit", "late");
  REQUIRE(manager.getStream("session_exit")->pendingInput == 1);

  requireErrorCode([&]() { manager.reconnectStream("session_exit"); },
                   ErrorCode::PROCESS_EXIT);
}

TEST_CASE("Closing a stream is idempotent", "[StreamManager]") {
  FakeProcessFactory fakes;
  StreamManager manager(streamConfig(), make_shared<PipeSocketHandler>(),
                        fakes.factory());
  EventLog log(manager);

  TerminalStreamOptions options;
  options.sessionId = "session_close";
  manager.createTerminalStream(options);
  REQUIRE(manager.closeStream("session_close"));
  REQUIRE(!manager.closeStream("session_close"));
  REQUIRE(!manager.closeStream("session_unknown"));
  REQUIRE(log.count(StreamEventType::CLOSED) == 1);
  REQUIRE(log.count(StreamEventType::EXIT) == 0);
  REQUIRE(fakes.last()->wasTerminated());

  REQUIRE(manager.purgeClosedStreams() == 1);
  REQUIRE(!manager.getStream("session_close"));

  // The session id can host a new stream once the old one is closed
  manager.createTerminalStream(options);
  REQUIRE(fakes.count() == 2);
}

TEST_CASE("Closing a process stream under a live writer", "[StreamManager]") {
  FakeProcessFactory fakes;
  StreamManager manager(streamConfig(), make_shared<PipeSocketHandler>(),
                        fakes.factory());
  EventLog log(manager);

  TerminalStreamOptions options;
  options.sessionId = "session_racing";
  manager.createTerminalStream(options);
  auto process = fakes.last();

  atomic<bool> stop(false);
  atomic<int> failures(0);
  atomic<int> writes(0);
  thread writer([&]() {
    while (!stop) {
      try {
        manager.write("session_racing", "x");
        writes++;
      } catch (const std::exception&) {
        failures++;
      }
      std::this_thread::sleep_for(std::chrono::microseconds(200));
    }
  });
  REQUIRE(waitFor([&]() { return writes > 50; }));
  REQUIRE(manager.closeStream("session_racing"));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  stop = true;
  writer.join();

  REQUIRE(failures == 0);
  REQUIRE(process->wasTerminated());
  REQUIRE(log.count(StreamEventType::CLOSED) == 1);
  // Whatever reached the child before the hangup is the writer's bytes only
  string received = process->readInput(1, 200);
  REQUIRE(received.find_first_not_of('x') == string::npos);
  // Writes after the close are held, not sent
  REQUIRE(manager.getStream("session_racing")->pendingInput > 0);
}

TEST_CASE("Output ring keeps only the newest chunks", "[StreamManager]") {
  FakeProcessFactory fakes;
  OrchestratorConfig config = streamConfig();
  config.streamBufferSize = 3;
  StreamManager manager(config, make_shared<PipeSocketHandler>(),
                        fakes.factory());
  EventLog log(manager);

  TerminalStreamOptions options;
  options.sessionId = "session_ring";
  manager.createTerminalStream(options);
  auto process = fakes.last();
  for (int i = 0; i < 5; i++) {
    process->emitOutput(to_string(i));
    // One chunk per read
    REQUIRE(waitFor([&]() { return int(log.data().size()) == i + 1; }));
  }
  REQUIRE(manager.readBuffer("session_ring") ==
          vector<string>({"2", "3", "4"}));
}

TEST_CASE("Transport streams handshake and exchange data",
          "[StreamManager]") {
  string path = tempSocketPath();
  FakeTransportBackend backend(path);
  FakeProcessFactory fakes;
  StreamManager manager(streamConfig(), make_shared<PipeSocketHandler>(),
                        fakes.factory());
  EventLog log(manager);

  TransportStreamOptions options;
  options.sessionId = "session_transport";
  options.endpoint = path;
  options.type = StreamType::CLAUDE;
  auto snapshot = manager.createTransportStream(options).get();
  REQUIRE(!snapshot.processBacked);
  REQUIRE(snapshot.type == StreamType::CLAUDE);
  REQUIRE(snapshot.status == StreamStatus::CONNECTED);
  REQUIRE(backend.handshakeCount() == 1);
  REQUIRE(log.count(StreamEventType::CONNECTED) == 1);

  manager.write("session_transport", "hello ");
  manager.write("session_transport", "backend");
  REQUIRE(waitFor([&]() { return backend.receivedData() == "hello backend"; }));

  backend.sendOutput("answer");
  REQUIRE(waitFor([&]() { return log.data() == "answer"; }));
  REQUIRE(manager.readBuffer("session_transport") ==
          vector<string>({"answer"}));

  manager.resize("session_transport", Dimensions{10, 20});
  REQUIRE(waitFor([&]() { return backend.receivedResizes().size() == 1; }));
  REQUIRE(backend.receivedResizes()[0].row() == 10);
  REQUIRE(backend.receivedResizes()[0].column() == 20);

  manager.runHealthCheck();
  REQUIRE(manager.getStream("session_transport")->status ==
          StreamStatus::CONNECTED);

  REQUIRE(manager.closeStream("session_transport"));
  REQUIRE(log.count(StreamEventType::CLOSED) == 1);
}

TEST_CASE("Transport writes made while disconnected replay in order",
          "[StreamManager]") {
  string path = tempSocketPath();
  unique_ptr<FakeTransportBackend> backend(new FakeTransportBackend(path));
  FakeProcessFactory fakes;
  StreamManager manager(streamConfig(), make_shared<PipeSocketHandler>(),
                        fakes.factory());
  EventLog log(manager);

  TransportStreamOptions options;
  options.sessionId = "session_replay";
  options.endpoint = path;
  manager.connectTransportStream(options);

  backend->stop();
  backend.reset();
  REQUIRE(waitFor([&]() { return log.count(StreamEventType::ERROR) >= 1; }));
  REQUIRE(manager.getStream("session_replay")->status !=
          StreamStatus::CONNECTED);

  manager.write("session_replay", "one ");
  manager.write("session_replay", "two ");
  manager.write("session_replay", "three");
  REQUIRE(manager.getStream("session_replay")->pendingInput == 3);

  FakeTransportBackend restarted(path);
  REQUIRE(waitFor([&]() {
    return log.count(StreamEventType::RECONNECTED) == 1;
  }));
  REQUIRE(waitFor([&]() { return restarted.receivedData() == "one two three"; }));
  auto snapshot = *manager.getStream("session_replay");
  REQUIRE(snapshot.status == StreamStatus::CONNECTED);
  REQUIRE(snapshot.pendingInput == 0);
  REQUIRE(snapshot.metrics.bytesIn == 13);

  manager.write("session_replay", "!");
  REQUIRE(waitFor([&]() { return restarted.receivedData() == "one two three!"; }));
}

TEST_CASE("Transport failures surface as typed errors", "[StreamManager]") {
  OrchestratorConfig config = streamConfig();
  config.connectTimeout = std::chrono::milliseconds(200);
  config.reconnectAttempts = 2;
  config.reconnectDelay = std::chrono::milliseconds(10);
  FakeProcessFactory fakes;
  StreamManager manager(config, make_shared<PipeSocketHandler>(),
                        fakes.factory());

  TransportStreamOptions options;
  options.sessionId = "session_missing_backend";
  options.endpoint = tempSocketPath();
  requireErrorCode([&]() { manager.connectTransportStream(options); },
                   ErrorCode::CONNECT_TIMEOUT);
  REQUIRE(!manager.getStream("session_missing_backend"));

  string path = tempSocketPath();
  FakeTransportBackend backend(path);
  options.endpoint = path;

  backend.answerHandshakes = false;
  options.sessionId = "session_silent";
  requireErrorCode([&]() { manager.createTransportStream(options).get(); },
                   ErrorCode::CONNECT_TIMEOUT);

  backend.answerHandshakes = true;
  backend.acceptHandshakes = false;
  options.sessionId = "session_rejected";
  requireErrorCode([&]() { manager.connectTransportStream(options); },
                   ErrorCode::PROTOCOL);

  options.endpoint = "";
  REQUIRE_THROWS_AS(manager.connectTransportStream(options),
                    std::invalid_argument);
}

TEST_CASE("Reconnect gives up after the configured attempts",
          "[StreamManager]") {
  OrchestratorConfig config = streamConfig();
  config.reconnectAttempts = 2;
  config.reconnectDelay = std::chrono::milliseconds(10);
  string path = tempSocketPath();
  unique_ptr<FakeTransportBackend> backend(new FakeTransportBackend(path));
  FakeProcessFactory fakes;
  StreamManager manager(config, make_shared<PipeSocketHandler>(),
                        fakes.factory());
  EventLog log(manager);

  TransportStreamOptions options;
  options.sessionId = "session_gone";
  options.endpoint = path;
  manager.connectTransportStream(options);
  backend.reset();

  REQUIRE(waitFor([&]() {
    return log.count(StreamEventType::RECONNECT_FAILED) == 1;
  }));
  REQUIRE(manager.getStream("session_gone")->status == StreamStatus::ERROR);
  requireErrorCode([&]() { manager.reconnectStream("session_gone"); },
                   ErrorCode::RECONNECT_EXHAUSTED);
  REQUIRE(log.count(StreamEventType::RECONNECT_FAILED) == 2);
}
