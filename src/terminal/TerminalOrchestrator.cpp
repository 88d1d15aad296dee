#include "TerminalOrchestrator.hpp"

namespace th {
json toJson(const TerminalInfo& info) {
  json j;
  j["session"] = toJson(info.session);
  if (info.stream) {
    j["stream"] = toJson(*info.stream);
  } else {
    j["stream"] = nullptr;
  }
  j["buffer"] = info.buffer;
  return j;
}

json toJson(const OrchestratorStatus& status) {
  return json{{"ready", status.ready},
              {"health", toJson(status.health)},
              {"statistics",
               {{"sessions", status.sessions},
                {"streams", status.streams},
                {"projects", status.projects}}}};
}

TerminalOrchestrator::TerminalOrchestrator(
    const OrchestratorConfig& _config,
    shared_ptr<SocketHandler> transportHandler,
    TerminalProcessFactory processFactory)
    : config(_config),
      sessionManager(new SessionManager(_config)),
      streamManager(
          new StreamManager(_config, transportHandler, processFactory)),
      ready(false) {
  metricsCollector.reset(new MetricsCollector(config, sessionManager.get(),
                                              streamManager.get()));
  streamSubscription = streamManager->events().subscribe(
      [this](const StreamEvent& event) { onStreamEvent(event); });
  // Sessions closed by the manager's own sweeps still own a backend.
  sessionSubscription = sessionManager->events().subscribe(
      [this](const SessionEvent& event) {
        if (event.type == SessionEventType::CLOSED) {
          streamManager->closeStream(event.session.id);
        }
      });
  ready = true;
  LOG(INFO) << "Terminal orchestrator initialized";
}

TerminalOrchestrator::~TerminalOrchestrator() {
  shutdown();
  sessionManager->events().unsubscribe(sessionSubscription);
  streamManager->events().unsubscribe(streamSubscription);
}

TerminalInfo TerminalOrchestrator::createTerminal(
    const CreateTerminalParams& params) {
  if (!ready) {
    throw std::runtime_error("Orchestrator not ready");
  }
  TerminalSession session = sessionManager->createSession(
      params.projectId, params.userId, params.mode, params.projectPath);

  TerminalInfo info;
  try {
    if (params.dimensions || !params.environment.empty()) {
      MetadataPatch patch;
      patch.dimensions = params.dimensions;
      if (!params.environment.empty()) {
        patch.environment = params.environment;
      }
      sessionManager->updateSessionMetadata(session.id, patch);
    }
    sessionManager->updateSessionStatus(session.id, SessionStatus::CONNECTING);
    session = *sessionManager->getSession(session.id);
    info.stream = attachBackend(session);
    sessionManager->updateSessionStatus(session.id, SessionStatus::ACTIVE);
  } catch (const std::exception& e) {
    LOG(WARNING) << "Failed to create terminal for project " << params.projectId
                 << ": " << e.what();
    streamManager->closeStream(session.id);
    sessionManager->closeSession(session.id);
    throw;
  }
  auto current = sessionManager->getSession(session.id);
  info.session = current ? *current : session;
  return info;
}

StreamSnapshot TerminalOrchestrator::attachBackend(
    const TerminalSession& session) {
  if (session.mode == SessionMode::CLAUDE) {
    TransportStreamOptions options;
    options.sessionId = session.id;
    options.type = StreamType::CLAUDE;
    return streamManager->createTransportStream(options).get();
  }
  TerminalStreamOptions options;
  options.sessionId = session.id;
  options.workingDirectory = session.metadata.workingDirectory;
  options.dimensions = session.metadata.dimensions;
  options.environment = session.metadata.environment;
  options.type = session.mode == SessionMode::SYSTEM ? StreamType::SYSTEM
                                                     : StreamType::TERMINAL;
  return streamManager->createTerminalStream(options);
}

optional<TerminalInfo> TerminalOrchestrator::getTerminal(
    const string& sessionId) const {
  auto session = sessionManager->getSession(sessionId);
  if (!session) {
    return nullopt;
  }
  TerminalInfo info;
  info.session = *session;
  info.stream = streamManager->getStream(sessionId);
  info.buffer = streamManager->readBuffer(sessionId);
  return info;
}

vector<TerminalInfo> TerminalOrchestrator::listProjectTerminals(
    const string& projectId) const {
  vector<TerminalInfo> retval;
  for (const auto& session : sessionManager->listProjectSessions(projectId)) {
    TerminalInfo info;
    info.session = session;
    info.stream = streamManager->getStream(session.id);
    info.buffer = streamManager->readBuffer(session.id);
    retval.push_back(info);
  }
  return retval;
}

void TerminalOrchestrator::writeToTerminal(const string& sessionId,
                                           const string& data) {
  if (!sessionManager->getSession(sessionId)) {
    throw TermhubError(ErrorCode::NOT_FOUND,
                       "Session " + sessionId + " not found");
  }
  sessionManager->recordActivity(sessionId, data.size(), 0);
  streamManager->write(sessionId, data);
}

void TerminalOrchestrator::resizeTerminal(const string& sessionId,
                                          const Dimensions& dimensions) {
  MetadataPatch patch;
  patch.dimensions = dimensions;
  sessionManager->updateSessionMetadata(sessionId, patch);
  auto stream = streamManager->getStream(sessionId);
  if (stream && stream->status != StreamStatus::DISCONNECTED) {
    streamManager->resize(sessionId, dimensions);
  }
}

void TerminalOrchestrator::setTerminalFocus(const string& sessionId,
                                            bool focused) {
  sessionManager->setSessionFocus(sessionId, focused);
}

bool TerminalOrchestrator::closeTerminal(const string& sessionId) {
  streamManager->closeStream(sessionId);
  return sessionManager->closeSession(sessionId);
}

int TerminalOrchestrator::suspendProject(const string& projectId) {
  map<string, vector<string>> bufferedOutput;
  for (const auto& session : sessionManager->listProjectSessions(projectId)) {
    if (session.status != SessionStatus::ACTIVE) {
      continue;
    }
    bufferedOutput[session.id] = streamManager->readBuffer(session.id);
    streamManager->closeStream(session.id);
  }
  int count = sessionManager->suspendProjectSessions(projectId, bufferedOutput);
  LOG(INFO) << "Suspended " << count << " terminals of project " << projectId;
  return count;
}

vector<TerminalInfo> TerminalOrchestrator::resumeProject(
    const string& projectId) {
  map<string, vector<string>> bufferedOutput;
  auto sessions =
      sessionManager->resumeProjectSessions(projectId, &bufferedOutput);

  vector<TerminalInfo> terminals;
  for (const auto& session : sessions) {
    try {
      TerminalInfo info;
      info.stream = attachBackend(session);
      auto current = sessionManager->getSession(session.id);
      info.session = current ? *current : session;
      info.buffer = bufferedOutput[session.id];
      terminals.push_back(info);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Failed to recreate stream for session " << session.id
                 << ": " << e.what();
      try {
        sessionManager->updateSessionStatus(session.id, SessionStatus::ERROR,
                                            e.what());
      } catch (const TermhubError& stateError) {
        LOG(WARNING) << "Could not mark " << session.id
                     << " as failed: " << stateError.what();
      }
    }
  }
  LOG(INFO) << "Resumed " << terminals.size() << " terminals of project "
            << projectId;
  return terminals;
}

OrchestratorStatus TerminalOrchestrator::getStatus() {
  OrchestratorStatus status;
  SessionStatistics stats = sessionManager->getStatistics();
  status.ready = ready;
  status.health = metricsCollector->getHealthStatus();
  status.sessions = stats.totalSessions;
  status.streams = int(streamManager->getActiveStreams().size());
  status.projects = stats.projectCount;
  return status;
}

string TerminalOrchestrator::exportMetrics(const string& format) {
  if (format == "prometheus") {
    return metricsCollector->exportPrometheusMetrics();
  }
  if (format == "json") {
    return toJson(getMetrics()).dump(2);
  }
  throw std::invalid_argument("Unknown metrics format: " + format);
}

void TerminalOrchestrator::cleanup() {
  for (const auto& stream : streamManager->getStreamSnapshots()) {
    streamManager->closeStream(stream.sessionId);
  }
  for (const auto& session : sessionManager->snapshotSessions()) {
    sessionManager->closeSession(session.id);
  }
  ready = false;
  LOG(INFO) << "Orchestrator cleaned up";
}

void TerminalOrchestrator::start() {
  sessionManager->start();
  streamManager->start();
  metricsCollector->start();
}

void TerminalOrchestrator::shutdown() {
  metricsCollector->shutdown();
  if (ready) {
    cleanup();
  }
  streamManager->shutdown();
  sessionManager->shutdown();
}

void TerminalOrchestrator::onStreamEvent(const StreamEvent& event) {
  switch (event.type) {
    case StreamEventType::DATA:
      sessionManager->recordActivity(event.sessionId, 0, event.data.size());
      break;
    case StreamEventType::EXIT:
      LOG(INFO) << "Backend of session " << event.sessionId
                << " exited with code " << event.exitCode;
      streamManager->closeStream(event.sessionId);
      sessionManager->closeSession(event.sessionId);
      break;
    case StreamEventType::ERROR: {
      auto session = sessionManager->getSession(event.sessionId);
      if (!session || session->status == SessionStatus::CLOSED ||
          session->status == SessionStatus::ERROR ||
          session->status == SessionStatus::SUSPENDED) {
        break;
      }
      try {
        sessionManager->updateSessionStatus(event.sessionId,
                                            SessionStatus::ERROR,
                                            event.message);
      } catch (const TermhubError& e) {
        VLOG(1) << "Ignoring stream error for " << event.sessionId << ": "
                << e.what();
      }
      break;
    }
    case StreamEventType::RECONNECTED: {
      auto session = sessionManager->getSession(event.sessionId);
      if (!session || session->status != SessionStatus::ERROR) {
        break;
      }
      try {
        sessionManager->updateSessionStatus(event.sessionId,
                                            SessionStatus::CONNECTING);
        sessionManager->updateSessionStatus(event.sessionId,
                                            SessionStatus::ACTIVE);
      } catch (const TermhubError& e) {
        LOG(WARNING) << "Could not reactivate " << event.sessionId << ": "
                     << e.what();
      }
      break;
    }
    default:
      break;
  }
}
}  // namespace th
