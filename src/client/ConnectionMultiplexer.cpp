#include "ConnectionMultiplexer.hpp"

namespace th {
const char* connectionStatusName(ConnectionStatus status) {
  switch (status) {
    case ConnectionStatus::CONNECTING:
      return "connecting";
    case ConnectionStatus::CONNECTED:
      return "connected";
    case ConnectionStatus::DISCONNECTED:
      return "disconnected";
    case ConnectionStatus::ERROR:
      return "error";
  }
  return "unknown";
}

const char* multiplexerEventName(MultiplexerEventType type) {
  switch (type) {
    case MultiplexerEventType::PRIMARY_CONNECTED:
      return "primary:connected";
    case MultiplexerEventType::PRIMARY_DISCONNECTED:
      return "primary:disconnected";
    case MultiplexerEventType::SESSION_CONNECTED:
      return "session:connected";
    case MultiplexerEventType::SESSION_DATA:
      return "session:data";
    case MultiplexerEventType::SESSION_STATUS:
      return "session:status";
    case MultiplexerEventType::SESSION_ERROR:
      return "session:error";
    case MultiplexerEventType::SESSION_CLOSED:
      return "session:closed";
    case MultiplexerEventType::SESSION_DISCONNECTED:
      return "session:disconnected";
    case MultiplexerEventType::SESSION_STATUS_CHANGED:
      return "session:status-changed";
    case MultiplexerEventType::SESSION_RECONNECT_FAILED:
      return "session:reconnect-failed";
  }
  return "unknown";
}

json toJson(const MultiplexerStatistics& stats) {
  return json{{"totalConnections", stats.totalConnections},
              {"connectedSessions", stats.connectedSessions},
              {"disconnectedSessions", stats.disconnectedSessions},
              {"queuedMessages", stats.queuedMessages}};
}

namespace {
MultiplexerEvent makeEvent(MultiplexerEventType type, const string& sessionId,
                           const string& data = "") {
  MultiplexerEvent event;
  event.type = type;
  event.sessionId = sessionId;
  event.data = data;
  return event;
}

MultiplexEnvelope makeEnvelope(const string& sessionId, EnvelopeType type) {
  MultiplexEnvelope envelope;
  envelope.set_sessionid(sessionId);
  envelope.set_type(type);
  return envelope;
}
}  // namespace

ConnectionMultiplexer::ConnectionMultiplexer(
    shared_ptr<SocketHandler> _socketHandler,
    const MultiplexerOptions& _options)
    : socketHandler(_socketHandler),
      options(_options),
      clientId(sole::uuid4().str()),
      breaker(_options.circuitBreaker),
      primaryFd(-1),
      primaryReconnectWanted(false),
      halt(false) {
  readerThread.reset(new thread(&ConnectionMultiplexer::readerLoop, this));
  timerThread.reset(new thread(&ConnectionMultiplexer::timerLoop, this));
  reconnectThread.reset(
      new thread(&ConnectionMultiplexer::primaryReconnectLoop, this));
}

ConnectionMultiplexer::~ConnectionMultiplexer() {
  stopThreads();
  dropPrimary();
}

void ConnectionMultiplexer::connect() {
  if (isPrimaryConnected()) {
    return;
  }
  if (!breaker.canAttempt()) {
    throw TermhubError(ErrorCode::CIRCUIT_OPEN,
                       "Circuit open, not connecting to " +
                           options.endpoint.name());
  }
  breaker.recordAttempt();
  int fd = socketHandler->connect(options.endpoint);
  if (fd < 0) {
    breaker.recordFailure();
    throw TermhubError(ErrorCode::CONNECT_TIMEOUT,
                       "Could not connect to " + options.endpoint.name());
  }
  breaker.recordSuccess();
  installPrimary(fd);
}

bool ConnectionMultiplexer::isPrimaryConnected() {
  lock_guard<recursive_mutex> guard(classMutex);
  return primaryFd >= 0;
}

void ConnectionMultiplexer::connectSession(const string& sessionId,
                                           const string& projectId,
                                           const string& type) {
  vector<MultiplexerEvent> pending;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    auto it = connections.find(sessionId);
    if (it != connections.end() &&
        it->second.status == ConnectionStatus::CONNECTED &&
        !it->second.detached) {
      VLOG(1) << "Session " << sessionId << " already connected";
      return;
    }
    // An existing record keeps its queued messages.
    SessionConnection& connection = connections[sessionId];
    connection.sessionId = sessionId;
    connection.projectId = projectId;
    connection.type = type;
    connection.detached = false;
    connection.reconnectAttempts = 0;
    connection.nextAttemptAt.reset();
    connection.lastActivity = Clock::now();

    if (primaryFd < 0) {
      // Attached as soon as the primary comes back.
      setStatusLocked(connection, ConnectionStatus::DISCONNECTED, &pending);
    } else {
      setStatusLocked(connection, ConnectionStatus::CONNECTING, &pending);
      ConnectRequest request;
      request.set_sessionid(sessionId);
      request.set_projectid(projectId);
      request.set_type(type);
      if (sendLocked(Packet::fromProto(uint8_t(PacketType::TERMINAL_CONNECT),
                                       request))) {
        connection.ackDeadline = Clock::now() + options.ackTimeout;
      } else {
        setStatusLocked(connection, ConnectionStatus::DISCONNECTED, &pending);
      }
    }
  }
  emitAll(pending);
}

void ConnectionMultiplexer::sendInput(const string& sessionId,
                                      const string& data) {
  lock_guard<recursive_mutex> guard(classMutex);
  auto it = connections.find(sessionId);
  if (it == connections.end()) {
    throw TermhubError(ErrorCode::NOT_FOUND,
                       "No connection for session " + sessionId);
  }
  auto envelope = makeEnvelope(sessionId, ENVELOPE_INPUT);
  envelope.set_data(data);
  enqueueOrSend(it->second, envelope);
}

void ConnectionMultiplexer::sendCommand(const string& sessionId,
                                        const string& command) {
  lock_guard<recursive_mutex> guard(classMutex);
  auto it = connections.find(sessionId);
  if (it == connections.end()) {
    throw TermhubError(ErrorCode::NOT_FOUND,
                       "No connection for session " + sessionId);
  }
  auto envelope = makeEnvelope(sessionId, ENVELOPE_COMMAND);
  envelope.set_data(command);
  enqueueOrSend(it->second, envelope);
}

void ConnectionMultiplexer::resizeSession(const string& sessionId, int cols,
                                          int rows) {
  lock_guard<recursive_mutex> guard(classMutex);
  auto it = connections.find(sessionId);
  if (it == connections.end()) {
    throw TermhubError(ErrorCode::NOT_FOUND,
                       "No connection for session " + sessionId);
  }
  auto envelope = makeEnvelope(sessionId, ENVELOPE_RESIZE);
  envelope.mutable_dimensions()->set_row(rows);
  envelope.mutable_dimensions()->set_column(cols);
  enqueueOrSend(it->second, envelope);
}

void ConnectionMultiplexer::clearSession(const string& sessionId) {
  lock_guard<recursive_mutex> guard(classMutex);
  auto it = connections.find(sessionId);
  if (it == connections.end()) {
    throw TermhubError(ErrorCode::NOT_FOUND,
                       "No connection for session " + sessionId);
  }
  enqueueOrSend(it->second, makeEnvelope(sessionId, ENVELOPE_CLEAR));
}

void ConnectionMultiplexer::disconnectSession(const string& sessionId) {
  vector<MultiplexerEvent> pending;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    auto it = connections.find(sessionId);
    if (it == connections.end()) {
      return;
    }
    SessionConnection& connection = it->second;
    connection.nextAttemptAt.reset();
    connection.ackDeadline.reset();
    connection.detached = true;
    setStatusLocked(connection, ConnectionStatus::DISCONNECTED, &pending);
    if (primaryFd >= 0) {
      SessionRef ref;
      ref.set_sessionid(sessionId);
      sendLocked(Packet::fromProto(
          uint8_t(PacketType::TERMINAL_UI_DISCONNECT), ref));
    }
    pending.push_back(
        makeEvent(MultiplexerEventType::SESSION_DISCONNECTED, sessionId));
  }
  emitAll(pending);
}

void ConnectionMultiplexer::closeSession(const string& sessionId) {
  {
    lock_guard<recursive_mutex> guard(classMutex);
    auto it = connections.find(sessionId);
    if (it == connections.end()) {
      return;
    }
    if (primaryFd >= 0) {
      SessionRef ref;
      ref.set_sessionid(sessionId);
      sendLocked(
          Packet::fromProto(uint8_t(PacketType::TERMINAL_CLOSE), ref));
    }
    connections.erase(it);
  }
  LOG(INFO) << "Closed session " << sessionId;
  emitAll({makeEvent(MultiplexerEventType::SESSION_CLOSED, sessionId)});
}

void ConnectionMultiplexer::reconnectSession(const string& sessionId) {
  vector<MultiplexerEvent> pending;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    auto it = connections.find(sessionId);
    if (it == connections.end()) {
      throw TermhubError(ErrorCode::NOT_FOUND,
                         "No connection for session " + sessionId);
    }
    SessionConnection& connection = it->second;
    if (connection.status == ConnectionStatus::CONNECTED &&
        !connection.detached) {
      return;
    }
    connection.detached = false;
    connection.reconnectAttempts = 0;
    scheduleReconnectLocked(connection, &pending);
  }
  emitAll(pending);
}

future<json> ConnectionMultiplexer::sendControl(const string& method,
                                                const json& params) {
  auto result = make_shared<promise<json>>();
  future<json> retval = result->get_future();

  ControlRequest request;
  request.set_requestid(sole::uuid4().str());
  request.set_method(method);
  request.set_params(params.dump());

  lock_guard<recursive_mutex> guard(classMutex);
  if (primaryFd < 0) {
    result->set_exception(make_exception_ptr(TermhubError(
        ErrorCode::INVALID_STATE, "Not connected to the session server")));
    return retval;
  }
  PendingControl pendingControl;
  pendingControl.result = result;
  pendingControl.deadline = Clock::now() + options.controlTimeout;
  pendingControls[request.requestid()] = pendingControl;
  if (!sendLocked(Packet::fromProto(uint8_t(PacketType::CONTROL_REQUEST),
                                    request))) {
    pendingControls.erase(request.requestid());
    result->set_exception(make_exception_ptr(
        std::runtime_error("Could not send control request " + method)));
  }
  return retval;
}

future<json> ConnectionMultiplexer::createSession(const string& projectId,
                                                  const string& projectPath,
                                                  const string& mode) {
  return sendControl("create", json{{"projectId", projectId},
                                    {"projectPath", projectPath},
                                    {"mode", mode}});
}

optional<ConnectionStatus> ConnectionMultiplexer::getSessionStatus(
    const string& sessionId) {
  lock_guard<recursive_mutex> guard(classMutex);
  auto it = connections.find(sessionId);
  if (it == connections.end()) {
    return nullopt;
  }
  return it->second.status;
}

vector<string> ConnectionMultiplexer::getActiveSessions() {
  lock_guard<recursive_mutex> guard(classMutex);
  vector<string> retval;
  for (const auto& it : connections) {
    retval.push_back(it.first);
  }
  return retval;
}

MultiplexerStatistics ConnectionMultiplexer::getStatistics() {
  lock_guard<recursive_mutex> guard(classMutex);
  MultiplexerStatistics stats;
  stats.totalConnections = int(connections.size());
  for (const auto& it : connections) {
    if (it.second.status == ConnectionStatus::CONNECTED) {
      stats.connectedSessions++;
    } else if (it.second.status == ConnectionStatus::DISCONNECTED) {
      stats.disconnectedSessions++;
    }
    stats.queuedMessages += int(it.second.messageQueue.size());
  }
  return stats;
}

void ConnectionMultiplexer::destroy() {
  for (const auto& sessionId : getActiveSessions()) {
    disconnectSession(sessionId);
  }
  stopThreads();
  dropPrimary();
}

void ConnectionMultiplexer::forceCloseAllSessions() {
  for (const auto& sessionId : getActiveSessions()) {
    closeSession(sessionId);
  }
  stopThreads();
  dropPrimary();
}

void ConnectionMultiplexer::readerLoop() {
  el::Helpers::setThreadName("mux-reader");
  while (!halt) {
    int fd;
    {
      lock_guard<recursive_mutex> guard(classMutex);
      fd = primaryFd;
    }
    if (fd < 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      continue;
    }
    try {
      if (!socketHandler->hasData(fd)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      Packet packet;
      if (!socketHandler->readPacket(fd, &packet, true)) {
        continue;
      }
      handlePacket(packet);
    } catch (const std::runtime_error& e) {
      onPrimaryLost(fd, e.what());
    }
  }
}

void ConnectionMultiplexer::timerLoop() {
  el::Helpers::setThreadName("mux-timer");
  while (!halt) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    vector<MultiplexerEvent> pending;
    vector<shared_ptr<promise<json>>> expired;
    {
      lock_guard<recursive_mutex> guard(classMutex);
      auto now = Clock::now();
      for (auto& it : connections) {
        SessionConnection& connection = it.second;
        if (connection.nextAttemptAt && now >= *connection.nextAttemptAt) {
          connection.nextAttemptAt.reset();
          if (primaryFd < 0) {
            // The primary's reconnect handler picks this session up again.
            setStatusLocked(connection, ConnectionStatus::DISCONNECTED,
                            &pending);
            continue;
          }
          SessionRef ref;
          ref.set_sessionid(connection.sessionId);
          VLOG(1) << "Reattaching " << connection.sessionId << " (attempt "
                  << connection.reconnectAttempts << ")";
          if (sendLocked(Packet::fromProto(
                  uint8_t(PacketType::TERMINAL_RECONNECT), ref))) {
            connection.ackDeadline = now + options.ackTimeout;
          } else {
            setStatusLocked(connection, ConnectionStatus::DISCONNECTED,
                            &pending);
          }
        } else if (connection.ackDeadline && now >= *connection.ackDeadline) {
          connection.ackDeadline.reset();
          LOG(INFO) << "No acknowledgement for " << connection.sessionId;
          scheduleReconnectLocked(connection, &pending);
        }
      }
      for (auto it = pendingControls.begin(); it != pendingControls.end();) {
        if (now >= it->second.deadline) {
          expired.push_back(it->second.result);
          it = pendingControls.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (auto& result : expired) {
      result->set_exception(make_exception_ptr(TermhubError(
          ErrorCode::CONNECT_TIMEOUT, "Control request timed out")));
    }
    emitAll(pending);
  }
}

void ConnectionMultiplexer::primaryReconnectLoop() {
  el::Helpers::setThreadName("mux-reconnect");
  while (true) {
    {
      unique_lock<mutex> lock(reconnectMutex);
      reconnectCv.wait(lock,
                       [this] { return halt || primaryReconnectWanted; });
      if (halt) {
        return;
      }
    }
    if (isPrimaryConnected()) {
      lock_guard<mutex> guard(reconnectMutex);
      primaryReconnectWanted = false;
      continue;
    }

    if (breaker.attemptsExhausted()) {
      LOG(WARNING) << "Giving up on " << options.endpoint << " after "
                   << breaker.getAttemptCount() << " attempts";
      {
        lock_guard<mutex> guard(reconnectMutex);
        primaryReconnectWanted = false;
      }
      vector<MultiplexerEvent> pending;
      {
        lock_guard<recursive_mutex> guard(classMutex);
        for (auto& it : connections) {
          if (it.second.detached) {
            continue;
          }
          setStatusLocked(it.second, ConnectionStatus::ERROR, &pending);
          pending.push_back(makeEvent(
              MultiplexerEventType::SESSION_RECONNECT_FAILED, it.first));
        }
      }
      emitAll(pending);
      continue;
    }

    if (!breaker.canAttempt()) {
      unique_lock<mutex> lock(reconnectMutex);
      reconnectCv.wait_for(lock, std::chrono::milliseconds(100),
                           [this] { return bool(halt); });
      continue;
    }

    auto delay = breaker.getBackoffDelay(breaker.getAttemptCount() + 1);
    {
      unique_lock<mutex> lock(reconnectMutex);
      if (reconnectCv.wait_for(lock, delay, [this] { return bool(halt); })) {
        return;
      }
    }
    breaker.recordAttempt();
    int fd = socketHandler->connect(options.endpoint);
    if (fd < 0) {
      LOG(INFO) << "Reconnect to " << options.endpoint << " failed";
      breaker.recordFailure();
      continue;
    }
    breaker.recordSuccess();
    installPrimary(fd);
  }
}

void ConnectionMultiplexer::installPrimary(int fd) {
  vector<MultiplexerEvent> pending;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    if (primaryFd >= 0) {
      // Lost a race with the other dialer.
      socketHandler->close(fd);
      return;
    }
    primaryFd = fd;
    LOG(INFO) << "Client " << clientId << " connected to "
              << options.endpoint;
    pending.push_back(makeEvent(MultiplexerEventType::PRIMARY_CONNECTED, ""));
    for (auto& it : connections) {
      if (it.second.status == ConnectionStatus::DISCONNECTED &&
          !it.second.detached) {
        scheduleReconnectLocked(it.second, &pending);
      }
    }
  }
  {
    lock_guard<mutex> guard(reconnectMutex);
    primaryReconnectWanted = false;
  }
  emitAll(pending);
}

void ConnectionMultiplexer::onPrimaryLost(int fd, const string& reason) {
  vector<MultiplexerEvent> pending;
  map<string, PendingControl> failed;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    if (primaryFd != fd) {
      return;
    }
    LOG(WARNING) << "Lost connection to " << options.endpoint << ": "
                 << reason;
    socketHandler->close(fd);
    primaryFd = -1;
    pending.push_back(
        makeEvent(MultiplexerEventType::PRIMARY_DISCONNECTED, "", reason));
    for (auto& it : connections) {
      it.second.nextAttemptAt.reset();
      it.second.ackDeadline.reset();
      setStatusLocked(it.second, ConnectionStatus::DISCONNECTED, &pending);
    }
    failed.swap(pendingControls);
  }
  breaker.recordFailure();
  for (auto& it : failed) {
    it.second.result->set_exception(make_exception_ptr(
        std::runtime_error("Connection lost before the control response")));
  }
  emitAll(pending);

  if (options.autoReconnect && !halt) {
    lock_guard<mutex> guard(reconnectMutex);
    primaryReconnectWanted = true;
    reconnectCv.notify_all();
  }
}

void ConnectionMultiplexer::handlePacket(const Packet& packet) {
  switch (packet.getHeader()) {
    case uint8_t(PacketType::TERMINAL_MULTIPLEX):
      handleEnvelope(packet.payloadAs<MultiplexEnvelope>());
      break;
    case uint8_t(PacketType::CONTROL_RESPONSE):
      handleControlResponse(packet.payloadAs<ControlResponse>());
      break;
    default:
      LOG(WARNING) << "Unexpected packet type " << int(packet.getHeader());
      break;
  }
}

void ConnectionMultiplexer::handleEnvelope(const MultiplexEnvelope& envelope) {
  const string& sessionId = envelope.sessionid();
  vector<MultiplexerEvent> pending;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    auto it = connections.find(sessionId);
    if (it == connections.end()) {
      VLOG(1) << "Envelope for unknown session " << sessionId;
      return;
    }
    SessionConnection& connection = it->second;
    switch (envelope.type()) {
      case ENVELOPE_CONNECTED:
        connection.ackDeadline.reset();
        connection.nextAttemptAt.reset();
        connection.reconnectAttempts = 0;
        connection.lastActivity = Clock::now();
        setStatusLocked(connection, ConnectionStatus::CONNECTED, &pending);
        flushQueueLocked(connection);
        pending.push_back(makeEvent(MultiplexerEventType::SESSION_CONNECTED,
                                    sessionId, envelope.data()));
        break;
      case ENVELOPE_DATA:
        if (connection.detached) {
          break;
        }
        connection.lastActivity = Clock::now();
        pending.push_back(makeEvent(MultiplexerEventType::SESSION_DATA,
                                    sessionId, envelope.data()));
        break;
      case ENVELOPE_STATUS:
        if (connection.detached) {
          break;
        }
        pending.push_back(makeEvent(MultiplexerEventType::SESSION_STATUS,
                                    sessionId, envelope.data()));
        break;
      case ENVELOPE_ERROR:
        if (connection.status == ConnectionStatus::CONNECTING) {
          // The server refused the attach.
          connection.ackDeadline.reset();
          setStatusLocked(connection, ConnectionStatus::ERROR, &pending);
        }
        pending.push_back(makeEvent(MultiplexerEventType::SESSION_ERROR,
                                    sessionId, envelope.data()));
        break;
      case ENVELOPE_CLOSED:
        LOG(INFO) << "Server closed session " << sessionId;
        connections.erase(it);
        pending.push_back(
            makeEvent(MultiplexerEventType::SESSION_CLOSED, sessionId));
        break;
      default:
        LOG(WARNING) << "Unexpected envelope type " << int(envelope.type())
                     << " for " << sessionId;
        break;
    }
  }
  emitAll(pending);
}

void ConnectionMultiplexer::handleControlResponse(
    const ControlResponse& response) {
  shared_ptr<promise<json>> result;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    auto it = pendingControls.find(response.requestid());
    if (it == pendingControls.end()) {
      VLOG(1) << "Late control response " << response.requestid();
      return;
    }
    result = it->second.result;
    pendingControls.erase(it);
  }
  if (!response.ok()) {
    if (response.errorcode() > 0) {
      result->set_exception(make_exception_ptr(
          TermhubError(ErrorCode(response.errorcode()), response.error())));
    } else {
      result->set_exception(
          make_exception_ptr(std::runtime_error(response.error())));
    }
    return;
  }
  try {
    result->set_value(response.result().empty()
                          ? json(nullptr)
                          : json::parse(response.result()));
  } catch (const json::exception& e) {
    result->set_exception(make_exception_ptr(TermhubError(
        ErrorCode::PROTOCOL, string("Malformed control result: ") + e.what())));
  }
}

void ConnectionMultiplexer::enqueueOrSend(SessionConnection& connection,
                                          MultiplexEnvelope envelope) {
  if (connection.status == ConnectionStatus::CONNECTED &&
      connection.messageQueue.empty() &&
      sendLocked(Packet::fromProto(uint8_t(PacketType::TERMINAL_MULTIPLEX),
                                   envelope))) {
    connection.lastActivity = Clock::now();
    return;
  }
  VLOG(2) << "Queueing envelope for " << connection.sessionId;
  connection.messageQueue.push_back(std::move(envelope));
}

bool ConnectionMultiplexer::sendLocked(const Packet& packet) {
  if (primaryFd < 0) {
    return false;
  }
  try {
    socketHandler->writePacket(primaryFd, packet);
  } catch (const std::runtime_error& e) {
    LOG(WARNING) << "Write to " << options.endpoint << " failed: " << e.what();
    // Wake the reader so it tears the primary down.
    ::shutdown(primaryFd, SHUT_RDWR);
    return false;
  }
  return true;
}

void ConnectionMultiplexer::flushQueueLocked(SessionConnection& connection) {
  if (!connection.messageQueue.empty()) {
    VLOG(1) << "Flushing " << connection.messageQueue.size()
            << " queued envelopes for " << connection.sessionId;
  }
  while (!connection.messageQueue.empty()) {
    if (!sendLocked(Packet::fromProto(uint8_t(PacketType::TERMINAL_MULTIPLEX),
                                      connection.messageQueue.front()))) {
      return;
    }
    connection.messageQueue.pop_front();
  }
}

void ConnectionMultiplexer::setStatusLocked(
    SessionConnection& connection, ConnectionStatus status,
    vector<MultiplexerEvent>* pending) {
  connection.status = status;
  MultiplexerEvent event =
      makeEvent(MultiplexerEventType::SESSION_STATUS_CHANGED,
                connection.sessionId, connectionStatusName(status));
  event.status = status;
  pending->push_back(event);
}

void ConnectionMultiplexer::scheduleReconnectLocked(
    SessionConnection& connection, vector<MultiplexerEvent>* pending) {
  connection.ackDeadline.reset();
  if (connection.reconnectAttempts >= options.sessionReconnectAttempts) {
    LOG(WARNING) << "Max reconnection attempts reached for "
                 << connection.sessionId;
    connection.nextAttemptAt.reset();
    setStatusLocked(connection, ConnectionStatus::ERROR, pending);
    pending->push_back(makeEvent(MultiplexerEventType::SESSION_RECONNECT_FAILED,
                                 connection.sessionId));
    return;
  }
  connection.reconnectAttempts++;
  int shift = std::min(connection.reconnectAttempts - 1, 20);
  auto delay = options.sessionReconnectDelay * (int64_t(1) << shift);
  connection.nextAttemptAt = Clock::now() + delay;
  setStatusLocked(connection, ConnectionStatus::CONNECTING, pending);
}

void ConnectionMultiplexer::stopThreads() {
  halt = true;
  {
    lock_guard<mutex> guard(reconnectMutex);
    reconnectCv.notify_all();
  }
  for (auto* t : {&readerThread, &timerThread, &reconnectThread}) {
    if (!*t) {
      continue;
    }
    if ((*t)->get_id() == std::this_thread::get_id()) {
      (*t)->detach();
    } else if ((*t)->joinable()) {
      (*t)->join();
    }
    t->reset();
  }
}

void ConnectionMultiplexer::dropPrimary() {
  map<string, PendingControl> failed;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    if (primaryFd >= 0) {
      socketHandler->close(primaryFd);
      primaryFd = -1;
    }
    failed.swap(pendingControls);
  }
  for (auto& it : failed) {
    it.second.result->set_exception(
        make_exception_ptr(std::runtime_error("Multiplexer shut down")));
  }
}

void ConnectionMultiplexer::emitAll(const vector<MultiplexerEvent>& pending) {
  for (const auto& event : pending) {
    VLOG(3) << multiplexerEventName(event.type) << " " << event.sessionId;
    eventChannel.emit(event);
  }
}
}  // namespace th
