#include "SessionServer.hpp"

namespace th {
namespace {
string requireString(const json& params, const char* key) {
  auto it = params.find(key);
  if (it == params.end() || !it->is_string() ||
      it->get<string>().empty()) {
    throw TermhubError(ErrorCode::PROTOCOL,
                       string("Missing parameter: ") + key);
  }
  return it->get<string>();
}
}  // namespace

SessionServer::SessionServer(shared_ptr<SocketHandler> _socketHandler,
                             const SocketEndpoint& _serverEndpoint,
                             shared_ptr<TerminalOrchestrator> _orchestrator)
    : socketHandler(_socketHandler),
      serverEndpoint(_serverEndpoint),
      orchestrator(_orchestrator),
      listening(false),
      halt(false) {
  sessionSubscription = orchestrator->sessions()->events().subscribe(
      [this](const SessionEvent& event) { onSessionEvent(event); });
  streamSubscription = orchestrator->streams()->events().subscribe(
      [this](const StreamEvent& event) { onStreamEvent(event); });
  socketHandler->listen(serverEndpoint);
  listening = true;
}

SessionServer::~SessionServer() {
  shutdown();
  stopListening();
  orchestrator->sessions()->events().unsubscribe(sessionSubscription);
  orchestrator->streams()->events().unsubscribe(streamSubscription);
}

void SessionServer::run() {
  LOG(INFO) << "Session server listening on " << serverEndpoint;
  set<int> serverFds = socketHandler->getEndpointFds(serverEndpoint);
  while (!halt) {
    fd_set rfds;
    FD_ZERO(&rfds);
    int maxFd = 0;
    for (int fd : serverFds) {
      FD_SET(fd, &rfds);
      maxFd = max(maxFd, fd);
    }
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet < 0 && errno == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);
    if (numFdsSet == 0) {
      continue;
    }
    for (int fd : serverFds) {
      if (FD_ISSET(fd, &rfds)) {
        acceptNewConnection(fd);
      }
    }
  }
  stopListening();
}

void SessionServer::stopListening() {
  lock_guard<recursive_mutex> guard(classMutex);
  if (listening) {
    socketHandler->stopListening(serverEndpoint);
    listening = false;
  }
}

bool SessionServer::acceptNewConnection(int fd) {
  int clientFd = socketHandler->accept(fd);
  if (clientFd < 0) {
    return false;
  }
  VLOG(1) << "Accepted session client on fd " << clientFd;
  auto client = make_shared<ClientState>(clientFd);

  vector<shared_ptr<thread>> finished;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    if (halt) {
      socketHandler->close(clientFd);
      return false;
    }
    // Reap handlers whose clients are gone.
    for (auto it = clientThreads.begin(); it != clientThreads.end();) {
      if (clients.find(it->first) == clients.end()) {
        finished.push_back(it->second);
        it = clientThreads.erase(it);
      } else {
        ++it;
      }
    }
    clients[clientFd] = client;
    clientThreads[clientFd].reset(
        new thread(&SessionServer::clientHandler, this, client));
  }
  for (auto& t : finished) {
    t->join();
  }
  return true;
}

void SessionServer::shutdown() {
  if (halt.exchange(true)) {
    return;
  }
  map<int, shared_ptr<thread>> threads;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    for (const auto& it : clients) {
      it.second->alive = false;
    }
    threads.swap(clientThreads);
  }
  for (auto& it : threads) {
    it.second->join();
  }
  LOG(INFO) << "Session server stopped";
}

int SessionServer::getClientCount() {
  lock_guard<recursive_mutex> guard(classMutex);
  return int(clients.size());
}

int SessionServer::getAttachmentCount(const string& sessionId) {
  lock_guard<recursive_mutex> guard(classMutex);
  auto it = attachments.find(sessionId);
  return it == attachments.end() ? 0 : int(it->second.size());
}

void SessionServer::clientHandler(shared_ptr<ClientState> client) {
  el::Helpers::setThreadName("session-client");
  try {
    while (client->alive && !halt) {
      if (!socketHandler->hasData(client->fd)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      Packet packet;
      if (!socketHandler->readPacket(client->fd, &packet, true)) {
        continue;
      }
      handlePacket(client, packet);
    }
  } catch (const std::runtime_error& e) {
    LOG(INFO) << "Session client on fd " << client->fd
              << " went away: " << e.what();
  }

  client->alive = false;
  detachAll(client->fd);
  {
    lock_guard<recursive_mutex> guard(classMutex);
    clients.erase(client->fd);
  }
  lock_guard<mutex> writeGuard(client->writeMutex);
  socketHandler->close(client->fd);
}

void SessionServer::handlePacket(const shared_ptr<ClientState>& client,
                                 const Packet& packet) {
  switch (packet.getHeader()) {
    case uint8_t(PacketType::TERMINAL_CONNECT): {
      auto request = packet.payloadAs<ConnectRequest>();
      attach(client, request.sessionid());
      break;
    }
    case uint8_t(PacketType::TERMINAL_RECONNECT): {
      auto ref = packet.payloadAs<SessionRef>();
      attach(client, ref.sessionid());
      break;
    }
    case uint8_t(PacketType::TERMINAL_UI_DISCONNECT): {
      auto ref = packet.payloadAs<SessionRef>();
      VLOG(1) << "Client " << client->fd << " detached from "
              << ref.sessionid();
      detach(client->fd, ref.sessionid());
      break;
    }
    case uint8_t(PacketType::TERMINAL_CLOSE): {
      auto ref = packet.payloadAs<SessionRef>();
      LOG(INFO) << "Client " << client->fd << " closed session "
                << ref.sessionid();
      orchestrator->closeTerminal(ref.sessionid());
      detach(client->fd, ref.sessionid());
      break;
    }
    case uint8_t(PacketType::TERMINAL_MULTIPLEX):
      handleEnvelope(client, packet.payloadAs<MultiplexEnvelope>());
      break;
    case uint8_t(PacketType::CONTROL_REQUEST): {
      auto response = handleControl(packet.payloadAs<ControlRequest>());
      send(client, Packet::fromProto(uint8_t(PacketType::CONTROL_RESPONSE),
                                     response));
      break;
    }
    default:
      LOG(WARNING) << "Unexpected packet type " << int(packet.getHeader())
                   << " from client " << client->fd;
      break;
  }
}

void SessionServer::handleEnvelope(const shared_ptr<ClientState>& client,
                                   const MultiplexEnvelope& envelope) {
  const string& sessionId = envelope.sessionid();
  try {
    switch (envelope.type()) {
      case ENVELOPE_INPUT:
        orchestrator->writeToTerminal(sessionId, envelope.data());
        break;
      case ENVELOPE_COMMAND:
        orchestrator->writeToTerminal(sessionId, envelope.data() + "\n");
        orchestrator->sessions()->recordActivity(sessionId, 0, 0, 1);
        break;
      case ENVELOPE_RESIZE: {
        Dimensions dimensions;
        dimensions.rows = envelope.dimensions().row();
        dimensions.cols = envelope.dimensions().column();
        orchestrator->resizeTerminal(sessionId, dimensions);
        break;
      }
      case ENVELOPE_CLEAR:
        orchestrator->writeToTerminal(sessionId, "\x0c");
        break;
      default:
        throw TermhubError(ErrorCode::PROTOCOL,
                           "Unexpected envelope type " +
                               to_string(int(envelope.type())));
    }
  } catch (const TermhubError& e) {
    VLOG(1) << "Envelope for " << sessionId << " failed: " << e.what();
    sendEnvelope(client, sessionId, ENVELOPE_ERROR, e.what());
  } catch (const std::invalid_argument& e) {
    sendEnvelope(client, sessionId, ENVELOPE_ERROR, e.what());
  }
}

void SessionServer::attach(const shared_ptr<ClientState>& client,
                           const string& sessionId) {
  auto session = orchestrator->sessions()->getSession(sessionId);
  if (!session || session->status == SessionStatus::CLOSED) {
    sendEnvelope(client, sessionId, ENVELOPE_ERROR,
                 "Session " + sessionId + " not found");
    return;
  }
  // Hold the client's write lock so live output queues behind the replay.
  lock_guard<mutex> writeGuard(client->writeMutex);
  {
    lock_guard<recursive_mutex> guard(classMutex);
    attachments[sessionId].insert(client->fd);
  }
  LOG(INFO) << "Client " << client->fd << " attached to " << sessionId;

  vector<Packet> packets;
  MultiplexEnvelope connected;
  connected.set_sessionid(sessionId);
  connected.set_type(ENVELOPE_CONNECTED);
  connected.set_data(toJson(*session).dump());
  packets.push_back(
      Packet::fromProto(uint8_t(PacketType::TERMINAL_MULTIPLEX), connected));
  for (const auto& chunk : orchestrator->streams()->readBuffer(sessionId)) {
    MultiplexEnvelope data;
    data.set_sessionid(sessionId);
    data.set_type(ENVELOPE_DATA);
    data.set_data(chunk);
    packets.push_back(
        Packet::fromProto(uint8_t(PacketType::TERMINAL_MULTIPLEX), data));
  }
  try {
    for (const auto& packet : packets) {
      socketHandler->writePacket(client->fd, packet);
    }
  } catch (const std::runtime_error& e) {
    LOG(WARNING) << "Could not replay " << sessionId << " to client "
                 << client->fd << ": " << e.what();
    client->alive = false;
  }
}

void SessionServer::detach(int clientFd, const string& sessionId) {
  lock_guard<recursive_mutex> guard(classMutex);
  auto it = attachments.find(sessionId);
  if (it == attachments.end()) {
    return;
  }
  it->second.erase(clientFd);
  if (it->second.empty()) {
    attachments.erase(it);
  }
}

void SessionServer::detachAll(int clientFd) {
  lock_guard<recursive_mutex> guard(classMutex);
  for (auto it = attachments.begin(); it != attachments.end();) {
    it->second.erase(clientFd);
    if (it->second.empty()) {
      it = attachments.erase(it);
    } else {
      ++it;
    }
  }
}

ControlResponse SessionServer::handleControl(const ControlRequest& request) {
  ControlResponse response;
  response.set_requestid(request.requestid());
  try {
    json params = request.params().empty() ? json::object()
                                           : json::parse(request.params());
    if (params.is_null()) {
      params = json::object();
    }
    if (!params.is_object()) {
      throw TermhubError(ErrorCode::PROTOCOL, "Parameters must be an object");
    }
    json result = dispatchControl(request.method(), params);
    response.set_ok(true);
    response.set_result(result.dump());
  } catch (const TermhubError& e) {
    response.set_ok(false);
    response.set_error(e.what());
    response.set_errorcode(int(e.getCode()));
  } catch (const json::exception& e) {
    response.set_ok(false);
    response.set_error(string("Malformed parameters: ") + e.what());
    response.set_errorcode(int(ErrorCode::PROTOCOL));
  } catch (const std::exception& e) {
    response.set_ok(false);
    response.set_error(e.what());
    response.set_errorcode(0);
  }
  VLOG(1) << "Control " << request.method() << " -> "
          << (response.ok() ? "ok" : response.error());
  return response;
}

json SessionServer::dispatchControl(const string& method, const json& params) {
  if (method == "create") {
    CreateTerminalParams create;
    create.projectId = requireString(params, "projectId");
    create.projectPath = params.value("projectPath", "");
    if (params.contains("userId") && params["userId"].is_string()) {
      create.userId = params["userId"].get<string>();
    }
    if (params.contains("mode")) {
      auto mode = parseSessionMode(params["mode"].get<string>());
      if (!mode) {
        throw TermhubError(ErrorCode::PROTOCOL,
                           "Unknown mode " + params["mode"].dump());
      }
      create.mode = *mode;
    }
    if (params.contains("rows") && params.contains("cols")) {
      Dimensions dimensions;
      dimensions.rows = params["rows"].get<int>();
      dimensions.cols = params["cols"].get<int>();
      create.dimensions = dimensions;
    }
    if (params.contains("environment")) {
      create.environment =
          params["environment"].get<map<string, string>>();
    }
    return toJson(orchestrator->createTerminal(create));
  }
  if (method == "list") {
    json retval = json::array();
    for (const auto& info : orchestrator->listProjectTerminals(
             requireString(params, "projectId"))) {
      retval.push_back(toJson(info));
    }
    return retval;
  }
  if (method == "get") {
    auto info = orchestrator->getTerminal(requireString(params, "sessionId"));
    return info ? toJson(*info) : json(nullptr);
  }
  if (method == "close") {
    return json{
        {"closed", orchestrator->closeTerminal(requireString(params, "sessionId"))}};
  }
  if (method == "focus") {
    orchestrator->setTerminalFocus(requireString(params, "sessionId"),
                                   params.value("focused", true));
    return json{{"ok", true}};
  }
  if (method == "suspend") {
    return json{
        {"count", orchestrator->suspendProject(requireString(params, "projectId"))}};
  }
  if (method == "resume") {
    json retval = json::array();
    for (const auto& info :
         orchestrator->resumeProject(requireString(params, "projectId"))) {
      retval.push_back(toJson(info));
    }
    return retval;
  }
  if (method == "stats") {
    return toJson(orchestrator->sessions()->getStatistics());
  }
  if (method == "metrics") {
    if (params.value("format", "json") == "prometheus") {
      return json{{"text", orchestrator->exportMetrics("prometheus")}};
    }
    return toJson(orchestrator->getMetrics());
  }
  if (method == "health") {
    return toJson(orchestrator->getStatus());
  }
  if (method == "report") {
    return toJson(orchestrator->getPerformanceReport());
  }
  throw TermhubError(ErrorCode::PROTOCOL, "Unknown control method " + method);
}

bool SessionServer::send(const shared_ptr<ClientState>& client,
                         const Packet& packet) {
  if (!client->alive) {
    return false;
  }
  lock_guard<mutex> writeGuard(client->writeMutex);
  try {
    socketHandler->writePacket(client->fd, packet);
  } catch (const std::runtime_error& e) {
    LOG(WARNING) << "Dropping client " << client->fd << ": " << e.what();
    client->alive = false;
    return false;
  }
  return true;
}

bool SessionServer::sendEnvelope(const shared_ptr<ClientState>& client,
                                 const string& sessionId, EnvelopeType type,
                                 const string& data) {
  MultiplexEnvelope envelope;
  envelope.set_sessionid(sessionId);
  envelope.set_type(type);
  if (!data.empty()) {
    envelope.set_data(data);
  }
  return send(client,
              Packet::fromProto(uint8_t(PacketType::TERMINAL_MULTIPLEX),
                                envelope));
}

void SessionServer::broadcast(const string& sessionId, EnvelopeType type,
                              const string& data) {
  vector<shared_ptr<ClientState>> targets;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    auto it = attachments.find(sessionId);
    if (it == attachments.end()) {
      return;
    }
    for (int fd : it->second) {
      auto clientIt = clients.find(fd);
      if (clientIt != clients.end()) {
        targets.push_back(clientIt->second);
      }
    }
  }
  for (const auto& client : targets) {
    sendEnvelope(client, sessionId, type, data);
  }
}

void SessionServer::onSessionEvent(const SessionEvent& event) {
  switch (event.type) {
    case SessionEventType::STATUS_CHANGED:
      broadcast(event.session.id, ENVELOPE_STATUS,
                sessionStatusName(event.newStatus));
      break;
    case SessionEventType::ERROR:
      broadcast(event.session.id, ENVELOPE_ERROR, event.message);
      break;
    case SessionEventType::CLOSED: {
      broadcast(event.session.id, ENVELOPE_CLOSED, "");
      lock_guard<recursive_mutex> guard(classMutex);
      attachments.erase(event.session.id);
      break;
    }
    default:
      break;
  }
}

void SessionServer::onStreamEvent(const StreamEvent& event) {
  if (event.type == StreamEventType::DATA) {
    broadcast(event.sessionId, ENVELOPE_DATA, event.data);
  }
}
}  // namespace th
