#include "StreamManager.hpp"

#include "RawSocketUtils.hpp"

namespace th {
namespace {
const int READ_BUFFER_SIZE = 16 * 1024;
const int64_t READER_POLL_MS = 100;

bool waitReadable(int fd, int64_t ms) {
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(fd, &fdset);
  timeval tv;
  tv.tv_sec = ms / 1000;
  tv.tv_usec = (ms % 1000) * 1000;
  int rc = select(fd + 1, &fdset, NULL, NULL, &tv);
  if (rc < 0) {
    if (errno == EINTR) {
      return false;
    }
    throw std::runtime_error(string("select failed: ") + strerror(errno));
  }
  return rc > 0 && FD_ISSET(fd, &fdset);
}
}  // namespace

const char* streamTypeName(StreamType type) {
  switch (type) {
    case StreamType::TERMINAL:
      return "terminal";
    case StreamType::CLAUDE:
      return "claude";
    case StreamType::SYSTEM:
      return "system";
  }
  return "unknown";
}

const char* streamStatusName(StreamStatus status) {
  switch (status) {
    case StreamStatus::CONNECTING:
      return "connecting";
    case StreamStatus::CONNECTED:
      return "connected";
    case StreamStatus::DISCONNECTED:
      return "disconnected";
    case StreamStatus::ERROR:
      return "error";
  }
  return "unknown";
}

const char* streamEventName(StreamEventType type) {
  switch (type) {
    case StreamEventType::CREATED:
      return "stream:created";
    case StreamEventType::CONNECTED:
      return "stream:connected";
    case StreamEventType::DATA:
      return "stream:data";
    case StreamEventType::EXIT:
      return "stream:exit";
    case StreamEventType::ERROR:
      return "stream:error";
    case StreamEventType::CLOSED:
      return "stream:closed";
    case StreamEventType::RECONNECTED:
      return "stream:reconnected";
    case StreamEventType::RECONNECT_FAILED:
      return "stream:reconnect-failed";
  }
  return "stream:unknown";
}

json toJson(const StreamMetrics& metrics) {
  json j{
      {"bytesIn", metrics.bytesIn},
      {"bytesOut", metrics.bytesOut},
      {"messagesIn", metrics.messagesIn},
      {"messagesOut", metrics.messagesOut},
      {"latency", metrics.latency},
  };
  if (metrics.connectTime) {
    j["connectTime"] = *metrics.connectTime;
  }
  if (metrics.disconnectTime) {
    j["disconnectTime"] = *metrics.disconnectTime;
  }
  return j;
}

json toJson(const StreamSnapshot& snapshot) {
  json j;
  j["sessionId"] = snapshot.sessionId;
  j["type"] = streamTypeName(snapshot.type);
  j["status"] = streamStatusName(snapshot.status);
  j["processBacked"] = snapshot.processBacked;
  j["metrics"] = toJson(snapshot.metrics);
  j["bufferedChunks"] = snapshot.bufferedChunks;
  j["pendingInput"] = snapshot.pendingInput;
  return j;
}

StreamManager::StreamManager(const OrchestratorConfig& _config,
                             shared_ptr<SocketHandler> _transportHandler,
                             TerminalProcessFactory _processFactory)
    : config(_config),
      transportHandler(_transportHandler),
      processFactory(_processFactory),
      reconnectPool(new ThreadPool(std::max(1, _config.reconnectPoolSize))),
      halt(false) {}

StreamManager::~StreamManager() { shutdown(); }

StreamSnapshot StreamManager::createTerminalStream(
    const TerminalStreamOptions& options) {
  if (options.sessionId.empty()) {
    throw std::invalid_argument("sessionId must not be empty");
  }
  {
    auto existing = findStream(options.sessionId);
    if (existing && !existing->closing) {
      throw TermhubError(ErrorCode::INVALID_STATE,
                         "Session " + options.sessionId +
                             " already has an open stream");
    }
  }

  SpawnOptions spawnOptions;
  spawnOptions.shell = config.resolveShell();
  spawnOptions.workingDirectory = options.workingDirectory;
  spawnOptions.environment = options.environment;
  if (options.dimensions) {
    spawnOptions.dimensions = *options.dimensions;
  }
  auto process = processFactory(spawnOptions);
  process->start();

  auto stream = make_shared<StreamConnection>(options.sessionId, options.type,
                                              config.streamBufferSize);
  stream->process = process;
  stream->status = StreamStatus::CONNECTED;
  stream->metrics.connectTime = nowEpochMs();
  try {
    registerStream(stream);
  } catch (const TermhubError&) {
    process->terminate();
    throw;
  }
  {
    lock_guard<mutex> guard(stream->stateMutex);
    if (!stream->closing) {
      stream->readerThread.reset(
          new thread(&StreamManager::ptyReadLoop, this, stream));
    }
  }

  LOG(INFO) << "Spawned " << spawnOptions.shell << " (pid "
            << process->getPid() << ") for session " << options.sessionId;
  StreamEvent event;
  event.type = StreamEventType::CREATED;
  event.sessionId = options.sessionId;
  event.streamType = options.type;
  eventChannel.emit(event);
  return snapshotOf(*stream);
}

std::future<StreamSnapshot> StreamManager::createTransportStream(
    const TransportStreamOptions& options) {
  if (!reconnectPool) {
    throw std::runtime_error("StreamManager is shut down");
  }
  return reconnectPool->enqueue(
      [this, options]() { return connectTransportStream(options); });
}

StreamSnapshot StreamManager::connectTransportStream(
    const TransportStreamOptions& options) {
  if (options.sessionId.empty()) {
    throw std::invalid_argument("sessionId must not be empty");
  }
  string endpoint =
      options.endpoint.empty() ? config.assistantEndpoint : options.endpoint;
  if (endpoint.empty()) {
    throw std::invalid_argument("No transport endpoint configured");
  }
  {
    auto existing = findStream(options.sessionId);
    if (existing && !existing->closing) {
      throw TermhubError(ErrorCode::INVALID_STATE,
                         "Session " + options.sessionId +
                             " already has an open stream");
    }
  }

  int fd = dialTransport(endpoint, options.sessionId, options.type);
  auto stream = make_shared<StreamConnection>(options.sessionId, options.type,
                                              config.streamBufferSize);
  stream->transportFd = fd;
  stream->endpoint = endpoint;
  stream->status = StreamStatus::CONNECTED;
  stream->metrics.connectTime = nowEpochMs();
  try {
    registerStream(stream);
  } catch (const TermhubError&) {
    transportHandler->close(fd);
    throw;
  }
  {
    lock_guard<mutex> guard(stream->stateMutex);
    if (!stream->closing) {
      stream->readerThread.reset(
          new thread(&StreamManager::transportReadLoop, this, stream, fd));
    }
  }

  LOG(INFO) << "Transport stream for session " << options.sessionId
            << " connected to " << endpoint;
  StreamEvent event;
  event.sessionId = options.sessionId;
  event.streamType = options.type;
  event.type = StreamEventType::CREATED;
  eventChannel.emit(event);
  event.type = StreamEventType::CONNECTED;
  eventChannel.emit(event);
  return snapshotOf(*stream);
}

int StreamManager::dialTransport(const string& endpoint,
                                 const string& sessionId, StreamType type) {
  SocketEndpoint socketEndpoint;
  socketEndpoint.set_name(endpoint);
  int fd = transportHandler->connect(socketEndpoint);
  if (fd < 0) {
    throw TermhubError(ErrorCode::CONNECT_TIMEOUT,
                       "Could not reach transport endpoint " + endpoint);
  }

  auto deadline = std::chrono::steady_clock::now() + config.connectTimeout;
  try {
    StreamHandshake handshake;
    handshake.set_sessionid(sessionId);
    handshake.set_type(streamTypeName(type));
    transportHandler->writePacket(
        fd, Packet::fromProto(uint8_t(PacketType::STREAM_HANDSHAKE), handshake));

    while (std::chrono::steady_clock::now() < deadline) {
      if (!waitReadable(fd, 10)) {
        continue;
      }
      Packet packet;
      if (!transportHandler->readPacket(fd, &packet, true)) {
        continue;
      }
      if (packet.getHeader() != uint8_t(PacketType::STREAM_HANDSHAKE)) {
        VLOG(1) << "Ignoring packet " << int(packet.getHeader())
                << " before handshake";
        continue;
      }
      auto reply = packet.payloadAs<StreamHandshake>();
      if (!reply.accepted()) {
        throw TermhubError(ErrorCode::PROTOCOL,
                           "Transport endpoint rejected session " + sessionId);
      }
      return fd;
    }
  } catch (const std::runtime_error&) {
    transportHandler->close(fd);
    throw;
  }
  transportHandler->close(fd);
  throw TermhubError(ErrorCode::CONNECT_TIMEOUT,
                     "Handshake with " + endpoint + " timed out after " +
                         to_string(config.connectTimeout.count()) + " ms");
}

void StreamManager::registerStream(const shared_ptr<StreamConnection>& stream) {
  lock_guard<mutex> guard(streamsMutex);
  auto it = streams.find(stream->sessionId);
  if (it != streams.end() && !it->second->closing) {
    throw TermhubError(ErrorCode::INVALID_STATE,
                       "Session " + stream->sessionId +
                           " already has an open stream");
  }
  streams[stream->sessionId] = stream;
  pendingRemovals.erase(stream->sessionId);
}

void StreamManager::ptyReadLoop(shared_ptr<StreamConnection> stream) {
  el::Helpers::setThreadName("pty-reader");
  int fd = stream->process->getFd();
  string buf(READ_BUFFER_SIZE, '\0');
  string failure;
  try {
    while (!stream->closing) {
      if (!waitReadable(fd, READER_POLL_MS)) {
        if (stream->process->pollExit(false)) {
          break;
        }
        continue;
      }
      ssize_t rc = RawSocketUtils::readSome(fd, &buf[0], buf.size());
      if (rc > 0) {
        handleOutput(stream, buf.substr(0, rc));
      }
    }
  } catch (const std::runtime_error& e) {
    failure = e.what();
  }
  if (stream->closing) {
    return;
  }

  // The slave side is gone. Give the child a moment to be reaped.
  optional<int> exitCode;
  for (int i = 0; i < 50 && !exitCode; i++) {
    exitCode = stream->process->pollExit(false);
    if (!exitCode) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
  {
    lock_guard<mutex> guard(stream->stateMutex);
    stream->status = StreamStatus::DISCONNECTED;
    stream->metrics.disconnectTime = nowEpochMs();
  }
  LOG(INFO) << "Process for session " << stream->sessionId << " exited with "
            << (exitCode ? to_string(*exitCode) : string("unknown status"))
            << (failure.empty() ? "" : " (" + failure + ")");
  StreamEvent event;
  event.type = StreamEventType::EXIT;
  event.sessionId = stream->sessionId;
  event.streamType = stream->type;
  event.exitCode = exitCode ? *exitCode : -1;
  eventChannel.emit(event);
}

void StreamManager::transportReadLoop(shared_ptr<StreamConnection> stream,
                                      int fd) {
  el::Helpers::setThreadName("transport-reader");
  string failure;
  try {
    while (!stream->closing) {
      if (!waitReadable(fd, READER_POLL_MS)) {
        continue;
      }
      Packet packet;
      if (!transportHandler->readPacket(fd, &packet, true)) {
        continue;
      }
      switch (packet.getHeader()) {
        case uint8_t(PacketType::STREAM_DATA):
          handleOutput(stream, packet.getPayload());
          break;
        case uint8_t(PacketType::STREAM_PONG): {
          auto pong = packet.payloadAs<PingPong>();
          lock_guard<mutex> guard(stream->stateMutex);
          stream->metrics.latency =
              double(std::max<int64_t>(0, nowEpochMs() - pong.timestampms()));
          break;
        }
        case uint8_t(PacketType::STREAM_PING): {
          lock_guard<mutex> writeGuard(stream->writeMutex);
          transportHandler->writePacket(
              fd, Packet(uint8_t(PacketType::STREAM_PONG), packet.getPayload()));
          break;
        }
        default:
          LOG(WARNING) << "Unexpected packet " << int(packet.getHeader())
                       << " on transport for " << stream->sessionId;
          break;
      }
    }
  } catch (const std::runtime_error& e) {
    failure = e.what();
  }

  // Whoever clears transportFd closes the descriptor.
  {
    lock_guard<mutex> writeGuard(stream->writeMutex);
    bool owned = false;
    {
      lock_guard<mutex> guard(stream->stateMutex);
      if (stream->transportFd == fd) {
        stream->transportFd = -1;
        owned = true;
      }
    }
    if (owned) {
      transportHandler->close(fd);
    }
  }
  if (stream->closing) {
    return;
  }
  handleTransportLoss(stream, fd, failure.empty() ? "transport closed" : failure);
}

void StreamManager::handleOutput(const shared_ptr<StreamConnection>& stream,
                                 const string& data) {
  stream->output.push(data);
  {
    lock_guard<mutex> guard(stream->stateMutex);
    stream->metrics.bytesOut += data.size();
    stream->metrics.messagesOut++;
  }
  VLOG(4) << "Session " << stream->sessionId << " produced " << data.size()
          << " bytes";
  StreamEvent event;
  event.type = StreamEventType::DATA;
  event.sessionId = stream->sessionId;
  event.streamType = stream->type;
  event.data = data;
  eventChannel.emit(event);
}

void StreamManager::handleTransportLoss(
    const shared_ptr<StreamConnection>& stream, int fd, const string& reason) {
  {
    lock_guard<mutex> guard(stream->stateMutex);
    stream->status = StreamStatus::DISCONNECTED;
    stream->metrics.disconnectTime = nowEpochMs();
  }
  LOG(WARNING) << "Transport for session " << stream->sessionId
               << " lost (fd " << fd << "): " << reason;
  StreamEvent event;
  event.type = StreamEventType::ERROR;
  event.sessionId = stream->sessionId;
  event.streamType = stream->type;
  event.message = reason;
  eventChannel.emit(event);

  if (stream->closing || halt) {
    return;
  }
  try {
    reconnectStreamAsync(stream->sessionId);
  } catch (const std::runtime_error& e) {
    LOG(WARNING) << "Could not schedule reconnect for " << stream->sessionId
                 << ": " << e.what();
  }
}

void StreamManager::write(const string& sessionId, const string& data) {
  auto stream = findStream(sessionId);
  if (!stream) {
    throw TermhubError(ErrorCode::NOT_FOUND,
                       "No stream for session " + sessionId);
  }
  if (data.empty()) {
    return;
  }

  lock_guard<mutex> writeGuard(stream->writeMutex);
  StreamStatus status;
  int fd;
  {
    lock_guard<mutex> guard(stream->stateMutex);
    status = stream->status;
    fd = stream->transportFd;
  }
  if (status != StreamStatus::CONNECTED || stream->closing) {
    VLOG(2) << "Buffering " << data.size() << " bytes for disconnected session "
            << sessionId;
    stream->pendingInput.push(data);
    return;
  }

  try {
    if (stream->process) {
      RawSocketUtils::writeAll(stream->process->getFd(), data.c_str(),
                               data.size());
    } else if (fd >= 0) {
      transportHandler->writePacket(
          fd, Packet(uint8_t(PacketType::STREAM_DATA), data));
    } else {
      stream->pendingInput.push(data);
      return;
    }
  } catch (const std::runtime_error& e) {
    LOG(WARNING) << "Write to session " << sessionId << " failed: " << e.what();
    stream->pendingInput.push(data);
    if (!stream->process && fd >= 0) {
      // Wake the reader so it tears the transport down and reconnects.
      ::shutdown(fd, SHUT_RDWR);
    }
    return;
  }

  lock_guard<mutex> guard(stream->stateMutex);
  stream->metrics.bytesIn += data.size();
  stream->metrics.messagesIn++;
}

void StreamManager::resize(const string& sessionId,
                           const Dimensions& dimensions) {
  auto stream = findStream(sessionId);
  if (!stream) {
    throw TermhubError(ErrorCode::NOT_FOUND,
                       "No stream for session " + sessionId);
  }
  if (dimensions.rows <= 0 || dimensions.cols <= 0) {
    throw std::invalid_argument("Terminal dimensions must be positive");
  }
  if (stream->closing) {
    return;
  }
  if (stream->process) {
    stream->process->resize(dimensions);
    return;
  }

  lock_guard<mutex> writeGuard(stream->writeMutex);
  int fd;
  {
    lock_guard<mutex> guard(stream->stateMutex);
    fd = stream->transportFd;
  }
  if (fd < 0) {
    VLOG(1) << "Dropping resize for disconnected session " << sessionId;
    return;
  }
  WindowSize info;
  info.set_row(dimensions.rows);
  info.set_column(dimensions.cols);
  try {
    transportHandler->writePacket(
        fd, Packet::fromProto(uint8_t(PacketType::STREAM_RESIZE), info));
  } catch (const std::runtime_error& e) {
    LOG(WARNING) << "Resize of session " << sessionId
                 << " failed: " << e.what();
    ::shutdown(fd, SHUT_RDWR);
  }
}

vector<string> StreamManager::readBuffer(const string& sessionId) const {
  auto stream = findStream(sessionId);
  if (!stream) {
    return {};
  }
  return stream->output.getAll();
}

bool StreamManager::closeStream(const string& sessionId) {
  auto stream = findStream(sessionId);
  if (!stream) {
    return false;
  }
  bool expected = false;
  if (!stream->closing.compare_exchange_strong(expected, true)) {
    return false;
  }

  stopReader(stream);
  {
    // Writers hold writeMutex across their use of the fd, so it cannot be
    // closed and reused under them.
    lock_guard<mutex> writeGuard(stream->writeMutex);
    if (stream->process) {
      stream->process->terminate();
    } else {
      int fd;
      {
        lock_guard<mutex> guard(stream->stateMutex);
        fd = stream->transportFd;
        stream->transportFd = -1;
      }
      if (fd >= 0) {
        transportHandler->close(fd);
      }
    }
  }
  {
    lock_guard<mutex> guard(stream->stateMutex);
    stream->status = StreamStatus::DISCONNECTED;
    if (!stream->metrics.disconnectTime) {
      stream->metrics.disconnectTime = nowEpochMs();
    }
  }
  {
    lock_guard<mutex> guard(streamsMutex);
    pendingRemovals[sessionId] = nowEpochMs() + config.closeGraceDelay.count();
  }
  {
    lock_guard<mutex> guard(maintenanceMutex);
  }
  maintenanceCv.notify_all();

  LOG(INFO) << "Closed stream for session " << sessionId;
  StreamEvent event;
  event.type = StreamEventType::CLOSED;
  event.sessionId = sessionId;
  event.streamType = stream->type;
  eventChannel.emit(event);
  return true;
}

void StreamManager::stopReader(const shared_ptr<StreamConnection>& stream) {
  shared_ptr<thread> reader;
  {
    lock_guard<mutex> guard(stream->stateMutex);
    reader.swap(stream->readerThread);
  }
  if (!reader) {
    return;
  }
  if (reader->get_id() == std::this_thread::get_id()) {
    // Closed from one of our own event listeners; the loop sees `closing`
    // and returns once the listener does.
    reader->detach();
  } else if (reader->joinable()) {
    reader->join();
  }
}

void StreamManager::reconnectStream(const string& sessionId) {
  auto stream = findStream(sessionId);
  if (!stream) {
    throw TermhubError(ErrorCode::NOT_FOUND,
                       "No stream for session " + sessionId);
  }
  if (stream->process) {
    throw TermhubError(ErrorCode::PROCESS_EXIT,
                       "Session " + sessionId +
                           " is process-backed and cannot be reconnected");
  }
  if (stream->closing) {
    return;
  }
  bool expected = false;
  if (!stream->reconnecting.compare_exchange_strong(expected, true)) {
    VLOG(1) << "Reconnect already running for " << sessionId;
    return;
  }

  string endpoint;
  {
    lock_guard<mutex> guard(stream->stateMutex);
    endpoint = stream->endpoint;
    if (stream->status == StreamStatus::CONNECTED && stream->transportFd >= 0) {
      stream->reconnecting = false;
      return;
    }
    stream->status = StreamStatus::CONNECTING;
  }
  // The previous reader has already released its fd; wait for it to finish.
  stopReader(stream);

  string lastError;
  for (int attempt = 1; attempt <= config.reconnectAttempts; attempt++) {
    if (stream->closing || halt) {
      stream->reconnecting = false;
      return;
    }
    LOG(INFO) << "Reconnecting session " << sessionId << " (attempt "
              << attempt << "/" << config.reconnectAttempts << ")";
    int fd = -1;
    try {
      fd = dialTransport(endpoint, sessionId, stream->type);
    } catch (const std::runtime_error& e) {
      lastError = e.what();
      LOG(WARNING) << "Reconnect attempt " << attempt << " for " << sessionId
                   << " failed: " << lastError;
    }

    if (fd >= 0) {
      bool replayed = true;
      {
        lock_guard<mutex> writeGuard(stream->writeMutex);
        auto pending = stream->pendingInput.drain();
        int64_t bytes = 0;
        size_t sent = 0;
        try {
          for (; sent < pending.size(); sent++) {
            transportHandler->writePacket(
                fd, Packet(uint8_t(PacketType::STREAM_DATA), pending[sent]));
            bytes += pending[sent].size();
          }
        } catch (const std::runtime_error& e) {
          lastError = e.what();
          replayed = false;
          // Put back what did not make it, ahead of anything newer.
          vector<string> newer = stream->pendingInput.drain();
          for (size_t i = sent; i < pending.size(); i++) {
            stream->pendingInput.push(pending[i]);
          }
          for (auto& chunk : newer) {
            stream->pendingInput.push(chunk);
          }
        }
        if (replayed) {
          lock_guard<mutex> guard(stream->stateMutex);
          if (stream->closing) {
            replayed = false;
          } else {
            stream->transportFd = fd;
            stream->status = StreamStatus::CONNECTED;
            stream->metrics.connectTime = nowEpochMs();
            stream->metrics.bytesIn += bytes;
            stream->metrics.messagesIn += sent;
            stream->readerThread.reset(new thread(
                &StreamManager::transportReadLoop, this, stream, fd));
          }
        }
      }
      if (replayed) {
        stream->reconnecting = false;
        LOG(INFO) << "Session " << sessionId << " reconnected";
        StreamEvent event;
        event.type = StreamEventType::RECONNECTED;
        event.sessionId = sessionId;
        event.streamType = stream->type;
        eventChannel.emit(event);
        return;
      }
      transportHandler->close(fd);
    }

    if (attempt < config.reconnectAttempts) {
      auto wakeAt = std::chrono::steady_clock::now() + config.reconnectDelay;
      while (std::chrono::steady_clock::now() < wakeAt && !stream->closing &&
             !halt) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
    }
  }

  {
    lock_guard<mutex> guard(stream->stateMutex);
    stream->status = StreamStatus::ERROR;
  }
  stream->reconnecting = false;
  LOG(ERROR) << "Giving up on session " << sessionId << " after "
             << config.reconnectAttempts << " reconnect attempts";
  StreamEvent event;
  event.type = StreamEventType::RECONNECT_FAILED;
  event.sessionId = sessionId;
  event.streamType = stream->type;
  event.message = lastError;
  eventChannel.emit(event);
  throw TermhubError(ErrorCode::RECONNECT_EXHAUSTED,
                     "Reconnect of session " + sessionId + " failed after " +
                         to_string(config.reconnectAttempts) + " attempts");
}

std::future<void> StreamManager::reconnectStreamAsync(const string& sessionId) {
  if (!reconnectPool) {
    throw std::runtime_error("StreamManager is shut down");
  }
  return reconnectPool->enqueue([this, sessionId]() {
    el::Helpers::setThreadName("stream-reconnect");
    reconnectStream(sessionId);
  });
}

optional<StreamMetrics> StreamManager::getMetrics(
    const string& sessionId) const {
  auto stream = findStream(sessionId);
  if (!stream) {
    return nullopt;
  }
  lock_guard<mutex> guard(stream->stateMutex);
  return stream->metrics;
}

optional<StreamSnapshot> StreamManager::getStream(
    const string& sessionId) const {
  auto stream = findStream(sessionId);
  if (!stream) {
    return nullopt;
  }
  return snapshotOf(*stream);
}

vector<StreamSnapshot> StreamManager::getActiveStreams() const {
  vector<StreamSnapshot> retval;
  for (const auto& snapshot : getStreamSnapshots()) {
    if (snapshot.status == StreamStatus::CONNECTED) {
      retval.push_back(snapshot);
    }
  }
  return retval;
}

vector<StreamSnapshot> StreamManager::getStreamSnapshots() const {
  vector<shared_ptr<StreamConnection>> all;
  {
    lock_guard<mutex> guard(streamsMutex);
    for (const auto& it : streams) {
      all.push_back(it.second);
    }
  }
  vector<StreamSnapshot> retval;
  for (const auto& stream : all) {
    retval.push_back(snapshotOf(*stream));
  }
  return retval;
}

StreamSnapshot StreamManager::snapshotOf(const StreamConnection& stream) const {
  StreamSnapshot snapshot;
  snapshot.sessionId = stream.sessionId;
  snapshot.type = stream.type;
  snapshot.processBacked = bool(stream.process);
  {
    lock_guard<mutex> guard(stream.stateMutex);
    snapshot.status = stream.status;
    snapshot.metrics = stream.metrics;
  }
  snapshot.bufferedChunks = stream.output.size();
  snapshot.pendingInput = stream.pendingInput.size();
  return snapshot;
}

void StreamManager::runHealthCheck() {
  vector<shared_ptr<StreamConnection>> transports;
  {
    lock_guard<mutex> guard(streamsMutex);
    for (const auto& it : streams) {
      if (!it.second->process && !it.second->closing) {
        transports.push_back(it.second);
      }
    }
  }
  for (const auto& stream : transports) {
    lock_guard<mutex> writeGuard(stream->writeMutex);
    int fd;
    {
      lock_guard<mutex> guard(stream->stateMutex);
      if (stream->status != StreamStatus::CONNECTED) {
        continue;
      }
      fd = stream->transportFd;
    }
    if (fd < 0) {
      continue;
    }
    PingPong ping;
    ping.set_timestampms(nowEpochMs());
    try {
      transportHandler->writePacket(
          fd, Packet::fromProto(uint8_t(PacketType::STREAM_PING), ping));
    } catch (const std::runtime_error& e) {
      LOG(WARNING) << "Health check ping for " << stream->sessionId
                   << " failed: " << e.what();
      ::shutdown(fd, SHUT_RDWR);
    }
  }
}

int StreamManager::purgeClosedStreams() {
  int64_t now = nowEpochMs();
  int purged = 0;
  lock_guard<mutex> guard(streamsMutex);
  for (auto it = pendingRemovals.begin(); it != pendingRemovals.end();) {
    if (it->second > now) {
      ++it;
      continue;
    }
    auto streamIt = streams.find(it->first);
    if (streamIt != streams.end() && streamIt->second->closing) {
      streams.erase(streamIt);
      purged++;
    }
    it = pendingRemovals.erase(it);
  }
  if (purged) {
    VLOG(1) << "Purged " << purged << " closed streams";
  }
  return purged;
}

void StreamManager::start() {
  lock_guard<mutex> guard(maintenanceMutex);
  if (maintenanceThread) {
    return;
  }
  halt = false;
  maintenanceThread.reset(new thread(&StreamManager::maintenanceLoop, this));
}

void StreamManager::shutdown() {
  {
    lock_guard<mutex> guard(maintenanceMutex);
    halt = true;
  }
  maintenanceCv.notify_all();
  if (maintenanceThread) {
    maintenanceThread->join();
    maintenanceThread.reset();
  }

  vector<string> ids;
  {
    lock_guard<mutex> guard(streamsMutex);
    for (const auto& it : streams) {
      if (!it.second->closing) {
        ids.push_back(it.first);
      }
    }
  }
  for (const auto& id : ids) {
    closeStream(id);
  }
  // Joins the workers; pending reconnects see `halt` and return.
  reconnectPool.reset();
}

void StreamManager::maintenanceLoop() {
  el::Helpers::setThreadName("stream-maintenance");
  typedef std::chrono::steady_clock Clock;
  auto nextHealthCheck = Clock::now() + config.streamHealthCheckInterval;

  unique_lock<mutex> lock(maintenanceMutex);
  while (!halt) {
    auto wakeAt = nextHealthCheck;
    {
      lock_guard<mutex> guard(streamsMutex);
      for (const auto& it : pendingRemovals) {
        auto removeAt =
            Clock::now() + std::chrono::milliseconds(
                               std::max<int64_t>(0, it.second - nowEpochMs()));
        wakeAt = std::min(wakeAt, removeAt);
      }
    }
    maintenanceCv.wait_until(lock, wakeAt);
    if (halt) {
      break;
    }
    lock.unlock();
    try {
      purgeClosedStreams();
      if (Clock::now() >= nextHealthCheck) {
        runHealthCheck();
        nextHealthCheck = Clock::now() + config.streamHealthCheckInterval;
      }
    } catch (const std::exception& e) {
      STERROR << "Stream maintenance failed: " << e.what();
    }
    lock.lock();
  }
}

shared_ptr<StreamManager::StreamConnection> StreamManager::findStream(
    const string& sessionId) const {
  lock_guard<mutex> guard(streamsMutex);
  auto it = streams.find(sessionId);
  if (it == streams.end()) {
    return nullptr;
  }
  return it->second;
}
}  // namespace th
