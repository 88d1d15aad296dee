#include "SessionManager.hpp"

namespace th {
namespace {
const char* TAB_PREFIX = "Terminal ";

int parseTabNumber(const string& tabName) {
  const size_t prefixLength = strlen(TAB_PREFIX);
  if (tabName.compare(0, prefixLength, TAB_PREFIX) != 0 ||
      tabName.size() == prefixLength) {
    return 0;
  }
  int number = 0;
  for (size_t i = prefixLength; i < tabName.size(); i++) {
    if (!isdigit((unsigned char)tabName[i])) {
      return 0;
    }
    number = number * 10 + (tabName[i] - '0');
    if (number > 1000000) {
      return 0;
    }
  }
  return number;
}

void trimFront(deque<string>* chunks, size_t limit) {
  while (chunks->size() > limit) {
    chunks->pop_front();
  }
}
}  // namespace

SessionManager::SessionManager(const OrchestratorConfig& _config)
    : config(_config), halt(false) {}

SessionManager::~SessionManager() { shutdown(); }

string SessionManager::generateSessionId() {
  static mutex idMutex;
  static int64_t lastMs = 0;
  int64_t ms = nowEpochMs();
  {
    lock_guard<mutex> guard(idMutex);
    if (ms <= lastMs) {
      ms = lastMs + 1;
    }
    lastMs = ms;
  }
  return "session_" + to_string(ms) + "_" + genRandomAlphaNum(8);
}

TerminalSession SessionManager::createSession(const string& projectId,
                                              const optional<string>& userId,
                                              SessionMode mode,
                                              const string& workingDirectory) {
  if (projectId.empty()) {
    throw std::invalid_argument("projectId must not be empty");
  }
  auto focusMutex = focusMutexFor(projectId);
  lock_guard<mutex> focusGuard(*focusMutex);

  auto entry = make_shared<SessionEntry>();
  TerminalSession created;
  {
    lock_guard<mutex> registryGuard(registryMutex);
    int live = liveSessionCountLocked();
    if (live >= config.maxTotalSessions) {
      throw TermhubError(ErrorCode::LIMIT_EXCEEDED,
                         "Maximum total sessions (" +
                             to_string(config.maxTotalSessions) + ") reached");
    }
    auto projectIt = projectSessions.find(projectId);
    if (projectIt != projectSessions.end() &&
        int(projectIt->second.size()) >= config.maxSessionsPerProject) {
      throw TermhubError(ErrorCode::LIMIT_EXCEEDED,
                         "Maximum sessions per project (" +
                             to_string(config.maxSessionsPerProject) +
                             ") reached");
    }

    int64_t now = nowEpochMs();
    TerminalSession& session = entry->session;
    session.id = generateSessionId();
    session.projectId = projectId;
    session.userId = userId;
    session.tabName = nextTabNameLocked(projectId);
    session.status = SessionStatus::INITIALIZING;
    session.mode = mode;
    session.createdAt = now;
    session.updatedAt = now;
    session.metadata.workingDirectory =
        workingDirectory.empty() ? fs::current_path().string()
                                 : workingDirectory;
    session.metrics.lastActivity = now;

    int focusedCount = 0;
    if (projectIt != projectSessions.end()) {
      for (const auto& id : projectIt->second) {
        auto peer = sessions.find(id);
        if (peer == sessions.end()) {
          continue;
        }
        lock_guard<mutex> peerGuard(peer->second->entryMutex);
        if (peer->second->session.metadata.focused) {
          focusedCount++;
        }
      }
    }
    session.metadata.focused = focusedCount < config.maxFocusedPerProject;

    sessions[session.id] = entry;
    projectSessions[projectId].push_back(session.id);
    created = session;
  }

  LOG(INFO) << "Created session " << created.id << " (" << created.tabName
            << ") for project " << projectId;
  SessionEvent event;
  event.type = SessionEventType::CREATED;
  event.session = created;
  eventChannel.emit(event);
  return created;
}

optional<TerminalSession> SessionManager::getSession(
    const string& sessionId) const {
  auto entry = findEntry(sessionId);
  if (!entry) {
    return nullopt;
  }
  lock_guard<mutex> guard(entry->entryMutex);
  return entry->session;
}

vector<TerminalSession> SessionManager::listProjectSessions(
    const string& projectId) const {
  vector<TerminalSession> retval;
  for (const auto& entry : projectEntries(projectId)) {
    lock_guard<mutex> guard(entry->entryMutex);
    if (entry->session.status != SessionStatus::CLOSED) {
      retval.push_back(entry->session);
    }
  }
  return retval;
}

void SessionManager::updateSessionStatus(const string& sessionId,
                                         SessionStatus status,
                                         const string& reason) {
  auto entry = findEntry(sessionId);
  if (!entry) {
    throw TermhubError(ErrorCode::NOT_FOUND,
                       "Session " + sessionId + " not found");
  }
  if (status == SessionStatus::CLOSED) {
    closeSession(sessionId);
    return;
  }

  vector<SessionEvent> pending;
  {
    lock_guard<mutex> guard(entry->entryMutex);
    SessionStatus oldStatus = entry->session.status;
    if (oldStatus == status) {
      return;
    }
    if (!isValidTransition(oldStatus, status)) {
      throw TermhubError(ErrorCode::INVALID_STATE,
                         string("Session ") + sessionId + " cannot go from " +
                             sessionStatusName(oldStatus) + " to " +
                             sessionStatusName(status));
    }
    applyTransition(entry.get(), status);

    SessionEvent changed;
    changed.type = SessionEventType::STATUS_CHANGED;
    changed.session = entry->session;
    changed.oldStatus = oldStatus;
    changed.newStatus = status;
    pending.push_back(changed);
    if (status == SessionStatus::ERROR) {
      SessionEvent error = changed;
      error.type = SessionEventType::ERROR;
      error.message = reason.empty() ? "Unknown session error" : reason;
      pending.push_back(error);
    }
  }
  VLOG(1) << "Session " << sessionId << " -> " << sessionStatusName(status);
  emitAll(pending);
}

void SessionManager::applyTransition(SessionEntry* entry,
                                     SessionStatus newStatus) {
  TerminalSession& session = entry->session;
  SessionStatus oldStatus = session.status;
  int64_t now = nowEpochMs();
  session.status = newStatus;
  session.updatedAt = now;

  if (newStatus == SessionStatus::ACTIVE && oldStatus != SessionStatus::ACTIVE) {
    session.metrics.lastActivity = now;
  }
  if (newStatus == SessionStatus::ERROR) {
    session.metrics.errorCount++;
  }
  if (newStatus == SessionStatus::SUSPENDED && !entry->suspended) {
    SuspendedState snapshot;
    snapshot.suspendedAt = now;
    snapshot.metadata = session.metadata;
    snapshot.metrics = session.metrics;
    entry->suspended = snapshot;
  }
  if (oldStatus == SessionStatus::SUSPENDED &&
      newStatus != SessionStatus::SUSPENDED) {
    entry->suspended.reset();
  }
}

void SessionManager::updateSessionMetadata(const string& sessionId,
                                           const MetadataPatch& patch) {
  auto entry = findEntry(sessionId);
  if (!entry) {
    throw TermhubError(ErrorCode::NOT_FOUND,
                       "Session " + sessionId + " not found");
  }
  SessionEvent event;
  event.type = SessionEventType::METADATA_UPDATED;
  {
    lock_guard<mutex> guard(entry->entryMutex);
    SessionMetadata& metadata = entry->session.metadata;
    if (patch.workingDirectory) {
      metadata.workingDirectory = *patch.workingDirectory;
    }
    if (patch.environment) {
      metadata.environment = *patch.environment;
    }
    if (patch.dimensions) {
      metadata.dimensions = *patch.dimensions;
    }
    if (patch.layoutPosition) {
      metadata.layoutPosition = *patch.layoutPosition;
    }
    entry->session.updatedAt = nowEpochMs();
    event.session = entry->session;
  }
  eventChannel.emit(event);
}

void SessionManager::updateSessionMetrics(const string& sessionId,
                                          const MetricsPatch& patch) {
  auto entry = findEntry(sessionId);
  if (!entry) {
    return;
  }
  lock_guard<mutex> guard(entry->entryMutex);
  SessionMetrics& metrics = entry->session.metrics;
  if (patch.cpuUsage) metrics.cpuUsage = *patch.cpuUsage;
  if (patch.memoryUsage) metrics.memoryUsage = *patch.memoryUsage;
  if (patch.inputBytes) metrics.inputBytes = *patch.inputBytes;
  if (patch.outputBytes) metrics.outputBytes = *patch.outputBytes;
  if (patch.commandCount) metrics.commandCount = *patch.commandCount;
  if (patch.errorCount) metrics.errorCount = *patch.errorCount;
  int64_t now = nowEpochMs();
  metrics.lastActivity = now;
  entry->session.updatedAt = now;
}

void SessionManager::recordActivity(const string& sessionId,
                                    int64_t inputBytes, int64_t outputBytes,
                                    int64_t commands) {
  auto entry = findEntry(sessionId);
  if (!entry) {
    return;
  }
  lock_guard<mutex> guard(entry->entryMutex);
  SessionMetrics& metrics = entry->session.metrics;
  metrics.inputBytes += inputBytes;
  metrics.outputBytes += outputBytes;
  metrics.commandCount += commands;
  int64_t now = nowEpochMs();
  metrics.lastActivity = now;
  entry->session.updatedAt = now;
}

void SessionManager::setSessionFocus(const string& sessionId, bool focused) {
  auto entry = findEntry(sessionId);
  string projectId;
  if (entry) {
    lock_guard<mutex> guard(entry->entryMutex);
    if (entry->session.status != SessionStatus::CLOSED) {
      projectId = entry->session.projectId;
    }
  }
  if (projectId.empty()) {
    throw TermhubError(ErrorCode::NOT_FOUND,
                       "Session " + sessionId + " not found");
  }

  auto focusMutex = focusMutexFor(projectId);
  lock_guard<mutex> focusGuard(*focusMutex);
  vector<SessionEvent> pending;

  if (focused) {
    bool alreadyFocused = false;
    int othersFocused = 0;
    shared_ptr<SessionEntry> oldest;
    int64_t oldestActivity = 0;
    for (const auto& peer : projectEntries(projectId)) {
      lock_guard<mutex> peerGuard(peer->entryMutex);
      if (!peer->session.metadata.focused ||
          peer->session.status == SessionStatus::CLOSED) {
        continue;
      }
      if (peer == entry) {
        alreadyFocused = true;
        continue;
      }
      othersFocused++;
      // Strictly older wins, so ties go to the session created first
      if (!oldest || peer->session.metrics.lastActivity < oldestActivity) {
        oldest = peer;
        oldestActivity = peer->session.metrics.lastActivity;
      }
    }
    if (!alreadyFocused && othersFocused >= config.maxFocusedPerProject &&
        oldest) {
      lock_guard<mutex> oldestGuard(oldest->entryMutex);
      oldest->session.metadata.focused = false;
      oldest->session.updatedAt = nowEpochMs();
      SessionEvent unfocused;
      unfocused.type = SessionEventType::FOCUS_CHANGED;
      unfocused.session = oldest->session;
      unfocused.focused = false;
      pending.push_back(unfocused);
      VLOG(1) << "Session " << oldest->session.id
              << " lost focus to " << sessionId;
    }
  }

  {
    lock_guard<mutex> guard(entry->entryMutex);
    if (entry->session.status == SessionStatus::CLOSED) {
      throw TermhubError(ErrorCode::NOT_FOUND,
                         "Session " + sessionId + " was closed");
    }
    entry->session.metadata.focused = focused;
    entry->session.updatedAt = nowEpochMs();
    SessionEvent event;
    event.type = SessionEventType::FOCUS_CHANGED;
    event.session = entry->session;
    event.focused = focused;
    pending.push_back(event);
  }
  emitAll(pending);
}

int SessionManager::suspendProjectSessions(
    const string& projectId, const map<string, vector<string>>& bufferedOutput) {
  vector<SessionEvent> pending;
  int64_t now = nowEpochMs();
  for (const auto& entry : projectEntries(projectId)) {
    lock_guard<mutex> guard(entry->entryMutex);
    if (entry->session.status != SessionStatus::ACTIVE) {
      continue;
    }
    SuspendedState snapshot;
    snapshot.suspendedAt = now;
    snapshot.metadata = entry->session.metadata;
    snapshot.metrics = entry->session.metrics;
    auto output = bufferedOutput.find(entry->session.id);
    if (output != bufferedOutput.end()) {
      snapshot.bufferedOutput.assign(output->second.begin(),
                                     output->second.end());
      trimFront(&snapshot.bufferedOutput, config.suspendedOutputLimit);
    }
    entry->suspended = std::move(snapshot);
    entry->session.status = SessionStatus::SUSPENDED;
    entry->session.updatedAt = now;

    SessionEvent event;
    event.type = SessionEventType::SUSPENDED;
    event.session = entry->session;
    event.oldStatus = SessionStatus::ACTIVE;
    event.newStatus = SessionStatus::SUSPENDED;
    pending.push_back(event);
  }
  LOG(INFO) << "Suspended " << pending.size() << " sessions of project "
            << projectId;
  emitAll(pending);
  return int(pending.size());
}

vector<TerminalSession> SessionManager::resumeProjectSessions(
    const string& projectId, map<string, vector<string>>* bufferedOutput) {
  auto focusMutex = focusMutexFor(projectId);
  vector<TerminalSession> resumed;
  vector<string> expired;
  vector<SessionEvent> pending;
  {
    lock_guard<mutex> focusGuard(*focusMutex);
    auto entries = projectEntries(projectId);

    int focusedCount = 0;
    for (const auto& entry : entries) {
      lock_guard<mutex> guard(entry->entryMutex);
      if (entry->session.metadata.focused) {
        focusedCount++;
      }
    }

    int64_t now = nowEpochMs();
    for (const auto& entry : entries) {
      lock_guard<mutex> guard(entry->entryMutex);
      if (!entry->suspended) {
        continue;
      }
      SuspendedState& snapshot = *entry->suspended;
      if (now - snapshot.suspendedAt >
          int64_t(config.suspensionTimeout.count())) {
        expired.push_back(entry->session.id);
        continue;
      }

      bool wasFocused = entry->session.metadata.focused;
      entry->session.status = SessionStatus::ACTIVE;
      entry->session.metadata = snapshot.metadata;
      entry->session.metrics = snapshot.metrics;
      entry->session.updatedAt = now;
      if (entry->session.metadata.focused && !wasFocused) {
        // Focus was handed to another session while this one slept
        if (focusedCount >= config.maxFocusedPerProject) {
          entry->session.metadata.focused = false;
        } else {
          focusedCount++;
        }
      } else if (!entry->session.metadata.focused && wasFocused) {
        focusedCount--;
      }
      if (bufferedOutput) {
        (*bufferedOutput)[entry->session.id] = vector<string>(
            snapshot.bufferedOutput.begin(), snapshot.bufferedOutput.end());
      }
      entry->suspended.reset();
      resumed.push_back(entry->session);

      SessionEvent event;
      event.type = SessionEventType::RESUMED;
      event.session = entry->session;
      event.oldStatus = SessionStatus::SUSPENDED;
      event.newStatus = SessionStatus::ACTIVE;
      pending.push_back(event);
    }
  }

  for (const auto& sessionId : expired) {
    LOG(INFO) << "Suspension of " << sessionId
              << " expired, closing instead of resuming";
    closeSession(sessionId);
  }
  LOG(INFO) << "Resumed " << resumed.size() << " sessions of project "
            << projectId;
  emitAll(pending);
  return resumed;
}

bool SessionManager::appendSuspendedOutput(const string& sessionId,
                                           const string& chunk) {
  auto entry = findEntry(sessionId);
  if (!entry) {
    return false;
  }
  lock_guard<mutex> guard(entry->entryMutex);
  if (!entry->suspended) {
    return false;
  }
  entry->suspended->bufferedOutput.push_back(chunk);
  trimFront(&entry->suspended->bufferedOutput, config.suspendedOutputLimit);
  return true;
}

bool SessionManager::closeSession(const string& sessionId) {
  SessionEvent event;
  event.type = SessionEventType::CLOSED;
  {
    lock_guard<mutex> registryGuard(registryMutex);
    auto it = sessions.find(sessionId);
    if (it == sessions.end()) {
      return false;
    }
    auto entry = it->second;
    lock_guard<mutex> guard(entry->entryMutex);
    if (entry->session.status == SessionStatus::CLOSED) {
      return false;
    }
    event.oldStatus = entry->session.status;
    event.newStatus = SessionStatus::CLOSED;
    int64_t now = nowEpochMs();
    entry->session.status = SessionStatus::CLOSED;
    entry->session.updatedAt = now;
    entry->suspended.reset();

    auto projectIt = projectSessions.find(entry->session.projectId);
    if (projectIt != projectSessions.end()) {
      auto& ids = projectIt->second;
      ids.erase(std::remove(ids.begin(), ids.end(), sessionId), ids.end());
      if (ids.empty()) {
        projectSessions.erase(projectIt);
      }
    }
    pendingRemovals[sessionId] = now + config.closeGraceDelay.count();
    event.session = entry->session;
  }
  {
    lock_guard<mutex> guard(maintenanceMutex);
  }
  maintenanceCv.notify_all();

  LOG(INFO) << "Closed session " << sessionId;
  eventChannel.emit(event);
  return true;
}

int SessionManager::closeProjectSessions(const string& projectId) {
  vector<string> ids;
  {
    lock_guard<mutex> registryGuard(registryMutex);
    auto it = projectSessions.find(projectId);
    if (it != projectSessions.end()) {
      ids = it->second;
    }
  }
  int closed = 0;
  for (const auto& id : ids) {
    if (closeSession(id)) {
      closed++;
    }
  }
  return closed;
}

SessionStatistics SessionManager::getStatistics() const {
  vector<shared_ptr<SessionEntry>> entries;
  SessionStatistics stats;
  {
    lock_guard<mutex> registryGuard(registryMutex);
    entries.reserve(sessions.size());
    for (const auto& it : sessions) {
      entries.push_back(it.second);
    }
    stats.projectCount = int(projectSessions.size());
  }
  for (const auto& entry : entries) {
    lock_guard<mutex> guard(entry->entryMutex);
    if (entry->session.status == SessionStatus::CLOSED) {
      continue;
    }
    stats.totalSessions++;
    if (entry->session.status == SessionStatus::ACTIVE) {
      stats.activeSessions++;
    }
    if (entry->suspended) {
      stats.suspendedSessions++;
    }
    stats.memoryUsage += entry->session.metrics.memoryUsage;
  }
  return stats;
}

vector<TerminalSession> SessionManager::snapshotSessions() const {
  vector<shared_ptr<SessionEntry>> entries;
  {
    lock_guard<mutex> registryGuard(registryMutex);
    for (const auto& it : sessions) {
      entries.push_back(it.second);
    }
  }
  vector<TerminalSession> retval;
  retval.reserve(entries.size());
  for (const auto& entry : entries) {
    lock_guard<mutex> guard(entry->entryMutex);
    retval.push_back(entry->session);
  }
  return retval;
}

map<string, int> SessionManager::projectSessionCounts() const {
  lock_guard<mutex> registryGuard(registryMutex);
  map<string, int> counts;
  for (const auto& it : projectSessions) {
    counts[it.first] = int(it.second.size());
  }
  return counts;
}

int SessionManager::cleanupInactiveSessions() {
  int64_t now = nowEpochMs();
  vector<string> stale;
  for (const auto& session : snapshotSessions()) {
    if (session.status == SessionStatus::CLOSED ||
        session.status == SessionStatus::ACTIVE ||
        session.status == SessionStatus::SUSPENDED) {
      continue;
    }
    if (now - session.metrics.lastActivity >
        int64_t(config.sessionTimeout.count())) {
      stale.push_back(session.id);
    }
  }
  int closed = 0;
  for (const auto& id : stale) {
    LOG(INFO) << "Closing inactive session " << id;
    if (closeSession(id)) {
      closed++;
    }
  }
  return closed;
}

int SessionManager::cleanupExpiredSuspensions() {
  int64_t now = nowEpochMs();
  vector<shared_ptr<SessionEntry>> entries;
  {
    lock_guard<mutex> registryGuard(registryMutex);
    for (const auto& it : sessions) {
      entries.push_back(it.second);
    }
  }
  vector<string> expired;
  for (const auto& entry : entries) {
    lock_guard<mutex> guard(entry->entryMutex);
    if (entry->suspended &&
        now - entry->suspended->suspendedAt >
            int64_t(config.suspensionTimeout.count())) {
      expired.push_back(entry->session.id);
    }
  }
  int closed = 0;
  for (const auto& id : expired) {
    LOG(INFO) << "Suspension of " << id << " expired";
    if (closeSession(id)) {
      closed++;
    }
  }
  return closed;
}

int SessionManager::purgeClosedSessions() {
  int64_t now = nowEpochMs();
  lock_guard<mutex> registryGuard(registryMutex);
  int removed = 0;
  for (auto it = pendingRemovals.begin(); it != pendingRemovals.end();) {
    if (it->second <= now) {
      VLOG(1) << "Removing closed session " << it->first;
      sessions.erase(it->first);
      it = pendingRemovals.erase(it);
      removed++;
    } else {
      ++it;
    }
  }
  return removed;
}

void SessionManager::start() {
  lock_guard<mutex> guard(maintenanceMutex);
  if (maintenanceThread) {
    return;
  }
  halt = false;
  maintenanceThread.reset(new thread(&SessionManager::maintenanceLoop, this));
}

void SessionManager::shutdown() {
  {
    lock_guard<mutex> guard(maintenanceMutex);
    halt = true;
  }
  maintenanceCv.notify_all();
  if (maintenanceThread) {
    maintenanceThread->join();
    maintenanceThread.reset();
  }
}

void SessionManager::maintenanceLoop() {
  el::Helpers::setThreadName("session-maintenance");
  typedef std::chrono::steady_clock Clock;
  auto nextCleanup = Clock::now() + config.cleanupInterval;
  auto nextSuspensionCleanup = Clock::now() + config.suspensionCleanupInterval;

  unique_lock<mutex> lock(maintenanceMutex);
  while (!halt) {
    auto wakeAt = std::min(nextCleanup, nextSuspensionCleanup);
    {
      lock_guard<mutex> registryGuard(registryMutex);
      if (!pendingRemovals.empty()) {
        int64_t earliest = INT64_MAX;
        for (const auto& it : pendingRemovals) {
          earliest = std::min(earliest, it.second);
        }
        auto removeAt = Clock::now() + std::chrono::milliseconds(std::max<int64_t>(
                                           0, earliest - nowEpochMs()));
        wakeAt = std::min(wakeAt, removeAt);
      }
    }
    maintenanceCv.wait_until(lock, wakeAt);
    if (halt) {
      break;
    }
    lock.unlock();
    try {
      auto now = Clock::now();
      purgeClosedSessions();
      if (now >= nextCleanup) {
        cleanupInactiveSessions();
        nextCleanup = now + config.cleanupInterval;
      }
      if (now >= nextSuspensionCleanup) {
        cleanupExpiredSuspensions();
        nextSuspensionCleanup = now + config.suspensionCleanupInterval;
      }
    } catch (const std::exception& e) {
      STERROR << "Session maintenance failed: " << e.what();
    }
    lock.lock();
  }
}

shared_ptr<SessionManager::SessionEntry> SessionManager::findEntry(
    const string& sessionId) const {
  lock_guard<mutex> registryGuard(registryMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    return nullptr;
  }
  return it->second;
}

vector<shared_ptr<SessionManager::SessionEntry>> SessionManager::projectEntries(
    const string& projectId) const {
  lock_guard<mutex> registryGuard(registryMutex);
  vector<shared_ptr<SessionEntry>> retval;
  auto it = projectSessions.find(projectId);
  if (it == projectSessions.end()) {
    return retval;
  }
  for (const auto& id : it->second) {
    auto entry = sessions.find(id);
    if (entry != sessions.end()) {
      retval.push_back(entry->second);
    }
  }
  return retval;
}

shared_ptr<mutex> SessionManager::focusMutexFor(const string& projectId) {
  lock_guard<mutex> guard(focusMutexesMutex);
  auto& m = focusMutexes[projectId];
  if (!m) {
    m = make_shared<mutex>();
  }
  return m;
}

int SessionManager::liveSessionCountLocked() const {
  int live = 0;
  for (const auto& it : projectSessions) {
    live += int(it.second.size());
  }
  return live;
}

string SessionManager::nextTabNameLocked(const string& projectId) const {
  int maxNumber = 0;
  auto it = projectSessions.find(projectId);
  if (it != projectSessions.end()) {
    for (const auto& id : it->second) {
      auto entry = sessions.find(id);
      if (entry == sessions.end()) {
        continue;
      }
      lock_guard<mutex> guard(entry->second->entryMutex);
      maxNumber =
          std::max(maxNumber, parseTabNumber(entry->second->session.tabName));
    }
  }
  return TAB_PREFIX + to_string(maxNumber + 1);
}

void SessionManager::emitAll(const vector<SessionEvent>& pending) {
  for (const auto& event : pending) {
    eventChannel.emit(event);
  }
}
}  // namespace th
