#include "SessionTypes.hpp"

namespace th {
const char* sessionStatusName(SessionStatus status) {
  switch (status) {
    case SessionStatus::INITIALIZING:
      return "initializing";
    case SessionStatus::CONNECTING:
      return "connecting";
    case SessionStatus::ACTIVE:
      return "active";
    case SessionStatus::SUSPENDED:
      return "suspended";
    case SessionStatus::CLOSING:
      return "closing";
    case SessionStatus::CLOSED:
      return "closed";
    case SessionStatus::ERROR:
      return "error";
  }
  return "unknown";
}

optional<SessionStatus> parseSessionStatus(const string& name) {
  static const map<string, SessionStatus> byName = {
      {"initializing", SessionStatus::INITIALIZING},
      {"connecting", SessionStatus::CONNECTING},
      {"active", SessionStatus::ACTIVE},
      {"suspended", SessionStatus::SUSPENDED},
      {"closing", SessionStatus::CLOSING},
      {"closed", SessionStatus::CLOSED},
      {"error", SessionStatus::ERROR},
  };
  auto it = byName.find(name);
  if (it == byName.end()) {
    return nullopt;
  }
  return it->second;
}

const char* sessionModeName(SessionMode mode) {
  switch (mode) {
    case SessionMode::NORMAL:
      return "normal";
    case SessionMode::CLAUDE:
      return "claude";
    case SessionMode::SYSTEM:
      return "system";
  }
  return "unknown";
}

optional<SessionMode> parseSessionMode(const string& name) {
  if (name == "normal") return SessionMode::NORMAL;
  if (name == "claude") return SessionMode::CLAUDE;
  if (name == "system") return SessionMode::SYSTEM;
  return nullopt;
}

bool isValidTransition(SessionStatus from, SessionStatus to) {
  if (from == to) {
    return from != SessionStatus::CLOSED;
  }
  switch (from) {
    case SessionStatus::INITIALIZING:
      return to != SessionStatus::SUSPENDED;
    case SessionStatus::CONNECTING:
      return to == SessionStatus::ACTIVE || to == SessionStatus::ERROR ||
             to == SessionStatus::CLOSING || to == SessionStatus::CLOSED;
    case SessionStatus::ACTIVE:
      return to == SessionStatus::SUSPENDED || to == SessionStatus::CLOSING ||
             to == SessionStatus::CLOSED || to == SessionStatus::ERROR;
    case SessionStatus::SUSPENDED:
      return to == SessionStatus::ACTIVE || to == SessionStatus::CLOSING ||
             to == SessionStatus::CLOSED || to == SessionStatus::ERROR;
    case SessionStatus::CLOSING:
      return to == SessionStatus::CLOSED || to == SessionStatus::ERROR;
    case SessionStatus::ERROR:
      return to == SessionStatus::CONNECTING || to == SessionStatus::CLOSING ||
             to == SessionStatus::CLOSED;
    case SessionStatus::CLOSED:
      return false;
  }
  return false;
}

const char* sessionEventName(SessionEventType type) {
  switch (type) {
    case SessionEventType::CREATED:
      return "session:created";
    case SessionEventType::STATUS_CHANGED:
      return "session:status-changed";
    case SessionEventType::METADATA_UPDATED:
      return "session:metadata-updated";
    case SessionEventType::FOCUS_CHANGED:
      return "session:focus-changed";
    case SessionEventType::SUSPENDED:
      return "session:suspended";
    case SessionEventType::RESUMED:
      return "session:resumed";
    case SessionEventType::CLOSED:
      return "session:closed";
    case SessionEventType::ERROR:
      return "session:error";
  }
  return "session:unknown";
}

json toJson(const Dimensions& dimensions) {
  return json{{"rows", dimensions.rows}, {"cols", dimensions.cols}};
}

json toJson(const SessionMetadata& metadata) {
  json j;
  j["workingDirectory"] = metadata.workingDirectory;
  j["environment"] = metadata.environment;
  j["dimensions"] = toJson(metadata.dimensions);
  j["focused"] = metadata.focused;
  if (metadata.layoutPosition) {
    j["layoutPosition"] = *metadata.layoutPosition;
  }
  return j;
}

json toJson(const SessionMetrics& metrics) {
  return json{
      {"cpuUsage", metrics.cpuUsage},
      {"memoryUsage", metrics.memoryUsage},
      {"inputBytes", metrics.inputBytes},
      {"outputBytes", metrics.outputBytes},
      {"commandCount", metrics.commandCount},
      {"errorCount", metrics.errorCount},
      {"lastActivity", metrics.lastActivity},
  };
}

json toJson(const TerminalSession& session) {
  json j;
  j["id"] = session.id;
  j["projectId"] = session.projectId;
  if (session.userId) {
    j["userId"] = *session.userId;
  }
  j["tabName"] = session.tabName;
  j["status"] = sessionStatusName(session.status);
  j["mode"] = sessionModeName(session.mode);
  j["createdAt"] = session.createdAt;
  j["updatedAt"] = session.updatedAt;
  j["metadata"] = toJson(session.metadata);
  j["metrics"] = toJson(session.metrics);
  return j;
}

json toJson(const SessionStatistics& stats) {
  return json{
      {"totalSessions", stats.totalSessions},
      {"activeSessions", stats.activeSessions},
      {"suspendedSessions", stats.suspendedSessions},
      {"projectCount", stats.projectCount},
      {"memoryUsage", stats.memoryUsage},
  };
}
}  // namespace th
