#ifndef __TH_SESSION_TYPES__
#define __TH_SESSION_TYPES__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace th {
enum class SessionStatus {
  INITIALIZING,
  CONNECTING,
  ACTIVE,
  SUSPENDED,
  CLOSING,
  CLOSED,
  ERROR,
};

/** @brief Selects which backend is attached to a session. */
enum class SessionMode { NORMAL, CLAUDE, SYSTEM };

const char* sessionStatusName(SessionStatus status);
optional<SessionStatus> parseSessionStatus(const string& name);
const char* sessionModeName(SessionMode mode);
optional<SessionMode> parseSessionMode(const string& name);

/**
 * @brief Whether the lifecycle allows moving from @p from to @p to.
 *
 * INITIALIZING -> CONNECTING -> ACTIVE <-> SUSPENDED -> CLOSING -> CLOSED,
 * anything except CLOSED may fall into ERROR, and ERROR may go back to
 * CONNECTING or be closed. CLOSED is terminal.
 */
bool isValidTransition(SessionStatus from, SessionStatus to);

struct Dimensions {
  int rows = 24;
  int cols = 80;

  bool operator==(const Dimensions& other) const {
    return rows == other.rows && cols == other.cols;
  }
};

struct SessionMetadata {
  string workingDirectory;
  map<string, string> environment;
  Dimensions dimensions;
  bool focused = false;
  optional<int> layoutPosition;

  bool operator==(const SessionMetadata& other) const {
    return workingDirectory == other.workingDirectory &&
           environment == other.environment &&
           dimensions == other.dimensions && focused == other.focused &&
           layoutPosition == other.layoutPosition;
  }
};

struct SessionMetrics {
  double cpuUsage = 0;
  int64_t memoryUsage = 0;
  int64_t inputBytes = 0;
  int64_t outputBytes = 0;
  int64_t commandCount = 0;
  int64_t errorCount = 0;
  /** @brief Epoch milliseconds of the last input, output or activation. */
  int64_t lastActivity = 0;

  bool operator==(const SessionMetrics& other) const {
    return cpuUsage == other.cpuUsage && memoryUsage == other.memoryUsage &&
           inputBytes == other.inputBytes &&
           outputBytes == other.outputBytes &&
           commandCount == other.commandCount &&
           errorCount == other.errorCount &&
           lastActivity == other.lastActivity;
  }
};

struct TerminalSession {
  string id;
  string projectId;
  optional<string> userId;
  string tabName;
  SessionStatus status = SessionStatus::INITIALIZING;
  SessionMode mode = SessionMode::NORMAL;
  int64_t createdAt = 0;
  int64_t updatedAt = 0;
  SessionMetadata metadata;
  SessionMetrics metrics;
};

/**
 * @brief What a session looked like when it was suspended, plus the output
 * its stream had not delivered yet.
 */
struct SuspendedState {
  int64_t suspendedAt = 0;
  deque<string> bufferedOutput;
  SessionMetadata metadata;
  SessionMetrics metrics;
};

/** @brief Partial metadata update; unset fields are left alone. */
struct MetadataPatch {
  optional<string> workingDirectory;
  optional<map<string, string>> environment;
  optional<Dimensions> dimensions;
  optional<int> layoutPosition;
};

/** @brief Partial metrics update; unset fields are left alone. */
struct MetricsPatch {
  optional<double> cpuUsage;
  optional<int64_t> memoryUsage;
  optional<int64_t> inputBytes;
  optional<int64_t> outputBytes;
  optional<int64_t> commandCount;
  optional<int64_t> errorCount;
};

struct SessionStatistics {
  int totalSessions = 0;
  int activeSessions = 0;
  int suspendedSessions = 0;
  int projectCount = 0;
  int64_t memoryUsage = 0;
};

enum class SessionEventType {
  CREATED,
  STATUS_CHANGED,
  METADATA_UPDATED,
  FOCUS_CHANGED,
  SUSPENDED,
  RESUMED,
  CLOSED,
  ERROR,
};

/**
 * @brief Everything SessionManager publishes. `session` is a copy taken when
 * the event happened.
 */
struct SessionEvent {
  SessionEventType type;
  TerminalSession session;
  SessionStatus oldStatus = SessionStatus::INITIALIZING;
  SessionStatus newStatus = SessionStatus::INITIALIZING;
  bool focused = false;
  string message;
};

/** @brief The wire name of an event, for example "session:closed". */
const char* sessionEventName(SessionEventType type);

json toJson(const Dimensions& dimensions);
json toJson(const SessionMetadata& metadata);
json toJson(const SessionMetrics& metrics);
json toJson(const TerminalSession& session);
json toJson(const SessionStatistics& stats);
}  // namespace th

#endif  // __TH_SESSION_TYPES__
