#ifndef __TH_SESSION_MANAGER__
#define __TH_SESSION_MANAGER__

#include "Errors.hpp"
#include "EventChannel.hpp"
#include "Headers.hpp"
#include "OrchestratorConfig.hpp"
#include "SessionTypes.hpp"

namespace th {
/**
 * @brief Authoritative registry and state machine for terminal sessions.
 *
 * The registry map is guarded by a short-held lock; every session entry has
 * its own mutex that serializes mutations of that session. Focus changes for
 * a project additionally take that project's focus lock so the focused-count
 * ceiling is checked and applied atomically. Lock order is project focus,
 * then registry, then entry. Events are published after every lock has been
 * released and carry copies of the session.
 */
class SessionManager {
 public:
  explicit SessionManager(const OrchestratorConfig& _config);
  virtual ~SessionManager();

  /**
   * @brief Creates a session in INITIALIZING state.
   *
   * Both quotas (live sessions overall and live sessions in the project) are
   * checked and the session inserted under one registry lock, so concurrent
   * callers can never overshoot a ceiling.
   * @throws TermhubError LIMIT_EXCEEDED when either quota is full.
   */
  TerminalSession createSession(const string& projectId,
                                const optional<string>& userId = nullopt,
                                SessionMode mode = SessionMode::NORMAL,
                                const string& workingDirectory = "");

  /** @brief Returns a copy of the session, including CLOSED sessions that are
   * still inside their grace period. */
  optional<TerminalSession> getSession(const string& sessionId) const;

  /** @brief Live (non-CLOSED) sessions of a project, in creation order. */
  vector<TerminalSession> listProjectSessions(const string& projectId) const;

  /**
   * @brief Applies a status transition and its side effects.
   *
   * Entering ACTIVE refreshes lastActivity, entering ERROR bumps errorCount
   * and publishes session:error with @p reason. CLOSED is routed through
   * closeSession().
   * @throws TermhubError NOT_FOUND for an unknown id, INVALID_STATE when the
   * lifecycle forbids the transition.
   */
  void updateSessionStatus(const string& sessionId, SessionStatus status,
                           const string& reason = "");

  /**
   * @brief Merges a partial metadata update.
   * @throws TermhubError NOT_FOUND for an unknown id.
   */
  void updateSessionMetadata(const string& sessionId,
                             const MetadataPatch& patch);

  /** @brief Merges counters and refreshes lastActivity. Unknown ids are
   * ignored. */
  void updateSessionMetrics(const string& sessionId, const MetricsPatch& patch);

  /** @brief Hot-path counter increment. Unknown ids are ignored. */
  void recordActivity(const string& sessionId, int64_t inputBytes,
                      int64_t outputBytes, int64_t commands = 0);

  /**
   * @brief Focuses or unfocuses a session.
   *
   * When the project is already at its focus ceiling, the focused session
   * with the oldest lastActivity loses focus first.
   * @throws TermhubError NOT_FOUND for an unknown or closed id.
   */
  void setSessionFocus(const string& sessionId, bool focused);

  /**
   * @brief Moves every ACTIVE session of the project to SUSPENDED.
   * @param bufferedOutput Undelivered output per session id, stored in the
   * snapshot (bounded by suspendedOutputLimit).
   * @return The number of sessions suspended.
   */
  int suspendProjectSessions(
      const string& projectId,
      const map<string, vector<string>>& bufferedOutput = {});

  /**
   * @brief Resumes every suspended session of the project.
   *
   * Sessions suspended for longer than suspensionTimeout are closed instead.
   * @param bufferedOutput When non-null, receives the output that was stored
   * with each resumed session.
   * @return The sessions actually resumed.
   */
  vector<TerminalSession> resumeProjectSessions(
      const string& projectId,
      map<string, vector<string>>* bufferedOutput = nullptr);

  /** @brief Appends output to a suspended session's snapshot, dropping the
   * oldest chunk once the limit is reached. */
  bool appendSuspendedOutput(const string& sessionId, const string& chunk);

  /**
   * @brief Closes a session. Safe to call repeatedly.
   *
   * The session leaves project listings immediately and is removed from the
   * registry closeGraceDelay later.
   * @return true if this call closed it, false if it was already closed or
   * unknown.
   */
  bool closeSession(const string& sessionId);

  /** @return How many sessions were closed. */
  int closeProjectSessions(const string& projectId);

  SessionStatistics getStatistics() const;

  /** @brief Copies of every registered session, closed ones included. */
  vector<TerminalSession> snapshotSessions() const;

  /** @brief Live session count per project. */
  map<string, int> projectSessionCounts() const;

  /** @brief Closes non-ACTIVE, non-SUSPENDED sessions idle for longer than
   * sessionTimeout. @return The number closed. */
  int cleanupInactiveSessions();

  /** @brief Closes sessions suspended for longer than suspensionTimeout.
   * @return The number closed. */
  int cleanupExpiredSuspensions();

  /** @brief Drops closed sessions whose grace period has elapsed.
   * @return The number removed. */
  int purgeClosedSessions();

  /** @brief Starts the maintenance thread that runs the sweeps above. */
  void start();
  /** @brief Stops and joins the maintenance thread. */
  void shutdown();

  EventChannel<SessionEvent>& events() { return eventChannel; }

  /** @brief Generates a process-unique `session_<ms>_<random>` id. */
  static string generateSessionId();

 protected:
  struct SessionEntry {
    mutable mutex entryMutex;
    TerminalSession session;
    optional<SuspendedState> suspended;
  };

  shared_ptr<SessionEntry> findEntry(const string& sessionId) const;
  vector<shared_ptr<SessionEntry>> projectEntries(
      const string& projectId) const;
  shared_ptr<mutex> focusMutexFor(const string& projectId);
  /** @brief Must be called with the registry lock held. */
  int liveSessionCountLocked() const;
  /** @brief Must be called with the registry lock held. */
  string nextTabNameLocked(const string& projectId) const;
  void applyTransition(SessionEntry* entry, SessionStatus newStatus);
  void emitAll(const vector<SessionEvent>& pending);
  void maintenanceLoop();

  const OrchestratorConfig config;

  mutable mutex registryMutex;
  /** @brief Every registered session, including closed ones in grace. */
  unordered_map<string, shared_ptr<SessionEntry>> sessions;
  /** @brief Live session ids per project, in creation order. */
  map<string, vector<string>> projectSessions;
  /** @brief Closed session id -> epoch ms at which it may be purged. */
  map<string, int64_t> pendingRemovals;

  mutex focusMutexesMutex;
  map<string, shared_ptr<mutex>> focusMutexes;

  EventChannel<SessionEvent> eventChannel;

  mutex maintenanceMutex;
  condition_variable maintenanceCv;
  bool halt;
  shared_ptr<thread> maintenanceThread;
};
}  // namespace th

#endif  // __TH_SESSION_MANAGER__
