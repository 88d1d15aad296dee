#ifndef __TH_TERMINAL_ORCHESTRATOR__
#define __TH_TERMINAL_ORCHESTRATOR__

#include "Headers.hpp"
#include "MetricsCollector.hpp"
#include "OrchestratorConfig.hpp"
#include "PtyTerminalProcess.hpp"
#include "SessionManager.hpp"
#include "StreamManager.hpp"

namespace th {
struct CreateTerminalParams {
  string projectId;
  string projectPath;
  optional<string> userId;
  SessionMode mode = SessionMode::NORMAL;
  optional<Dimensions> dimensions;
  map<string, string> environment;
};

/** @brief A session together with its stream and the output it holds. */
struct TerminalInfo {
  TerminalSession session;
  optional<StreamSnapshot> stream;
  vector<string> buffer;
};

struct OrchestratorStatus {
  bool ready = false;
  HealthStatus health;
  int sessions = 0;
  int streams = 0;
  int projects = 0;
};

json toJson(const TerminalInfo& info);
json toJson(const OrchestratorStatus& status);

/**
 * @brief Owns the session, stream and metrics components of one daemon and
 * keeps them consistent: a session always gets its stream, a dead stream
 * closes or fails its session.
 */
class TerminalOrchestrator {
 public:
  TerminalOrchestrator(const OrchestratorConfig& _config,
                       shared_ptr<SocketHandler> transportHandler,
                       TerminalProcessFactory processFactory =
                           PtyTerminalProcess::create);
  virtual ~TerminalOrchestrator();

  /**
   * @brief Creates a session and attaches its backend, then activates it.
   *
   * CLAUDE sessions connect to the assistant endpoint, the others spawn a
   * shell. If the backend cannot be attached the session is closed again and
   * the error rethrown.
   */
  TerminalInfo createTerminal(const CreateTerminalParams& params);

  optional<TerminalInfo> getTerminal(const string& sessionId) const;
  vector<TerminalInfo> listProjectTerminals(const string& projectId) const;

  /** @throws TermhubError NOT_FOUND for an unknown session. */
  void writeToTerminal(const string& sessionId, const string& data);
  /** @throws TermhubError NOT_FOUND for an unknown session. */
  void resizeTerminal(const string& sessionId, const Dimensions& dimensions);
  void setTerminalFocus(const string& sessionId, bool focused);
  /** @brief Closes the stream, then the session. */
  bool closeTerminal(const string& sessionId);

  /**
   * @brief Detaches every active session of the project from its backend,
   * keeping the undelivered output with the suspended session.
   * @return The number of sessions suspended.
   */
  int suspendProject(const string& projectId);
  /**
   * @brief Resumes the project's sessions and gives each a new backend. The
   * output kept at suspension time comes back in TerminalInfo::buffer.
   */
  vector<TerminalInfo> resumeProject(const string& projectId);

  OrchestratorStatus getStatus();
  SystemMetrics getMetrics() { return metricsCollector->getCurrentMetrics(); }
  PerformanceReport getPerformanceReport() {
    return metricsCollector->getPerformanceReport();
  }
  /** @param format "json" or "prometheus". */
  string exportMetrics(const string& format);

  /** @brief Closes every stream and every session. */
  void cleanup();

  void start();
  void shutdown();

  SessionManager* sessions() { return sessionManager.get(); }
  StreamManager* streams() { return streamManager.get(); }
  MetricsCollector* metrics() { return metricsCollector.get(); }

 protected:
  StreamSnapshot attachBackend(const TerminalSession& session);
  void onStreamEvent(const StreamEvent& event);

  const OrchestratorConfig config;
  shared_ptr<SessionManager> sessionManager;
  shared_ptr<StreamManager> streamManager;
  shared_ptr<MetricsCollector> metricsCollector;
  int streamSubscription;
  int sessionSubscription;
  atomic<bool> ready;
};
}  // namespace th

#endif  // __TH_TERMINAL_ORCHESTRATOR__
