#ifndef __TH_CONNECTION_MULTIPLEXER__
#define __TH_CONNECTION_MULTIPLEXER__

#include "CircuitBreaker.hpp"
#include "Errors.hpp"
#include "EventChannel.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SocketHandler.hpp"

namespace th {
enum class ConnectionStatus { CONNECTING, CONNECTED, DISCONNECTED, ERROR };

const char* connectionStatusName(ConnectionStatus status);

enum class MultiplexerEventType {
  PRIMARY_CONNECTED,
  PRIMARY_DISCONNECTED,
  SESSION_CONNECTED,
  SESSION_DATA,
  SESSION_STATUS,
  SESSION_ERROR,
  SESSION_CLOSED,
  SESSION_DISCONNECTED,
  SESSION_STATUS_CHANGED,
  SESSION_RECONNECT_FAILED,
};

const char* multiplexerEventName(MultiplexerEventType type);

struct MultiplexerEvent {
  MultiplexerEventType type;
  string sessionId;
  /** @brief Output bytes, the server's status/error text, or session JSON
   * for SESSION_CONNECTED. */
  string data;
  ConnectionStatus status = ConnectionStatus::DISCONNECTED;
};

struct MultiplexerStatistics {
  int totalConnections = 0;
  int connectedSessions = 0;
  int disconnectedSessions = 0;
  int queuedMessages = 0;
};

json toJson(const MultiplexerStatistics& stats);

struct MultiplexerOptions {
  SocketEndpoint endpoint;
  /** @brief Per-session attempts before a session is marked ERROR. */
  int sessionReconnectAttempts = 5;
  std::chrono::milliseconds sessionReconnectDelay = std::chrono::seconds(1);
  /** @brief How long a connect/reconnect may wait for the server's ack. */
  std::chrono::milliseconds ackTimeout = std::chrono::seconds(5);
  std::chrono::milliseconds controlTimeout = std::chrono::seconds(10);
  /** @brief Re-dial the primary endpoint automatically after it drops. */
  bool autoReconnect = true;
  CircuitBreakerPolicy circuitBreaker;
};

/**
 * @brief Runs many logical terminal sessions over one primary socket.
 *
 * Every outbound message is a MultiplexEnvelope tagged with its session id.
 * While a session is not CONNECTED its input, commands, resizes and clears
 * are queued and flushed in submission order once the server acknowledges
 * the session. Losing the primary socket marks every session DISCONNECTED
 * but keeps its record; the primary is re-dialed behind a CircuitBreaker and
 * sessions are re-attached with exponential backoff.
 */
class ConnectionMultiplexer {
 public:
  ConnectionMultiplexer(shared_ptr<SocketHandler> _socketHandler,
                        const MultiplexerOptions& _options);
  virtual ~ConnectionMultiplexer();

  /**
   * @brief Opens the primary transport. Safe to call again after a drop as a
   * manual retry.
   * @throws TermhubError CIRCUIT_OPEN while the breaker rejects attempts,
   * CONNECT_TIMEOUT when the endpoint cannot be reached.
   */
  void connect();
  bool isPrimaryConnected();

  /**
   * @brief Attaches to a server-side session. A no-op for a session that is
   * already CONNECTED.
   */
  void connectSession(const string& sessionId, const string& projectId,
                      const string& type);

  /** @throws TermhubError NOT_FOUND for a session never connected here. */
  void sendInput(const string& sessionId, const string& data);
  void sendCommand(const string& sessionId, const string& command);
  void resizeSession(const string& sessionId, int cols, int rows);
  void clearSession(const string& sessionId);

  /**
   * @brief UI-only detach: server-side events stop flowing to this client,
   * the server keeps the process running and the local record is kept.
   */
  void disconnectSession(const string& sessionId);
  /** @brief Terminates the session on the server and forgets it locally. */
  void closeSession(const string& sessionId);
  /**
   * @brief Manual retry for a DISCONNECTED or ERROR session; resets its
   * backoff counter.
   */
  void reconnectSession(const string& sessionId);

  /**
   * @brief Sends a control request. The future throws TermhubError with the
   * server's error code when the request fails.
   */
  future<json> sendControl(const string& method, const json& params);
  future<json> createSession(const string& projectId,
                             const string& projectPath,
                             const string& mode = "normal");

  optional<ConnectionStatus> getSessionStatus(const string& sessionId);
  vector<string> getActiveSessions();
  MultiplexerStatistics getStatistics();
  CircuitState getCircuitState() const { return breaker.getState(); }

  /** @brief Soft-detaches every session and drops the primary socket. */
  void destroy();
  /** @brief Hard-closes every session and drops the primary socket. */
  void forceCloseAllSessions();

  EventChannel<MultiplexerEvent>& events() { return eventChannel; }

 protected:
  typedef std::chrono::steady_clock Clock;

  struct SessionConnection {
    string sessionId;
    string projectId;
    string type;
    ConnectionStatus status = ConnectionStatus::CONNECTING;
    bool detached = false;
    int reconnectAttempts = 0;
    Clock::time_point lastActivity;
    optional<Clock::time_point> nextAttemptAt;
    optional<Clock::time_point> ackDeadline;
    deque<MultiplexEnvelope> messageQueue;
  };

  struct PendingControl {
    shared_ptr<promise<json>> result;
    Clock::time_point deadline;
  };

  void readerLoop();
  void timerLoop();
  void primaryReconnectLoop();

  void installPrimary(int fd);
  void onPrimaryLost(int fd, const string& reason);
  void handlePacket(const Packet& packet);
  void handleEnvelope(const MultiplexEnvelope& envelope);
  void handleControlResponse(const ControlResponse& response);

  /** @brief Sends or queues an envelope. classMutex must be held. */
  void enqueueOrSend(SessionConnection& connection,
                     MultiplexEnvelope envelope);
  /** @brief Writes on the primary socket. classMutex must be held. */
  bool sendLocked(const Packet& packet);
  void flushQueueLocked(SessionConnection& connection);
  void setStatusLocked(SessionConnection& connection, ConnectionStatus status,
                       vector<MultiplexerEvent>* pending);
  void scheduleReconnectLocked(SessionConnection& connection,
                               vector<MultiplexerEvent>* pending);
  void stopThreads();
  void dropPrimary();
  void emitAll(const vector<MultiplexerEvent>& pending);

  shared_ptr<SocketHandler> socketHandler;
  const MultiplexerOptions options;
  const string clientId;
  CircuitBreaker breaker;
  EventChannel<MultiplexerEvent> eventChannel;

  recursive_mutex classMutex;
  int primaryFd;
  map<string, SessionConnection> connections;
  map<string, PendingControl> pendingControls;

  mutex reconnectMutex;
  condition_variable reconnectCv;
  bool primaryReconnectWanted;

  atomic<bool> halt;
  shared_ptr<thread> readerThread;
  shared_ptr<thread> timerThread;
  shared_ptr<thread> reconnectThread;
};
}  // namespace th

#endif  // __TH_CONNECTION_MULTIPLEXER__
