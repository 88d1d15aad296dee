#ifndef __TH_STREAM_MANAGER__
#define __TH_STREAM_MANAGER__

#include "CircularBuffer.hpp"
#include "Errors.hpp"
#include "EventChannel.hpp"
#include "Headers.hpp"
#include "OrchestratorConfig.hpp"
#include "SessionTypes.hpp"
#include "SocketHandler.hpp"
#include "TerminalProcess.hpp"
#include "ThreadPool.h"

namespace th {
enum class StreamType { TERMINAL, CLAUDE, SYSTEM };
enum class StreamStatus { CONNECTING, CONNECTED, DISCONNECTED, ERROR };

const char* streamTypeName(StreamType type);
const char* streamStatusName(StreamStatus status);

/**
 * @brief Per-stream counters. bytesIn/messagesIn count what callers wrote
 * into the backend, bytesOut/messagesOut what the backend produced.
 */
struct StreamMetrics {
  int64_t bytesIn = 0;
  int64_t bytesOut = 0;
  int64_t messagesIn = 0;
  int64_t messagesOut = 0;
  /** @brief Last measured ping round trip, in milliseconds. */
  double latency = 0;
  optional<int64_t> connectTime;
  optional<int64_t> disconnectTime;
};

struct StreamSnapshot {
  string sessionId;
  StreamType type = StreamType::TERMINAL;
  StreamStatus status = StreamStatus::CONNECTING;
  bool processBacked = false;
  StreamMetrics metrics;
  size_t bufferedChunks = 0;
  size_t pendingInput = 0;
};

enum class StreamEventType {
  CREATED,
  CONNECTED,
  DATA,
  EXIT,
  ERROR,
  CLOSED,
  RECONNECTED,
  RECONNECT_FAILED,
};

struct StreamEvent {
  StreamEventType type;
  string sessionId;
  StreamType streamType = StreamType::TERMINAL;
  string data;
  int exitCode = 0;
  string message;
};

const char* streamEventName(StreamEventType type);

json toJson(const StreamMetrics& metrics);
json toJson(const StreamSnapshot& snapshot);

struct TerminalStreamOptions {
  string sessionId;
  string workingDirectory;
  optional<Dimensions> dimensions;
  map<string, string> environment;
  StreamType type = StreamType::TERMINAL;
};

struct TransportStreamOptions {
  string sessionId;
  /** @brief Socket path of the backend; empty means the configured
   * assistant endpoint. */
  string endpoint;
  StreamType type = StreamType::SYSTEM;
};

/**
 * @brief Owns the bytes of every session: a PTY child process or a transport
 * connection, behind one write/read/resize/close surface.
 *
 * Each stream has two bounded rings. The output ring holds what the backend
 * produced (readBuffer() returns it when a consumer reattaches); the input
 * ring holds writes issued while the backend was unreachable and is replayed
 * in order on reconnect. Output is published as stream:data events from the
 * stream's own reader thread, so per-session order is the backend's order.
 */
class StreamManager {
 public:
  StreamManager(const OrchestratorConfig& _config,
                shared_ptr<SocketHandler> _transportHandler,
                TerminalProcessFactory _processFactory);
  virtual ~StreamManager();

  /**
   * @brief Spawns a shell on a pseudo-terminal for the session.
   * @throws TermhubError INVALID_STATE if the session already has a live
   * stream, std::runtime_error if the process cannot be spawned.
   */
  StreamSnapshot createTerminalStream(const TerminalStreamOptions& options);

  /**
   * @brief Connects to a transport backend and completes the handshake on the
   * reconnect pool. The future throws TermhubError CONNECT_TIMEOUT when the
   * handshake does not finish within connectTimeout.
   */
  std::future<StreamSnapshot> createTransportStream(
      const TransportStreamOptions& options);

  /** @brief Blocking form of createTransportStream(). */
  StreamSnapshot connectTransportStream(const TransportStreamOptions& options);

  /**
   * @brief Sends input to the backend, or queues it if the backend is not
   * connected.
   * @throws TermhubError NOT_FOUND for an unknown session.
   */
  void write(const string& sessionId, const string& data);

  /**
   * @brief Resizes the PTY, or sends a resize message over the transport.
   * @throws TermhubError NOT_FOUND for an unknown session.
   */
  void resize(const string& sessionId, const Dimensions& dimensions);

  /** @brief Output chunks held in the stream's ring, oldest first. */
  vector<string> readBuffer(const string& sessionId) const;

  /**
   * @brief Terminates the backend and marks the stream DISCONNECTED. The
   * record is dropped closeGraceDelay later.
   * @return false if there was no open stream for the session.
   */
  bool closeStream(const string& sessionId);

  /**
   * @brief Re-dials a transport stream, up to reconnectAttempts times,
   * reconnectDelay apart.
   * @throws TermhubError NOT_FOUND, PROCESS_EXIT for PTY streams (a dead
   * process needs a new session), RECONNECT_EXHAUSTED when every attempt
   * failed.
   */
  void reconnectStream(const string& sessionId);
  /** @brief Runs reconnectStream() on the reconnect pool. */
  std::future<void> reconnectStreamAsync(const string& sessionId);

  optional<StreamMetrics> getMetrics(const string& sessionId) const;
  optional<StreamSnapshot> getStream(const string& sessionId) const;
  /** @brief Snapshots of CONNECTED streams. */
  vector<StreamSnapshot> getActiveStreams() const;
  /** @brief Snapshots of every stream, including closed ones in grace. */
  vector<StreamSnapshot> getStreamSnapshots() const;

  /**
   * @brief Pings every connected transport and marks transports whose
   * socket is gone as disconnected.
   */
  void runHealthCheck();
  /** @brief Drops closed streams whose grace period has elapsed. */
  int purgeClosedStreams();

  /** @brief Starts the health check and purge thread. */
  void start();
  void shutdown();

  EventChannel<StreamEvent>& events() { return eventChannel; }

 protected:
  struct StreamConnection {
    StreamConnection(const string& _sessionId, StreamType _type,
                     size_t bufferSize)
        : sessionId(_sessionId),
          type(_type),
          status(StreamStatus::CONNECTING),
          transportFd(-1),
          output(bufferSize),
          pendingInput(bufferSize),
          closing(false),
          reconnecting(false) {}

    const string sessionId;
    const StreamType type;

    mutable mutex stateMutex;
    StreamStatus status;
    StreamMetrics metrics;

    shared_ptr<TerminalProcess> process;
    int transportFd;
    string endpoint;

    CircularBuffer<string> output;
    CircularBuffer<string> pendingInput;

    /** @brief Serializes input so replay and new writes keep their order. */
    mutex writeMutex;
    atomic<bool> closing;
    atomic<bool> reconnecting;
    shared_ptr<thread> readerThread;
  };

  shared_ptr<StreamConnection> findStream(const string& sessionId) const;
  void registerStream(const shared_ptr<StreamConnection>& stream);
  /** @brief Connects and handshakes. @return The connected fd. */
  int dialTransport(const string& endpoint, const string& sessionId,
                    StreamType type);
  void ptyReadLoop(shared_ptr<StreamConnection> stream);
  void transportReadLoop(shared_ptr<StreamConnection> stream, int fd);
  void handleOutput(const shared_ptr<StreamConnection>& stream,
                    const string& data);
  void handleTransportLoss(const shared_ptr<StreamConnection>& stream, int fd,
                           const string& reason);
  void stopReader(const shared_ptr<StreamConnection>& stream);
  StreamSnapshot snapshotOf(const StreamConnection& stream) const;
  void maintenanceLoop();

  const OrchestratorConfig config;
  shared_ptr<SocketHandler> transportHandler;
  TerminalProcessFactory processFactory;

  mutable mutex streamsMutex;
  map<string, shared_ptr<StreamConnection>> streams;
  map<string, int64_t> pendingRemovals;

  EventChannel<StreamEvent> eventChannel;
  unique_ptr<ThreadPool> reconnectPool;

  mutex maintenanceMutex;
  condition_variable maintenanceCv;
  atomic<bool> halt;
  shared_ptr<thread> maintenanceThread;
};
}  // namespace th

#endif  // __TH_STREAM_MANAGER__
