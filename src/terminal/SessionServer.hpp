#ifndef __TH_SESSION_SERVER__
#define __TH_SESSION_SERVER__

#include "Headers.hpp"
#include "SocketHandler.hpp"
#include "TerminalOrchestrator.hpp"

namespace th {
/**
 * @brief Server end of the multiplexed session protocol.
 *
 * Every accepted client runs on its own handler thread. A client attaches to
 * sessions with TERMINAL_CONNECT; from then on the session's output, status
 * changes and close are pushed to it as MultiplexEnvelope packets until it
 * detaches or disconnects. Sessions outlive their clients.
 */
class SessionServer {
 public:
  SessionServer(shared_ptr<SocketHandler> _socketHandler,
                const SocketEndpoint& _serverEndpoint,
                shared_ptr<TerminalOrchestrator> _orchestrator);
  virtual ~SessionServer();

  /** @brief Accepts clients until shutdown() is called, then closes the
   * listening socket. */
  void run();
  bool acceptNewConnection(int fd);
  /** @brief Stops run() and joins every client handler. */
  void shutdown();

  int getClientCount();
  /** @brief Number of clients attached to a session. */
  int getAttachmentCount(const string& sessionId);

  /**
   * @brief Executes one control request. Domain errors come back as a
   * response with ok=false and the error code set.
   */
  ControlResponse handleControl(const ControlRequest& request);

 protected:
  struct ClientState {
    explicit ClientState(int _fd) : fd(_fd), alive(true) {}
    const int fd;
    mutex writeMutex;
    atomic<bool> alive;
  };

  void clientHandler(shared_ptr<ClientState> client);
  void handlePacket(const shared_ptr<ClientState>& client,
                    const Packet& packet);
  void handleEnvelope(const shared_ptr<ClientState>& client,
                      const MultiplexEnvelope& envelope);
  void attach(const shared_ptr<ClientState>& client, const string& sessionId);
  void detach(int clientFd, const string& sessionId);
  void detachAll(int clientFd);
  json dispatchControl(const string& method, const json& params);
  void stopListening();

  bool send(const shared_ptr<ClientState>& client, const Packet& packet);
  bool sendEnvelope(const shared_ptr<ClientState>& client,
                    const string& sessionId, EnvelopeType type,
                    const string& data = "");
  void broadcast(const string& sessionId, EnvelopeType type,
                 const string& data);

  void onSessionEvent(const SessionEvent& event);
  void onStreamEvent(const StreamEvent& event);

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint serverEndpoint;
  shared_ptr<TerminalOrchestrator> orchestrator;
  int sessionSubscription;
  int streamSubscription;

  recursive_mutex classMutex;
  map<int, shared_ptr<ClientState>> clients;
  map<int, shared_ptr<thread>> clientThreads;
  map<string, set<int>> attachments;
  bool listening;
  atomic<bool> halt;
};
}  // namespace th

#endif  // __TH_SESSION_SERVER__
