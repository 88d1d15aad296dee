#ifndef __TH_PIPE_SOCKET_HANDLER__
#define __TH_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace th {
/**
 * @brief UNIX domain socket handler. Endpoint names are filesystem paths.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  explicit PipeSocketHandler(int64_t _connectTimeoutMs = 3000);
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to the socket at the endpoint's path.
   * @return The connected fd, or -1 if nothing accepted within the connect
   * timeout.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Binds and listens on the endpoint's path, replacing any stale
   * socket file. The socket is only accessible to the current user.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /** @brief Closes the listening fd and removes the socket file. */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  int64_t connectTimeoutMs;
  map<string, set<int>> pipeServerSockets;
};
}  // namespace th

#endif  // __TH_PIPE_SOCKET_HANDLER__
