#ifndef __TH_METRICS_HTTP_SERVER__
#define __TH_METRICS_HTTP_SERVER__

#include "Headers.hpp"
#include "TerminalOrchestrator.hpp"

namespace httplib {
class Server;
}

namespace th {
/**
 * @brief Serves /metrics (Prometheus text) and /health (JSON) on localhost.
 */
class MetricsHttpServer {
 public:
  MetricsHttpServer(shared_ptr<TerminalOrchestrator> _orchestrator,
                    const string& _host, int _port);
  virtual ~MetricsHttpServer();

  /**
   * @brief Binds and starts serving on a background thread.
   * @return The bound port. Port 0 binds any free port.
   * @throws std::runtime_error when the port cannot be bound.
   */
  int start();
  void stop();
  int getPort() const { return boundPort; }

 protected:
  shared_ptr<TerminalOrchestrator> orchestrator;
  string host;
  int port;
  int boundPort;
  unique_ptr<httplib::Server> server;
  unique_ptr<thread> serverThread;
};
}  // namespace th

#endif  // __TH_METRICS_HTTP_SERVER__
