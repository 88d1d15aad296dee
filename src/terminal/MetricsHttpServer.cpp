#include "MetricsHttpServer.hpp"

#include "httplib.h"

namespace th {
MetricsHttpServer::MetricsHttpServer(
    shared_ptr<TerminalOrchestrator> _orchestrator, const string& _host,
    int _port)
    : orchestrator(_orchestrator), host(_host), port(_port), boundPort(0) {}

MetricsHttpServer::~MetricsHttpServer() { stop(); }

int MetricsHttpServer::start() {
  if (server) {
    return boundPort;
  }
  server.reset(new httplib::Server());
  server->Get("/metrics", [this](const httplib::Request&,
                                 httplib::Response& res) {
    try {
      res.set_content(orchestrator->exportMetrics("prometheus") + "\n",
                      "text/plain; version=0.0.4");
    } catch (const std::exception& e) {
      LOG(WARNING) << "Metrics export failed: " << e.what();
      res.status = 500;
      res.set_content(e.what(), "text/plain");
    }
  });
  server->Get("/health", [this](const httplib::Request&,
                                httplib::Response& res) {
    try {
      HealthStatus health = orchestrator->metrics()->getHealthStatus();
      res.status = health.healthy ? 200 : 503;
      res.set_content(toJson(health).dump(2), "application/json");
    } catch (const std::exception& e) {
      LOG(WARNING) << "Health check failed: " << e.what();
      res.status = 500;
      res.set_content(e.what(), "text/plain");
    }
  });

  if (port == 0) {
    boundPort = server->bind_to_any_port(host);
  } else {
    boundPort = server->bind_to_port(host, port) ? port : -1;
  }
  if (boundPort < 0) {
    server.reset();
    throw std::runtime_error("Cannot bind metrics server to " + host + ":" +
                             to_string(port));
  }
  serverThread.reset(new thread([this]() {
    el::Helpers::setThreadName("metrics-http");
    server->listen_after_bind();
  }));
  server->wait_until_ready();
  LOG(INFO) << "Serving metrics on http://" << host << ":" << boundPort;
  return boundPort;
}

void MetricsHttpServer::stop() {
  if (!server) {
    return;
  }
  server->stop();
  if (serverThread) {
    serverThread->join();
    serverThread.reset();
  }
  server.reset();
  boundPort = 0;
}
}  // namespace th
