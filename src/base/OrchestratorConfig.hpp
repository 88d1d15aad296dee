#ifndef __TH_ORCHESTRATOR_CONFIG__
#define __TH_ORCHESTRATOR_CONFIG__

#include "CircuitBreaker.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"

namespace th {
/**
 * @brief Thresholds the metrics collector grades health checks against.
 */
struct HealthThresholds {
  double cpuPercent = 80.0;
  double memoryMb = 2048.0;
  int activeSessions = 100;
  double disconnectedRatioFail = 0.5;
  double disconnectedRatioWarn = 0.2;
  double errorsPerMinute = 10.0;
  double latencyMs = 100.0;
};

/**
 * @brief Every tunable of the session daemon and the client multiplexer.
 *
 * Defaults are usable as-is; loadFromIni() overrides whichever keys the file
 * sets and leaves the rest alone.
 */
struct OrchestratorConfig {
  // [sessions]
  int maxTotalSessions = 50;
  int maxSessionsPerProject = 10;
  int maxFocusedPerProject = 4;
  std::chrono::milliseconds sessionTimeout = std::chrono::minutes(30);
  std::chrono::milliseconds suspensionTimeout = std::chrono::hours(24);
  std::chrono::milliseconds cleanupInterval = std::chrono::seconds(60);
  std::chrono::milliseconds suspensionCleanupInterval =
      std::chrono::minutes(5);
  std::chrono::milliseconds closeGraceDelay = std::chrono::seconds(5);
  size_t suspendedOutputLimit = 500;

  // [streams]
  size_t streamBufferSize = 500;
  int reconnectAttempts = 3;
  std::chrono::milliseconds reconnectDelay = std::chrono::seconds(1);
  std::chrono::milliseconds connectTimeout = std::chrono::seconds(5);
  std::chrono::milliseconds streamHealthCheckInterval =
      std::chrono::seconds(30);
  string shell;
  /** @brief UNIX socket of the assistant backend used by CLAUDE sessions. */
  string assistantEndpoint;
  int reconnectPoolSize = 4;

  // [metrics]
  std::chrono::milliseconds metricsInterval = std::chrono::seconds(10);
  std::chrono::milliseconds healthInterval = std::chrono::seconds(30);
  size_t metricsHistorySize = 1000;
  HealthThresholds thresholds;

  // [circuit_breaker]
  CircuitBreakerPolicy circuitBreaker;

  // [server]
  string socketPath;
  int metricsPort = 0;

  /**
   * @brief Applies the keys found in an INI file on top of this config.
   * @throws std::runtime_error if the file cannot be parsed or a value is
   * malformed.
   */
  void loadFromIni(const string& path);

  /** @brief The shell to spawn: `shell`, then $SHELL, then /bin/sh. */
  string resolveShell() const;

  json toJson() const;
};
}  // namespace th

#endif  // __TH_ORCHESTRATOR_CONFIG__
