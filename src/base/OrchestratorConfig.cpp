#include "OrchestratorConfig.hpp"

#include "SimpleIni.h"

namespace th {
namespace {
template <typename T>
void readInt(const CSimpleIniA& ini, const char* section, const char* key,
             T* out) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL) {
    return;
  }
  try {
    *out = T(std::stoll(value));
  } catch (const std::logic_error&) {
    throw std::runtime_error(string("Invalid integer for [") + section + "] " +
                             key + ": " + value);
  }
}

void readMillis(const CSimpleIniA& ini, const char* section, const char* key,
                std::chrono::milliseconds* out) {
  int64_t ms = out->count();
  readInt(ini, section, key, &ms);
  *out = std::chrono::milliseconds(ms);
}

void readDouble(const CSimpleIniA& ini, const char* section, const char* key,
                double* out) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL) {
    return;
  }
  try {
    *out = std::stod(value);
  } catch (const std::logic_error&) {
    throw std::runtime_error(string("Invalid number for [") + section + "] " +
                             key + ": " + value);
  }
}

void readString(const CSimpleIniA& ini, const char* section, const char* key,
                string* out) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value != NULL) {
    *out = value;
  }
}
}  // namespace

void OrchestratorConfig::loadFromIni(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc != SI_OK) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  readInt(ini, "sessions", "max_total", &maxTotalSessions);
  readInt(ini, "sessions", "max_per_project", &maxSessionsPerProject);
  readInt(ini, "sessions", "max_focused_per_project", &maxFocusedPerProject);
  readMillis(ini, "sessions", "timeout_ms", &sessionTimeout);
  readMillis(ini, "sessions", "suspension_timeout_ms", &suspensionTimeout);
  readMillis(ini, "sessions", "cleanup_interval_ms", &cleanupInterval);
  readMillis(ini, "sessions", "suspension_cleanup_interval_ms",
             &suspensionCleanupInterval);
  readMillis(ini, "sessions", "close_grace_ms", &closeGraceDelay);
  readInt(ini, "sessions", "suspended_output_limit", &suspendedOutputLimit);

  readInt(ini, "streams", "buffer_size", &streamBufferSize);
  readInt(ini, "streams", "reconnect_attempts", &reconnectAttempts);
  readMillis(ini, "streams", "reconnect_delay_ms", &reconnectDelay);
  readMillis(ini, "streams", "connect_timeout_ms", &connectTimeout);
  readMillis(ini, "streams", "health_check_interval_ms",
             &streamHealthCheckInterval);
  readString(ini, "streams", "shell", &shell);
  readString(ini, "streams", "assistant_endpoint", &assistantEndpoint);
  readInt(ini, "streams", "reconnect_pool_size", &reconnectPoolSize);

  readMillis(ini, "metrics", "interval_ms", &metricsInterval);
  readMillis(ini, "metrics", "health_interval_ms", &healthInterval);
  readInt(ini, "metrics", "history_size", &metricsHistorySize);
  readDouble(ini, "metrics", "cpu_threshold", &thresholds.cpuPercent);
  readDouble(ini, "metrics", "memory_threshold_mb", &thresholds.memoryMb);
  readInt(ini, "metrics", "active_sessions_threshold",
          &thresholds.activeSessions);
  readDouble(ini, "metrics", "error_rate_threshold",
             &thresholds.errorsPerMinute);
  readDouble(ini, "metrics", "latency_threshold_ms", &thresholds.latencyMs);

  readInt(ini, "circuit_breaker", "failure_threshold",
          &circuitBreaker.failureThreshold);
  readMillis(ini, "circuit_breaker", "failure_window_ms",
             &circuitBreaker.failureWindow);
  readMillis(ini, "circuit_breaker", "recovery_timeout_ms",
             &circuitBreaker.recoveryTimeout);
  readInt(ini, "circuit_breaker", "max_attempts", &circuitBreaker.maxAttempts);
  readMillis(ini, "circuit_breaker", "backoff_base_ms",
             &circuitBreaker.backoffBase);
  readMillis(ini, "circuit_breaker", "backoff_max_ms",
             &circuitBreaker.backoffMax);

  readString(ini, "server", "socket", &socketPath);
  readInt(ini, "server", "metrics_port", &metricsPort);

  if (maxTotalSessions <= 0 || maxSessionsPerProject <= 0 ||
      maxFocusedPerProject <= 0 || streamBufferSize == 0) {
    throw std::runtime_error("Session and buffer limits must be positive");
  }
  LOG(INFO) << "Loaded config from " << path;
}

string OrchestratorConfig::resolveShell() const {
  if (!shell.empty()) {
    return shell;
  }
  const char* envShell = ::getenv("SHELL");
  if (envShell != NULL && envShell[0] != '\0') {
    return envShell;
  }
  return "/bin/sh";
}

json OrchestratorConfig::toJson() const {
  json j;
  j["sessions"] = {
      {"maxTotal", maxTotalSessions},
      {"maxPerProject", maxSessionsPerProject},
      {"maxFocusedPerProject", maxFocusedPerProject},
      {"timeoutMs", sessionTimeout.count()},
      {"suspensionTimeoutMs", suspensionTimeout.count()},
      {"closeGraceMs", closeGraceDelay.count()},
  };
  j["streams"] = {
      {"bufferSize", streamBufferSize},
      {"reconnectAttempts", reconnectAttempts},
      {"reconnectDelayMs", reconnectDelay.count()},
      {"connectTimeoutMs", connectTimeout.count()},
  };
  j["circuitBreaker"] = {
      {"failureThreshold", circuitBreaker.failureThreshold},
      {"failureWindowMs", circuitBreaker.failureWindow.count()},
      {"recoveryTimeoutMs", circuitBreaker.recoveryTimeout.count()},
      {"maxAttempts", circuitBreaker.maxAttempts},
  };
  return j;
}
}  // namespace th
