#ifndef __TH_METRICS_COLLECTOR__
#define __TH_METRICS_COLLECTOR__

#include "EventChannel.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "OrchestratorConfig.hpp"
#include "SessionManager.hpp"
#include "StreamManager.hpp"

namespace th {
struct CpuSample {
  /** @brief Share of one core used by this process since the last sample. */
  double usage = 0;
  vector<double> loadAverage;
  int cores = 0;
};

struct MemorySample {
  int64_t heapUsed = 0;
  int64_t heapTotal = 0;
  int64_t rss = 0;
};

struct SessionCounts {
  int total = 0;
  int active = 0;
  int suspended = 0;
  int error = 0;
  map<string, int> byProject;
  /** @brief Mean lifetime of closed sessions still in the registry, in ms. */
  double averageLifetime = 0;
  /** @brief Sessions created during the last minute. */
  int creationRate = 0;
};

struct StreamCounts {
  int total = 0;
  int connected = 0;
  int disconnected = 0;
  int64_t totalBytesIn = 0;
  int64_t totalBytesOut = 0;
  double averageLatency = 0;
};

struct ErrorRecord {
  int64_t timestamp = 0;
  string type;
  string message;
};

struct ErrorCounts {
  /** @brief Every error since startup; never goes down. */
  int64_t total = 0;
  /** @brief Over the retained error log only. */
  map<string, int> byType;
  /** @brief Errors recorded during the last minute. */
  int rate = 0;
  optional<ErrorRecord> lastError;
};

struct SystemMetrics {
  int64_t timestamp = 0;
  CpuSample cpu;
  MemorySample memory;
  SessionCounts sessions;
  StreamCounts streams;
  ErrorCounts errors;
};

enum class CheckStatus { PASS, WARN, FAIL };
const char* checkStatusName(CheckStatus status);

struct HealthCheck {
  string name;
  CheckStatus status = CheckStatus::PASS;
  string value;
  string threshold;
};

struct HealthStatus {
  bool healthy = true;
  vector<HealthCheck> checks;
  int64_t timestamp = 0;
};

struct PerformanceReport {
  string summary;
  vector<string> recommendations;
  json metrics;
};

enum class MetricsEventType {
  COLLECTED,
  HEALTH_CHECKED,
  UNHEALTHY,
  ERROR_RECORDED,
};

struct MetricsEvent {
  MetricsEventType type;
  optional<SystemMetrics> metrics;
  optional<HealthStatus> health;
  optional<ErrorRecord> error;
};

const char* metricsEventName(MetricsEventType type);

json toJson(const SystemMetrics& metrics);
json toJson(const HealthStatus& health);
json toJson(const PerformanceReport& report);

/**
 * @brief Passive observer of the session and stream managers.
 *
 * Reads their public snapshots, never mutates them. Errors and session
 * creations are learned from the managers' event channels; everything else is
 * sampled on demand or by the collector's own thread. A failed sample is
 * logged and skipped.
 */
class MetricsCollector {
 public:
  MetricsCollector(const OrchestratorConfig& _config,
                   SessionManager* _sessionManager,
                   StreamManager* _streamManager);
  virtual ~MetricsCollector();

  SystemMetrics getCurrentMetrics();
  /**
   * @param duration When set, only samples newer than now - duration.
   */
  vector<SystemMetrics> getMetricsHistory(
      optional<std::chrono::milliseconds> duration = nullopt) const;
  HealthStatus getHealthStatus();
  PerformanceReport getPerformanceReport();
  /** @brief Prometheus text exposition of the current metrics. */
  string exportPrometheusMetrics();

  /** @brief Adds an entry to the error log ("session", "stream", ...). */
  void recordError(const string& type, const string& message);

  /** @brief Takes one sample into the history and publishes it. */
  void collectNow();
  /** @brief Runs the health checks and publishes the result. */
  HealthStatus checkHealthNow();

  void start();
  void shutdown();

  EventChannel<MetricsEvent>& events() { return eventChannel; }

 protected:
  CpuSample sampleCpu();
  MemorySample sampleMemory() const;
  SessionCounts sampleSessions();
  StreamCounts sampleStreams() const;
  ErrorCounts sampleErrors() const;
  HealthStatus gradeHealth(const SystemMetrics& metrics) const;
  void samplingLoop();

  const OrchestratorConfig config;
  SessionManager* sessionManager;
  StreamManager* streamManager;
  int sessionSubscription;
  int streamSubscription;

  mutable mutex dataMutex;
  deque<SystemMetrics> history;
  deque<ErrorRecord> errorLog;
  int64_t errorsTotal;
  deque<int64_t> creationTimes;

  mutex cpuMutex;
  int64_t lastCpuMicros;
  int64_t lastWallMicros;
  double lastCpuUsage;

  EventChannel<MetricsEvent> eventChannel;

  mutex samplingMutex;
  condition_variable samplingCv;
  bool halt;
  shared_ptr<thread> samplingThread;
};
}  // namespace th

#endif  // __TH_METRICS_COLLECTOR__
