#include "MetricsCollector.hpp"

namespace th {
namespace {
const size_t MAX_ERROR_LOG = 1000;
const size_t ERROR_LOG_KEEP = 500;
const int64_t RATE_WINDOW_MS = 60 * 1000;
const int64_t CREATION_RETENTION_MS = 5 * 60 * 1000;
const int MANY_SESSIONS = 50;
const int ELEVATED_ERROR_RATE = 5;
const double ELEVATED_LATENCY_MS = 50;

int64_t microsOf(const timeval& tv) {
  return int64_t(tv.tv_sec) * 1000 * 1000 + tv.tv_usec;
}

int64_t steadyMicros() {
  return std::chrono::duration_cast<std::chrono::microseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

int64_t processCpuMicros() {
  rusage usage;
  FATAL_FAIL(getrusage(RUSAGE_SELF, &usage));
  return microsOf(usage.ru_utime) + microsOf(usage.ru_stime);
}

string fixed(double value, int digits) {
  char buf[64];
  snprintf(buf, sizeof(buf), "%.*f", digits, value);
  return buf;
}

/** Prints integral values without a fraction, like a JSON number. */
string formatNumber(double value) {
  if (std::isfinite(value) && value == std::floor(value) &&
      std::fabs(value) < 1e15) {
    return to_string(int64_t(value));
  }
  std::ostringstream ss;
  ss << std::setprecision(15) << value;
  return ss.str();
}

/** Reads a "Key:   1234 kB" line from /proc/self/status, in bytes. */
int64_t readStatusField(const string& key) {
  std::ifstream statusFile("/proc/self/status");
  if (!statusFile.is_open()) {
    return 0;
  }
  string line;
  while (std::getline(statusFile, line)) {
    if (line.compare(0, key.size(), key) != 0) {
      continue;
    }
    std::istringstream iss(line);
    string label;
    int64_t size;
    string unit;
    if (iss >> label >> size >> unit && unit == "kB") {
      return size * 1024;
    }
    break;
  }
  return 0;
}
}  // namespace

const char* checkStatusName(CheckStatus status) {
  switch (status) {
    case CheckStatus::PASS:
      return "pass";
    case CheckStatus::WARN:
      return "warn";
    case CheckStatus::FAIL:
      return "fail";
  }
  return "unknown";
}

const char* metricsEventName(MetricsEventType type) {
  switch (type) {
    case MetricsEventType::COLLECTED:
      return "metrics:collected";
    case MetricsEventType::HEALTH_CHECKED:
      return "health:checked";
    case MetricsEventType::UNHEALTHY:
      return "health:unhealthy";
    case MetricsEventType::ERROR_RECORDED:
      return "error:recorded";
  }
  return "metrics:unknown";
}

json toJson(const SystemMetrics& metrics) {
  json j;
  j["timestamp"] = metrics.timestamp;
  j["cpu"] = json{{"usage", metrics.cpu.usage},
                  {"loadAverage", metrics.cpu.loadAverage},
                  {"cores", metrics.cpu.cores}};
  j["memory"] = json{{"heapUsed", metrics.memory.heapUsed},
                     {"heapTotal", metrics.memory.heapTotal},
                     {"rss", metrics.memory.rss}};
  j["sessions"] = json{{"total", metrics.sessions.total},
                       {"active", metrics.sessions.active},
                       {"suspended", metrics.sessions.suspended},
                       {"error", metrics.sessions.error},
                       {"byProject", metrics.sessions.byProject},
                       {"averageLifetime", metrics.sessions.averageLifetime},
                       {"creationRate", metrics.sessions.creationRate}};
  j["streams"] = json{{"total", metrics.streams.total},
                      {"connected", metrics.streams.connected},
                      {"disconnected", metrics.streams.disconnected},
                      {"totalBytesIn", metrics.streams.totalBytesIn},
                      {"totalBytesOut", metrics.streams.totalBytesOut},
                      {"averageLatency", metrics.streams.averageLatency}};
  json errors{{"total", metrics.errors.total},
              {"byType", metrics.errors.byType},
              {"rate", metrics.errors.rate}};
  if (metrics.errors.lastError) {
    errors["lastError"] = json{{"timestamp", metrics.errors.lastError->timestamp},
                               {"type", metrics.errors.lastError->type},
                               {"message", metrics.errors.lastError->message}};
  }
  j["errors"] = errors;
  return j;
}

json toJson(const HealthStatus& health) {
  json checks = json::array();
  for (const auto& check : health.checks) {
    json c{{"name", check.name},
           {"status", checkStatusName(check.status)},
           {"value", check.value}};
    if (!check.threshold.empty()) {
      c["threshold"] = check.threshold;
    }
    checks.push_back(c);
  }
  return json{{"healthy", health.healthy},
              {"checks", checks},
              {"timestamp", health.timestamp}};
}

json toJson(const PerformanceReport& report) {
  return json{{"summary", report.summary},
              {"recommendations", report.recommendations},
              {"metrics", report.metrics}};
}

MetricsCollector::MetricsCollector(const OrchestratorConfig& _config,
                                   SessionManager* _sessionManager,
                                   StreamManager* _streamManager)
    : config(_config),
      sessionManager(_sessionManager),
      streamManager(_streamManager),
      errorsTotal(0),
      lastCpuMicros(processCpuMicros()),
      lastWallMicros(steadyMicros()),
      lastCpuUsage(0),
      halt(false) {
  sessionSubscription =
      sessionManager->events().subscribe([this](const SessionEvent& event) {
        if (event.type == SessionEventType::CREATED) {
          int64_t now = nowEpochMs();
          lock_guard<mutex> guard(dataMutex);
          creationTimes.push_back(now);
          while (!creationTimes.empty() &&
                 creationTimes.front() <= now - CREATION_RETENTION_MS) {
            creationTimes.pop_front();
          }
        } else if (event.type == SessionEventType::ERROR) {
          recordError("session", event.message.empty()
                                     ? "Unknown session error"
                                     : event.message);
        }
      });
  streamSubscription =
      streamManager->events().subscribe([this](const StreamEvent& event) {
        if (event.type == StreamEventType::ERROR) {
          recordError("stream", event.message.empty() ? "Unknown stream error"
                                                      : event.message);
        } else if (event.type == StreamEventType::RECONNECT_FAILED) {
          recordError("reconnect",
                      "Failed to reconnect stream " + event.sessionId);
        }
      });
}

MetricsCollector::~MetricsCollector() {
  shutdown();
  sessionManager->events().unsubscribe(sessionSubscription);
  streamManager->events().unsubscribe(streamSubscription);
}

SystemMetrics MetricsCollector::getCurrentMetrics() {
  SystemMetrics metrics;
  metrics.timestamp = nowEpochMs();
  metrics.cpu = sampleCpu();
  metrics.memory = sampleMemory();
  metrics.sessions = sampleSessions();
  metrics.streams = sampleStreams();
  metrics.errors = sampleErrors();
  return metrics;
}

vector<SystemMetrics> MetricsCollector::getMetricsHistory(
    optional<std::chrono::milliseconds> duration) const {
  lock_guard<mutex> guard(dataMutex);
  if (!duration) {
    return vector<SystemMetrics>(history.begin(), history.end());
  }
  int64_t cutoff = nowEpochMs() - duration->count();
  vector<SystemMetrics> retval;
  for (const auto& sample : history) {
    if (sample.timestamp > cutoff) {
      retval.push_back(sample);
    }
  }
  return retval;
}

HealthStatus MetricsCollector::getHealthStatus() {
  return gradeHealth(getCurrentMetrics());
}

HealthStatus MetricsCollector::gradeHealth(const SystemMetrics& metrics) const {
  const HealthThresholds& limits = config.thresholds;
  HealthStatus health;
  health.timestamp = nowEpochMs();

  HealthCheck cpu;
  cpu.name = "CPU Usage";
  cpu.status =
      metrics.cpu.usage > limits.cpuPercent ? CheckStatus::WARN : CheckStatus::PASS;
  cpu.value = fixed(metrics.cpu.usage, 1) + "%";
  cpu.threshold = formatNumber(limits.cpuPercent) + "%";
  health.checks.push_back(cpu);

  double memoryMb = double(metrics.memory.rss) / 1024 / 1024;
  HealthCheck memory;
  memory.name = "Memory Usage";
  memory.status =
      memoryMb > limits.memoryMb ? CheckStatus::WARN : CheckStatus::PASS;
  memory.value = fixed(memoryMb, 0) + "MB";
  memory.threshold = formatNumber(limits.memoryMb) + "MB";
  health.checks.push_back(memory);

  HealthCheck sessions;
  sessions.name = "Active Sessions";
  sessions.status = metrics.sessions.active > limits.activeSessions
                        ? CheckStatus::WARN
                        : CheckStatus::PASS;
  sessions.value = to_string(metrics.sessions.active);
  sessions.threshold = to_string(limits.activeSessions);
  health.checks.push_back(sessions);

  double disconnectedRatio = double(metrics.streams.disconnected) /
                             std::max(1, metrics.streams.total);
  HealthCheck streams;
  streams.name = "Stream Connectivity";
  if (disconnectedRatio > limits.disconnectedRatioFail) {
    streams.status = CheckStatus::FAIL;
  } else if (disconnectedRatio > limits.disconnectedRatioWarn) {
    streams.status = CheckStatus::WARN;
  }
  streams.value = fixed(100 - disconnectedRatio * 100, 0) + "% connected";
  health.checks.push_back(streams);

  HealthCheck errors;
  errors.name = "Error Rate";
  errors.status = metrics.errors.rate > limits.errorsPerMinute
                      ? CheckStatus::FAIL
                      : CheckStatus::PASS;
  errors.value = fixed(metrics.errors.rate, 1) + "/min";
  errors.threshold = formatNumber(limits.errorsPerMinute) + "/min";
  health.checks.push_back(errors);

  HealthCheck latency;
  latency.name = "Average Latency";
  latency.status = metrics.streams.averageLatency > limits.latencyMs
                       ? CheckStatus::WARN
                       : CheckStatus::PASS;
  latency.value = fixed(metrics.streams.averageLatency, 0) + "ms";
  latency.threshold = formatNumber(limits.latencyMs) + "ms";
  health.checks.push_back(latency);

  for (const auto& check : health.checks) {
    if (check.status == CheckStatus::FAIL) {
      health.healthy = false;
    }
  }
  return health;
}

PerformanceReport MetricsCollector::getPerformanceReport() {
  SystemMetrics metrics = getCurrentMetrics();
  HealthStatus health = gradeHealth(metrics);
  const HealthThresholds& limits = config.thresholds;

  PerformanceReport report;
  double memoryMb = double(metrics.memory.rss) / 1024 / 1024;
  if (memoryMb > limits.memoryMb) {
    report.recommendations.push_back(
        "High memory usage detected. Consider closing inactive sessions.");
  }
  if (metrics.cpu.usage > limits.cpuPercent) {
    report.recommendations.push_back(
        "High CPU usage. Review active processes and consider load "
        "distribution.");
  }
  if (metrics.sessions.active > MANY_SESSIONS) {
    report.recommendations.push_back(
        "Many active sessions. Monitor for performance degradation.");
  }
  if (metrics.errors.rate > ELEVATED_ERROR_RATE) {
    report.recommendations.push_back(
        "Elevated error rate. Check logs for recurring issues.");
  }
  if (metrics.streams.averageLatency > ELEVATED_LATENCY_MS) {
    report.recommendations.push_back(
        "High stream latency. Check network conditions.");
  }

  report.summary =
      health.healthy
          ? "System is healthy and performing within normal parameters."
          : "System has issues that require attention.";
  report.metrics = json{
      {"cpu", fixed(metrics.cpu.usage, 1) + "%"},
      {"memory", fixed(memoryMb, 0) + "MB"},
      {"sessions", metrics.sessions.active},
      {"streams", metrics.streams.connected},
      {"errors", metrics.errors.rate},
      {"latency", fixed(metrics.streams.averageLatency, 0) + "ms"},
  };
  return report;
}

string MetricsCollector::exportPrometheusMetrics() {
  SystemMetrics metrics = getCurrentMetrics();
  vector<string> lines;

  lines.push_back("# HELP terminal_cpu_usage CPU usage percentage");
  lines.push_back("# TYPE terminal_cpu_usage gauge");
  lines.push_back("terminal_cpu_usage " + formatNumber(metrics.cpu.usage));

  lines.push_back("# HELP terminal_memory_usage Memory usage in bytes");
  lines.push_back("# TYPE terminal_memory_usage gauge");
  lines.push_back("terminal_memory_usage{type=\"heap\"} " +
                  to_string(metrics.memory.heapUsed));
  lines.push_back("terminal_memory_usage{type=\"rss\"} " +
                  to_string(metrics.memory.rss));

  lines.push_back("# HELP terminal_sessions_total Total number of sessions");
  lines.push_back("# TYPE terminal_sessions_total gauge");
  lines.push_back("terminal_sessions_total " +
                  to_string(metrics.sessions.total));
  lines.push_back("terminal_sessions_active " +
                  to_string(metrics.sessions.active));

  lines.push_back("# HELP terminal_streams_total Total number of streams");
  lines.push_back("# TYPE terminal_streams_total gauge");
  lines.push_back("terminal_streams_total " + to_string(metrics.streams.total));
  lines.push_back("terminal_streams_connected " +
                  to_string(metrics.streams.connected));

  lines.push_back("# HELP terminal_errors_total Total number of errors");
  lines.push_back("# TYPE terminal_errors_total counter");
  lines.push_back("terminal_errors_total " + to_string(metrics.errors.total));

  lines.push_back("# HELP terminal_latency_ms Average latency in milliseconds");
  lines.push_back("# TYPE terminal_latency_ms gauge");
  lines.push_back("terminal_latency_ms " +
                  formatNumber(metrics.streams.averageLatency));

  string retval;
  for (size_t i = 0; i < lines.size(); i++) {
    if (i) {
      retval += "\n";
    }
    retval += lines[i];
  }
  return retval;
}

void MetricsCollector::recordError(const string& type, const string& message) {
  ErrorRecord record;
  record.timestamp = nowEpochMs();
  record.type = type;
  record.message = message;
  {
    lock_guard<mutex> guard(dataMutex);
    errorsTotal++;
    errorLog.push_back(record);
    if (errorLog.size() > MAX_ERROR_LOG) {
      errorLog.erase(errorLog.begin(), errorLog.end() - ERROR_LOG_KEEP);
    }
  }
  VLOG(1) << "Recorded " << type << " error: " << message;
  MetricsEvent event;
  event.type = MetricsEventType::ERROR_RECORDED;
  event.error = record;
  eventChannel.emit(event);
}

void MetricsCollector::collectNow() {
  SystemMetrics metrics = getCurrentMetrics();
  {
    lock_guard<mutex> guard(dataMutex);
    history.push_back(metrics);
    if (history.size() > config.metricsHistorySize) {
      size_t keep = std::max<size_t>(1, config.metricsHistorySize / 2);
      history.erase(history.begin(), history.end() - keep);
    }
  }
  MetricsEvent event;
  event.type = MetricsEventType::COLLECTED;
  event.metrics = metrics;
  eventChannel.emit(event);
}

HealthStatus MetricsCollector::checkHealthNow() {
  HealthStatus health = getHealthStatus();
  MetricsEvent event;
  event.health = health;
  if (!health.healthy) {
    LOG(WARNING) << "Health check failed: " << toJson(health).dump();
    event.type = MetricsEventType::UNHEALTHY;
    eventChannel.emit(event);
  }
  event.type = MetricsEventType::HEALTH_CHECKED;
  eventChannel.emit(event);
  return health;
}

CpuSample MetricsCollector::sampleCpu() {
  CpuSample sample;
  {
    lock_guard<mutex> guard(cpuMutex);
    int64_t cpuMicros = processCpuMicros();
    int64_t wallMicros = steadyMicros();
    int64_t wallDelta = wallMicros - lastWallMicros;
    // Two samples in the same millisecond would only produce noise.
    if (wallDelta >= 1000) {
      double usage = double(cpuMicros - lastCpuMicros) * 100.0 / wallDelta;
      lastCpuUsage = std::min(100.0, std::max(0.0, usage));
      lastCpuMicros = cpuMicros;
      lastWallMicros = wallMicros;
    }
    sample.usage = lastCpuUsage;
  }
  double loads[3];
  int n = getloadavg(loads, 3);
  for (int i = 0; i < n; i++) {
    sample.loadAverage.push_back(loads[i]);
  }
  long cores = sysconf(_SC_NPROCESSORS_ONLN);
  sample.cores = cores > 0 ? int(cores) : 1;
  return sample;
}

MemorySample MetricsCollector::sampleMemory() const {
  MemorySample sample;
  sample.rss = readStatusField("VmRSS:");
  sample.heapUsed = readStatusField("VmData:");
  sample.heapTotal = readStatusField("VmSize:");
  return sample;
}

SessionCounts MetricsCollector::sampleSessions() {
  SessionCounts counts;
  SessionStatistics stats = sessionManager->getStatistics();
  counts.total = stats.totalSessions;
  counts.active = stats.activeSessions;
  counts.suspended = stats.suspendedSessions;
  counts.byProject = sessionManager->projectSessionCounts();

  int64_t totalLifetime = 0;
  int closedCount = 0;
  for (const auto& session : sessionManager->snapshotSessions()) {
    if (session.status == SessionStatus::ERROR) {
      counts.error++;
    } else if (session.status == SessionStatus::CLOSED) {
      totalLifetime += session.updatedAt - session.createdAt;
      closedCount++;
    }
  }
  counts.averageLifetime =
      closedCount > 0 ? double(totalLifetime) / closedCount : 0;

  int64_t now = nowEpochMs();
  lock_guard<mutex> guard(dataMutex);
  for (auto t : creationTimes) {
    if (now - t < RATE_WINDOW_MS) {
      counts.creationRate++;
    }
  }
  return counts;
}

StreamCounts MetricsCollector::sampleStreams() const {
  StreamCounts counts;
  double totalLatency = 0;
  int latencyCount = 0;
  for (const auto& stream : streamManager->getStreamSnapshots()) {
    counts.total++;
    if (stream.status == StreamStatus::CONNECTED) {
      counts.connected++;
    }
    counts.totalBytesIn += stream.metrics.bytesIn;
    counts.totalBytesOut += stream.metrics.bytesOut;
    if (stream.metrics.latency > 0) {
      totalLatency += stream.metrics.latency;
      latencyCount++;
    }
  }
  counts.disconnected = counts.total - counts.connected;
  counts.averageLatency = latencyCount > 0 ? totalLatency / latencyCount : 0;
  return counts;
}

ErrorCounts MetricsCollector::sampleErrors() const {
  ErrorCounts counts;
  int64_t now = nowEpochMs();
  lock_guard<mutex> guard(dataMutex);
  counts.total = errorsTotal;
  for (const auto& record : errorLog) {
    counts.byType[record.type]++;
    if (now - record.timestamp < RATE_WINDOW_MS) {
      counts.rate++;
    }
  }
  if (!errorLog.empty()) {
    counts.lastError = errorLog.back();
  }
  return counts;
}

void MetricsCollector::start() {
  lock_guard<mutex> guard(samplingMutex);
  if (samplingThread) {
    return;
  }
  halt = false;
  samplingThread.reset(new thread(&MetricsCollector::samplingLoop, this));
}

void MetricsCollector::shutdown() {
  {
    lock_guard<mutex> guard(samplingMutex);
    halt = true;
  }
  samplingCv.notify_all();
  if (samplingThread) {
    samplingThread->join();
    samplingThread.reset();
  }
}

void MetricsCollector::samplingLoop() {
  el::Helpers::setThreadName("metrics-sampler");
  typedef std::chrono::steady_clock Clock;
  auto nextMetrics = Clock::now() + config.metricsInterval;
  auto nextHealth = Clock::now() + config.healthInterval;

  unique_lock<mutex> lock(samplingMutex);
  while (!halt) {
    samplingCv.wait_until(lock, std::min(nextMetrics, nextHealth));
    if (halt) {
      break;
    }
    lock.unlock();
    auto now = Clock::now();
    if (now >= nextMetrics) {
      try {
        collectNow();
      } catch (const std::exception& e) {
        LOG(WARNING) << "Metrics collection failed: " << e.what();
      }
      nextMetrics = now + config.metricsInterval;
    }
    if (now >= nextHealth) {
      try {
        checkHealthNow();
      } catch (const std::exception& e) {
        LOG(WARNING) << "Health check failed to run: " << e.what();
      }
      nextHealth = now + config.healthInterval;
    }
    lock.lock();
  }
}
}  // namespace th
