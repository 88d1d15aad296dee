#include "CircuitBreaker.hpp"

namespace th {
const char* circuitStateName(CircuitState state) {
  switch (state) {
    case CircuitState::CLOSED:
      return "CLOSED";
    case CircuitState::OPEN:
      return "OPEN";
    case CircuitState::HALF_OPEN:
      return "HALF_OPEN";
  }
  return "UNKNOWN";
}

CircuitBreaker::CircuitBreaker(const CircuitBreakerPolicy& _policy)
    : policy(_policy),
      state(CircuitState::CLOSED),
      trialInFlight(false),
      attempts(0) {
  if (policy.failureThreshold <= 0) {
    throw std::invalid_argument("failureThreshold must be positive");
  }
}

bool CircuitBreaker::canAttempt() {
  lock_guard<std::mutex> guard(breakerMutex);
  auto now = Clock::now();
  switch (state) {
    case CircuitState::CLOSED:
      return true;
    case CircuitState::OPEN:
      if (now < nextRetryTime) {
        return false;
      }
      LOG(INFO) << "Circuit recovery timeout elapsed, allowing one trial attempt";
      state = CircuitState::HALF_OPEN;
      trialInFlight = true;
      return true;
    case CircuitState::HALF_OPEN:
      if (trialInFlight) {
        return false;
      }
      trialInFlight = true;
      return true;
  }
  return false;
}

void CircuitBreaker::recordAttempt() {
  lock_guard<std::mutex> guard(breakerMutex);
  attempts++;
  VLOG(2) << "Circuit attempt " << attempts << " of " << policy.maxAttempts;
}

void CircuitBreaker::recordSuccess() {
  lock_guard<std::mutex> guard(breakerMutex);
  if (state != CircuitState::CLOSED) {
    LOG(INFO) << "Circuit closed after successful attempt";
  }
  state = CircuitState::CLOSED;
  failureTimes.clear();
  trialInFlight = false;
  attempts = 0;
}

void CircuitBreaker::recordFailure() {
  lock_guard<std::mutex> guard(breakerMutex);
  auto now = Clock::now();
  lastFailureTime = now;
  failureTimes.push_back(now);
  pruneFailures(now);

  if (state == CircuitState::HALF_OPEN ||
      int(failureTimes.size()) >= policy.failureThreshold) {
    if (state != CircuitState::OPEN) {
      LOG(WARNING) << "Circuit opened after " << failureTimes.size()
                   << " failures";
    }
    state = CircuitState::OPEN;
    nextRetryTime = now + policy.recoveryTimeout;
  }
  trialInFlight = false;
}

std::chrono::milliseconds CircuitBreaker::getBackoffDelay(int attempt) const {
  if (attempt < 1) {
    attempt = 1;
  }
  // Clamp the shift so large attempt numbers cannot overflow
  int shift = std::min(attempt - 1, 30);
  auto delay = policy.backoffBase * (int64_t(1) << shift);
  return std::min<std::chrono::milliseconds>(delay, policy.backoffMax);
}

bool CircuitBreaker::attemptsExhausted() const {
  lock_guard<std::mutex> guard(breakerMutex);
  return attempts >= policy.maxAttempts;
}

void CircuitBreaker::reset() {
  lock_guard<std::mutex> guard(breakerMutex);
  state = CircuitState::CLOSED;
  failureTimes.clear();
  trialInFlight = false;
  attempts = 0;
}

CircuitState CircuitBreaker::getState() const {
  lock_guard<std::mutex> guard(breakerMutex);
  return state;
}

int CircuitBreaker::getFailureCount() const {
  lock_guard<std::mutex> guard(breakerMutex);
  return int(failureTimes.size());
}

int CircuitBreaker::getAttemptCount() const {
  lock_guard<std::mutex> guard(breakerMutex);
  return attempts;
}

json CircuitBreaker::toJson() const {
  lock_guard<std::mutex> guard(breakerMutex);
  json j;
  j["state"] = circuitStateName(state);
  j["failureCount"] = failureTimes.size();
  j["attempts"] = attempts;
  if (state == CircuitState::OPEN) {
    j["retryInMs"] = std::max<int64_t>(
        0, std::chrono::duration_cast<std::chrono::milliseconds>(
               nextRetryTime - Clock::now())
               .count());
  }
  return j;
}

void CircuitBreaker::pruneFailures(Clock::time_point now) {
  while (!failureTimes.empty() &&
         now - failureTimes.front() > policy.failureWindow) {
    failureTimes.pop_front();
  }
}
}  // namespace th
