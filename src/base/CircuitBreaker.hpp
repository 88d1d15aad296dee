#ifndef __TH_CIRCUIT_BREAKER__
#define __TH_CIRCUIT_BREAKER__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace th {
enum class CircuitState { CLOSED, OPEN, HALF_OPEN };

const char* circuitStateName(CircuitState state);

struct CircuitBreakerPolicy {
  /** @brief Failures inside the window that open the circuit. */
  int failureThreshold = 2;
  std::chrono::milliseconds failureWindow = std::chrono::seconds(10);
  std::chrono::milliseconds recoveryTimeout = std::chrono::seconds(30);
  /** @brief Total reconnection attempts allowed per cycle. */
  int maxAttempts = 3;
  std::chrono::milliseconds backoffBase = std::chrono::seconds(1);
  std::chrono::milliseconds backoffMax = std::chrono::seconds(5);
};

/**
 * @brief Gates reconnection attempts on one multiplexed transport.
 *
 * Failures are counted inside a sliding window. Reaching the threshold opens
 * the circuit until the recovery timeout elapses; after that exactly one
 * trial attempt is let through (HALF_OPEN). The trial's outcome closes or reopens
 * the circuit.
 */
class CircuitBreaker {
 public:
  explicit CircuitBreaker(const CircuitBreakerPolicy& _policy =
                              CircuitBreakerPolicy());

  /**
   * @brief Returns whether a connection attempt may be made right now.
   *
   * Calling this while OPEN and past the recovery deadline moves the circuit
   * to HALF_OPEN and grants the single trial attempt; later calls return false until
   * the trial is resolved with recordSuccess() or recordFailure().
   */
  bool canAttempt();
  void recordAttempt();
  /** @brief Clears failures and closes the circuit. */
  void recordSuccess();
  void recordFailure();

  /**
   * @brief Delay before attempt number @p attempt (1-based):
   * min(base * 2^(attempt-1), max).
   */
  std::chrono::milliseconds getBackoffDelay(int attempt) const;
  /** @brief True once recordAttempt() has been called maxAttempts times since
   * the last success or reset. */
  bool attemptsExhausted() const;

  void reset();

  CircuitState getState() const;
  int getFailureCount() const;
  int getAttemptCount() const;
  const CircuitBreakerPolicy& getPolicy() const { return policy; }

  json toJson() const;

 protected:
  typedef std::chrono::steady_clock Clock;

  void pruneFailures(Clock::time_point now);

  const CircuitBreakerPolicy policy;
  mutable std::mutex breakerMutex;
  CircuitState state;
  deque<Clock::time_point> failureTimes;
  Clock::time_point lastFailureTime;
  Clock::time_point nextRetryTime;
  bool trialInFlight;
  int attempts;
};
}  // namespace th

#endif  // __TH_CIRCUIT_BREAKER__
