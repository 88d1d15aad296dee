#include "CircuitBreaker.hpp"

#include "TestHeaders.hpp"

using namespace th;

namespace {
CircuitBreakerPolicy fastPolicy() {
  CircuitBreakerPolicy policy;
  policy.failureThreshold = 2;
  policy.failureWindow = std::chrono::milliseconds(500);
  policy.recoveryTimeout = std::chrono::milliseconds(100);
  policy.maxAttempts = 3;
  policy.backoffBase = std::chrono::milliseconds(1000);
  policy.backoffMax = std::chrono::milliseconds(5000);
  return policy;
}
}  // namespace

TEST_CASE("CircuitBreaker opens at the failure threshold", "[CircuitBreaker]") {
  CircuitBreaker breaker(fastPolicy());
  REQUIRE(breaker.getState() == CircuitState::CLOSED);
  REQUIRE(breaker.canAttempt());

  breaker.recordFailure();
  REQUIRE(breaker.getState() == CircuitState::CLOSED);
  REQUIRE(breaker.canAttempt());

  breaker.recordFailure();
  REQUIRE(breaker.getState() == CircuitState::OPEN);
  REQUIRE(!breaker.canAttempt());
  REQUIRE(breaker.toJson()["state"] == "OPEN");
}

TEST_CASE("CircuitBreaker allows exactly one trial attempt after recovery",
          "[CircuitBreaker]") {
  CircuitBreaker breaker(fastPolicy());
  breaker.recordFailure();
  breaker.recordFailure();
  REQUIRE(!breaker.canAttempt());

  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  REQUIRE(breaker.canAttempt());
  REQUIRE(breaker.getState() == CircuitState::HALF_OPEN);
  REQUIRE(!breaker.canAttempt());

  SECTION("Probe succeeds") {
    breaker.recordSuccess();
    REQUIRE(breaker.getState() == CircuitState::CLOSED);
    REQUIRE(breaker.getFailureCount() == 0);
    REQUIRE(breaker.canAttempt());
  }

  SECTION("Probe fails") {
    breaker.recordFailure();
    REQUIRE(breaker.getState() == CircuitState::OPEN);
    REQUIRE(!breaker.canAttempt());
  }
}

TEST_CASE("CircuitBreaker forgets failures outside the window",
          "[CircuitBreaker]") {
  CircuitBreakerPolicy policy = fastPolicy();
  policy.failureWindow = std::chrono::milliseconds(50);
  CircuitBreaker breaker(policy);

  breaker.recordFailure();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  breaker.recordFailure();
  REQUIRE(breaker.getState() == CircuitState::CLOSED);
  REQUIRE(breaker.getFailureCount() == 1);
}

TEST_CASE("CircuitBreaker backoff and attempt cap", "[CircuitBreaker]") {
  CircuitBreaker breaker(fastPolicy());
  REQUIRE(breaker.getBackoffDelay(1) == std::chrono::milliseconds(1000));
  REQUIRE(breaker.getBackoffDelay(2) == std::chrono::milliseconds(2000));
  REQUIRE(breaker.getBackoffDelay(3) == std::chrono::milliseconds(4000));
  REQUIRE(breaker.getBackoffDelay(4) == std::chrono::milliseconds(5000));
  REQUIRE(breaker.getBackoffDelay(60) == std::chrono::milliseconds(5000));

  for (int i = 0; i < 3; i++) {
    REQUIRE(!breaker.attemptsExhausted());
    breaker.recordAttempt();
  }
  REQUIRE(breaker.attemptsExhausted());
  REQUIRE(breaker.getAttemptCount() == 3);

  breaker.recordSuccess();
  REQUIRE(!breaker.attemptsExhausted());

  breaker.recordAttempt();
  breaker.reset();
  REQUIRE(breaker.getAttemptCount() == 0);
}

TEST_CASE("CircuitBreaker rejects a non-positive threshold",
          "[CircuitBreaker]") {
  CircuitBreakerPolicy policy;
  policy.failureThreshold = 0;
  REQUIRE_THROWS_AS(CircuitBreaker(policy), std::invalid_argument);
}
