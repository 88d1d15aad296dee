#ifndef __TH_ERRORS__
#define __TH_ERRORS__

#include "Headers.hpp"

namespace th {
enum class ErrorCode {
  LIMIT_EXCEEDED = 1,
  NOT_FOUND = 2,
  CONNECT_TIMEOUT = 3,
  RECONNECT_EXHAUSTED = 4,
  PROCESS_EXIT = 5,
  CIRCUIT_OPEN = 6,
  PROTOCOL = 7,
  INVALID_STATE = 8,
};

inline const char *errorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::LIMIT_EXCEEDED:
      return "LimitExceeded";
    case ErrorCode::NOT_FOUND:
      return "NotFound";
    case ErrorCode::CONNECT_TIMEOUT:
      return "ConnectTimeout";
    case ErrorCode::RECONNECT_EXHAUSTED:
      return "ReconnectExhausted";
    case ErrorCode::PROCESS_EXIT:
      return "ProcessExit";
    case ErrorCode::CIRCUIT_OPEN:
      return "CircuitOpen";
    case ErrorCode::PROTOCOL:
      return "Protocol";
    case ErrorCode::INVALID_STATE:
      return "InvalidState";
  }
  return "Unknown";
}

/**
 * @brief Domain failure raised by the session and stream managers.
 */
class TermhubError : public std::runtime_error {
 public:
  TermhubError(ErrorCode _code, const string &message)
      : std::runtime_error(message), code(_code) {}

  ErrorCode getCode() const { return code; }
  const char *getCodeName() const { return errorCodeName(code); }

 protected:
  ErrorCode code;
};
}  // namespace th

#endif  // __TH_ERRORS__
