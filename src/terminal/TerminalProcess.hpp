#ifndef __TH_TERMINAL_PROCESS__
#define __TH_TERMINAL_PROCESS__

#include "Headers.hpp"
#include "SessionTypes.hpp"

namespace th {
struct SpawnOptions {
  string shell;
  string workingDirectory;
  /** @brief Overrides applied on top of the daemon's environment. */
  map<string, string> environment;
  Dimensions dimensions;
};

/**
 * @brief A child program attached to a terminal that can be polled through a
 * descriptor.
 */
class TerminalProcess {
 public:
  virtual ~TerminalProcess() {}

  /**
   * @brief Spawns the program.
   * @throws std::runtime_error if the process could not be created.
   */
  virtual void start() = 0;
  /** @brief Descriptor carrying the program's output and accepting input. */
  virtual int getFd() = 0;
  virtual pid_t getPid() = 0;
  virtual void resize(const Dimensions& dimensions) = 0;
  /** @brief Ends the program and releases the descriptor. Idempotent. */
  virtual void terminate() = 0;
  /**
   * @brief Reaps the program if it has exited.
   * @param block Wait for the exit instead of polling.
   * @return The exit code (128 + signal for a killed program), or nullopt if
   * it is still running.
   */
  virtual optional<int> pollExit(bool block) = 0;
};

typedef std::function<shared_ptr<TerminalProcess>(const SpawnOptions&)>
    TerminalProcessFactory;
}  // namespace th

#endif  // __TH_TERMINAL_PROCESS__
