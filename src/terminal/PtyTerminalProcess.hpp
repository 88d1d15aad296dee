#ifndef __TH_PTY_TERMINAL_PROCESS__
#define __TH_PTY_TERMINAL_PROCESS__

#include "TerminalProcess.hpp"

namespace th {
/**
 * @brief Runs a shell on a fresh pseudo-terminal created with forkpty().
 */
class PtyTerminalProcess : public TerminalProcess {
 public:
  explicit PtyTerminalProcess(const SpawnOptions& _options);
  virtual ~PtyTerminalProcess();

  virtual void start();
  virtual int getFd();
  virtual pid_t getPid() { return childPid; }
  /** @brief Applies the window size with ioctl(TIOCSWINSZ). */
  virtual void resize(const Dimensions& dimensions);
  /**
   * @brief Sends SIGHUP, waits briefly for the shell to leave, then SIGKILLs.
   */
  virtual void terminate();
  virtual optional<int> pollExit(bool block);

  static shared_ptr<TerminalProcess> create(const SpawnOptions& options) {
    return make_shared<PtyTerminalProcess>(options);
  }

 protected:
  /** @brief Builds the child's environment before forking. */
  vector<string> buildEnvironment() const;

  SpawnOptions options;
  recursive_mutex processMutex;
  int masterFd;
  pid_t childPid;
  optional<int> exitCode;
};
}  // namespace th

#endif  // __TH_PTY_TERMINAL_PROCESS__
