#ifndef __TH_FAKE_TERMINAL_PROCESS__
#define __TH_FAKE_TERMINAL_PROCESS__

#include "RawSocketUtils.hpp"
#include "TerminalProcess.hpp"

namespace th {
/**
 * @brief TerminalProcess backed by a socketpair. The test plays the child
 * through the other end: it reads what the stream wrote and writes output.
 */
class FakeTerminalProcess : public TerminalProcess {
 public:
  explicit FakeTerminalProcess(const SpawnOptions& _options)
      : options(_options), streamFd(-1), childFd(-1), terminated(false) {}

  virtual ~FakeTerminalProcess() {
    if (streamFd >= 0) {
      ::close(streamFd);
    }
    if (childFd >= 0) {
      ::close(childFd);
    }
  }

  virtual void start() {
    int fds[2];
    FATAL_FAIL(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    streamFd = fds[0];
    childFd = fds[1];
  }

  virtual int getFd() {
    lock_guard<mutex> guard(fakeMutex);
    return streamFd;
  }
  virtual pid_t getPid() { return 4242; }

  virtual void resize(const Dimensions& dimensions) {
    lock_guard<mutex> guard(fakeMutex);
    resizes.push_back(dimensions);
  }

  /** @brief Hangs up like a pty: the stream's end of the pair is closed. */
  virtual void terminate() {
    lock_guard<mutex> guard(fakeMutex);
    terminated = true;
    if (!exitCode) {
      exitCode = 128 + SIGHUP;
    }
    if (streamFd >= 0) {
      ::close(streamFd);
      streamFd = -1;
    }
  }

  virtual optional<int> pollExit(bool) {
    lock_guard<mutex> guard(fakeMutex);
    return exitCode;
  }

  /** @brief Output as if the child printed it. */
  void emitOutput(const string& s) {
    RawSocketUtils::writeAll(childFd, s.data(), s.size());
  }

  /** @brief Everything the stream wrote, waiting up to @p timeoutMs for
   * @p expected bytes. */
  string readInput(size_t expected, int timeoutMs = 2000) {
    string retval;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeoutMs);
    char buf[4096];
    while (retval.size() < expected &&
           std::chrono::steady_clock::now() < deadline) {
      fd_set rfds;
      FD_ZERO(&rfds);
      FD_SET(childFd, &rfds);
      timeval tv;
      tv.tv_sec = 0;
      tv.tv_usec = 10000;
      if (select(childFd + 1, &rfds, NULL, NULL, &tv) <= 0) {
        continue;
      }
      ssize_t rc = ::read(childFd, buf, sizeof(buf));
      if (rc <= 0) {
        break;
      }
      retval.append(buf, rc);
    }
    return retval;
  }

  /** @brief The child exits: its end of the terminal goes away. */
  void exit(int code) {
    {
      lock_guard<mutex> guard(fakeMutex);
      exitCode = code;
    }
    ::shutdown(childFd, SHUT_RDWR);
  }

  vector<Dimensions> getResizes() {
    lock_guard<mutex> guard(fakeMutex);
    return resizes;
  }

  bool wasTerminated() {
    lock_guard<mutex> guard(fakeMutex);
    return terminated;
  }

  SpawnOptions options;

 protected:
  mutex fakeMutex;
  int streamFd;
  int childFd;
  bool terminated;
  optional<int> exitCode;
  vector<Dimensions> resizes;
};

/**
 * @brief Process factory that remembers every fake it handed out.
 */
class FakeProcessFactory {
 public:
  FakeProcessFactory() : failSpawns(false) {}

  TerminalProcessFactory factory() {
    return [this](const SpawnOptions& options) -> shared_ptr<TerminalProcess> {
      if (failSpawns) {
        throw std::runtime_error("spawn refused");
      }
      auto process = make_shared<FakeTerminalProcess>(options);
      lock_guard<mutex> guard(factoryMutex);
      processes.push_back(process);
      return process;
    };
  }

  shared_ptr<FakeTerminalProcess> last() {
    lock_guard<mutex> guard(factoryMutex);
    return processes.empty() ? nullptr : processes.back();
  }

  size_t count() {
    lock_guard<mutex> guard(factoryMutex);
    return processes.size();
  }

  atomic<bool> failSpawns;

 protected:
  mutex factoryMutex;
  vector<shared_ptr<FakeTerminalProcess>> processes;
};

/** @brief Polls @p condition every 10ms until it holds or the timeout ends. */
inline bool waitFor(std::function<bool()> condition, int timeoutMs = 3000) {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(timeoutMs);
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}
}  // namespace th

#endif  // __TH_FAKE_TERMINAL_PROCESS__
