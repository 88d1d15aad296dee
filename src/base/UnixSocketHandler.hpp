#ifndef __TH_UNIX_SOCKET_HANDLER__
#define __TH_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace th {
/**
 * @brief SocketHandler over POSIX descriptors. Every tracked fd gets its own
 * mutex so a read and a write on the same socket never interleave.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  /**
   * @brief Blocks with select() until the fd becomes readable.
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  virtual bool hasData(int fd);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int accept(int fd);
  /** @brief Closes the descriptor and stops tracking it. */
  virtual void close(int fd);
  virtual vector<int> getActiveSockets();

  /**
   * @brief Starts tracking a descriptor that was created outside this
   * handler (for example one end of a socketpair).
   */
  void adoptSocket(int fd);

 protected:
  void addToActiveSockets(int fd);
  /**
   * @brief Makes the descriptor non-blocking.
   */
  virtual void initSocket(int fd);
  virtual void initServerSocket(int fd);

  /** @brief Mutex per active socket to ensure serial read/write. */
  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  recursive_mutex globalMutex;
};
}  // namespace th

#endif  // __TH_UNIX_SOCKET_HANDLER__
