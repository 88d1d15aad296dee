#ifndef __TH_RAW_SOCKET_UTILS__
#define __TH_RAW_SOCKET_UTILS__

#include "Headers.hpp"

namespace th {
/**
 * @brief Blocking read/write loops for descriptors that are not tracked by a
 * SocketHandler (PTY masters, the local tty).
 */
class RawSocketUtils {
 public:
  /**
   * @brief Writes the entire buffer, retrying on EAGAIN and EINTR.
   * @throws std::runtime_error when the descriptor is closed or broken.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Reads whatever is available (at most @p count bytes).
   * @return Bytes read, 0 when nothing was ready.
   * @throws std::runtime_error on EOF or EIO (the other side went away).
   */
  static ssize_t readSome(int fd, char* buf, size_t count);
};
}  // namespace th
#endif  // __TH_RAW_SOCKET_UTILS__
