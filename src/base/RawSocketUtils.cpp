#include "RawSocketUtils.hpp"

namespace th {
void RawSocketUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      LOG(WARNING) << "Cannot write to fd " << fd << ": "
                   << strerror(localErrno);
      throw std::runtime_error("Cannot write to raw socket");
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to raw socket: socket closed");
    }
    bytesWritten += rc;
  }
}

ssize_t RawSocketUtils::readSome(int fd, char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for readSome");
  }
  ssize_t rc = ::read(fd, buf, count);
  if (rc < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
        localErrno == EINTR) {
      return 0;
    }
    // A pty master reports EIO once the slave side has no more writers
    VLOG(1) << "Read from fd " << fd << " failed: " << strerror(localErrno);
    throw std::runtime_error("Cannot read from raw socket");
  }
  if (rc == 0) {
    throw std::runtime_error("Socket has closed abruptly.");
  }
  return rc;
}
}  // namespace th
