#include "SocketHandler.hpp"

namespace th {
namespace {
int64_t steadyNowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}
}  // namespace

void SocketHandler::readAll(int fd, void* buf, size_t count, bool timeout) {
  int64_t lastProgress = steadyNowMs();
  size_t pos = 0;
  while (pos < count) {
    if (!waitOnSocketData(fd)) {
      if (timeout && steadyNowMs() > lastProgress + transferTimeoutMs) {
        throw std::runtime_error("Socket Timeout");
      }
      continue;
    }

    ssize_t bytesRead = read(fd, ((char*)buf) + pos, count - pos);
    if (bytesRead == 0) {
      // The peer hung up. Report it like a broken pipe so callers see one
      // failure mode for a vanished connection.
      errno = EPIPE;
      bytesRead = -1;
    }
    if (bytesRead < 0) {
      auto localErrno = errno;
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        VLOG(4) << "Got EAGAIN, waiting...";
        if (timeout && steadyNowMs() > lastProgress + transferTimeoutMs) {
          throw std::runtime_error("Socket Timeout");
        }
      } else {
        VLOG(1) << "Failed a call to readAll: " << strerror(localErrno);
        throw std::runtime_error("Failed a call to readAll");
      }
    } else {
      pos += bytesRead;
      lastProgress = steadyNowMs();
    }
  }
}

int SocketHandler::writeAllOrReturn(int fd, const void* buf, size_t count) {
  size_t pos = 0;
  int64_t lastProgress = steadyNowMs();
  while (pos < count) {
    if (steadyNowMs() > lastProgress + transferTimeoutMs) {
      return -1;
    }
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    auto localErrno = errno;
    if (bytesWritten < 0) {
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      } else {
        VLOG(1) << "Failed a call to writeAll: " << strerror(localErrno);
        return -1;
      }
    } else if (bytesWritten == 0) {
      return 0;
    } else {
      pos += bytesWritten;
      lastProgress = steadyNowMs();
    }
  }
  return count;
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    bool timeout) {
  int64_t lastProgress = steadyNowMs();
  size_t pos = 0;
  while (pos < count) {
    if (timeout && steadyNowMs() > lastProgress + transferTimeoutMs) {
      throw std::runtime_error("Socket Timeout");
    }
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    auto localErrno = errno;
    if (bytesWritten < 0) {
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      } else {
        LOG(WARNING) << "Failed a call to writeAll: " << strerror(localErrno);
        throw std::runtime_error("Failed a call to writeAll");
      }
    } else if (bytesWritten == 0) {
      throw std::runtime_error("Socket closed during writeAll");
    } else {
      pos += bytesWritten;
      lastProgress = steadyNowMs();
    }
  }
}
}  // namespace th
