#include "UnixSocketHandler.hpp"

namespace th {
UnixSocketHandler::UnixSocketHandler() {}

bool UnixSocketHandler::waitForData(int fd, int64_t sec, int64_t usec) {
  fd_set input;
  FD_ZERO(&input);
  FD_SET(fd, &input);
  struct timeval timeout;
  timeout.tv_sec = sec;
  timeout.tv_usec = usec;
  int n = select(fd + 1, &input, NULL, NULL, &timeout);
  if (n <= 0) {
    VLOG(4) << "socket select timeout";
    return false;
  }
  if (!FD_ISSET(fd, &input)) {
    STFATAL << "FD_ISSET is false but we should have data by now.";
  }
  VLOG(4) << "socket " << fd << " has data";
  return true;
}

bool UnixSocketHandler::hasData(int fd) { return waitForData(fd, 0, 0); }

ssize_t UnixSocketHandler::read(int fd, void* buf, size_t count) {
  if (fd <= 0) {
    STFATAL << "Tried to read from an invalid socket: " << fd;
  }
  shared_ptr<recursive_mutex> socketMutex;
  {
    lock_guard<std::recursive_mutex> guard(globalMutex);
    auto it = activeSocketMutexes.find(fd);
    if (it == activeSocketMutexes.end()) {
      VLOG(1) << "Tried to read from a socket that has been closed: " << fd;
      errno = EPIPE;
      return -1;
    }
    socketMutex = it->second;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  ssize_t readBytes = ::read(fd, buf, count);
  auto localErrno = errno;
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading: " << localErrno << " "
                 << strerror(localErrno);
  }
  errno = localErrno;
  return readBytes;
}

ssize_t UnixSocketHandler::write(int fd, const void* buf, size_t count) {
  VLOG(4) << "Unixsocket handler write to fd: " << fd;
  if (fd <= 0) {
    STFATAL << "Tried to write to an invalid socket: " << fd;
  }
  shared_ptr<recursive_mutex> socketMutex;
  {
    lock_guard<std::recursive_mutex> guard(globalMutex);
    auto it = activeSocketMutexes.find(fd);
    if (it == activeSocketMutexes.end()) {
      VLOG(1) << "Tried to write to a socket that has been closed: " << fd;
      errno = EPIPE;
      return -1;
    }
    socketMutex = it->second;
  }
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(transferTimeoutMs.load());
  size_t bytesWritten = 0;
  lock_guard<recursive_mutex> guard(*socketMutex);
  while (bytesWritten < count) {
    ssize_t w = ::send(fd, ((const char*)buf) + bytesWritten,
                       count - bytesWritten, MSG_NOSIGNAL);
    if (w < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        if (std::chrono::steady_clock::now() > deadline) {
          return -1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      } else {
        return -1;
      }
    } else {
      bytesWritten += w;
    }
  }
  return count;
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  if (activeSocketMutexes.find(fd) != activeSocketMutexes.end()) {
    STFATAL << "Tried to insert an fd that already exists: " << fd;
  }
  activeSocketMutexes.insert(make_pair(fd, make_shared<recursive_mutex>()));
}

void UnixSocketHandler::adoptSocket(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  addToActiveSockets(fd);
  initSocket(fd);
}

int UnixSocketHandler::accept(int sockFd) {
  sockaddr_un client;
  socklen_t c = sizeof(sockaddr_un);
  int clientSock = ::accept(sockFd, (sockaddr*)&client, &c);
  auto acceptErrno = errno;
  while (clientSock >= 0) {
    {
      lock_guard<std::recursive_mutex> guard(globalMutex);
      if (activeSocketMutexes.find(clientSock) == activeSocketMutexes.end()) {
        break;
      }
    }
    // The kernel recycled an fd we are still closing
    LOG_EVERY_N(100, INFO) << "Waiting for read/write to time out...";
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  lock_guard<std::recursive_mutex> guard(globalMutex);
  VLOG(3) << "Socket " << sockFd << " accepted client " << clientSock;
  if (clientSock >= 0) {
    addToActiveSockets(clientSock);
    initSocket(clientSock);
    return clientSock;
  } else if (acceptErrno != EAGAIN && acceptErrno != EWOULDBLOCK) {
    FATAL_FAIL(-1);  // STFATAL with the error
  }

  errno = acceptErrno;
  return -1;
}

void UnixSocketHandler::close(int fd) {
  lock_guard<std::recursive_mutex> globalGuard(globalMutex);
  if (fd == -1) {
    return;
  }
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    STERROR << "Tried to close a connection that doesn't exist: " << fd;
    return;
  }
  auto m = it->second;
  lock_guard<std::recursive_mutex> guard(*m);
  VLOG(1) << "Closing connection: " << fd;
  ::shutdown(fd, SHUT_RDWR);
  FATAL_FAIL(::close(fd));
  activeSocketMutexes.erase(it);
}

vector<int> UnixSocketHandler::getActiveSockets() {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  vector<int> fds;
  for (const auto& it : activeSocketMutexes) {
    fds.push_back(it.first);
  }
  return fds;
}

void UnixSocketHandler::initSocket(int fd) {
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL_UNLESS_EINVAL(opts);
  opts |= O_NONBLOCK;
  FATAL_FAIL_UNLESS_EINVAL(fcntl(fd, F_SETFL, opts));
}

void UnixSocketHandler::initServerSocket(int fd) { initSocket(fd); }
}  // namespace th
