#include "PipeSocketHandler.hpp"

namespace th {
PipeSocketHandler::PipeSocketHandler(int64_t _connectTimeoutMs)
    : connectTimeoutMs(_connectTimeoutMs) {}

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> mutexGuard(globalMutex);

  string pipePath = endpoint.name();
  if (pipePath.size() >= sizeof(sockaddr_un::sun_path)) {
    throw std::runtime_error("Socket path too long: " + pipePath);
  }
  sockaddr_un remote;
  memset(&remote, 0, sizeof(remote));

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  initSocket(sockFd);
  remote.sun_family = AF_UNIX;
  strncpy(remote.sun_path, pipePath.c_str(), sizeof(remote.sun_path) - 1);

  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  int result =
      ::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un));
  auto localErrno = GetErrno();
  if (result < 0 && localErrno != EINPROGRESS && localErrno != EAGAIN) {
    VLOG(3) << "Connection result: " << result << " (" << strerror(localErrno)
            << ")";
    FATAL_FAIL(::close(sockFd));
    SetErrno(localErrno);
    return -1;
  }

  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(sockFd, &fdset);
  timeval tv;
  tv.tv_sec = connectTimeoutMs / 1000;
  tv.tv_usec = (connectTimeoutMs % 1000) * 1000;
  select(sockFd + 1, NULL, &fdset, NULL, &tv);

  if (FD_ISSET(sockFd, &fdset)) {
    int so_error;
    socklen_t len = sizeof so_error;
    FATAL_FAIL(
        ::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, (char*)&so_error, &len));
    if (so_error != 0) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << so_error << " "
                << strerror(so_error);
      FATAL_FAIL(::close(sockFd));
      SetErrno(so_error);
      return -1;
    }
  } else {
    LOG(INFO) << "Timed out connecting to " << endpoint;
    FATAL_FAIL(::close(sockFd));
    SetErrno(ETIMEDOUT);
    return -1;
  }

  LOG(INFO) << "Connected to endpoint " << endpoint << " on fd " << sockFd;
  addToActiveSockets(sockFd);
  return sockFd;
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  if (pipeServerSockets.find(pipePath) != pipeServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same path");
  }
  if (pipePath.size() >= sizeof(sockaddr_un::sun_path)) {
    throw std::runtime_error("Socket path too long: " + pipePath);
  }

  sockaddr_un local;
  memset(&local, 0, sizeof(local));

  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  initServerSocket(fd);
  local.sun_family = AF_UNIX;
  strncpy(local.sun_path, pipePath.c_str(), sizeof(local.sun_path) - 1);
  unlink(local.sun_path);

  FATAL_FAIL(::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un)));
  FATAL_FAIL(::listen(fd, 16));
  FATAL_FAIL(::chmod(local.sun_path, S_IRUSR | S_IWUSR | S_IXUSR));

  pipeServerSockets[pipePath] = set<int>({fd});
  return pipeServerSockets[pipePath];
}

set<int> PipeSocketHandler::getEndpointFds(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  auto it = pipeServerSockets.find(pipePath);
  if (it == pipeServerSockets.end()) {
    STFATAL << "Tried to getPipeFd on a pipe without calling listen() first: "
            << pipePath;
  }
  return it->second;
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  auto it = pipeServerSockets.find(pipePath);
  if (it == pipeServerSockets.end()) {
    STFATAL << "Tried to stop listening to a pipe that we weren't listening on:"
            << pipePath;
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  pipeServerSockets.erase(it);
  unlink(pipePath.c_str());
}
}  // namespace th
