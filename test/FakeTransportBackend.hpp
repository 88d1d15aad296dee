#ifndef __TH_FAKE_TRANSPORT_BACKEND__
#define __TH_FAKE_TRANSPORT_BACKEND__

#include "PipeSocketHandler.hpp"

namespace th {
/**
 * @brief Transport endpoint for stream tests. Answers the stream handshake,
 * records every STREAM_DATA payload and can push output or drop clients.
 */
class FakeTransportBackend {
 public:
  explicit FakeTransportBackend(const string& path)
      : handler(new PipeSocketHandler()),
        acceptHandshakes(true),
        answerHandshakes(true),
        dropRequested(false),
        halt(false) {
    endpoint.set_name(path);
    handler->listen(endpoint);
    serverThread.reset(new thread(&FakeTransportBackend::serve, this));
  }

  virtual ~FakeTransportBackend() { stop(); }

  void stop() {
    if (halt.exchange(true)) {
      return;
    }
    serverThread->join();
    lock_guard<mutex> guard(backendMutex);
    for (int fd : clients) {
      handler->close(fd);
    }
    clients.clear();
    handler->stopListening(endpoint);
  }

  /** @brief Sends output to the most recently handshaken client. */
  void sendOutput(const string& data) {
    lock_guard<mutex> guard(backendMutex);
    if (clients.empty()) {
      throw std::runtime_error("No transport client");
    }
    handler->writePacket(clients.back(),
                         Packet(uint8_t(PacketType::STREAM_DATA), data));
  }

  /** @brief Closes every client connection, as if the backend restarted. */
  void dropClients() {
    dropRequested = true;
    while (dropRequested && !halt) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }

  string receivedData() {
    lock_guard<mutex> guard(backendMutex);
    return received;
  }

  vector<WindowSize> receivedResizes() {
    lock_guard<mutex> guard(backendMutex);
    return resizes;
  }

  int handshakeCount() {
    lock_guard<mutex> guard(backendMutex);
    return handshakes;
  }

  int clientCount() {
    lock_guard<mutex> guard(backendMutex);
    return int(clients.size());
  }

  atomic<bool> acceptHandshakes;
  /** @brief When false, handshakes are read but never answered. */
  atomic<bool> answerHandshakes;

 protected:
  void serve() {
    el::Helpers::setThreadName("fake-backend");
    int serverFd = *(handler->getEndpointFds(endpoint).begin());
    vector<int> handshaking;
    while (!halt) {
      if (dropRequested) {
        lock_guard<mutex> guard(backendMutex);
        for (int fd : clients) {
          handler->close(fd);
        }
        clients.clear();
        dropRequested = false;
      }
      int fd = handler->accept(serverFd);
      if (fd >= 0) {
        handshaking.push_back(fd);
      }
      vector<int> current;
      {
        lock_guard<mutex> guard(backendMutex);
        current = clients;
      }
      current.insert(current.end(), handshaking.begin(), handshaking.end());
      bool idle = true;
      for (int clientFd : current) {
        if (!handler->hasData(clientFd)) {
          continue;
        }
        idle = false;
        try {
          Packet packet;
          if (!handler->readPacket(clientFd, &packet, true)) {
            continue;
          }
          handlePacket(clientFd, packet, &handshaking);
        } catch (const std::runtime_error&) {
          forget(clientFd, &handshaking);
        }
      }
      if (idle) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
    }
    for (int fd : handshaking) {
      handler->close(fd);
    }
  }

  void handlePacket(int fd, const Packet& packet, vector<int>* handshaking) {
    lock_guard<mutex> guard(backendMutex);
    switch (packet.getHeader()) {
      case uint8_t(PacketType::STREAM_HANDSHAKE): {
        handshakes++;
        if (!answerHandshakes) {
          return;
        }
        auto request = packet.payloadAs<StreamHandshake>();
        StreamHandshake reply;
        reply.set_sessionid(request.sessionid());
        reply.set_accepted(bool(acceptHandshakes));
        handler->writePacket(
            fd, Packet::fromProto(uint8_t(PacketType::STREAM_HANDSHAKE), reply));
        handshaking->erase(
            std::remove(handshaking->begin(), handshaking->end(), fd),
            handshaking->end());
        clients.push_back(fd);
        break;
      }
      case uint8_t(PacketType::STREAM_DATA):
        received.append(packet.getPayload());
        break;
      case uint8_t(PacketType::STREAM_RESIZE):
        resizes.push_back(packet.payloadAs<WindowSize>());
        break;
      case uint8_t(PacketType::STREAM_PING):
        handler->writePacket(
            fd, Packet(uint8_t(PacketType::STREAM_PONG), packet.getPayload()));
        break;
      default:
        break;
    }
  }

  void forget(int fd, vector<int>* handshaking) {
    lock_guard<mutex> guard(backendMutex);
    auto it = std::find(clients.begin(), clients.end(), fd);
    if (it != clients.end()) {
      clients.erase(it);
    } else {
      handshaking->erase(
          std::remove(handshaking->begin(), handshaking->end(), fd),
          handshaking->end());
    }
    handler->close(fd);
  }

  shared_ptr<PipeSocketHandler> handler;
  SocketEndpoint endpoint;
  mutex backendMutex;
  vector<int> clients;
  string received;
  vector<WindowSize> resizes;
  int handshakes = 0;
  atomic<bool> dropRequested;
  atomic<bool> halt;
  shared_ptr<thread> serverThread;
};
}  // namespace th

#endif  // __TH_FAKE_TRANSPORT_BACKEND__
