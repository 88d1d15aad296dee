#include "PipeSocketHandler.hpp"
#include "TestHeaders.hpp"

using namespace th;

namespace {
struct PipePair {
  PipePair() : handler(new PipeSocketHandler()) {
    endpoint.set_name(GetTempDirectory() + "th_pipe_" + genRandomAlphaNum(8) +
                      ".sock");
    handler->listen(endpoint);
    int serverFd = *(handler->getEndpointFds(endpoint).begin());
    clientFd = handler->connect(endpoint);
    REQUIRE(clientFd >= 0);
    serverSideFd = -1;
    for (int i = 0; i < 100 && serverSideFd < 0; i++) {
      serverSideFd = handler->accept(serverFd);
      if (serverSideFd < 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
    }
    REQUIRE(serverSideFd >= 0);
  }

  ~PipePair() {
    handler->close(clientFd);
    handler->close(serverSideFd);
    handler->stopListening(endpoint);
  }

  shared_ptr<PipeSocketHandler> handler;
  SocketEndpoint endpoint;
  int clientFd;
  int serverSideFd;
};
}  // namespace

TEST_CASE("Packets keep their header and payload", "[PipeSocketHandler]") {
  PipePair pair;
  pair.handler->writePacket(
      pair.clientFd, Packet(uint8_t(PacketType::STREAM_DATA), "ls -la\n"));
  SessionRef ref;
  ref.set_sessionid("session_1_abcdefgh");
  pair.handler->writePacket(
      pair.clientFd,
      Packet::fromProto(uint8_t(PacketType::TERMINAL_CLOSE), ref));

  Packet packet;
  REQUIRE(pair.handler->readPacket(pair.serverSideFd, &packet, true));
  REQUIRE(packet.getHeader() == uint8_t(PacketType::STREAM_DATA));
  REQUIRE(packet.getPayload() == "ls -la\n");
  REQUIRE(pair.handler->readPacket(pair.serverSideFd, &packet, true));
  REQUIRE(packet.getHeader() == uint8_t(PacketType::TERMINAL_CLOSE));
  REQUIRE(packet.payloadAs<SessionRef>().sessionid() == "session_1_abcdefgh");
}

TEST_CASE("An empty frame is a keepalive", "[PipeSocketHandler]") {
  PipePair pair;
  int64_t zero = 0;
  pair.handler->writeAllOrThrow(pair.clientFd, &zero, sizeof(zero), true);
  Packet packet;
  REQUIRE(!pair.handler->readPacket(pair.serverSideFd, &packet, true));
}

TEST_CASE("Corrupt frame lengths are rejected", "[PipeSocketHandler]") {
  PipePair pair;
  int64_t huge = MAX_FRAME_LENGTH + 1;
  pair.handler->writeAllOrThrow(pair.clientFd, &huge, sizeof(huge), true);
  Packet packet;
  REQUIRE_THROWS_AS(pair.handler->readPacket(pair.serverSideFd, &packet, true),
                    std::runtime_error);
}

TEST_CASE("Connecting to a missing socket fails", "[PipeSocketHandler]") {
  PipeSocketHandler handler;
  SocketEndpoint endpoint;
  endpoint.set_name(GetTempDirectory() + "th_missing_" + genRandomAlphaNum(8) +
                    ".sock");
  REQUIRE(handler.connect(endpoint) == -1);
}

TEST_CASE("Listening twice on one path is refused", "[PipeSocketHandler]") {
  PipeSocketHandler handler;
  SocketEndpoint endpoint;
  endpoint.set_name(GetTempDirectory() + "th_twice_" + genRandomAlphaNum(8) +
                    ".sock");
  handler.listen(endpoint);
  REQUIRE_THROWS_AS(handler.listen(endpoint), std::runtime_error);
  handler.stopListening(endpoint);
}
