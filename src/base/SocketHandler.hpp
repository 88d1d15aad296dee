#ifndef __TH_SOCKET_HANDLER__
#define __TH_SOCKET_HANDLER__

#include "Headers.hpp"
#include "Packet.hpp"

namespace th {
// Anything bigger than this on the wire is treated as a corrupt frame.
static const int64_t MAX_FRAME_LENGTH = 64 * 1024 * 1024;

/**
 * @brief Abstract socket API used by the session server, the stream layer and
 * the client multiplexer. Concrete handlers own the descriptors they hand out.
 */
class SocketHandler {
 public:
  SocketHandler() : transferTimeoutMs(10 * 1000) {}
  virtual ~SocketHandler() {}

  /**
   * @brief Returns true when the kernel reports data ready to read on a
   * descriptor.
   */
  virtual bool hasData(int fd) = 0;
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes.
   * @param timeout When true, throws if no progress is made within the
   * transfer timeout.
   * @throws std::runtime_error on timeout, EOF or a socket error.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);
  /**
   * @brief Writes the full buffer.
   * @return Total bytes written, or -1 when the socket stalls or fails.
   */
  int writeAllOrReturn(int fd, const void* buf, size_t count);
  /**
   * @brief Writes all bytes, throwing if the operation stalls or fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Reads a length-prefixed protobuf from the socket.
   * @throws std::runtime_error on invalid length or parse failure.
   */
  template <typename T>
  inline T readProto(int fd, bool timeout) {
    T t;
    int64_t length;
    readAll(fd, &length, sizeof(int64_t), timeout);
    if (length < 0 || length > MAX_FRAME_LENGTH) {
      throw std::runtime_error("Invalid proto size: " + to_string(length));
    }
    if (length == 0) {
      return t;
    }
    string s(length, '\0');
    readAll(fd, &s[0], length, timeout);
    if (!t.ParseFromString(s)) {
      throw std::runtime_error("Invalid proto");
    }
    return t;
  }

  template <typename T>
  inline void writeProto(int fd, const T& t, bool timeout) {
    string s;
    if (!t.SerializeToString(&s)) {
      STFATAL << "Serialization of " << t.GetTypeName() << " failed!";
    }
    int64_t length = s.length();
    if (length > MAX_FRAME_LENGTH) {
      throw std::runtime_error("Proto too large to send: " +
                               to_string(length));
    }
    writeAllOrThrow(fd, &length, sizeof(int64_t), timeout);
    if (length > 0) {
      writeAllOrThrow(fd, &s[0], length, timeout);
    }
  }

  /**
   * @brief Reads one length-prefixed packet.
   * @returns false when the frame is empty (a keepalive).
   */
  inline bool readPacket(int fd, Packet* packet, bool timeout = false) {
    int64_t length;
    readAll(fd, (char*)&length, sizeof(int64_t), timeout);
    if (length < 0 || length > MAX_FRAME_LENGTH) {
      throw std::runtime_error("Invalid packet size: " + to_string(length));
    }
    if (length == 0) {
      return false;
    }
    string s(length, '\0');
    readAll(fd, &s[0], length, timeout);
    *packet = Packet(s);
    return true;
  }

  inline void writePacket(int fd, const Packet& packet, bool timeout = true) {
    string s = packet.serialize();
    int64_t length = s.length();
    if (length > MAX_FRAME_LENGTH) {
      throw std::runtime_error("Packet too large to send: " +
                               to_string(length));
    }
    // Length and body go out in one write so concurrent writers on the same
    // fd cannot interleave frames.
    string frame((const char*)&length, sizeof(int64_t));
    frame.append(s);
    writeAllOrThrow(fd, frame.data(), frame.size(), timeout);
  }

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) = 0;
  virtual int accept(int fd) = 0;
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  virtual void close(int fd) = 0;
  virtual vector<int> getActiveSockets() = 0;

  /** @brief Sets how long a blocked transfer may stall before it fails. */
  void setTransferTimeoutMs(int64_t ms) { transferTimeoutMs = ms; }
  int64_t getTransferTimeoutMs() const { return transferTimeoutMs; }

 protected:
  atomic<int64_t> transferTimeoutMs;
};
}  // namespace th

#endif  // __TH_SOCKET_HANDLER__
