#ifndef __TH_PACKET__
#define __TH_PACKET__

#include "Headers.hpp"

namespace th {
/**
 * @brief A single frame on the multiplexed transport: one header byte
 * (a PacketType value) followed by an opaque payload.
 */
class Packet {
 public:
  Packet() : header(255) {}
  Packet(uint8_t _header, const string& _payload)
      : header(_header), payload(_payload) {}

  /**
   * @brief Builds a packet whose payload is the serialized @p proto.
   */
  template <typename T>
  static Packet fromProto(uint8_t _header, const T& proto) {
    return Packet(_header, protoToString(proto));
  }

  /**
   * @brief Deserializes a packet from its raw byte representation.
   * @throws std::runtime_error when the frame is empty.
   */
  explicit Packet(const string& serializedPacket) {
    if (serializedPacket.empty()) {
      throw std::runtime_error("Empty packet");
    }
    header = serializedPacket[0];
    payload = serializedPacket.substr(1);
  }

  uint8_t getHeader() const { return header; }
  const string& getPayload() const { return payload; }

  /** @brief Parses the payload as protobuf message @p T. */
  template <typename T>
  T payloadAs() const {
    return stringToProto<T>(payload);
  }

  ssize_t length() const { return HEADER_SIZE + payload.length(); }

  string serialize() const {
    string s(1, char(header));
    s.append(payload);
    return s;
  }

 protected:
  static const int HEADER_SIZE = 1;
  uint8_t header;
  string payload;
};
}  // namespace th

#endif  // __TH_PACKET__
