#ifndef __APT_MESSAGE_H__
#define __APT_MESSAGE_H__

#include "Headers.hpp"

namespace apt {
/** @brief Address of the host PC in APT headers. */
const uint8_t HOST_ADDRESS = 0x01;
/** @brief Address of a generic USB unit in APT headers. */
const uint8_t USB_UNIT_ADDRESS = 0x50;
/** @brief Address of the motherboard of a rack system. */
const uint8_t RACK_CONTROLLER_ADDRESS = 0x11;
/** @brief Addresses of the first and last bay of a rack system. */
const uint8_t FIRST_BAY_ADDRESS = 0x21;
const uint8_t LAST_BAY_ADDRESS = 0x2A;
/** @brief Destination bit announcing that a data packet follows the header. */
const uint8_t DATA_PACKET_FLAG = 0x80;

/** @brief True if the address (flag stripped) can appear in an APT header. */
inline bool isKnownAddress(uint8_t address) {
  return address == HOST_ADDRESS || address == USB_UNIT_ADDRESS ||
         address == RACK_CONTROLLER_ADDRESS ||
         (address >= FIRST_BAY_ADDRESS && address <= LAST_BAY_ADDRESS);
}

/**
 * @brief A single APT protocol message: a six byte header optionally followed
 * by a data packet.
 *
 * Messages are immutable once built.  The decoder builds them from validated
 * frames and callers build commands with the static factories.
 */
class Message {
 public:
  /** @brief Size of the fixed header that starts every frame. */
  static const int HEADER_SIZE = 6;

  /** @brief Constructs an empty placeholder message. */
  Message() : identity(0), param1(0), param2(0), destination(0), source(0) {}

  /**
   * @brief Deserializes a message from a complete frame.
   * @throws std::runtime_error if the frame is shorter than the header or
   * its data length disagrees with the frame size.
   */
  explicit Message(const string& frame);

  /**
   * @brief Builds a header-only command.
   */
  static Message headerOnly(uint16_t identity, uint8_t param1, uint8_t param2,
                            uint8_t destination = USB_UNIT_ADDRESS,
                            uint8_t source = HOST_ADDRESS);

  /**
   * @brief Builds a header-plus-data command; the data length is written to
   * the header and the destination carries DATA_PACKET_FLAG.
   */
  static Message withData(uint16_t identity, const string& data,
                          uint8_t destination = USB_UNIT_ADDRESS,
                          uint8_t source = HOST_ADDRESS);

  uint16_t getIdentity() const { return identity; }
  uint8_t getParam1() const { return param1; }
  uint8_t getParam2() const { return param2; }
  /** @brief Destination address with DATA_PACKET_FLAG stripped. */
  uint8_t getDestination() const { return destination & ~DATA_PACKET_FLAG; }
  uint8_t getSource() const { return source; }
  bool hasData() const { return destination & DATA_PACKET_FLAG; }
  const string& getData() const { return data; }

  /** @brief Total frame size in bytes, header included. */
  size_t length() const { return HEADER_SIZE + data.length(); }

  /** @brief Serializes the message to its wire frame. */
  string serialize() const;

  bool operator==(const Message& other) const {
    return identity == other.identity && param1 == other.param1 &&
           param2 == other.param2 && destination == other.destination &&
           source == other.source && data == other.data;
  }
  bool operator!=(const Message& other) const { return !(*this == other); }

 protected:
  uint16_t identity;
  /** @brief For data messages these hold the little endian data length. */
  uint8_t param1;
  uint8_t param2;
  /** @brief Raw destination byte, flag included. */
  uint8_t destination;
  uint8_t source;
  string data;
};

std::ostream& operator<<(std::ostream& os, const Message& message);

/** @brief Reads the little endian identity from the first two frame bytes. */
inline uint16_t readIdentity(const char* frame) {
  return uint16_t(uint8_t(frame[0])) | (uint16_t(uint8_t(frame[1])) << 8);
}
}  // namespace apt

#endif  // __APT_MESSAGE_H__
