#include "Message.hpp"

#include "ProtocolTable.hpp"

namespace apt {
Message::Message(const string& frame) {
  if (frame.length() < size_t(HEADER_SIZE)) {
    throw std::runtime_error("Frame shorter than the APT header: " +
                             to_string(frame.length()));
  }
  identity = readIdentity(&frame[0]);
  param1 = frame[2];
  param2 = frame[3];
  destination = frame[4];
  source = frame[5];
  data = frame.substr(HEADER_SIZE);
  if (hasData()) {
    size_t declared = size_t(param1) | (size_t(param2) << 8);
    if (declared != data.length()) {
      throw std::runtime_error("Data length mismatch for " +
                               identityToString(identity) + ": header says " +
                               to_string(declared) + ", frame has " +
                               to_string(data.length()));
    }
  } else if (!data.empty()) {
    throw std::runtime_error("Header-only frame for " +
                             identityToString(identity) + " carries " +
                             to_string(data.length()) + " extra bytes");
  }
}

Message Message::headerOnly(uint16_t identity, uint8_t param1, uint8_t param2,
                            uint8_t destination, uint8_t source) {
  Message m;
  m.identity = identity;
  m.param1 = param1;
  m.param2 = param2;
  m.destination = destination & ~DATA_PACKET_FLAG;
  m.source = source;
  return m;
}

Message Message::withData(uint16_t identity, const string& data,
                          uint8_t destination, uint8_t source) {
  if (data.length() > 0xFFFF) {
    throw std::invalid_argument("APT data packet too large: " +
                                to_string(data.length()));
  }
  Message m;
  m.identity = identity;
  m.param1 = uint8_t(data.length() & 0xFF);
  m.param2 = uint8_t((data.length() >> 8) & 0xFF);
  m.destination = destination | DATA_PACKET_FLAG;
  m.source = source;
  m.data = data;
  return m;
}

string Message::serialize() const {
  string s(HEADER_SIZE, '\0');
  s[0] = char(identity & 0xFF);
  s[1] = char((identity >> 8) & 0xFF);
  s[2] = char(param1);
  s[3] = char(param2);
  s[4] = char(destination);
  s[5] = char(source);
  s.append(data);
  return s;
}

std::ostream& operator<<(std::ostream& os, const Message& message) {
  os << ProtocolTable::messageName(message.getIdentity()) << " ("
     << identityToString(message.getIdentity()) << ", " << message.length()
     << " bytes)";
  return os;
}
}  // namespace apt
