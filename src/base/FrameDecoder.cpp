#include "FrameDecoder.hpp"

namespace apt {
FrameDecoder::FrameDecoder(DecodeErrorPolicy _policy)
    : policy(_policy),
      state(DecoderState::AWAITING_HEADER),
      readPos(0),
      frameLength(0),
      messagesDecoded(0),
      bytesSkipped(0),
      failureKind(DecodeError::UNKNOWN_IDENTITY) {}

void FrameDecoder::push(const char* buf, size_t count) {
  VLOG(4) << "Decoder received: " << toHex(string(buf, count));
  buffer.append(buf, count);
}

bool FrameDecoder::next(Message* message) {
  while (true) {
    switch (state) {
      case DecoderState::FAILED:
        throw DecodeError(failureKind, failureReason);
      case DecoderState::AWAITING_HEADER:
        if (bufferedBytes() < size_t(Message::HEADER_SIZE)) {
          return false;
        }
        if (!readHeader()) {
          continue;
        }
        state = DecoderState::AWAITING_PAYLOAD;
        VLOG(3) << "Awaiting " << frameLength << " byte frame";
        break;
      case DecoderState::AWAITING_PAYLOAD: {
        if (bufferedBytes() < frameLength) {
          return false;
        }
        string frame = buffer.substr(readPos, frameLength);
        readPos += frameLength;
        state = DecoderState::AWAITING_HEADER;
        compact();
        *message = Message(frame);
        messagesDecoded++;
        VLOG(3) << "Decoded " << *message;
        return true;
      }
    }
  }
}

bool FrameDecoder::readHeader() {
  const char* header = &buffer[readPos];
  uint16_t identity = readIdentity(header);
  const ProtocolEntry* entry = ProtocolTable::find(identity);
  if (entry == nullptr) {
    return reject(DecodeError::UNKNOWN_IDENTITY,
                  "Unknown message identity " + identityToString(identity));
  }

  uint8_t destination = uint8_t(header[4]);
  uint8_t source = uint8_t(header[5]);
  if (policy == SCAN_FORWARD &&
      (!isKnownAddress(destination & ~DATA_PACKET_FLAG) ||
       !isKnownAddress(source))) {
    return reject(DecodeError::UNKNOWN_IDENTITY,
                  string(entry->name) + " header has unknown addresses");
  }

  size_t declared = size_t(uint8_t(header[2])) |
                    (size_t(uint8_t(header[3])) << 8);
  if (entry->policy == LengthPolicy::FIXED) {
    size_t expected = entry->length;
    if ((destination & DATA_PACKET_FLAG) &&
        declared + Message::HEADER_SIZE != expected) {
      return reject(DecodeError::LENGTH_MISMATCH,
                    string(entry->name) + " declares " + to_string(declared) +
                        " data bytes but the table expects " +
                        to_string(expected - Message::HEADER_SIZE));
    }
    if (!(destination & DATA_PACKET_FLAG) &&
        expected != size_t(Message::HEADER_SIZE)) {
      return reject(DecodeError::LENGTH_MISMATCH,
                    string(entry->name) + " is missing its data packet flag");
    }
    frameLength = expected;
  } else if (destination & DATA_PACKET_FLAG) {
    frameLength = Message::HEADER_SIZE + declared;
  } else {
    frameLength = Message::HEADER_SIZE;
  }
  return true;
}

bool FrameDecoder::reject(DecodeError::Kind kind, const string& reason) {
  if (policy != SCAN_FORWARD) {
    fail(kind, reason);
  }
  readPos++;
  bytesSkipped++;
  LOG_EVERY_N(100, WARNING) << "Skipping byte while resynchronizing: "
                            << reason;
  return false;
}

void FrameDecoder::finish() {
  if (state == DecoderState::FAILED) {
    throw DecodeError(failureKind, failureReason);
  }
  if (bufferedBytes() > 0) {
    string reason = "Stream ended mid-frame with " +
                    to_string(bufferedBytes()) + " bytes buffered";
    if (state == DecoderState::AWAITING_PAYLOAD) {
      reason += " of " + to_string(frameLength);
    }
    fail(DecodeError::TRUNCATED_FRAME, reason);
  }
}

void FrameDecoder::reset() {
  buffer.clear();
  readPos = 0;
  frameLength = 0;
  state = DecoderState::AWAITING_HEADER;
  failureReason.clear();
}

void FrameDecoder::fail(DecodeError::Kind kind, const string& reason) {
  state = DecoderState::FAILED;
  failureKind = kind;
  failureReason = reason;
  LOG(WARNING) << "Decode error: " << reason;
  throw DecodeError(kind, reason);
}

void FrameDecoder::compact() {
  if (readPos == buffer.size()) {
    buffer.clear();
    readPos = 0;
  } else if (readPos > 4096 && readPos * 2 > buffer.size()) {
    buffer.erase(0, readPos);
    readPos = 0;
  }
}
}  // namespace apt
