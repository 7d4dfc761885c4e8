#include "FrameDecoder.hpp"
#include "TestHeaders.hpp"

using namespace apt;

namespace {
vector<Message> sampleStream() {
  vector<Message> messages;
  messages.push_back(Message::headerOnly(0x0443, 1, 0));
  messages.push_back(
      Message::headerOnly(0x0444, 1, 0, HOST_ADDRESS, USB_UNIT_ADDRESS));
  messages.push_back(
      Message::withData(0x042A, string("\x01\x00\x00\x04\x00\x80", 6),
                        HOST_ADDRESS, USB_UNIT_ADDRESS));
  messages.push_back(
      Message::withData(0x0453, string("\x01\x00\x10\x27\x00\x00", 6)));
  messages.push_back(Message::headerOnly(0x0453, 1, 0));
  string info(84, '\0');
  for (size_t i = 0; i < info.size(); ++i) {
    info[i] = char(i * 7);
  }
  messages.push_back(
      Message::withData(0x0006, info, HOST_ADDRESS, USB_UNIT_ADDRESS));
  messages.push_back(Message::withData(0x0448, string(300, '\x5A')));
  return messages;
}

string serializeAll(const vector<Message>& messages) {
  string s;
  for (const auto& m : messages) {
    s += m.serialize();
  }
  return s;
}

vector<Message> drain(FrameDecoder* decoder) {
  vector<Message> out;
  Message m;
  while (decoder->next(&m)) {
    out.push_back(m);
  }
  return out;
}
}  // namespace

TEST_CASE("Frames round trip regardless of chunking", "[FrameDecoder]") {
  vector<Message> expected = sampleStream();
  string stream = serializeAll(expected);

  for (size_t chunk = 1; chunk <= stream.size();
       chunk += (chunk < 16 ? 1 : 37)) {
    FrameDecoder decoder;
    vector<Message> decoded;
    for (size_t pos = 0; pos < stream.size(); pos += chunk) {
      decoder.push(stream.substr(pos, chunk));
      auto batch = drain(&decoder);
      decoded.insert(decoded.end(), batch.begin(), batch.end());
    }
    REQUIRE_NOTHROW(decoder.finish());
    REQUIRE(decoded.size() == expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
      CHECK(decoded[i] == expected[i]);
    }
    CHECK(decoder.getMessagesDecoded() == int64_t(expected.size()));
  }
}

TEST_CASE("Random chunk boundaries", "[FrameDecoder]") {
  vector<Message> expected = sampleStream();
  string stream = serializeAll(expected) + serializeAll(expected);

  for (int trial = 0; trial < 50; ++trial) {
    FrameDecoder decoder;
    vector<Message> decoded;
    size_t pos = 0;
    while (pos < stream.size()) {
      size_t chunk = 1 + rand() % 40;
      decoder.push(stream.substr(pos, chunk));
      pos += chunk;
      auto batch = drain(&decoder);
      decoded.insert(decoded.end(), batch.begin(), batch.end());
    }
    REQUIRE(decoded.size() == expected.size() * 2);
    CHECK(decoded.back() == expected.back());
  }
}

TEST_CASE("Variable length frames are exact", "[FrameDecoder]") {
  Message move =
      Message::withData(0x0448, string("\x01\x00\xE8\x03\x00\x00", 6));
  string frame = move.serialize();
  REQUIRE(frame.size() == 12);

  SECTION("complete frame decodes") {
    FrameDecoder decoder;
    decoder.push(frame);
    Message m;
    REQUIRE(decoder.next(&m));
    CHECK(m == move);
    CHECK_FALSE(decoder.next(&m));
    CHECK(decoder.bufferedBytes() == 0);
  }

  SECTION("one byte short is a truncated frame") {
    FrameDecoder decoder;
    decoder.push(frame.substr(0, frame.size() - 1));
    Message m;
    REQUIRE_FALSE(decoder.next(&m));
    CHECK(decoder.getState() == DecoderState::AWAITING_PAYLOAD);
    try {
      decoder.finish();
      FAIL("finish() should throw");
    } catch (const DecodeError& de) {
      CHECK(de.getKind() == DecodeError::TRUNCATED_FRAME);
    }
    CHECK(decoder.getState() == DecoderState::FAILED);
  }

  SECTION("partial header is a truncated frame") {
    FrameDecoder decoder;
    decoder.push(frame.substr(0, 3));
    Message m;
    REQUIRE_FALSE(decoder.next(&m));
    CHECK(decoder.getState() == DecoderState::AWAITING_HEADER);
    REQUIRE_THROWS_AS(decoder.finish(), DecodeError);
  }
}

TEST_CASE("Unknown identity fails fast", "[FrameDecoder]") {
  FrameDecoder decoder;
  decoder.push(string("\xFF\x7F\x00\x00\x50\x01", 6));
  Message m;
  try {
    decoder.next(&m);
    FAIL("next() should throw");
  } catch (const DecodeError& de) {
    CHECK(de.getKind() == DecodeError::UNKNOWN_IDENTITY);
  }
  CHECK(decoder.getState() == DecoderState::FAILED);

  // Stays failed until reset
  decoder.push(Message::headerOnly(0x0443, 1, 0).serialize());
  REQUIRE_THROWS_AS(decoder.next(&m), DecodeError);

  decoder.reset();
  decoder.push(Message::headerOnly(0x0443, 1, 0).serialize());
  REQUIRE(decoder.next(&m));
  CHECK(m.getIdentity() == 0x0443);
}

TEST_CASE("Scan forward skips garbage", "[FrameDecoder]") {
  FrameDecoder decoder(SCAN_FORWARD);
  Message home = Message::headerOnly(0x0443, 1, 0);
  decoder.push(string("\xFF\xFF\xFF", 3) + home.serialize());
  Message m;
  REQUIRE(decoder.next(&m));
  CHECK(m == home);
  CHECK(decoder.getBytesSkipped() == 3);
  CHECK(decoder.getMessagesDecoded() == 1);
}

TEST_CASE("Fixed length disagreement is a decode error", "[FrameDecoder]") {
  FrameDecoder decoder;
  // MOT_GET_STATUSBITS is 12 bytes but this header declares 2 data bytes
  decoder.push(string("\x2A\x04\x02\x00\x81\x50\x01\x00\x00\x00\x00\x00", 12));
  Message m;
  try {
    decoder.next(&m);
    FAIL("next() should throw");
  } catch (const DecodeError& de) {
    CHECK(de.getKind() == DecodeError::LENGTH_MISMATCH);
  }
}

TEST_CASE("Scan forward skips headers with inconsistent lengths",
          "[FrameDecoder]") {
  FrameDecoder decoder(SCAN_FORWARD);
  Message homed =
      Message::headerOnly(0x0444, 1, 0, HOST_ADDRESS, USB_UNIT_ADDRESS);
  // 02 00 reads as HW_DISCONNECT with a data flag and 5 data bytes, and
  // 05 00 reads as HW_REQ_INFO addressed to 0x04
  decoder.push(string("\xEE\xEE\x02\x00\x05\x00\x81", 7) +
               homed.serialize());
  Message m;
  REQUIRE(decoder.next(&m));
  CHECK(m == homed);
  CHECK(decoder.getBytesSkipped() == 7);
  CHECK_FALSE(decoder.next(&m));
  CHECK(decoder.getState() == DecoderState::AWAITING_HEADER);
  REQUIRE_NOTHROW(decoder.finish());
}

TEST_CASE("Scan forward skips a fixed frame missing its data flag",
          "[FrameDecoder]") {
  FrameDecoder decoder(SCAN_FORWARD);
  Message status =
      Message::withData(0x042A, string("\x01\x00\x00\x04\x00\x80", 6),
                        HOST_ADDRESS, USB_UNIT_ADDRESS);
  // MOT_GET_STATUSBITS header without the flag, followed by a real frame
  decoder.push(string("\x2A\x04\x06\x00\x01\x50", 6) +
               status.serialize());
  Message m;
  REQUIRE(decoder.next(&m));
  CHECK(m == status);
  CHECK(decoder.getBytesSkipped() == 6);
}
