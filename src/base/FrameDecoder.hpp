#ifndef __APT_FRAME_DECODER__
#define __APT_FRAME_DECODER__

#include "Headers.hpp"
#include "Message.hpp"
#include "ProtocolTable.hpp"

namespace apt {
/**
 * @brief Fatal framing error.  Once raised the byte position of the stream
 * can no longer be trusted.
 */
class DecodeError : public std::runtime_error {
 public:
  enum Kind {
    /** @brief The frame header names an identity absent from the table. */
    UNKNOWN_IDENTITY = 0,
    /** @brief The stream ended while a frame was partially received. */
    TRUNCATED_FRAME = 1,
    /** @brief A fixed-length frame declared a different data length. */
    LENGTH_MISMATCH = 2
  };

  DecodeError(Kind _kind, const string& what)
      : std::runtime_error(what), kind(_kind) {}

  Kind getKind() const { return kind; }

 protected:
  Kind kind;
};

enum class DecoderState {
  AWAITING_HEADER = 0,
  AWAITING_PAYLOAD = 1,
  /** @brief A decode error was raised; reset() is required. */
  FAILED = 2
};

/**
 * @brief Incremental APT framer.
 *
 * Raw transport bytes go in through push() in chunks of any size; complete
 * messages come out of next() in stream order.  The frame length of each
 * message comes from the generated protocol table, or from the header for
 * identities whose length is variable.
 */
class FrameDecoder {
 public:
  explicit FrameDecoder(DecodeErrorPolicy _policy = FAIL_FAST);

  /** @brief Appends raw bytes read from the transport. */
  void push(const char* buf, size_t count);
  inline void push(const string& bytes) { push(bytes.data(), bytes.size()); }

  /**
   * @brief Pulls the next complete message.
   * @return true if a message was produced, false if more bytes are needed.
   * @throws DecodeError on an unknown identity or a length mismatch
   * (FAIL_FAST policy), and on every call after the decoder failed.
   */
  bool next(Message* message);

  /**
   * @brief Signals the end of the stream.
   * @throws DecodeError (TRUNCATED_FRAME) if a partial frame is buffered.
   */
  void finish();

  /** @brief Drops buffered bytes and restarts framing. */
  void reset();

  DecoderState getState() const { return state; }
  size_t bufferedBytes() const { return buffer.size() - readPos; }
  int64_t getMessagesDecoded() const { return messagesDecoded; }
  int64_t getBytesSkipped() const { return bytesSkipped; }
  DecodeErrorPolicy getPolicy() const { return policy; }

 protected:
  /**
   * @brief Resolves the frame length from a complete header.
   * @return false if the head of the buffer was skipped (SCAN_FORWARD).
   */
  bool readHeader();
  /**
   * @brief Handles an implausible header: throws under FAIL_FAST, skips one
   * byte under SCAN_FORWARD.
   */
  bool reject(DecodeError::Kind kind, const string& reason);
  void fail(DecodeError::Kind kind, const string& reason);
  void compact();

  DecodeErrorPolicy policy;
  DecoderState state;
  string buffer;
  /** @brief Offset of the first unconsumed byte in buffer. */
  size_t readPos;
  /** @brief Total size of the frame being accumulated. */
  size_t frameLength;
  int64_t messagesDecoded;
  int64_t bytesSkipped;
  DecodeError::Kind failureKind;
  string failureReason;
};
}  // namespace apt

#endif  // __APT_FRAME_DECODER__
