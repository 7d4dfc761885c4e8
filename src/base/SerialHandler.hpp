#ifndef __APT_SERIAL_HANDLER__
#define __APT_SERIAL_HANDLER__

#include "Headers.hpp"

namespace apt {
/**
 * @brief Provides an abstract API for device reads/writes and lifecycle
 * management.
 */
class SerialHandler {
 public:
  /** @brief Ensures derived handlers can release their descriptors. */
  virtual ~SerialHandler() {}

  /**
   * @brief Opens and configures the device named by the endpoint.
   * @return File descriptor of the open device.
   * @throws std::runtime_error if the device cannot be opened.
   */
  virtual int open(const DeviceEndpoint& endpoint) = 0;

  /**
   * @brief Returns true when data is ready to read without blocking.
   */
  virtual bool hasData(int fd) = 0;

  /**
   * @brief Blocks for up to timeoutMs waiting for readable data.
   */
  virtual bool waitForData(int fd, int64_t timeoutMs) = 0;

  /**
   * @brief Reads up to count bytes from fd.
   * @return bytes read, 0 at end of stream, -1 with errno set on error.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;

  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /** @brief Closes the device descriptor. */
  virtual void close(int fd) = 0;

  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count);

  inline void writeAllOrThrow(int fd, const string& bytes) {
    writeAllOrThrow(fd, bytes.data(), bytes.size());
  }
};
}  // namespace apt

#endif  // __APT_SERIAL_HANDLER__
