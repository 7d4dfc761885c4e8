#ifndef __APT_TTY_SERIAL_HANDLER__
#define __APT_TTY_SERIAL_HANDLER__

#include "SerialHandler.hpp"

namespace apt {
/**
 * @brief Talks to an APT controller through the tty the kernel's FTDI
 * driver exposes (usually /dev/ttyUSB*).
 *
 * open() mirrors the vendor's serial init: 8N1 at the endpoint's baud rate,
 * a purge of both directions bracketed by 50ms dwells, RTS/CTS flow control
 * and RTS raised.
 */
class TtySerialHandler : public SerialHandler {
 public:
  TtySerialHandler();

  virtual int open(const DeviceEndpoint& endpoint);
  virtual bool hasData(int fd);
  virtual bool waitForData(int fd, int64_t timeoutMs);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual void close(int fd);

  /** @throws std::runtime_error for rates termios cannot express. */
  static speed_t baudToSpeed(int baudRate);

 protected:
  void configure(int fd, const DeviceEndpoint& endpoint);

  std::mutex handlerMutex;
  set<int> openFds;
};
}  // namespace apt

#endif  // __APT_TTY_SERIAL_HANDLER__
