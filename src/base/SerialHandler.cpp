#include "SerialHandler.hpp"

namespace apt {
#define SERIAL_WRITE_TIMEOUT (5)

void SerialHandler::writeAllOrThrow(int fd, const void* buf, size_t count) {
  time_t startTime = time(NULL);
  size_t pos = 0;
  while (pos < count) {
    time_t currentTime = time(NULL);
    if (currentTime > startTime + SERIAL_WRITE_TIMEOUT) {
      throw std::runtime_error("Serial write timeout");
    }
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    auto localErrno = errno;
    if (bytesWritten < 0) {
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        VLOG(4) << "Got EAGAIN, waiting...";
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      } else {
        LOG(WARNING) << "Failed a call to writeAll: " << strerror(localErrno);
        throw std::runtime_error(string("Failed a call to writeAll: ") +
                                 strerror(localErrno));
      }
    } else if (bytesWritten == 0) {
      throw std::runtime_error("Device closed during writeAll");
    } else {
      pos += bytesWritten;
      // Reset the timeout as long as we are writing bytes
      startTime = currentTime;
    }
  }
}
}  // namespace apt
