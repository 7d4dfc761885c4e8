#include "TtySerialHandler.hpp"

namespace apt {
namespace {
const int PURGE_DWELL_MS = 50;
}

TtySerialHandler::TtySerialHandler() {}

speed_t TtySerialHandler::baudToSpeed(int baudRate) {
  switch (baudRate) {
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 115200:
      return B115200;
    case 230400:
      return B230400;
#ifdef B460800
    case 460800:
      return B460800;
#endif
#ifdef B921600
    case 921600:
      return B921600;
#endif
    default:
      throw std::runtime_error("Unsupported baud rate: " + to_string(baudRate));
  }
}

int TtySerialHandler::open(const DeviceEndpoint& endpoint) {
  if (!endpoint.has_path() || endpoint.path().empty()) {
    throw std::runtime_error("No device path configured");
  }
  int fd = ::open(endpoint.path().c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) {
    auto localErrno = GetErrno();
    throw std::runtime_error("Could not open " + endpoint.path() + ": " +
                             strerror(localErrno));
  }
  try {
    configure(fd, endpoint);
  } catch (const std::runtime_error&) {
    ::close(fd);
    throw;
  }
  {
    lock_guard<std::mutex> guard(handlerMutex);
    openFds.insert(fd);
  }
  LOG(INFO) << "Opened " << endpoint << " on fd " << fd;
  return fd;
}

void TtySerialHandler::configure(int fd, const DeviceEndpoint& endpoint) {
  termios tio;
  if (tcgetattr(fd, &tio) == -1) {
    throw std::runtime_error(string("tcgetattr failed: ") +
                             strerror(GetErrno()));
  }
  cfmakeraw(&tio);
  speed_t speed = baudToSpeed(endpoint.baud_rate());
  cfsetispeed(&tio, speed);
  cfsetospeed(&tio, speed);
  tio.c_cflag &= ~(CSIZE | PARENB | CSTOPB);
  tio.c_cflag |= CS8 | CLOCAL | CREAD;
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;
  if (tcsetattr(fd, TCSANOW, &tio) == -1) {
    throw std::runtime_error(string("tcsetattr failed: ") +
                             strerror(GetErrno()));
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(PURGE_DWELL_MS));
  FATAL_FAIL(tcflush(fd, TCIOFLUSH));
  std::this_thread::sleep_for(std::chrono::milliseconds(PURGE_DWELL_MS));

  if (endpoint.rts_cts()) {
    tio.c_cflag |= CRTSCTS;
  } else {
    tio.c_cflag &= ~CRTSCTS;
  }
  if (tcsetattr(fd, TCSANOW, &tio) == -1) {
    throw std::runtime_error(string("tcsetattr failed: ") +
                             strerror(GetErrno()));
  }
  int rts = TIOCM_RTS;
  if (ioctl(fd, TIOCMBIS, &rts) == -1) {
    LOG(WARNING) << "Could not raise RTS on " << endpoint.path() << ": "
                 << strerror(GetErrno());
  }
}

bool TtySerialHandler::hasData(int fd) { return waitForData(fd, 0); }

bool TtySerialHandler::waitForData(int fd, int64_t timeoutMs) {
  fd_set input;
  FD_ZERO(&input);
  FD_SET(fd, &input);
  struct timeval timeout;
  timeout.tv_sec = timeoutMs / 1000;
  timeout.tv_usec = (timeoutMs % 1000) * 1000;
  int n = select(fd + 1, &input, NULL, NULL, &timeout);
  if (n == -1) {
    VLOG(4) << "device select failed: " << strerror(GetErrno());
    return false;
  } else if (n == 0) {
    return false;
  }
  return FD_ISSET(fd, &input);
}

ssize_t TtySerialHandler::read(int fd, void* buf, size_t count) {
  {
    lock_guard<std::mutex> guard(handlerMutex);
    if (openFds.find(fd) == openFds.end()) {
      LOG(INFO) << "Tried to read from a device that has been closed: " << fd;
      SetErrno(EPIPE);
      return -1;
    }
  }
  ssize_t readBytes = ::read(fd, buf, count);
  auto localErrno = GetErrno();
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading: " << localErrno << " "
                 << strerror(localErrno);
  }
  SetErrno(localErrno);
  return readBytes;
}

ssize_t TtySerialHandler::write(int fd, const void* buf, size_t count) {
  {
    lock_guard<std::mutex> guard(handlerMutex);
    if (openFds.find(fd) == openFds.end()) {
      LOG(INFO) << "Tried to write to a device that has been closed: " << fd;
      SetErrno(EPIPE);
      return -1;
    }
  }
  VLOG(4) << "Tty handler write to fd: " << fd;
  return ::write(fd, buf, count);
}

void TtySerialHandler::close(int fd) {
  lock_guard<std::mutex> guard(handlerMutex);
  if (openFds.erase(fd) == 0) {
    VLOG(1) << "Tried to close a device that is not open: " << fd;
    return;
  }
  VLOG(1) << "Closing device: " << fd;
  FATAL_FAIL(::close(fd));
}
}  // namespace apt
