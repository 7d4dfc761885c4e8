#include "FakeSerialHandler.hpp"

namespace apt {
FakeSerialHandler::FakeSerialHandler() : nextFd(100) {}

int FakeSerialHandler::open(const DeviceEndpoint& endpoint) {
  lock_guard<std::mutex> guard(handlerMutex);
  int fd = nextFd++;
  devices[fd] = FakeDevice();
  VLOG(1) << "Opened fake device " << endpoint << " on fd " << fd;
  return fd;
}

FakeSerialHandler::FakeDevice& FakeSerialHandler::getDevice(int fd) {
  auto it = devices.find(fd);
  if (it == devices.end()) {
    STFATAL << "Unknown fake device fd: " << fd;
  }
  return it->second;
}

bool FakeSerialHandler::hasData(int fd) {
  lock_guard<std::mutex> guard(handlerMutex);
  FakeDevice& device = getDevice(fd);
  return !device.inBuffer.empty() || device.eof || !device.open;
}

bool FakeSerialHandler::waitForData(int fd, int64_t timeoutMs) {
  unique_lock<std::mutex> lock(handlerMutex);
  return dataCondition.wait_for(
      lock, std::chrono::milliseconds(timeoutMs), [this, fd]() {
        FakeDevice& device = getDevice(fd);
        return !device.inBuffer.empty() || device.eof || !device.open;
      });
}

ssize_t FakeSerialHandler::read(int fd, void* buf, size_t count) {
  lock_guard<std::mutex> guard(handlerMutex);
  FakeDevice& device = getDevice(fd);
  if (!device.open) {
    SetErrno(EPIPE);
    return -1;
  }
  if (device.inBuffer.empty()) {
    if (device.eof) {
      return 0;
    }
    SetErrno(EAGAIN);
    return -1;
  }
  size_t bytesToRead = min(count, device.inBuffer.length());
  memcpy(buf, &device.inBuffer[0], bytesToRead);
  device.inBuffer.erase(0, bytesToRead);
  return bytesToRead;
}

ssize_t FakeSerialHandler::write(int fd, const void* buf, size_t count) {
  WriteHook hook;
  string bytes((const char*)buf, count);
  {
    lock_guard<std::mutex> guard(handlerMutex);
    FakeDevice& device = getDevice(fd);
    if (!device.open) {
      SetErrno(EPIPE);
      return -1;
    }
    if (device.writesFail) {
      SetErrno(EIO);
      return -1;
    }
    device.written.append(bytes);
    hook = writeHook;
  }
  if (hook) {
    hook(fd, bytes);
  }
  return count;
}

void FakeSerialHandler::close(int fd) {
  {
    lock_guard<std::mutex> guard(handlerMutex);
    getDevice(fd).open = false;
  }
  dataCondition.notify_all();
}

void FakeSerialHandler::inject(int fd, const string& bytes) {
  {
    lock_guard<std::mutex> guard(handlerMutex);
    getDevice(fd).inBuffer.append(bytes);
  }
  dataCondition.notify_all();
}

void FakeSerialHandler::endOfStream(int fd) {
  {
    lock_guard<std::mutex> guard(handlerMutex);
    getDevice(fd).eof = true;
  }
  dataCondition.notify_all();
}

void FakeSerialHandler::failWrites(int fd) {
  lock_guard<std::mutex> guard(handlerMutex);
  getDevice(fd).writesFail = true;
}

string FakeSerialHandler::getWritten(int fd) {
  lock_guard<std::mutex> guard(handlerMutex);
  return getDevice(fd).written;
}

void FakeSerialHandler::setWriteHook(const WriteHook& hook) {
  lock_guard<std::mutex> guard(handlerMutex);
  writeHook = hook;
}

bool FakeSerialHandler::isOpen(int fd) {
  lock_guard<std::mutex> guard(handlerMutex);
  return getDevice(fd).open;
}
}  // namespace apt
