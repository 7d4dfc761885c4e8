#ifndef __APT_FAKE_SERIAL_HANDLER__
#define __APT_FAKE_SERIAL_HANDLER__

#include "SerialHandler.hpp"

namespace apt {
/**
 * @brief In-memory device used by tests and dry runs.  Bytes injected with
 * inject() are read back by the host; bytes the host writes are captured and
 * optionally handed to a write hook that can play the device's part.
 */
class FakeSerialHandler : public SerialHandler {
 public:
  typedef function<void(int fd, const string& bytes)> WriteHook;

  FakeSerialHandler();

  virtual int open(const DeviceEndpoint& endpoint);
  virtual bool hasData(int fd);
  virtual bool waitForData(int fd, int64_t timeoutMs);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual void close(int fd);

  /** @brief Queues bytes as if the device had sent them. */
  void inject(int fd, const string& bytes);
  /** @brief Makes reads return end of stream once the queue drains. */
  void endOfStream(int fd);
  /** @brief Makes every later write fail with EIO. */
  void failWrites(int fd);

  /** @brief Everything the host has written so far. */
  string getWritten(int fd);
  void setWriteHook(const WriteHook& hook);
  bool isOpen(int fd);

 protected:
  struct FakeDevice {
    string inBuffer;
    string written;
    bool open = true;
    bool eof = false;
    bool writesFail = false;
  };

  FakeDevice& getDevice(int fd);

  std::mutex handlerMutex;
  std::condition_variable dataCondition;
  map<int, FakeDevice> devices;
  WriteHook writeHook;
  int nextFd;
};
}  // namespace apt

#endif  // __APT_FAKE_SERIAL_HANDLER__
