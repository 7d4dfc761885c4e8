#ifndef __APT_DEVICE_CONNECTION__
#define __APT_DEVICE_CONNECTION__

#include "ChannelRegistry.hpp"
#include "Dispatcher.hpp"
#include "FrameDecoder.hpp"
#include "Headers.hpp"
#include "SerialHandler.hpp"

namespace apt {
/**
 * @brief One open link to an APT controller.
 *
 * A single reader thread pulls bytes from the serial handler, frames them
 * and dispatches every message into the connection's channel registry.
 * Writes from any thread are serialized onto the one device descriptor.
 *
 * A decode error, a read error or the end of the stream stops the reader and
 * fails every waiter in the registry.  There is no reconnect.
 */
class DeviceConnection {
 public:
  DeviceConnection(shared_ptr<SerialHandler> _serialHandler,
                   const DeviceEndpoint& _endpoint,
                   const LinkOptions& _options);

  virtual ~DeviceConnection();

  /**
   * @brief Opens the device and starts the reader thread.
   * @throws std::runtime_error if the device cannot be opened.
   */
  void connect();

  /**
   * @brief Writes one message to the device.
   * @throws std::runtime_error if the connection is down or the write fails.
   */
  void write(const Message& message);

  /**
   * @brief Stops the reader, closes the device and fails all waiters.
   */
  void shutdown();

  bool isConnected();
  bool isFailed();
  string getFailureReason();

  /** @brief Snapshot of the link counters. */
  LinkStats getStats();

  inline shared_ptr<ChannelRegistry> getRegistry() { return registry; }
  inline shared_ptr<Dispatcher> getDispatcher() { return dispatcher; }
  inline shared_ptr<SerialHandler> getSerialHandler() { return serialHandler; }
  inline const LinkOptions& getOptions() const { return options; }
  inline const DeviceEndpoint& getEndpoint() const { return endpoint; }
  inline int getFd() { return fd; }

 protected:
  void readLoop();
  void fail(const string& reason);

  shared_ptr<SerialHandler> serialHandler;
  DeviceEndpoint endpoint;
  LinkOptions options;
  shared_ptr<ChannelRegistry> registry;
  shared_ptr<Dispatcher> dispatcher;
  /** @brief Owned by the reader thread once connect() returns. */
  FrameDecoder decoder;

  std::recursive_mutex connectionMutex;
  std::mutex writeMutex;
  int fd;
  atomic<bool> shuttingDown;
  bool failed;
  string failureReason;
  unique_ptr<thread> readerThread;

  atomic<int64_t> bytesRead;
  atomic<int64_t> messagesDecoded;
  atomic<int64_t> bytesSkipped;
  atomic<int64_t> decodeErrors;
};
}  // namespace apt

#endif  // __APT_DEVICE_CONNECTION__
