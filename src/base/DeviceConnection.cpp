#include "DeviceConnection.hpp"

namespace apt {
namespace {
const int64_t READ_POLL_MS = 100;
}

DeviceConnection::DeviceConnection(shared_ptr<SerialHandler> _serialHandler,
                                   const DeviceEndpoint& _endpoint,
                                   const LinkOptions& _options)
    : serialHandler(_serialHandler),
      endpoint(_endpoint),
      options(_options),
      registry(make_shared<ChannelRegistry>(_options.reclaim_empty_slots())),
      dispatcher(make_shared<Dispatcher>(registry)),
      decoder(_options.decode_error_policy()),
      fd(-1),
      shuttingDown(false),
      failed(false),
      bytesRead(0),
      messagesDecoded(0),
      bytesSkipped(0),
      decodeErrors(0) {
  if (options.read_chunk_size() <= 0) {
    throw std::runtime_error("read_chunk_size must be positive");
  }
  if (options.log_unmatched()) {
    dispatcher->setUnmatchedHandler(
        [](const shared_ptr<const Message>& message) {
          LOG(INFO) << "Unmatched message: " << *message;
        });
  }
}

DeviceConnection::~DeviceConnection() {
  if (!shuttingDown && readerThread) {
    STERROR << "Call shutdown before destructing a DeviceConnection.";
    shutdown();
  }
}

void DeviceConnection::connect() {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  if (fd != -1 || shuttingDown) {
    throw std::runtime_error("DeviceConnection can only connect once");
  }
  fd = serialHandler->open(endpoint);
  LOG(INFO) << "Connected to " << endpoint;
  readerThread.reset(new thread(&DeviceConnection::readLoop, this));
}

void DeviceConnection::readLoop() {
  VLOG(1) << "Reader started on fd " << fd;
  vector<char> buf(options.read_chunk_size());
  try {
    while (!shuttingDown) {
      if (!serialHandler->waitForData(fd, READ_POLL_MS)) {
        continue;
      }
      ssize_t n = serialHandler->read(fd, &buf[0], buf.size());
      if (n == 0) {
        decoder.finish();
        fail("Device disconnected");
        break;
      }
      if (n < 0) {
        auto localErrno = GetErrno();
        if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
          continue;
        }
        if (shuttingDown) {
          break;
        }
        fail(string("Read failed: ") + strerror(localErrno));
        break;
      }
      bytesRead += n;
      decoder.push(&buf[0], n);
      Message message;
      while (decoder.next(&message)) {
        messagesDecoded++;
        dispatcher->dispatch(make_shared<const Message>(message));
      }
      bytesSkipped = decoder.getBytesSkipped();
    }
  } catch (const DecodeError& ex) {
    decodeErrors++;
    bytesSkipped = decoder.getBytesSkipped();
    fail(string("Decode error: ") + ex.what());
  } catch (const std::exception& ex) {
    bytesSkipped = decoder.getBytesSkipped();
    fail(string("Reader failed: ") + ex.what());
  }
  VLOG(1) << "Reader stopped on fd " << fd;
}

void DeviceConnection::fail(const string& reason) {
  {
    lock_guard<std::recursive_mutex> guard(connectionMutex);
    if (failed) {
      return;
    }
    failed = true;
    failureReason = reason;
  }
  LOG(WARNING) << "Connection to " << endpoint << " failed: " << reason;
  registry->failAll(reason);
}

void DeviceConnection::write(const Message& message) {
  int writeFd;
  {
    lock_guard<std::recursive_mutex> guard(connectionMutex);
    if (failed) {
      throw std::runtime_error("Connection failed: " + failureReason);
    }
    if (fd == -1 || shuttingDown) {
      throw std::runtime_error("Connection is not open");
    }
    writeFd = fd;
  }
  string frame = message.serialize();
  lock_guard<std::mutex> guard(writeMutex);
  VLOG(2) << "Sending " << message;
  VLOG(4) << "Sending bytes: " << toHex(frame);
  serialHandler->writeAllOrThrow(writeFd, frame);
}

void DeviceConnection::shutdown() {
  {
    lock_guard<std::recursive_mutex> guard(connectionMutex);
    if (shuttingDown) {
      return;
    }
    LOG(INFO) << "Shutting down connection to " << endpoint;
    shuttingDown = true;
  }
  if (readerThread) {
    if (readerThread->get_id() == std::this_thread::get_id()) {
      STFATAL << "DeviceConnection::shutdown called from its reader thread";
    }
    readerThread->join();
    readerThread.reset();
  }
  {
    lock_guard<std::mutex> writeGuard(writeMutex);
    lock_guard<std::recursive_mutex> guard(connectionMutex);
    if (fd != -1) {
      serialHandler->close(fd);
      fd = -1;
    }
  }
  registry->failAll("Connection shut down");
}

bool DeviceConnection::isConnected() {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  return fd != -1 && !failed && !shuttingDown;
}

bool DeviceConnection::isFailed() {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  return failed;
}

string DeviceConnection::getFailureReason() {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  return failureReason;
}

LinkStats DeviceConnection::getStats() {
  LinkStats stats;
  stats.set_bytes_read(bytesRead);
  stats.set_messages_decoded(messagesDecoded);
  stats.set_messages_delivered(dispatcher->getDelivered());
  stats.set_messages_unmatched(dispatcher->getUnmatched());
  stats.set_bytes_skipped(bytesSkipped);
  stats.set_decode_errors(decodeErrors);
  return stats;
}
}  // namespace apt
