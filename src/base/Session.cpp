#include "Session.hpp"

namespace apt {
std::ostream& operator<<(std::ostream& os, const Response& response) {
  os << waitStatusName(response.status);
  if (response.message) {
    os << " " << *response.message;
  }
  if (!response.error.empty()) {
    os << " (" << response.error << ")";
  }
  return os;
}

Session::Session(shared_ptr<DeviceConnection> _connection)
    : connection(_connection),
      defaultTimeout(connection->getOptions().default_timeout_ms()) {}

namespace {
// Counts the caller as an in-flight request for the lifetime of the guard
class PendingRequest {
 public:
  PendingRequest(shared_ptr<ChannelRegistry> _registry, uint16_t _identity)
      : registry(_registry), identity(_identity) {
    othersPending = registry->beginRequest(identity);
  }
  ~PendingRequest() { registry->endRequest(identity); }

  bool joinsOthers() const { return othersPending; }

 protected:
  shared_ptr<ChannelRegistry> registry;
  uint16_t identity;
  bool othersPending;
};
}  // namespace

Response Session::request(const Message& command, uint16_t expectedIdentity,
                          chrono::milliseconds timeout,
                          shared_ptr<CancellationToken> token,
                          RequestMode mode) {
  return performRequest(connection, command, expectedIdentity, timeout, token,
                        mode);
}

Response Session::performRequest(shared_ptr<DeviceConnection> target,
                                 const Message& command,
                                 uint16_t expectedIdentity,
                                 chrono::milliseconds timeout,
                                 shared_ptr<CancellationToken> token,
                                 RequestMode mode) {
  auto deadline = chrono::steady_clock::now() + timeout;
  shared_ptr<ChannelRegistry> registry = target->getRegistry();
  Subscription subscription = registry->subscribe(expectedIdentity);
  PendingRequest pending(registry, expectedIdentity);

  if (mode == RequestMode::JOIN_PENDING && pending.joinsOthers()) {
    VLOG(1) << "Joining pending request for "
            << ProtocolTable::messageName(expectedIdentity);
  } else {
    try {
      target->write(command);
    } catch (const std::runtime_error& ex) {
      Response response;
      response.status = WaitStatus::TRANSPORT_FAILED;
      response.error = ex.what();
      LOG(WARNING) << "Request " << command << " failed: " << ex.what();
      return response;
    }
  }

  Response response;
  response.status = subscription.waitUntil(deadline, token, &response.message);
  if (response.status == WaitStatus::TRANSPORT_FAILED) {
    response.error = subscription.getFailureReason();
  }
  VLOG(1) << "Request " << command << " -> " << response;
  return response;
}

Response Session::request(const Message& command, uint16_t expectedIdentity) {
  return request(command, expectedIdentity, defaultTimeout);
}

std::future<Response> Session::requestAsync(const Message& command,
                                            uint16_t expectedIdentity,
                                            chrono::milliseconds timeout,
                                            shared_ptr<CancellationToken> token,
                                            RequestMode mode) {
  shared_ptr<DeviceConnection> target = connection;
  return std::async(std::launch::async, [target, command, expectedIdentity,
                                         timeout, token, mode]() {
    return performRequest(target, command, expectedIdentity, timeout, token,
                          mode);
  });
}

void Session::send(const Message& command) { connection->write(command); }

Subscription Session::subscribe(uint16_t identity) {
  return connection->getRegistry()->subscribe(identity);
}

Response Session::waitFor(Subscription& subscription,
                          chrono::milliseconds timeout,
                          shared_ptr<CancellationToken> token) {
  Response response;
  response.status = subscription.waitFor(timeout, token, &response.message);
  if (response.status == WaitStatus::TRANSPORT_FAILED) {
    response.error = subscription.getFailureReason();
  }
  return response;
}
}  // namespace apt
