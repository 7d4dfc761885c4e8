#ifndef __APT_SESSION__
#define __APT_SESSION__

#include "CancellationToken.hpp"
#include "DeviceConnection.hpp"
#include "Headers.hpp"
#include "Subscription.hpp"

namespace apt {
/** @brief Outcome of a request or of a wait on a subscription. */
struct Response {
  WaitStatus status = WaitStatus::TIMED_OUT;
  /** @brief The delivered message; null unless status is DELIVERED. */
  shared_ptr<const Message> message;
  /** @brief Reason for a TRANSPORT_FAILED outcome. */
  string error;

  bool ok() const { return status == WaitStatus::DELIVERED; }
};

std::ostream& operator<<(std::ostream& os, const Response& response);

enum class RequestMode {
  /** @brief Always write the command. */
  ALWAYS_SEND = 0,
  /**
   * @brief Skip the write when another request for the same response
   * identity is in flight, and share that response.  Plain subscriptions
   * do not count as requests.
   */
  JOIN_PENDING = 1
};

/**
 * @brief Request/response exchanges over a device connection.
 *
 * A request subscribes to the expected response before the command is
 * written, so a fast reply is never missed.  It then waits for the first of
 * delivery, deadline, cancellation and transport failure.  Requests never
 * retry.
 */
class Session {
 public:
  explicit Session(shared_ptr<DeviceConnection> _connection);

  /**
   * @brief Sends a command and awaits the first message on the channel of
   * the expected identity.
   *
   * Identities grouped on one channel share it, so the response can carry
   * any identity of the group (MOT_MOVE_STOPPED when MOT_MOVE_COMPLETED was
   * expected).  Check getIdentity() on the delivered message.
   * @throws std::invalid_argument if expectedIdentity is not in the table.
   */
  Response request(const Message& command, uint16_t expectedIdentity,
                   chrono::milliseconds timeout,
                   shared_ptr<CancellationToken> token = nullptr,
                   RequestMode mode = RequestMode::ALWAYS_SEND);

  /** @brief request() with the connection's default timeout. */
  Response request(const Message& command, uint16_t expectedIdentity);

  /**
   * @brief Runs request() as an independent task.  The task shares the
   * connection, so the future may outlive this Session.
   */
  std::future<Response> requestAsync(
      const Message& command, uint16_t expectedIdentity,
      chrono::milliseconds timeout,
      shared_ptr<CancellationToken> token = nullptr,
      RequestMode mode = RequestMode::ALWAYS_SEND);

  /**
   * @brief Writes a command without waiting for anything.
   * @throws std::runtime_error if the write fails.
   */
  void send(const Message& command);

  /** @brief Subscribes to notifications of one identity. */
  Subscription subscribe(uint16_t identity);

  /**
   * @brief Awaits the next message on an existing subscription with the same
   * outcome rules as request().
   */
  Response waitFor(Subscription& subscription, chrono::milliseconds timeout,
                   shared_ptr<CancellationToken> token = nullptr);

  chrono::milliseconds getDefaultTimeout() const { return defaultTimeout; }
  inline shared_ptr<DeviceConnection> getConnection() { return connection; }

 protected:
  static Response performRequest(shared_ptr<DeviceConnection> target,
                                 const Message& command,
                                 uint16_t expectedIdentity,
                                 chrono::milliseconds timeout,
                                 shared_ptr<CancellationToken> token,
                                 RequestMode mode);

  shared_ptr<DeviceConnection> connection;
  chrono::milliseconds defaultTimeout;
};
}  // namespace apt

#endif  // __APT_SESSION__
