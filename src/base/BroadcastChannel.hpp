#ifndef __APT_BROADCAST_CHANNEL__
#define __APT_BROADCAST_CHANNEL__

#include "Headers.hpp"
#include "Message.hpp"

namespace apt {
class CancellationToken;

/** @brief How a wait for the next message ended. */
enum class WaitStatus {
  DELIVERED = 0,
  TIMED_OUT = 1,
  CANCELLED = 2,
  TRANSPORT_FAILED = 3
};

const char* waitStatusName(WaitStatus status);

/**
 * @brief Unbounded FIFO of messages owned by a single subscriber.
 *
 * Publishers never block on it beyond the queue mutex.  Once failed, queued
 * messages are still handed out before the failure is reported.
 */
class SubscriberQueue {
 public:
  SubscriberQueue() : failed(false) {}

  void push(const shared_ptr<const Message>& message);

  /** @brief Marks the queue failed and wakes every waiter. */
  void fail(const string& reason);

  /** @brief Wakes waiters so they re-check cancellation. */
  void interrupt();

  bool tryPop(shared_ptr<const Message>* message);

  /**
   * @brief Blocks until a message arrives, the token is cancelled, the queue
   * fails or the deadline passes, checked in that order.
   */
  WaitStatus waitUntil(const chrono::steady_clock::time_point& deadline,
                       const CancellationToken* token,
                       shared_ptr<const Message>* message);

  size_t size() const;
  bool isFailed() const;
  string getFailureReason() const;

 protected:
  mutable std::mutex queueMutex;
  std::condition_variable queueCondition;
  deque<shared_ptr<const Message>> messages;
  bool failed;
  string failureReason;
};

/**
 * @brief Runtime state of one channel slot: the set of subscriber queues
 * that receive every message published to the slot.
 */
class BroadcastChannel {
 public:
  explicit BroadcastChannel(size_t _slot) : slot(_slot), failed(false) {}

  /**
   * @brief Attaches a new subscriber queue.
   * @param first set to true when no other subscriber was attached.
   */
  shared_ptr<SubscriberQueue> addSubscriber(bool* first);

  /** @return the number of subscribers left. */
  size_t removeSubscriber(const shared_ptr<SubscriberQueue>& queue);

  /** @return the number of subscribers that received the message. */
  size_t publish(const shared_ptr<const Message>& message);

  void fail(const string& reason);

  size_t subscriberCount() const;
  size_t getSlot() const { return slot; }

 protected:
  mutable std::mutex subscriberMutex;
  vector<shared_ptr<SubscriberQueue>> subscribers;
  size_t slot;
  bool failed;
  string failureReason;
};
}  // namespace apt

#endif  // __APT_BROADCAST_CHANNEL__
