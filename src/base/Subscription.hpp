#ifndef __APT_SUBSCRIPTION__
#define __APT_SUBSCRIPTION__

#include "BroadcastChannel.hpp"
#include "Headers.hpp"

namespace apt {
class ChannelRegistry;
class CancellationToken;

/**
 * @brief Receive handle for every message published to one channel slot
 * after the subscription was taken.
 *
 * Subscriptions are move-only.  Destroying one (or calling unsubscribe())
 * detaches it from its slot, which may let the registry reclaim the slot.
 */
class Subscription {
 public:
  Subscription() : identity(0), slot(0), created(false) {}
  Subscription(const weak_ptr<ChannelRegistry>& _registry, uint16_t _identity,
               size_t _slot, const shared_ptr<BroadcastChannel>& _channel,
               const shared_ptr<SubscriberQueue>& _queue, bool _created);
  Subscription(Subscription&& other) noexcept;
  Subscription& operator=(Subscription&& other) noexcept;
  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;
  ~Subscription();

  /** @brief True while attached to a slot. */
  bool isActive() const { return queue.get() != nullptr; }

  /**
   * @brief True if no other subscriber was waiting on the slot when this
   * subscription was taken.
   */
  bool isNew() const { return created; }

  uint16_t getIdentity() const { return identity; }
  size_t getSlot() const { return slot; }

  /** @brief Pops a queued message without waiting. */
  bool tryNext(shared_ptr<const Message>* message);

  /**
   * @brief Waits for the next message until the deadline.
   * @param token optional; cancelling it ends the wait with CANCELLED.
   */
  WaitStatus waitUntil(const chrono::steady_clock::time_point& deadline,
                       const shared_ptr<CancellationToken>& token,
                       shared_ptr<const Message>* message);

  WaitStatus waitFor(const chrono::milliseconds& timeout,
                     const shared_ptr<CancellationToken>& token,
                     shared_ptr<const Message>* message) {
    return waitUntil(chrono::steady_clock::now() + timeout, token, message);
  }

  size_t pending() const;
  string getFailureReason() const;

  /** @brief Detaches from the slot.  Safe to call more than once. */
  void unsubscribe();

 protected:
  weak_ptr<ChannelRegistry> registry;
  uint16_t identity;
  size_t slot;
  shared_ptr<BroadcastChannel> channel;
  shared_ptr<SubscriberQueue> queue;
  bool created;
};
}  // namespace apt

#endif  // __APT_SUBSCRIPTION__
