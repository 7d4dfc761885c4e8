#ifndef __APT_CHANNEL_REGISTRY__
#define __APT_CHANNEL_REGISTRY__

#include "BroadcastChannel.hpp"
#include "Headers.hpp"
#include "Message.hpp"
#include "ProtocolTable.hpp"
#include "Subscription.hpp"

namespace apt {
/**
 * @brief Maps every protocol identity to the live broadcast channel of its
 * channel slot.
 *
 * Slots are created on first subscription and, when reclaimEmptySlots is
 * set, torn down when their last subscriber leaves.  One registry belongs to
 * one connection.  Registries must be owned by a shared_ptr because
 * subscriptions hold a weak reference back to them.
 */
class ChannelRegistry : public std::enable_shared_from_this<ChannelRegistry> {
 public:
  explicit ChannelRegistry(bool _reclaimEmptySlots = true);

  /**
   * @brief Subscribes to the slot of the given identity.  Only messages
   * published after this call returns are received.
   * @throws std::invalid_argument if the identity is not in the table.
   */
  Subscription subscribe(uint16_t identity);

  /**
   * @brief Delivers the message to every current subscriber of its slot.
   * @return the number of subscribers reached; zero means it was dropped.
   */
  size_t publish(const shared_ptr<const Message>& message);

  /**
   * @brief Fails every live channel so that all waiters wake with a
   * transport failure.  Later subscriptions are born failed.
   */
  void failAll(const string& reason);

  /**
   * @brief Records a request in flight for the response identity.
   * @return true if another request for the same identity was already in
   * flight.
   */
  bool beginRequest(uint16_t identity);
  void endRequest(uint16_t identity);
  int pendingRequestCount(uint16_t identity) const;

  size_t activeSlotCount() const;
  size_t subscriberCount(uint16_t identity) const;
  bool isFailed() const;
  bool reclaimsEmptySlots() const { return reclaimEmptySlots; }

 protected:
  friend class Subscription;

  void unsubscribe(const shared_ptr<BroadcastChannel>& channel,
                   const shared_ptr<SubscriberQueue>& queue);

  mutable std::shared_mutex registryMutex;
  /** @brief Indexed by channel slot; null when the slot is absent. */
  vector<shared_ptr<BroadcastChannel>> slots;
  bool reclaimEmptySlots;
  mutable std::mutex pendingMutex;
  /** @brief In-flight requests by response identity. */
  map<uint16_t, int> pendingRequests;
  bool failed;
  string failureReason;
};
}  // namespace apt

#endif  // __APT_CHANNEL_REGISTRY__
