#ifndef __APT_DISPATCHER__
#define __APT_DISPATCHER__

#include "ChannelRegistry.hpp"
#include "Headers.hpp"
#include "Message.hpp"

namespace apt {
/**
 * @brief Routes decoded messages into the channel registry.
 */
class Dispatcher {
 public:
  typedef function<void(const shared_ptr<const Message>&)> UnmatchedHandler;

  explicit Dispatcher(shared_ptr<ChannelRegistry> _registry);

  /**
   * @brief Publishes the message to its channel slot.  Messages that reach
   * no subscriber are counted and handed to the unmatched handler.
   * @return the number of subscribers that received the message.
   */
  size_t dispatch(const shared_ptr<const Message>& message);

  /** @brief Installs a hook for messages nobody is waiting on. */
  void setUnmatchedHandler(const UnmatchedHandler& handler);

  int64_t getDispatched() const { return dispatched; }
  int64_t getDelivered() const { return delivered; }
  int64_t getUnmatched() const { return unmatched; }

  shared_ptr<ChannelRegistry> getRegistry() { return registry; }

 protected:
  shared_ptr<ChannelRegistry> registry;
  std::mutex handlerMutex;
  UnmatchedHandler unmatchedHandler;
  atomic<int64_t> dispatched;
  atomic<int64_t> delivered;
  atomic<int64_t> unmatched;
};
}  // namespace apt

#endif  // __APT_DISPATCHER__
