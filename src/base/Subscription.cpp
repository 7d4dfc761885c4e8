#include "Subscription.hpp"

#include "CancellationToken.hpp"
#include "ChannelRegistry.hpp"

namespace apt {
Subscription::Subscription(const weak_ptr<ChannelRegistry>& _registry,
                           uint16_t _identity, size_t _slot,
                           const shared_ptr<BroadcastChannel>& _channel,
                           const shared_ptr<SubscriberQueue>& _queue,
                           bool _created)
    : registry(_registry),
      identity(_identity),
      slot(_slot),
      channel(_channel),
      queue(_queue),
      created(_created) {}

Subscription::Subscription(Subscription&& other) noexcept
    : registry(std::move(other.registry)),
      identity(other.identity),
      slot(other.slot),
      channel(std::move(other.channel)),
      queue(std::move(other.queue)),
      created(other.created) {
  other.channel.reset();
  other.queue.reset();
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    unsubscribe();
    registry = std::move(other.registry);
    identity = other.identity;
    slot = other.slot;
    channel = std::move(other.channel);
    queue = std::move(other.queue);
    created = other.created;
    other.channel.reset();
    other.queue.reset();
  }
  return *this;
}

Subscription::~Subscription() { unsubscribe(); }

bool Subscription::tryNext(shared_ptr<const Message>* message) {
  if (!queue) {
    throw std::logic_error("Subscription is no longer active");
  }
  return queue->tryPop(message);
}

WaitStatus Subscription::waitUntil(
    const chrono::steady_clock::time_point& deadline,
    const shared_ptr<CancellationToken>& token,
    shared_ptr<const Message>* message) {
  if (!queue) {
    throw std::logic_error("Subscription is no longer active");
  }
  int listenerId = 0;
  if (token) {
    shared_ptr<SubscriberQueue> wakeQueue = queue;
    listenerId = token->addListener([wakeQueue]() { wakeQueue->interrupt(); });
  }
  WaitStatus status = queue->waitUntil(deadline, token.get(), message);
  if (token && listenerId) {
    token->removeListener(listenerId);
  }
  VLOG(2) << "Wait on " << identityToString(identity) << " ended with "
          << waitStatusName(status);
  return status;
}

size_t Subscription::pending() const { return queue ? queue->size() : 0; }

string Subscription::getFailureReason() const {
  return queue ? queue->getFailureReason() : string();
}

void Subscription::unsubscribe() {
  if (!queue) {
    return;
  }
  shared_ptr<ChannelRegistry> owner = registry.lock();
  if (owner) {
    owner->unsubscribe(channel, queue);
  } else {
    channel->removeSubscriber(queue);
  }
  channel.reset();
  queue.reset();
}
}  // namespace apt
