#include "ChannelRegistry.hpp"

namespace apt {
ChannelRegistry::ChannelRegistry(bool _reclaimEmptySlots)
    : slots(ProtocolTable::channelCount()),
      reclaimEmptySlots(_reclaimEmptySlots),
      failed(false) {}

Subscription ChannelRegistry::subscribe(uint16_t identity) {
  const ProtocolEntry* entry = ProtocolTable::find(identity);
  if (entry == nullptr) {
    throw std::invalid_argument("Cannot subscribe to unknown identity " +
                                identityToString(identity));
  }
  size_t slot = entry->slot;
  bool first = false;
  shared_ptr<BroadcastChannel> channel;
  shared_ptr<SubscriberQueue> queue;
  {
    std::shared_lock<std::shared_mutex> guard(registryMutex);
    channel = slots[slot];
    if (channel) {
      queue = channel->addSubscriber(&first);
    }
  }
  if (!queue) {
    std::unique_lock<std::shared_mutex> guard(registryMutex);
    channel = slots[slot];
    if (!channel) {
      VLOG(1) << "Creating channel " << ProtocolTable::channelName(slot)
              << " for " << entry->name;
      channel = make_shared<BroadcastChannel>(slot);
      if (failed) {
        channel->fail(failureReason);
      }
      slots[slot] = channel;
    }
    queue = channel->addSubscriber(&first);
  }
  VLOG(2) << "Subscribed to " << entry->name << " on channel "
          << ProtocolTable::channelName(slot) << (first ? " (new)" : "");
  return Subscription(weak_from_this(), identity, slot, channel, queue, first);
}

size_t ChannelRegistry::publish(const shared_ptr<const Message>& message) {
  const ProtocolEntry* entry = ProtocolTable::find(message->getIdentity());
  if (entry == nullptr) {
    LOG(WARNING) << "Refusing to publish unknown identity "
                 << identityToString(message->getIdentity());
    return 0;
  }
  std::shared_lock<std::shared_mutex> guard(registryMutex);
  const shared_ptr<BroadcastChannel>& channel = slots[entry->slot];
  if (!channel) {
    return 0;
  }
  return channel->publish(message);
}

void ChannelRegistry::failAll(const string& reason) {
  std::unique_lock<std::shared_mutex> guard(registryMutex);
  if (failed) {
    return;
  }
  LOG(INFO) << "Failing all channels: " << reason;
  failed = true;
  failureReason = reason;
  for (auto& channel : slots) {
    if (channel) {
      channel->fail(reason);
    }
  }
}

void ChannelRegistry::unsubscribe(const shared_ptr<BroadcastChannel>& channel,
                                  const shared_ptr<SubscriberQueue>& queue) {
  std::unique_lock<std::shared_mutex> guard(registryMutex);
  size_t remaining = channel->removeSubscriber(queue);
  size_t slot = channel->getSlot();
  if (remaining == 0 && reclaimEmptySlots && slots[slot] == channel) {
    VLOG(1) << "Reclaiming channel " << ProtocolTable::channelName(slot);
    slots[slot].reset();
  }
}

bool ChannelRegistry::beginRequest(uint16_t identity) {
  lock_guard<std::mutex> guard(pendingMutex);
  return pendingRequests[identity]++ > 0;
}

void ChannelRegistry::endRequest(uint16_t identity) {
  lock_guard<std::mutex> guard(pendingMutex);
  auto it = pendingRequests.find(identity);
  if (it == pendingRequests.end()) {
    STFATAL << "No request in flight for " << identityToString(identity);
  }
  if (--it->second == 0) {
    pendingRequests.erase(it);
  }
}

int ChannelRegistry::pendingRequestCount(uint16_t identity) const {
  lock_guard<std::mutex> guard(pendingMutex);
  auto it = pendingRequests.find(identity);
  return it == pendingRequests.end() ? 0 : it->second;
}

size_t ChannelRegistry::activeSlotCount() const {
  std::shared_lock<std::shared_mutex> guard(registryMutex);
  size_t count = 0;
  for (const auto& channel : slots) {
    if (channel) {
      count++;
    }
  }
  return count;
}

size_t ChannelRegistry::subscriberCount(uint16_t identity) const {
  size_t slot = ProtocolTable::channelSlot(identity);
  std::shared_lock<std::shared_mutex> guard(registryMutex);
  return slots[slot] ? slots[slot]->subscriberCount() : 0;
}

bool ChannelRegistry::isFailed() const {
  std::shared_lock<std::shared_mutex> guard(registryMutex);
  return failed;
}
}  // namespace apt
