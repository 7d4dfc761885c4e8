#include "BroadcastChannel.hpp"

#include "CancellationToken.hpp"

namespace apt {
const char* waitStatusName(WaitStatus status) {
  switch (status) {
    case WaitStatus::DELIVERED:
      return "DELIVERED";
    case WaitStatus::TIMED_OUT:
      return "TIMED_OUT";
    case WaitStatus::CANCELLED:
      return "CANCELLED";
    case WaitStatus::TRANSPORT_FAILED:
      return "TRANSPORT_FAILED";
  }
  return "UNKNOWN";
}

void SubscriberQueue::push(const shared_ptr<const Message>& message) {
  {
    lock_guard<std::mutex> guard(queueMutex);
    messages.push_back(message);
  }
  queueCondition.notify_all();
}

void SubscriberQueue::fail(const string& reason) {
  {
    lock_guard<std::mutex> guard(queueMutex);
    if (failed) {
      return;
    }
    failed = true;
    failureReason = reason;
  }
  queueCondition.notify_all();
}

void SubscriberQueue::interrupt() {
  {
    // Taking the lock orders this wakeup after any in-progress check.
    lock_guard<std::mutex> guard(queueMutex);
  }
  queueCondition.notify_all();
}

bool SubscriberQueue::tryPop(shared_ptr<const Message>* message) {
  lock_guard<std::mutex> guard(queueMutex);
  if (messages.empty()) {
    return false;
  }
  *message = messages.front();
  messages.pop_front();
  return true;
}

WaitStatus SubscriberQueue::waitUntil(
    const chrono::steady_clock::time_point& deadline,
    const CancellationToken* token, shared_ptr<const Message>* message) {
  unique_lock<std::mutex> lock(queueMutex);
  while (true) {
    if (!messages.empty()) {
      *message = messages.front();
      messages.pop_front();
      return WaitStatus::DELIVERED;
    }
    if (token && token->isCancelled()) {
      return WaitStatus::CANCELLED;
    }
    if (failed) {
      return WaitStatus::TRANSPORT_FAILED;
    }
    if (chrono::steady_clock::now() >= deadline) {
      return WaitStatus::TIMED_OUT;
    }
    queueCondition.wait_until(lock, deadline);
  }
}

size_t SubscriberQueue::size() const {
  lock_guard<std::mutex> guard(queueMutex);
  return messages.size();
}

bool SubscriberQueue::isFailed() const {
  lock_guard<std::mutex> guard(queueMutex);
  return failed;
}

string SubscriberQueue::getFailureReason() const {
  lock_guard<std::mutex> guard(queueMutex);
  return failureReason;
}

shared_ptr<SubscriberQueue> BroadcastChannel::addSubscriber(bool* first) {
  auto queue = make_shared<SubscriberQueue>();
  lock_guard<std::mutex> guard(subscriberMutex);
  if (failed) {
    queue->fail(failureReason);
  }
  *first = subscribers.empty();
  subscribers.push_back(queue);
  return queue;
}

size_t BroadcastChannel::removeSubscriber(
    const shared_ptr<SubscriberQueue>& queue) {
  lock_guard<std::mutex> guard(subscriberMutex);
  auto it = std::find(subscribers.begin(), subscribers.end(), queue);
  if (it == subscribers.end()) {
    STFATAL << "Tried to remove a subscriber that is not attached to slot "
            << slot;
  }
  subscribers.erase(it);
  return subscribers.size();
}

size_t BroadcastChannel::publish(const shared_ptr<const Message>& message) {
  lock_guard<std::mutex> guard(subscriberMutex);
  for (auto& queue : subscribers) {
    queue->push(message);
  }
  return subscribers.size();
}

void BroadcastChannel::fail(const string& reason) {
  lock_guard<std::mutex> guard(subscriberMutex);
  failed = true;
  failureReason = reason;
  for (auto& queue : subscribers) {
    queue->fail(reason);
  }
}

size_t BroadcastChannel::subscriberCount() const {
  lock_guard<std::mutex> guard(subscriberMutex);
  return subscribers.size();
}
}  // namespace apt
