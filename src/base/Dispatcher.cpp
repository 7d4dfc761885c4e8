#include "Dispatcher.hpp"

namespace apt {
Dispatcher::Dispatcher(shared_ptr<ChannelRegistry> _registry)
    : registry(_registry), dispatched(0), delivered(0), unmatched(0) {}

size_t Dispatcher::dispatch(const shared_ptr<const Message>& message) {
  dispatched++;
  size_t receivers = registry->publish(message);
  if (receivers > 0) {
    delivered++;
    VLOG(2) << "Dispatched " << *message << " to " << receivers
            << " subscribers";
    return receivers;
  }

  unmatched++;
  VLOG(2) << "No subscriber for " << *message;
  UnmatchedHandler handler;
  {
    lock_guard<std::mutex> guard(handlerMutex);
    handler = unmatchedHandler;
  }
  if (handler) {
    try {
      handler(message);
    } catch (const std::exception& ex) {
      LOG(WARNING) << "Unmatched message handler failed on " << *message
                   << ": " << ex.what();
    }
  }
  return 0;
}

void Dispatcher::setUnmatchedHandler(const UnmatchedHandler& handler) {
  lock_guard<std::mutex> guard(handlerMutex);
  unmatchedHandler = handler;
}
}  // namespace apt
