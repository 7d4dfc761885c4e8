#include "CancellationToken.hpp"

namespace apt {
void CancellationToken::cancel() {
  map<int, function<void()>> toNotify;
  {
    lock_guard<std::mutex> guard(listenerMutex);
    if (cancelled) {
      return;
    }
    cancelled = true;
    toNotify.swap(listeners);
  }
  VLOG(1) << "Cancelling " << toNotify.size() << " listeners";
  for (auto& it : toNotify) {
    it.second();
  }
}

int CancellationToken::addListener(const function<void()>& listener) {
  {
    lock_guard<std::mutex> guard(listenerMutex);
    if (!cancelled) {
      int listenerId = nextListenerId++;
      listeners[listenerId] = listener;
      return listenerId;
    }
  }
  listener();
  return 0;
}

void CancellationToken::removeListener(int listenerId) {
  lock_guard<std::mutex> guard(listenerMutex);
  listeners.erase(listenerId);
}
}  // namespace apt
