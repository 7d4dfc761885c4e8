#ifndef __APT_CANCELLATION_TOKEN__
#define __APT_CANCELLATION_TOKEN__

#include "Headers.hpp"

namespace apt {
/**
 * @brief One-shot cancellation signal shared between the party that starts
 * an operation and the party that may abandon it.
 *
 * Listeners registered with addListener() run exactly once, on the thread
 * that calls cancel(), or immediately if the token is already cancelled.
 */
class CancellationToken {
 public:
  CancellationToken() : cancelled(false), nextListenerId(1) {}

  void cancel();

  bool isCancelled() const { return cancelled; }

  int addListener(const function<void()>& listener);

  void removeListener(int listenerId);

 protected:
  mutex listenerMutex;
  atomic<bool> cancelled;
  int nextListenerId;
  map<int, function<void()>> listeners;
};
}  // namespace apt

#endif  // __APT_CANCELLATION_TOKEN__
