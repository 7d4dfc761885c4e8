#include "Dispatcher.hpp"
#include "TestHeaders.hpp"

using namespace apt;

TEST_CASE("Dispatches to subscribers and counts unmatched", "[Dispatcher]") {
  auto registry = make_shared<ChannelRegistry>();
  Dispatcher dispatcher(registry);

  vector<uint16_t> unmatched;
  dispatcher.setUnmatchedHandler(
      [&unmatched](const shared_ptr<const Message>& message) {
        unmatched.push_back(message->getIdentity());
      });

  Subscription homed = registry->subscribe(0x0444);
  auto homedMessage = make_shared<const Message>(
      Message::headerOnly(0x0444, 1, 0, HOST_ADDRESS, USB_UNIT_ADDRESS));
  auto statusMessage = make_shared<const Message>(Message::withData(
      0x042A, string(6, '\0'), HOST_ADDRESS, USB_UNIT_ADDRESS));

  CHECK(dispatcher.dispatch(homedMessage) == 1);
  CHECK(dispatcher.dispatch(statusMessage) == 0);
  CHECK(dispatcher.dispatch(homedMessage) == 1);

  CHECK(dispatcher.getDispatched() == 3);
  CHECK(dispatcher.getDelivered() == 2);
  CHECK(dispatcher.getUnmatched() == 1);
  REQUIRE(unmatched.size() == 1);
  CHECK(unmatched[0] == 0x042A);

  shared_ptr<const Message> m;
  REQUIRE(homed.tryNext(&m));
  CHECK(m.get() == homedMessage.get());
}

TEST_CASE("A slow subscriber does not stall dispatch", "[Dispatcher]") {
  auto registry = make_shared<ChannelRegistry>();
  Dispatcher dispatcher(registry);
  Subscription idle = registry->subscribe(0x0491);
  auto update = make_shared<const Message>(Message::withData(
      0x0491, string(14, '\0'), HOST_ADDRESS, USB_UNIT_ADDRESS));
  for (int i = 0; i < 10000; ++i) {
    dispatcher.dispatch(update);
  }
  CHECK(idle.pending() == 10000);
}

TEST_CASE("A throwing unmatched handler does not escape dispatch",
          "[Dispatcher]") {
  auto registry = make_shared<ChannelRegistry>();
  Dispatcher dispatcher(registry);
  int calls = 0;
  dispatcher.setUnmatchedHandler(
      [&calls](const shared_ptr<const Message>&) {
        calls++;
        throw std::runtime_error("handler exploded");
      });

  auto homedMessage = make_shared<const Message>(
      Message::headerOnly(0x0444, 1, 0, HOST_ADDRESS, USB_UNIT_ADDRESS));
  size_t receivers = 1;
  REQUIRE_NOTHROW(receivers = dispatcher.dispatch(homedMessage));
  CHECK(receivers == 0);
  REQUIRE_NOTHROW(dispatcher.dispatch(homedMessage));
  CHECK(calls == 2);
  CHECK(dispatcher.getUnmatched() == 2);
}
