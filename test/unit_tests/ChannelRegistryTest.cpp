#include "CancellationToken.hpp"
#include "ChannelRegistry.hpp"
#include "TestHeaders.hpp"

using namespace apt;

namespace {
const uint16_t MOVE_HOMED = 0x0444;
const uint16_t MOVE_COMPLETED = 0x0464;
const uint16_t MOVE_STOPPED = 0x0466;

shared_ptr<const Message> homed(uint8_t channel) {
  return make_shared<const Message>(Message::headerOnly(
      MOVE_HOMED, channel, 0, HOST_ADDRESS, USB_UNIT_ADDRESS));
}
}  // namespace

TEST_CASE("Broadcasts to every subscriber in order", "[ChannelRegistry]") {
  auto registry = make_shared<ChannelRegistry>();
  vector<Subscription> subscriptions;
  for (int i = 0; i < 4; ++i) {
    subscriptions.push_back(registry->subscribe(MOVE_HOMED));
  }
  CHECK(subscriptions[0].isNew());
  CHECK_FALSE(subscriptions[3].isNew());
  CHECK(registry->activeSlotCount() == 1);
  CHECK(registry->subscriberCount(MOVE_HOMED) == 4);

  for (uint8_t c = 1; c <= 3; ++c) {
    CHECK(registry->publish(homed(c)) == 4);
  }
  for (auto& subscription : subscriptions) {
    for (uint8_t c = 1; c <= 3; ++c) {
      shared_ptr<const Message> m;
      REQUIRE(subscription.tryNext(&m));
      CHECK(m->getParam1() == c);
    }
    shared_ptr<const Message> m;
    CHECK_FALSE(subscription.tryNext(&m));
  }
}

TEST_CASE("Late subscribers see no replay", "[ChannelRegistry]") {
  auto registry = make_shared<ChannelRegistry>();
  CHECK(registry->publish(homed(1)) == 0);

  Subscription early = registry->subscribe(MOVE_HOMED);
  CHECK(registry->publish(homed(2)) == 1);
  Subscription late = registry->subscribe(MOVE_HOMED);
  CHECK(registry->publish(homed(3)) == 2);

  shared_ptr<const Message> m;
  REQUIRE(early.tryNext(&m));
  CHECK(m->getParam1() == 2);
  REQUIRE(late.tryNext(&m));
  CHECK(m->getParam1() == 3);
  CHECK_FALSE(late.tryNext(&m));
}

TEST_CASE("Grouped identities share a slot", "[ChannelRegistry]") {
  auto registry = make_shared<ChannelRegistry>();
  Subscription outcome = registry->subscribe(MOVE_COMPLETED);
  auto stopped = make_shared<const Message>(Message::withData(
      MOVE_STOPPED, string(14, '\0'), HOST_ADDRESS, USB_UNIT_ADDRESS));
  CHECK(registry->publish(stopped) == 1);
  shared_ptr<const Message> m;
  REQUIRE(outcome.tryNext(&m));
  CHECK(m->getIdentity() == MOVE_STOPPED);
  CHECK_FALSE(registry->subscribe(MOVE_STOPPED).isNew());
}

TEST_CASE("Concurrent first subscribers observe one channel",
          "[ChannelRegistry]") {
  for (int trial = 0; trial < 20; ++trial) {
    auto registry = make_shared<ChannelRegistry>();
    const int threadCount = 8;
    vector<Subscription> subscriptions(threadCount);
    vector<thread> threads;
    atomic<bool> go(false);
    for (int i = 0; i < threadCount; ++i) {
      threads.emplace_back([&, i]() {
        while (!go) {
          std::this_thread::yield();
        }
        subscriptions[i] = registry->subscribe(MOVE_HOMED);
      });
    }
    go = true;
    for (auto& t : threads) {
      t.join();
    }

    int created = 0;
    for (auto& subscription : subscriptions) {
      REQUIRE(subscription.isActive());
      if (subscription.isNew()) {
        created++;
      }
    }
    CHECK(created == 1);
    CHECK(registry->activeSlotCount() == 1);
    CHECK(registry->publish(homed(1)) == size_t(threadCount));
  }
}

TEST_CASE("Empty slots are reclaimed", "[ChannelRegistry]") {
  SECTION("reclaim on") {
    auto registry = make_shared<ChannelRegistry>(true);
    {
      Subscription a = registry->subscribe(MOVE_HOMED);
      Subscription b = registry->subscribe(MOVE_HOMED);
      CHECK(registry->activeSlotCount() == 1);
      a.unsubscribe();
      CHECK(registry->activeSlotCount() == 1);
    }
    CHECK(registry->activeSlotCount() == 0);
    CHECK(registry->subscribe(MOVE_HOMED).isNew());
  }

  SECTION("reclaim off") {
    auto registry = make_shared<ChannelRegistry>(false);
    { Subscription a = registry->subscribe(MOVE_HOMED); }
    CHECK(registry->activeSlotCount() == 1);
    CHECK(registry->subscriberCount(MOVE_HOMED) == 0);
    CHECK(registry->subscribe(MOVE_HOMED).isNew());
  }
}

TEST_CASE("Moved subscriptions keep their slot", "[ChannelRegistry]") {
  auto registry = make_shared<ChannelRegistry>();
  Subscription a = registry->subscribe(MOVE_HOMED);
  Subscription b(std::move(a));
  CHECK_FALSE(a.isActive());
  CHECK(b.isActive());
  CHECK(registry->subscriberCount(MOVE_HOMED) == 1);

  Subscription c;
  c = std::move(b);
  CHECK(registry->publish(homed(5)) == 1);
  shared_ptr<const Message> m;
  REQUIRE(c.tryNext(&m));
  CHECK(m->getParam1() == 5);
}

TEST_CASE("Unknown identities cannot be subscribed", "[ChannelRegistry]") {
  auto registry = make_shared<ChannelRegistry>();
  REQUIRE_THROWS_AS(registry->subscribe(0x7777), std::invalid_argument);
  CHECK(registry->activeSlotCount() == 0);
}

TEST_CASE("failAll wakes every waiter", "[ChannelRegistry]") {
  auto registry = make_shared<ChannelRegistry>();
  Subscription queued = registry->subscribe(MOVE_HOMED);
  registry->publish(homed(1));
  Subscription waiting = registry->subscribe(MOVE_COMPLETED);

  std::future<WaitStatus> waiter = std::async(std::launch::async, [&]() {
    shared_ptr<const Message> m;
    return waiting.waitFor(std::chrono::seconds(10), nullptr, &m);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  registry->failAll("device unplugged");
  CHECK(waiter.get() == WaitStatus::TRANSPORT_FAILED);
  CHECK(waiting.getFailureReason() == "device unplugged");

  // Messages already queued are still delivered first
  shared_ptr<const Message> m;
  CHECK(queued.waitFor(std::chrono::milliseconds(0), nullptr, &m) ==
        WaitStatus::DELIVERED);
  CHECK(queued.waitFor(std::chrono::milliseconds(0), nullptr, &m) ==
        WaitStatus::TRANSPORT_FAILED);

  // New subscriptions are born failed
  Subscription late = registry->subscribe(MOVE_STOPPED);
  CHECK(late.waitFor(std::chrono::seconds(10), nullptr, &m) ==
        WaitStatus::TRANSPORT_FAILED);
  CHECK(registry->isFailed());
}

TEST_CASE("Cancellation ends a wait", "[ChannelRegistry]") {
  auto registry = make_shared<ChannelRegistry>();
  Subscription subscription = registry->subscribe(MOVE_HOMED);
  auto token = make_shared<CancellationToken>();

  auto start = std::chrono::steady_clock::now();
  std::future<WaitStatus> waiter = std::async(std::launch::async, [&]() {
    shared_ptr<const Message> m;
    return subscription.waitFor(std::chrono::seconds(10), token, &m);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  token->cancel();
  CHECK(waiter.get() == WaitStatus::CANCELLED);
  CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));

  // An already cancelled token ends the wait immediately
  shared_ptr<const Message> m;
  CHECK(subscription.waitFor(std::chrono::seconds(10), token, &m) ==
        WaitStatus::CANCELLED);
}

TEST_CASE("Delivery and timeout resolve to one outcome", "[ChannelRegistry]") {
  auto registry = make_shared<ChannelRegistry>();
  int delivered = 0;
  int timedOut = 0;
  for (int trial = 0; trial < 200; ++trial) {
    Subscription subscription = registry->subscribe(MOVE_HOMED);
    std::thread publisher([&]() {
      std::this_thread::sleep_for(std::chrono::microseconds(rand() % 2000));
      registry->publish(homed(1));
    });
    shared_ptr<const Message> m;
    WaitStatus status = subscription.waitFor(std::chrono::milliseconds(1),
                                             nullptr, &m);
    publisher.join();
    if (status == WaitStatus::DELIVERED) {
      REQUIRE(m);
      delivered++;
    } else {
      REQUIRE(status == WaitStatus::TIMED_OUT);
      REQUIRE_FALSE(m);
      timedOut++;
    }
  }
  CHECK(delivered + timedOut == 200);
}

TEST_CASE("Pending requests are tracked apart from subscribers",
          "[ChannelRegistry]") {
  auto registry = make_shared<ChannelRegistry>();
  Subscription listener = registry->subscribe(MOVE_HOMED);
  CHECK(registry->pendingRequestCount(MOVE_HOMED) == 0);

  CHECK_FALSE(registry->beginRequest(MOVE_HOMED));
  CHECK(registry->beginRequest(MOVE_HOMED));
  CHECK(registry->pendingRequestCount(MOVE_HOMED) == 2);
  CHECK(registry->pendingRequestCount(MOVE_COMPLETED) == 0);

  registry->endRequest(MOVE_HOMED);
  registry->endRequest(MOVE_HOMED);
  CHECK(registry->pendingRequestCount(MOVE_HOMED) == 0);
  CHECK_FALSE(registry->beginRequest(MOVE_HOMED));
  registry->endRequest(MOVE_HOMED);
}
