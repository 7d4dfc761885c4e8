#include "DeviceConnection.hpp"
#include "FakeSerialHandler.hpp"
#include "TestHeaders.hpp"

using namespace apt;
using Catch::Matchers::Contains;

namespace {
shared_ptr<DeviceConnection> connectFake(shared_ptr<FakeSerialHandler> handler,
                                         const LinkOptions& options) {
  DeviceEndpoint endpoint;
  endpoint.set_path("/dev/fake-apt");
  auto connection = make_shared<DeviceConnection>(handler, endpoint, options);
  connection->connect();
  return connection;
}

void waitUntil(std::function<bool()> condition) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!condition() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  REQUIRE(condition());
}
}  // namespace

TEST_CASE("Reader frames and dispatches device traffic", "[DeviceConnection]") {
  auto handler = make_shared<FakeSerialHandler>();
  LinkOptions options;
  options.set_read_chunk_size(5);
  auto connection = connectFake(handler, options);
  int fd = connection->getFd();

  Subscription status = connection->getRegistry()->subscribe(0x042A);
  Message bits =
      Message::withData(0x042A, string("\x01\x00\x00\x04\x00\x80", 6),
                        HOST_ADDRESS, USB_UNIT_ADDRESS);
  Message homed =
      Message::headerOnly(0x0444, 1, 0, HOST_ADDRESS, USB_UNIT_ADDRESS);
  handler->inject(fd, bits.serialize() + homed.serialize());

  shared_ptr<const Message> m;
  REQUIRE(status.waitFor(std::chrono::seconds(5), nullptr, &m) ==
          WaitStatus::DELIVERED);
  CHECK(*m == bits);

  waitUntil([&]() { return connection->getStats().messages_decoded() == 2; });
  LinkStats stats = connection->getStats();
  CHECK(stats.bytes_read() == 18);
  CHECK(stats.messages_delivered() == 1);
  CHECK(stats.messages_unmatched() == 1);
  CHECK(stats.decode_errors() == 0);

  connection->shutdown();
  CHECK_FALSE(connection->isConnected());
  CHECK_FALSE(handler->isOpen(fd));
  CHECK_THROWS_AS(connection->write(homed), std::runtime_error);
}

TEST_CASE("Writes reach the device in order", "[DeviceConnection]") {
  auto handler = make_shared<FakeSerialHandler>();
  auto connection = connectFake(handler, LinkOptions());
  vector<thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&connection, t]() {
      for (int i = 0; i < 25; ++i) {
        connection->write(
            Message::withData(0x0453, string(6, char('a' + t))));
      }
    });
  }
  for (auto& t : writers) {
    t.join();
  }
  string written = handler->getWritten(connection->getFd());
  REQUIRE(written.size() == 100 * 12);
  // Every 12 byte frame arrives intact
  for (size_t pos = 0; pos < written.size(); pos += 12) {
    Message frame(written.substr(pos, 12));
    CHECK(frame.getIdentity() == 0x0453);
    CHECK(frame.getData() == string(6, frame.getData()[0]));
  }
  connection->shutdown();
}

TEST_CASE("End of stream fails waiters", "[DeviceConnection]") {
  auto handler = make_shared<FakeSerialHandler>();
  auto connection = connectFake(handler, LinkOptions());
  int fd = connection->getFd();
  Subscription homed = connection->getRegistry()->subscribe(0x0444);

  SECTION("clean disconnect") {
    handler->endOfStream(fd);
    shared_ptr<const Message> m;
    CHECK(homed.waitFor(std::chrono::seconds(5), nullptr, &m) ==
          WaitStatus::TRANSPORT_FAILED);
    CHECK(connection->getFailureReason() == "Device disconnected");
    CHECK(connection->getStats().decode_errors() == 0);
  }

  SECTION("disconnect mid-frame") {
    handler->inject(fd, string("\x44\x04\x01", 3));
    handler->endOfStream(fd);
    shared_ptr<const Message> m;
    CHECK(homed.waitFor(std::chrono::seconds(5), nullptr, &m) ==
          WaitStatus::TRANSPORT_FAILED);
    CHECK_THAT(connection->getFailureReason(), Contains("mid-frame"));
    CHECK(connection->getStats().decode_errors() == 1);
  }

  CHECK(connection->isFailed());
  connection->shutdown();
}

TEST_CASE("Scan forward policy survives garbage", "[DeviceConnection]") {
  auto handler = make_shared<FakeSerialHandler>();
  LinkOptions options;
  options.set_decode_error_policy(SCAN_FORWARD);
  auto connection = connectFake(handler, options);
  Subscription homed = connection->getRegistry()->subscribe(0x0444);

  handler->inject(connection->getFd(),
                  string("\xFF\xFF", 2) +
                      Message::headerOnly(0x0444, 2, 0, HOST_ADDRESS,
                                          USB_UNIT_ADDRESS)
                          .serialize());
  shared_ptr<const Message> m;
  REQUIRE(homed.waitFor(std::chrono::seconds(5), nullptr, &m) ==
          WaitStatus::DELIVERED);
  CHECK(m->getParam1() == 2);
  CHECK_FALSE(connection->isFailed());
  waitUntil([&]() { return connection->getStats().bytes_skipped() == 2; });
  connection->shutdown();
}

TEST_CASE("A throwing unmatched handler keeps the reader alive",
          "[DeviceConnection]") {
  auto handler = make_shared<FakeSerialHandler>();
  auto connection = connectFake(handler, LinkOptions());
  connection->getDispatcher()->setUnmatchedHandler(
      [](const shared_ptr<const Message>&) {
        throw std::runtime_error("observer failed");
      });

  Message bits = Message::withData(0x042A, string(6, '\0'), HOST_ADDRESS,
                                   USB_UNIT_ADDRESS);
  handler->inject(connection->getFd(), bits.serialize());
  waitUntil(
      [&]() { return connection->getStats().messages_unmatched() == 1; });

  Subscription homed = connection->getRegistry()->subscribe(0x0444);
  handler->inject(connection->getFd(),
                  Message::headerOnly(0x0444, 1, 0, HOST_ADDRESS,
                                      USB_UNIT_ADDRESS)
                      .serialize());
  shared_ptr<const Message> m;
  REQUIRE(homed.waitFor(std::chrono::seconds(5), nullptr, &m) ==
          WaitStatus::DELIVERED);
  CHECK_FALSE(connection->isFailed());
  connection->shutdown();
}

TEST_CASE("Shutdown fails pending waiters", "[DeviceConnection]") {
  auto handler = make_shared<FakeSerialHandler>();
  auto connection = connectFake(handler, LinkOptions());
  Subscription homed = connection->getRegistry()->subscribe(0x0444);
  std::future<WaitStatus> waiter = std::async(std::launch::async, [&]() {
    shared_ptr<const Message> m;
    return homed.waitFor(std::chrono::seconds(10), nullptr, &m);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  connection->shutdown();
  CHECK(waiter.get() == WaitStatus::TRANSPORT_FAILED);
  CHECK_THROWS_AS(connection->connect(), std::runtime_error);
}
