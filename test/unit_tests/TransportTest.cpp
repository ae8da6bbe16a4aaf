#include "LoopbackListener.hpp"
#include "TcpSocketHandler.hpp"
#include "TestHeaders.hpp"
#include "TransportFactory.hpp"

using namespace td;
using Catch::Matchers::ContainsSubstring;

namespace {
class TransportFixture {
 public:
  TransportFixture()
      : socketHandler(new TcpSocketHandler()), factory(socketHandler) {
    transport = factory.connect(listener.getEndpoint(), 2000);
    serverFd = listener.acceptOne(2000);
    REQUIRE(serverFd != -1);
  }

  ~TransportFixture() {
    transport.reset();
    if (serverFd != -1) {
      ::close(serverFd);
    }
  }

  LoopbackListener listener;
  shared_ptr<TcpSocketHandler> socketHandler;
  TcpTransportFactory factory;
  unique_ptr<Transport> transport;
  int serverFd;
};

const size_t LARGE_WRITE_SIZE = 32 * 1024 * 1024;
}  // namespace

TEST_CASE("Connect failure is reported", "[Transport]") {
  int port;
  {
    LoopbackListener closed;
    port = closed.getEndpoint().getPort();
  }
  TcpTransportFactory factory(make_shared<TcpSocketHandler>());
  REQUIRE_THROWS_AS(factory.connect(SocketEndpoint("127.0.0.1", port), 500),
                    TransportError);
}

TEST_CASE("Writes to a peer that never reads stall out", "[Transport]") {
  TransportFixture fixture;
  fixture.transport->setWriteTimeout(1);
  string payload(LARGE_WRITE_SIZE, 'x');
  auto start = chrono::steady_clock::now();
  try {
    fixture.transport->writeAll(payload);
    FAIL("writeAll() did not throw");
  } catch (const TimeoutError& te) {
    REQUIRE_THAT(te.what(), ContainsSubstring("stalled for 1 seconds"));
  }
  auto elapsed = chrono::steady_clock::now() - start;
  REQUIRE(elapsed >= chrono::seconds(1));
  REQUIRE(elapsed < chrono::seconds(5));
}

TEST_CASE("A slow reader keeps a large write alive", "[Transport]") {
  TransportFixture fixture;
  fixture.transport->setWriteTimeout(1);
  int serverFd = fixture.serverFd;
  size_t received = 0;
  thread reader([serverFd, &received]() {
    char buf[64 * 1024];
    while (received < LARGE_WRITE_SIZE) {
      ssize_t n = ::read(serverFd, buf, sizeof(buf));
      if (n <= 0) {
        break;
      }
      received += n;
    }
  });
  string payload(LARGE_WRITE_SIZE, 'x');
  fixture.transport->writeAll(payload);
  reader.join();
  REQUIRE(received == LARGE_WRITE_SIZE);
}

TEST_CASE("Cancel check interrupts a blocked read", "[Transport]") {
  TransportFixture fixture;
  atomic<bool> cancelled(false);
  fixture.transport->setCancelCheck([&cancelled]() { return bool(cancelled); });
  thread canceller([&cancelled]() {
    std::this_thread::sleep_for(chrono::milliseconds(200));
    cancelled = true;
  });
  char buf[16];
  auto start = chrono::steady_clock::now();
  REQUIRE_THROWS_AS(fixture.transport->readAll(buf, sizeof(buf)),
                    CancelledError);
  REQUIRE(chrono::steady_clock::now() - start < chrono::seconds(2));
  canceller.join();

  fixture.transport->clearCancelCheck();
  string reply = "ok";
  REQUIRE(::write(fixture.serverFd, reply.data(), reply.size()) == 2);
  fixture.transport->readAll(buf, 2);
  REQUIRE(string(buf, 2) == "ok");
}

TEST_CASE("Deadline bounds a blocked read", "[Transport]") {
  TransportFixture fixture;
  fixture.transport->setDeadline(chrono::steady_clock::now() +
                                 chrono::milliseconds(200));
  char buf[16];
  REQUIRE_THROWS_AS(fixture.transport->readAll(buf, sizeof(buf)),
                    TimeoutError);
  REQUIRE(fixture.transport->getDeadline().has_value());
  fixture.transport->clearDeadline();
  REQUIRE_FALSE(fixture.transport->getDeadline().has_value());
}

TEST_CASE("Peer close during read is an error", "[Transport]") {
  TransportFixture fixture;
  ::close(fixture.serverFd);
  fixture.serverFd = -1;
  char buf[16];
  try {
    fixture.transport->readAll(buf, sizeof(buf));
    FAIL("readAll() did not throw");
  } catch (const TransportError& te) {
    REQUIRE_THAT(te.what(), ContainsSubstring("Connection closed by"));
  }
}
