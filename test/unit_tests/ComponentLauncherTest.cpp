#include "ComponentLauncher.hpp"
#include "FakeCodec.hpp"
#include "FakeTransportFactory.hpp"
#include "OrchestrationBus.hpp"
#include "TestHeaders.hpp"
#include "TestScripts.hpp"

using namespace td;

namespace {
/**
 * Runs the bus against real launchers: tunnels are shell scripts standing in
 * for cloudflared and sessions use the scripted codec.
 */
class LauncherFixture {
 public:
  LauncherFixture()
      : subprocessUtils(new SubprocessUtils()),
        processRegistry(new ProcessRegistry(subprocessUtils)),
        codec(new FakeCodec()),
        factory(new FakeTransportFactory()) {
    RdpSessionOptions options;
    options.negotiator.backoffMs = 10;
    options.negotiator.diagnosticTimeoutMs = 100;
    tunnelLauncher.reset(
        new ProcessTunnelLauncher(subprocessUtils, processRegistry));
    sessionLauncher.reset(new RdpSessionLauncher(codec, factory, options));
  }

  void createBus(const string& tunnelBinary) {
    BusConfig config;
    config.tunnelBinary = tunnelBinary;
    config.settleDelayMs = 0;
    bus.reset(new OrchestrationBus(tunnelLauncher, sessionLauncher, config));
  }

  /** @brief Pumps the bus until the predicate holds or 10s pass. */
  bool pumpUntil(const function<bool(const Screen&)>& predicate) {
    auto deadline = chrono::steady_clock::now() + chrono::seconds(10);
    while (chrono::steady_clock::now() < deadline) {
      if (predicate(bus->getScreen())) {
        return true;
      }
      bus->processNext(50);
    }
    return predicate(bus->getScreen());
  }

  void shutdown() {
    bus->post(BusMessage::intent(BusMessageType::Shutdown));
    auto deadline = chrono::steady_clock::now() + chrono::seconds(10);
    while (!bus->isFinished() && chrono::steady_clock::now() < deadline) {
      bus->processNext(50);
    }
    REQUIRE(bus->isFinished());
    REQUIRE(processRegistry->size() == 0);
  }

  shared_ptr<SubprocessUtils> subprocessUtils;
  shared_ptr<ProcessRegistry> processRegistry;
  shared_ptr<FakeCodec> codec;
  shared_ptr<FakeTransportFactory> factory;
  shared_ptr<TunnelLauncher> tunnelLauncher;
  shared_ptr<SessionLauncher> sessionLauncher;
  ScriptDirectory scripts;
  unique_ptr<OrchestrationBus> bus;
};
}  // namespace

TEST_CASE("Hosting through a tunnel process", "[ComponentLauncher]") {
  LauncherFixture fixture;
  fixture.createBus(fixture.scripts.write(
      "cloudflared",
      "echo \"INF Requesting new quick Tunnel on trycloudflare.com...\" >&2\n"
      "echo \"INF |  https://calm-river.trycloudflare.com  |\" >&2\n"
      "exec sleep 30"));

  fixture.bus->post(BusMessage::intent(BusMessageType::SelectHost));
  REQUIRE(fixture.pumpUntil([](const Screen& screen) {
    return screen.hostingStatus == HostingStatus::Active &&
           screen.hostingLog.size() == 2;
  }));
  auto screen = fixture.bus->getScreen();
  REQUIRE(screen.type == ScreenType::Hosting);
  REQUIRE(screen.hostingUrl == "https://calm-river.trycloudflare.com");
  REQUIRE(screen.hostingLog.size() == 2);

  fixture.bus->post(BusMessage::intent(BusMessageType::StopHosting));
  REQUIRE(fixture.pumpUntil([](const Screen& screen) {
    return screen.type == ScreenType::ModeSelect;
  }));
  fixture.shutdown();
}

TEST_CASE("Viewing through a client tunnel", "[ComponentLauncher]") {
  LauncherFixture fixture;
  fixture.createBus(fixture.scripts.write(
      "cloudflared",
      "echo \"INF Start Websocket listener host=localhost:13389\" >&2\n"
      "exec sleep 30"));

  LoginForm form;
  form.tunnelUrl = "https://calm-river.trycloudflare.com";
  form.username = "admin";
  form.password = "secret";
  form.width = "64";
  form.height = "48";
  fixture.bus->post(BusMessage::intent(BusMessageType::SelectConnect));
  fixture.bus->post(BusMessage::submitLogin(form));
  REQUIRE(fixture.pumpUntil([](const Screen& screen) {
    return screen.type == ScreenType::Viewing;
  }));
  REQUIRE(fixture.factory->lastEndpoint ==
          SocketEndpoint("localhost", DEFAULT_CLIENT_PROXY_PORT));
  REQUIRE(fixture.codec->lastConfig.username == "admin");

  fixture.factory->writeAsServer(fixture.factory->lastServerFd(), "GFX\n");
  REQUIRE(fixture.pumpUntil([](const Screen& screen) {
    return screen.framePixels != nullptr;
  }));
  REQUIRE(fixture.bus->sendKey(LocalKey::fromCharacter("q"), true));
  REQUIRE(fixture.factory->readAsServer(fixture.factory->lastServerFd(),
                                        2000) == "INPUT 0 16\n");

  fixture.bus->post(BusMessage::intent(BusMessageType::Disconnect));
  REQUIRE(fixture.pumpUntil([](const Screen& screen) {
    return screen.type == ScreenType::LoginForm;
  }));
  fixture.shutdown();
}

TEST_CASE("Tunnel binary that cannot start", "[ComponentLauncher]") {
  LauncherFixture fixture;
  fixture.createBus(fixture.scripts.path + "/missing-cloudflared");

  fixture.bus->post(BusMessage::intent(BusMessageType::SelectHost));
  REQUIRE(fixture.pumpUntil([](const Screen& screen) {
    return screen.type == ScreenType::ErrorDisplay;
  }));
  REQUIRE_THAT(fixture.bus->getScreen().errorMessage,
               Catch::Matchers::StartsWith("Failed to start cloudflared"));
  fixture.shutdown();
}
