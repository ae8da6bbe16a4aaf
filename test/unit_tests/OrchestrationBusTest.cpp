#include "OrchestrationBus.hpp"
#include "TestHeaders.hpp"

using namespace td;
using Catch::Matchers::ContainsSubstring;

namespace {
class FakeTask : public ComponentTask {
 public:
  FakeTask() : stopRequests(0), joins(0) {}

  virtual void requestStop() { stopRequests++; }
  virtual void join() { joins++; }

  int stopRequests;
  int joins;
};

struct TunnelLaunch {
  TunnelParams params;
  TunnelEventSink sink;
  shared_ptr<FakeTask> task;
  TunnelHandle handle;
  bool ended = false;
};

struct SessionLaunch {
  ConnectionProfile profile;
  SessionEventSink sink;
  shared_ptr<FakeTask> task;
  shared_ptr<InputQueue> inputQueue;
  bool ended = false;
};

class FakeTunnelLauncher : public TunnelLauncher {
 public:
  virtual shared_ptr<ComponentTask> launch(const TunnelParams& params,
                                           TunnelEventSink sink) {
    auto record = make_shared<TunnelLaunch>();
    record->params = params;
    record->sink = sink;
    record->task = make_shared<FakeTask>();
    launches.push_back(record);
    return record->task;
  }

  vector<shared_ptr<TunnelLaunch>> launches;
};

class FakeSessionLauncher : public SessionLauncher {
 public:
  virtual shared_ptr<ComponentTask> launch(const ConnectionProfile& profile,
                                           SessionEventSink sink) {
    auto record = make_shared<SessionLaunch>();
    record->profile = profile;
    record->sink = sink;
    record->task = make_shared<FakeTask>();
    record->inputQueue = make_shared<InputQueue>(10);
    launches.push_back(record);
    return record->task;
  }

  vector<shared_ptr<SessionLaunch>> launches;
};

LoginForm validForm() {
  LoginForm form;
  form.tunnelUrl = "abc.trycloudflare.com";
  form.username = "admin";
  form.password = "secret";
  form.width = "1280";
  form.height = "720";
  return form;
}

/**
 * Drives the bus from the test thread. Component events are delivered
 * through the sinks the bus handed to the fake launchers.
 */
class BusFixture {
 public:
  explicit BusFixture(const string& tunnelBinary = "/opt/bin/cloudflared",
                      bool withCodec = true, int settleDelayMs = 0)
      : tunnels(new FakeTunnelLauncher()),
        sessions(new FakeSessionLauncher()) {
    BusConfig config;
    config.tunnelBinary = tunnelBinary;
    config.settleDelayMs = settleDelayMs;
    shared_ptr<SessionLauncher> sessionLauncher;
    if (withCodec) {
      sessionLauncher = sessions;
    }
    bus.reset(new OrchestrationBus(tunnels, sessionLauncher, config));
  }

  ~BusFixture() {
    bus->post(BusMessage::intent(BusMessageType::Shutdown));
    drain();
    for (auto& launch : sessions->launches) {
      if (!launch->ended) {
        emitSession(launch, SessionEvent::disconnected());
      }
    }
    for (auto& launch : tunnels->launches) {
      if (!launch->ended) {
        emitTunnel(launch, TunnelEvent::stopped());
      }
    }
    bus.reset();
  }

  void drain() {
    while (bus->processNext(0)) {
    }
  }

  void post(const BusMessage& message) {
    bus->post(message);
    drain();
  }

  void intent(BusMessageType type) { post(BusMessage::intent(type)); }

  void emitTunnel(shared_ptr<TunnelLaunch> launch, const TunnelEvent& event) {
    if (event.isTerminal()) {
      launch->ended = true;
    }
    launch->sink(event);
    drain();
  }

  void emitSession(shared_ptr<SessionLaunch> launch,
                   const SessionEvent& event) {
    if (event.isTerminal()) {
      launch->ended = true;
    }
    launch->sink(event);
    drain();
  }

  void tunnelReady(shared_ptr<TunnelLaunch> launch) {
    emitTunnel(launch, TunnelEvent::handleReady(launch->handle));
  }

  shared_ptr<TunnelLaunch> lastTunnel() {
    REQUIRE_FALSE(tunnels->launches.empty());
    return tunnels->launches.back();
  }

  shared_ptr<SessionLaunch> lastSession() {
    REQUIRE_FALSE(sessions->launches.empty());
    return sessions->launches.back();
  }

  Screen screen() { return bus->getScreen(); }

  void goConnecting() {
    intent(BusMessageType::SelectConnect);
    post(BusMessage::submitLogin(validForm()));
    REQUIRE(screen().type == ScreenType::Connecting);
  }

  void goViewing() {
    goConnecting();
    tunnelReady(lastTunnel());
    auto session = lastSession();
    emitSession(session, SessionEvent::statusChanged(
                             ConnectionStatus::Connecting));
    emitSession(session, SessionEvent::connected(
                             SessionHandle(session->inputQueue)));
    REQUIRE(screen().type == ScreenType::Viewing);
  }

  shared_ptr<FakeTunnelLauncher> tunnels;
  shared_ptr<FakeSessionLauncher> sessions;
  unique_ptr<OrchestrationBus> bus;
};
}  // namespace

TEST_CASE("Mode select navigation", "[OrchestrationBus]") {
  BusFixture fixture;
  REQUIRE(fixture.screen().type == ScreenType::ModeSelect);

  fixture.intent(BusMessageType::SelectConnect);
  auto screen = fixture.screen();
  REQUIRE(screen.type == ScreenType::LoginForm);
  REQUIRE(screen.form.width == "1920");
  REQUIRE(screen.formError.empty());

  fixture.intent(BusMessageType::BackToModeSelect);
  REQUIRE(fixture.screen().type == ScreenType::ModeSelect);

  // Intents that do not belong to the current screen are ignored
  fixture.intent(BusMessageType::DismissError);
  fixture.intent(BusMessageType::StopHosting);
  fixture.intent(BusMessageType::Disconnect);
  REQUIRE(fixture.screen().type == ScreenType::ModeSelect);
  REQUIRE(fixture.tunnels->launches.empty());
}

TEST_CASE("Invalid login form stays on the form", "[OrchestrationBus]") {
  BusFixture fixture;
  fixture.intent(BusMessageType::SelectConnect);

  LoginForm form = validForm();
  form.username = "  ";
  fixture.post(BusMessage::submitLogin(form));
  auto screen = fixture.screen();
  REQUIRE(screen.type == ScreenType::LoginForm);
  REQUIRE(screen.formError == "Username is required");
  REQUIRE(screen.form.tunnelUrl == form.tunnelUrl);
  REQUIRE(screen.form.password.empty());

  form = validForm();
  form.width = "wide";
  fixture.post(BusMessage::submitLogin(form));
  REQUIRE(fixture.screen().formError == "Width must be a number: wide");
  REQUIRE(fixture.tunnels->launches.empty());
}

TEST_CASE("Client connect flow", "[OrchestrationBus]") {
  BusFixture fixture;
  fixture.goConnecting();

  auto tunnel = fixture.lastTunnel();
  REQUIRE(tunnel->params.role == TunnelRole::Client);
  REQUIRE(tunnel->params.binaryPath == "/opt/bin/cloudflared");
  REQUIRE(tunnel->params.tunnelUrl == "https://abc.trycloudflare.com");
  REQUIRE(tunnel->params.localPort == DEFAULT_CLIENT_PROXY_PORT);
  REQUIRE(fixture.screen().profile.width == 1280);
  // The session waits for the tunnel
  REQUIRE(fixture.sessions->launches.empty());

  fixture.emitTunnel(tunnel, TunnelEvent::outputLine("INF Starting"));
  REQUIRE(fixture.sessions->launches.empty());
  fixture.tunnelReady(tunnel);
  REQUIRE(fixture.sessions->launches.size() == 1);
  auto session = fixture.lastSession();
  REQUIRE(session->profile.hostname == "localhost");
  REQUIRE(session->profile.proxyPort == DEFAULT_CLIENT_PROXY_PORT);
  REQUIRE(session->profile.username == "admin");
  REQUIRE(session->profile.password == "secret");
  REQUIRE(session->profile.height == 720);

  fixture.emitSession(session,
                      SessionEvent::statusChanged(ConnectionStatus::TlsUpgrade));
  REQUIRE(fixture.screen().phase == ConnectionStatus::TlsUpgrade);
  fixture.emitSession(
      session, SessionEvent::statusChanged(ConnectionStatus::Authenticating));
  REQUIRE(fixture.screen().phase == ConnectionStatus::Authenticating);

  SessionHandle handle(session->inputQueue);
  fixture.emitSession(session, SessionEvent::connected(handle));
  auto screen = fixture.screen();
  REQUIRE(screen.type == ScreenType::Viewing);
  REQUIRE(screen.sessionHandle == handle);
  REQUIRE(screen.frameWidth == 1280);
  REQUIRE(screen.frameHeight == 720);
  REQUIRE_FALSE(screen.framePixels);

  auto pixels = make_shared<const vector<uint8_t>>(1280 * 720 * 4, 7);
  fixture.emitSession(session, SessionEvent::frame(1280, 720, pixels));
  REQUIRE(fixture.screen().framePixels == pixels);
}

TEST_CASE("Disconnect stops both components", "[OrchestrationBus]") {
  BusFixture fixture;
  fixture.goViewing();
  auto tunnel = fixture.lastTunnel();
  auto session = fixture.lastSession();

  fixture.intent(BusMessageType::Disconnect);
  auto screen = fixture.screen();
  REQUIRE(screen.type == ScreenType::LoginForm);
  REQUIRE(screen.form.tunnelUrl == "abc.trycloudflare.com");
  REQUIRE(screen.form.username == "admin");
  REQUIRE(screen.form.password.empty());
  REQUIRE_FALSE(screen.sessionHandle.isValid());
  REQUIRE(session->task->stopRequests == 1);
  // A tunnel with a handle is stopped through it
  REQUIRE(tunnel->handle.isStopRequested());
  REQUIRE(tunnel->task->stopRequests == 0);
  REQUIRE(fixture.bus->getRetiredCount() == 2);

  // Late events from the stopped components change nothing
  fixture.emitSession(session, SessionEvent::frame(1, 1, nullptr));
  fixture.emitSession(session, SessionEvent::disconnected());
  REQUIRE(session->task->joins == 1);
  REQUIRE(fixture.bus->getRetiredCount() == 1);
  fixture.emitTunnel(tunnel, TunnelEvent::stopped());
  REQUIRE(tunnel->task->joins == 1);
  REQUIRE(fixture.bus->getRetiredCount() == 0);
  REQUIRE(fixture.screen().type == ScreenType::LoginForm);
}

TEST_CASE("Frames posted faster than dispatch are coalesced",
          "[OrchestrationBus]") {
  BusFixture fixture;
  fixture.goViewing();
  auto session = fixture.lastSession();
  REQUIRE(fixture.bus->getQueuedCount() == 0);

  // The session thread outruns the UI: nothing is dispatched in between
  shared_ptr<const vector<uint8_t>> last;
  for (int a = 0; a < 1000; a++) {
    last = make_shared<const vector<uint8_t>>(4, uint8_t(a % 256));
    session->sink(SessionEvent::frame(1, 1, last));
  }
  REQUIRE(fixture.bus->getQueuedCount() == 1);

  // Non-frame events still queue in order behind the frame
  session->sink(SessionEvent::statusChanged(ConnectionStatus::Active));
  REQUIRE(fixture.bus->getQueuedCount() == 2);

  REQUIRE(fixture.bus->processNext(0));
  auto screen = fixture.screen();
  REQUIRE(screen.framePixels == last);
  REQUIRE(screen.frameWidth == 1);
  REQUIRE(screen.frameHeight == 1);
  fixture.drain();
  REQUIRE(fixture.bus->getQueuedCount() == 0);

  // Once dispatched, the next frame queues again
  auto next = make_shared<const vector<uint8_t>>(4, uint8_t(7));
  fixture.emitSession(session, SessionEvent::frame(1, 1, next));
  REQUIRE(fixture.screen().framePixels == next);
}

TEST_CASE("Disconnect while connecting", "[OrchestrationBus]") {
  BusFixture fixture;
  fixture.goConnecting();
  auto tunnel = fixture.lastTunnel();

  fixture.intent(BusMessageType::Disconnect);
  REQUIRE(fixture.screen().type == ScreenType::LoginForm);
  // No handle yet, so the task itself is asked to stop
  REQUIRE(tunnel->task->stopRequests == 1);

  // A handle arriving late does not start a session
  fixture.tunnelReady(tunnel);
  REQUIRE(fixture.sessions->launches.empty());
}

TEST_CASE("Session error tears down the tunnel", "[OrchestrationBus]") {
  BusFixture fixture;
  fixture.goViewing();
  auto tunnel = fixture.lastTunnel();
  auto session = fixture.lastSession();

  fixture.emitSession(session, SessionEvent::error("Read error: reset"));
  auto screen = fixture.screen();
  REQUIRE(screen.type == ScreenType::ErrorDisplay);
  REQUIRE(screen.errorMessage == "Read error: reset");
  REQUIRE(session->task->joins == 1);
  REQUIRE(tunnel->handle.isStopRequested());

  fixture.intent(BusMessageType::DismissError);
  REQUIRE(fixture.screen().type == ScreenType::ModeSelect);
}

TEST_CASE("Server disconnect returns to the form", "[OrchestrationBus]") {
  BusFixture fixture;
  fixture.goViewing();
  auto session = fixture.lastSession();

  fixture.emitSession(session, SessionEvent::disconnected());
  auto screen = fixture.screen();
  REQUIRE(screen.type == ScreenType::LoginForm);
  REQUIRE(screen.formError.empty());
  REQUIRE(screen.form.password.empty());
  REQUIRE(session->task->joins == 1);
  REQUIRE(fixture.lastTunnel()->handle.isStopRequested());

  // The form can be submitted again and starts a fresh tunnel
  fixture.post(BusMessage::submitLogin(validForm()));
  REQUIRE(fixture.screen().type == ScreenType::Connecting);
  REQUIRE(fixture.tunnels->launches.size() == 2);
}

TEST_CASE("Tunnel error is shown", "[OrchestrationBus]") {
  BusFixture fixture;
  fixture.goConnecting();
  auto tunnel = fixture.lastTunnel();

  fixture.emitTunnel(tunnel,
                     TunnelEvent::error("Tunnel error: failed to connect"));
  auto screen = fixture.screen();
  REQUIRE(screen.type == ScreenType::ErrorDisplay);
  REQUIRE(screen.errorMessage == "Tunnel error: failed to connect");
  REQUIRE(tunnel->task->stopRequests == 1);
  REQUIRE(fixture.sessions->launches.empty());
}

TEST_CASE("Tunnel exit while viewing", "[OrchestrationBus]") {
  BusFixture fixture;
  fixture.goViewing();
  auto tunnel = fixture.lastTunnel();
  auto session = fixture.lastSession();

  fixture.emitTunnel(tunnel, TunnelEvent::stopped());
  auto screen = fixture.screen();
  REQUIRE(screen.type == ScreenType::ErrorDisplay);
  REQUIRE(screen.errorMessage == "Tunnel exited unexpectedly");
  REQUIRE(tunnel->task->joins == 1);
  REQUIRE(session->task->stopRequests == 1);
  REQUIRE(fixture.bus->getRetiredCount() == 1);
}

TEST_CASE("Hosting flow", "[OrchestrationBus]") {
  BusFixture fixture;
  fixture.intent(BusMessageType::SelectHost);
  auto screen = fixture.screen();
  REQUIRE(screen.type == ScreenType::Hosting);
  REQUIRE(screen.hostingStatus == HostingStatus::Starting);
  auto tunnel = fixture.lastTunnel();
  REQUIRE(tunnel->params.role == TunnelRole::Host);
  REQUIRE(tunnel->params.servicePort == DEFAULT_SERVICE_PORT);

  fixture.tunnelReady(tunnel);
  for (int a = 0; a < 60; a++) {
    fixture.emitTunnel(tunnel, TunnelEvent::outputLine("line " + to_string(a)));
  }
  screen = fixture.screen();
  REQUIRE(screen.hostingLog.size() == HOSTING_LOG_LINES);
  REQUIRE(screen.hostingLog.front() == "line 10");
  REQUIRE(screen.hostingLog.back() == "line 59");

  fixture.emitTunnel(tunnel,
                     TunnelEvent::urlReady("https://abc.trycloudflare.com"));
  screen = fixture.screen();
  REQUIRE(screen.hostingStatus == HostingStatus::Active);
  REQUIRE(screen.hostingUrl == "https://abc.trycloudflare.com");

  fixture.intent(BusMessageType::StopHosting);
  REQUIRE(fixture.screen().type == ScreenType::ModeSelect);
  REQUIRE(tunnel->handle.isStopRequested());
  REQUIRE(fixture.bus->getRetiredCount() == 1);
}

TEST_CASE("Host tunnel exit returns to mode select", "[OrchestrationBus]") {
  BusFixture fixture;
  fixture.intent(BusMessageType::SelectHost);
  auto tunnel = fixture.lastTunnel();
  fixture.emitTunnel(tunnel, TunnelEvent::stopped());
  REQUIRE(fixture.screen().type == ScreenType::ModeSelect);
  REQUIRE(tunnel->task->joins == 1);
  REQUIRE(fixture.bus->getRetiredCount() == 0);
}

TEST_CASE("Events from a previous tunnel are ignored", "[OrchestrationBus]") {
  BusFixture fixture;
  fixture.intent(BusMessageType::SelectHost);
  auto oldTunnel = fixture.lastTunnel();
  fixture.intent(BusMessageType::StopHosting);
  fixture.intent(BusMessageType::SelectHost);
  REQUIRE(fixture.tunnels->launches.size() == 2);

  fixture.emitTunnel(oldTunnel,
                     TunnelEvent::urlReady("https://old.trycloudflare.com"));
  fixture.emitTunnel(oldTunnel, TunnelEvent::outputLine("old"));
  fixture.emitTunnel(oldTunnel, TunnelEvent::error("Tunnel error: old"));
  auto screen = fixture.screen();
  REQUIRE(screen.type == ScreenType::Hosting);
  REQUIRE(screen.hostingStatus == HostingStatus::Starting);
  REQUIRE(screen.hostingLog.empty());

  fixture.emitTunnel(oldTunnel, TunnelEvent::stopped());
  REQUIRE(oldTunnel->task->joins == 1);
  REQUIRE(fixture.bus->getRetiredCount() == 0);
  REQUIRE(fixture.screen().type == ScreenType::Hosting);
}

TEST_CASE("Missing tunnel binary", "[OrchestrationBus]") {
  BusFixture fixture("");
  fixture.intent(BusMessageType::SelectHost);
  auto screen = fixture.screen();
  REQUIRE(screen.type == ScreenType::ErrorDisplay);
  REQUIRE_THAT(screen.errorMessage, ContainsSubstring("cloudflared was not found"));

  fixture.intent(BusMessageType::DismissError);
  fixture.intent(BusMessageType::SelectConnect);
  fixture.post(BusMessage::submitLogin(validForm()));
  REQUIRE(fixture.screen().type == ScreenType::ErrorDisplay);
  REQUIRE(fixture.tunnels->launches.empty());
}

TEST_CASE("No codec available", "[OrchestrationBus]") {
  BusFixture fixture("/opt/bin/cloudflared", false);
  fixture.goConnecting();
  auto tunnel = fixture.lastTunnel();
  fixture.tunnelReady(tunnel);

  auto screen = fixture.screen();
  REQUIRE(screen.type == ScreenType::ErrorDisplay);
  REQUIRE_THAT(screen.errorMessage, ContainsSubstring("No remote desktop codec"));
  REQUIRE(tunnel->handle.isStopRequested());
}

TEST_CASE("Session starts after the settle delay", "[OrchestrationBus]") {
  BusFixture fixture("/opt/bin/cloudflared", true, 200);
  fixture.goConnecting();
  auto start = chrono::steady_clock::now();
  fixture.tunnelReady(fixture.lastTunnel());
  REQUIRE(fixture.sessions->launches.empty());

  auto deadline = start + chrono::seconds(5);
  while (fixture.sessions->launches.empty() &&
         chrono::steady_clock::now() < deadline) {
    fixture.bus->processNext(50);
  }
  REQUIRE(fixture.sessions->launches.size() == 1);
  REQUIRE(chrono::steady_clock::now() - start >= chrono::milliseconds(200));
}

TEST_CASE("Disconnect cancels a pending session start", "[OrchestrationBus]") {
  BusFixture fixture("/opt/bin/cloudflared", true, 100);
  fixture.goConnecting();
  fixture.tunnelReady(fixture.lastTunnel());
  fixture.intent(BusMessageType::Disconnect);

  auto deadline = chrono::steady_clock::now() + chrono::milliseconds(300);
  while (chrono::steady_clock::now() < deadline) {
    fixture.bus->processNext(50);
  }
  REQUIRE(fixture.sessions->launches.empty());
  REQUIRE(fixture.screen().type == ScreenType::LoginForm);
}

TEST_CASE("Input is only sent while viewing", "[OrchestrationBus]") {
  BusFixture fixture;
  REQUIRE_FALSE(fixture.bus->sendInput(InputCommand::mouseMoved(1, 1)));
  fixture.goViewing();
  auto session = fixture.lastSession();

  REQUIRE(fixture.bus->sendInput(InputCommand::mouseMoved(5, 6)));
  REQUIRE(fixture.bus->sendKey(LocalKey::fromCharacter("a"), true));
  REQUIRE(fixture.bus->sendKey(LocalKey::fromNamed(NamedKey::Enter), false));
  REQUIRE_FALSE(fixture.bus->sendKey(LocalKey::unidentified(), true));

  auto moved = session->inputQueue->tryPop();
  REQUIRE(moved.has_value());
  REQUIRE(moved->type == InputCommandType::MouseMoved);
  REQUIRE(moved->x == 5);
  auto pressed = session->inputQueue->tryPop();
  REQUIRE(pressed->type == InputCommandType::KeyPressed);
  REQUIRE(pressed->scancode == 0x1E);
  auto released = session->inputQueue->tryPop();
  REQUIRE(released->type == InputCommandType::KeyReleased);
  REQUIRE(released->scancode == 0x1C);
  REQUIRE_FALSE(session->inputQueue->tryPop().has_value());

  fixture.intent(BusMessageType::Disconnect);
  REQUIRE_FALSE(fixture.bus->sendInput(InputCommand::mouseMoved(1, 1)));
}

TEST_CASE("Shutdown waits for every component", "[OrchestrationBus]") {
  BusFixture fixture;
  fixture.goViewing();
  auto tunnel = fixture.lastTunnel();
  auto session = fixture.lastSession();

  fixture.intent(BusMessageType::Shutdown);
  REQUIRE_FALSE(fixture.bus->isFinished());
  REQUIRE(session->task->stopRequests == 1);
  REQUIRE(tunnel->handle.isStopRequested());

  // Intents are ignored from now on
  fixture.intent(BusMessageType::Disconnect);
  fixture.intent(BusMessageType::SelectHost);
  REQUIRE(fixture.tunnels->launches.size() == 1);

  fixture.emitSession(session, SessionEvent::disconnected());
  REQUIRE_FALSE(fixture.bus->isFinished());
  fixture.emitTunnel(tunnel, TunnelEvent::stopped());
  REQUIRE(fixture.bus->isFinished());
  REQUIRE(session->task->joins == 1);
  REQUIRE(tunnel->task->joins == 1);
}

TEST_CASE("Observer sees every screen change", "[OrchestrationBus]") {
  BusFixture fixture;
  vector<ScreenType> seen;
  fixture.bus->setScreenObserver(
      [&seen](const Screen& screen) { seen.push_back(screen.type); });

  fixture.intent(BusMessageType::SelectConnect);
  fixture.intent(BusMessageType::BackToModeSelect);
  fixture.intent(BusMessageType::SelectHost);
  REQUIRE(seen == vector<ScreenType>({ScreenType::LoginForm,
                                      ScreenType::ModeSelect,
                                      ScreenType::Hosting}));
  fixture.bus->setScreenObserver(nullptr);
}
