#include "OrchestrationBus.hpp"

#include "ScancodeTranslator.hpp"

namespace td {
OrchestrationBus::OrchestrationBus(shared_ptr<TunnelLauncher> _tunnelLauncher,
                                   shared_ptr<SessionLauncher> _sessionLauncher,
                                   const BusConfig& _config)
    : tunnelLauncher(_tunnelLauncher),
      sessionLauncher(_sessionLauncher),
      config(_config),
      queue(0),
      nextGeneration(1),
      shuttingDown(false) {}

OrchestrationBus::~OrchestrationBus() {
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    teardownAll();
    shuttingDown = true;
  }
  // Components post into our queue until their final event, wait for them
  while (!isFinished()) {
    processNext(100);
  }
}

void OrchestrationBus::post(const BusMessage& message) {
  if (!queue.push(message)) {
    STERROR << "Message posted to a closed bus";
  }
}

void OrchestrationBus::postSessionEvent(uint64_t generation,
                                        const SessionEvent& event) {
  if (event.type != SessionEventType::Frame) {
    post(BusMessage::session(generation, event));
    return;
  }
  {
    lock_guard<recursive_mutex> guard(frameMutex);
    bool markerQueued = pendingFrames.count(generation) > 0;
    pendingFrames[generation] = event;
    if (markerQueued) {
      VLOG(2) << "Replaced undispatched frame of generation " << generation;
      return;
    }
  }
  // The queued message only marks that a frame is waiting, the pixels are
  // picked up at dispatch time.
  SessionEvent marker = event;
  marker.pixels.reset();
  post(BusMessage::session(generation, marker));
}

optional<SessionEvent> OrchestrationBus::takePendingFrame(uint64_t generation) {
  lock_guard<recursive_mutex> guard(frameMutex);
  auto it = pendingFrames.find(generation);
  if (it == pendingFrames.end()) {
    return nullopt;
  }
  SessionEvent frame = it->second;
  pendingFrames.erase(it);
  return frame;
}

bool OrchestrationBus::processNext(int timeoutMs) {
  fireDueTimers();
  int waitMs = timeoutMs;
  if (!timers.empty()) {
    waitMs = min(waitMs, millisUntil(timers.begin()->first));
  }
  auto message = queue.pop(waitMs);
  if (message) {
    dispatch(*message);
  }
  fireDueTimers();
  return bool(message);
}

void OrchestrationBus::run() {
  el::Helpers::setThreadName("bus");
  while (!isFinished()) {
    processNext(100);
  }
  LOG(INFO) << "Bus finished";
}

bool OrchestrationBus::isFinished() {
  lock_guard<recursive_mutex> guard(stateMutex);
  return shuttingDown && retired.empty() && !tunnelSubscription &&
         !sessionSubscription;
}

Screen OrchestrationBus::getScreen() {
  lock_guard<recursive_mutex> guard(stateMutex);
  return screen;
}

void OrchestrationBus::setScreenObserver(ScreenObserver observer) {
  lock_guard<recursive_mutex> guard(stateMutex);
  screenObserver = observer;
}

bool OrchestrationBus::sendInput(const InputCommand& command) {
  SessionHandle handle;
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    if (screen.type != ScreenType::Viewing) {
      return false;
    }
    handle = screen.sessionHandle;
  }
  // Outside the lock: this blocks while the session catches up
  return handle.send(command);
}

bool OrchestrationBus::sendKey(const LocalKey& key, bool pressed) {
  auto scancode = localKeyToScancode(key);
  if (!scancode) {
    VLOG(2) << "Dropping unmapped key";
    return false;
  }
  return sendInput(pressed ? InputCommand::keyPressed(*scancode)
                           : InputCommand::keyReleased(*scancode));
}

size_t OrchestrationBus::getRetiredCount() {
  lock_guard<recursive_mutex> guard(stateMutex);
  return retired.size();
}

void OrchestrationBus::dispatch(const BusMessage& message) {
  Screen snapshot;
  ScreenObserver observer;
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    switch (message.type) {
      case BusMessageType::Tunnel:
        handleTunnelEvent(message.generation, message.tunnelEvent);
        break;
      case BusMessageType::Session:
        if (message.sessionEvent.type == SessionEventType::Frame) {
          auto frame = takePendingFrame(message.generation);
          if (frame) {
            handleSessionEvent(message.generation, *frame);
          }
        } else {
          handleSessionEvent(message.generation, message.sessionEvent);
        }
        break;
      case BusMessageType::ClientTunnelSettled:
        handleClientTunnelSettled(message.generation);
        break;
      case BusMessageType::Shutdown:
        LOG(INFO) << "Shutting down";
        teardownAll();
        shuttingDown = true;
        break;
      default:
        if (shuttingDown) {
          VLOG(1) << "Ignoring intent during shutdown";
          break;
        }
        handleIntent(message);
        break;
    }
    snapshot = screen;
    observer = screenObserver;
  }
  if (observer) {
    observer(snapshot);
  }
}

void OrchestrationBus::handleIntent(const BusMessage& message) {
  switch (screen.type) {
    case ScreenType::ModeSelect:
      if (message.type == BusMessageType::SelectConnect) {
        showLoginForm("");
        return;
      }
      if (message.type == BusMessageType::SelectHost) {
        startHostTunnel();
        return;
      }
      break;
    case ScreenType::LoginForm:
      if (message.type == BusMessageType::BackToModeSelect) {
        showScreen(ScreenType::ModeSelect);
        return;
      }
      if (message.type == BusMessageType::SubmitLogin) {
        submitLogin(message.form);
        return;
      }
      break;
    case ScreenType::Connecting:
    case ScreenType::Viewing:
      if (message.type == BusMessageType::Disconnect) {
        LOG(INFO) << "Disconnect requested";
        stopSession();
        stopTunnel();
        showLoginForm("");
        return;
      }
      break;
    case ScreenType::Hosting:
      if (message.type == BusMessageType::StopHosting) {
        LOG(INFO) << "Stop hosting requested";
        stopTunnel();
        showScreen(ScreenType::ModeSelect);
        return;
      }
      break;
    case ScreenType::ErrorDisplay:
      if (message.type == BusMessageType::DismissError) {
        showScreen(ScreenType::ModeSelect);
        return;
      }
      break;
  }
  VLOG(1) << "Ignoring message " << int(message.type) << " on screen "
          << screenTypeToString(screen.type);
}

void OrchestrationBus::handleTunnelEvent(uint64_t generation,
                                         const TunnelEvent& event) {
  if (!tunnelSubscription || tunnelSubscription->generation != generation) {
    if (event.isTerminal()) {
      releaseRetired(generation);
    }
    return;
  }

  switch (event.type) {
    case TunnelEventType::HandleReady:
      tunnelSubscription->tunnelHandle = event.handle;
      tunnelSubscription->handleReady = true;
      if (screen.type == ScreenType::Connecting && !sessionSubscription) {
        VLOG(1) << "Client tunnel ready, waiting " << config.settleDelayMs
                << "ms for it to bind";
        scheduleTimer(config.settleDelayMs,
                      BusMessage::clientTunnelSettled(generation));
      }
      break;
    case TunnelEventType::UrlReady:
      if (screen.type == ScreenType::Hosting) {
        screen.hostingStatus = HostingStatus::Active;
        screen.hostingUrl = event.text;
      }
      break;
    case TunnelEventType::OutputLine:
      if (screen.type == ScreenType::Hosting) {
        screen.hostingLog.push_back(event.text);
        while (screen.hostingLog.size() > HOSTING_LOG_LINES) {
          screen.hostingLog.pop_front();
        }
      }
      break;
    case TunnelEventType::Error:
      LOG(ERROR) << "Tunnel error: " << event.text;
      stopSession();
      stopTunnel();
      showError(event.text);
      break;
    case TunnelEventType::Stopped: {
      LOG(INFO) << "Tunnel stopped";
      auto task = tunnelSubscription->task;
      tunnelSubscription.reset();
      task->join();
      if (screen.type == ScreenType::Hosting) {
        showScreen(ScreenType::ModeSelect);
      } else if (screen.type == ScreenType::Connecting ||
                 screen.type == ScreenType::Viewing) {
        stopSession();
        showError("Tunnel exited unexpectedly");
      }
      break;
    }
  }
}

void OrchestrationBus::handleSessionEvent(uint64_t generation,
                                          const SessionEvent& event) {
  if (!sessionSubscription || sessionSubscription->generation != generation) {
    if (event.isTerminal()) {
      releaseRetired(generation);
    }
    return;
  }

  switch (event.type) {
    case SessionEventType::StatusChanged:
      VLOG(1) << "Session status: " << connectionStatusToString(event.status);
      if (screen.type == ScreenType::Connecting) {
        screen.phase = event.status;
      }
      break;
    case SessionEventType::Connected:
      LOG(INFO) << "Session connected";
      screen.sessionHandle = event.handle;
      screen.frameWidth = uint32_t(screen.profile.width);
      screen.frameHeight = uint32_t(screen.profile.height);
      screen.framePixels.reset();
      screen.type = ScreenType::Viewing;
      break;
    case SessionEventType::Frame:
      if (screen.type == ScreenType::Viewing) {
        screen.frameWidth = event.width;
        screen.frameHeight = event.height;
        screen.framePixels = event.pixels;
      }
      break;
    case SessionEventType::Error: {
      LOG(ERROR) << "Session error: " << event.message;
      auto task = sessionSubscription->task;
      sessionSubscription.reset();
      task->join();
      stopTunnel();
      showError(event.message);
      break;
    }
    case SessionEventType::Disconnected: {
      LOG(INFO) << "Session disconnected";
      auto task = sessionSubscription->task;
      sessionSubscription.reset();
      task->join();
      stopTunnel();
      showLoginForm("");
      break;
    }
  }
}

void OrchestrationBus::handleClientTunnelSettled(uint64_t generation) {
  if (!tunnelSubscription || tunnelSubscription->generation != generation ||
      screen.type != ScreenType::Connecting || sessionSubscription ||
      shuttingDown) {
    VLOG(1) << "Ignoring stale tunnel settle timer";
    return;
  }
  startSession();
}

void OrchestrationBus::startHostTunnel() {
  TunnelParams params;
  params.role = TunnelRole::Host;
  params.binaryPath = config.tunnelBinary;
  params.servicePort = config.hostServicePort;
  if (!startTunnel(params)) {
    return;
  }
  screen.hostingStatus = HostingStatus::Starting;
  screen.hostingUrl.clear();
  screen.hostingLog.clear();
  showScreen(ScreenType::Hosting);
}

void OrchestrationBus::submitLogin(const td::LoginForm& form) {
  lastForm = form;
  ClientConnectRequest request;
  try {
    request = buildClientConnectRequest(form, config.clientProxyPort);
  } catch (const ProfileValidationException& pve) {
    LOG(INFO) << "Invalid login form: " << pve.what();
    showLoginForm(pve.what());
    return;
  }

  TunnelParams params;
  params.role = TunnelRole::Client;
  params.binaryPath = config.tunnelBinary;
  params.tunnelUrl = request.tunnelUrl;
  params.localPort = config.clientProxyPort;
  if (!startTunnel(params)) {
    return;
  }
  pendingProfile = request.profile;
  screen.profile = request.profile;
  screen.phase = ConnectionStatus::Connecting;
  showScreen(ScreenType::Connecting);
}

bool OrchestrationBus::startTunnel(const TunnelParams& params) {
  if (params.binaryPath.empty()) {
    showError(
        "cloudflared was not found. Install it or pass its path with "
        "--cloudflared.");
    return false;
  }
  if (tunnelSubscription) {
    if (tunnelSubscription->key == params.subscriptionKey()) {
      VLOG(1) << "Tunnel " << params.subscriptionKey() << " already running";
      return true;
    }
    stopTunnel();
  }

  uint64_t generation = nextGeneration++;
  Subscription subscription;
  subscription.generation = generation;
  subscription.key = params.subscriptionKey();
  subscription.task = tunnelLauncher->launch(
      params, [this, generation](const TunnelEvent& event) {
        post(BusMessage::tunnel(generation, event));
      });
  tunnelSubscription = subscription;
  LOG(INFO) << "Started tunnel " << subscription.key << " (generation "
            << generation << ")";
  return true;
}

void OrchestrationBus::startSession() {
  if (!pendingProfile) {
    STERROR << "Session start without a profile";
    return;
  }
  ConnectionProfile profile = *pendingProfile;
  pendingProfile.reset();
  if (!sessionLauncher) {
    stopTunnel();
    showError(
        "No remote desktop codec is available in this build. Use "
        "'tunneldesk access' with an external client.");
    return;
  }

  uint64_t generation = nextGeneration++;
  Subscription subscription;
  subscription.generation = generation;
  subscription.key = profile.serverAddr();
  subscription.task = sessionLauncher->launch(
      profile, [this, generation](const SessionEvent& event) {
        postSessionEvent(generation, event);
      });
  sessionSubscription = subscription;
  LOG(INFO) << "Started session to " << profile.serverAddr() << " as "
            << profile.username << " (generation " << generation << ")";
}

void OrchestrationBus::stopTunnel() {
  if (!tunnelSubscription) {
    return;
  }
  LOG(INFO) << "Stopping tunnel " << tunnelSubscription->key;
  if (tunnelSubscription->handleReady) {
    tunnelSubscription->tunnelHandle.stop();
  } else {
    tunnelSubscription->task->requestStop();
  }
  retired[tunnelSubscription->generation] = tunnelSubscription->task;
  tunnelSubscription.reset();
}

void OrchestrationBus::stopSession() {
  pendingProfile.reset();
  if (!sessionSubscription) {
    return;
  }
  LOG(INFO) << "Stopping session " << sessionSubscription->key;
  sessionSubscription->task->requestStop();
  retired[sessionSubscription->generation] = sessionSubscription->task;
  sessionSubscription.reset();
}

void OrchestrationBus::teardownAll() {
  stopSession();
  stopTunnel();
  timers.clear();
}

void OrchestrationBus::releaseRetired(uint64_t generation) {
  auto it = retired.find(generation);
  if (it == retired.end()) {
    STERROR << "Final event from unknown generation " << generation;
    return;
  }
  VLOG(1) << "Releasing retired component " << generation;
  it->second->join();
  retired.erase(it);
}

void OrchestrationBus::showScreen(ScreenType type) {
  if (screen.type != type) {
    LOG(INFO) << "Screen " << screenTypeToString(screen.type) << " -> "
              << screenTypeToString(type);
  }
  if (type != ScreenType::Viewing) {
    screen.sessionHandle = SessionHandle();
    screen.framePixels.reset();
  }
  screen.type = type;
}

void OrchestrationBus::showError(const string& message) {
  screen.errorMessage = message;
  showScreen(ScreenType::ErrorDisplay);
}

void OrchestrationBus::showLoginForm(const string& formError) {
  screen.form = lastForm;
  // Passwords are not kept between attempts
  screen.form.password.clear();
  screen.formError = formError;
  showScreen(ScreenType::LoginForm);
}

void OrchestrationBus::scheduleTimer(int delayMs, const BusMessage& message) {
  timers.insert(make_pair(
      chrono::steady_clock::now() + chrono::milliseconds(delayMs), message));
}

void OrchestrationBus::fireDueTimers() {
  while (!timers.empty() &&
         timers.begin()->first <= chrono::steady_clock::now()) {
    BusMessage message = timers.begin()->second;
    timers.erase(timers.begin());
    dispatch(message);
  }
}
}  // namespace td
