#ifndef __TD_ORCHESTRATION_BUS__
#define __TD_ORCHESTRATION_BUS__

#include "BoundedQueue.hpp"
#include "BusMessage.hpp"
#include "ComponentLauncher.hpp"
#include "Headers.hpp"
#include "Screen.hpp"

namespace td {
struct BusConfig {
  // Resolved path of the tunnel broker, empty if none was found
  string tunnelBinary;
  int clientProxyPort = DEFAULT_CLIENT_PROXY_PORT;
  int hostServicePort = DEFAULT_SERVICE_PORT;
  // Time the client tunnel is given to bind its local port
  int settleDelayMs = CLIENT_TUNNEL_SETTLE_MS;
};

/**
 * @brief The application state machine.
 *
 * Every UI intent, component event and timer goes through one queue and is
 * dispatched on the thread calling processNext(), so screen state is only
 * ever changed by one message at a time. Sessions and tunnels run on their
 * own threads and post back through sinks tagged with a subscription
 * generation.
 */
class OrchestrationBus {
 public:
  typedef function<void(const Screen&)> ScreenObserver;

  OrchestrationBus(shared_ptr<TunnelLauncher> _tunnelLauncher,
                   shared_ptr<SessionLauncher> _sessionLauncher,
                   const BusConfig& _config);
  ~OrchestrationBus();

  /** @brief Thread safe. */
  void post(const BusMessage& message);

  /**
   * @brief Thread safe. Frames are coalesced: while one frame of a session
   * is waiting to be dispatched, newer frames replace it instead of queueing
   * behind it.
   */
  void postSessionEvent(uint64_t generation, const SessionEvent& event);

  /** @brief Messages waiting to be dispatched. */
  size_t getQueuedCount() { return queue.size(); }

  /**
   * @brief Dispatches at most one queued message, then fires due timers.
   * @return true if a message was dispatched.
   */
  bool processNext(int timeoutMs);

  /** @brief Processes messages until a Shutdown has fully completed. */
  void run();

  /** @brief True once Shutdown was handled and every component ended. */
  bool isFinished();

  Screen getScreen();

  /** @brief Called on the bus thread after every dispatched message. */
  void setScreenObserver(ScreenObserver observer);

  /**
   * @brief Sends input to the live session from the UI thread. Blocks while
   * the session's input queue is full.
   * @return false if no session is accepting input.
   */
  bool sendInput(const InputCommand& command);

  /** @brief Translates and sends a key press or release. */
  bool sendKey(const LocalKey& key, bool pressed);

  /** @brief Number of stopped components whose final event is pending. */
  size_t getRetiredCount();

 protected:
  struct Subscription {
    uint64_t generation = 0;
    string key;
    shared_ptr<ComponentTask> task;
    TunnelHandle tunnelHandle;
    bool handleReady = false;
  };

  void dispatch(const BusMessage& message);
  /** @return the newest frame posted for generation, if one is pending. */
  optional<SessionEvent> takePendingFrame(uint64_t generation);
  void handleIntent(const BusMessage& message);
  void handleTunnelEvent(uint64_t generation, const TunnelEvent& event);
  void handleSessionEvent(uint64_t generation, const SessionEvent& event);
  void handleClientTunnelSettled(uint64_t generation);

  void startHostTunnel();
  void submitLogin(const td::LoginForm& form);
  bool startTunnel(const TunnelParams& params);
  void startSession();

  void stopTunnel();
  void stopSession();
  void teardownAll();
  /** @brief Joins a retired component once its final event arrived. */
  void releaseRetired(uint64_t generation);

  void showScreen(ScreenType type);
  void showError(const string& message);
  void showLoginForm(const string& formError);

  void scheduleTimer(int delayMs, const BusMessage& message);
  void fireDueTimers();

  shared_ptr<TunnelLauncher> tunnelLauncher;
  shared_ptr<SessionLauncher> sessionLauncher;
  BusConfig config;
  BoundedQueue<BusMessage> queue;

  recursive_mutex stateMutex;
  Screen screen;
  td::LoginForm lastForm;
  optional<ConnectionProfile> pendingProfile;
  optional<Subscription> tunnelSubscription;
  optional<Subscription> sessionSubscription;
  map<uint64_t, shared_ptr<ComponentTask>> retired;
  uint64_t nextGeneration;
  bool shuttingDown;
  ScreenObserver screenObserver;

  multimap<chrono::steady_clock::time_point, BusMessage> timers;

  // Latest undispatched frame per session generation
  map<uint64_t, SessionEvent> pendingFrames;
  recursive_mutex frameMutex;
};
}  // namespace td

#endif  // __TD_ORCHESTRATION_BUS__
