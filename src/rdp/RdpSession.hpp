#ifndef __TD_RDP_SESSION__
#define __TD_RDP_SESSION__

#include "Headers.hpp"
#include "Negotiator.hpp"
#include "SessionLoop.hpp"

namespace td {
struct RdpSessionOptions {
  NegotiatorOptions negotiator;
  SessionLoopOptions loop;
  int inputQueueCapacity = INPUT_QUEUE_CAPACITY;
};

/**
 * @brief One remote desktop session from first connect to termination,
 * running on its own thread.
 *
 * Emits StatusChanged(Connecting), then either a terminal Error, or
 * Connected followed by the session loop's events. The last event is always
 * Error or Disconnected.
 */
class RdpSession {
 public:
  RdpSession(shared_ptr<ProtocolCodec> _codec,
             shared_ptr<TransportFactory> _transportFactory,
             const ConnectionProfile& _profile, SessionEventSink _sink,
             const RdpSessionOptions& _options);
  ~RdpSession();

  void start();
  /**
   * @brief Asks the session to end. Idempotent and never blocks. Before
   * Connected this cancels the negotiation. Afterwards a Disconnect command
   * is queued if there is room, and the session loop also notices the
   * request on its next iteration or transport wait.
   */
  void requestStop();
  void join();

  /** @brief The session body, run by start() on the session thread. */
  void run();

  const ConnectionProfile& getProfile() const { return profile; }

 protected:
  shared_ptr<ProtocolCodec> codec;
  shared_ptr<TransportFactory> transportFactory;
  ConnectionProfile profile;
  SessionEventSink sink;
  RdpSessionOptions options;
  atomic<bool> stopRequested;
  SessionHandle handle;
  recursive_mutex sessionMutex;
  shared_ptr<thread> sessionThread;
};
}  // namespace td

#endif  // __TD_RDP_SESSION__
