#ifndef __TD_SESSION_LOOP__
#define __TD_SESSION_LOOP__

#include "Headers.hpp"
#include "Negotiator.hpp"
#include "ProtocolCodec.hpp"
#include "SessionEvent.hpp"

namespace td {
struct SessionLoopOptions {
  int inactivityTimeoutSeconds = SESSION_INACTIVITY_TIMEOUT_SECONDS;
  int pollIntervalMs = SESSION_POLL_INTERVAL_MS;
  int writeTimeoutSeconds = TRANSPORT_WRITE_TIMEOUT_SECONDS;
};

/**
 * @brief Drives an established session: inbound PDUs from the transport and
 * queued input commands from the UI.
 *
 * run() returns after emitting exactly one terminal event (Error or
 * Disconnected). Nothing is emitted afterwards, the transport is closed and
 * the input queue rejects further commands. A write that makes no progress
 * for writeTimeoutSeconds ends the session with an Error.
 */
class SessionLoop {
 public:
  SessionLoop(NegotiatedConnection connection,
              shared_ptr<InputQueue> _inputQueue, SessionEventSink _sink,
              const SessionLoopOptions& _options);

  /**
   * @brief Installs a check polled every iteration and during transport
   * waits. Once it returns true the loop ends with Disconnected.
   */
  void setStopCheck(const function<bool()>& check);

  void run();

  bool isTerminated() const { return terminated; }

 protected:
  /** @return false once a terminal event was emitted. */
  bool handleInbound();
  bool handleCommand(const InputCommand& command);
  void emitFrame();
  void terminate(const SessionEvent& event);
  /** @brief Terminates with an Error, or Disconnected if a stop is pending. */
  void fail(const string& message);
  bool stopPending() const { return stopCheck && stopCheck(); }

  unique_ptr<Transport> transport;
  shared_ptr<ActiveStage> activeStage;
  DecodedImage image;
  shared_ptr<InputQueue> inputQueue;
  SessionEventSink sink;
  SessionLoopOptions options;
  function<bool()> stopCheck;
  string readBuffer;
  chrono::steady_clock::time_point lastInbound;
  bool terminated;
};
}  // namespace td

#endif  // __TD_SESSION_LOOP__
