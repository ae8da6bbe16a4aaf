#ifndef __TD_TUNNEL_PROCESS__
#define __TD_TUNNEL_PROCESS__

#include "Headers.hpp"
#include "ProcessRegistry.hpp"
#include "SubprocessUtils.hpp"
#include "TunnelEvent.hpp"

namespace td {
/**
 * @brief Runs the tunnel broker subprocess for one role and reports its
 * progress as TunnelEvents.
 *
 * HandleReady is always the first event and Stopped always the last, however
 * the subprocess ended (stop request, exit, spawn or read failure).
 */
class TunnelProcess {
 public:
  TunnelProcess(shared_ptr<SubprocessUtils> _subprocessUtils,
                shared_ptr<ProcessRegistry> _processRegistry,
                const TunnelParams& _params, TunnelEventSink _sink);
  ~TunnelProcess();

  void start();
  /** @brief Same as calling stop() on the handle. Idempotent. */
  void requestStop();
  void join();

  /** @brief The reader loop, run by start() on the tunnel thread. */
  void run();

  const TunnelParams& getParams() const { return params; }
  TunnelHandle getHandle() const { return handle; }

 protected:
  void handleLine(const string& line);

  shared_ptr<SubprocessUtils> subprocessUtils;
  shared_ptr<ProcessRegistry> processRegistry;
  TunnelParams params;
  TunnelEventSink sink;
  TunnelHandle handle;
  bool urlFound;
  recursive_mutex threadMutex;
  shared_ptr<thread> tunnelThread;
};
}  // namespace td

#endif  // __TD_TUNNEL_PROCESS__
