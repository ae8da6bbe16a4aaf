#ifndef __TD_COMPONENT_LAUNCHER__
#define __TD_COMPONENT_LAUNCHER__

#include "ConnectionProfile.hpp"
#include "Headers.hpp"
#include "ProcessRegistry.hpp"
#include "ProtocolCodec.hpp"
#include "RdpSession.hpp"
#include "SessionEvent.hpp"
#include "SubprocessUtils.hpp"
#include "TransportFactory.hpp"
#include "TunnelEvent.hpp"
#include "TunnelProcess.hpp"

namespace td {
/**
 * @brief A running component as seen by the bus. It reports back only
 * through the sink it was launched with and always ends with a terminal
 * event.
 */
class ComponentTask {
 public:
  virtual ~ComponentTask() {}
  /** @brief Cooperative and idempotent. */
  virtual void requestStop() = 0;
  /** @brief Waits for the component thread. Call after the terminal event. */
  virtual void join() = 0;
};

class TunnelLauncher {
 public:
  virtual ~TunnelLauncher() {}
  virtual shared_ptr<ComponentTask> launch(const TunnelParams& params,
                                           TunnelEventSink sink) = 0;
};

class SessionLauncher {
 public:
  virtual ~SessionLauncher() {}
  virtual shared_ptr<ComponentTask> launch(const ConnectionProfile& profile,
                                           SessionEventSink sink) = 0;
};

/**
 * @brief Launches the tunnel broker as a child process.
 */
class ProcessTunnelLauncher : public TunnelLauncher {
 public:
  ProcessTunnelLauncher(shared_ptr<SubprocessUtils> _subprocessUtils,
                        shared_ptr<ProcessRegistry> _processRegistry)
      : subprocessUtils(_subprocessUtils), processRegistry(_processRegistry) {}

  virtual shared_ptr<ComponentTask> launch(const TunnelParams& params,
                                           TunnelEventSink sink);

 protected:
  shared_ptr<SubprocessUtils> subprocessUtils;
  shared_ptr<ProcessRegistry> processRegistry;
};

/**
 * @brief Launches remote desktop sessions through a protocol codec.
 */
class RdpSessionLauncher : public SessionLauncher {
 public:
  RdpSessionLauncher(shared_ptr<ProtocolCodec> _codec,
                     shared_ptr<TransportFactory> _transportFactory,
                     const RdpSessionOptions& _options)
      : codec(_codec), transportFactory(_transportFactory), options(_options) {}

  virtual shared_ptr<ComponentTask> launch(const ConnectionProfile& profile,
                                           SessionEventSink sink);

 protected:
  shared_ptr<ProtocolCodec> codec;
  shared_ptr<TransportFactory> transportFactory;
  RdpSessionOptions options;
};
}  // namespace td

#endif  // __TD_COMPONENT_LAUNCHER__
