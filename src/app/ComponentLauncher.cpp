#include "ComponentLauncher.hpp"

namespace td {
namespace {
class TunnelProcessTask : public ComponentTask {
 public:
  explicit TunnelProcessTask(shared_ptr<TunnelProcess> _process)
      : process(_process) {}
  virtual void requestStop() { process->requestStop(); }
  virtual void join() { process->join(); }

 protected:
  shared_ptr<TunnelProcess> process;
};

class RdpSessionTask : public ComponentTask {
 public:
  explicit RdpSessionTask(shared_ptr<RdpSession> _session)
      : session(_session) {}
  virtual void requestStop() { session->requestStop(); }
  virtual void join() { session->join(); }

 protected:
  shared_ptr<RdpSession> session;
};
}  // namespace

shared_ptr<ComponentTask> ProcessTunnelLauncher::launch(
    const TunnelParams& params, TunnelEventSink sink) {
  auto process = make_shared<TunnelProcess>(subprocessUtils, processRegistry,
                                            params, sink);
  process->start();
  return make_shared<TunnelProcessTask>(process);
}

shared_ptr<ComponentTask> RdpSessionLauncher::launch(
    const ConnectionProfile& profile, SessionEventSink sink) {
  auto session = make_shared<RdpSession>(codec, transportFactory, profile,
                                         sink, options);
  session->start();
  return make_shared<RdpSessionTask>(session);
}
}  // namespace td
