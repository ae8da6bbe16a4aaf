#include "RdpSession.hpp"

namespace td {
RdpSession::RdpSession(shared_ptr<ProtocolCodec> _codec,
                       shared_ptr<TransportFactory> _transportFactory,
                       const ConnectionProfile& _profile,
                       SessionEventSink _sink,
                       const RdpSessionOptions& _options)
    : codec(_codec),
      transportFactory(_transportFactory),
      profile(_profile),
      sink(_sink),
      options(_options),
      stopRequested(false) {}

RdpSession::~RdpSession() {
  requestStop();
  join();
}

void RdpSession::start() {
  lock_guard<recursive_mutex> guard(sessionMutex);
  if (sessionThread) {
    STFATAL << "Session started twice";
  }
  sessionThread.reset(new thread(&RdpSession::run, this));
}

void RdpSession::requestStop() {
  SessionHandle currentHandle;
  {
    lock_guard<recursive_mutex> guard(sessionMutex);
    stopRequested = true;
    currentHandle = handle;
  }
  // A full or closed queue is fine, the loop also polls stopRequested
  currentHandle.trySend(InputCommand::disconnect());
}

void RdpSession::join() {
  shared_ptr<thread> t;
  {
    lock_guard<recursive_mutex> guard(sessionMutex);
    t = sessionThread;
  }
  if (t && t->joinable() && t->get_id() != this_thread::get_id()) {
    t->join();
  }
}

void RdpSession::run() {
  el::Helpers::setThreadName("rdp-session");
  sink(SessionEvent::statusChanged(ConnectionStatus::Connecting));

  Negotiator negotiator(codec, transportFactory, options.negotiator);
  NegotiatedConnection connection;
  try {
    connection = negotiator.connect(
        profile,
        [this](ConnectionStatus status) {
          sink(SessionEvent::statusChanged(status));
        },
        [this]() { return bool(stopRequested); });
  } catch (const ConnectError& ce) {
    if (ce.getKind() == ConnectErrorKind::Cancelled || stopRequested) {
      LOG(INFO) << "Connection cancelled";
      sink(SessionEvent::disconnected());
      return;
    }
    LOG(ERROR) << "Connection failed: " << ce.what();
    sink(SessionEvent::error(ce.what()));
    return;
  }

  shared_ptr<InputQueue> inputQueue;
  {
    lock_guard<recursive_mutex> guard(sessionMutex);
    if (stopRequested) {
      LOG(INFO) << "Stop requested while finalizing, dropping connection";
      connection.transport->close();
      sink(SessionEvent::disconnected());
      return;
    }
    inputQueue.reset(new InputQueue(options.inputQueueCapacity));
    handle = SessionHandle(inputQueue);
  }
  sink(SessionEvent::connected(handle));
  sink(SessionEvent::statusChanged(ConnectionStatus::Active));

  SessionLoop loop(std::move(connection), inputQueue, sink, options.loop);
  loop.setStopCheck([this]() { return bool(stopRequested); });
  loop.run();
}
}  // namespace td
