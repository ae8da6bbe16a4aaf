#include "TunnelProcess.hpp"

#include "TunnelUrl.hpp"

namespace td {
TunnelProcess::TunnelProcess(shared_ptr<SubprocessUtils> _subprocessUtils,
                             shared_ptr<ProcessRegistry> _processRegistry,
                             const TunnelParams& _params,
                             TunnelEventSink _sink)
    : subprocessUtils(_subprocessUtils),
      processRegistry(_processRegistry),
      params(_params),
      sink(_sink),
      urlFound(false) {}

TunnelProcess::~TunnelProcess() {
  requestStop();
  join();
}

void TunnelProcess::start() {
  lock_guard<recursive_mutex> guard(threadMutex);
  if (tunnelThread) {
    STFATAL << "Tunnel started twice";
  }
  tunnelThread.reset(new thread(&TunnelProcess::run, this));
}

void TunnelProcess::requestStop() { handle.stop(); }

void TunnelProcess::join() {
  shared_ptr<thread> t;
  {
    lock_guard<recursive_mutex> guard(threadMutex);
    t = tunnelThread;
  }
  if (t && t->joinable() && t->get_id() != this_thread::get_id()) {
    t->join();
  }
}

void TunnelProcess::run() {
  el::Helpers::setThreadName(params.role == TunnelRole::Host ? "tunnel-host"
                                                             : "tunnel-client");
  sink(TunnelEvent::handleReady(handle));

  vector<string> args = buildTunnelArgs(params);
  ChildProcess child;
  try {
    child = subprocessUtils->spawnWithErrorPipe(params.binaryPath, args);
  } catch (const ProcessError& pe) {
    LOG(ERROR) << "Failed to start tunnel: " << pe.what();
    sink(TunnelEvent::error(string("Failed to start cloudflared: ") +
                            pe.what()));
    sink(TunnelEvent::stopped());
    return;
  }
  processRegistry->registerChild(child.pid, params.binaryPath);
  LOG(INFO) << "Started " << params.binaryPath << " (" << child.pid
            << ") for " << params.subscriptionKey();

  LineSplitter splitter;
  char buf[4096];
  while (true) {
    if (handle.isStopRequested()) {
      LOG(INFO) << "Stopping tunnel " << params.subscriptionKey();
      break;
    }
    if (!waitOnFdData(child.errorFd, TUNNEL_POLL_INTERVAL_MS)) {
      continue;
    }
    ssize_t bytesRead = ::read(child.errorFd, buf, sizeof(buf));
    if (bytesRead == 0) {
      LOG(INFO) << "Tunnel output closed";
      auto rest = splitter.flush();
      if (rest) {
        handleLine(*rest);
      }
      break;
    }
    if (bytesRead < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      string message = string("Read error: ") + strerror(errno);
      LOG(ERROR) << "Tunnel " << message;
      sink(TunnelEvent::error(message));
      break;
    }
    for (const auto& line : splitter.append(string(buf, bytesRead))) {
      handleLine(line);
    }
  }

  ::close(child.errorFd);
  int status = subprocessUtils->terminate(child.pid, CHILD_TERMINATE_GRACE_MS);
  processRegistry->unregisterChild(child.pid);
  if (status != -1 && WIFEXITED(status)) {
    LOG(INFO) << "Tunnel exited with code " << WEXITSTATUS(status);
  } else if (status != -1 && WIFSIGNALED(status)) {
    LOG(INFO) << "Tunnel killed by signal " << WTERMSIG(status);
  }
  sink(TunnelEvent::stopped());
}

void TunnelProcess::handleLine(const string& line) {
  VLOG(1) << "cloudflared: " << line;
  if (params.role == TunnelRole::Host) {
    if (!urlFound) {
      auto url = extractTunnelUrl(line);
      if (url) {
        urlFound = true;
        LOG(INFO) << "Tunnel URL: " << *url;
        sink(TunnelEvent::urlReady(*url));
      }
    }
    sink(TunnelEvent::outputLine(line));
    return;
  }
  if (isTunnelErrorLine(line)) {
    LOG(WARNING) << "cloudflared error: " << line;
    sink(TunnelEvent::error(line));
  } else {
    sink(TunnelEvent::outputLine(line));
  }
}
}  // namespace td
