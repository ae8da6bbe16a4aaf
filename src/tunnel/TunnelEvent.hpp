#ifndef __TD_TUNNEL_EVENT__
#define __TD_TUNNEL_EVENT__

#include "Headers.hpp"

namespace td {
enum class TunnelRole { Host, Client };

/**
 * @brief How to launch the tunnel broker for one role.
 */
struct TunnelParams {
  TunnelRole role = TunnelRole::Host;
  string binaryPath = "cloudflared";
  // Host: the local service exposed through the tunnel
  int servicePort = DEFAULT_SERVICE_PORT;
  // Client: the remote tunnel URL and the local port it is bound to
  string tunnelUrl;
  int localPort = DEFAULT_CLIENT_PROXY_PORT;

  /** @brief Identifies the subscription, changes when the tunnel must be
   * restarted. */
  string subscriptionKey() const {
    if (role == TunnelRole::Host) {
      return "host-tunnel";
    }
    return "client-tunnel|" + tunnelUrl + "|" + to_string(localPort);
  }
};

/**
 * @brief Capability to stop one tunnel subprocess. Copies share the same
 * request flag, stopping twice is a no-op.
 */
class TunnelHandle {
 public:
  TunnelHandle() : stopFlag(new atomic<bool>(false)) {}

  /** @return true for the call that actually requested the stop. */
  bool stop() const { return !stopFlag->exchange(true); }

  bool isStopRequested() const { return *stopFlag; }

  bool operator==(const TunnelHandle& other) const {
    return stopFlag == other.stopFlag;
  }

 protected:
  shared_ptr<atomic<bool>> stopFlag;
};

enum class TunnelEventType { HandleReady, UrlReady, OutputLine, Error, Stopped };

struct TunnelEvent {
  TunnelEventType type = TunnelEventType::Stopped;
  TunnelHandle handle;
  // UrlReady: the URL, OutputLine and Error: the line or message
  string text;

  bool isTerminal() const { return type == TunnelEventType::Stopped; }

  static TunnelEvent handleReady(const TunnelHandle& handle) {
    TunnelEvent e;
    e.type = TunnelEventType::HandleReady;
    e.handle = handle;
    return e;
  }
  static TunnelEvent urlReady(const string& url) {
    TunnelEvent e;
    e.type = TunnelEventType::UrlReady;
    e.text = url;
    return e;
  }
  static TunnelEvent outputLine(const string& line) {
    TunnelEvent e;
    e.type = TunnelEventType::OutputLine;
    e.text = line;
    return e;
  }
  static TunnelEvent error(const string& message) {
    TunnelEvent e;
    e.type = TunnelEventType::Error;
    e.text = message;
    return e;
  }
  static TunnelEvent stopped() { return TunnelEvent(); }
};

typedef function<void(const TunnelEvent&)> TunnelEventSink;
}  // namespace td

#endif  // __TD_TUNNEL_EVENT__
