#ifndef __TD_BUS_MESSAGE__
#define __TD_BUS_MESSAGE__

#include "ConnectionProfile.hpp"
#include "Headers.hpp"
#include "SessionEvent.hpp"
#include "TunnelEvent.hpp"

namespace td {
enum class BusMessageType {
  // From the UI shell
  SelectConnect,
  SelectHost,
  BackToModeSelect,
  SubmitLogin,
  StopHosting,
  Disconnect,
  DismissError,
  Shutdown,
  // From timers
  ClientTunnelSettled,
  // From running components
  Session,
  Tunnel
};

/**
 * @brief One entry of the bus queue. Component events carry the generation
 * of the subscription that produced them so stale ones can be told apart.
 */
struct BusMessage {
  BusMessageType type = BusMessageType::Shutdown;
  uint64_t generation = 0;
  td::LoginForm form;
  SessionEvent sessionEvent;
  TunnelEvent tunnelEvent;

  static BusMessage intent(BusMessageType type) {
    BusMessage m;
    m.type = type;
    return m;
  }
  static BusMessage submitLogin(const td::LoginForm& form) {
    BusMessage m;
    m.type = BusMessageType::SubmitLogin;
    m.form = form;
    return m;
  }
  static BusMessage clientTunnelSettled(uint64_t generation) {
    BusMessage m;
    m.type = BusMessageType::ClientTunnelSettled;
    m.generation = generation;
    return m;
  }
  static BusMessage session(uint64_t generation, const SessionEvent& event) {
    BusMessage m;
    m.type = BusMessageType::Session;
    m.generation = generation;
    m.sessionEvent = event;
    return m;
  }
  static BusMessage tunnel(uint64_t generation, const TunnelEvent& event) {
    BusMessage m;
    m.type = BusMessageType::Tunnel;
    m.generation = generation;
    m.tunnelEvent = event;
    return m;
  }
};
}  // namespace td

#endif  // __TD_BUS_MESSAGE__
