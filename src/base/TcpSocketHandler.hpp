#ifndef __TD_TCP_SOCKET_HANDLER__
#define __TD_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace td {
/**
 * @brief Implements IPv4/IPv6 client sockets on top of UnixSocketHandler.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the hostname/port and connects non-blockingly to the
   * server. All addresses share one timeoutMs budget.
   */
  virtual int connect(const SocketEndpoint& endpoint, int timeoutMs);

 protected:
  /**
   * @brief Performs additional TCP-specific socket configuration (NODELAY).
   */
  virtual void initSocket(int fd);
};
}  // namespace td

#endif  // __TD_TCP_SOCKET_HANDLER__
