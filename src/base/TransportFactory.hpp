#ifndef __TD_TRANSPORT_FACTORY__
#define __TD_TRANSPORT_FACTORY__

#include "Headers.hpp"
#include "SocketHandler.hpp"
#include "Transport.hpp"

namespace td {
/**
 * @brief Opens transports and upgrades them to TLS.
 */
class TransportFactory {
 public:
  virtual ~TransportFactory() {}

  /**
   * @brief Connects to endpoint, giving up after timeoutMs.
   * @throws TransportError when no connection can be made.
   */
  virtual unique_ptr<Transport> connect(const SocketEndpoint& endpoint,
                                        int timeoutMs) = 0;

  /**
   * @brief Replaces a plain transport by a TLS session running over it.
   * @throws TlsError when the handshake fails.
   */
  virtual unique_ptr<Transport> upgradeToTls(unique_ptr<Transport> transport,
                                             const string& serverName) = 0;
};

class TcpTransportFactory : public TransportFactory {
 public:
  explicit TcpTransportFactory(shared_ptr<SocketHandler> _socketHandler)
      : socketHandler(_socketHandler) {}
  virtual ~TcpTransportFactory() {}

  virtual unique_ptr<Transport> connect(const SocketEndpoint& endpoint,
                                        int timeoutMs);
  virtual unique_ptr<Transport> upgradeToTls(unique_ptr<Transport> transport,
                                             const string& serverName);

 protected:
  shared_ptr<SocketHandler> socketHandler;
};
}  // namespace td

#endif  // __TD_TRANSPORT_FACTORY__
