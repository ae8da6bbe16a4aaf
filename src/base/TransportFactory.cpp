#include "TransportFactory.hpp"

#include "TlsTransport.hpp"

namespace td {
unique_ptr<Transport> TcpTransportFactory::connect(
    const SocketEndpoint& endpoint, int timeoutMs) {
  int fd = socketHandler->connect(endpoint, timeoutMs);
  if (fd == -1) {
    throw TransportError("Could not connect to " + endpoint.toString());
  }
  return unique_ptr<Transport>(
      new SocketTransport(socketHandler, fd, endpoint));
}

unique_ptr<Transport> TcpTransportFactory::upgradeToTls(
    unique_ptr<Transport> transport, const string& serverName) {
  SocketTransport* socketTransport =
      dynamic_cast<SocketTransport*>(transport.get());
  if (socketTransport == NULL) {
    throw TlsError("Only a plain socket transport can be upgraded to TLS");
  }
  transport.release();
  return TlsTransport::upgrade(unique_ptr<SocketTransport>(socketTransport),
                               serverName);
}
}  // namespace td
