#ifndef __TD_CONNECTION_DIAGNOSTICS__
#define __TD_CONNECTION_DIAGNOSTICS__

#include "Headers.hpp"
#include "TransportFactory.hpp"

namespace td {
enum class DiagnosisKind {
  BrokerUnreachable,
  ServiceNotRunning,
  TunnelExpired,
  UnexpectedResponse
};

struct Diagnosis {
  DiagnosisKind kind = DiagnosisKind::BrokerUnreachable;
  SocketEndpoint endpoint;
  // Printable rendering of the first bytes received, if any
  string rawPrefix;

  string describe() const;
};

/**
 * @brief Explains a failed connection by looking at what the tunnel's local
 * end does with a fresh connection.
 */
class ConnectionDiagnostics {
 public:
  ConnectionDiagnostics(shared_ptr<TransportFactory> _transportFactory,
                        int _readTimeoutMs)
      : transportFactory(_transportFactory), readTimeoutMs(_readTimeoutMs) {}

  /** @brief Connects, reads for a short while and classifies the result. */
  Diagnosis probe(const SocketEndpoint& endpoint);

  /** @brief Classifies the bytes the remote end sent unprompted. */
  static Diagnosis classify(const SocketEndpoint& endpoint,
                            const string& firstBytes);

  static string printablePrefix(const string& bytes, size_t maxBytes);

 protected:
  shared_ptr<TransportFactory> transportFactory;
  int readTimeoutMs;
};
}  // namespace td

#endif  // __TD_CONNECTION_DIAGNOSTICS__
