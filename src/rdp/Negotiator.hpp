#ifndef __TD_NEGOTIATOR__
#define __TD_NEGOTIATOR__

#include "ConnectError.hpp"
#include "ConnectionDiagnostics.hpp"
#include "ConnectionProfile.hpp"
#include "Headers.hpp"
#include "ProtocolCodec.hpp"
#include "SessionEvent.hpp"
#include "TransportFactory.hpp"

namespace td {
struct NegotiatorOptions {
  int maxAttempts = NEGOTIATION_ATTEMPTS;
  int backoffMs = NEGOTIATION_BACKOFF_MS;
  int timeoutSeconds = NEGOTIATION_TIMEOUT_SECONDS;
  int diagnosticTimeoutMs = DIAGNOSTIC_READ_TIMEOUT_MS;
};

/**
 * @brief An authenticated transport and the codec state that drives it.
 * Moved into the session loop, never shared.
 */
struct NegotiatedConnection {
  unique_ptr<Transport> transport;
  ConnectionResult result;
};

/**
 * @brief Establishes an authenticated session through the local end of the
 * tunnel.
 *
 * The handshake is attempted up to maxAttempts times with a fixed backoff
 * between attempts. Transport failures and negotiation failures are retried,
 * TLS and authentication failures are not. The whole call is bounded by
 * timeoutSeconds.
 */
class Negotiator {
 public:
  Negotiator(shared_ptr<ProtocolCodec> _codec,
             shared_ptr<TransportFactory> _transportFactory,
             const NegotiatorOptions& _options);
  virtual ~Negotiator() {}

  /**
   * @param onStatus Called on the caller's thread as the phases advance.
   * @param isCancelled Polled between attempts, during the backoff and
   * while the handshake waits on the transport.
   * @throws ConnectError
   */
  NegotiatedConnection connect(const ConnectionProfile& profile,
                               const function<void(ConnectionStatus)>& onStatus,
                               const function<bool()>& isCancelled);

  /** @brief Number of handshake attempts made by the last connect(). */
  int getAttemptsMade() const { return attemptsMade; }

  static ConnectorConfig makeConnectorConfig(const ConnectionProfile& profile);

 protected:
  /**
   * @brief Waits between two attempts. Returns early on cancellation or
   * when the deadline is reached.
   */
  virtual void sleepBeforeRetry(int backoffMs);

  void throwIfExpiredOrCancelled();

  shared_ptr<ProtocolCodec> codec;
  shared_ptr<TransportFactory> transportFactory;
  NegotiatorOptions options;
  int attemptsMade;
  chrono::steady_clock::time_point deadline;
  function<bool()> cancelCheck;
};
}  // namespace td

#endif  // __TD_NEGOTIATOR__
