#ifndef __TD_CONNECT_ERROR__
#define __TD_CONNECT_ERROR__

#include "Headers.hpp"

namespace td {
enum class ConnectErrorKind {
  // Transport could not be opened or broke during the handshake
  ConnectionFailed,
  // Protocol handshake failed, retried by the negotiator
  NegotiationFailed,
  TlsFailed,
  AuthFailed,
  Timeout,
  Cancelled
};

/**
 * @brief Why establishing a session failed, with an optional diagnosis of
 * the likely root cause.
 */
class ConnectError : public std::runtime_error {
 public:
  ConnectError(ConnectErrorKind _kind, const string& _detail,
               const string& _diagnosis = "")
      : std::runtime_error(formatMessage(_kind, _detail, _diagnosis)),
        kind(_kind),
        detail(_detail),
        diagnosis(_diagnosis) {}

  ConnectErrorKind getKind() const { return kind; }
  const string& getDetail() const { return detail; }
  const string& getDiagnosis() const { return diagnosis; }

  static string formatMessage(ConnectErrorKind kind, const string& detail,
                              const string& diagnosis) {
    string s;
    switch (kind) {
      case ConnectErrorKind::ConnectionFailed:
        s = "connection failed: " + detail;
        break;
      case ConnectErrorKind::NegotiationFailed:
        s = "negotiation failed: " + detail;
        break;
      case ConnectErrorKind::TlsFailed:
        s = "TLS error: " + detail;
        break;
      case ConnectErrorKind::AuthFailed:
        s = "authentication failed: " + detail;
        break;
      case ConnectErrorKind::Timeout:
      case ConnectErrorKind::Cancelled:
        s = detail;
        break;
    }
    if (!diagnosis.empty()) {
      s += "\nDiagnosis: " + diagnosis;
    }
    return s;
  }

 private:
  ConnectErrorKind kind;
  string detail;
  string diagnosis;
};
}  // namespace td

#endif  // __TD_CONNECT_ERROR__
