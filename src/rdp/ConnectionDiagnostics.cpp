#include "ConnectionDiagnostics.hpp"

namespace td {
string Diagnosis::describe() const {
  switch (kind) {
    case DiagnosisKind::BrokerUnreachable:
      return "Could not reach the tunnel at " + endpoint.toString() +
             ". The tunnel broker is not running or not listening there.";
    case DiagnosisKind::ServiceNotRunning:
      return "The tunnel accepted the connection but nothing answered. The "
             "remote desktop service is probably not running on the host.";
    case DiagnosisKind::TunnelExpired:
      return "The tunnel answered with HTTP instead of the desktop protocol. "
             "The tunnel URL has probably expired or the host is offline.";
    case DiagnosisKind::UnexpectedResponse:
      return "Unexpected response from the remote end: " + rawPrefix;
  }
  return "";
}

Diagnosis ConnectionDiagnostics::probe(const SocketEndpoint& endpoint) {
  unique_ptr<Transport> transport;
  try {
    transport = transportFactory->connect(
        endpoint, TCP_CONNECT_TIMEOUT_SECONDS * 1000);
  } catch (const TransportError& te) {
    VLOG(1) << "Diagnostic connect failed: " << te.what();
    Diagnosis diagnosis;
    diagnosis.kind = DiagnosisKind::BrokerUnreachable;
    diagnosis.endpoint = endpoint;
    return diagnosis;
  }

  string received;
  auto deadline =
      chrono::steady_clock::now() + chrono::milliseconds(readTimeoutMs);
  try {
    while (received.size() < 64) {
      int remaining = millisUntil(deadline);
      if (remaining == 0) {
        break;
      }
      string chunk = transport->readSome(64 - received.size(), remaining);
      if (chunk.empty()) {
        continue;
      }
      received += chunk;
    }
  } catch (const TransportError& te) {
    // The far end closed the connection, classify what we have
    VLOG(1) << "Diagnostic read ended: " << te.what();
  }
  transport->close();
  return classify(endpoint, received);
}

Diagnosis ConnectionDiagnostics::classify(const SocketEndpoint& endpoint,
                                          const string& firstBytes) {
  Diagnosis diagnosis;
  diagnosis.endpoint = endpoint;
  if (firstBytes.empty()) {
    diagnosis.kind = DiagnosisKind::ServiceNotRunning;
  } else if (firstBytes.compare(0, 5, "HTTP/") == 0 ||
             firstBytes.compare(0, 1, "<") == 0) {
    diagnosis.kind = DiagnosisKind::TunnelExpired;
    diagnosis.rawPrefix = printablePrefix(firstBytes, 32);
  } else {
    diagnosis.kind = DiagnosisKind::UnexpectedResponse;
    diagnosis.rawPrefix = printablePrefix(firstBytes, 32);
  }
  return diagnosis;
}

string ConnectionDiagnostics::printablePrefix(const string& bytes,
                                              size_t maxBytes) {
  string s;
  for (size_t i = 0; i < bytes.size() && i < maxBytes; i++) {
    unsigned char c = bytes[i];
    if (c >= 0x20 && c < 0x7F) {
      s += char(c);
    } else {
      char hex[8];
      snprintf(hex, sizeof(hex), "\\x%02x", c);
      s += hex;
    }
  }
  if (bytes.size() > maxBytes) {
    s += "...";
  }
  return s;
}
}  // namespace td
