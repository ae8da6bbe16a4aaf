#include "Negotiator.hpp"

namespace td {
Negotiator::Negotiator(shared_ptr<ProtocolCodec> _codec,
                       shared_ptr<TransportFactory> _transportFactory,
                       const NegotiatorOptions& _options)
    : codec(_codec),
      transportFactory(_transportFactory),
      options(_options),
      attemptsMade(0) {}

ConnectorConfig Negotiator::makeConnectorConfig(
    const ConnectionProfile& profile) {
  ConnectorConfig config;
  config.username = profile.username;
  config.password = profile.password;
  config.desktopSize.width = uint16_t(profile.width);
  config.desktopSize.height = uint16_t(profile.height);
  return config;
}

void Negotiator::throwIfExpiredOrCancelled() {
  if (cancelCheck && cancelCheck()) {
    throw ConnectError(ConnectErrorKind::Cancelled, "Connection cancelled");
  }
  if (chrono::steady_clock::now() >= deadline) {
    throw ConnectError(ConnectErrorKind::Timeout,
                       "Connection timed out after " +
                           to_string(options.timeoutSeconds) + " seconds");
  }
}

void Negotiator::sleepBeforeRetry(int backoffMs) {
  auto wakeTime = min(chrono::steady_clock::now() +
                          chrono::milliseconds(backoffMs),
                      deadline);
  while (chrono::steady_clock::now() < wakeTime) {
    if (cancelCheck && cancelCheck()) {
      return;
    }
    std::this_thread::sleep_for(
        chrono::milliseconds(min(50, max(1, millisUntil(wakeTime)))));
  }
}

NegotiatedConnection Negotiator::connect(
    const ConnectionProfile& profile,
    const function<void(ConnectionStatus)>& onStatus,
    const function<bool()>& isCancelled) {
  cancelCheck = isCancelled;
  attemptsMade = 0;
  deadline = chrono::steady_clock::now() +
             chrono::seconds(options.timeoutSeconds);
  SocketEndpoint endpoint = profile.getEndpoint();
  ConnectorConfig config = makeConnectorConfig(profile);
  LOG(INFO) << "Connecting to proxy at " << endpoint;

  unique_ptr<Transport> transport;
  shared_ptr<ClientConnector> connector;
  bool shouldUpgrade = false;
  ConnectErrorKind lastKind = ConnectErrorKind::ConnectionFailed;
  string lastDetail;
  for (int attempt = 1; attempt <= options.maxAttempts; attempt++) {
    throwIfExpiredOrCancelled();
    attemptsMade = attempt;
    try {
      int connectTimeoutMs = min(TCP_CONNECT_TIMEOUT_SECONDS * 1000,
                                 max(1, millisUntil(deadline)));
      transport = transportFactory->connect(endpoint, connectTimeoutMs);
      transport->setDeadline(deadline);
      transport->setCancelCheck(cancelCheck);
      connector = codec->createConnector(config);
      shouldUpgrade = connector->beginNegotiation(transport.get());
      VLOG(1) << "Negotiation succeeded on attempt " << attempt;
      break;
    } catch (const TimeoutError& te) {
      throwIfExpiredOrCancelled();
      lastKind = ConnectErrorKind::ConnectionFailed;
      lastDetail = te.what();
    } catch (const TransportError& te) {
      throwIfExpiredOrCancelled();
      lastKind = ConnectErrorKind::ConnectionFailed;
      lastDetail = te.what();
    } catch (const ProtocolError& pe) {
      lastKind = ConnectErrorKind::NegotiationFailed;
      lastDetail = pe.what();
    }
    transport.reset();
    connector.reset();
    LOG(WARNING) << "Handshake attempt " << attempt << "/"
                 << options.maxAttempts << " failed: " << lastDetail;
    if (attempt < options.maxAttempts) {
      sleepBeforeRetry(options.backoffMs);
    }
  }

  if (!transport) {
    throwIfExpiredOrCancelled();
    ConnectionDiagnostics diagnostics(transportFactory,
                                      options.diagnosticTimeoutMs);
    Diagnosis diagnosis = diagnostics.probe(endpoint);
    LOG(ERROR) << "Giving up on " << endpoint << " after " << attemptsMade
               << " attempts: " << diagnosis.describe();
    throw ConnectError(lastKind,
                       lastDetail + " (after " + to_string(attemptsMade) +
                           " attempts)",
                       diagnosis.describe());
  }

  string serverPublicKey;
  if (shouldUpgrade) {
    if (onStatus) {
      onStatus(ConnectionStatus::TlsUpgrade);
    }
    LOG(INFO) << "TLS upgrade required, upgrading...";
    try {
      transport =
          transportFactory->upgradeToTls(std::move(transport), profile.hostname);
    } catch (const TimeoutError& te) {
      throwIfExpiredOrCancelled();
      throw ConnectError(ConnectErrorKind::TlsFailed, te.what());
    } catch (const TransportError& te) {
      throwIfExpiredOrCancelled();
      throw ConnectError(ConnectErrorKind::TlsFailed, te.what());
    }
    serverPublicKey = transport->getPeerCertificate();
    VLOG(1) << "Peer certificate is " << serverPublicKey.size() << " bytes";
    connector->markAsUpgraded();
  }

  throwIfExpiredOrCancelled();
  if (onStatus) {
    onStatus(ConnectionStatus::Authenticating);
  }
  NegotiatedConnection connection;
  try {
    connection.result =
        connector->finalize(transport.get(), profile.hostname, serverPublicKey);
  } catch (const TimeoutError& te) {
    throwIfExpiredOrCancelled();
    throw ConnectError(ConnectErrorKind::ConnectionFailed, te.what());
  } catch (const TransportError& te) {
    throwIfExpiredOrCancelled();
    throw ConnectError(ConnectErrorKind::ConnectionFailed, te.what());
  } catch (const ProtocolError& pe) {
    throw ConnectError(ConnectErrorKind::AuthFailed, pe.what());
  }
  if (!connection.result.activeStage) {
    throw ConnectError(ConnectErrorKind::AuthFailed,
                       "codec finished without an active session");
  }
  transport->clearDeadline();
  transport->clearCancelCheck();
  connection.transport = std::move(transport);
  LOG(INFO) << "Connection to " << endpoint << " established ("
            << connection.result.desktopSize.width << "x"
            << connection.result.desktopSize.height << ")";
  return connection;
}
}  // namespace td
