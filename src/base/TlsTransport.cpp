#include "TlsTransport.hpp"

namespace td {
unique_ptr<TlsTransport> TlsTransport::upgrade(
    unique_ptr<SocketTransport> inner, const string& serverName) {
  if (!inner || !inner->isOpen()) {
    throw TlsError("Cannot upgrade a closed transport");
  }
  SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
  if (ctx == NULL) {
    throw TlsError("Could not create TLS context: " + lastOpensslError());
  }
  SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, NULL);
  // Lets writeAll observe progress on large frames record by record
  SSL_CTX_set_mode(ctx, SSL_MODE_ENABLE_PARTIAL_WRITE);
  SSL* ssl = SSL_new(ctx);
  if (ssl == NULL) {
    SSL_CTX_free(ctx);
    throw TlsError("Could not create TLS session: " + lastOpensslError());
  }
  SSL_set_fd(ssl, inner->getFd());
  if (!serverName.empty()) {
    SSL_set_tlsext_host_name(ssl, serverName.c_str());
  }
  // From here on the transport owns ctx and ssl.
  unique_ptr<TlsTransport> transport(
      new TlsTransport(std::move(inner), ctx, ssl));
  if (transport->inner->getDeadline()) {
    transport->setDeadline(*transport->inner->getDeadline());
  }
  transport->setCancelCheck(transport->inner->getCancelCheck());
  transport->setWriteTimeout(transport->inner->getWriteTimeout());

  while (true) {
    ERR_clear_error();
    int rc = SSL_connect(ssl);
    if (rc == 1) {
      break;
    }
    int sslError = SSL_get_error(ssl, rc);
    // Throws TimeoutError once the caller's deadline has passed
    int waitMs = transport->boundedWait(100);
    if (sslError == SSL_ERROR_WANT_READ) {
      transport->inner->waitForData(waitMs);
    } else if (sslError == SSL_ERROR_WANT_WRITE) {
      transport->inner->waitForWritable(waitMs);
    } else {
      string reason = lastOpensslError();
      if (reason.empty()) {
        reason = (sslError == SSL_ERROR_SYSCALL && errno != 0)
                     ? string(strerror(errno))
                     : "connection closed during handshake";
      }
      throw TlsError("TLS handshake failed: " + reason);
    }
  }
  LOG(INFO) << "TLS established with " << transport->inner->describe()
            << " using " << SSL_get_version(ssl);
  return transport;
}

TlsTransport::TlsTransport(unique_ptr<SocketTransport> _inner, SSL_CTX* _ctx,
                           SSL* _ssl)
    : inner(std::move(_inner)), ctx(_ctx), ssl(_ssl) {}

TlsTransport::~TlsTransport() {
  close();
  if (ctx != NULL) {
    SSL_CTX_free(ctx);
    ctx = NULL;
  }
}

bool TlsTransport::waitForData(int timeoutMs) {
  {
    lock_guard<recursive_mutex> guard(sslMutex);
    if (ssl == NULL) {
      throw TransportError("Transport to " + describe() + " is closed");
    }
    // Decrypted bytes may already be buffered inside OpenSSL
    if (SSL_pending(ssl) > 0) {
      return true;
    }
  }
  return inner->waitForData(timeoutMs);
}

bool TlsTransport::waitForWritable(int timeoutMs) {
  {
    lock_guard<recursive_mutex> guard(sslMutex);
    if (ssl == NULL) {
      throw TransportError("Transport to " + describe() + " is closed");
    }
  }
  return inner->waitForWritable(timeoutMs);
}

ssize_t TlsTransport::read(void* buf, size_t count) {
  lock_guard<recursive_mutex> guard(sslMutex);
  if (ssl == NULL) {
    errno = EPIPE;
    return -1;
  }
  ERR_clear_error();
  int rc = SSL_read(ssl, buf, int(count));
  if (rc > 0) {
    return rc;
  }
  int sslError = SSL_get_error(ssl, rc);
  if (sslError == SSL_ERROR_WANT_READ || sslError == SSL_ERROR_WANT_WRITE) {
    errno = EAGAIN;
    return -1;
  }
  if (sslError == SSL_ERROR_ZERO_RETURN) {
    return 0;
  }
  LOG(WARNING) << "TLS read failed on " << describe() << ": "
               << lastOpensslError();
  if (errno == 0 || errno == EAGAIN) {
    errno = EPIPE;
  }
  return -1;
}

ssize_t TlsTransport::write(const void* buf, size_t count) {
  lock_guard<recursive_mutex> guard(sslMutex);
  if (ssl == NULL) {
    errno = EPIPE;
    return -1;
  }
  ERR_clear_error();
  int rc = SSL_write(ssl, buf, int(count));
  if (rc > 0) {
    return rc;
  }
  int sslError = SSL_get_error(ssl, rc);
  if (sslError == SSL_ERROR_WANT_READ || sslError == SSL_ERROR_WANT_WRITE) {
    errno = EAGAIN;
    return -1;
  }
  LOG(WARNING) << "TLS write failed on " << describe() << ": "
               << lastOpensslError();
  if (errno == 0 || errno == EAGAIN) {
    errno = EPIPE;
  }
  return -1;
}

void TlsTransport::close() {
  lock_guard<recursive_mutex> guard(sslMutex);
  if (ssl != NULL) {
    // Best effort close_notify, the socket is non-blocking
    SSL_shutdown(ssl);
    SSL_free(ssl);
    ssl = NULL;
  }
  inner->close();
}

string TlsTransport::getPeerCertificate() const {
  if (ssl == NULL) {
    return "";
  }
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
  X509* cert = SSL_get1_peer_certificate(ssl);
#else
  X509* cert = SSL_get_peer_certificate(ssl);
#endif
  if (cert == NULL) {
    return "";
  }
  string der;
  int length = i2d_X509(cert, NULL);
  if (length > 0) {
    der.resize(length);
    unsigned char* out = (unsigned char*)&der[0];
    i2d_X509(cert, &out);
  }
  X509_free(cert);
  return der;
}

string TlsTransport::lastOpensslError() {
  string s;
  unsigned long e;
  while ((e = ERR_get_error()) != 0) {
    char buf[256];
    ERR_error_string_n(e, buf, sizeof(buf));
    if (!s.empty()) {
      s += "; ";
    }
    s += buf;
  }
  return s;
}
}  // namespace td
