#ifndef __TD_TLS_TRANSPORT__
#define __TD_TLS_TRANSPORT__

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include "Transport.hpp"

namespace td {
/**
 * @brief TLS client session layered over an already connected
 * SocketTransport.
 *
 * The server certificate is accepted without path validation. Channel
 * security comes from the authentication exchange that runs inside the
 * tunnel, which receives the certificate bytes as binding material.
 */
class TlsTransport : public Transport {
 public:
  /**
   * @brief Runs the TLS client handshake on the socket, honoring the socket
   * transport's deadline.
   * @throws TlsError when the handshake fails.
   */
  static unique_ptr<TlsTransport> upgrade(unique_ptr<SocketTransport> inner,
                                          const string& serverName);

  virtual ~TlsTransport();

  virtual bool waitForData(int timeoutMs);
  virtual bool waitForWritable(int timeoutMs);
  virtual ssize_t read(void* buf, size_t count);
  virtual ssize_t write(const void* buf, size_t count);
  virtual void close();
  virtual bool isOpen() const { return ssl != NULL && inner->isOpen(); }
  virtual string getPeerCertificate() const;
  virtual string describe() const { return "tls://" + inner->describe(); }

 protected:
  TlsTransport(unique_ptr<SocketTransport> _inner, SSL_CTX* _ctx, SSL* _ssl);

  static string lastOpensslError();

  unique_ptr<SocketTransport> inner;
  SSL_CTX* ctx;
  SSL* ssl;
  recursive_mutex sslMutex;
};
}  // namespace td

#endif  // __TD_TLS_TRANSPORT__
