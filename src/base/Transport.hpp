#ifndef __TD_TRANSPORT__
#define __TD_TRANSPORT__

#include "Errors.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace td {
/**
 * @brief A connected, bidirectional byte stream (plain TCP or TLS).
 *
 * The raw read/write calls mirror the POSIX ones and never block. The helpers
 * on top of them honor an optional wall-clock deadline, a cancel check and a
 * write stall limit, and throw TransportError or one of its subclasses
 * instead of returning error codes.
 */
class Transport {
 public:
  Transport() : writeTimeoutSeconds(TRANSPORT_WRITE_TIMEOUT_SECONDS) {}
  virtual ~Transport() {}

  /** @brief Returns true if a read will not block. */
  virtual bool waitForData(int timeoutMs) = 0;
  /** @brief Returns true if a write will make progress. */
  virtual bool waitForWritable(int timeoutMs) = 0;
  /**
   * @brief Reads up to count bytes.
   * @return bytes read, 0 on orderly close, -1 with errno set (EAGAIN when no
   * data is available yet).
   */
  virtual ssize_t read(void* buf, size_t count) = 0;
  virtual ssize_t write(const void* buf, size_t count) = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
  /** @brief DER bytes of the peer certificate, empty when there is none. */
  virtual string getPeerCertificate() const { return ""; }
  virtual string describe() const = 0;

  void setDeadline(const chrono::steady_clock::time_point& newDeadline) {
    deadline = newDeadline;
  }
  void clearDeadline() { deadline.reset(); }
  const optional<chrono::steady_clock::time_point>& getDeadline() const {
    return deadline;
  }
  /**
   * @brief Installs a check that is polled while waiting. Once it returns
   * true, waits throw CancelledError.
   */
  void setCancelCheck(const function<bool()>& check) { cancelCheck = check; }
  void clearCancelCheck() { cancelCheck = nullptr; }
  const function<bool()>& getCancelCheck() const { return cancelCheck; }
  /** @brief writeAll gives up after this long without progress. */
  void setWriteTimeout(int seconds) { writeTimeoutSeconds = seconds; }
  int getWriteTimeout() const { return writeTimeoutSeconds; }

  /** @brief Reads exactly count bytes or throws. */
  void readAll(void* buf, size_t count);
  /**
   * @brief Reads whatever is available, up to maxBytes.
   * @return an empty string if nothing arrived within timeoutMs.
   * @throws TransportError when the peer closed the stream.
   */
  string readSome(size_t maxBytes, int timeoutMs);
  void writeAll(const string& data);
  void writeAll(const void* buf, size_t count);

 protected:
  /**
   * @brief Clamps a wait to the deadline.
   * @throws CancelledError if the cancel check fires.
   * @throws TimeoutError if the deadline has already passed.
   */
  int boundedWait(int timeoutMs) const;

  optional<chrono::steady_clock::time_point> deadline;
  function<bool()> cancelCheck;
  int writeTimeoutSeconds;
};

/**
 * @brief Plain TCP transport over a descriptor owned by a SocketHandler.
 */
class SocketTransport : public Transport {
 public:
  SocketTransport(shared_ptr<SocketHandler> _socketHandler, int _fd,
                  const SocketEndpoint& _endpoint);
  virtual ~SocketTransport();

  virtual bool waitForData(int timeoutMs);
  virtual bool waitForWritable(int timeoutMs);
  virtual ssize_t read(void* buf, size_t count);
  virtual ssize_t write(const void* buf, size_t count);
  virtual void close();
  virtual bool isOpen() const { return fd != -1; }
  virtual string describe() const { return endpoint.toString(); }

  int getFd() const { return fd; }
  const SocketEndpoint& getEndpoint() const { return endpoint; }

 protected:
  shared_ptr<SocketHandler> socketHandler;
  int fd;
  SocketEndpoint endpoint;
};
}  // namespace td

#endif  // __TD_TRANSPORT__
