#ifndef __TD_SOCKET_HANDLER__
#define __TD_SOCKET_HANDLER__

#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace td {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Blocks up to timeoutMs until the descriptor becomes readable.
   */
  virtual bool waitForData(int fd, int timeoutMs) = 0;
  /**
   * @brief Blocks up to timeoutMs until the descriptor can accept more bytes.
   */
  virtual bool waitForWritable(int fd, int timeoutMs) = 0;
  /**
   * @brief Reads up to count bytes from fd.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd without blocking.
   * @return bytes written (possibly fewer than count), or -1 with errno set
   * (EAGAIN when the send buffer is full).
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Opens a connection to the specified endpoint, giving up after
   * timeoutMs across all resolved addresses.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint, int timeoutMs) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
};
}  // namespace td

#endif  // __TD_SOCKET_HANDLER__
