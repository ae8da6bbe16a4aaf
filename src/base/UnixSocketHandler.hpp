#ifndef __TD_UNIX_SOCKET_HANDLER__
#define __TD_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace td {
/**
 * @brief Default SocketHandler implementation using POSIX sockets with mutex
 * guards.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  virtual bool waitForData(int fd, int timeoutMs);
  virtual bool waitForWritable(int fd, int timeoutMs);
  /** @brief Reads up to `count` bytes while holding the per-socket mutex. */
  virtual ssize_t read(int fd, void* buf, size_t count);
  /** @brief Makes a single non-blocking send while holding the mutex. */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  /** @brief Closes the descriptor and removes it from the tracked set. */
  virtual void close(int fd);

 protected:
  /**
   * @brief Ensures that a descriptor is tracked and has its own mutex.
   */
  void addToActiveSockets(int fd);
  /**
   * @brief Performs per-socket initialization (non-blocking, signal handling).
   */
  virtual void initSocket(int fd);

  /** @brief Mutex per active socket to ensure serial read/write. */
  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  /** @brief Guards access to the active socket map. */
  recursive_mutex globalMutex;
};
}  // namespace td

#endif  // __TD_UNIX_SOCKET_HANDLER__
