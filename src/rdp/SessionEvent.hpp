#ifndef __TD_SESSION_EVENT__
#define __TD_SESSION_EVENT__

#include "BoundedQueue.hpp"
#include "Headers.hpp"
#include "InputCommand.hpp"

namespace td {
enum class ConnectionStatus { Connecting, TlsUpgrade, Authenticating, Active };

inline string connectionStatusToString(ConnectionStatus status) {
  switch (status) {
    case ConnectionStatus::Connecting:
      return "Connecting";
    case ConnectionStatus::TlsUpgrade:
      return "Upgrading to TLS";
    case ConnectionStatus::Authenticating:
      return "Authenticating";
    case ConnectionStatus::Active:
      return "Active";
  }
  return "Unknown";
}

typedef BoundedQueue<InputCommand> InputQueue;

/**
 * @brief Sending side of a live session's input queue.
 *
 * Copies share the same queue. Sends block while the queue is full and fail
 * once the session has ended, so a second disconnect is a no-op.
 */
class SessionHandle {
 public:
  SessionHandle() {}
  explicit SessionHandle(shared_ptr<InputQueue> _queue) : queue(_queue) {}

  bool isValid() const { return queue.get() != NULL; }

  /**
   * @return false if the session no longer accepts input.
   */
  bool send(const InputCommand& command) const {
    if (!queue) {
      return false;
    }
    return queue->push(command);
  }

  /** @brief Like send(), but gives up instead of blocking on a full queue. */
  bool trySend(const InputCommand& command) const {
    if (!queue) {
      return false;
    }
    return queue->tryPush(command);
  }

  bool disconnect() const { return send(InputCommand::disconnect()); }

  bool operator==(const SessionHandle& other) const {
    return queue == other.queue;
  }

 protected:
  shared_ptr<InputQueue> queue;
};

enum class SessionEventType {
  Connected,
  Frame,
  StatusChanged,
  Error,
  Disconnected
};

struct SessionEvent {
  SessionEventType type = SessionEventType::Disconnected;
  // Connected
  SessionHandle handle;
  // Frame
  uint32_t width = 0;
  uint32_t height = 0;
  shared_ptr<const vector<uint8_t>> pixels;
  // StatusChanged
  ConnectionStatus status = ConnectionStatus::Connecting;
  // Error
  string message;

  bool isTerminal() const {
    return type == SessionEventType::Error ||
           type == SessionEventType::Disconnected;
  }

  static SessionEvent connected(const SessionHandle& handle) {
    SessionEvent e;
    e.type = SessionEventType::Connected;
    e.handle = handle;
    return e;
  }
  static SessionEvent frame(uint32_t width, uint32_t height,
                            shared_ptr<const vector<uint8_t>> pixels) {
    SessionEvent e;
    e.type = SessionEventType::Frame;
    e.width = width;
    e.height = height;
    e.pixels = pixels;
    return e;
  }
  static SessionEvent statusChanged(ConnectionStatus status) {
    SessionEvent e;
    e.type = SessionEventType::StatusChanged;
    e.status = status;
    return e;
  }
  static SessionEvent error(const string& message) {
    SessionEvent e;
    e.type = SessionEventType::Error;
    e.message = message;
    return e;
  }
  static SessionEvent disconnected() {
    SessionEvent e;
    e.type = SessionEventType::Disconnected;
    return e;
  }
};

typedef function<void(const SessionEvent&)> SessionEventSink;
}  // namespace td

#endif  // __TD_SESSION_EVENT__
