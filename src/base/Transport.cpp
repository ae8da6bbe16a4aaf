#include "Transport.hpp"

namespace td {
int Transport::boundedWait(int timeoutMs) const {
  if (cancelCheck && cancelCheck()) {
    throw CancelledError("Cancelled while waiting on " + describe());
  }
  if (!deadline) {
    return timeoutMs;
  }
  if (chrono::steady_clock::now() >= *deadline) {
    throw TimeoutError("Deadline exceeded on " + describe());
  }
  return min(timeoutMs, millisUntil(*deadline));
}

void Transport::readAll(void* buf, size_t count) {
  size_t pos = 0;
  while (pos < count) {
    if (!waitForData(boundedWait(100))) {
      continue;
    }
    ssize_t bytesRead = read(((char*)buf) + pos, count - pos);
    if (bytesRead == 0) {
      throw TransportError("Connection closed by " + describe());
    }
    if (bytesRead < 0) {
      auto localErrno = errno;
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        continue;
      }
      throw TransportError(string("Read from ") + describe() +
                           " failed: " + strerror(localErrno));
    }
    pos += bytesRead;
  }
}

string Transport::readSome(size_t maxBytes, int timeoutMs) {
  if (!waitForData(boundedWait(timeoutMs))) {
    return "";
  }
  string s(maxBytes, '\0');
  ssize_t bytesRead = read(&s[0], maxBytes);
  if (bytesRead == 0) {
    throw TransportError("Connection closed by " + describe());
  }
  if (bytesRead < 0) {
    auto localErrno = errno;
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
      return "";
    }
    throw TransportError(string("Read from ") + describe() +
                         " failed: " + strerror(localErrno));
  }
  s.resize(bytesRead);
  return s;
}

void Transport::writeAll(const string& data) {
  writeAll(data.data(), data.size());
}

void Transport::writeAll(const void* buf, size_t count) {
  size_t pos = 0;
  auto lastProgress = chrono::steady_clock::now();
  while (pos < count) {
    int waitMs = boundedWait(100);
    ssize_t bytesWritten = write(((const char*)buf) + pos, count - pos);
    if (bytesWritten < 0) {
      auto localErrno = errno;
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        if (chrono::steady_clock::now() - lastProgress >=
            chrono::seconds(writeTimeoutSeconds)) {
          throw TimeoutError("Write to " + describe() + " stalled for " +
                             to_string(writeTimeoutSeconds) + " seconds");
        }
        waitForWritable(waitMs);
        continue;
      }
      throw TransportError(string("Write to ") + describe() +
                           " failed: " + strerror(localErrno));
    }
    if (bytesWritten == 0) {
      throw TransportError("Connection closed during write to " + describe());
    }
    pos += bytesWritten;
    lastProgress = chrono::steady_clock::now();
  }
}

SocketTransport::SocketTransport(shared_ptr<SocketHandler> _socketHandler,
                                 int _fd, const SocketEndpoint& _endpoint)
    : socketHandler(_socketHandler), fd(_fd), endpoint(_endpoint) {}

SocketTransport::~SocketTransport() { close(); }

bool SocketTransport::waitForData(int timeoutMs) {
  if (fd == -1) {
    throw TransportError("Transport to " + describe() + " is closed");
  }
  return socketHandler->waitForData(fd, timeoutMs);
}

bool SocketTransport::waitForWritable(int timeoutMs) {
  if (fd == -1) {
    throw TransportError("Transport to " + describe() + " is closed");
  }
  return socketHandler->waitForWritable(fd, timeoutMs);
}

ssize_t SocketTransport::read(void* buf, size_t count) {
  if (fd == -1) {
    errno = EPIPE;
    return -1;
  }
  return socketHandler->read(fd, buf, count);
}

ssize_t SocketTransport::write(const void* buf, size_t count) {
  if (fd == -1) {
    errno = EPIPE;
    return -1;
  }
  return socketHandler->write(fd, buf, count);
}

void SocketTransport::close() {
  if (fd != -1) {
    socketHandler->close(fd);
    fd = -1;
  }
}
}  // namespace td
