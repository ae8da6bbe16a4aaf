#include "TcpSocketHandler.hpp"

namespace td {
TcpSocketHandler::TcpSocketHandler() {}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint,
                              int timeoutMs) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto connectDeadline =
      chrono::steady_clock::now() + chrono::milliseconds(timeoutMs);
  int sockFd = -1;
  addrinfo *results = NULL;
  addrinfo *p = NULL;
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = (AI_CANONNAME | AI_V4MAPPED | AI_ADDRCONFIG | AI_ALL);
  std::string portname = std::to_string(endpoint.getPort());
  std::string hostname = endpoint.getName();

  int rc = getaddrinfo(hostname.c_str(), portname.c_str(), &hints, &results);

  if (rc == EAI_NONAME) {
    VLOG(1) << "Cannot resolve hostname: " << gai_strerror(rc);
    if (results) {
      freeaddrinfo(results);
    }
    return -1;
  }

  if (rc != 0) {
    LOG(ERROR) << "Error getting address info for " << endpoint << ": " << rc
               << " (" << gai_strerror(rc) << ")";
    if (results) {
      freeaddrinfo(results);
    }
    return -1;
  }

  // loop through all the results and connect to the first we can
  for (p = results; p != NULL; p = p->ai_next) {
    int remainingMs = millisUntil(connectDeadline);
    if (remainingMs == 0) {
      VLOG(1) << "Connect budget for " << endpoint << " is spent";
      break;
    }
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      LOG(INFO) << "Error creating socket: " << errno << " " << strerror(errno);
      continue;
    }

    // Nonblocking for the connect phase and for the rest of the socket's life
    initSocket(sockFd);
    VLOG(4) << "Set nonblocking";
    if (::connect(sockFd, p->ai_addr, p->ai_addrlen) == -1 &&
        errno != EINPROGRESS) {
      VLOG(1) << "Error connecting to " << endpoint << ": " << errno << " "
              << strerror(errno);
      ::close(sockFd);
      sockFd = -1;
      continue;
    }
    fd_set fdset;
    FD_ZERO(&fdset);
    FD_SET(sockFd, &fdset);
    timeval tv;
    tv.tv_sec = remainingMs / 1000;
    tv.tv_usec = (remainingMs % 1000) * 1000;
    VLOG(4) << "Before selecting sockFd";
    select(sockFd + 1, NULL, &fdset, NULL, &tv);

    if (FD_ISSET(sockFd, &fdset)) {
      int so_error;
      socklen_t len = sizeof so_error;

      FATAL_FAIL(::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, &so_error, &len));

      if (so_error == 0) {
        LOG(INFO) << "Connected to " << endpoint << " using fd " << sockFd;
        break;  // if we get here, we must have connected successfully
      } else {
        VLOG(1) << "Error connecting to " << endpoint << ": " << so_error
                << " " << strerror(so_error);
        ::close(sockFd);
        sockFd = -1;
        continue;
      }
    } else {
      VLOG(1) << "Timed out connecting to " << endpoint;
      ::close(sockFd);
      sockFd = -1;
      continue;
    }
  }
  if (sockFd == -1) {
    LOG(WARNING) << "Could not connect to " << endpoint;
  } else {
    addToActiveSockets(sockFd);
  }

  freeaddrinfo(results);
  return sockFd;
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)) ==
      -1) {
    VLOG(1) << "Could not set TCP_NODELAY: " << strerror(errno);
  }
}
}  // namespace td
