#ifndef __TD_HEADERS__
#define __TD_HEADERS__

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <paths.h>
#include <pthread.h>
#include <resolv.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "easylogging++.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Negotiation defaults
const int NEGOTIATION_ATTEMPTS = 3;
const int NEGOTIATION_BACKOFF_MS = 1000;
const int NEGOTIATION_TIMEOUT_SECONDS = 30;
const int DIAGNOSTIC_READ_TIMEOUT_MS = 2000;
const int TCP_CONNECT_TIMEOUT_SECONDS = 3;
const int TRANSPORT_WRITE_TIMEOUT_SECONDS = 30;

// Active session defaults
const int SESSION_INACTIVITY_TIMEOUT_SECONDS = 60;
const int SESSION_POLL_INTERVAL_MS = 10;
const int INPUT_QUEUE_CAPACITY = 100;

// Tunnel defaults
const int DEFAULT_SERVICE_PORT = 3389;
const int DEFAULT_CLIENT_PROXY_PORT = 13389;
const int CLIENT_TUNNEL_SETTLE_MS = 3000;
const int TUNNEL_POLL_INTERVAL_MS = 100;
const int CHILD_TERMINATE_GRACE_MS = 2000;
const string TUNNEL_DOMAIN_SUFFIX = "trycloudflare.com";

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

#ifndef TD_VERSION
#define TD_VERSION "unknown"
#endif

namespace td {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

inline string trim(const string &s) {
  const char *whitespace = " \t\r\n";
  auto start = s.find_first_not_of(whitespace);
  if (start == string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(whitespace);
  return s.substr(start, end - start + 1);
}

/**
 * @brief Waits up to timeoutMs for fd to become readable.
 * @return true if the descriptor is readable (or hung up).
 */
inline bool waitOnFdData(int fd, int timeoutMs) {
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(fd, &fdset);
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  int rc = select(fd + 1, &fdset, NULL, NULL, &tv);
  if (rc == -1) {
    if (errno == EINTR) {
      return false;
    }
    STFATAL << "select failed on fd " << fd << ": " << strerror(errno);
  }
  return rc > 0 && FD_ISSET(fd, &fdset);
}

inline int millisUntil(const chrono::steady_clock::time_point &deadline) {
  auto remaining = chrono::duration_cast<chrono::milliseconds>(
      deadline - chrono::steady_clock::now());
  return max(0, int(remaining.count()));
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace td

#endif  // __TD_HEADERS__
