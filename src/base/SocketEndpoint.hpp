#ifndef __TD_SOCKET_ENDPOINT__
#define __TD_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace td {
class SocketEndpoint {
 public:
  SocketEndpoint() : name(""), port(-1) {}

  SocketEndpoint(const string &_name, int _port) : name(_name), port(_port) {}

  const string &getName() const { return name; }

  int getPort() const { return port; }

  string toString() const {
    if (port >= 0) {
      return name + ":" + to_string(port);
    }
    return name;
  }

  bool operator==(const SocketEndpoint &other) const {
    return name == other.name && port == other.port;
  }

 protected:
  string name;
  int port;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  return os << self.toString();
}
}  // namespace td

#endif  // __TD_SOCKET_ENDPOINT__
