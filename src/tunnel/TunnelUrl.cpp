#include "TunnelUrl.hpp"

namespace td {
optional<string> extractTunnelUrl(const string& line) {
  static const string SCHEME = "https://";
  auto start = line.find(SCHEME);
  if (start == string::npos) {
    return nullopt;
  }
  auto end = line.find_first_of(" \t\r\n\"'>|", start);
  string url = line.substr(start, end == string::npos ? string::npos
                                                      : end - start);

  string host = url.substr(SCHEME.size());
  auto hostEnd = host.find_first_of("/:?#");
  if (hostEnd != string::npos) {
    host = host.substr(0, hostEnd);
  }
  string suffix = "." + TUNNEL_DOMAIN_SUFFIX;
  if (host.size() <= suffix.size() ||
      host.compare(host.size() - suffix.size(), suffix.size(), suffix) != 0) {
    return nullopt;
  }
  return url;
}

bool isTunnelErrorLine(const string& line) {
  return line.find(" ERR ") != string::npos ||
         line.find("\"level\":\"error\"") != string::npos ||
         line.find("\"level\":\"fatal\"") != string::npos;
}

vector<string> buildTunnelArgs(const TunnelParams& params) {
  if (params.role == TunnelRole::Host) {
    return {"tunnel", "--url",
            "tcp://localhost:" + to_string(params.servicePort)};
  }
  return {"access",   "tcp",   "--hostname",
          params.tunnelUrl, "--url", "localhost:" + to_string(params.localPort)};
}

vector<string> LineSplitter::append(const string& data) {
  pending += data;
  vector<string> lines;
  size_t pos;
  while ((pos = pending.find('\n')) != string::npos) {
    string line = pending.substr(0, pos);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(line);
    pending.erase(0, pos + 1);
  }
  return lines;
}

optional<string> LineSplitter::flush() {
  if (pending.empty()) {
    return nullopt;
  }
  string line = pending;
  pending.clear();
  if (line.back() == '\r') {
    line.pop_back();
  }
  return line;
}
}  // namespace td
