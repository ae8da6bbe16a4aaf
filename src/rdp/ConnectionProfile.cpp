#include "ConnectionProfile.hpp"

namespace td {
namespace {
int parseDimension(const string& name, const string& rawValue) {
  string value = trim(rawValue);
  if (value.empty()) {
    throw ProfileValidationException(name + " is required");
  }
  for (char c : value) {
    if (c < '0' || c > '9') {
      throw ProfileValidationException(name + " must be a number: " + value);
    }
  }
  if (value.size() > 5) {
    throw ProfileValidationException(name + " is out of range: " + value);
  }
  int parsed = stoi(value);
  if (parsed <= 0 || parsed > 65535) {
    throw ProfileValidationException(name + " is out of range: " + value);
  }
  return parsed;
}
}  // namespace

string ConnectionProfile::serverAddr() const {
  return getEndpoint().toString();
}

SocketEndpoint ConnectionProfile::getEndpoint() const {
  return SocketEndpoint(hostname, proxyPort);
}

void ConnectionProfile::validate() const {
  if (hostname.empty()) {
    throw ProfileValidationException("Hostname is required");
  }
  if (username.empty()) {
    throw ProfileValidationException("Username is required");
  }
  if (width <= 0 || width > 65535) {
    throw ProfileValidationException("Width is out of range: " +
                                     to_string(width));
  }
  if (height <= 0 || height > 65535) {
    throw ProfileValidationException("Height is out of range: " +
                                     to_string(height));
  }
  if (proxyPort < 1 || proxyPort > 65535) {
    throw ProfileValidationException("Proxy port is out of range: " +
                                     to_string(proxyPort));
  }
}

json ConnectionProfile::toJson() const {
  json j;
  j["hostname"] = hostname;
  j["username"] = username;
  j["width"] = width;
  j["height"] = height;
  j["proxy_port"] = proxyPort;
  return j;
}

ConnectionProfile ConnectionProfile::fromJson(const json& j) {
  ConnectionProfile profile;
  try {
    profile.hostname = j.value("hostname", profile.hostname);
    profile.username = j.value("username", profile.username);
    profile.width = j.value("width", profile.width);
    profile.height = j.value("height", profile.height);
    profile.proxyPort = j.value("proxy_port", profile.proxyPort);
  } catch (const json::exception& je) {
    throw ProfileValidationException(string("Invalid profile: ") + je.what());
  }
  profile.validate();
  return profile;
}

void ConnectionProfile::save(const string& path) const {
  writeJsonFile(path, toJson());
  LOG(INFO) << "Saved profile for " << username << " to " << path;
}

ConnectionProfile ConnectionProfile::load(const string& path) {
  return fromJson(readJsonFile(path));
}

string normalizeTunnelUrl(const string& url) {
  string trimmed = trim(url);
  if (trimmed.empty() || trimmed.find("://") != string::npos) {
    return trimmed;
  }
  return "https://" + trimmed;
}

ClientConnectRequest buildClientConnectRequest(const LoginForm& form,
                                               int proxyPort) {
  ClientConnectRequest request;
  request.tunnelUrl = normalizeTunnelUrl(form.tunnelUrl);
  if (request.tunnelUrl.empty()) {
    throw ProfileValidationException("Tunnel URL is required");
  }
  if (request.tunnelUrl.find(' ') != string::npos) {
    throw ProfileValidationException("Tunnel URL must not contain spaces");
  }
  ConnectionProfile& profile = request.profile;
  profile.hostname = "localhost";
  profile.username = trim(form.username);
  profile.password = form.password;
  profile.width = parseDimension("Width", form.width);
  profile.height = parseDimension("Height", form.height);
  profile.proxyPort = proxyPort;
  profile.validate();
  return request;
}
}  // namespace td
