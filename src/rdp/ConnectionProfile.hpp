#ifndef __TD_CONNECTION_PROFILE__
#define __TD_CONNECTION_PROFILE__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SocketEndpoint.hpp"

namespace td {
/**
 * @brief Thrown when user supplied connection settings are invalid.
 */
class ProfileValidationException : public std::exception {
 public:
  explicit ProfileValidationException(const string& msg) : message(msg) {}
  const char* what() const noexcept override { return message.c_str(); }

 private:
  std::string message = " ";
};

/**
 * @brief Where and as whom to connect. Read-only once a session starts.
 */
struct ConnectionProfile {
  string hostname = "localhost";
  string username;
  // Never serialized
  string password;
  int width = 1920;
  int height = 1080;
  int proxyPort = DEFAULT_CLIENT_PROXY_PORT;

  /** @brief "hostname:proxyPort" */
  string serverAddr() const;
  SocketEndpoint getEndpoint() const;

  /**
   * @throws ProfileValidationException
   */
  void validate() const;

  /** @brief Serializes every field except the password. */
  json toJson() const;
  /**
   * @brief Missing fields take their defaults, the password is left empty.
   * @throws ProfileValidationException
   */
  static ConnectionProfile fromJson(const json& j);

  void save(const string& path) const;
  static ConnectionProfile load(const string& path);

  bool operator==(const ConnectionProfile& other) const {
    return hostname == other.hostname && username == other.username &&
           password == other.password && width == other.width &&
           height == other.height && proxyPort == other.proxyPort;
  }
  bool operator!=(const ConnectionProfile& other) const {
    return !(*this == other);
  }
};

/**
 * @brief Raw text of the login form, as typed by the user.
 */
struct LoginForm {
  string tunnelUrl;
  string username;
  string password;
  string width = "1920";
  string height = "1080";
};

/**
 * @brief A validated request to reach a hosted desktop through its tunnel.
 */
struct ClientConnectRequest {
  string tunnelUrl;
  ConnectionProfile profile;
};

/**
 * @brief Validates the login form and builds the profile used through the
 * local end of the client tunnel.
 * @throws ProfileValidationException naming the offending field.
 */
ClientConnectRequest buildClientConnectRequest(const LoginForm& form,
                                               int proxyPort);

/** @brief Adds https:// when the user typed a bare host name. */
string normalizeTunnelUrl(const string& url);
}  // namespace td

#endif  // __TD_CONNECTION_PROFILE__
