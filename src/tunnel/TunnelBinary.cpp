#include "TunnelBinary.hpp"

namespace td {
namespace {
const char* BINARY_NAME = "cloudflared";
}

optional<string> TunnelBinary::find(const string& overridePath) {
  if (!overridePath.empty()) {
    if (isExecutable(overridePath)) {
      return overridePath;
    }
    LOG(WARNING) << "Tunnel binary override is not executable: "
                 << overridePath;
    return nullopt;
  }

  const char* envPath = ::getenv("TUNNELDESK_CLOUDFLARED");
  if (envPath && *envPath) {
    if (isExecutable(envPath)) {
      return string(envPath);
    }
    LOG(WARNING) << "TUNNELDESK_CLOUDFLARED is not executable: " << envPath;
  }

  string managed = managedInstallPath();
  if (!managed.empty() && isExecutable(managed)) {
    return managed;
  }

  const char* pathEnv = ::getenv("PATH");
  if (pathEnv) {
    for (const auto& dir : split(pathEnv, ':')) {
      if (dir.empty()) {
        continue;
      }
      string candidate = dir + "/" + BINARY_NAME;
      if (isExecutable(candidate)) {
        return candidate;
      }
    }
  }
  VLOG(1) << "No " << BINARY_NAME << " found";
  return nullopt;
}

string TunnelBinary::managedInstallPath() {
  string dataHome;
  const char* xdgDataHome = ::getenv("XDG_DATA_HOME");
  if (xdgDataHome && *xdgDataHome) {
    dataHome = xdgDataHome;
  } else {
    const char* home = ::getenv("HOME");
    if (!home || !*home) {
      return "";
    }
    dataHome = string(home) + "/.local/share";
  }
  return dataHome + "/tunneldesk/bin/" + BINARY_NAME;
}

bool TunnelBinary::isExecutable(const string& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    return false;
  }
  return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}
}  // namespace td
