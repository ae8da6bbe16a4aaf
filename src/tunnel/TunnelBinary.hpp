#ifndef __TD_TUNNEL_BINARY__
#define __TD_TUNNEL_BINARY__

#include "Headers.hpp"

namespace td {
class TunnelBinary {
 public:
  /**
   * @brief Locates the tunnel broker executable.
   *
   * Looks at the override path, then $TUNNELDESK_CLOUDFLARED, then the
   * managed install location, then every directory on $PATH.
   * @return the path of the first executable found, or nullopt.
   */
  static optional<string> find(const string& overridePath);

  /** @brief $XDG_DATA_HOME/tunneldesk/bin/cloudflared or the ~/.local/share
   * equivalent. Empty if neither variable is set. */
  static string managedInstallPath();

  static bool isExecutable(const string& path);
};
}  // namespace td

#endif  // __TD_TUNNEL_BINARY__
