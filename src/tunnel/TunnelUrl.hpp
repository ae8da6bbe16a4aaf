#ifndef __TD_TUNNEL_URL__
#define __TD_TUNNEL_URL__

#include "Headers.hpp"
#include "TunnelEvent.hpp"

namespace td {
/**
 * @brief Finds the reachability URL the broker prints for a hosted tunnel.
 *
 * Takes the first "https://" in the line up to whitespace, a quote, '>' or
 * '|'. Only URLs whose host is under the tunnel provider's domain are
 * accepted.
 */
optional<string> extractTunnelUrl(const string& line);

/**
 * @brief True if a client-role broker line reports an error or fatal
 * condition.
 */
bool isTunnelErrorLine(const string& line);

/** @brief Command line arguments for the broker in the given role. */
vector<string> buildTunnelArgs(const TunnelParams& params);

/**
 * @brief Splits a byte stream into lines, keeping the trailing partial
 * line for the next call.
 */
class LineSplitter {
 public:
  vector<string> append(const string& data);
  /** @brief Returns the partial line left at end of stream, if any. */
  optional<string> flush();

 protected:
  string pending;
};
}  // namespace td

#endif  // __TD_TUNNEL_URL__
