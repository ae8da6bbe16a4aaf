#ifndef __TD_ERRORS__
#define __TD_ERRORS__

#include "Headers.hpp"

namespace td {
/**
 * @brief Thrown when a connect, read or write on a transport fails.
 */
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Thrown when a wall-clock deadline on a transport has passed.
 */
class TimeoutError : public TransportError {
 public:
  explicit TimeoutError(const string& msg) : TransportError(msg) {}
};

/**
 * @brief Thrown when a transport wait is abandoned because its owner asked
 * to stop.
 */
class CancelledError : public TransportError {
 public:
  explicit CancelledError(const string& msg) : TransportError(msg) {}
};

/**
 * @brief Thrown when the TLS upgrade of an established transport fails.
 */
class TlsError : public TransportError {
 public:
  explicit TlsError(const string& msg) : TransportError(msg) {}
};

/**
 * @brief Thrown by protocol codec implementations when negotiation,
 * authentication or active-stage processing fails.
 */
class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Thrown when a subprocess cannot be spawned or its pipes fail.
 */
class ProcessError : public std::runtime_error {
 public:
  explicit ProcessError(const string& msg) : std::runtime_error(msg) {}
};
}  // namespace td

#endif  // __TD_ERRORS__
