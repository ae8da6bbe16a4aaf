#ifndef __TD_SCANCODE_TRANSLATOR__
#define __TD_SCANCODE_TRANSLATOR__

#include "Headers.hpp"
#include "InputCommand.hpp"
#include "ProtocolCodec.hpp"

namespace td {
/**
 * @brief Maps a key reported by the UI toolkit to its set-1 scancode.
 * @return nullopt for unidentified keys and characters with no key on a US
 * layout.
 */
optional<uint16_t> localKeyToScancode(const LocalKey& key);

/**
 * @brief Converts a queued input command to protocol input operations.
 *
 * Pure: the same command always yields the same operations. Disconnect
 * yields no operation.
 */
vector<InputOperation> translateInputCommand(const InputCommand& command);

/**
 * @brief Narrows a wheel delta to the signed 16-bit wire unit, clamping
 * values outside the range.
 */
int16_t narrowWheelDelta(int32_t delta);
}  // namespace td

#endif  // __TD_SCANCODE_TRANSLATOR__
