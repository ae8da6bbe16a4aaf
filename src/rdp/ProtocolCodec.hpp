#ifndef __TD_PROTOCOL_CODEC__
#define __TD_PROTOCOL_CODEC__

#include "Errors.hpp"
#include "Headers.hpp"
#include "InputCommand.hpp"
#include "Transport.hpp"

namespace td {
/**
 * The remote desktop wire protocol (PDU encoding, capability exchange,
 * credential exchange and bitmap decoding) lives in a codec library. The
 * classes below are the boundary this engine drives it through. Codec
 * implementations report failures by throwing ProtocolError; transport
 * failures surface as TransportError from the Transport they were given.
 */

struct DesktopSize {
  uint16_t width = 0;
  uint16_t height = 0;
};

enum class InputOperationType {
  KeyPressed,
  KeyReleased,
  MouseMove,
  MouseButtonPressed,
  MouseButtonReleased,
  WheelRotations
};

/**
 * @brief A protocol-level input operation, fed to the fast-path input
 * encoder.
 */
struct InputOperation {
  InputOperationType type = InputOperationType::MouseMove;
  // Set-1 scancode. An 0xE0 or 0xE1 high byte marks an extended key.
  uint16_t scancode = 0;
  uint16_t x = 0;
  uint16_t y = 0;
  MouseButtonKind button = MouseButtonKind::Left;
  bool vertical = true;
  int16_t rotationUnits = 0;

  bool isExtendedKey() const {
    return (scancode & 0xFF00) == 0xE000 || (scancode & 0xFF00) == 0xE100;
  }

  bool operator==(const InputOperation& other) const {
    return type == other.type && scancode == other.scancode &&
           x == other.x && y == other.y && button == other.button &&
           vertical == other.vertical && rotationUnits == other.rotationUnits;
  }
};

/**
 * @brief The session's framebuffer, 32-bit RGBA, row major.
 */
class DecodedImage {
 public:
  DecodedImage(uint16_t _width, uint16_t _height)
      : width(_width), height(_height), data(size_t(_width) * _height * 4, 0) {}

  uint16_t getWidth() const { return width; }
  uint16_t getHeight() const { return height; }
  const vector<uint8_t>& getData() const { return data; }
  vector<uint8_t>& getMutableData() { return data; }

  /** @brief Used by the codec when the server resizes the desktop. */
  void resize(uint16_t newWidth, uint16_t newHeight) {
    width = newWidth;
    height = newHeight;
    data.assign(size_t(newWidth) * newHeight * 4, 0);
  }

 protected:
  uint16_t width;
  uint16_t height;
  vector<uint8_t> data;
};

enum class StageOutputType {
  ResponseFrame,
  GraphicsUpdate,
  Terminate,
  DeactivateAll,
  PointerUpdate
};

struct StageOutput {
  StageOutputType type = StageOutputType::ResponseFrame;
  // Bytes to send back for ResponseFrame
  string frame;
  // Human readable reason for Terminate
  string reason;

  static StageOutput responseFrame(const string& frame) {
    StageOutput o;
    o.type = StageOutputType::ResponseFrame;
    o.frame = frame;
    return o;
  }
  static StageOutput graphicsUpdate() {
    StageOutput o;
    o.type = StageOutputType::GraphicsUpdate;
    return o;
  }
  static StageOutput terminate(const string& reason) {
    StageOutput o;
    o.type = StageOutputType::Terminate;
    o.reason = reason;
    return o;
  }
  static StageOutput deactivateAll() {
    StageOutput o;
    o.type = StageOutputType::DeactivateAll;
    return o;
  }
};

/**
 * @brief Post-authentication session state of the codec.
 */
class ActiveStage {
 public:
  virtual ~ActiveStage() {}

  /**
   * @brief Inspects the start of buffer for a complete PDU.
   * @return its length, or 0 when more bytes are needed.
   */
  virtual size_t findPduLength(const string& buffer) = 0;

  /** @brief Processes one complete inbound PDU. */
  virtual vector<StageOutput> process(DecodedImage* image,
                                      const string& pdu) = 0;

  /** @brief Encodes a batch of input operations. */
  virtual vector<StageOutput> processFastPathInput(
      DecodedImage* image, const vector<InputOperation>& operations) = 0;
};

struct ConnectionResult {
  DesktopSize desktopSize;
  shared_ptr<ActiveStage> activeStage;
};

/**
 * @brief Everything the codec needs to build its client connector.
 */
struct ConnectorConfig {
  string username;
  string password;
  string domain;
  DesktopSize desktopSize;
  string clientName = "tunneldesk";
  uint32_t keyboardLayout = 0x0409;
  // IBM enhanced (101/102 keys)
  uint32_t keyboardType = 4;
  uint32_t keyboardFunctionalKeysCount = 12;
  bool enableTls = true;
  bool enableCredssp = true;
  uint32_t colorDepth = 32;
  bool enableServerPointer = true;
};

/**
 * @brief One connection attempt's handshake state machine. Not reusable
 * across attempts.
 */
class ClientConnector {
 public:
  virtual ~ClientConnector() {}

  /**
   * @brief Runs the pre-authentication negotiation.
   * @return true if the security upgrade must happen before finalize().
   */
  virtual bool beginNegotiation(Transport* transport) = 0;

  /** @brief Tells the connector the transport is now TLS. */
  virtual void markAsUpgraded() = 0;

  /**
   * @brief Runs the credential exchange and the capability exchange.
   * @param serverPublicKey DER certificate of the TLS peer, may be empty.
   */
  virtual ConnectionResult finalize(Transport* transport,
                                    const string& serverName,
                                    const string& serverPublicKey) = 0;
};

class ProtocolCodec {
 public:
  virtual ~ProtocolCodec() {}

  virtual string getName() const = 0;
  virtual shared_ptr<ClientConnector> createConnector(
      const ConnectorConfig& config) = 0;
};
}  // namespace td

#endif  // __TD_PROTOCOL_CODEC__
