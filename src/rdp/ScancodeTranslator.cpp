#include "ScancodeTranslator.hpp"

namespace td {
namespace {
uint16_t namedKeyToScancode(NamedKey key) {
  switch (key) {
    case NamedKey::Escape:
      return 0x01;
    case NamedKey::F1:
      return 0x3B;
    case NamedKey::F2:
      return 0x3C;
    case NamedKey::F3:
      return 0x3D;
    case NamedKey::F4:
      return 0x3E;
    case NamedKey::F5:
      return 0x3F;
    case NamedKey::F6:
      return 0x40;
    case NamedKey::F7:
      return 0x41;
    case NamedKey::F8:
      return 0x42;
    case NamedKey::F9:
      return 0x43;
    case NamedKey::F10:
      return 0x44;
    case NamedKey::F11:
      return 0x57;
    case NamedKey::F12:
      return 0x58;
    case NamedKey::Backspace:
      return 0x0E;
    case NamedKey::Tab:
      return 0x0F;
    case NamedKey::Enter:
      return 0x1C;
    case NamedKey::Shift:
      return 0x2A;
    case NamedKey::Control:
      return 0x1D;
    case NamedKey::Alt:
      return 0x38;
    case NamedKey::Super:
      return 0xE05B;
    case NamedKey::CapsLock:
      return 0x3A;
    case NamedKey::Space:
      return 0x39;
    case NamedKey::PageUp:
      return 0xE049;
    case NamedKey::PageDown:
      return 0xE051;
    case NamedKey::End:
      return 0xE04F;
    case NamedKey::Home:
      return 0xE047;
    case NamedKey::ArrowLeft:
      return 0xE04B;
    case NamedKey::ArrowUp:
      return 0xE048;
    case NamedKey::ArrowRight:
      return 0xE04D;
    case NamedKey::ArrowDown:
      return 0xE050;
    case NamedKey::Insert:
      return 0xE052;
    case NamedKey::Delete:
      return 0xE053;
    case NamedKey::NumLock:
      return 0x45;
    case NamedKey::ScrollLock:
      return 0x46;
    case NamedKey::PrintScreen:
      return 0xE037;
    case NamedKey::Pause:
      return 0xE11D;
    case NamedKey::ContextMenu:
      return 0xE05D;
  }
  STFATAL << "Unhandled named key: " << int(key);
  return 0;
}

// US layout, unshifted key for each printable character
const map<char, uint16_t> CHARACTER_SCANCODES = {
    {'a', 0x1E}, {'b', 0x30},  {'c', 0x2E}, {'d', 0x20}, {'e', 0x12},
    {'f', 0x21}, {'g', 0x22},  {'h', 0x23}, {'i', 0x17}, {'j', 0x24},
    {'k', 0x25}, {'l', 0x26},  {'m', 0x32}, {'n', 0x31}, {'o', 0x18},
    {'p', 0x19}, {'q', 0x10},  {'r', 0x13}, {'s', 0x1F}, {'t', 0x14},
    {'u', 0x16}, {'v', 0x2F},  {'w', 0x11}, {'x', 0x2D}, {'y', 0x15},
    {'z', 0x2C}, {'1', 0x02},  {'2', 0x03}, {'3', 0x04}, {'4', 0x05},
    {'5', 0x06}, {'6', 0x07},  {'7', 0x08}, {'8', 0x09}, {'9', 0x0A},
    {'0', 0x0B}, {'-', 0x0C},  {'=', 0x0D}, {'[', 0x1A}, {']', 0x1B},
    {'\\', 0x2B}, {';', 0x27}, {'\'', 0x28}, {'`', 0x29}, {',', 0x33},
    {'.', 0x34}, {'/', 0x35},  {' ', 0x39},
};

const map<char, char> SHIFTED_CHARACTERS = {
    {'!', '1'}, {'@', '2'}, {'#', '3'}, {'$', '4'},  {'%', '5'},
    {'^', '6'}, {'&', '7'}, {'*', '8'}, {'(', '9'},  {')', '0'},
    {'_', '-'}, {'+', '='}, {'{', '['}, {'}', ']'},  {'|', '\\'},
    {':', ';'}, {'"', '\''}, {'~', '`'}, {'<', ','}, {'>', '.'},
    {'?', '/'},
};

optional<uint16_t> characterToScancode(const string& character) {
  if (character.size() != 1) {
    // Empty, multi-character or non-ASCII input
    return nullopt;
  }
  char c = character[0];
  if (c >= 'A' && c <= 'Z') {
    c = char(c - 'A' + 'a');
  }
  auto shifted = SHIFTED_CHARACTERS.find(c);
  if (shifted != SHIFTED_CHARACTERS.end()) {
    c = shifted->second;
  }
  auto it = CHARACTER_SCANCODES.find(c);
  if (it == CHARACTER_SCANCODES.end()) {
    return nullopt;
  }
  return it->second;
}
}  // namespace

optional<uint16_t> localKeyToScancode(const LocalKey& key) {
  switch (key.kind) {
    case LocalKey::Named:
      return namedKeyToScancode(key.named);
    case LocalKey::Character:
      return characterToScancode(key.character);
    case LocalKey::Unidentified:
      return nullopt;
  }
  return nullopt;
}

int16_t narrowWheelDelta(int32_t delta) {
  if (delta > INT16_MAX) {
    return INT16_MAX;
  }
  if (delta < INT16_MIN) {
    return INT16_MIN;
  }
  return int16_t(delta);
}

vector<InputOperation> translateInputCommand(const InputCommand& command) {
  InputOperation op;
  switch (command.type) {
    case InputCommandType::KeyPressed:
      op.type = InputOperationType::KeyPressed;
      op.scancode = command.scancode;
      break;
    case InputCommandType::KeyReleased:
      op.type = InputOperationType::KeyReleased;
      op.scancode = command.scancode;
      break;
    case InputCommandType::MouseMoved:
      op.type = InputOperationType::MouseMove;
      op.x = command.x;
      op.y = command.y;
      break;
    case InputCommandType::MouseButtonPressed:
      op.type = InputOperationType::MouseButtonPressed;
      op.button = command.button;
      break;
    case InputCommandType::MouseButtonReleased:
      op.type = InputOperationType::MouseButtonReleased;
      op.button = command.button;
      break;
    case InputCommandType::MouseWheel:
      op.type = InputOperationType::WheelRotations;
      op.vertical = command.vertical;
      op.rotationUnits = narrowWheelDelta(command.delta);
      break;
    case InputCommandType::Disconnect:
      return {};
  }
  return {op};
}
}  // namespace td
