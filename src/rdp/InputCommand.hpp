#ifndef __TD_INPUT_COMMAND__
#define __TD_INPUT_COMMAND__

#include "Headers.hpp"

namespace td {
enum class MouseButtonKind { Left, Middle, Right, X1, X2 };

enum class InputCommandType {
  KeyPressed,
  KeyReleased,
  MouseMoved,
  MouseButtonPressed,
  MouseButtonReleased,
  MouseWheel,
  Disconnect
};

/**
 * @brief One user input, queued from the UI shell to the session loop.
 *
 * Only the fields relevant to the type are meaningful. Disconnect is a
 * control message travelling through the same queue, not a hardware event.
 */
struct InputCommand {
  InputCommandType type = InputCommandType::Disconnect;
  uint16_t scancode = 0;
  uint16_t x = 0;
  uint16_t y = 0;
  MouseButtonKind button = MouseButtonKind::Left;
  bool vertical = true;
  // Wider than the wire unit, narrowed by the translator.
  int32_t delta = 0;

  static InputCommand keyPressed(uint16_t scancode) {
    InputCommand c;
    c.type = InputCommandType::KeyPressed;
    c.scancode = scancode;
    return c;
  }
  static InputCommand keyReleased(uint16_t scancode) {
    InputCommand c;
    c.type = InputCommandType::KeyReleased;
    c.scancode = scancode;
    return c;
  }
  static InputCommand mouseMoved(uint16_t x, uint16_t y) {
    InputCommand c;
    c.type = InputCommandType::MouseMoved;
    c.x = x;
    c.y = y;
    return c;
  }
  static InputCommand mouseButtonPressed(MouseButtonKind button) {
    InputCommand c;
    c.type = InputCommandType::MouseButtonPressed;
    c.button = button;
    return c;
  }
  static InputCommand mouseButtonReleased(MouseButtonKind button) {
    InputCommand c;
    c.type = InputCommandType::MouseButtonReleased;
    c.button = button;
    return c;
  }
  static InputCommand mouseWheel(bool vertical, int32_t delta) {
    InputCommand c;
    c.type = InputCommandType::MouseWheel;
    c.vertical = vertical;
    c.delta = delta;
    return c;
  }
  static InputCommand disconnect() { return InputCommand(); }
};

/**
 * @brief Named keys the UI shell can report.
 */
enum class NamedKey {
  Escape,
  F1,
  F2,
  F3,
  F4,
  F5,
  F6,
  F7,
  F8,
  F9,
  F10,
  F11,
  F12,
  Backspace,
  Tab,
  Enter,
  Shift,
  Control,
  Alt,
  Super,
  CapsLock,
  Space,
  PageUp,
  PageDown,
  End,
  Home,
  ArrowLeft,
  ArrowUp,
  ArrowRight,
  ArrowDown,
  Insert,
  Delete,
  NumLock,
  ScrollLock,
  PrintScreen,
  Pause,
  ContextMenu
};

/**
 * @brief A key as reported by the UI toolkit: named, a character or
 * unidentified.
 */
struct LocalKey {
  enum Kind { Named, Character, Unidentified };

  Kind kind = Unidentified;
  NamedKey named = NamedKey::Escape;
  // UTF-8 text of the key
  string character;

  static LocalKey fromNamed(NamedKey named) {
    LocalKey k;
    k.kind = Named;
    k.named = named;
    return k;
  }
  static LocalKey fromCharacter(const string& character) {
    LocalKey k;
    k.kind = Character;
    k.character = character;
    return k;
  }
  static LocalKey unidentified() { return LocalKey(); }
};
}  // namespace td

#endif  // __TD_INPUT_COMMAND__
