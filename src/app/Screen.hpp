#ifndef __TD_SCREEN__
#define __TD_SCREEN__

#include "ConnectionProfile.hpp"
#include "Headers.hpp"
#include "SessionEvent.hpp"

namespace td {
enum class ScreenType {
  ModeSelect,
  LoginForm,
  Connecting,
  Hosting,
  Viewing,
  ErrorDisplay
};

inline string screenTypeToString(ScreenType type) {
  switch (type) {
    case ScreenType::ModeSelect:
      return "ModeSelect";
    case ScreenType::LoginForm:
      return "LoginForm";
    case ScreenType::Connecting:
      return "Connecting";
    case ScreenType::Hosting:
      return "Hosting";
    case ScreenType::Viewing:
      return "Viewing";
    case ScreenType::ErrorDisplay:
      return "ErrorDisplay";
  }
  return "Unknown";
}

enum class HostingStatus { Starting, Active };

const size_t HOSTING_LOG_LINES = 50;

/**
 * @brief Everything the UI shell needs to draw the current screen. Only the
 * fields of the current screen type are meaningful.
 */
struct Screen {
  ScreenType type = ScreenType::ModeSelect;

  // LoginForm
  td::LoginForm form;
  string formError;

  // Connecting
  ConnectionProfile profile;
  ConnectionStatus phase = ConnectionStatus::Connecting;

  // Hosting
  HostingStatus hostingStatus = HostingStatus::Starting;
  string hostingUrl;
  deque<string> hostingLog;

  // Viewing
  SessionHandle sessionHandle;
  uint32_t frameWidth = 0;
  uint32_t frameHeight = 0;
  shared_ptr<const vector<uint8_t>> framePixels;

  // ErrorDisplay
  string errorMessage;
};
}  // namespace td

#endif  // __TD_SCREEN__
