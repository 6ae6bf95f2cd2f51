#pragma once

#include <cstdint>
#include <optional>

// Requests the engine hands back to the host. The engine never saves or
// closes anything itself.
enum class HostAction : std::uint8_t {
  Save,      // :w
  Quit,      // :q
  SaveQuit,  // :wq
};

inline const char* actionName(HostAction action) {
  switch (action) {
    case HostAction::Save: return "save";
    case HostAction::Quit: return "quit";
    case HostAction::SaveQuit: return "save_quit";
  }
  return "";
}

// Result of one dispatch call.
struct DispatchResult {
  bool consumed = false;               // false: host may route the key elsewhere
  std::optional<HostAction> action;

  DispatchResult() = default;
  DispatchResult(bool c, std::optional<HostAction> a = std::nullopt)
    : consumed(c), action(a) {}
};
