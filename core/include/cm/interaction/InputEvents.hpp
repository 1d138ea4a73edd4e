#pragma once
#include <cstdint>

namespace cm {

enum class PointerButton : std::uint8_t { Primary = 0, Secondary, Middle };

// Pointer position in surface pixels, 0 = left/top.
struct PointerEvent {
  double x{0}, y{0};
  PointerButton button{PointerButton::Primary};
  std::int64_t timeMs{0};
};

inline PointerEvent pointerAt(double x, double y, std::int64_t timeMs = 0,
                              PointerButton button = PointerButton::Primary) {
  PointerEvent e;
  e.x = x;
  e.y = y;
  e.button = button;
  e.timeMs = timeMs;
  return e;
}

enum class KeyCode : std::uint8_t {
  None = 0, Escape, Delete, Backspace, Enter
};

} // namespace cm
