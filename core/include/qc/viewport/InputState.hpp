#pragma once
#include <cstdint>

namespace qc {

enum class KeyCode : std::uint8_t {
  None = 0, Escape, R, Num1, Num2, Num3, Num4, Num5, Num6, Num7, Num8, Num9
};

enum class PointerEventType : std::uint8_t {
  Down,
  Move,
  Up,
  Leave,        // pointer left the chart container
  DoubleClick,
  ContextMenu,
  WindowUp      // button released outside the container
};

// Numbered like DOM MouseEvent.button.
enum class PointerButton : std::uint8_t {
  Primary = 0,
  Middle = 1,
  Secondary = 2
};

// Generic input event, NOT GLFW-specific. Coordinates are container-relative
// canvas pixels, 0 = left/top.
struct PointerEvent {
  PointerEventType type{PointerEventType::Move};
  PointerButton button{PointerButton::Primary};
  double x{0}, y{0};
};

} // namespace qc
