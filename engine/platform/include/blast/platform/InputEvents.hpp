#pragma once

namespace blast::platform {

enum class InputEventType { Quit, MouseMove, MouseButtonDown, KeyDown, WindowResized };

enum class MouseButton { Left, Right, Middle, Unknown };

enum class KeyCode { Escape, S, R, Unknown };

struct InputEvent {
    InputEventType type = InputEventType::Quit;
    // Pointer position, or the new window size for WindowResized.
    int x = 0;
    int y = 0;
    MouseButton mouse_button = MouseButton::Unknown;
    KeyCode key = KeyCode::Unknown;
};

}  // namespace blast::platform
