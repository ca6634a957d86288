#pragma once

namespace treenav {

// Terminal-independent input, produced by the front end.

enum class KeyCode {
    None,
    Char,
    Enter,
    Escape,
    Backspace,
    Delete,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
    Tab,
    BackTab
};

struct KeyEvent {
    KeyCode code = KeyCode::None;
    char32_t ch = 0;       // valid for KeyCode::Char
    bool ctrl = false;     // Ctrl held (ch is then the lowercase letter)
};

enum class MouseAction {
    LeftClick,
    ScrollUp,
    ScrollDown
};

struct MouseEvent {
    MouseAction action = MouseAction::LeftClick;
    int row = -1;          // index into the controller's rows, -1 outside the tree
    double time = 0.0;     // PlatformUtils::getTime() at the event
};

} // namespace treenav
