#pragma once
#include <cstdint>
#include <string>
#include <variant>

enum class KeyCode : uint8_t {
    Char,
    Enter,
    Escape,
    Backspace,
    Tab,
    BackTab,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
    Insert,
    Delete,
    F,          // function key, number in KeyEvent::fn
};

struct KeyModifiers {
    bool shift = false;
    bool ctrl  = false;
    bool alt   = false;
    bool operator==(const KeyModifiers&) const = default;
};

struct KeyEvent {
    KeyCode      code = KeyCode::Char;
    char32_t     ch   = 0;       // valid for KeyCode::Char
    uint8_t      fn   = 0;       // valid for KeyCode::F
    KeyModifiers modifiers;

    static KeyEvent character(char32_t c, KeyModifiers m = {}) {
        return {KeyCode::Char, c, 0, m};
    }
    static KeyEvent ctrl(char c) {
        return {KeyCode::Char, static_cast<char32_t>(c), 0, {false, true, false}};
    }
    static KeyEvent key(KeyCode code, KeyModifiers m = {}) { return {code, 0, 0, m}; }

    bool isChar(char32_t c) const { return code == KeyCode::Char && ch == c; }
    bool isCtrl(char c) const {
        return code == KeyCode::Char && modifiers.ctrl && ch == static_cast<char32_t>(c);
    }
    bool operator==(const KeyEvent&) const = default;
};

struct MouseEvent {
    enum class Kind : uint8_t { Down, Up, Drag, Moved, ScrollUp, ScrollDown };
    enum class Button : uint8_t { None, Left, Middle, Right };

    Kind         kind   = Kind::Down;
    Button       button = Button::None;
    uint16_t     x = 0;
    uint16_t     y = 0;
    KeyModifiers modifiers;
    bool operator==(const MouseEvent&) const = default;
};

struct ResizeEvent {
    uint16_t width  = 0;
    uint16_t height = 0;
    bool operator==(const ResizeEvent&) const = default;
};

struct FocusGainedEvent { bool operator==(const FocusGainedEvent&) const = default; };
struct FocusLostEvent   { bool operator==(const FocusLostEvent&) const = default; };

struct PasteEvent {
    std::string text;
    bool operator==(const PasteEvent&) const = default;
};

using Event = std::variant<KeyEvent, MouseEvent, ResizeEvent,
                           FocusGainedEvent, FocusLostEvent, PasteEvent>;

// Short human-readable form, used in debug logging.
std::string describe(const Event& ev);
