#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Terminal colour: the terminal default, a palette index (0-15 are the
// named ANSI colours) or 24-bit RGB.
struct Color {
    enum class Type : uint8_t { Reset, Indexed, Rgb };

    Type    type  = Type::Reset;
    uint8_t index = 0;
    uint8_t r = 0, g = 0, b = 0;

    static constexpr Color reset() { return {}; }
    static constexpr Color indexed(uint8_t i) {
        Color c; c.type = Type::Indexed; c.index = i; return c;
    }
    static constexpr Color rgb(uint8_t r, uint8_t g, uint8_t b) {
        Color c; c.type = Type::Rgb; c.r = r; c.g = g; c.b = b; return c;
    }

    bool isReset() const { return type == Type::Reset; }
    bool operator==(const Color&) const = default;

    // Accepts named colours ("red", "darkgray", "lightblue", ...),
    // "#rrggbb" and "index:N".
    static std::optional<Color> parse(std::string_view text);
    std::string toString() const;
};

namespace colors {
inline constexpr Color Black        = Color::indexed(0);
inline constexpr Color Red          = Color::indexed(1);
inline constexpr Color Green        = Color::indexed(2);
inline constexpr Color Yellow       = Color::indexed(3);
inline constexpr Color Blue         = Color::indexed(4);
inline constexpr Color Magenta      = Color::indexed(5);
inline constexpr Color Cyan         = Color::indexed(6);
inline constexpr Color Gray         = Color::indexed(7);
inline constexpr Color DarkGray     = Color::indexed(8);
inline constexpr Color LightRed     = Color::indexed(9);
inline constexpr Color LightGreen   = Color::indexed(10);
inline constexpr Color LightYellow  = Color::indexed(11);
inline constexpr Color LightBlue    = Color::indexed(12);
inline constexpr Color LightMagenta = Color::indexed(13);
inline constexpr Color LightCyan    = Color::indexed(14);
inline constexpr Color White        = Color::indexed(15);
} // namespace colors

enum class Modifier : uint16_t {
    None       = 0,
    Bold       = 1 << 0,
    Dim        = 1 << 1,
    Italic     = 1 << 2,
    Underline  = 1 << 3,
    Reversed   = 1 << 4,
    Hidden     = 1 << 5,
    CrossedOut = 1 << 6,
};

constexpr Modifier operator|(Modifier a, Modifier b) {
    return static_cast<Modifier>(static_cast<uint16_t>(a) | static_cast<uint16_t>(b));
}
constexpr Modifier operator&(Modifier a, Modifier b) {
    return static_cast<Modifier>(static_cast<uint16_t>(a) & static_cast<uint16_t>(b));
}
constexpr Modifier operator~(Modifier a) {
    return static_cast<Modifier>(~static_cast<uint16_t>(a) & 0x7F);
}
inline Modifier& operator|=(Modifier& a, Modifier b) { return a = a | b; }
constexpr bool hasModifier(Modifier set, Modifier m) {
    return (static_cast<uint16_t>(set) & static_cast<uint16_t>(m)) == static_cast<uint16_t>(m)
        && m != Modifier::None;
}

// "bold", "dim", "italic", "underline", "reversed", "hidden", "crossed".
std::optional<Modifier> parseModifier(std::string_view name);

// Names of the flags set in `set`, in bit order.
std::vector<std::string> modifierNames(Modifier set);

// A style patch. Unset colours pass through when applied to a cell;
// modifiers are added and removed.
struct Style {
    std::optional<Color> fg;
    std::optional<Color> bg;
    Modifier addModifier = Modifier::None;
    Modifier subModifier = Modifier::None;

    Style& withFg(Color c) { fg = c; return *this; }
    Style& withBg(Color c) { bg = c; return *this; }
    Style& add(Modifier m) { addModifier |= m; subModifier = subModifier & ~m; return *this; }
    Style& remove(Modifier m) { subModifier |= m; addModifier = addModifier & ~m; return *this; }

    // Later style wins field-by-field.
    Style patch(const Style& other) const {
        Style out = *this;
        if (other.fg) out.fg = other.fg;
        if (other.bg) out.bg = other.bg;
        out.addModifier = (out.addModifier & ~other.subModifier) | other.addModifier;
        out.subModifier = (out.subModifier & ~other.addModifier) | other.subModifier;
        return out;
    }

    bool operator==(const Style&) const = default;
};
