#pragma once

namespace symbols {

struct BorderSet {
    const char* topLeft;
    const char* topRight;
    const char* bottomLeft;
    const char* bottomRight;
    const char* horizontal;
    const char* vertical;
};

inline constexpr BorderSet Plain   = {"┌", "┐", "└", "┘", "─", "│"};
inline constexpr BorderSet Rounded = {"╭", "╮", "╰", "╯", "─", "│"};
inline constexpr BorderSet Double  = {"╔", "╗", "╚", "╝", "═", "║"};
inline constexpr BorderSet Thick   = {"┏", "┓", "┗", "┛", "━", "┃"};

inline constexpr const char* FullBlock  = "█";
inline constexpr const char* LightShade = "░";

} // namespace symbols
