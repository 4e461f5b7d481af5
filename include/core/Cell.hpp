#pragma once
#include "Style.hpp"
#include <string>
#include <string_view>

// One character position: a single grapheme cluster plus its style.
// The glyph is never empty; assigning an empty glyph stores a space.
class Cell {
public:
    Cell() = default;
    explicit Cell(std::string_view glyph, Color foreground = {}, Color background = {},
                  Modifier mods = Modifier::None)
        : fg(foreground), bg(background), modifiers(mods) {
        setGlyph(glyph);
    }

    const std::string& glyph() const { return glyph_; }
    void setGlyph(std::string_view g) {
        if (g.empty()) glyph_ = " ";
        else           glyph_.assign(g.data(), g.size());
    }

    void applyStyle(const Style& style) {
        if (style.fg) fg = *style.fg;
        if (style.bg) bg = *style.bg;
        modifiers = (modifiers & ~style.subModifier) | style.addModifier;
    }

    void reset() { *this = Cell{}; }

    Color    fg;
    Color    bg;
    Modifier modifiers = Modifier::None;

    bool operator==(const Cell&) const = default;

private:
    std::string glyph_ = " ";
};
