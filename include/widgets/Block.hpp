#pragma once
#include "Widget.hpp"
#include "core/Style.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class Borders : uint8_t {
    None   = 0,
    Top    = 1 << 0,
    Right  = 1 << 1,
    Bottom = 1 << 2,
    Left   = 1 << 3,
    All    = 0x0F,
};

constexpr Borders operator|(Borders a, Borders b) {
    return static_cast<Borders>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}
constexpr bool hasBorder(Borders set, Borders b) {
    return (static_cast<uint8_t>(set) & static_cast<uint8_t>(b)) != 0;
}

enum class BorderType { Plain, Rounded, Double, Thick };

std::optional<BorderType> parseBorderType(std::string_view name);

struct Padding {
    uint16_t left = 0, right = 0, top = 0, bottom = 0;
    static Padding uniform(uint16_t n) { return {n, n, n, n}; }
};

// Bordered box with an optional title on the top edge.
class Block : public Renderable {
public:
    Block& borders(Borders b)        { borders_ = b; return *this; }
    Block& borderType(BorderType t)  { borderType_ = t; return *this; }
    Block& borderStyle(Style s)      { borderStyle_ = s; return *this; }
    Block& style(Style s)            { style_ = s; return *this; }
    Block& title(std::string t)      { title_ = std::move(t); return *this; }
    Block& titleStyle(Style s)       { titleStyle_ = s; return *this; }
    Block& padding(Padding p)        { padding_ = p; return *this; }

    // Area left for content once borders and padding are removed.
    Rect inner(Rect area) const;

    void render(Rect area, CellBuffer& buf) const override;

private:
    Borders     borders_     = Borders::None;
    BorderType  borderType_  = BorderType::Plain;
    Style       borderStyle_;
    Style       style_;
    std::string title_;
    Style       titleStyle_;
    Padding     padding_;
};
