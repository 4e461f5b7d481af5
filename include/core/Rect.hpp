#pragma once
#include <algorithm>
#include <cstdint>

// Rectangular area in terminal cells. Coordinates are absolute.
struct Rect {
    uint16_t x      = 0;
    uint16_t y      = 0;
    uint16_t width  = 0;
    uint16_t height = 0;

    constexpr Rect() = default;
    constexpr Rect(uint16_t x_, uint16_t y_, uint16_t w, uint16_t h)
        : x(x_), y(y_), width(w), height(h) {}

    constexpr uint32_t area() const {
        return static_cast<uint32_t>(width) * height;
    }
    constexpr bool isEmpty() const { return width == 0 || height == 0; }

    constexpr uint16_t left() const { return x; }
    constexpr uint16_t top() const  { return y; }
    constexpr uint16_t right() const {
        return static_cast<uint16_t>(std::min<uint32_t>(0xFFFFu, uint32_t(x) + width));
    }
    constexpr uint16_t bottom() const {
        return static_cast<uint16_t>(std::min<uint32_t>(0xFFFFu, uint32_t(y) + height));
    }

    constexpr bool contains(uint16_t px, uint16_t py) const {
        return px >= left() && px < right() && py >= top() && py < bottom();
    }

    constexpr bool intersects(const Rect& o) const {
        return x < o.right() && right() > o.x && y < o.bottom() && bottom() > o.y;
    }

    constexpr Rect intersection(const Rect& o) const {
        uint16_t x1 = std::max(x, o.x);
        uint16_t y1 = std::max(y, o.y);
        uint16_t x2 = std::min(right(), o.right());
        uint16_t y2 = std::min(bottom(), o.bottom());
        return {x1, y1,
                static_cast<uint16_t>(x2 > x1 ? x2 - x1 : 0),
                static_cast<uint16_t>(y2 > y1 ? y2 - y1 : 0)};
    }

    // Shrink by `margin` on every side; collapses to an empty rect when
    // the margin does not fit.
    constexpr Rect inner(uint16_t margin) const {
        uint32_t doubled = uint32_t(margin) * 2;
        if (width < doubled || height < doubled) return {};
        return {static_cast<uint16_t>(x + margin), static_cast<uint16_t>(y + margin),
                static_cast<uint16_t>(width - doubled),
                static_cast<uint16_t>(height - doubled)};
    }

    bool operator==(const Rect&) const = default;
};

struct Position {
    uint16_t x = 0;
    uint16_t y = 0;
    bool operator==(const Position&) const = default;
};
