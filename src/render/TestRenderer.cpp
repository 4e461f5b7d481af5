#include "render/TestRenderer.hpp"

std::string TestRenderer::row(uint16_t y) const {
    std::string out;
    const Rect& a = buffer_.area();
    if (y >= a.height) return out;
    for (uint16_t x = 0; x < a.width; ++x)
        out += buffer_.at(a.x + x, a.y + y)->glyph();
    return out;
}

std::string TestRenderer::debugOutput() const {
    std::string out;
    const Rect& a = buffer_.area();
    for (uint16_t y = 0; y < a.height; ++y) {
        out += row(y);
        if (y + 1 < a.height) out += '\n';
    }
    return out;
}
