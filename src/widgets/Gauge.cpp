#include "widgets/Gauge.hpp"
#include "core/Symbols.hpp"
#include <ftxui/screen/string.hpp>
#include <algorithm>
#include <cmath>

void Gauge::render(Rect area, CellBuffer& buf) const {
    area = area.intersection(buf.area());
    if (area.isEmpty()) return;

    buf.setStyle(area, style_);

    double r = std::isfinite(ratio_) ? std::clamp(ratio_, 0.0, 1.0) : 0.0;
    auto filled = static_cast<uint16_t>(std::lround(r * area.width));

    for (uint16_t y = area.top(); y < area.bottom(); ++y) {
        for (uint16_t x = area.left(); x < area.right(); ++x) {
            Cell* c = buf.at(x, y);
            bool on = x < area.left() + filled;
            c->setGlyph(on ? symbols::FullBlock : symbols::LightShade);
            c->applyStyle(gaugeStyle_);
        }
    }

    std::string text = label_.empty()
        ? std::to_string(static_cast<int>(std::lround(r * 100))) + "%"
        : label_;
    int width = ftxui::string_width(text);
    uint16_t lx = area.x + static_cast<uint16_t>(std::max(0, (int(area.width) - width) / 2));
    uint16_t ly = area.y + area.height / 2;
    buf.setStringN(lx, ly, text, static_cast<uint16_t>(area.right() - lx), style_);
}
