#include "widgets/Block.hpp"
#include "core/Symbols.hpp"
#include <algorithm>

std::optional<BorderType> parseBorderType(std::string_view name) {
    if (name == "plain")   return BorderType::Plain;
    if (name == "rounded") return BorderType::Rounded;
    if (name == "double")  return BorderType::Double;
    if (name == "thick")   return BorderType::Thick;
    return std::nullopt;
}

static const symbols::BorderSet& borderSet(BorderType t) {
    switch (t) {
        case BorderType::Rounded: return symbols::Rounded;
        case BorderType::Double:  return symbols::Double;
        case BorderType::Thick:   return symbols::Thick;
        case BorderType::Plain:   break;
    }
    return symbols::Plain;
}

Rect Block::inner(Rect area) const {
    uint32_t x = area.x, y = area.y;
    uint32_t w = area.width, h = area.height;

    auto shrink = [](uint32_t& pos, uint32_t& len, uint32_t lead, uint32_t trail) {
        uint32_t a = std::min(len, lead);
        pos += a; len -= a;
        len -= std::min(len, trail);
    };

    shrink(x, w, hasBorder(borders_, Borders::Left) ? 1u : 0u,
                 hasBorder(borders_, Borders::Right) ? 1u : 0u);
    shrink(y, h, hasBorder(borders_, Borders::Top) ? 1u : 0u,
                 hasBorder(borders_, Borders::Bottom) ? 1u : 0u);
    shrink(x, w, padding_.left, padding_.right);
    shrink(y, h, padding_.top, padding_.bottom);

    return {static_cast<uint16_t>(x), static_cast<uint16_t>(y),
            static_cast<uint16_t>(w), static_cast<uint16_t>(h)};
}

void Block::render(Rect area, CellBuffer& buf) const {
    area = area.intersection(buf.area());
    if (area.isEmpty()) return;

    buf.setStyle(area, style_);

    const auto& set = borderSet(borderType_);
    const uint16_t l = area.left(), r = area.right() - 1;
    const uint16_t t = area.top(),  b = area.bottom() - 1;

    auto put = [&](uint16_t x, uint16_t y, const char* glyph) {
        if (Cell* c = buf.at(x, y)) {
            c->setGlyph(glyph);
            c->applyStyle(borderStyle_);
        }
    };

    if (hasBorder(borders_, Borders::Top))
        for (uint16_t x = l; x <= r; ++x) put(x, t, set.horizontal);
    if (hasBorder(borders_, Borders::Bottom))
        for (uint16_t x = l; x <= r; ++x) put(x, b, set.horizontal);
    if (hasBorder(borders_, Borders::Left))
        for (uint16_t y = t; y <= b; ++y) put(l, y, set.vertical);
    if (hasBorder(borders_, Borders::Right))
        for (uint16_t y = t; y <= b; ++y) put(r, y, set.vertical);

    if (hasBorder(borders_, Borders::Top) && hasBorder(borders_, Borders::Left))
        put(l, t, set.topLeft);
    if (hasBorder(borders_, Borders::Top) && hasBorder(borders_, Borders::Right))
        put(r, t, set.topRight);
    if (hasBorder(borders_, Borders::Bottom) && hasBorder(borders_, Borders::Left))
        put(l, b, set.bottomLeft);
    if (hasBorder(borders_, Borders::Bottom) && hasBorder(borders_, Borders::Right))
        put(r, b, set.bottomRight);

    if (title_.empty()) return;

    // Title sits on the top row between the corners.
    uint16_t lead  = hasBorder(borders_, Borders::Left) ? 1 : 0;
    uint16_t trail = hasBorder(borders_, Borders::Right) ? 1 : 0;
    if (area.width <= lead + trail) return;
    uint16_t room = area.width - lead - trail;
    buf.setStringN(l + lead, t, title_, room, borderStyle_.patch(titleStyle_));
}
