#include "core/CellBuffer.hpp"
#include <ftxui/screen/string.hpp>
#include <algorithm>

CellBuffer::CellBuffer(Rect area)
    : area_(area), cells_(area.area()) {}

CellBuffer CellBuffer::filled(Rect area, const Cell& cell) {
    CellBuffer buf(area);
    std::fill(buf.cells_.begin(), buf.cells_.end(), cell);
    return buf;
}

std::optional<size_t> CellBuffer::indexOf(uint16_t x, uint16_t y) const {
    if (!area_.contains(x, y)) return std::nullopt;
    return size_t(y - area_.y) * area_.width + size_t(x - area_.x);
}

std::optional<Cell> CellBuffer::get(uint16_t x, uint16_t y) const {
    auto idx = indexOf(x, y);
    if (!idx) return std::nullopt;
    return cells_[*idx];
}

const Cell* CellBuffer::at(uint16_t x, uint16_t y) const {
    auto idx = indexOf(x, y);
    return idx ? &cells_[*idx] : nullptr;
}

Cell* CellBuffer::at(uint16_t x, uint16_t y) {
    auto idx = indexOf(x, y);
    return idx ? &cells_[*idx] : nullptr;
}

bool CellBuffer::set(uint16_t x, uint16_t y, const Cell& cell) {
    Cell* c = at(x, y);
    if (!c) return false;
    *c = cell;
    return true;
}

size_t CellBuffer::setString(uint16_t x, uint16_t y, std::string_view text,
                             const Style& style) {
    return setStringN(x, y, text, 0xFFFF, style);
}

size_t CellBuffer::setStringN(uint16_t x, uint16_t y, std::string_view text,
                              uint16_t maxWidth, const Style& style) {
    if (!area_.contains(x, y)) return 0;

    uint32_t limit = std::min<uint32_t>(area_.right(), uint32_t(x) + maxWidth);
    uint32_t cx = x;
    size_t written = 0;

    // Utf8ToGlyphs emits an empty entry after each full-width glyph to
    // reserve its second column.
    auto glyphs = ftxui::Utf8ToGlyphs(std::string(text));
    for (size_t i = 0; i < glyphs.size(); ++i) {
        const std::string& g = glyphs[i];
        if (g.empty()) continue;

        int width = std::max(1, glyphWidth(g));
        if (cx + width > limit) break;

        Cell* cell = at(static_cast<uint16_t>(cx), y);
        cell->setGlyph(g);
        cell->applyStyle(style);
        ++written;

        for (int k = 1; k < width; ++k) {
            Cell* cont = at(static_cast<uint16_t>(cx + k), y);
            cont->setGlyph(" ");
            cont->applyStyle(style);
        }
        cx += width;
    }
    return written;
}

void CellBuffer::setStyle(const Rect& rect, const Style& style) {
    Rect clipped = rect.intersection(area_);
    for (uint16_t yy = clipped.top(); yy < clipped.bottom(); ++yy)
        for (uint16_t xx = clipped.left(); xx < clipped.right(); ++xx)
            at(xx, yy)->applyStyle(style);
}

void CellBuffer::merge(const CellBuffer& other) {
    merge(other, Position{other.area_.x, other.area_.y});
}

void CellBuffer::merge(const CellBuffer& other, Position dest) {
    for (uint16_t oy = 0; oy < other.area_.height; ++oy) {
        uint32_t ty = uint32_t(dest.y) + oy;
        if (ty > 0xFFFF) break;
        for (uint16_t ox = 0; ox < other.area_.width; ++ox) {
            uint32_t tx = uint32_t(dest.x) + ox;
            if (tx > 0xFFFF) break;
            Cell* target = at(static_cast<uint16_t>(tx), static_cast<uint16_t>(ty));
            if (!target) continue;
            *target = other.cells_[size_t(oy) * other.area_.width + ox];
        }
    }
}

std::vector<CellBuffer::CellUpdate> CellBuffer::diff(const CellBuffer& next) const {
    std::vector<CellUpdate> updates;
    const Rect& na = next.area_;

    if (area_ != na) {
        updates.reserve(next.cells_.size());
        for (uint16_t yy = 0; yy < na.height; ++yy)
            for (uint16_t xx = 0; xx < na.width; ++xx)
                updates.push_back({static_cast<uint16_t>(na.x + xx),
                                   static_cast<uint16_t>(na.y + yy),
                                   &next.cells_[size_t(yy) * na.width + xx]});
        return updates;
    }

    for (size_t i = 0; i < cells_.size(); ++i) {
        if (cells_[i] == next.cells_[i]) continue;
        updates.push_back({static_cast<uint16_t>(na.x + i % na.width),
                           static_cast<uint16_t>(na.y + i / na.width),
                           &next.cells_[i]});
    }
    return updates;
}

void CellBuffer::clear() {
    for (auto& c : cells_) c.reset();
}

void CellBuffer::resize(Rect area) {
    CellBuffer next(area);
    Rect overlap = area_.intersection(area);
    for (uint16_t yy = overlap.top(); yy < overlap.bottom(); ++yy)
        for (uint16_t xx = overlap.left(); xx < overlap.right(); ++xx)
            *next.at(xx, yy) = *at(xx, yy);
    *this = std::move(next);
}

int glyphWidth(const std::string& glyph) {
    int w = ftxui::string_width(glyph);
    return std::clamp(w, 1, 2);
}
