#include "widgets/List.hpp"
#include "core/CellBuffer.hpp"
#include <ftxui/screen/string.hpp>
#include <algorithm>

void List::render(Rect area, CellBuffer& buf) const {
    ListState scratch;
    render(area, buf, scratch);
}

void List::render(Rect area, CellBuffer& buf, ListState& state) const {
    area = area.intersection(buf.area());
    buf.setStyle(area, style_);
    if (area.isEmpty() || items_.empty()) {
        state.offset = 0;
        return;
    }

    if (state.selected && *state.selected >= items_.size())
        state.selected = items_.size() - 1;

    const size_t visible = area.height;
    state.offset = std::min(state.offset, items_.size() - 1);
    if (state.selected) {
        size_t sel = *state.selected;
        if (sel < state.offset) state.offset = sel;
        else if (sel >= state.offset + visible) state.offset = sel - visible + 1;
    }

    const uint16_t symbolWidth = state.selected
        ? static_cast<uint16_t>(ftxui::string_width(highlightSymbol_)) : 0;
    const std::string blank(symbolWidth, ' ');

    for (size_t row = 0; row < visible; ++row) {
        size_t idx = state.offset + row;
        if (idx >= items_.size()) break;

        uint16_t y = static_cast<uint16_t>(area.y + row);
        bool highlighted = state.selected && *state.selected == idx;
        Style rowStyle = highlighted ? style_.patch(highlightStyle_) : style_;

        uint16_t x = area.x;
        if (symbolWidth > 0) {
            buf.setStringN(x, y, highlighted ? highlightSymbol_ : blank,
                           area.width, rowStyle);
            x = static_cast<uint16_t>(std::min<uint32_t>(area.right(), x + symbolWidth));
        }
        if (x < area.right())
            buf.setStringN(x, y, items_[idx], area.right() - x, rowStyle);
        if (highlighted)
            buf.setStyle(Rect{area.x, y, area.width, 1}, highlightStyle_);
    }
}
