#pragma once
#include "Widget.hpp"
#include "core/Style.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct ListState {
    std::optional<size_t> selected;
    size_t                offset = 0;   // first visible item

    void select(std::optional<size_t> index) {
        selected = index;
        if (!index) offset = 0;
    }
};

// Vertical list of items with an optionally highlighted selection.
// Scrolls so the selected item stays visible.
class List : public StatefulRenderable<ListState>, public Renderable {
public:
    explicit List(std::vector<std::string> items = {}) : items_(std::move(items)) {}

    List& style(Style s)                 { style_ = s; return *this; }
    List& highlightStyle(Style s)        { highlightStyle_ = s; return *this; }
    List& highlightSymbol(std::string s) { highlightSymbol_ = std::move(s); return *this; }

    const std::vector<std::string>& items() const { return items_; }

    void render(Rect area, CellBuffer& buf, ListState& state) const override;
    void render(Rect area, CellBuffer& buf) const override;

private:
    std::vector<std::string> items_;
    Style       style_;
    Style       highlightStyle_ = Style{}.add(Modifier::Reversed);
    std::string highlightSymbol_ = "> ";
};
