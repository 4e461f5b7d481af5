#pragma once
#include "Widget.hpp"
#include "core/Style.hpp"
#include <string>
#include <vector>

// Multi-line text. Lines are split on '\n'; with wrap enabled, long lines
// break at spaces (or mid-word when a word is wider than the area).
class Paragraph : public Renderable {
public:
    explicit Paragraph(std::string text = {}) : text_(std::move(text)) {}

    Paragraph& style(Style s) { style_ = s; return *this; }
    Paragraph& wrap(bool on)  { wrap_ = on; return *this; }

    void render(Rect area, CellBuffer& buf) const override;

    // Lines as they would be laid out in a column of `width` cells.
    std::vector<std::string> layoutLines(uint16_t width) const;

private:
    std::string text_;
    Style       style_;
    bool        wrap_ = false;
};
