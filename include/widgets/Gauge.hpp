#pragma once
#include "Widget.hpp"
#include "core/Style.hpp"
#include <string>

// Horizontal progress bar filling `ratio` (clamped to 0..1) of its area,
// with a centred label. Defaults to "NN%".
class Gauge : public Renderable {
public:
    Gauge& ratio(double r)           { ratio_ = r; return *this; }
    Gauge& label(std::string l)      { label_ = std::move(l); return *this; }
    Gauge& style(Style s)            { style_ = s; return *this; }
    Gauge& gaugeStyle(Style s)       { gaugeStyle_ = s; return *this; }

    void render(Rect area, CellBuffer& buf) const override;

private:
    double      ratio_ = 0.0;
    std::string label_;
    Style       style_;
    Style       gaugeStyle_;
};
