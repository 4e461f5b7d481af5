#include "dashboard/ErrorOverlay.hpp"
#include "widgets/Block.hpp"
#include "widgets/Paragraph.hpp"
#include <algorithm>

namespace {

constexpr uint16_t OVERLAY_WIDTH_PCT  = 80;
constexpr uint16_t OVERLAY_HEIGHT_PCT = 60;
constexpr const char* FOOTER = "Press Ctrl+D to dismiss, Ctrl+R to reload";

Color severityColor(Severity s, const ColorPalette& p) {
    switch (s) {
        case Severity::Error:   return p.error;
        case Severity::Warning: return p.warning;
        case Severity::Info:    return p.primary;
    }
    return p.error;
}

} // namespace

ErrorOverlay::ErrorOverlay(ErrorInfo info, Clock::time_point shownAt)
    : info_(std::move(info)), shownAt_(shownAt) {}

void ErrorOverlay::update(Clock::time_point now) {
    if (autoDismiss_ && visible_ && now - shownAt_ >= *autoDismiss_)
        visible_ = false;
}

void ErrorOverlay::show(Clock::time_point now) {
    visible_ = true;
    shownAt_ = now;
}

std::vector<std::string> ErrorOverlay::contentLines() const {
    std::vector<std::string> lines;
    lines.push_back(info_.message);
    lines.emplace_back();

    std::string loc = info_.location();
    if (!loc.empty()) {
        lines.push_back("Location: " + loc);
        lines.emplace_back();
    }

    if (!info_.hints.empty()) {
        lines.emplace_back("Hints:");
        for (const auto& h : info_.hints) lines.push_back("  * " + h);
        lines.emplace_back();
    }

    lines.emplace_back(FOOTER);
    return lines;
}

Rect ErrorOverlay::centeredRect(Rect area, uint16_t percentX, uint16_t percentY) {
    uint32_t w = area.width, h = area.height;
    uint32_t marginX = (w - std::min(w, w * percentX / 100)) / 2;
    uint32_t marginY = (h - std::min(h, h * percentY / 100)) / 2;
    return {static_cast<uint16_t>(area.x + marginX),
            static_cast<uint16_t>(area.y + marginY),
            static_cast<uint16_t>(w - marginX * 2),
            static_cast<uint16_t>(h - marginY * 2)};
}

void ErrorOverlay::render(Rect area, CellBuffer& buf) const {
    if (!visible_) return;

    Rect panel = centeredRect(area, OVERLAY_WIDTH_PCT, OVERLAY_HEIGHT_PCT)
                     .intersection(buf.area());
    if (panel.isEmpty()) return;

    // Blank out whatever the dashboard drew underneath
    buf.merge(CellBuffer(panel));

    Color accent = severityColor(info_.severity, colors_);
    Block block;
    block.borders(Borders::All)
         .borderType(BorderType::Rounded)
         .borderStyle(Style{}.withFg(accent))
         .style(Style{}.withBg(colors_.background))
         .title(" " + std::string(toString(info_.severity)) + ": " + info_.title + " ")
         .titleStyle(Style{}.withFg(accent).add(Modifier::Bold));
    block.render(panel, buf);

    auto lines = contentLines();
    std::string text;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) text += '\n';
        text += lines[i];
    }
    Paragraph(text).style(Style{}.withFg(colors_.foreground)).wrap(true)
        .render(block.inner(panel), buf);
}
