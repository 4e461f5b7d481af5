#include "widgets/Paragraph.hpp"
#include <ftxui/screen/string.hpp>
#include <sstream>

namespace {

std::vector<std::string> wrapLine(const std::string& line, uint16_t width) {
    std::vector<std::string> out;
    if (width == 0) return out;

    std::string current;
    int currentWidth = 0;
    std::string word;
    int wordWidth = 0;

    auto flushWord = [&]() {
        if (word.empty()) return;
        if (currentWidth > 0 && currentWidth + 1 + wordWidth > width) {
            out.push_back(current);
            current.clear();
            currentWidth = 0;
        }
        if (currentWidth > 0) { current += ' '; ++currentWidth; }
        current += word;
        currentWidth += wordWidth;
        word.clear();
        wordWidth = 0;
    };

    for (const auto& g : ftxui::Utf8ToGlyphs(line)) {
        if (g.empty()) continue;
        if (g == " ") { flushWord(); continue; }
        int gw = ftxui::string_width(g);
        if (gw < 1) gw = 1;
        // A word wider than the column is hard-broken.
        if (wordWidth + gw > width) {
            flushWord();
            if (currentWidth > 0) {
                out.push_back(current);
                current.clear();
                currentWidth = 0;
            }
        }
        word += g;
        wordWidth += gw;
    }
    flushWord();
    out.push_back(current);
    return out;
}

} // namespace

std::vector<std::string> Paragraph::layoutLines(uint16_t width) const {
    std::vector<std::string> lines;
    std::istringstream in(text_);
    std::string line;
    while (std::getline(in, line)) {
        if (!wrap_) {
            lines.push_back(line);
            continue;
        }
        for (auto& l : wrapLine(line, width)) lines.push_back(std::move(l));
    }
    return lines;
}

void Paragraph::render(Rect area, CellBuffer& buf) const {
    area = area.intersection(buf.area());
    if (area.isEmpty()) return;

    buf.setStyle(area, style_);
    auto lines = layoutLines(area.width);
    for (size_t i = 0; i < lines.size() && i < area.height; ++i)
        buf.setStringN(area.x, static_cast<uint16_t>(area.y + i), lines[i],
                       area.width, style_);
}
