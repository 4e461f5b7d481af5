#include "dashboard/Definition.hpp"
#include "widgets/Gauge.hpp"
#include "widgets/List.hpp"
#include "widgets/Paragraph.hpp"
#include <algorithm>

namespace {

std::string jsonToText(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

// Numbers above 1 are read as a percentage.
double gaugeRatio(const nlohmann::json* v) {
    if (!v || !v->is_number()) return 0.0;
    double r = v->get<double>();
    return r > 1.0 ? r / 100.0 : r;
}

} // namespace

std::string substituteState(const std::string& text,
                            const std::map<std::string, nlohmann::json>& userState) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find('{', pos);
        if (open == std::string::npos) break;
        size_t close = text.find('}', open + 1);
        if (close == std::string::npos) break;

        out.append(text, pos, open - pos);
        std::string key = text.substr(open + 1, close - open - 1);
        auto it = userState.find(key);
        if (it != userState.end()) out += jsonToText(it->second);
        else                       out.append(text, open, close - open + 1);
        pos = close + 1;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

const PanelDef* Definition::findPanel(const std::string& id) const {
    for (const auto& p : panels)
        if (p.id == id) return &p;
    return nullptr;
}

std::vector<std::string> Definition::focusOrder() const {
    std::vector<std::string> ids;
    for (const auto& p : panels)
        for (const auto& e : p.elements)
            if (e.kind == Element::Kind::List) ids.push_back(e.id);
    return ids;
}

size_t Definition::listSize(const std::string& id) const {
    for (const auto& p : panels)
        for (const auto& e : p.elements)
            if (e.kind == Element::Kind::List && e.id == id) return e.items.size();
    return 0;
}

void Definition::render(Rect area, CellBuffer& buf, const DashboardState& state,
                        const Theme& theme) const {
    const Style borderStyle = theme.style("border");
    const Style textStyle   = theme.style("text");

    Block outer;
    if (border) {
        outer.borders(Borders::All).borderType(*border).borderStyle(borderStyle);
    } else if (!title.empty()) {
        outer.padding({0, 0, 1, 0});   // title takes the first row
    }
    outer.title(title).titleStyle(theme.style("title").add(Modifier::Bold).patch(titleStyle));
    outer.render(area, buf);
    Rect content = outer.inner(area);

    std::vector<Constraint> constraints;
    for (const auto& p : panels) constraints.push_back(p.constraint);
    auto rects = solve(constraints, layout, 0, content);

    for (size_t i = 0; i < panels.size() && i < rects.size(); ++i) {
        const PanelDef& panel = panels[i];
        bool panelFocused = false;
        for (const auto& e : panel.elements)
            if (e.kind == Element::Kind::List && state.focusedWidget == e.id) panelFocused = true;

        Block box;
        box.borders(Borders::All)
           .borderType(border.value_or(BorderType::Plain))
           .title(panel.title)
           .titleStyle(textStyle)
           .borderStyle(panelFocused ? theme.style("focus") : borderStyle)
           .style(panel.style);
        box.render(rects[i], buf);
        Rect inner = box.inner(rects[i]);

        // Texts and gauges take what they need, lists share the rest
        std::vector<Constraint> rows;
        std::vector<std::vector<std::string>> textLines(panel.elements.size());
        for (size_t k = 0; k < panel.elements.size(); ++k) {
            const Element& e = panel.elements[k];
            switch (e.kind) {
                case Element::Kind::Text: {
                    Paragraph para(substituteState(e.text, state.userState));
                    para.wrap(true);
                    textLines[k] = para.layoutLines(inner.width);
                    rows.push_back(Constraint::length(static_cast<uint32_t>(textLines[k].size())));
                    break;
                }
                case Element::Kind::Gauge:
                    rows.push_back(Constraint::length(1));
                    break;
                case Element::Kind::List:
                    rows.push_back(Constraint::fill());
                    break;
            }
        }
        auto slots = solve(rows, Direction::Vertical, 0, inner);

        for (size_t k = 0; k < panel.elements.size() && k < slots.size(); ++k) {
            const Element& e = panel.elements[k];
            const Rect& slot = slots[k];
            switch (e.kind) {
                case Element::Kind::Text: {
                    std::string joined;
                    for (size_t n = 0; n < textLines[k].size(); ++n) {
                        if (n) joined += '\n';
                        joined += textLines[k][n];
                    }
                    Paragraph(joined).style(textStyle.patch(e.style)).render(slot, buf);
                    break;
                }
                case Element::Kind::Gauge: {
                    auto it = state.userState.find(e.id);
                    const nlohmann::json* v = it == state.userState.end() ? nullptr : &it->second;
                    Gauge gauge;
                    gauge.ratio(gaugeRatio(v)).label(substituteState(e.text, state.userState))
                         .style(theme.style("gauge_label"))
                         .gaugeStyle(theme.style("gauge_bar").patch(e.style));
                    gauge.render(slot, buf);
                    break;
                }
                case Element::Kind::List: {
                    ListState ls;
                    auto ui = state.uiState.find(e.id);
                    if (ui != state.uiState.end()) {
                        ls.selected = ui->second.selected;
                        ls.offset   = ui->second.scroll;
                    }
                    List list(e.items);
                    list.style(textStyle.patch(e.style));
                    if (state.focusedWidget == e.id)
                        list.highlightStyle(theme.style("list_selected"));
                    else
                        list.highlightStyle(Style{}.add(Modifier::Bold));
                    list.render(slot, buf, ls);
                    break;
                }
            }
        }
    }
}
