#pragma once
#include "core/CellBuffer.hpp"
#include "core/Layout.hpp"
#include "core/Style.hpp"
#include "core/Theme.hpp"
#include "reload/DashboardState.hpp"
#include "widgets/Block.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

// ── Compiled dashboard definition ───────────────────────────────────

struct Element {
    enum class Kind { Text, List, Gauge };

    Kind                     kind = Kind::Text;
    std::string              id;      // list id or gauge state key
    std::string              text;    // text template or gauge label
    std::vector<std::string> items;   // list only
    Style                    style;
    int                      line = 0;
};

struct PanelDef {
    std::string          id;
    Constraint           constraint = Constraint::fill();
    std::string          title;
    Style                style;
    std::vector<Element> elements;
};

struct Definition {
    std::string                title;
    Style                      titleStyle;
    std::optional<BorderType>  border = BorderType::Rounded;   // nullopt: no border
    Direction                  layout = Direction::Vertical;
    std::optional<std::string> theme;   // preset name; overrides the runtime theme

    std::map<std::string, nlohmann::json> stateDefaults;   // applied when absent
    std::map<std::string, nlohmann::json> stateResets;     // applied on every load

    std::vector<PanelDef>              panels;
    std::vector<std::filesystem::path> sources;   // evaluation order

    const PanelDef* findPanel(const std::string& id) const;

    // Ids of list elements, in order; Tab cycles through these.
    std::vector<std::string> focusOrder() const;

    // Item count of list `id`, 0 when absent.
    size_t listSize(const std::string& id) const;

    // Colours not given by the definition come from `theme`.
    void render(Rect area, CellBuffer& buf, const DashboardState& state,
                const Theme& theme) const;
};

// "{key}" -> user state value. Unknown keys are left untouched.
std::string substituteState(const std::string& text,
                            const std::map<std::string, nlohmann::json>& userState);
