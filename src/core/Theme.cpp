#include "core/Theme.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace fs = std::filesystem;

namespace {

std::string lowerCase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

Color colorFromJson(const nlohmann::json& j, const std::string& key) {
    if (!j.is_string()) throw ThemeError("colour '" + key + "' must be a string");
    auto c = Color::parse(j.get<std::string>());
    if (!c) throw ThemeError("unknown colour '" + j.get<std::string>() + "' for '" + key + "'");
    return *c;
}

Style styleFromJson(const nlohmann::json& j, const std::string& key) {
    if (!j.is_object()) throw ThemeError("style '" + key + "' must be an object");
    Style s;
    if (j.contains("fg")) s.withFg(colorFromJson(j["fg"], key + ".fg"));
    if (j.contains("bg")) s.withBg(colorFromJson(j["bg"], key + ".bg"));
    for (const char* field : {"modifiers", "remove"}) {
        if (!j.contains(field)) continue;
        const auto& list = j[field];
        if (!list.is_array())
            throw ThemeError("'" + key + "." + field + "' must be an array");
        for (const auto& m : list) {
            auto mod = m.is_string() ? parseModifier(m.get<std::string>()) : std::nullopt;
            if (!mod) throw ThemeError("unknown modifier " + m.dump() + " in '" + key + "'");
            if (field[0] == 'm') s.add(*mod);
            else                 s.remove(*mod);
        }
    }
    return s;
}

nlohmann::json styleToJson(const Style& s) {
    nlohmann::json j = nlohmann::json::object();
    if (s.fg) j["fg"] = s.fg->toString();
    if (s.bg) j["bg"] = s.bg->toString();
    auto added = modifierNames(s.addModifier);
    if (!added.empty()) j["modifiers"] = added;
    auto removed = modifierNames(s.subModifier);
    if (!removed.empty()) j["remove"] = removed;
    return j;
}

// Palette fields by file key
struct PaletteField {
    const char* key;
    Color ColorPalette::* member;
};

constexpr PaletteField kPaletteFields[] = {
    {"background", &ColorPalette::background},
    {"foreground", &ColorPalette::foreground},
    {"primary",    &ColorPalette::primary},
    {"secondary",  &ColorPalette::secondary},
    {"accent",     &ColorPalette::accent},
    {"error",      &ColorPalette::error},
    {"warning",    &ColorPalette::warning},
    {"success",    &ColorPalette::success},
};

} // namespace

// ── Presets ─────────────────────────────────────────────────────────

ColorPalette ColorPalette::dark() {
    return {};
}

ColorPalette ColorPalette::light() {
    ColorPalette p;
    p.background = colors::White;
    p.foreground = colors::Black;
    return p;
}

ColorPalette ColorPalette::slime() {
    ColorPalette p;
    p.background = Color::rgb(30, 35, 36);
    p.foreground = Color::rgb(224, 224, 224);
    p.primary    = Color::rgb(168, 223, 90);
    p.secondary  = Color::rgb(128, 181, 179);
    p.accent     = Color::rgb(174, 193, 153);
    p.error      = Color::rgb(205, 101, 100);
    p.warning    = Color::rgb(255, 240, 153);
    p.success    = Color::rgb(174, 193, 153);
    return p;
}

Theme::Theme() : Theme("Dark", ColorPalette::dark()) {}

Theme::Theme(std::string name, ColorPalette colors)
    : name_(std::move(name)), colors_(colors), styles_(defaultStyles(colors_)) {}

Theme Theme::dark()  { return Theme("Dark", ColorPalette::dark()); }
Theme Theme::light() { return Theme("Light", ColorPalette::light()); }
Theme Theme::slime() { return Theme("Slime", ColorPalette::slime()); }

std::optional<Theme> Theme::preset(std::string_view name) {
    std::string n = lowerCase(name);
    if (n == "dark")  return dark();
    if (n == "light") return light();
    if (n == "slime") return slime();
    return std::nullopt;
}

std::vector<std::string> Theme::presetNames() {
    return {"dark", "light", "slime"};
}

Theme Theme::resolve(const std::string& nameOrPath) {
    if (auto t = preset(nameOrPath)) return *t;
    std::error_code ec;
    if (fs::is_regular_file(nameOrPath, ec)) return loadFile(nameOrPath);
    throw ThemeError("unknown theme '" + nameOrPath + "' (expected dark, light, slime or a theme file)");
}

std::map<std::string, Style> Theme::defaultStyles(const ColorPalette& c) {
    const Style inverted = Style{}.withFg(c.background).withBg(c.primary);
    return {
        {"base",           Style{}.withFg(c.foreground).withBg(c.background)},
        {"title",          Style{}.withFg(c.primary)},
        {"border",         Style{}.withFg(c.secondary)},
        {"text",           Style{}.withFg(c.foreground)},
        {"selected",       inverted},
        {"highlight",      Style{}.withFg(c.accent)},
        {"focus",          Style{}.withFg(c.primary)},
        {"error",          Style{}.withFg(c.error)},
        {"warning",        Style{}.withFg(c.warning)},
        {"success",        Style{}.withFg(c.success)},
        {"gauge_bar",      Style{}.withFg(c.primary).withBg(c.background)},
        {"gauge_label",    Style{}.withFg(c.foreground)},
        {"list_selected",  inverted},
    };
}

Style Theme::style(const std::string& name) const {
    auto it = styles_.find(name);
    if (it != styles_.end()) return it->second;
    return Style{}.withFg(colors_.foreground);
}

// ── File format ─────────────────────────────────────────────────────

Theme Theme::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) throw ThemeError("theme must be a JSON object");

    try {
        Theme base = dark();
        if (j.contains("base")) {
            std::string baseName = j["base"].get<std::string>();
            auto p = preset(baseName);
            if (!p) throw ThemeError("unknown base theme '" + baseName + "'");
            base = *p;
        }

        ColorPalette palette = base.colors_;
        if (j.contains("colors")) {
            const auto& cj = j["colors"];
            if (!cj.is_object()) throw ThemeError("'colors' must be an object");
            for (const auto& [key, value] : cj.items()) {
                auto field = std::find_if(std::begin(kPaletteFields), std::end(kPaletteFields),
                                          [&](const PaletteField& f) { return key == f.key; });
                if (field == std::end(kPaletteFields))
                    throw ThemeError("unknown palette colour '" + key + "'");
                palette.*(field->member) = colorFromJson(value, key);
            }
        }

        Theme theme(j.value("name", std::string("Custom")), palette);
        if (j.contains("styles")) {
            const auto& sj = j["styles"];
            if (!sj.is_object()) throw ThemeError("'styles' must be an object");
            for (const auto& [key, value] : sj.items())
                theme.setStyle(key, styleFromJson(value, key));
        }
        return theme;
    } catch (const nlohmann::json::exception& e) {
        throw ThemeError(std::string("invalid theme: ") + e.what());
    }
}

nlohmann::json Theme::toJson() const {
    nlohmann::json j;
    j["name"] = name_;
    j["colors"] = nlohmann::json::object();
    for (const auto& f : kPaletteFields)
        j["colors"][f.key] = (colors_.*(f.member)).toString();
    j["styles"] = nlohmann::json::object();
    for (const auto& [key, style] : styles_)
        j["styles"][key] = styleToJson(style);
    return j;
}

Theme Theme::loadFile(const fs::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw ThemeError("cannot open theme file: " + path.string());

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ThemeError(path.string() + ": " + e.what());
    }

    try {
        Theme theme = fromJson(j);
        spdlog::info("Loaded theme '{}' from {}", theme.name(), path.string());
        return theme;
    } catch (const ThemeError& e) {
        throw ThemeError(path.string() + ": " + e.what());
    }
}

void Theme::saveFile(const fs::path& path) const {
    std::ofstream f(path, std::ios::trunc);
    if (!f.is_open()) throw ThemeError("cannot write theme file: " + path.string());
    f << toJson().dump(4) << '\n';
    if (!f) throw ThemeError("failed writing theme file: " + path.string());
}
