#pragma once
#include "Style.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// Unreadable or malformed theme file.
class ThemeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Base colours of a theme. Named styles are derived from these.
struct ColorPalette {
    Color background = colors::Black;
    Color foreground = colors::White;
    Color primary    = colors::Blue;      // interactive elements, focus
    Color secondary  = colors::Cyan;      // borders
    Color accent     = colors::Magenta;   // emphasis
    Color error      = colors::Red;
    Color warning    = colors::Yellow;
    Color success    = colors::Green;

    static ColorPalette dark();
    static ColorPalette light();
    static ColorPalette slime();   // dark grey with slime-green accents

    bool operator==(const ColorPalette&) const = default;
};

// Palette plus named styles ("title", "border", "focus", "list_selected",
// "gauge_bar", ...). Dashboards and the error overlay look colours up here
// instead of hard-coding them.
//
// Theme file (JSON):
//   {
//     "name": "Mine",
//     "base": "dark",                       // preset to start from
//     "colors": { "primary": "#a8df5a", "background": "black" },
//     "styles": { "title": { "fg": "yellow", "modifiers": ["bold"] } }
//   }
// Missing colours come from the base preset; styles not listed are derived
// from the resulting palette.
class Theme {
public:
    Theme();
    Theme(std::string name, ColorPalette colors);

    static Theme dark();
    static Theme light();
    static Theme slime();

    // "dark", "light" or "slime" (case-insensitive).
    static std::optional<Theme> preset(std::string_view name);
    static std::vector<std::string> presetNames();

    // Preset name or path to a theme file. Throws ThemeError.
    static Theme resolve(const std::string& nameOrPath);

    static Theme fromJson(const nlohmann::json& j);   // throws ThemeError
    static Theme loadFile(const std::filesystem::path& path);
    nlohmann::json toJson() const;
    void saveFile(const std::filesystem::path& path) const;

    const std::string&  name() const   { return name_; }
    const ColorPalette& colors() const { return colors_; }

    // Named style, or foreground-only when the name is unknown.
    Style style(const std::string& name) const;
    void  setStyle(const std::string& name, Style style) { styles_[name] = style; }
    bool  hasStyle(const std::string& name) const { return styles_.count(name) > 0; }
    const std::map<std::string, Style>& styles() const { return styles_; }

    Style baseStyle() const { return Style{}.withFg(colors_.foreground).withBg(colors_.background); }
    Style primaryStyle() const   { return Style{}.withFg(colors_.primary); }
    Style secondaryStyle() const { return Style{}.withFg(colors_.secondary); }
    Style accentStyle() const    { return Style{}.withFg(colors_.accent); }
    Style errorStyle() const     { return Style{}.withFg(colors_.error); }
    Style warningStyle() const   { return Style{}.withFg(colors_.warning); }
    Style successStyle() const   { return Style{}.withFg(colors_.success); }

private:
    static std::map<std::string, Style> defaultStyles(const ColorPalette& c);

    std::string                  name_;
    ColorPalette                 colors_;
    std::map<std::string, Style> styles_;
};
