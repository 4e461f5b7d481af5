#include "core/Style.hpp"
#include <array>
#include <cctype>
#include <charconv>
#include <cstdio>

namespace {

struct NamedColor {
    const char* name;
    uint8_t     index;
};

constexpr std::array<NamedColor, 19> kNamedColors = {{
    {"black", 0},      {"red", 1},          {"green", 2},
    {"yellow", 3},     {"blue", 4},         {"magenta", 5},
    {"cyan", 6},       {"gray", 7},         {"grey", 7},
    {"darkgray", 8},   {"lightred", 9},     {"lightgreen", 10},
    {"lightyellow", 11}, {"lightblue", 12}, {"lightmagenta", 13},
    {"lightcyan", 14}, {"white", 15},       {"darkgrey", 8},
    {"lightwhite", 15},
}};

struct NamedModifier {
    const char* name;
    Modifier    flag;
};

constexpr std::array<NamedModifier, 7> kNamedModifiers = {{
    {"bold", Modifier::Bold},           {"dim", Modifier::Dim},
    {"italic", Modifier::Italic},       {"underline", Modifier::Underline},
    {"reversed", Modifier::Reversed},   {"hidden", Modifier::Hidden},
    {"crossed", Modifier::CrossedOut},
}};

std::string lowered(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '_' || c == '-') continue;
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool parseHexByte(std::string_view s, uint8_t& out) {
    unsigned v = 0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), v, 16);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size()) return false;
    out = static_cast<uint8_t>(v);
    return true;
}

} // namespace

std::optional<Color> Color::parse(std::string_view text) {
    if (text.empty()) return std::nullopt;

    if (text[0] == '#') {
        if (text.size() != 7) return std::nullopt;
        uint8_t r, g, b;
        if (!parseHexByte(text.substr(1, 2), r) ||
            !parseHexByte(text.substr(3, 2), g) ||
            !parseHexByte(text.substr(5, 2), b))
            return std::nullopt;
        return Color::rgb(r, g, b);
    }

    std::string name = lowered(text);
    if (name == "reset" || name == "default") return Color::reset();

    if (name.rfind("index:", 0) == 0) {
        unsigned v = 0;
        auto digits = std::string_view(name).substr(6);
        auto res = std::from_chars(digits.data(), digits.data() + digits.size(), v);
        if (res.ec != std::errc() || res.ptr != digits.data() + digits.size() || v > 255)
            return std::nullopt;
        return Color::indexed(static_cast<uint8_t>(v));
    }

    for (const auto& nc : kNamedColors)
        if (name == nc.name) return Color::indexed(nc.index);

    return std::nullopt;
}

std::string Color::toString() const {
    switch (type) {
        case Type::Reset:
            return "reset";
        case Type::Indexed:
            if (index < 16) {
                for (const auto& nc : kNamedColors)
                    if (nc.index == index) return nc.name;
            }
            return "index:" + std::to_string(index);
        case Type::Rgb: {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
            return buf;
        }
    }
    return "reset";
}

std::optional<Modifier> parseModifier(std::string_view name) {
    for (const auto& nm : kNamedModifiers)
        if (name == nm.name) return nm.flag;
    return std::nullopt;
}

std::vector<std::string> modifierNames(Modifier set) {
    std::vector<std::string> out;
    for (const auto& nm : kNamedModifiers)
        if (hasModifier(set, nm.flag)) out.emplace_back(nm.name);
    return out;
}
