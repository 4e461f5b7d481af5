#include "core/Layout.hpp"
#include <algorithm>
#include <charconv>
#include <string>

namespace {

bool parseUint(std::string_view s, uint32_t& out) {
    if (s.empty()) return false;
    auto res = std::from_chars(s.data(), s.data() + s.size(), out);
    return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

uint32_t sizeFor(const Constraint& c, uint32_t total, uint32_t remaining) {
    switch (c.type) {
        case Constraint::Type::Length:
            return std::min(remaining, c.value);
        case Constraint::Type::Percentage:
            return total * std::min<uint32_t>(c.value, 100) / 100;
        case Constraint::Type::Ratio:
            if (c.denom == 0) return 0;
            return static_cast<uint32_t>(
                std::min<uint64_t>(total, uint64_t(total) * c.value / c.denom));
        case Constraint::Type::Min:
            return std::max(remaining, c.value);
        case Constraint::Type::Max:
            return std::min(remaining, c.value);
        case Constraint::Type::Fill:
            return 0;
    }
    return 0;
}

} // namespace

std::optional<Constraint> Constraint::parse(std::string_view text) {
    uint32_t n = 0;
    if (text == "fill") return fill();
    if (text.size() > 1 && text.back() == '%') {
        if (!parseUint(text.substr(0, text.size() - 1), n)) return std::nullopt;
        return percentage(n);
    }
    auto colon = text.find(':');
    if (colon == std::string_view::npos) {
        if (!parseUint(text, n)) return std::nullopt;
        return length(n);
    }

    std::string_view kind = text.substr(0, colon);
    std::string_view arg  = text.substr(colon + 1);
    if (kind == "ratio") {
        auto slash = arg.find('/');
        uint32_t a = 0, b = 0;
        if (slash == std::string_view::npos ||
            !parseUint(arg.substr(0, slash), a) ||
            !parseUint(arg.substr(slash + 1), b) || b == 0)
            return std::nullopt;
        return ratio(a, b);
    }
    if (!parseUint(arg, n)) return std::nullopt;
    if (kind == "min")  return min(n);
    if (kind == "max")  return max(n);
    if (kind == "fill") return fill(std::max<uint32_t>(n, 1));
    return std::nullopt;
}

std::vector<Rect> solve(const std::vector<Constraint>& constraints,
                        Direction direction, uint16_t margin, Rect area) {
    Rect inner = area.inner(margin);
    if (constraints.empty()) return {inner};

    const bool horizontal = direction == Direction::Horizontal;
    const uint32_t total = horizontal ? inner.width : inner.height;

    std::vector<uint32_t> sizes(constraints.size(), 0);
    uint32_t remaining = total;
    uint32_t fillWeight = 0;

    // Fixed sizes first; percentage and ratio are relative to the whole axis.
    for (size_t i = 0; i < constraints.size(); ++i) {
        const auto& c = constraints[i];
        if (c.type == Constraint::Type::Fill) {
            fillWeight += std::max<uint32_t>(c.value, 1);
            continue;
        }
        if (c.type == Constraint::Type::Min || c.type == Constraint::Type::Max)
            continue;
        sizes[i] = std::min(remaining, sizeFor(c, total, remaining));
        remaining -= sizes[i];
    }

    // Min/Max share what is left with the fills: Min claims its minimum,
    // Max takes up to its cap from an equal share.
    size_t flexible = 0;
    for (const auto& c : constraints)
        if (c.type == Constraint::Type::Min || c.type == Constraint::Type::Max)
            ++flexible;
    for (size_t i = 0; i < constraints.size(); ++i) {
        const auto& c = constraints[i];
        if (c.type != Constraint::Type::Min && c.type != Constraint::Type::Max)
            continue;
        uint32_t share = fillWeight == 0 && flexible == 1
                             ? remaining
                             : remaining / uint32_t(flexible + (fillWeight ? 1 : 0));
        --flexible;
        uint32_t size = c.type == Constraint::Type::Min ? std::max(share, c.value)
                                                        : std::min(share, c.value);
        sizes[i] = std::min(size, remaining);
        remaining -= sizes[i];
    }

    if (fillWeight > 0) {
        uint32_t pool = remaining;
        uint32_t handed = 0;
        size_t lastFill = 0;
        for (size_t i = 0; i < constraints.size(); ++i) {
            const auto& c = constraints[i];
            if (c.type != Constraint::Type::Fill) continue;
            sizes[i] = pool * std::max<uint32_t>(c.value, 1) / fillWeight;
            handed += sizes[i];
            lastFill = i;
        }
        sizes[lastFill] += pool - handed;
    }

    std::vector<Rect> rects;
    rects.reserve(constraints.size());
    uint32_t offset = 0;
    for (uint32_t size : sizes) {
        size = std::min(size, total - std::min(total, offset));
        if (horizontal)
            rects.emplace_back(static_cast<uint16_t>(inner.x + offset), inner.y,
                               static_cast<uint16_t>(size), inner.height);
        else
            rects.emplace_back(inner.x, static_cast<uint16_t>(inner.y + offset),
                               inner.width, static_cast<uint16_t>(size));
        offset += size;
    }
    return rects;
}
