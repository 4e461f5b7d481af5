#pragma once
#include "Rect.hpp"
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

enum class Direction { Horizontal, Vertical };

struct Constraint {
    enum class Type : uint8_t { Length, Percentage, Ratio, Min, Max, Fill };

    Type     type  = Type::Fill;
    uint32_t value = 1;   // length / percent / min / max / fill weight / numerator
    uint32_t denom = 1;   // ratio only

    static Constraint length(uint32_t n)        { return {Type::Length, n, 1}; }
    static Constraint percentage(uint32_t p)    { return {Type::Percentage, p, 1}; }
    static Constraint ratio(uint32_t a, uint32_t b) { return {Type::Ratio, a, b}; }
    static Constraint min(uint32_t n)           { return {Type::Min, n, 1}; }
    static Constraint max(uint32_t n)           { return {Type::Max, n, 1}; }
    static Constraint fill(uint32_t weight = 1) { return {Type::Fill, weight, 1}; }

    // "12", "30%", "min:5", "max:8", "fill", "fill:2", "ratio:1/3"
    static std::optional<Constraint> parse(std::string_view text);

    bool operator==(const Constraint&) const = default;
};

// Splits `area` (shrunk by `margin`) along `direction`. The returned rects
// are in constraint order, pairwise disjoint and contained in `area`.
std::vector<Rect> solve(const std::vector<Constraint>& constraints,
                        Direction direction, uint16_t margin, Rect area);
