#pragma once
#include "Cell.hpp"
#include "Rect.hpp"
#include <optional>
#include <string_view>
#include <vector>

// A frame: row-major grid of cells covering `area`.
// cells().size() == area.width * area.height at all times.
// Coordinates passed to accessors are absolute (inside area()).
class CellBuffer {
public:
    struct CellUpdate {
        uint16_t    x;
        uint16_t    y;
        const Cell* cell;
    };

    CellBuffer() = default;
    explicit CellBuffer(Rect area);

    static CellBuffer filled(Rect area, const Cell& cell);

    const Rect& area() const { return area_; }
    const std::vector<Cell>& cells() const { return cells_; }
    size_t size() const { return cells_.size(); }

    // Bounds-checked access. Out-of-area coordinates yield nullopt/nullptr.
    std::optional<Cell> get(uint16_t x, uint16_t y) const;
    const Cell* at(uint16_t x, uint16_t y) const;
    Cell* at(uint16_t x, uint16_t y);
    bool set(uint16_t x, uint16_t y, const Cell& cell);

    // Writes grapheme clusters left to right from (x, y), clipped at the
    // right edge. Returns the number of cells written.
    size_t setString(uint16_t x, uint16_t y, std::string_view text,
                     const Style& style = {});

    // Same as setString but stops after `maxWidth` columns.
    size_t setStringN(uint16_t x, uint16_t y, std::string_view text,
                      uint16_t maxWidth, const Style& style = {});

    void setStyle(const Rect& rect, const Style& style);

    // Composite `other` at its own origin, or at `dest`, clipped to area().
    void merge(const CellBuffer& other);
    void merge(const CellBuffer& other, Position dest);

    // Cells of `next` that differ from this buffer. Every cell of `next`
    // when the areas differ.
    std::vector<CellUpdate> diff(const CellBuffer& next) const;

    void clear();
    void resize(Rect area);

    bool operator==(const CellBuffer&) const = default;

private:
    std::optional<size_t> indexOf(uint16_t x, uint16_t y) const;

    Rect              area_;
    std::vector<Cell> cells_;
};

// Display width (1 or 2 columns) of a single grapheme cluster.
int glyphWidth(const std::string& glyph);
