#include "ipc/SharedFrameLayout.hpp"
#include <cstring>

namespace {
constexpr char REPLACEMENT_CHAR[] = "\xEF\xBF\xBD";   // U+FFFD
}

uint32_t packColor(const Color& c) {
    switch (c.type) {
        case Color::Type::Reset:
            return 0;
        case Color::Type::Indexed:
            return (1u << 24) | c.index;
        case Color::Type::Rgb:
            return (2u << 24) | (uint32_t(c.r) << 16) | (uint32_t(c.g) << 8) | c.b;
    }
    return 0;
}

Color unpackColor(uint32_t packed) {
    switch (packed >> 24) {
        case 1:  return Color::indexed(static_cast<uint8_t>(packed & 0xFF));
        case 2:  return Color::rgb(static_cast<uint8_t>((packed >> 16) & 0xFF),
                                   static_cast<uint8_t>((packed >> 8) & 0xFF),
                                   static_cast<uint8_t>(packed & 0xFF));
        default: return Color::reset();
    }
}

SharedCell encodeCell(const Cell& cell) {
    SharedCell out{};
    const std::string& g = cell.glyph();
    if (g.size() < shm::GLYPH_BYTES) std::memcpy(out.glyph, g.data(), g.size());
    else                             std::memcpy(out.glyph, REPLACEMENT_CHAR, 3);
    out.fg        = packColor(cell.fg);
    out.bg        = packColor(cell.bg);
    out.modifiers = static_cast<uint16_t>(cell.modifiers);
    return out;
}

Cell decodeCell(const SharedCell& cell) {
    size_t len = strnlen(cell.glyph, shm::GLYPH_BYTES - 1);
    return Cell(std::string_view(cell.glyph, len),
                unpackColor(cell.fg), unpackColor(cell.bg),
                static_cast<Modifier>(cell.modifiers & 0x7F));
}
