#pragma once
#include "render/Event.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Fixed-size wire form of an Event for the shared-memory event ring.
// Paste text longer than one record is split across consecutive records
// flagged MoreFollows.
struct SharedEventRecord {
    enum Type : uint8_t { None, Key, Mouse, Resize, FocusGained, FocusLost, Paste };
    enum Flags : uint8_t { MoreFollows = 1 };
    static constexpr size_t TEXT_BYTES = 112;

    uint8_t  type       = None;
    uint8_t  code       = 0;    // KeyCode / MouseEvent::Kind
    uint8_t  aux        = 0;    // function key number / mouse button
    uint8_t  modifiers  = 0;    // bit0 shift, bit1 ctrl, bit2 alt
    uint32_t ch         = 0;
    uint16_t x          = 0;    // mouse column or resize width
    uint16_t y          = 0;    // mouse row or resize height
    uint16_t textLength = 0;
    uint8_t  flags      = 0;
    uint8_t  reserved   = 0;
    char     text[TEXT_BYTES] = {};
};

std::vector<SharedEventRecord> encodeEvent(const Event& ev);

// Reassembles records into Events on the consumer side.
class SharedEventAssembler {
public:
    // Returns an Event once its last record has arrived.
    std::optional<Event> push(const SharedEventRecord& rec);

private:
    std::string pasteBuffer_;
};
