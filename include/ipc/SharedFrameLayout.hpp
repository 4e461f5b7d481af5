#pragma once
#include "SharedEvent.hpp"
#include "SpscRing.hpp"
#include "core/Cell.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

// Byte layout of the shared-memory frame segment. Writer
// (SharedMemoryRenderer) and reader (SharedFrameReader) must agree on
// every field; bump VERSION on any change.
//
//   [SharedFrameHeader][slot 0][slot 1][EventRing]
//   slot = SharedSlotHeader + capacityWidth*capacityHeight SharedCells
//
// The frame with sequence N lives in slot N & 1.
namespace shm {

inline constexpr uint32_t MAGIC   = 0x48534454;   // "TDSH" little-endian
inline constexpr uint32_t VERSION = 1;
inline constexpr size_t   GLYPH_BYTES = 16;
inline constexpr size_t   EVENT_RING_CAPACITY = 256;
inline constexpr size_t   SEGMENT_ALIGN = 64;

enum class WriterState : uint32_t { Starting = 0, Running = 1, Closed = 2 };

inline uint64_t nowNs() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

} // namespace shm

struct SharedCell {
    char     glyph[shm::GLYPH_BYTES];   // NUL-terminated UTF-8, <= 15 bytes
    uint32_t fg;
    uint32_t bg;
    uint16_t modifiers;
    uint16_t reserved;
};
static_assert(sizeof(SharedCell) == 28);

struct SharedFrameHeader {
    uint32_t magic;
    uint32_t version;
    uint32_t headerSize;
    uint32_t cellSize;
    uint32_t capacityWidth;
    uint32_t capacityHeight;

    std::atomic<uint64_t> sequence;            // last published frame
    std::atomic<uint64_t> writerHeartbeatNs;   // steady_clock
    std::atomic<uint64_t> readerHeartbeatNs;
    std::atomic<uint32_t> writerState;         // shm::WriterState
    std::atomic<uint32_t> readerAttached;
    std::atomic<uint32_t> viewWidth;
    std::atomic<uint32_t> viewHeight;
};
static_assert(std::atomic<uint32_t>::is_always_lock_free);

struct SharedSlotHeader {
    uint32_t width;
    uint32_t height;
};

using SharedEventRing = SpscRing<SharedEventRecord, shm::EVENT_RING_CAPACITY>;

// Offsets of each region for a given grid capacity.
struct SegmentLayout {
    size_t slotOffset[2] = {0, 0};
    size_t slotBytes     = 0;
    size_t ringOffset    = 0;
    size_t totalBytes    = 0;

    static SegmentLayout compute(uint32_t capacityWidth, uint32_t capacityHeight) {
        auto align = [](size_t n) {
            return (n + shm::SEGMENT_ALIGN - 1) / shm::SEGMENT_ALIGN * shm::SEGMENT_ALIGN;
        };
        SegmentLayout l;
        l.slotBytes     = align(sizeof(SharedSlotHeader) +
                                size_t(capacityWidth) * capacityHeight * sizeof(SharedCell));
        l.slotOffset[0] = align(sizeof(SharedFrameHeader));
        l.slotOffset[1] = l.slotOffset[0] + l.slotBytes;
        l.ringOffset    = l.slotOffset[1] + l.slotBytes;
        l.totalBytes    = align(l.ringOffset + sizeof(SharedEventRing));
        return l;
    }
};

// Colour packing: top byte is the Color::Type, low bytes the payload.
uint32_t packColor(const Color& c);
Color unpackColor(uint32_t packed);

// Glyphs that do not fit are stored as U+FFFD.
SharedCell encodeCell(const Cell& cell);
Cell decodeCell(const SharedCell& cell);
