#pragma once
#include "SharedFrameLayout.hpp"
#include "SharedRegion.hpp"
#include "core/CellBuffer.hpp"
#include "render/Event.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct SharedFrameSnapshot {
    uint64_t   sequence = 0;
    CellBuffer buffer;
};

// Host side of the shared-memory protocol: maps a segment created by
// SharedMemoryRenderer, copies out published frames and sends input events.
class SharedFrameReader {
public:
    SharedFrameReader() = default;
    ~SharedFrameReader();

    SharedFrameReader(const SharedFrameReader&) = delete;
    SharedFrameReader& operator=(const SharedFrameReader&) = delete;

    // Throws RenderError(BackendIo) when the segment is missing or its
    // magic, version or cell size do not match this build.
    void attach(const std::string& name);
    void detach();
    bool attached() const { return header_ != nullptr; }

    // The newest frame if its sequence differs from the last one returned.
    // Never returns a grid mixed from two frames.
    std::optional<SharedFrameSnapshot> poll();

    // False when the event ring is full.
    bool sendEvent(const Event& ev);

    void heartbeat();

    // False once the writer closed or its heartbeat is older than `timeout`.
    bool writerAlive(std::chrono::milliseconds timeout) const;

    uint64_t lastSequence() const { return lastSequence_; }
    Rect capacity() const;
    Rect viewSize() const;

    // Number of copies discarded because the writer moved on mid-copy.
    uint64_t retries() const { return retries_; }

private:
    SharedSlotHeader* slotHeader(size_t slot) const;
    const SharedCell* slotCells(size_t slot) const;

    SharedRegion       region_;
    SegmentLayout      layout_;
    SharedFrameHeader* header_ = nullptr;
    SharedEventRing*   events_ = nullptr;
    uint64_t           lastSequence_ = 0;
    uint64_t           retries_      = 0;
    std::vector<SharedCell> scratch_;
};
