#pragma once
#include "IRenderer.hpp"
#include "ipc/SharedFrameLayout.hpp"
#include "ipc/SharedRegion.hpp"
#include <chrono>
#include <string>

struct SharedMemoryOptions {
    std::string name           = "/tuidash";
    uint16_t    capacityWidth  = 256;    // grid capacity of each slot
    uint16_t    capacityHeight = 128;
    uint16_t    width          = 80;     // initial view size
    uint16_t    height         = 24;
    std::chrono::milliseconds readerTimeout{2000};
};

// Publishes frames into a shared-memory segment for a host process.
//
// draw() encodes the buffer into the slot for the next sequence number;
// flush() publishes it with a single release increment of `sequence`.
// The host reads with SharedFrameReader and sends input back through the
// event ring. A Resize event from the host changes size().
//
// Once a reader has attached, a reader heartbeat older than readerTimeout
// makes draw()/flush() throw RenderError(ConnectionLost).
class SharedMemoryRenderer : public IRenderer {
public:
    explicit SharedMemoryRenderer(SharedMemoryOptions opts = {});
    ~SharedMemoryRenderer() override;

    SharedMemoryRenderer(const SharedMemoryRenderer&) = delete;
    SharedMemoryRenderer& operator=(const SharedMemoryRenderer&) = delete;

    Rect size() override { return view_; }
    void draw(const CellBuffer& buffer) override;
    void flush() override;
    std::optional<Event> pollEvent(std::chrono::milliseconds timeout) override;
    void cleanup() override;
    std::string name() const override { return "shm"; }

    uint64_t sequence() const;
    const std::string& segmentName() const { return region_.name(); }
    Rect capacity() const { return Rect(0, 0, opts_.capacityWidth, opts_.capacityHeight); }

private:
    void checkReader() const;
    void stampHeartbeat();
    SharedSlotHeader* slotHeader(size_t slot) const;
    SharedCell* slotCells(size_t slot) const;

    SharedMemoryOptions  opts_;
    SharedRegion         region_;
    SegmentLayout        layout_;
    SharedFrameHeader*   header_ = nullptr;
    SharedEventRing*     events_ = nullptr;
    SharedEventAssembler assembler_;
    Rect                 view_;
    bool                 staged_    = false;
    bool                 cleanedUp_ = false;
};
