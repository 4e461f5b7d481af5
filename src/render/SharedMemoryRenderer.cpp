#include "render/SharedMemoryRenderer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <new>
#include <thread>

SharedMemoryRenderer::SharedMemoryRenderer(SharedMemoryOptions opts)
    : opts_(std::move(opts)),
      view_(0, 0, opts_.width, opts_.height) {
    layout_ = SegmentLayout::compute(opts_.capacityWidth, opts_.capacityHeight);
    region_ = SharedRegion::create(opts_.name, layout_.totalBytes);

    auto* base = static_cast<std::byte*>(region_.data());
    header_ = new (base) SharedFrameHeader{};
    header_->magic          = shm::MAGIC;
    header_->version        = shm::VERSION;
    header_->headerSize     = sizeof(SharedFrameHeader);
    header_->cellSize       = sizeof(SharedCell);
    header_->capacityWidth  = opts_.capacityWidth;
    header_->capacityHeight = opts_.capacityHeight;
    header_->viewWidth.store(view_.width, std::memory_order_relaxed);
    header_->viewHeight.store(view_.height, std::memory_order_relaxed);
    header_->writerHeartbeatNs.store(shm::nowNs(), std::memory_order_relaxed);

    events_ = new (base + layout_.ringOffset) SharedEventRing{};

    // Everything above must be visible before a reader sees Running
    header_->writerState.store(static_cast<uint32_t>(shm::WriterState::Running),
                               std::memory_order_release);

    spdlog::info("Shared-memory renderer on {}: capacity {}x{}, view {}x{}, {} bytes",
                 region_.name(), opts_.capacityWidth, opts_.capacityHeight,
                 view_.width, view_.height, layout_.totalBytes);
}

SharedMemoryRenderer::~SharedMemoryRenderer() {
    cleanup();
}

uint64_t SharedMemoryRenderer::sequence() const {
    return header_ ? header_->sequence.load(std::memory_order_acquire) : 0;
}

SharedSlotHeader* SharedMemoryRenderer::slotHeader(size_t slot) const {
    auto* base = static_cast<std::byte*>(region_.data());
    return reinterpret_cast<SharedSlotHeader*>(base + layout_.slotOffset[slot]);
}

SharedCell* SharedMemoryRenderer::slotCells(size_t slot) const {
    return reinterpret_cast<SharedCell*>(
        reinterpret_cast<std::byte*>(slotHeader(slot)) + sizeof(SharedSlotHeader));
}

void SharedMemoryRenderer::stampHeartbeat() {
    header_->writerHeartbeatNs.store(shm::nowNs(), std::memory_order_relaxed);
}

void SharedMemoryRenderer::checkReader() const {
    if (header_->readerAttached.load(std::memory_order_acquire) == 0) return;

    uint64_t last = header_->readerHeartbeatNs.load(std::memory_order_relaxed);
    uint64_t now  = shm::nowNs();
    auto timeoutNs = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(opts_.readerTimeout).count());
    if (now > last && now - last > timeoutNs) {
        throw RenderError(RenderError::Kind::ConnectionLost,
                          "host reader on " + region_.name() + " stopped responding (" +
                          std::to_string((now - last) / 1'000'000) + " ms since heartbeat)");
    }
}

void SharedMemoryRenderer::draw(const CellBuffer& buffer) {
    if (cleanedUp_)
        throw RenderError(RenderError::Kind::BackendIo, "shared-memory renderer is closed");

    const Rect& area = buffer.area();
    if (area.width > opts_.capacityWidth || area.height > opts_.capacityHeight) {
        throw RenderError(RenderError::Kind::FrameTooLarge,
                          "frame " + std::to_string(area.width) + "x" +
                          std::to_string(area.height) + " exceeds shared capacity " +
                          std::to_string(opts_.capacityWidth) + "x" +
                          std::to_string(opts_.capacityHeight));
    }
    if (area != view_) throw RenderError::sizeMismatch(view_, area);
    checkReader();

    uint64_t seq  = header_->sequence.load(std::memory_order_relaxed);
    size_t   slot = (seq + 1) & 1;

    // Pairs with the reader's acquire fence: a reader that observes the
    // slot being rewritten also observes the newer sequence
    std::atomic_thread_fence(std::memory_order_release);

    SharedSlotHeader* sh = slotHeader(slot);
    sh->width  = area.width;
    sh->height = area.height;
    SharedCell* cells = slotCells(slot);
    const auto& src = buffer.cells();
    for (size_t i = 0; i < src.size(); ++i)
        cells[i] = encodeCell(src[i]);

    staged_ = true;
    stampHeartbeat();
}

void SharedMemoryRenderer::flush() {
    if (cleanedUp_)
        throw RenderError(RenderError::Kind::BackendIo, "shared-memory renderer is closed");
    checkReader();
    stampHeartbeat();
    if (!staged_) return;

    uint64_t seq = header_->sequence.fetch_add(1, std::memory_order_release) + 1;
    staged_ = false;
    spdlog::debug("shm frame {} published ({}x{})", seq, view_.width, view_.height);
}

std::optional<Event> SharedMemoryRenderer::pollEvent(std::chrono::milliseconds timeout) {
    if (cleanedUp_) return std::nullopt;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        stampHeartbeat();
        while (auto rec = events_->pop()) {
            auto ev = assembler_.push(*rec);
            if (!ev) continue;
            if (auto* r = std::get_if<ResizeEvent>(&*ev)) {
                // Views never exceed the segment grid
                if (r->width > opts_.capacityWidth || r->height > opts_.capacityHeight) {
                    spdlog::warn("shm resize {}x{} exceeds capacity {}x{}, clamping",
                                 r->width, r->height, opts_.capacityWidth, opts_.capacityHeight);
                    r->width  = std::min(r->width, opts_.capacityWidth);
                    r->height = std::min(r->height, opts_.capacityHeight);
                }
                view_ = Rect(0, 0, r->width, r->height);
                header_->viewWidth.store(r->width, std::memory_order_relaxed);
                header_->viewHeight.store(r->height, std::memory_order_relaxed);
                spdlog::debug("shm view resized to {}x{}", r->width, r->height);
            }
            return ev;
        }
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void SharedMemoryRenderer::cleanup() {
    if (cleanedUp_) return;
    cleanedUp_ = true;
    if (header_) {
        header_->writerState.store(static_cast<uint32_t>(shm::WriterState::Closed),
                                   std::memory_order_release);
        spdlog::info("Shared-memory renderer closed after {} frames",
                     header_->sequence.load(std::memory_order_relaxed));
    }
    header_ = nullptr;
    events_ = nullptr;
    region_.close();
}
