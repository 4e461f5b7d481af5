#include "ipc/SharedFrameReader.hpp"
#include "render/RenderError.hpp"
#include <spdlog/spdlog.h>
#include <cstring>

namespace {
constexpr int MAX_COPY_ATTEMPTS = 64;
}

SharedFrameReader::~SharedFrameReader() {
    detach();
}

void SharedFrameReader::attach(const std::string& name) {
    detach();
    SharedRegion region = SharedRegion::open(name);

    if (region.size() < sizeof(SharedFrameHeader))
        throw RenderError(RenderError::Kind::BackendIo,
                          "shared segment " + region.name() + " is too small");

    auto* header = static_cast<SharedFrameHeader*>(region.data());
    if (header->magic != shm::MAGIC)
        throw RenderError(RenderError::Kind::BackendIo,
                          "shared segment " + region.name() + " has bad magic");
    if (header->version != shm::VERSION)
        throw RenderError(RenderError::Kind::BackendIo,
                          "shared segment " + region.name() + " has protocol version " +
                          std::to_string(header->version) + ", expected " +
                          std::to_string(shm::VERSION));
    if (header->cellSize != sizeof(SharedCell) ||
        header->headerSize != sizeof(SharedFrameHeader))
        throw RenderError(RenderError::Kind::BackendIo,
                          "shared segment " + region.name() + " has incompatible layout");

    SegmentLayout layout = SegmentLayout::compute(header->capacityWidth, header->capacityHeight);
    if (region.size() < layout.totalBytes)
        throw RenderError(RenderError::Kind::BackendIo,
                          "shared segment " + region.name() + " is truncated");

    region_ = std::move(region);
    layout_ = layout;
    header_ = header;
    events_ = reinterpret_cast<SharedEventRing*>(
        static_cast<std::byte*>(region_.data()) + layout_.ringOffset);
    lastSequence_ = 0;
    scratch_.resize(size_t(header_->capacityWidth) * header_->capacityHeight);

    heartbeat();
    header_->readerAttached.store(1, std::memory_order_release);
    spdlog::info("Attached to {} (capacity {}x{})", region_.name(),
                 header_->capacityWidth, header_->capacityHeight);
}

void SharedFrameReader::detach() {
    if (header_) {
        header_->readerAttached.store(0, std::memory_order_release);
        spdlog::debug("Detached from {}", region_.name());
    }
    header_ = nullptr;
    events_ = nullptr;
    region_.close();
}

SharedSlotHeader* SharedFrameReader::slotHeader(size_t slot) const {
    auto* base = static_cast<std::byte*>(region_.data());
    return reinterpret_cast<SharedSlotHeader*>(base + layout_.slotOffset[slot]);
}

const SharedCell* SharedFrameReader::slotCells(size_t slot) const {
    return reinterpret_cast<const SharedCell*>(
        reinterpret_cast<const std::byte*>(slotHeader(slot)) + sizeof(SharedSlotHeader));
}

std::optional<SharedFrameSnapshot> SharedFrameReader::poll() {
    if (!header_) return std::nullopt;
    heartbeat();

    uint64_t seq = header_->sequence.load(std::memory_order_acquire);
    for (int attempt = 0; attempt < MAX_COPY_ATTEMPTS; ++attempt) {
        if (seq == 0 || seq == lastSequence_) return std::nullopt;

        size_t slot = seq & 1;
        const SharedSlotHeader* sh = slotHeader(slot);
        uint32_t width  = sh->width;
        uint32_t height = sh->height;
        bool sane = width <= header_->capacityWidth && height <= header_->capacityHeight;
        size_t count = sane ? size_t(width) * height : 0;
        if (sane) std::memcpy(scratch_.data(), slotCells(slot), count * sizeof(SharedCell));

        std::atomic_thread_fence(std::memory_order_acquire);
        uint64_t again = header_->sequence.load(std::memory_order_relaxed);
        if (again != seq || !sane) {
            // Writer started the next frame while we copied
            ++retries_;
            seq = header_->sequence.load(std::memory_order_acquire);
            continue;
        }

        SharedFrameSnapshot snap;
        snap.sequence = seq;
        snap.buffer   = CellBuffer(Rect(0, 0, static_cast<uint16_t>(width),
                                        static_cast<uint16_t>(height)));
        for (uint32_t y = 0; y < height; ++y)
            for (uint32_t x = 0; x < width; ++x)
                snap.buffer.set(static_cast<uint16_t>(x), static_cast<uint16_t>(y),
                                decodeCell(scratch_[size_t(y) * width + x]));
        lastSequence_ = seq;
        return snap;
    }

    spdlog::warn("Gave up copying frame after {} attempts", MAX_COPY_ATTEMPTS);
    return std::nullopt;
}

bool SharedFrameReader::sendEvent(const Event& ev) {
    if (!events_) return false;
    auto records = encodeEvent(ev);
    // All records of a paste must fit, or none are sent
    if (SharedEventRing::capacity() - events_->available() < records.size()) return false;
    for (const auto& rec : records) {
        if (!events_->push(rec)) return false;
    }
    return true;
}

void SharedFrameReader::heartbeat() {
    if (header_) header_->readerHeartbeatNs.store(shm::nowNs(), std::memory_order_relaxed);
}

bool SharedFrameReader::writerAlive(std::chrono::milliseconds timeout) const {
    if (!header_) return false;
    auto state = static_cast<shm::WriterState>(header_->writerState.load(std::memory_order_acquire));
    if (state == shm::WriterState::Closed) return false;

    uint64_t last = header_->writerHeartbeatNs.load(std::memory_order_relaxed);
    uint64_t now  = shm::nowNs();
    auto timeoutNs = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(timeout).count());
    return now <= last || now - last <= timeoutNs;
}

Rect SharedFrameReader::capacity() const {
    if (!header_) return {};
    return Rect(0, 0, static_cast<uint16_t>(header_->capacityWidth),
                static_cast<uint16_t>(header_->capacityHeight));
}

Rect SharedFrameReader::viewSize() const {
    if (!header_) return {};
    return Rect(0, 0,
                static_cast<uint16_t>(header_->viewWidth.load(std::memory_order_relaxed)),
                static_cast<uint16_t>(header_->viewHeight.load(std::memory_order_relaxed)));
}
