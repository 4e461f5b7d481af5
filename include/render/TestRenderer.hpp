#pragma once
#include "IRenderer.hpp"
#include <deque>

// In-memory renderer: keeps the last drawn buffer verbatim and replays
// queued synthetic events. No timing dependencies.
class TestRenderer : public IRenderer {
public:
    TestRenderer(uint16_t width, uint16_t height)
        : size_(0, 0, width, height), buffer_(size_) {}

    Rect size() override { return size_; }

    void draw(const CellBuffer& buffer) override {
        if (buffer.area() != size_)
            throw RenderError::sizeMismatch(size_, buffer.area());
        buffer_ = buffer;
        ++drawCount_;
    }

    void flush() override { ++flushCount_; }

    std::optional<Event> pollEvent(std::chrono::milliseconds) override {
        if (events_.empty()) return std::nullopt;
        Event ev = std::move(events_.front());
        events_.pop_front();
        return ev;
    }

    void cleanup() override { ++cleanupCount_; cleanedUp_ = true; }

    std::string name() const override { return "test"; }

    // ── Test controls ─────────────────────────────────────────────────
    void pushEvent(Event ev) { events_.push_back(std::move(ev)); }
    size_t pendingEvents() const { return events_.size(); }

    // Simulates a terminal resize: changes size() and queues a Resize event.
    void resize(uint16_t width, uint16_t height) {
        size_ = Rect(0, 0, width, height);
        events_.push_back(ResizeEvent{width, height});
    }

    const CellBuffer& buffer() const { return buffer_; }
    int drawCount() const { return drawCount_; }
    int flushCount() const { return flushCount_; }
    int cleanupCount() const { return cleanupCount_; }
    bool cleanedUp() const { return cleanedUp_; }

    // Glyphs of the last frame, one line per row.
    std::string debugOutput() const;

    // Row `y` of the last frame as a string (relative to the frame origin).
    std::string row(uint16_t y) const;

private:
    Rect              size_;
    CellBuffer        buffer_;
    std::deque<Event> events_;
    int  drawCount_    = 0;
    int  flushCount_   = 0;
    int  cleanupCount_ = 0;
    bool cleanedUp_    = false;
};
