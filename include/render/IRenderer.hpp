#pragma once
#include "Event.hpp"
#include "RenderError.hpp"
#include "core/CellBuffer.hpp"
#include <chrono>
#include <optional>
#include <string>

// Abstract renderer backend. Every output target implements this.
// Implementations: TerminalRenderer (local TTY), SharedMemoryRenderer
// (host process reads frames), TestRenderer (in-memory).
//
// All failing operations throw RenderError.
class IRenderer {
public:
    virtual ~IRenderer() = default;

    // Current drawable area; may change between calls.
    virtual Rect size() = 0;

    // Render the whole buffer. Its area must equal size() or this throws
    // RenderError::Kind::SizeMismatch. Output need not be visible until flush().
    virtual void draw(const CellBuffer& buffer) = 0;

    virtual void flush() = 0;

    // Returns within `timeout`; nullopt on timeout or when the backend has
    // no input channel.
    virtual std::optional<Event> pollEvent(std::chrono::milliseconds timeout) = 0;

    // Restores any external state the renderer changed. Idempotent.
    virtual void cleanup() = 0;

    // Name for logging
    virtual std::string name() const = 0;
};
