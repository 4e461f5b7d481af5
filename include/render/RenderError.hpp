#pragma once
#include "core/Rect.hpp"
#include <stdexcept>
#include <string>

// Failure of a renderer backend. Propagated to the runtime loop, which
// decides whether to exit; renderers never retry on their own.
class RenderError : public std::runtime_error {
public:
    enum class Kind {
        SizeMismatch,    // buffer area != renderer size()
        FrameTooLarge,   // frame exceeds the shared grid capacity
        ConnectionLost,  // the peer process went away
        BackendIo,       // write/ioctl/mmap failure
    };

    RenderError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    static RenderError sizeMismatch(const Rect& expected, const Rect& actual) {
        return {Kind::SizeMismatch,
                "size mismatch: renderer is " + std::to_string(expected.width) + "x" +
                std::to_string(expected.height) + ", buffer is " +
                std::to_string(actual.width) + "x" + std::to_string(actual.height)};
    }

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

const char* toString(RenderError::Kind kind);
