#pragma once
#include "Event.hpp"
#include <optional>
#include <string>
#include <string_view>

// Incremental decoder for terminal input bytes (xterm conventions).
// Bytes are appended with feed(); next() returns one decoded event at a time
// and leaves incomplete sequences buffered until more bytes arrive.
//
// A lone ESC is ambiguous (Escape key vs. start of a sequence); callers
// resolve it with flushPending() once the input has gone quiet.
class InputDecoder {
public:
    void feed(std::string_view bytes) { pending_.append(bytes); }

    std::optional<Event> next();

    // Treat whatever is buffered as complete: a lone ESC becomes an
    // Escape key, a truncated sequence is dropped.
    std::optional<Event> flushPending();

    bool hasPending() const { return !pending_.empty(); }
    void clear() { pending_.clear(); inPaste_ = false; paste_.clear(); }

private:
    enum class Result { Event, Incomplete, Skip };

    Result decodeEscape(Event& out, size_t& consumed);
    Result decodeCsi(size_t start, Event& out, size_t& consumed);
    Result decodeSs3(Event& out, size_t& consumed);
    Result decodeUtf8(size_t start, char32_t& cp, size_t& len) const;
    std::optional<Event> takePaste();

    std::string pending_;
    bool        inPaste_ = false;
    std::string paste_;
};
