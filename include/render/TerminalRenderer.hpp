#pragma once
#include "IRenderer.hpp"
#include "InputDecoder.hpp"
#include <optional>
#include <string>
#include <termios.h>

enum class ColorDepth { Palette16, Palette256, TrueColor };

struct TerminalOptions {
    int  inFd            = 0;
    int  outFd           = 1;
    bool rawMode         = true;    // only applied when inFd is a tty
    bool alternateScreen = true;
    bool mouseCapture    = false;
    std::optional<Rect>       fixedSize;    // bypass the terminal size query
    std::optional<ColorDepth> colorDepth;   // default: detected via ftxui
};

// Renders CellBuffers to a local terminal with ANSI escape sequences.
//
// Keeps the last flushed frame and emits only the cells that changed, with
// cursor moves and SGR changes kept to a minimum. draw() stages the bytes,
// flush() writes them and promotes the staged frame.
//
// Construction takes over the terminal (raw mode, alternate screen, hidden
// cursor, bracketed paste, focus reporting); cleanup() gives it back. A
// process-wide atexit/fatal-signal hook restores the terminal if the
// process dies while a renderer is still active.
class TerminalRenderer : public IRenderer {
public:
    explicit TerminalRenderer(TerminalOptions opts = {});
    ~TerminalRenderer() override;

    TerminalRenderer(const TerminalRenderer&) = delete;
    TerminalRenderer& operator=(const TerminalRenderer&) = delete;

    Rect size() override;
    void draw(const CellBuffer& buffer) override;
    void flush() override;
    std::optional<Event> pollEvent(std::chrono::milliseconds timeout) override;
    void cleanup() override;
    std::string name() const override { return "terminal"; }

    // Forget the previous frame; the next draw repaints everything.
    void invalidate() { previous_.reset(); }

    // Bytes staged by the last draw() and not yet flushed.
    const std::string& pendingOutput() const { return pending_; }

    ColorDepth colorDepth() const { return depth_; }
    uint64_t bytesWritten() const { return bytesWritten_; }

    static uint8_t rgbTo256(uint8_t r, uint8_t g, uint8_t b);
    static uint8_t rgbTo16(uint8_t r, uint8_t g, uint8_t b);

private:
    void enter();
    void emitCell(uint16_t x, uint16_t y, const Cell& cell);
    void appendCursorMove(uint16_t x, uint16_t y);
    void appendSgr(const Cell& cell);
    void appendColor(const Color& c, bool foreground);
    void writeAll(const std::string& bytes);
    std::optional<Event> readInput(std::chrono::milliseconds timeout);

    TerminalOptions opts_;
    ColorDepth      depth_ = ColorDepth::Palette256;
    InputDecoder    decoder_;

    termios savedTermios_{};
    bool    rawActive_    = false;
    bool    screenActive_ = false;
    bool    inputIsTty_   = false;
    bool    cleanedUp_    = false;

    std::optional<CellBuffer> previous_;   // last flushed frame
    std::optional<CellBuffer> staged_;     // drawn, not yet flushed
    std::string pending_;

    // Emission state within one draw()
    int  cursorX_ = -1;
    int  cursorY_ = -1;
    std::optional<Cell> currentStyle_;     // glyph ignored

    uint64_t bytesWritten_ = 0;
};
