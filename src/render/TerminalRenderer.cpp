#include "render/TerminalRenderer.hpp"
#include <ftxui/screen/terminal.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <charconv>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <poll.h>
#include <unistd.h>

namespace {

constexpr std::string_view ENTER_ALT_SCREEN = "\x1b[?1049h";
constexpr std::string_view LEAVE_ALT_SCREEN = "\x1b[?1049l";
constexpr std::string_view HIDE_CURSOR      = "\x1b[?25l";
constexpr std::string_view SHOW_CURSOR      = "\x1b[?25h";
constexpr std::string_view PASTE_ON         = "\x1b[?2004h";
constexpr std::string_view PASTE_OFF        = "\x1b[?2004l";
constexpr std::string_view FOCUS_ON         = "\x1b[?1004h";
constexpr std::string_view FOCUS_OFF        = "\x1b[?1004l";
constexpr std::string_view MOUSE_ON         = "\x1b[?1000h\x1b[?1002h\x1b[?1006h";
constexpr std::string_view MOUSE_OFF        = "\x1b[?1006l\x1b[?1002l\x1b[?1000l";
constexpr std::string_view SGR_RESET        = "\x1b[0m";
constexpr std::string_view CLEAR_SCREEN     = "\x1b[2J";

// Time to wait for the rest of an escape sequence before reporting Esc
constexpr std::chrono::milliseconds ESCAPE_TIMEOUT{25};

// ── Last-resort terminal restore ────────────────────────────────────
// Only async-signal-safe calls below: write(2), tcsetattr(3), signal, raise.

struct EmergencyRestore {
    std::atomic<bool> armed{false};
    int     inFd  = -1;
    int     outFd = -1;
    bool    restoreTermios = false;
    termios saved{};
    char    sequence[128]{};
    size_t  sequenceLen = 0;
};

EmergencyRestore g_restore;
std::atomic<bool> g_resized{false};
std::atomic<bool> g_hooksInstalled{false};

void emergencyRestore() {
    if (!g_restore.armed.exchange(false)) return;
    if (g_restore.sequenceLen > 0) {
        [[maybe_unused]] ssize_t n =
            ::write(g_restore.outFd, g_restore.sequence, g_restore.sequenceLen);
    }
    if (g_restore.restoreTermios)
        ::tcsetattr(g_restore.inFd, TCSANOW, &g_restore.saved);
}

void onFatalSignal(int sig) {
    emergencyRestore();
    std::signal(sig, SIG_DFL);
    std::raise(sig);
}

void onWindowChange(int) {
    g_resized.store(true);
}

void installHooks() {
    if (g_hooksInstalled.exchange(true)) return;

    std::atexit(emergencyRestore);
    for (int sig : {SIGTERM, SIGHUP, SIGQUIT, SIGSEGV, SIGABRT, SIGBUS, SIGFPE, SIGILL})
        std::signal(sig, onFatalSignal);

    struct sigaction sa{};
    sa.sa_handler = onWindowChange;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (sigaction(SIGWINCH, &sa, nullptr) != 0)
        spdlog::warn("SIGWINCH handler not installed: {}", std::strerror(errno));
}

// ── Colour tables ───────────────────────────────────────────────────

struct Palette {
    std::array<uint8_t, 256> r{}, g{}, b{};

    Palette() {
        static constexpr uint8_t base[16][3] = {
            {0, 0, 0}, {128, 0, 0}, {0, 128, 0}, {128, 128, 0},
            {0, 0, 128}, {128, 0, 128}, {0, 128, 128}, {192, 192, 192},
            {128, 128, 128}, {255, 0, 0}, {0, 255, 0}, {255, 255, 0},
            {0, 0, 255}, {255, 0, 255}, {0, 255, 255}, {255, 255, 255}
        };
        for (int i = 0; i < 16; ++i) {
            r[i] = base[i][0];
            g[i] = base[i][1];
            b[i] = base[i][2];
        }
        // 6x6x6 colour cube
        for (int i = 16; i < 232; ++i) {
            int idx = i - 16;
            int rv = idx / 36, gv = (idx % 36) / 6, bv = idx % 6;
            r[i] = rv ? static_cast<uint8_t>(55 + rv * 40) : 0;
            g[i] = gv ? static_cast<uint8_t>(55 + gv * 40) : 0;
            b[i] = bv ? static_cast<uint8_t>(55 + bv * 40) : 0;
        }
        // grayscale ramp
        for (int i = 232; i < 256; ++i)
            r[i] = g[i] = b[i] = static_cast<uint8_t>(8 + (i - 232) * 10);
    }
};

const Palette& palette() {
    static const Palette p;
    return p;
}

uint8_t nearest(uint8_t r, uint8_t g, uint8_t b, int count) {
    const Palette& p = palette();
    uint8_t  best = 0;
    uint32_t bestDist = UINT32_MAX;
    for (int i = 0; i < count; ++i) {
        int dr = r - p.r[i], dg = g - p.g[i], db = b - p.b[i];
        uint32_t dist = static_cast<uint32_t>(dr * dr + dg * dg + db * db);
        if (dist < bestDist) {
            bestDist = dist;
            best = static_cast<uint8_t>(i);
        }
    }
    return best;
}

ColorDepth detectDepth() {
    switch (ftxui::Terminal::ColorSupport()) {
        case ftxui::Terminal::Color::TrueColor:  return ColorDepth::TrueColor;
        case ftxui::Terminal::Color::Palette256: return ColorDepth::Palette256;
        default:                                 return ColorDepth::Palette16;
    }
}

const char* depthName(ColorDepth d) {
    switch (d) {
        case ColorDepth::Palette16:  return "16";
        case ColorDepth::Palette256: return "256";
        case ColorDepth::TrueColor:  return "truecolor";
    }
    return "?";
}

void appendNumber(std::string& out, int value) {
    char tmp[16];
    auto res = std::to_chars(tmp, tmp + sizeof(tmp), value);
    out.append(tmp, res.ptr);
}

bool sameStyle(const Cell& a, const Cell& b) {
    return a.fg == b.fg && a.bg == b.bg && a.modifiers == b.modifiers;
}

std::string teardownSequence(const TerminalOptions& opts) {
    std::string out;
    if (opts.mouseCapture) out += MOUSE_OFF;
    out += FOCUS_OFF;
    out += PASTE_OFF;
    out += SGR_RESET;
    out += SHOW_CURSOR;
    if (opts.alternateScreen) out += LEAVE_ALT_SCREEN;
    return out;
}

} // namespace

// ── Lifecycle ───────────────────────────────────────────────────────

TerminalRenderer::TerminalRenderer(TerminalOptions opts)
    : opts_(std::move(opts)) {
    depth_ = opts_.colorDepth ? *opts_.colorDepth : detectDepth();
    inputIsTty_ = ::isatty(opts_.inFd) == 1;

    try {
        enter();
    } catch (const std::exception&) {
        cleanup();
        throw;
    }

    Rect area = size();
    spdlog::info("Terminal renderer: {}x{}, colour depth {}, raw={}",
                 area.width, area.height, depthName(depth_), rawActive_);
}

TerminalRenderer::~TerminalRenderer() {
    cleanup();
}

void TerminalRenderer::enter() {
    installHooks();

    if (opts_.rawMode && inputIsTty_) {
        if (::tcgetattr(opts_.inFd, &savedTermios_) != 0)
            throw RenderError(RenderError::Kind::BackendIo,
                              std::string("tcgetattr failed: ") + std::strerror(errno));
        termios raw = savedTermios_;
        raw.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
        raw.c_oflag &= ~(OPOST);
        raw.c_cflag |= CS8;
        raw.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);
        raw.c_cc[VMIN]  = 0;
        raw.c_cc[VTIME] = 0;
        if (::tcsetattr(opts_.inFd, TCSAFLUSH, &raw) != 0)
            throw RenderError(RenderError::Kind::BackendIo,
                              std::string("tcsetattr failed: ") + std::strerror(errno));
        rawActive_ = true;
    }

    std::string setup;
    if (opts_.alternateScreen) {
        setup += ENTER_ALT_SCREEN;
        setup += CLEAR_SCREEN;
    }
    setup += HIDE_CURSOR;
    setup += PASTE_ON;
    setup += FOCUS_ON;
    if (opts_.mouseCapture) setup += MOUSE_ON;
    std::string teardown = teardownSequence(opts_);

    // Arm the emergency hook before touching the screen
    std::memcpy(g_restore.sequence, teardown.data(),
                std::min(teardown.size(), sizeof(g_restore.sequence)));
    g_restore.sequenceLen    = std::min(teardown.size(), sizeof(g_restore.sequence));
    g_restore.inFd           = opts_.inFd;
    g_restore.outFd          = opts_.outFd;
    g_restore.restoreTermios = rawActive_;
    g_restore.saved          = savedTermios_;
    g_restore.armed.store(true);

    screenActive_ = true;
    writeAll(setup);
}

void TerminalRenderer::cleanup() {
    if (cleanedUp_) return;
    cleanedUp_ = true;
    g_restore.armed.store(false);

    if (screenActive_) {
        try {
            writeAll(teardownSequence(opts_));
        } catch (const RenderError& e) {
            spdlog::warn("Terminal restore incomplete: {}", e.what());
        }
        screenActive_ = false;
    }

    if (rawActive_) {
        if (::tcsetattr(opts_.inFd, TCSAFLUSH, &savedTermios_) != 0)
            spdlog::warn("Failed to restore terminal mode: {}", std::strerror(errno));
        rawActive_ = false;
    }

    pending_.clear();
    spdlog::debug("Terminal renderer cleaned up ({} bytes written)", bytesWritten_);
}

// ── Rendering ───────────────────────────────────────────────────────

Rect TerminalRenderer::size() {
    if (opts_.fixedSize) return *opts_.fixedSize;
    auto dim = ftxui::Terminal::Size();
    return Rect(0, 0,
                static_cast<uint16_t>(std::clamp(dim.dimx, 0, 0xFFFF)),
                static_cast<uint16_t>(std::clamp(dim.dimy, 0, 0xFFFF)));
}

void TerminalRenderer::draw(const CellBuffer& buffer) {
    Rect expected = size();
    if (buffer.area() != expected)
        throw RenderError::sizeMismatch(expected, buffer.area());

    pending_.clear();
    cursorX_ = cursorY_ = -1;
    currentStyle_.reset();

    bool full = !previous_ || previous_->area() != buffer.area();
    std::vector<CellBuffer::CellUpdate> updates;
    if (full) {
        pending_ += SGR_RESET;
        pending_ += CLEAR_SCREEN;
        updates = CellBuffer().diff(buffer);
    } else {
        updates = previous_->diff(buffer);
    }

    // A wide glyph covers the cell to its right; that cell is not emitted
    int skipX = -1, skipY = -1;
    for (const auto& u : updates) {
        if (u.x == skipX && u.y == skipY) continue;
        emitCell(u.x, u.y, *u.cell);
        if (glyphWidth(u.cell->glyph()) == 2) {
            skipX = u.x + 1;
            skipY = u.y;
        }
    }
    if (currentStyle_) pending_ += SGR_RESET;

    staged_ = buffer;
    spdlog::debug("terminal draw: {} cells changed, {} bytes staged{}",
                  updates.size(), pending_.size(), full ? " (full redraw)" : "");
}

void TerminalRenderer::flush() {
    if (!pending_.empty()) {
        writeAll(pending_);
        pending_.clear();
    }
    if (staged_) {
        previous_ = std::move(staged_);
        staged_.reset();
    }
}

void TerminalRenderer::emitCell(uint16_t x, uint16_t y, const Cell& cell) {
    if (cursorX_ != x || cursorY_ != y) appendCursorMove(x, y);
    if (!currentStyle_ || !sameStyle(*currentStyle_, cell)) {
        appendSgr(cell);
        currentStyle_ = cell;
    }
    pending_ += cell.glyph();
    cursorX_ = x + glyphWidth(cell.glyph());
    cursorY_ = y;
}

void TerminalRenderer::appendCursorMove(uint16_t x, uint16_t y) {
    // Same row, moving right past a short gap: cursor-forward is shorter
    if (cursorY_ == y && cursorX_ >= 0 && x > cursorX_) {
        pending_ += "\x1b[";
        appendNumber(pending_, x - cursorX_);
        pending_ += 'C';
    } else {
        pending_ += "\x1b[";
        appendNumber(pending_, y + 1);
        pending_ += ';';
        appendNumber(pending_, x + 1);
        pending_ += 'H';
    }
    cursorX_ = x;
    cursorY_ = y;
}

void TerminalRenderer::appendSgr(const Cell& cell) {
    pending_ += "\x1b[0";
    static constexpr std::pair<Modifier, int> codes[] = {
        {Modifier::Bold, 1}, {Modifier::Dim, 2}, {Modifier::Italic, 3},
        {Modifier::Underline, 4}, {Modifier::Reversed, 7},
        {Modifier::Hidden, 8}, {Modifier::CrossedOut, 9},
    };
    for (const auto& [mod, code] : codes) {
        if (hasModifier(cell.modifiers, mod)) {
            pending_ += ';';
            appendNumber(pending_, code);
        }
    }
    appendColor(cell.fg, true);
    appendColor(cell.bg, false);
    pending_ += 'm';
}

void TerminalRenderer::appendColor(const Color& c, bool foreground) {
    if (c.isReset()) return;

    auto indexed = [&](uint8_t idx) {
        if (idx < 8) {
            pending_ += ';';
            appendNumber(pending_, (foreground ? 30 : 40) + idx);
        } else if (idx < 16) {
            pending_ += ';';
            appendNumber(pending_, (foreground ? 90 : 100) + idx - 8);
        } else {
            pending_ += foreground ? ";38;5;" : ";48;5;";
            appendNumber(pending_, idx);
        }
    };

    if (c.type == Color::Type::Indexed) {
        if (depth_ == ColorDepth::Palette16 && c.index >= 16) {
            const Palette& p = palette();
            indexed(rgbTo16(p.r[c.index], p.g[c.index], p.b[c.index]));
        } else {
            indexed(c.index);
        }
        return;
    }

    switch (depth_) {
        case ColorDepth::TrueColor:
            pending_ += foreground ? ";38;2;" : ";48;2;";
            appendNumber(pending_, c.r);
            pending_ += ';';
            appendNumber(pending_, c.g);
            pending_ += ';';
            appendNumber(pending_, c.b);
            break;
        case ColorDepth::Palette256:
            indexed(rgbTo256(c.r, c.g, c.b));
            break;
        case ColorDepth::Palette16:
            indexed(rgbTo16(c.r, c.g, c.b));
            break;
    }
}

void TerminalRenderer::writeAll(const std::string& bytes) {
    size_t off = 0;
    while (off < bytes.size()) {
        ssize_t n = ::write(opts_.outFd, bytes.data() + off, bytes.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN) {
                pollfd pfd{opts_.outFd, POLLOUT, 0};
                ::poll(&pfd, 1, 100);
                continue;
            }
            throw RenderError(RenderError::Kind::BackendIo,
                              std::string("terminal write failed: ") + std::strerror(errno));
        }
        off += static_cast<size_t>(n);
    }
    bytesWritten_ += bytes.size();
}

// ── Input ───────────────────────────────────────────────────────────

std::optional<Event> TerminalRenderer::pollEvent(std::chrono::milliseconds timeout) {
    if (auto ev = decoder_.next()) return ev;

    if (g_resized.exchange(false)) {
        invalidate();
        Rect area = size();
        spdlog::debug("terminal resized to {}x{}", area.width, area.height);
        return ResizeEvent{area.width, area.height};
    }

    return readInput(timeout);
}

std::optional<Event> TerminalRenderer::readInput(std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    auto deadline = Clock::now() + timeout;

    if (!inputIsTty_) {
        // No interactive input; just pace the caller
        if (timeout.count() > 0) std::this_thread::sleep_for(timeout);
        if (g_resized.exchange(false)) {
            invalidate();
            Rect area = size();
            return ResizeEvent{area.width, area.height};
        }
        return std::nullopt;
    }

    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        // An incomplete escape sequence only waits a short while for the rest
        if (decoder_.hasPending()) remaining = std::min(remaining, ESCAPE_TIMEOUT);
        int waitMs = static_cast<int>(std::max<int64_t>(remaining.count(), 0));

        pollfd pfd{opts_.inFd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, waitMs);
        if (rc < 0) {
            if (errno != EINTR)
                throw RenderError(RenderError::Kind::BackendIo,
                                  std::string("poll failed: ") + std::strerror(errno));
            if (g_resized.exchange(false)) {
                invalidate();
                Rect area = size();
                return ResizeEvent{area.width, area.height};
            }
            continue;
        }

        if (rc == 0) {
            if (decoder_.hasPending()) return decoder_.flushPending();
            return std::nullopt;
        }

        char buf[4096];
        ssize_t n = ::read(opts_.inFd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw RenderError(RenderError::Kind::BackendIo,
                              std::string("read failed: ") + std::strerror(errno));
        }
        if (n == 0) return std::nullopt;

        decoder_.feed(std::string_view(buf, static_cast<size_t>(n)));
        if (auto ev = decoder_.next()) return ev;
        if (Clock::now() >= deadline && !decoder_.hasPending()) return std::nullopt;
    }
}

// ── Colour conversion ───────────────────────────────────────────────

uint8_t TerminalRenderer::rgbTo256(uint8_t r, uint8_t g, uint8_t b) {
    return nearest(r, g, b, 256);
}

uint8_t TerminalRenderer::rgbTo16(uint8_t r, uint8_t g, uint8_t b) {
    return nearest(r, g, b, 16);
}
