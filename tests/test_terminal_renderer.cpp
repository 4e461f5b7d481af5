#include <gtest/gtest.h>
#include "render/TerminalRenderer.hpp"
#include <csignal>
#include <fcntl.h>
#include <unistd.h>

// Renders into /dev/null with a fixed size; assertions look at the bytes
// staged by draw() before flush() writes them.
class TerminalRendererTest : public ::testing::Test {
protected:
    int nullFd_ = -1;

    void SetUp() override {
        nullFd_ = ::open("/dev/null", O_RDWR);
        ASSERT_GE(nullFd_, 0);
    }

    void TearDown() override {
        if (nullFd_ >= 0) ::close(nullFd_);
    }

    TerminalOptions options(uint16_t w, uint16_t h,
                            ColorDepth depth = ColorDepth::Palette256) const {
        TerminalOptions opts;
        opts.inFd       = nullFd_;
        opts.outFd      = nullFd_;
        opts.fixedSize  = Rect(0, 0, w, h);
        opts.colorDepth = depth;
        return opts;
    }
};

TEST_F(TerminalRendererTest, FirstDrawIsFullRedraw) {
    TerminalRenderer r(options(3, 1));
    CellBuffer buf(r.size());
    buf.setString(0, 0, "abc");
    r.draw(buf);

    EXPECT_EQ(r.pendingOutput(), "\x1b[0m\x1b[2J\x1b[1;1H\x1b[0mabc\x1b[0m");
}

TEST_F(TerminalRendererTest, IdenticalFrameEmitsNothing) {
    TerminalRenderer r(options(10, 3));
    CellBuffer buf(r.size());
    buf.setString(2, 1, "hello", Style{}.withFg(colors::Green));

    r.draw(buf);
    r.flush();

    r.draw(buf);
    std::string second = r.pendingOutput();
    r.flush();

    r.draw(buf);
    EXPECT_EQ(r.pendingOutput(), second);
    EXPECT_TRUE(second.empty());
}

TEST_F(TerminalRendererTest, SingleChangedCell) {
    TerminalRenderer r(options(10, 3));
    CellBuffer buf(r.size());
    r.draw(buf);
    r.flush();

    buf.setString(3, 1, "x");
    r.draw(buf);
    EXPECT_EQ(r.pendingOutput(), "\x1b[2;4H\x1b[0mx\x1b[0m");
}

TEST_F(TerminalRendererTest, CursorForwardOnSameRow) {
    TerminalRenderer r(options(10, 1));
    CellBuffer buf(r.size());
    r.draw(buf);
    r.flush();

    buf.setString(1, 0, "a");
    buf.setString(4, 0, "b");
    r.draw(buf);
    EXPECT_EQ(r.pendingOutput(), "\x1b[1;2H\x1b[0ma\x1b[2Cb\x1b[0m");
}

TEST_F(TerminalRendererTest, StyleChangeEmitsSgr) {
    TerminalRenderer r(options(4, 1));
    CellBuffer buf(r.size());
    r.draw(buf);
    r.flush();

    buf.setString(0, 0, "ab", Style{}.withFg(colors::Red).add(Modifier::Bold));
    buf.setString(2, 0, "c", Style{}.withBg(colors::LightBlue));
    r.draw(buf);
    EXPECT_EQ(r.pendingOutput(), "\x1b[1;1H\x1b[0;1;31mab\x1b[0;104mc\x1b[0m");
}

TEST_F(TerminalRendererTest, RgbDowngradesWithColourDepth) {
    auto render = [&](ColorDepth depth) {
        TerminalRenderer r(options(1, 1, depth));
        CellBuffer buf(r.size());
        buf.setString(0, 0, "x", Style{}.withFg(Color::rgb(95, 135, 175)));
        r.draw(buf);
        return r.pendingOutput();
    };
    EXPECT_NE(render(ColorDepth::TrueColor).find("\x1b[0;38;2;95;135;175m"), std::string::npos);
    EXPECT_NE(render(ColorDepth::Palette256).find("\x1b[0;38;5;67m"), std::string::npos);
    EXPECT_EQ(TerminalRenderer::rgbTo16(255, 0, 0), 9);
    EXPECT_EQ(TerminalRenderer::rgbTo256(95, 135, 175), 67);
}

TEST_F(TerminalRendererTest, WideGlyphSkipsContinuationCell) {
    TerminalRenderer r(options(3, 1));
    CellBuffer buf(r.size());
    buf.setString(0, 0, "日x");
    r.draw(buf);
    EXPECT_EQ(r.pendingOutput(), "\x1b[0m\x1b[2J\x1b[1;1H\x1b[0m日x\x1b[0m");
}

TEST_F(TerminalRendererTest, InvalidateForcesFullRedraw) {
    TerminalRenderer r(options(2, 1));
    CellBuffer buf(r.size());
    r.draw(buf);
    r.flush();

    r.invalidate();
    r.draw(buf);
    EXPECT_EQ(r.pendingOutput().rfind("\x1b[0m\x1b[2J", 0), 0u);
}

TEST_F(TerminalRendererTest, WindowChangeSignalBecomesResizeAndFullRedraw) {
    TerminalRenderer r(options(6, 1));
    CellBuffer buf(r.size());
    buf.setString(0, 0, "resize");
    r.draw(buf);
    r.flush();

    r.draw(buf);
    EXPECT_TRUE(r.pendingOutput().empty());

    ASSERT_EQ(::raise(SIGWINCH), 0);
    auto ev = r.pollEvent(std::chrono::milliseconds(0));
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(*ev, Event(ResizeEvent{6, 1}));

    // The signal is consumed once
    EXPECT_FALSE(r.pollEvent(std::chrono::milliseconds(0)).has_value());

    r.draw(buf);
    EXPECT_EQ(r.pendingOutput(), "\x1b[0m\x1b[2J\x1b[1;1H\x1b[0mresize\x1b[0m");
}

TEST_F(TerminalRendererTest, UnflushedFrameIsNotPromoted) {
    TerminalRenderer r(options(4, 1));
    CellBuffer blank(r.size());
    r.draw(blank);
    r.flush();

    CellBuffer changed = blank;
    changed.setString(0, 0, "z");
    r.draw(changed);   // never flushed
    r.draw(changed);
    EXPECT_EQ(r.pendingOutput(), "\x1b[1;1H\x1b[0mz\x1b[0m");
}

TEST_F(TerminalRendererTest, SizeMismatchThrows) {
    TerminalRenderer r(options(4, 2));
    try {
        r.draw(CellBuffer(Rect(0, 0, 4, 3)));
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_EQ(e.kind(), RenderError::Kind::SizeMismatch);
    }
}

TEST_F(TerminalRendererTest, FlushWritesAndCleanupIsIdempotent) {
    TerminalRenderer r(options(4, 2));
    uint64_t afterSetup = r.bytesWritten();
    EXPECT_GT(afterSetup, 0u);

    r.draw(CellBuffer(r.size()));
    r.flush();
    EXPECT_GT(r.bytesWritten(), afterSetup);
    EXPECT_TRUE(r.pendingOutput().empty());

    r.cleanup();
    uint64_t afterCleanup = r.bytesWritten();
    r.cleanup();
    EXPECT_EQ(r.bytesWritten(), afterCleanup);
}

TEST_F(TerminalRendererTest, NonTtyInputTimesOut) {
    TerminalRenderer r(options(4, 2));
    EXPECT_FALSE(r.pollEvent(std::chrono::milliseconds(5)).has_value());
}
