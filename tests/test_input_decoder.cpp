#include <gtest/gtest.h>
#include "render/InputDecoder.hpp"
#include <vector>

static std::vector<Event> decodeAll(InputDecoder& d, std::string_view bytes) {
    d.feed(bytes);
    std::vector<Event> out;
    while (auto ev = d.next()) out.push_back(*ev);
    return out;
}

static KeyEvent onlyKey(std::string_view bytes) {
    InputDecoder d;
    auto events = decodeAll(d, bytes);
    EXPECT_EQ(events.size(), 1u) << "for input of " << bytes.size() << " bytes";
    if (events.empty() || !std::holds_alternative<KeyEvent>(events[0])) return {};
    return std::get<KeyEvent>(events[0]);
}

TEST(InputDecoderTest, PlainCharacters) {
    InputDecoder d;
    auto events = decodeAll(d, "ab");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(std::get<KeyEvent>(events[0]), KeyEvent::character('a'));
    EXPECT_EQ(std::get<KeyEvent>(events[1]), KeyEvent::character('b'));
}

TEST(InputDecoderTest, Utf8Character) {
    EXPECT_EQ(onlyKey("\xC3\xA9"), KeyEvent::character(U'é'));
    EXPECT_EQ(onlyKey("\xE2\x82\xAC"), KeyEvent::character(U'€'));
}

TEST(InputDecoderTest, SplitUtf8WaitsForRest) {
    InputDecoder d;
    EXPECT_TRUE(decodeAll(d, "\xE2\x82").empty());
    auto events = decodeAll(d, "\xAC");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<KeyEvent>(events[0]), KeyEvent::character(U'€'));
}

TEST(InputDecoderTest, ControlKeys) {
    EXPECT_EQ(onlyKey("\x03"), KeyEvent::ctrl('c'));
    EXPECT_EQ(onlyKey("\x12"), KeyEvent::ctrl('r'));
    EXPECT_EQ(onlyKey("\r").code, KeyCode::Enter);
    EXPECT_EQ(onlyKey("\t").code, KeyCode::Tab);
    EXPECT_EQ(onlyKey("\x7f").code, KeyCode::Backspace);
    EXPECT_EQ(onlyKey("\x1d"), KeyEvent::ctrl(']'));
}

TEST(InputDecoderTest, ArrowsAndNavigation) {
    EXPECT_EQ(onlyKey("\x1b[A").code, KeyCode::Up);
    EXPECT_EQ(onlyKey("\x1b[B").code, KeyCode::Down);
    EXPECT_EQ(onlyKey("\x1bOC").code, KeyCode::Right);
    EXPECT_EQ(onlyKey("\x1b[H").code, KeyCode::Home);
    EXPECT_EQ(onlyKey("\x1b[4~").code, KeyCode::End);
    EXPECT_EQ(onlyKey("\x1b[5~").code, KeyCode::PageUp);
    EXPECT_EQ(onlyKey("\x1b[6~").code, KeyCode::PageDown);
    EXPECT_EQ(onlyKey("\x1b[3~").code, KeyCode::Delete);
    EXPECT_EQ(onlyKey("\x1b[Z").code, KeyCode::BackTab);
}

TEST(InputDecoderTest, ModifiedArrow) {
    KeyEvent k = onlyKey("\x1b[1;5C");   // Ctrl+Right
    EXPECT_EQ(k.code, KeyCode::Right);
    EXPECT_TRUE(k.modifiers.ctrl);
    EXPECT_FALSE(k.modifiers.shift);

    k = onlyKey("\x1b[1;4A");            // Shift+Alt+Up
    EXPECT_TRUE(k.modifiers.shift);
    EXPECT_TRUE(k.modifiers.alt);
}

TEST(InputDecoderTest, FunctionKeys) {
    KeyEvent f1 = onlyKey("\x1bOP");
    EXPECT_EQ(f1.code, KeyCode::F);
    EXPECT_EQ(f1.fn, 1);
    EXPECT_EQ(onlyKey("\x1b[15~").fn, 5);
    EXPECT_EQ(onlyKey("\x1b[24~").fn, 12);
}

TEST(InputDecoderTest, AltPrefix) {
    KeyEvent k = onlyKey("\x1bx");
    EXPECT_TRUE(k.isChar('x'));
    EXPECT_TRUE(k.modifiers.alt);
}

TEST(InputDecoderTest, LoneEscapeNeedsFlush) {
    InputDecoder d;
    EXPECT_TRUE(decodeAll(d, "\x1b").empty());
    EXPECT_TRUE(d.hasPending());
    auto ev = d.flushPending();
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(std::get<KeyEvent>(*ev).code, KeyCode::Escape);
    EXPECT_FALSE(d.hasPending());
}

TEST(InputDecoderTest, SequenceSplitAcrossFeeds) {
    InputDecoder d;
    EXPECT_TRUE(decodeAll(d, "\x1b[1;").empty());
    auto events = decodeAll(d, "2B");
    ASSERT_EQ(events.size(), 1u);
    KeyEvent k = std::get<KeyEvent>(events[0]);
    EXPECT_EQ(k.code, KeyCode::Down);
    EXPECT_TRUE(k.modifiers.shift);
}

TEST(InputDecoderTest, SgrMouse) {
    InputDecoder d;
    auto events = decodeAll(d, "\x1b[<0;10;5M\x1b[<0;10;5m\x1b[<65;1;1M\x1b[<32;3;4M");
    ASSERT_EQ(events.size(), 4u);

    auto down = std::get<MouseEvent>(events[0]);
    EXPECT_EQ(down.kind, MouseEvent::Kind::Down);
    EXPECT_EQ(down.button, MouseEvent::Button::Left);
    EXPECT_EQ(down.x, 9);
    EXPECT_EQ(down.y, 4);

    EXPECT_EQ(std::get<MouseEvent>(events[1]).kind, MouseEvent::Kind::Up);
    EXPECT_EQ(std::get<MouseEvent>(events[2]).kind, MouseEvent::Kind::ScrollDown);
    EXPECT_EQ(std::get<MouseEvent>(events[3]).kind, MouseEvent::Kind::Drag);
}

TEST(InputDecoderTest, FocusReports) {
    InputDecoder d;
    auto events = decodeAll(d, "\x1b[I\x1b[O");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<FocusGainedEvent>(events[0]));
    EXPECT_TRUE(std::holds_alternative<FocusLostEvent>(events[1]));
}

TEST(InputDecoderTest, BracketedPaste) {
    InputDecoder d;
    auto events = decodeAll(d, "\x1b[200~hello\nworld\x1b[201~q");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(std::get<PasteEvent>(events[0]).text, "hello\nworld");
    EXPECT_TRUE(std::get<KeyEvent>(events[1]).isChar('q'));
}

TEST(InputDecoderTest, PasteSplitAcrossFeeds) {
    InputDecoder d;
    EXPECT_TRUE(decodeAll(d, "\x1b[200~abc\x1b[20").empty());
    auto events = decodeAll(d, "1~");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<PasteEvent>(events[0]).text, "abc");
}

TEST(InputDecoderTest, UnknownSequenceIsSkipped) {
    InputDecoder d;
    auto events = decodeAll(d, "\x1b[99~z");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(std::get<KeyEvent>(events[0]).isChar('z'));
}
