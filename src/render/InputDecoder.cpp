#include "render/InputDecoder.hpp"
#include <algorithm>
#include <charconv>
#include <vector>

namespace {

constexpr char   ESC            = '\x1b';
constexpr size_t MAX_CSI_LENGTH = 64;
constexpr std::string_view PASTE_END = "\x1b[201~";

std::vector<int> splitParams(std::string_view params) {
    std::vector<int> out;
    size_t pos = 0;
    while (pos <= params.size()) {
        size_t end = params.find(';', pos);
        if (end == std::string_view::npos) end = params.size();
        int value = 0;
        std::from_chars(params.data() + pos, params.data() + end, value);
        out.push_back(value);
        pos = end + 1;
    }
    return out;
}

// xterm encodes modifiers as 1 + (shift | alt<<1 | ctrl<<2)
KeyModifiers modifiersFromParam(int param) {
    KeyModifiers m;
    if (param <= 1) return m;
    int bits = param - 1;
    m.shift = bits & 1;
    m.alt   = bits & 2;
    m.ctrl  = bits & 4;
    return m;
}

std::optional<KeyEvent> tildeKey(int code, KeyModifiers m) {
    switch (code) {
        case 1: case 7: return KeyEvent::key(KeyCode::Home, m);
        case 4: case 8: return KeyEvent::key(KeyCode::End, m);
        case 2:  return KeyEvent::key(KeyCode::Insert, m);
        case 3:  return KeyEvent::key(KeyCode::Delete, m);
        case 5:  return KeyEvent::key(KeyCode::PageUp, m);
        case 6:  return KeyEvent::key(KeyCode::PageDown, m);
        default: break;
    }
    // F1..F12 have gaps in their numbering
    static constexpr int fnCodes[] = {11, 12, 13, 14, 15, 17, 18, 19, 20, 21, 23, 24};
    for (int i = 0; i < 12; ++i) {
        if (fnCodes[i] == code) return KeyEvent{KeyCode::F, 0, static_cast<uint8_t>(i + 1), m};
    }
    return std::nullopt;
}

std::optional<KeyEvent> letterKey(char final, KeyModifiers m) {
    switch (final) {
        case 'A': return KeyEvent::key(KeyCode::Up, m);
        case 'B': return KeyEvent::key(KeyCode::Down, m);
        case 'C': return KeyEvent::key(KeyCode::Right, m);
        case 'D': return KeyEvent::key(KeyCode::Left, m);
        case 'H': return KeyEvent::key(KeyCode::Home, m);
        case 'F': return KeyEvent::key(KeyCode::End, m);
        case 'P': return KeyEvent{KeyCode::F, 0, 1, m};
        case 'Q': return KeyEvent{KeyCode::F, 0, 2, m};
        case 'R': return KeyEvent{KeyCode::F, 0, 3, m};
        case 'S': return KeyEvent{KeyCode::F, 0, 4, m};
        default:  return std::nullopt;
    }
}

std::optional<KeyEvent> controlKey(unsigned char c) {
    switch (c) {
        case '\r': case '\n': return KeyEvent::key(KeyCode::Enter);
        case '\t':            return KeyEvent::key(KeyCode::Tab);
        case 0x7f: case 0x08: return KeyEvent::key(KeyCode::Backspace);
        case 0x00:            return KeyEvent::ctrl(' ');
        default: break;
    }
    if (c >= 0x01 && c <= 0x1a) return KeyEvent::ctrl(static_cast<char>('a' + c - 1));
    if (c >= 0x1c && c <= 0x1f) return KeyEvent::ctrl(static_cast<char>(c + 0x40));
    return std::nullopt;
}

MouseEvent sgrMouse(const std::vector<int>& p, bool release) {
    MouseEvent ev;
    int b = p.size() > 0 ? p[0] : 0;
    ev.x = static_cast<uint16_t>(p.size() > 1 && p[1] > 0 ? p[1] - 1 : 0);
    ev.y = static_cast<uint16_t>(p.size() > 2 && p[2] > 0 ? p[2] - 1 : 0);
    ev.modifiers.shift = b & 4;
    ev.modifiers.alt   = b & 8;
    ev.modifiers.ctrl  = b & 16;

    int base = b & 3;
    static constexpr MouseEvent::Button buttons[] = {
        MouseEvent::Button::Left, MouseEvent::Button::Middle,
        MouseEvent::Button::Right, MouseEvent::Button::None};

    if (b & 64) {
        ev.kind = base == 0 ? MouseEvent::Kind::ScrollUp : MouseEvent::Kind::ScrollDown;
    } else if (release) {
        ev.kind   = MouseEvent::Kind::Up;
        ev.button = buttons[base];
    } else if (b & 32) {
        ev.kind   = base == 3 ? MouseEvent::Kind::Moved : MouseEvent::Kind::Drag;
        ev.button = buttons[base];
    } else {
        ev.kind   = MouseEvent::Kind::Down;
        ev.button = buttons[base];
    }
    return ev;
}

} // namespace

std::optional<Event> InputDecoder::next() {
    while (!pending_.empty() || inPaste_) {
        if (inPaste_) return takePaste();

        unsigned char c = static_cast<unsigned char>(pending_[0]);
        Event ev;
        size_t consumed = 1;
        Result r = Result::Event;

        if (c == ESC) {
            r = decodeEscape(ev, consumed);
        } else if (auto key = controlKey(c)) {
            ev = *key;
        } else {
            char32_t cp = 0;
            r = decodeUtf8(0, cp, consumed);
            if (r == Result::Event) ev = KeyEvent::character(cp);
        }

        if (r == Result::Incomplete) return std::nullopt;
        pending_.erase(0, consumed);
        if (r == Result::Event) return ev;
    }
    return std::nullopt;
}

std::optional<Event> InputDecoder::flushPending() {
    if (inPaste_) {
        // Unterminated paste: deliver what arrived
        paste_ += pending_;
        pending_.clear();
        inPaste_ = false;
        return PasteEvent{std::move(paste_)};
    }
    if (pending_.empty()) return std::nullopt;
    bool loneEscape = pending_.size() == 1 && pending_[0] == ESC;
    pending_.clear();
    if (loneEscape) return KeyEvent::key(KeyCode::Escape);
    return std::nullopt;
}

InputDecoder::Result InputDecoder::decodeEscape(Event& out, size_t& consumed) {
    if (pending_.size() < 2) return Result::Incomplete;

    char second = pending_[1];
    if (second == '[') return decodeCsi(2, out, consumed);
    if (second == 'O') return decodeSs3(out, consumed);
    if (second == ESC) {
        out = KeyEvent::key(KeyCode::Escape);
        consumed = 1;
        return Result::Event;
    }

    // ESC + key = Alt+key
    unsigned char c = static_cast<unsigned char>(second);
    if (auto key = controlKey(c)) {
        key->modifiers.alt = true;
        out = *key;
        consumed = 2;
        return Result::Event;
    }
    char32_t cp = 0;
    size_t len = 0;
    Result r = decodeUtf8(1, cp, len);
    if (r != Result::Event) {
        consumed = 1 + len;
        return r;
    }
    out = KeyEvent::character(cp, {false, false, true});
    consumed = 1 + len;
    return Result::Event;
}

InputDecoder::Result InputDecoder::decodeCsi(size_t start, Event& out, size_t& consumed) {
    size_t i = start;
    while (i < pending_.size()) {
        unsigned char c = static_cast<unsigned char>(pending_[i]);
        if (c >= 0x40 && c <= 0x7e) break;
        if (c < 0x20 || c > 0x3f) {
            // Not a parameter byte: malformed, drop what we have
            consumed = i;
            return Result::Skip;
        }
        if (i - start > MAX_CSI_LENGTH) {
            consumed = i;
            return Result::Skip;
        }
        ++i;
    }
    if (i >= pending_.size()) return Result::Incomplete;

    std::string_view params(pending_.data() + start, i - start);
    char final = pending_[i];
    consumed = i + 1;

    if (!params.empty() && params[0] == '<') {
        if (final != 'M' && final != 'm') return Result::Skip;
        out = sgrMouse(splitParams(params.substr(1)), final == 'm');
        return Result::Event;
    }

    auto p = splitParams(params);
    KeyModifiers mods = modifiersFromParam(p.size() > 1 ? p[1] : 0);

    switch (final) {
        case 'I': out = FocusGainedEvent{}; return Result::Event;
        case 'O': out = FocusLostEvent{};   return Result::Event;
        case 'Z': {
            KeyModifiers m = mods;
            m.shift = true;
            out = KeyEvent::key(KeyCode::BackTab, m);
            return Result::Event;
        }
        case '~': {
            int code = p.empty() ? 0 : p[0];
            if (code == 200) {
                inPaste_ = true;
                paste_.clear();
                return Result::Skip;
            }
            if (auto key = tildeKey(code, mods)) {
                out = *key;
                return Result::Event;
            }
            return Result::Skip;
        }
        default:
            if (auto key = letterKey(final, mods)) {
                out = *key;
                return Result::Event;
            }
            return Result::Skip;
    }
}

InputDecoder::Result InputDecoder::decodeSs3(Event& out, size_t& consumed) {
    if (pending_.size() < 3) return Result::Incomplete;
    consumed = 3;
    if (auto key = letterKey(pending_[2], {})) {
        out = *key;
        return Result::Event;
    }
    return Result::Skip;
}

InputDecoder::Result InputDecoder::decodeUtf8(size_t start, char32_t& cp, size_t& len) const {
    unsigned char lead = static_cast<unsigned char>(pending_[start]);
    size_t need;
    if (lead < 0x80)                { cp = lead;        need = 1; }
    else if ((lead & 0xE0) == 0xC0) { cp = lead & 0x1F; need = 2; }
    else if ((lead & 0xF0) == 0xE0) { cp = lead & 0x0F; need = 3; }
    else if ((lead & 0xF8) == 0xF0) { cp = lead & 0x07; need = 4; }
    else { len = 1; return Result::Skip; }

    if (pending_.size() - start < need) return Result::Incomplete;
    for (size_t k = 1; k < need; ++k) {
        unsigned char c = static_cast<unsigned char>(pending_[start + k]);
        if ((c & 0xC0) != 0x80) { len = k; return Result::Skip; }
        cp = (cp << 6) | (c & 0x3F);
    }
    len = need;
    return Result::Event;
}

std::optional<Event> InputDecoder::takePaste() {
    size_t end = pending_.find(PASTE_END);
    if (end == std::string::npos) {
        // Hold back a possible partial terminator
        size_t keep = std::min(pending_.size(), PASTE_END.size() - 1);
        paste_.append(pending_, 0, pending_.size() - keep);
        pending_.erase(0, pending_.size() - keep);
        return std::nullopt;
    }
    paste_.append(pending_, 0, end);
    pending_.erase(0, end + PASTE_END.size());
    inPaste_ = false;
    return PasteEvent{std::move(paste_)};
}
