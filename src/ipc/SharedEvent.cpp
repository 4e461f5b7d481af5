#include "ipc/SharedEvent.hpp"
#include <algorithm>
#include <cstring>

namespace {

uint8_t packModifiers(const KeyModifiers& m) {
    return static_cast<uint8_t>((m.shift ? 1 : 0) | (m.ctrl ? 2 : 0) | (m.alt ? 4 : 0));
}

KeyModifiers unpackModifiers(uint8_t bits) {
    return {(bits & 1) != 0, (bits & 2) != 0, (bits & 4) != 0};
}

} // namespace

std::vector<SharedEventRecord> encodeEvent(const Event& ev) {
    std::vector<SharedEventRecord> out;
    SharedEventRecord rec;

    if (auto* k = std::get_if<KeyEvent>(&ev)) {
        rec.type      = SharedEventRecord::Key;
        rec.code      = static_cast<uint8_t>(k->code);
        rec.aux       = k->fn;
        rec.modifiers = packModifiers(k->modifiers);
        rec.ch        = static_cast<uint32_t>(k->ch);
    } else if (auto* m = std::get_if<MouseEvent>(&ev)) {
        rec.type      = SharedEventRecord::Mouse;
        rec.code      = static_cast<uint8_t>(m->kind);
        rec.aux       = static_cast<uint8_t>(m->button);
        rec.modifiers = packModifiers(m->modifiers);
        rec.x         = m->x;
        rec.y         = m->y;
    } else if (auto* r = std::get_if<ResizeEvent>(&ev)) {
        rec.type = SharedEventRecord::Resize;
        rec.x    = r->width;
        rec.y    = r->height;
    } else if (std::holds_alternative<FocusGainedEvent>(ev)) {
        rec.type = SharedEventRecord::FocusGained;
    } else if (std::holds_alternative<FocusLostEvent>(ev)) {
        rec.type = SharedEventRecord::FocusLost;
    } else if (auto* p = std::get_if<PasteEvent>(&ev)) {
        const std::string& text = p->text;
        size_t off = 0;
        do {
            SharedEventRecord chunk;
            chunk.type = SharedEventRecord::Paste;
            size_t n = std::min(text.size() - off, SharedEventRecord::TEXT_BYTES);
            std::memcpy(chunk.text, text.data() + off, n);
            chunk.textLength = static_cast<uint16_t>(n);
            off += n;
            if (off < text.size()) chunk.flags = SharedEventRecord::MoreFollows;
            out.push_back(chunk);
        } while (off < text.size());
        return out;
    }

    out.push_back(rec);
    return out;
}

std::optional<Event> SharedEventAssembler::push(const SharedEventRecord& rec) {
    switch (rec.type) {
        case SharedEventRecord::Key: {
            KeyEvent k;
            k.code      = static_cast<KeyCode>(rec.code);
            k.ch        = static_cast<char32_t>(rec.ch);
            k.fn        = rec.aux;
            k.modifiers = unpackModifiers(rec.modifiers);
            return k;
        }
        case SharedEventRecord::Mouse: {
            MouseEvent m;
            m.kind      = static_cast<MouseEvent::Kind>(rec.code);
            m.button    = static_cast<MouseEvent::Button>(rec.aux);
            m.modifiers = unpackModifiers(rec.modifiers);
            m.x         = rec.x;
            m.y         = rec.y;
            return m;
        }
        case SharedEventRecord::Resize:
            return ResizeEvent{rec.x, rec.y};
        case SharedEventRecord::FocusGained:
            return FocusGainedEvent{};
        case SharedEventRecord::FocusLost:
            return FocusLostEvent{};
        case SharedEventRecord::Paste: {
            size_t n = std::min<size_t>(rec.textLength, SharedEventRecord::TEXT_BYTES);
            pasteBuffer_.append(rec.text, n);
            if (rec.flags & SharedEventRecord::MoreFollows) return std::nullopt;
            PasteEvent p{std::move(pasteBuffer_)};
            pasteBuffer_.clear();
            return p;
        }
        default:
            return std::nullopt;
    }
}
