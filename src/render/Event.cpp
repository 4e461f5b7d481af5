#include "render/Event.hpp"
#include "render/RenderError.hpp"
#include <sstream>

namespace {

const char* keyName(KeyCode code) {
    switch (code) {
        case KeyCode::Char:      return "Char";
        case KeyCode::Enter:     return "Enter";
        case KeyCode::Escape:    return "Esc";
        case KeyCode::Backspace: return "Backspace";
        case KeyCode::Tab:       return "Tab";
        case KeyCode::BackTab:   return "BackTab";
        case KeyCode::Up:        return "Up";
        case KeyCode::Down:      return "Down";
        case KeyCode::Left:      return "Left";
        case KeyCode::Right:     return "Right";
        case KeyCode::Home:      return "Home";
        case KeyCode::End:       return "End";
        case KeyCode::PageUp:    return "PageUp";
        case KeyCode::PageDown:  return "PageDown";
        case KeyCode::Insert:    return "Insert";
        case KeyCode::Delete:    return "Delete";
        case KeyCode::F:         return "F";
    }
    return "?";
}

void appendModifiers(std::ostringstream& out, const KeyModifiers& m) {
    if (m.ctrl)  out << "Ctrl+";
    if (m.alt)   out << "Alt+";
    if (m.shift) out << "Shift+";
}

} // namespace

std::string describe(const Event& ev) {
    std::ostringstream out;
    if (auto* k = std::get_if<KeyEvent>(&ev)) {
        out << "key ";
        appendModifiers(out, k->modifiers);
        if (k->code == KeyCode::Char) {
            if (k->ch < 0x80) out << "'" << static_cast<char>(k->ch) << "'";
            else              out << "U+" << std::hex << static_cast<uint32_t>(k->ch);
        } else if (k->code == KeyCode::F) {
            out << "F" << int(k->fn);
        } else {
            out << keyName(k->code);
        }
    } else if (auto* m = std::get_if<MouseEvent>(&ev)) {
        out << "mouse kind=" << int(m->kind) << " at " << m->x << "," << m->y;
    } else if (auto* r = std::get_if<ResizeEvent>(&ev)) {
        out << "resize " << r->width << "x" << r->height;
    } else if (std::holds_alternative<FocusGainedEvent>(ev)) {
        out << "focus gained";
    } else if (std::holds_alternative<FocusLostEvent>(ev)) {
        out << "focus lost";
    } else if (auto* p = std::get_if<PasteEvent>(&ev)) {
        out << "paste (" << p->text.size() << " bytes)";
    }
    return out.str();
}

const char* toString(RenderError::Kind kind) {
    switch (kind) {
        case RenderError::Kind::SizeMismatch:   return "SizeMismatch";
        case RenderError::Kind::FrameTooLarge:  return "FrameTooLarge";
        case RenderError::Kind::ConnectionLost: return "ConnectionLost";
        case RenderError::Kind::BackendIo:      return "BackendIo";
    }
    return "Unknown";
}
