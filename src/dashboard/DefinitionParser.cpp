#include "dashboard/DefinitionParser.hpp"
#include <spdlog/spdlog.h>
#include <set>

namespace fs = std::filesystem;

namespace {

// Reads one statement line left to right, remembering columns for errors.
class LineCursor {
public:
    LineCursor(std::string_view line, int lineNo, const fs::path& path)
        : line_(line), lineNo_(lineNo), path_(path) {}

    void skipSpace() {
        while (pos_ < line_.size() && (line_[pos_] == ' ' || line_[pos_] == '\t')) ++pos_;
    }
    bool atEnd() { skipSpace(); return pos_ >= line_.size(); }
    bool peekQuote() { skipSpace(); return pos_ < line_.size() && line_[pos_] == '"'; }
    int column() const { return static_cast<int>(pos_) + 1; }

    std::string word(const char* what) {
        skipSpace();
        if (pos_ >= line_.size()) fail("expected " + std::string(what));
        if (line_[pos_] == '"') fail("expected " + std::string(what) + ", found a string");
        size_t start = pos_;
        while (pos_ < line_.size() && line_[pos_] != ' ' && line_[pos_] != '\t') ++pos_;
        return std::string(line_.substr(start, pos_ - start));
    }

    std::string quoted(const char* what) {
        skipSpace();
        if (pos_ >= line_.size() || line_[pos_] != '"')
            fail("expected quoted " + std::string(what));
        int openCol = column();
        ++pos_;
        std::string out;
        while (pos_ < line_.size()) {
            char c = line_[pos_++];
            if (c == '"') return out;
            if (c == '\\' && pos_ < line_.size()) {
                char e = line_[pos_++];
                switch (e) {
                    case 'n':  out += '\n'; break;
                    case 't':  out += '\t'; break;
                    case '"':  out += '"';  break;
                    case '\\': out += '\\'; break;
                    default:   out += '\\'; out += e; break;
                }
                continue;
            }
            out += c;
        }
        throw LoadError::parseError(path_, lineNo_, openCol, "unterminated string");
    }

    // Remainder of the line, trimmed; column of its first character.
    std::string_view rest(int& col) {
        skipSpace();
        col = column();
        std::string_view r = line_.substr(pos_);
        while (!r.empty() && (r.back() == ' ' || r.back() == '\t')) r.remove_suffix(1);
        pos_ = line_.size();
        return r;
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw LoadError::parseError(path_, lineNo_, column(), message);
    }
    [[noreturn]] void failAt(int col, const std::string& message) const {
        throw LoadError::parseError(path_, lineNo_, col, message);
    }

private:
    std::string_view line_;
    size_t           pos_ = 0;
    int              lineNo_;
    const fs::path&  path_;
};

Style parseAttributes(LineCursor& cur) {
    Style style;
    while (!cur.atEnd()) {
        int col = cur.column();
        std::string attr = cur.word("attribute");

        if (attr.rfind("fg=", 0) == 0 || attr.rfind("bg=", 0) == 0) {
            auto color = Color::parse(std::string_view(attr).substr(3));
            if (!color) cur.failAt(col + 3, "unknown colour '" + attr.substr(3) + "'");
            if (attr[0] == 'f') style.withFg(*color);
            else                style.withBg(*color);
        } else if (auto mod = parseModifier(attr)) {
            style.add(*mod);
        } else {
            cur.failAt(col, "unknown attribute '" + attr + "'");
        }
    }
    return style;
}

nlohmann::json parseJsonValue(LineCursor& cur, const std::string& key) {
    int col = 0;
    std::string_view raw = cur.rest(col);
    if (raw.empty()) cur.failAt(col, "missing value for '" + key + "'");
    try {
        return nlohmann::json::parse(raw);
    } catch (const nlohmann::json::parse_error& e) {
        int offset = e.byte > 0 ? static_cast<int>(e.byte) - 1 : 0;
        cur.failAt(col + offset, "invalid JSON value for '" + key + "'");
    }
}

class FileParser {
public:
    FileParser(Definition& def, const fs::path& path) : def_(def), path_(path) {
        for (const auto& id : def_.focusOrder()) listIds_.insert(id);
    }

    void parse(std::string_view source) {
        int lineNo = 0;
        size_t pos = 0;
        while (pos <= source.size()) {
            size_t end = source.find('\n', pos);
            if (end == std::string_view::npos) end = source.size();
            std::string_view line = source.substr(pos, end - pos);
            pos = end + 1;
            ++lineNo;
            if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
            statement(line, lineNo);
        }
    }

private:
    PanelDef& currentPanel() {
        if (!current_) {
            // Content before the first panel goes to "main"
            for (size_t i = 0; i < def_.panels.size(); ++i)
                if (def_.panels[i].id == "main") current_ = i;
            if (!current_) {
                PanelDef main;
                main.id = "main";
                def_.panels.push_back(main);
                current_ = def_.panels.size() - 1;
            }
        }
        return def_.panels[*current_];
    }

    void statement(std::string_view line, int lineNo) {
        LineCursor cur(line, lineNo, path_);
        if (cur.atEnd()) return;
        std::string_view trimmed = line.substr(line.find_first_not_of(" \t"));
        if (trimmed.rfind("//", 0) == 0) return;
        if (trimmed.rfind("#load", 0) == 0) return;   // resolved by FileLoader

        int kwCol = cur.column();
        std::string kw = cur.word("statement");

        if (kw == "title") {
            def_.title = cur.quoted("title");
            def_.titleStyle = parseAttributes(cur);
        } else if (kw == "border") {
            int col = cur.column();
            std::string name = cur.word("border type");
            if (name == "none") {
                def_.border.reset();
            } else {
                auto type = parseBorderType(name);
                if (!type) cur.failAt(col, "unknown border type '" + name + "'");
                def_.border = *type;
            }
            expectEnd(cur);
        } else if (kw == "layout") {
            int col = cur.column();
            std::string dir = cur.word("layout direction");
            if (dir == "vertical")        def_.layout = Direction::Vertical;
            else if (dir == "horizontal") def_.layout = Direction::Horizontal;
            else cur.failAt(col, "unknown layout '" + dir + "'");
            expectEnd(cur);
        } else if (kw == "theme") {
            int col = cur.column();
            std::string name = cur.word("theme name");
            if (!Theme::preset(name)) cur.failAt(col, "unknown theme '" + name + "'");
            def_.theme = name;
            expectEnd(cur);
        } else if (kw == "state" || kw == "reset") {
            std::string key = cur.word("state key");
            auto value = parseJsonValue(cur, key);
            (kw == "state" ? def_.stateDefaults : def_.stateResets)[key] = std::move(value);
        } else if (kw == "panel") {
            panel(cur);
        } else if (kw == "text") {
            Element e;
            e.kind  = Element::Kind::Text;
            e.line  = lineNo;
            e.text  = cur.quoted("text");
            e.style = parseAttributes(cur);
            currentPanel().elements.push_back(std::move(e));
        } else if (kw == "list") {
            Element e;
            e.kind = Element::Kind::List;
            e.line = lineNo;
            int col = cur.column();
            e.id = cur.word("list id");
            if (!listIds_.insert(e.id).second) cur.failAt(col, "duplicate list id '" + e.id + "'");
            while (cur.peekQuote()) e.items.push_back(cur.quoted("item"));
            e.style = parseAttributes(cur);
            currentPanel().elements.push_back(std::move(e));
        } else if (kw == "gauge") {
            Element e;
            e.kind = Element::Kind::Gauge;
            e.line = lineNo;
            e.id   = cur.word("state key");
            if (cur.peekQuote()) e.text = cur.quoted("label");
            e.style = parseAttributes(cur);
            currentPanel().elements.push_back(std::move(e));
        } else {
            cur.failAt(kwCol, "unknown statement '" + kw + "'");
        }
    }

    void panel(LineCursor& cur) {
        PanelDef p;
        int idCol = cur.column();
        p.id = cur.word("panel id");
        for (const auto& existing : def_.panels)
            if (existing.id == p.id) cur.failAt(idCol, "duplicate panel id '" + p.id + "'");

        int col = cur.column();
        std::string sizeText = cur.word("panel size");
        auto constraint = Constraint::parse(sizeText);
        if (!constraint) cur.failAt(col, "invalid panel size '" + sizeText + "'");
        p.constraint = *constraint;

        if (cur.peekQuote()) p.title = cur.quoted("panel title");
        p.style = parseAttributes(cur);

        def_.panels.push_back(std::move(p));
        current_ = def_.panels.size() - 1;
    }

    static void expectEnd(LineCursor& cur) {
        if (!cur.atEnd()) cur.fail("unexpected trailing input");
    }

    Definition&           def_;
    const fs::path&       path_;
    std::optional<size_t> current_;
    std::set<std::string> listIds_;
};

} // namespace

void DefinitionParser::parseInto(Definition& def, std::string_view source, const fs::path& path) {
    FileParser(def, path).parse(source);
    def.sources.push_back(path);
}

Definition DefinitionParser::parse(std::string_view source, const fs::path& path) {
    Definition def;
    parseInto(def, source, path);
    return def;
}

Definition DefinitionParser::compile(const std::vector<std::shared_ptr<const LoadedFile>>& files) {
    Definition def;
    for (const auto& f : files) parseInto(def, f->content, f->path);
    spdlog::debug("Compiled definition: {} panels from {} files", def.panels.size(), files.size());
    return def;
}
