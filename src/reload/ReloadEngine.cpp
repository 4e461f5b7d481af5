#include "reload/ReloadEngine.hpp"
#include "dashboard/DefinitionParser.hpp"
#include "widgets/Block.hpp"
#include "widgets/Paragraph.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace fs = std::filesystem;

ReloadEngine::ReloadEngine() = default;
ReloadEngine::~ReloadEngine() = default;

const char* toString(ReloadEngine::Status s) {
    switch (s) {
        case ReloadEngine::Status::Idle:    return "idle";
        case ReloadEngine::Status::Loading: return "loading";
        case ReloadEngine::Status::Ready:   return "ready";
        case ReloadEngine::Status::Failed:  return "failed";
    }
    return "unknown";
}

// ── Loading ─────────────────────────────────────────────────────────

bool ReloadEngine::load(const fs::path& entry) {
    entry_  = FileLoader::normalize(entry);
    status_ = Status::Loading;
    spdlog::debug("Loading dashboard {}", entry_.string());

    try {
        auto files = loader_.loadTree(entry_);
        auto def   = std::make_unique<Definition>(DefinitionParser::compile(files));

        // Nothing below throws a LoadError; the swap is all-or-nothing
        std::vector<fs::path> order;
        std::set<fs::path>    reached;
        for (const auto& f : files) {
            order.push_back(f->path);
            reached.insert(f->path);
        }

        applyState(*def);
        definitionTheme_.reset();
        if (def->theme) definitionTheme_ = Theme::preset(*def->theme);
        definition_    = std::move(def);
        lastLoadOrder_ = std::move(order);
        status_        = Status::Ready;
        state_.loaded  = true;
        state_.dirty   = true;
        state_.lastError.reset();
        ++reloadCount_;

        updateWatches(reached);
        spdlog::info("Dashboard ready: {} ({} files, {} panels)",
                     entry_.filename().string(), lastLoadOrder_.size(),
                     definition_->panels.size());
        return true;
    } catch (const LoadError& e) {
        spdlog::warn("Dashboard load failed: {}", e.what());
        fail(ErrorInfo::fromLoadError(e));
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error loading {}: {}", entry_.string(), e.what());
        fail(ErrorInfo::fromException(e));
    }

    // Watch whatever the attempt reached so fixing any of it retries
    std::set<fs::path> reached;
    reached.insert(entry_);
    for (const auto& dep : loader_.graph().transitiveDependencies(entry_)) {
        std::error_code ec;
        if (fs::exists(dep, ec)) reached.insert(dep);
    }
    updateWatches(reached);
    return false;
}

bool ReloadEngine::reload() {
    if (entry_.empty()) {
        spdlog::warn("Reload requested with no dashboard loaded");
        ErrorInfo info;
        info.title    = "Nothing to Reload";
        info.message  = "No dashboard file has been loaded yet";
        info.severity = Severity::Info;
        state_.lastError = std::move(info);
        state_.dirty     = true;
        return false;
    }

    // Forced reload: re-read every file even if mtime/size look unchanged
    for (const auto& p : dependencies_) loader_.invalidate(p);
    loader_.invalidate(entry_);
    return load(entry_);
}

void ReloadEngine::fail(ErrorInfo info) {
    status_          = Status::Failed;
    state_.lastError = std::move(info);
    state_.dirty     = true;
}

// Defaults fill absent keys, resets overwrite; keys the new definition no
// longer mentions are kept.
void ReloadEngine::applyState(const Definition& def) {
    for (const auto& [key, value] : def.stateDefaults)
        state_.userState.try_emplace(key, value);
    for (const auto& [key, value] : def.stateResets)
        state_.userState[key] = value;

    auto order = def.focusOrder();
    for (const auto& id : order) {
        WidgetUiState& ui = state_.uiState[id];
        size_t n = def.listSize(id);
        if (n == 0) {
            ui.selected.reset();
            ui.scroll = 0;
        } else {
            if (!ui.selected) ui.selected = 0;
            else if (*ui.selected >= n) ui.selected = n - 1;
            if (ui.scroll >= n) ui.scroll = n - 1;
        }
    }

    if (state_.focusedWidget &&
        std::find(order.begin(), order.end(), *state_.focusedWidget) == order.end())
        state_.focusedWidget.reset();
    if (!state_.focusedWidget && !order.empty())
        state_.focusedWidget = order.front();

    for (auto& [id, ui] : state_.uiState)
        ui.focused = state_.focusedWidget && *state_.focusedWidget == id;
}

// ── Hot reload ──────────────────────────────────────────────────────

void ReloadEngine::updateWatches(const std::set<fs::path>& files) {
    if (watcher_) {
        for (const auto& old : dependencies_)
            if (!files.count(old)) watcher_->unwatch(old);
        for (const auto& f : files) {
            try {
                watcher_->watch(f);
            } catch (const WatchError& e) {
                spdlog::warn("Cannot watch {}: {}", f.string(), e.what());
            }
        }
    }
    dependencies_ = files;
}

void ReloadEngine::enableHotReload(std::chrono::milliseconds debounce, bool forcePolling) {
    FileWatcher::Options opts;
    opts.debounce     = debounce;
    opts.forcePolling = forcePolling;
    watcher_ = std::make_unique<FileWatcher>(opts);

    auto current = dependencies_;
    dependencies_.clear();
    updateWatches(current);
    spdlog::info("Hot reload enabled ({}, debounce {}ms, {} files)",
                 watcher_->usingInotify() ? "inotify" : "polling",
                 debounce.count(), watcher_->watchCount());
}

void ReloadEngine::disableHotReload() {
    if (!watcher_) return;
    watcher_.reset();
    spdlog::info("Hot reload disabled");
}

std::optional<std::set<fs::path>> ReloadEngine::pollChanges() {
    if (!watcher_) return std::nullopt;
    auto changed = watcher_->pollChanges();
    if (!changed) return std::nullopt;

    bool relevant = false;
    for (const auto& p : *changed) {
        if (dependencies_.count(p) || p == entry_) {
            relevant = true;
            loader_.invalidate(p);
            spdlog::info("Changed: {}", p.string());
        }
    }
    if (relevant) load(entry_);
    return changed;
}

void ReloadEngine::setTheme(Theme theme) {
    spdlog::info("Theme: {}", theme.name());
    theme_       = std::move(theme);
    state_.dirty = true;
}

void ReloadEngine::dismissError() {
    if (!state_.lastError) return;
    state_.lastError.reset();
    state_.dirty = true;
}

// ── Rendering ───────────────────────────────────────────────────────

CellBuffer ReloadEngine::render(Rect area) const {
    CellBuffer buf(area);
    if (definition_) {
        definition_->render(area, buf, state_, theme());
        return buf;
    }

    const Theme& t = theme();
    Block block;
    std::string text;
    Style textStyle = t.style("text");
    if (entry_.empty()) {
        block.borderType(BorderType::Double)
             .borderStyle(t.primaryStyle())
             .title(" tuidash ")
             .titleStyle(t.primaryStyle().add(Modifier::Bold));
        text = "No dashboard loaded.\n\n"
               "Pass a definition file (.fsx) to load it.\n\n"
               "Press Ctrl+C to quit";
        textStyle.add(Modifier::Dim);
    } else {
        block.borderType(BorderType::Rounded)
             .borderStyle(t.style("border"))
             .title(" tuidash ")
             .titleStyle(t.style("border").add(Modifier::Bold));
        text = "Dashboard: " + entry_.string() + "\n\n"
               "Hot reload: " + std::string(watcher_ ? "enabled" : "disabled") + "\n\n"
               "Waiting for a successful load...\n\n"
               "Press Ctrl+R to reload, Ctrl+C to quit";
    }
    block.borders(Borders::All);
    block.render(area, buf);
    Paragraph(text).style(textStyle).wrap(true).render(block.inner(area), buf);
    return buf;
}
