#include "dashboard/DashboardRuntime.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {
constexpr long PAGE_STEP = 10;
}

DashboardRuntime::DashboardRuntime(std::unique_ptr<IRenderer> renderer, RuntimeOptions opts)
    : renderer_(std::move(renderer)), opts_(opts) {}

DashboardRuntime::~DashboardRuntime() {
    try {
        renderer_->cleanup();
    } catch (const RenderError& e) {
        spdlog::warn("Renderer cleanup failed: {}", e.what());
    }
}

// ── Loop ────────────────────────────────────────────────────────────

void DashboardRuntime::run() {
    running_ = true;
    spdlog::info("Runtime started ({} backend, tick {}ms)", renderer_->name(), opts_.tick.count());

    try {
        renderFrame();
        while (running_ && tick()) {}
    } catch (const RenderError& e) {
        spdlog::error("Renderer failure ({}): {}", toString(e.kind()), e.what());
        running_ = false;
        try {
            renderer_->cleanup();
        } catch (const RenderError& ce) {
            spdlog::warn("Cleanup after renderer failure also failed: {}", ce.what());
        }
        throw;
    }

    running_ = false;
    renderer_->cleanup();
    spdlog::info("Runtime stopped after {} frames", frames_);
}

bool DashboardRuntime::tick() {
    engine_.pollChanges();

    if (auto ev = renderer_->pollEvent(opts_.tick)) {
        spdlog::debug("Event: {}", describe(*ev));
        if (handleEvent(*ev) == Action::Quit) {
            running_ = false;
            return false;
        }
    }

    syncOverlay(ErrorOverlay::Clock::now());
    if (engine_.state().dirty) renderFrame();
    return true;
}

// ── Rendering ───────────────────────────────────────────────────────

CellBuffer DashboardRuntime::composeFrame(Rect area) {
    CellBuffer frame = engine_.render(area);
    if (overlay_ && overlay_->visible()) overlay_->render(area, frame);
    return frame;
}

void DashboardRuntime::renderFrame() {
    syncOverlay(ErrorOverlay::Clock::now());

    // size() may change between the query and draw() (a resize signal in
    // between). Rebuild once at the new size; if it moves again, leave the
    // state dirty and let the next tick draw it.
    for (int attempt = 0; attempt < 2; ++attempt) {
        Rect area = renderer_->size();
        CellBuffer frame = composeFrame(area);
        try {
            renderer_->draw(frame);
        } catch (const RenderError& e) {
            if (e.kind() != RenderError::Kind::SizeMismatch) throw;
            spdlog::debug("Frame dropped, renderer resized mid-draw: {}", e.what());
            continue;
        }
        renderer_->flush();

        engine_.state().dirty = false;
        ++frames_;
        return;
    }
    engine_.state().dirty = true;
}

// Keeps the overlay in step with state().lastError
void DashboardRuntime::syncOverlay(ErrorOverlay::Clock::time_point now) {
    const auto& err = engine_.state().lastError;
    if (!err) {
        overlay_.reset();
        return;
    }

    if (!overlay_ || overlay_->info().raisedAt != err->raisedAt ||
        overlay_->info().message != err->message) {
        overlay_.emplace(*err, now);
        overlay_->theme(engine_.theme());
        if (opts_.overlayDismiss) overlay_->autoDismissAfter(*opts_.overlayDismiss);
    }

    overlay_->update(now);
    if (!overlay_->visible()) {
        spdlog::debug("Error overlay timed out");
        overlay_.reset();
        engine_.dismissError();
    }
}

// ── Input ───────────────────────────────────────────────────────────

DashboardRuntime::Action DashboardRuntime::handleEvent(const Event& ev) {
    auto& state = engine_.state();

    if (const auto* key = std::get_if<KeyEvent>(&ev)) return handleKey(*key);

    if (const auto* mouse = std::get_if<MouseEvent>(&ev)) {
        if (mouse->kind == MouseEvent::Kind::ScrollUp)   { moveSelection(-1); return Action::Render; }
        if (mouse->kind == MouseEvent::Kind::ScrollDown) { moveSelection(1);  return Action::Render; }
        return Action::None;
    }

    if (const auto* resize = std::get_if<ResizeEvent>(&ev)) {
        spdlog::debug("Resized to {}x{}", resize->width, resize->height);
        state.dirty = true;
        return Action::Render;
    }

    if (std::holds_alternative<FocusGainedEvent>(ev) || std::holds_alternative<FocusLostEvent>(ev)) {
        state.dirty = true;
        return Action::Render;
    }

    return Action::None;
}

DashboardRuntime::Action DashboardRuntime::handleKey(const KeyEvent& key) {
    if (key.isCtrl('c')) return Action::Quit;
    if (key.isChar('q') && !key.modifiers.ctrl && !key.modifiers.alt) return Action::Quit;

    if (key.isCtrl('r')) {
        spdlog::info("Manual reload requested");
        engine_.reload();
        return Action::Render;
    }

    if (key.isCtrl('d')) {
        if (!engine_.state().lastError) return Action::None;
        engine_.dismissError();
        return Action::Render;
    }

    switch (key.code) {
        case KeyCode::Tab:      cycleFocus(1);               break;
        case KeyCode::BackTab:  cycleFocus(-1);              break;
        case KeyCode::Up:       moveSelection(-1);           break;
        case KeyCode::Down:     moveSelection(1);            break;
        case KeyCode::PageUp:   moveSelection(-PAGE_STEP);   break;
        case KeyCode::PageDown: moveSelection(PAGE_STEP);    break;
        case KeyCode::Home:     selectEdge(false);           break;
        case KeyCode::End:      selectEdge(true);            break;
        default:                return Action::None;
    }
    return Action::Render;
}

// ── List focus / selection ──────────────────────────────────────────

void DashboardRuntime::cycleFocus(int direction) {
    const Definition* def = engine_.definition();
    if (!def) return;
    auto order = def->focusOrder();
    if (order.empty()) return;

    auto& state = engine_.state();
    size_t next = direction > 0 ? 0 : order.size() - 1;
    if (state.focusedWidget) {
        auto it = std::find(order.begin(), order.end(), *state.focusedWidget);
        if (it != order.end()) {
            size_t pos = static_cast<size_t>(it - order.begin());
            next = direction > 0 ? (pos + 1) % order.size()
                                 : (pos + order.size() - 1) % order.size();
        }
    }

    state.focusedWidget = order[next];
    for (auto& [id, ui] : state.uiState) ui.focused = false;
    state.uiState[order[next]].focused = true;
    state.dirty = true;
}

WidgetUiState* DashboardRuntime::focusedList(size_t& count) {
    const Definition* def = engine_.definition();
    auto& state = engine_.state();
    if (!def || !state.focusedWidget) return nullptr;
    count = def->listSize(*state.focusedWidget);
    return &state.uiState[*state.focusedWidget];
}

void DashboardRuntime::moveSelection(long delta) {
    size_t n = 0;
    WidgetUiState* ui = focusedList(n);
    if (!ui || n == 0) return;

    long current = ui->selected ? static_cast<long>(*ui->selected)
                                : (delta > 0 ? -1 : static_cast<long>(n));
    long next = std::clamp(current + delta, 0L, static_cast<long>(n) - 1);
    ui->selected = static_cast<size_t>(next);
    engine_.state().dirty = true;
}

void DashboardRuntime::selectEdge(bool last) {
    size_t n = 0;
    WidgetUiState* ui = focusedList(n);
    if (!ui || n == 0) return;

    ui->selected = last ? n - 1 : 0;
    if (!last) ui->scroll = 0;
    engine_.state().dirty = true;
}
