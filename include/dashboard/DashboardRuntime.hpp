#pragma once
#include "ErrorOverlay.hpp"
#include "reload/ReloadEngine.hpp"
#include "render/IRenderer.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

struct RuntimeOptions {
    std::chrono::milliseconds                tick{50};        // pollEvent timeout
    std::optional<std::chrono::milliseconds> overlayDismiss;  // auto-hide errors
};

// Outer driver loop. Owns the renderer and the reload engine; each tick
// checks for file changes, handles at most one input event and redraws
// when the dashboard state is dirty.
//
// Single-threaded except for stop(), which may be called from a signal
// handler.
class DashboardRuntime {
public:
    enum class Action { None, Render, Quit };

    explicit DashboardRuntime(std::unique_ptr<IRenderer> renderer,
                              RuntimeOptions opts = {});
    ~DashboardRuntime();

    DashboardRuntime(const DashboardRuntime&) = delete;
    DashboardRuntime& operator=(const DashboardRuntime&) = delete;

    // Runs until quit or stop(). A RenderError other than SizeMismatch ends
    // the loop: the renderer is cleaned up and the error rethrown.
    void run();

    // One loop iteration. Returns false once the runtime should exit.
    bool tick();

    void stop() { running_ = false; }
    bool isRunning() const { return running_; }

    Action handleEvent(const Event& ev);

    // Draws and flushes the current frame regardless of the dirty flag.
    // A size change during the draw retries once, then leaves it dirty.
    void renderFrame();

    // Frame as it would be drawn at `area`: dashboard plus error overlay.
    CellBuffer composeFrame(Rect area);

    ReloadEngine&       engine()       { return engine_; }
    const ReloadEngine& engine() const { return engine_; }
    IRenderer&          renderer()     { return *renderer_; }

    // Overlay for the current error, if one is showing.
    const ErrorOverlay* overlay() const { return overlay_ ? &*overlay_ : nullptr; }

    uint64_t frameCount() const { return frames_; }

private:
    Action handleKey(const KeyEvent& key);
    void   syncOverlay(ErrorOverlay::Clock::time_point now);
    void   cycleFocus(int direction);
    void   moveSelection(long delta);
    void   selectEdge(bool last);
    WidgetUiState* focusedList(size_t& count);

    std::unique_ptr<IRenderer>  renderer_;
    ReloadEngine                engine_;
    RuntimeOptions              opts_;
    std::optional<ErrorOverlay> overlay_;
    std::atomic<bool>           running_{false};
    uint64_t                    frames_ = 0;
};
