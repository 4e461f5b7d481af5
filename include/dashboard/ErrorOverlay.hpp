#pragma once
#include "core/Theme.hpp"
#include "reload/DashboardState.hpp"
#include "widgets/Widget.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

// Centered error panel drawn over the last good frame after a failed load.
// The dashboard underneath keeps rendering; the overlay only covers it.
class ErrorOverlay : public Renderable {
public:
    using Clock = std::chrono::steady_clock;

    explicit ErrorOverlay(ErrorInfo info, Clock::time_point shownAt = Clock::now());

    ErrorOverlay& autoDismissAfter(std::chrono::milliseconds d) { autoDismiss_ = d; return *this; }

    // Border colour follows severity: error, warning, or primary for info.
    ErrorOverlay& theme(const Theme& t) { colors_ = t.colors(); return *this; }

    // Hides the overlay once the auto-dismiss period has passed.
    void update(Clock::time_point now = Clock::now());

    bool visible() const { return visible_; }
    void dismiss() { visible_ = false; }
    void show(Clock::time_point now = Clock::now());

    const ErrorInfo& info() const { return info_; }

    // Message, location, hints and key help, one entry per line.
    std::vector<std::string> contentLines() const;

    // `percentX` x `percentY` of `area`, centered.
    static Rect centeredRect(Rect area, uint16_t percentX, uint16_t percentY);

    void render(Rect area, CellBuffer& buf) const override;

private:
    ErrorInfo                                info_;
    Clock::time_point                        shownAt_;
    std::optional<std::chrono::milliseconds> autoDismiss_;
    ColorPalette                             colors_ = ColorPalette::dark();
    bool                                     visible_ = true;
};
