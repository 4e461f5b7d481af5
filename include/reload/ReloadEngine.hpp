#pragma once
#include "DashboardState.hpp"
#include "FileLoader.hpp"
#include "FileWatcher.hpp"
#include "core/CellBuffer.hpp"
#include "dashboard/Definition.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <vector>

// Loads a dashboard definition (entry file + #load includes), keeps it
// live, and swaps in a new one whenever a file in its dependency set
// changes. A failed load never replaces a working definition: the old one
// stays live and the failure is recorded in state().lastError.
class ReloadEngine {
public:
    enum class Status { Idle, Loading, Ready, Failed };

    ReloadEngine();
    ~ReloadEngine();

    ReloadEngine(const ReloadEngine&) = delete;
    ReloadEngine& operator=(const ReloadEngine&) = delete;

    // Full load + compile. Returns true on success. Never throws for
    // load/parse failures; the entry path is remembered either way.
    bool load(const std::filesystem::path& entry);

    // Same attempt against the current entry path.
    bool reload();

    // Drives file watching. When a changed file belongs to the active (or
    // last attempted) definition, reloads before returning.
    std::optional<std::set<std::filesystem::path>> pollChanges();

    void enableHotReload(std::chrono::milliseconds debounce = std::chrono::milliseconds(150),
                         bool forcePolling = false);
    void disableHotReload();
    bool hotReloadEnabled() const { return watcher_ != nullptr; }

    void dismissError();

    // Runtime theme. A `theme` statement in the active definition wins.
    void setTheme(Theme theme);
    const Theme& theme() const { return definitionTheme_ ? *definitionTheme_ : theme_; }

    // Frame of the active definition; a placeholder before anything has
    // loaded. Does not include the error overlay.
    CellBuffer render(Rect area) const;

    Status status() const { return status_; }
    DashboardState& state() { return state_; }
    const DashboardState& state() const { return state_; }
    const std::filesystem::path& entryPath() const { return entry_; }
    const Definition* definition() const { return definition_.get(); }
    const FileLoader& loader() const { return loader_; }

    // Files of the last successful load, in evaluation order.
    const std::vector<std::filesystem::path>& lastLoadOrder() const { return lastLoadOrder_; }

    // Files whose change triggers a reload: the last successful tree, or
    // whatever the last failed attempt reached.
    const std::set<std::filesystem::path>& dependencySet() const { return dependencies_; }

    uint64_t reloadCount() const { return reloadCount_; }

private:
    void applyState(const Definition& def);
    void updateWatches(const std::set<std::filesystem::path>& files);
    void fail(ErrorInfo info);

    FileLoader                         loader_;
    std::unique_ptr<FileWatcher>       watcher_;
    std::unique_ptr<const Definition>  definition_;
    Theme                              theme_;
    std::optional<Theme>               definitionTheme_;
    DashboardState                     state_;
    Status                             status_ = Status::Idle;
    std::filesystem::path              entry_;
    std::vector<std::filesystem::path> lastLoadOrder_;
    std::set<std::filesystem::path>    dependencies_;
    uint64_t                           reloadCount_ = 0;
};

const char* toString(ReloadEngine::Status s);
