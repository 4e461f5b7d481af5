#pragma once
#include "ReloadErrors.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>

// Watches individual files for changes and debounces bursts of events.
//
// inotify watches the parent directory of every file, so editors that
// save via write-to-temp + rename are still seen. If inotify is not
// available (or polling is forced) it compares mtime/size on each poll.
//
// Single-threaded: nothing happens between calls to pollChanges(), which
// drains pending notifications and returns the paths whose quiet period
// has elapsed.
class FileWatcher {
public:
    struct Options {
        std::chrono::milliseconds debounce{150};
        bool forcePolling = false;
    };

    FileWatcher();
    explicit FileWatcher(Options opts);
    ~FileWatcher();

    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

    // Idempotent. Throws WatchError(PathNotFound) for a missing file.
    void watch(const std::filesystem::path& path);
    void unwatch(const std::filesystem::path& path);
    bool isWatching(const std::filesystem::path& path) const;

    // Non-blocking. Each path is reported once per burst of changes.
    std::optional<std::set<std::filesystem::path>> pollChanges();

    void setDebounce(std::chrono::milliseconds debounce) { opts_.debounce = debounce; }
    std::chrono::milliseconds debounce() const { return opts_.debounce; }

    bool usingInotify() const { return inotifyFd_ >= 0; }
    size_t watchCount() const { return entries_.size(); }

    static std::filesystem::path normalize(const std::filesystem::path& path);

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        bool                             exists = false;
        std::filesystem::file_time_type  mtime{};
        uintmax_t                        size   = 0;
        std::optional<Clock::time_point> deadline;
    };

    void openInotify();
    void addDirWatch(const std::filesystem::path& dir);
    void removeDirWatch(const std::filesystem::path& dir);
    void fallBackToPolling(const char* reason);
    void drainInotify(Clock::time_point now);
    void scanPolling(Clock::time_point now);
    void markPending(const std::filesystem::path& path, Clock::time_point now);
    static void snapshot(const std::filesystem::path& path, Entry& e);

    Options                                opts_;
    std::map<std::filesystem::path, Entry> entries_;
    int                                    inotifyFd_ = -1;
    std::map<int, std::filesystem::path>   dirByWd_;
    std::map<std::filesystem::path, int>   wdByDir_;
    std::map<std::filesystem::path, int>   dirRefs_;   // watched files per directory
};
