#include "reload/FileWatcher.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
constexpr uint32_t DIR_EVENTS = IN_CLOSE_WRITE | IN_MODIFY | IN_ATTRIB | IN_CREATE |
                                IN_DELETE | IN_MOVED_TO | IN_MOVED_FROM;
}

FileWatcher::FileWatcher() : FileWatcher(Options{}) {}

FileWatcher::FileWatcher(Options opts) : opts_(opts) {
    if (opts_.forcePolling) {
        spdlog::info("File watcher: polling (forced), debounce {}ms", opts_.debounce.count());
        return;
    }
    try {
        openInotify();
        spdlog::info("File watcher: inotify, debounce {}ms", opts_.debounce.count());
    } catch (const WatchError& e) {
        fallBackToPolling(e.what());
    }
}

FileWatcher::~FileWatcher() {
    if (inotifyFd_ >= 0) ::close(inotifyFd_);
}

fs::path FileWatcher::normalize(const fs::path& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) return path.lexically_normal();
    fs::path canon = fs::weakly_canonical(abs, ec);
    return ec ? abs.lexically_normal() : canon;
}

void FileWatcher::openInotify() {
    inotifyFd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotifyFd_ < 0)
        throw WatchError(WatchError::Kind::BackendUnavailable,
                         std::string("inotify_init1 failed: ") + std::strerror(errno));
}

void FileWatcher::fallBackToPolling(const char* reason) {
    spdlog::warn("File watcher falling back to polling: {}", reason);
    if (inotifyFd_ >= 0) ::close(inotifyFd_);
    inotifyFd_ = -1;
    dirByWd_.clear();
    wdByDir_.clear();
}

void FileWatcher::snapshot(const fs::path& path, Entry& e) {
    std::error_code ec;
    e.exists = fs::is_regular_file(path, ec);
    if (!e.exists) {
        e.size = 0;
        e.mtime = {};
        return;
    }
    e.mtime = fs::last_write_time(path, ec);
    e.size  = fs::file_size(path, ec);
}

// ── Watch management ────────────────────────────────────────────────

void FileWatcher::watch(const fs::path& rawPath) {
    fs::path path = normalize(rawPath);
    if (entries_.count(path)) return;

    std::error_code ec;
    if (!fs::exists(path, ec))
        throw WatchError(WatchError::Kind::PathNotFound, "cannot watch missing file " + path.string());

    Entry e;
    snapshot(path, e);
    entries_.emplace(path, e);

    fs::path dir = path.parent_path();
    if (dirRefs_[dir]++ == 0 && inotifyFd_ >= 0) {
        try {
            addDirWatch(dir);
        } catch (const WatchError& err) {
            fallBackToPolling(err.what());
        }
    }
    spdlog::debug("Watching {}", path.string());
}

void FileWatcher::unwatch(const fs::path& rawPath) {
    fs::path path = normalize(rawPath);
    if (entries_.erase(path) == 0) return;

    fs::path dir = path.parent_path();
    auto it = dirRefs_.find(dir);
    if (it != dirRefs_.end() && --it->second == 0) {
        dirRefs_.erase(it);
        removeDirWatch(dir);
    }
    spdlog::debug("Stopped watching {}", path.string());
}

bool FileWatcher::isWatching(const fs::path& path) const {
    return entries_.count(normalize(path)) > 0;
}

void FileWatcher::addDirWatch(const fs::path& dir) {
    int wd = ::inotify_add_watch(inotifyFd_, dir.c_str(), DIR_EVENTS);
    if (wd < 0)
        throw WatchError(WatchError::Kind::BackendUnavailable,
                         "inotify_add_watch(" + dir.string() + ") failed: " + std::strerror(errno));
    dirByWd_[wd]  = dir;
    wdByDir_[dir] = wd;
}

void FileWatcher::removeDirWatch(const fs::path& dir) {
    auto it = wdByDir_.find(dir);
    if (it == wdByDir_.end()) return;
    if (inotifyFd_ >= 0 && ::inotify_rm_watch(inotifyFd_, it->second) != 0)
        spdlog::debug("inotify_rm_watch({}) failed: {}", dir.string(), std::strerror(errno));
    dirByWd_.erase(it->second);
    wdByDir_.erase(it);
}

// ── Change detection ────────────────────────────────────────────────

void FileWatcher::markPending(const fs::path& path, Clock::time_point now) {
    auto it = entries_.find(path);
    if (it == entries_.end()) return;
    // Every new event pushes the deadline out again
    it->second.deadline = now + opts_.debounce;
}

void FileWatcher::drainInotify(Clock::time_point now) {
    alignas(inotify_event) char buf[8192];
    for (;;) {
        ssize_t n = ::read(inotifyFd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno != EAGAIN)
                spdlog::warn("inotify read failed: {}", std::strerror(errno));
            return;
        }
        if (n == 0) return;

        for (ssize_t off = 0; off < n;) {
            auto* ev = reinterpret_cast<const inotify_event*>(buf + off);
            off += static_cast<ssize_t>(sizeof(inotify_event) + ev->len);

            if (ev->mask & IN_Q_OVERFLOW) {
                spdlog::warn("inotify queue overflow, treating all files as changed");
                for (auto& [path, entry] : entries_) markPending(path, now);
                continue;
            }
            auto dirIt = dirByWd_.find(ev->wd);
            if (dirIt == dirByWd_.end() || ev->len == 0) continue;
            markPending(dirIt->second / ev->name, now);
        }
    }
}

void FileWatcher::scanPolling(Clock::time_point now) {
    for (auto& [path, entry] : entries_) {
        Entry current;
        snapshot(path, current);
        if (current.exists != entry.exists || current.mtime != entry.mtime ||
            current.size != entry.size) {
            entry.exists = current.exists;
            entry.mtime  = current.mtime;
            entry.size   = current.size;
            entry.deadline = now + opts_.debounce;
        }
    }
}

std::optional<std::set<fs::path>> FileWatcher::pollChanges() {
    auto now = Clock::now();
    if (inotifyFd_ >= 0) drainInotify(now);
    else                 scanPolling(now);

    std::set<fs::path> ready;
    for (auto& [path, entry] : entries_) {
        if (entry.deadline && *entry.deadline <= now) {
            entry.deadline.reset();
            if (inotifyFd_ >= 0) snapshot(path, entry);
            ready.insert(path);
        }
    }
    if (ready.empty()) return std::nullopt;

    spdlog::debug("{} watched file(s) changed", ready.size());
    return ready;
}
