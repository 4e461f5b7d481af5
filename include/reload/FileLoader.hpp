#pragma once
#include "DependencyGraph.hpp"
#include "ReloadErrors.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

// One definition file as read from disk.
struct LoadedFile {
    std::filesystem::path              path;
    std::string                        content;
    uint64_t                           contentHash = 0;
    std::vector<std::filesystem::path> includes;     // resolved, in file order
    std::filesystem::file_time_type    modified{};
    uintmax_t                          size = 0;
};

// Bookkeeping for a file the loader has seen.
struct WatchedFile {
    std::filesystem::path           path;
    std::filesystem::file_time_type lastModified{};
    uint64_t                        contentHash = 0;
    std::set<std::filesystem::path> dependents;
    std::set<std::filesystem::path> dependencies;
};

// Reads definition files, caches them by mtime/size, and tracks the
// `#load "path"` include graph between them.
class FileLoader {
public:
    using Path = std::filesystem::path;

    // Cached copy when the file is unchanged and not invalidated. An mtime
    // within two seconds of the last read is confirmed by content hash.
    // Throws LoadError(NotFound / IoError / ParseError).
    std::shared_ptr<const LoadedFile> load(const Path& path);

    // Entry plus transitive includes, dependencies first. Throws
    // LoadError(CircularDependency) naming the cycle.
    std::vector<std::shared_ptr<const LoadedFile>> loadTree(const Path& entry);

    // True if the file or any transitive dependency differs on disk from
    // its cached hash (or is missing / not cached).
    bool needsReload(const Path& path) const;

    // Marks the file and its transitive dependents stale. Returns them.
    std::set<Path> invalidate(const Path& path);

    void unwatch(const Path& path);

    std::optional<WatchedFile> watched(const Path& path) const;
    std::vector<Path> watchedPaths() const;
    const DependencyGraph& graph() const { return graph_; }

    // Files actually read by load() (cache misses; hash confirmations of a
    // cached copy are not counted).
    uint64_t diskReads() const { return diskReads_; }

    static uint64_t hashContent(std::string_view content);
    static std::vector<std::string> scanIncludes(std::string_view content, const Path& source);
    static Path normalize(const Path& path);

private:
    struct CacheEntry {
        std::shared_ptr<const LoadedFile> file;
        bool invalidated = false;
        std::filesystem::file_time_type verifiedAt{};  // last time content matched the hash
    };

    static std::string readFile(const Path& path);
    void refreshWatched(const Path& path);

    std::map<Path, CacheEntry>  cache_;
    std::map<Path, WatchedFile> watched_;
    DependencyGraph             graph_;
    uint64_t                    diskReads_ = 0;
};
