#include "reload/FileLoader.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <functional>
#include <sstream>

namespace fs = std::filesystem;

namespace {
constexpr uint64_t FNV_OFFSET = 14695981039346656037ull;
constexpr uint64_t FNV_PRIME  = 1099511628211ull;
constexpr std::string_view LOAD_DIRECTIVE = "#load";
// Widest common mtime granularity (FAT); a stat match inside it is not trusted
constexpr std::chrono::seconds RACY_WINDOW{2};
}

// ── Helpers ─────────────────────────────────────────────────────────

uint64_t FileLoader::hashContent(std::string_view content) {
    uint64_t h = FNV_OFFSET;
    for (unsigned char c : content) {
        h ^= c;
        h *= FNV_PRIME;
    }
    return h;
}

fs::path FileLoader::normalize(const fs::path& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) return path.lexically_normal();
    fs::path canon = fs::weakly_canonical(abs, ec);
    return ec ? abs.lexically_normal() : canon;
}

std::vector<std::string> FileLoader::scanIncludes(std::string_view content, const fs::path& source) {
    std::vector<std::string> out;
    int lineNo = 0;
    size_t pos = 0;
    while (pos <= content.size()) {
        size_t end = content.find('\n', pos);
        if (end == std::string_view::npos) end = content.size();
        std::string_view line = content.substr(pos, end - pos);
        pos = end + 1;
        ++lineNo;

        size_t start = line.find_first_not_of(" \t");
        if (start == std::string_view::npos) continue;
        if (line.compare(start, LOAD_DIRECTIVE.size(), LOAD_DIRECTIVE) != 0) continue;

        size_t q = line.find_first_not_of(" \t", start + LOAD_DIRECTIVE.size());
        if (q == std::string_view::npos || line[q] != '"')
            throw LoadError::parseError(source, lineNo,
                                        static_cast<int>(q == std::string_view::npos ? line.size() : q) + 1,
                                        "expected quoted path after #load");
        size_t close = line.find('"', q + 1);
        if (close == std::string_view::npos)
            throw LoadError::parseError(source, lineNo, static_cast<int>(q) + 1,
                                        "unterminated string in #load");
        if (close == q + 1)
            throw LoadError::parseError(source, lineNo, static_cast<int>(q) + 1,
                                        "empty #load path");
        out.emplace_back(line.substr(q + 1, close - q - 1));
    }
    return out;
}

std::string FileLoader::readFile(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) throw LoadError::ioError(path, std::strerror(errno));
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) throw LoadError::ioError(path, "read failed");
    return ss.str();
}

// ── Loading ─────────────────────────────────────────────────────────

std::shared_ptr<const LoadedFile> FileLoader::load(const fs::path& rawPath) {
    fs::path path = normalize(rawPath);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) throw LoadError::notFound(path);
    auto modified = fs::last_write_time(path, ec);
    if (ec) throw LoadError::ioError(path, ec.message());
    auto size = fs::file_size(path, ec);
    if (ec) throw LoadError::ioError(path, ec.message());

    auto readAt = fs::file_time_type::clock::now();
    std::optional<std::string> content;

    auto it = cache_.find(path);
    if (it != cache_.end() && !it->second.invalidated &&
        it->second.file->modified == modified && it->second.file->size == size) {
        CacheEntry& entry = it->second;
        if (modified + RACY_WINDOW < entry.verifiedAt) return entry.file;

        // Modified within the timestamp granularity of the last read: a
        // same-size rewrite would look identical, so compare content
        content = readFile(path);
        if (hashContent(*content) == entry.file->contentHash) {
            entry.verifiedAt = readAt;
            return entry.file;
        }
        spdlog::debug("{} changed without an mtime/size change", path.string());
    }

    auto file = std::make_shared<LoadedFile>();
    file->path        = path;
    file->content     = content ? std::move(*content) : readFile(path);
    file->contentHash = hashContent(file->content);
    file->modified    = modified;
    file->size        = size;
    ++diskReads_;

    std::set<fs::path> deps;
    for (const auto& inc : scanIncludes(file->content, path)) {
        fs::path resolved = normalize(path.parent_path() / inc);
        file->includes.push_back(resolved);
        deps.insert(resolved);
    }
    graph_.setDependencies(path, deps);

    cache_[path] = CacheEntry{file, false, readAt};
    refreshWatched(path);
    for (const auto& dep : deps)
        if (watched_.count(dep)) refreshWatched(dep);

    spdlog::debug("Loaded {} ({} bytes, {} includes, hash {:016x})",
                  path.string(), file->content.size(), file->includes.size(), file->contentHash);
    return file;
}

std::vector<std::shared_ptr<const LoadedFile>> FileLoader::loadTree(const fs::path& entry) {
    enum class Mark { Visiting, Done };
    std::map<fs::path, Mark> marks;
    std::vector<fs::path> stack;
    std::vector<std::shared_ptr<const LoadedFile>> order;

    std::function<void(const fs::path&)> visit = [&](const fs::path& p) {
        marks[p] = Mark::Visiting;
        stack.push_back(p);
        auto file = load(p);
        for (const auto& inc : file->includes) {
            auto m = marks.find(inc);
            if (m == marks.end()) {
                visit(inc);
            } else if (m->second == Mark::Visiting) {
                auto start = std::find(stack.begin(), stack.end(), inc);
                std::vector<fs::path> cycle(start, stack.end());
                cycle.push_back(inc);
                throw LoadError::circular(std::move(cycle));
            }
        }
        stack.pop_back();
        marks[p] = Mark::Done;
        order.push_back(std::move(file));
    };

    visit(normalize(entry));
    return order;
}

bool FileLoader::needsReload(const fs::path& rawPath) const {
    fs::path path = normalize(rawPath);
    std::set<fs::path> files = graph_.transitiveDependencies(path);
    files.insert(path);

    for (const auto& p : files) {
        auto it = cache_.find(p);
        if (it == cache_.end() || it->second.invalidated) return true;
        std::error_code ec;
        if (!fs::is_regular_file(p, ec)) return true;
        try {
            if (hashContent(readFile(p)) != it->second.file->contentHash) return true;
        } catch (const LoadError& e) {
            spdlog::debug("needsReload: {}", e.what());
            return true;
        }
    }
    return false;
}

std::set<fs::path> FileLoader::invalidate(const fs::path& rawPath) {
    fs::path path = normalize(rawPath);
    std::set<fs::path> affected = graph_.transitiveDependents(path);
    affected.insert(path);
    for (const auto& p : affected) {
        auto it = cache_.find(p);
        if (it != cache_.end()) it->second.invalidated = true;
    }
    return affected;
}

void FileLoader::unwatch(const fs::path& rawPath) {
    fs::path path = normalize(rawPath);
    auto deps = graph_.dependenciesOf(path);
    auto dependents = graph_.dependentsOf(path);
    cache_.erase(path);
    watched_.erase(path);
    graph_.removeFile(path);
    for (const auto& p : deps)
        if (watched_.count(p)) refreshWatched(p);
    for (const auto& p : dependents)
        if (watched_.count(p)) refreshWatched(p);
}

void FileLoader::refreshWatched(const fs::path& path) {
    auto it = cache_.find(path);
    WatchedFile& w = watched_[path];
    w.path = path;
    if (it != cache_.end()) {
        w.lastModified = it->second.file->modified;
        w.contentHash  = it->second.file->contentHash;
    }
    w.dependencies = graph_.dependenciesOf(path);
    w.dependents   = graph_.dependentsOf(path);
}

std::optional<WatchedFile> FileLoader::watched(const fs::path& path) const {
    auto it = watched_.find(normalize(path));
    if (it == watched_.end()) return std::nullopt;
    // Dependents can change without this file being reloaded
    WatchedFile w = it->second;
    w.dependents = graph_.dependentsOf(w.path);
    return w;
}

std::vector<fs::path> FileLoader::watchedPaths() const {
    std::vector<fs::path> out;
    out.reserve(watched_.size());
    for (const auto& [p, w] : watched_) out.push_back(p);
    return out;
}
