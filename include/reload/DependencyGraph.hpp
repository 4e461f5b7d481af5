#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <vector>

// Include graph between definition files. An edge from -> to means
// `from` includes `to` (so `to` must be evaluated first).
class DependencyGraph {
public:
    using Path = std::filesystem::path;

    void addFile(const Path& file);
    void addDependency(const Path& from, const Path& to);
    // Replace every outgoing edge of `from`.
    void setDependencies(const Path& from, const std::set<Path>& to);
    // Drops the node and every edge touching it.
    void removeFile(const Path& file);

    bool contains(const Path& file) const { return deps_.count(file) > 0; }
    size_t size() const { return deps_.size(); }

    std::set<Path> dependenciesOf(const Path& file) const;
    std::set<Path> dependentsOf(const Path& file) const;
    std::set<Path> transitiveDependencies(const Path& file) const;
    std::set<Path> transitiveDependents(const Path& file) const;

    // A cycle reachable from `root`, as the path that closes it
    // (first element repeated at the end), or nullopt.
    std::optional<std::vector<Path>> findCycle(const Path& root) const;

    // Every file reachable from `roots`, dependencies before dependents.
    // Throws LoadError(CircularDependency) on a cycle.
    std::vector<Path> topologicalOrder(const std::vector<Path>& roots) const;

private:
    static std::set<Path> reach(const std::map<Path, std::set<Path>>& edges, const Path& start);

    std::map<Path, std::set<Path>> deps_;         // file -> files it includes
    std::map<Path, std::set<Path>> dependents_;   // file -> files including it
};
