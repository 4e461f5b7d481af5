#include "reload/DependencyGraph.hpp"
#include "reload/ReloadErrors.hpp"
#include <algorithm>
#include <functional>

using Path = DependencyGraph::Path;

void DependencyGraph::addFile(const Path& file) {
    deps_[file];
    dependents_[file];
}

void DependencyGraph::addDependency(const Path& from, const Path& to) {
    addFile(from);
    addFile(to);
    deps_[from].insert(to);
    dependents_[to].insert(from);
}

void DependencyGraph::setDependencies(const Path& from, const std::set<Path>& to) {
    addFile(from);
    for (const auto& old : deps_[from]) dependents_[old].erase(from);
    deps_[from].clear();
    for (const auto& t : to) addDependency(from, t);
}

void DependencyGraph::removeFile(const Path& file) {
    auto it = deps_.find(file);
    if (it == deps_.end()) return;
    for (const auto& to : it->second) dependents_[to].erase(file);
    for (const auto& from : dependents_[file]) deps_[from].erase(file);
    deps_.erase(it);
    dependents_.erase(file);
}

std::set<Path> DependencyGraph::dependenciesOf(const Path& file) const {
    auto it = deps_.find(file);
    return it == deps_.end() ? std::set<Path>{} : it->second;
}

std::set<Path> DependencyGraph::dependentsOf(const Path& file) const {
    auto it = dependents_.find(file);
    return it == dependents_.end() ? std::set<Path>{} : it->second;
}

std::set<Path> DependencyGraph::reach(const std::map<Path, std::set<Path>>& edges,
                                      const Path& start) {
    std::set<Path> seen;
    std::vector<Path> stack{start};
    while (!stack.empty()) {
        Path cur = stack.back();
        stack.pop_back();
        auto it = edges.find(cur);
        if (it == edges.end()) continue;
        for (const auto& next : it->second) {
            if (next != start && seen.insert(next).second) stack.push_back(next);
        }
    }
    return seen;
}

std::set<Path> DependencyGraph::transitiveDependencies(const Path& file) const {
    return reach(deps_, file);
}

std::set<Path> DependencyGraph::transitiveDependents(const Path& file) const {
    return reach(dependents_, file);
}

std::optional<std::vector<Path>> DependencyGraph::findCycle(const Path& root) const {
    enum class Mark { Visiting, Done };
    std::map<Path, Mark> marks;
    std::vector<Path> stack;
    std::optional<std::vector<Path>> cycle;

    std::function<bool(const Path&)> visit = [&](const Path& node) {
        marks[node] = Mark::Visiting;
        stack.push_back(node);
        for (const auto& next : dependenciesOf(node)) {
            auto m = marks.find(next);
            if (m != marks.end() && m->second == Mark::Visiting) {
                auto start = std::find(stack.begin(), stack.end(), next);
                cycle = std::vector<Path>(start, stack.end());
                cycle->push_back(next);
                return true;
            }
            if (m == marks.end() && visit(next)) return true;
        }
        stack.pop_back();
        marks[node] = Mark::Done;
        return false;
    };

    visit(root);
    return cycle;
}

std::vector<Path> DependencyGraph::topologicalOrder(const std::vector<Path>& roots) const {
    std::vector<Path> order;
    std::set<Path> done;
    for (const auto& root : roots) {
        if (auto cycle = findCycle(root)) throw LoadError::circular(*cycle);

        // Post-order DFS: dependencies land before their dependents
        std::function<void(const Path&)> visit = [&](const Path& node) {
            if (!done.insert(node).second) return;
            for (const auto& dep : dependenciesOf(node)) visit(dep);
            order.push_back(node);
        };
        visit(root);
    }
    return order;
}
