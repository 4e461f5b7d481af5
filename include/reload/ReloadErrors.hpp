#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

// Failure to load or compile a dashboard definition. Always caught by
// ReloadEngine and turned into the dashboard's lastError.
class LoadError : public std::runtime_error {
public:
    enum class Kind { NotFound, ParseError, CircularDependency, IoError };

    LoadError(Kind kind, std::filesystem::path path, const std::string& what)
        : std::runtime_error(what), kind_(kind), path_(std::move(path)) {}

    static LoadError notFound(const std::filesystem::path& path) {
        return {Kind::NotFound, path, "file not found: " + path.string()};
    }

    static LoadError ioError(const std::filesystem::path& path, const std::string& reason) {
        return {Kind::IoError, path, "cannot read " + path.string() + ": " + reason};
    }

    static LoadError parseError(const std::filesystem::path& path, int line, int column,
                                const std::string& message) {
        LoadError e(Kind::ParseError, path,
                    path.string() + ":" + std::to_string(line) + ":" +
                    std::to_string(column) + ": " + message);
        e.line_    = line;
        e.column_  = column;
        e.message_ = message;
        return e;
    }

    static LoadError circular(std::vector<std::filesystem::path> cycle) {
        std::string chain;
        for (size_t i = 0; i < cycle.size(); ++i) {
            if (i) chain += " -> ";
            chain += cycle[i].filename().string();
        }
        std::filesystem::path head = cycle.empty() ? std::filesystem::path{} : cycle.front();
        LoadError e(Kind::CircularDependency, head, "circular dependency: " + chain);
        e.cycle_ = std::move(cycle);
        return e;
    }

    Kind kind() const { return kind_; }
    const std::filesystem::path& path() const { return path_; }
    int line() const { return line_; }          // 1-based, 0 when unknown
    int column() const { return column_; }      // 1-based, 0 when unknown
    const std::string& message() const { return message_; }   // parse message without location
    const std::vector<std::filesystem::path>& cycle() const { return cycle_; }

private:
    Kind                               kind_;
    std::filesystem::path              path_;
    int                                line_   = 0;
    int                                column_ = 0;
    std::string                        message_;
    std::vector<std::filesystem::path> cycle_;
};

// File-watching failure. BackendUnavailable never escapes FileWatcher;
// it degrades to polling instead.
class WatchError : public std::runtime_error {
public:
    enum class Kind { PathNotFound, BackendUnavailable };

    WatchError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};
