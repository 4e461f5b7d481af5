#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

class LoadError;

enum class Severity { Error, Warning, Info };

const char* toString(Severity s);

// Structured, user-facing description of a failure.
struct ErrorInfo {
    std::string                          title;
    std::string                          message;
    std::optional<std::filesystem::path> path;
    std::optional<int>                   line;
    std::optional<int>                   column;
    std::vector<std::string>             hints;
    Severity                             severity = Severity::Error;
    std::chrono::steady_clock::time_point raisedAt = std::chrono::steady_clock::now();

    // "path:line:col", "path:line", "path" or empty
    std::string location() const;

    static ErrorInfo fromLoadError(const LoadError& e);
    static ErrorInfo fromException(const std::exception& e);
};

// Per-widget interaction state, keyed by widget id.
struct WidgetUiState {
    std::optional<size_t> selected;
    size_t                scroll  = 0;
    bool                  focused = false;
};

// Everything that survives a reload.
struct DashboardState {
    bool                                  loaded = false;
    bool                                  dirty  = true;
    std::map<std::string, nlohmann::json> userState;
    std::map<std::string, WidgetUiState>  uiState;
    std::optional<std::string>            focusedWidget;
    std::optional<ErrorInfo>              lastError;
};
