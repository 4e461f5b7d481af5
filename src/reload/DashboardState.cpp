#include "reload/DashboardState.hpp"
#include "reload/ReloadErrors.hpp"

const char* toString(Severity s) {
    switch (s) {
        case Severity::Error:   return "ERROR";
        case Severity::Warning: return "WARNING";
        case Severity::Info:    return "INFO";
    }
    return "ERROR";
}

std::string ErrorInfo::location() const {
    if (!path) return {};
    std::string out = path->string();
    if (line) {
        out += ":" + std::to_string(*line);
        if (column) out += ":" + std::to_string(*column);
    }
    return out;
}

ErrorInfo ErrorInfo::fromLoadError(const LoadError& e) {
    ErrorInfo info;
    if (!e.path().empty()) info.path = e.path();

    switch (e.kind()) {
        case LoadError::Kind::NotFound:
            info.title   = "File Not Found";
            info.message = "Could not find file: " + e.path().string();
            info.hints   = {"Check that the file path is correct",
                            "Make sure the file exists in the expected location"};
            break;
        case LoadError::Kind::IoError:
            info.title   = "Failed to Read File";
            info.message = e.what();
            info.hints   = {"Check file permissions",
                            "Ensure the file is not locked by another process"};
            break;
        case LoadError::Kind::ParseError:
            info.title   = "Parse Error";
            info.message = e.message().empty() ? e.what() : e.message();
            if (e.line() > 0)   info.line   = e.line();
            if (e.column() > 0) info.column = e.column();
            info.hints   = {"Check the syntax of your .fsx file",
                            "Look for unclosed quotes or unknown keywords"};
            break;
        case LoadError::Kind::CircularDependency:
            info.title   = "Circular Dependency";
            info.message = e.what();
            info.hints   = {"Remove one of the #load directives in the cycle"};
            break;
    }
    return info;
}

ErrorInfo ErrorInfo::fromException(const std::exception& e) {
    ErrorInfo info;
    info.title   = "Error";
    info.message = e.what();
    info.hints   = {"Try reloading the dashboard"};
    return info;
}
