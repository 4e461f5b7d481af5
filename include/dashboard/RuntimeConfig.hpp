#pragma once
#include <nlohmann/json.hpp>
#include <filesystem>
#include <stdexcept>
#include <string>

// Malformed or unreadable configuration file.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RuntimeConfig {
    enum class Backend { Terminal, SharedMemory };

    Backend     backend          = Backend::Terminal;
    std::string entry;                         // dashboard definition (.fsx)
    bool        hotReload        = true;
    int         debounceMs       = 150;
    bool        forcePolling     = false;      // skip inotify
    int         tickMs           = 50;         // pollEvent timeout per loop
    std::string logLevel         = "info";
    std::string logFile          = "tuidash.log";
    int         overlayDismissMs = 0;          // 0 = overlay stays until dismissed
    std::string theme            = "dark";     // preset name or theme file (.json)

    // Shared-memory backend
    std::string shmName            = "/tuidash";
    int         shmCapacityWidth   = 256;
    int         shmCapacityHeight  = 128;
    int         shmWidth           = 80;
    int         shmHeight          = 24;
    int         shmReaderTimeoutMs = 2000;

    // Terminal backend
    bool terminalAlternateScreen = true;
    bool terminalMouse           = false;

    // Missing keys keep their defaults. Throws ConfigError on bad values.
    static RuntimeConfig fromJson(const nlohmann::json& j);

    // Throws ConfigError if the file cannot be opened or parsed.
    static RuntimeConfig load(const std::filesystem::path& path);

    // TUIDASH_BACKEND, TUIDASH_ENTRY, TUIDASH_LOG_LEVEL, TUIDASH_SHM_NAME,
    // TUIDASH_THEME
    void applyEnvironment();
};

const char* toString(RuntimeConfig::Backend b);
