#include "dashboard/RuntimeConfig.hpp"
#include <cstdlib>
#include <fstream>

namespace {

std::string getEnv(const std::string& key, const std::string& defaultVal = "") {
    const char* val = std::getenv(key.c_str());
    return val ? val : defaultVal;
}

RuntimeConfig::Backend parseBackend(const std::string& name) {
    if (name == "terminal")                       return RuntimeConfig::Backend::Terminal;
    if (name == "shm" || name == "shared_memory") return RuntimeConfig::Backend::SharedMemory;
    throw ConfigError("unknown backend '" + name + "' (expected terminal or shm)");
}

int positive(const nlohmann::json& j, const char* key, int defaultVal) {
    int v = j.value(key, defaultVal);
    if (v <= 0) throw ConfigError(std::string(key) + " must be positive");
    return v;
}

// Grid dimensions travel as 16-bit values
int dimension(const nlohmann::json& j, const char* key, int defaultVal) {
    int v = positive(j, key, defaultVal);
    if (v > 0xFFFF) throw ConfigError(std::string(key) + " must not exceed 65535");
    return v;
}

} // namespace

const char* toString(RuntimeConfig::Backend b) {
    switch (b) {
        case RuntimeConfig::Backend::Terminal:     return "terminal";
        case RuntimeConfig::Backend::SharedMemory: return "shm";
    }
    return "terminal";
}

RuntimeConfig RuntimeConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigError("configuration must be a JSON object");

    RuntimeConfig c;
    try {
        c.backend          = parseBackend(j.value("backend", std::string("terminal")));
        c.entry            = j.value("entry", c.entry);
        c.hotReload        = j.value("hot_reload", c.hotReload);
        c.debounceMs       = j.value("debounce_ms", c.debounceMs);
        c.forcePolling     = j.value("force_polling", c.forcePolling);
        c.tickMs           = positive(j, "tick_ms", c.tickMs);
        c.logLevel         = j.value("log_level", c.logLevel);
        c.logFile          = j.value("log_file", c.logFile);
        c.overlayDismissMs = j.value("overlay_dismiss_ms", c.overlayDismissMs);
        c.theme            = j.value("theme", c.theme);

        if (j.contains("shm")) {
            const auto& shm = j["shm"];
            c.shmName            = shm.value("name", c.shmName);
            c.shmCapacityWidth   = dimension(shm, "capacity_width", c.shmCapacityWidth);
            c.shmCapacityHeight  = dimension(shm, "capacity_height", c.shmCapacityHeight);
            c.shmWidth           = dimension(shm, "width", c.shmWidth);
            c.shmHeight          = dimension(shm, "height", c.shmHeight);
            c.shmReaderTimeoutMs = positive(shm, "reader_timeout_ms", c.shmReaderTimeoutMs);
        }
        if (j.contains("terminal")) {
            const auto& term = j["terminal"];
            c.terminalAlternateScreen = term.value("alternate_screen", c.terminalAlternateScreen);
            c.terminalMouse           = term.value("mouse", c.terminalMouse);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }

    if (c.debounceMs < 0) throw ConfigError("debounce_ms must not be negative");
    if (c.theme.empty()) throw ConfigError("theme must not be empty");
    if (c.shmWidth > c.shmCapacityWidth || c.shmHeight > c.shmCapacityHeight)
        throw ConfigError("shm width/height exceed capacity");
    return c;
}

RuntimeConfig RuntimeConfig::load(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw ConfigError("cannot open config file: " + path.string());

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(path.string() + ": " + e.what());
    }
    return fromJson(j);
}

void RuntimeConfig::applyEnvironment() {
    std::string backendName = getEnv("TUIDASH_BACKEND");
    if (!backendName.empty()) backend = parseBackend(backendName);

    entry    = getEnv("TUIDASH_ENTRY", entry);
    logLevel = getEnv("TUIDASH_LOG_LEVEL", logLevel);
    shmName  = getEnv("TUIDASH_SHM_NAME", shmName);
    theme    = getEnv("TUIDASH_THEME", theme);
}
