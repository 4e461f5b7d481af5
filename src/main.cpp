#include "dashboard/DashboardRuntime.hpp"
#include "dashboard/RuntimeConfig.hpp"
#include "render/SharedMemoryRenderer.hpp"
#include "render/TerminalRenderer.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <vector>

static DashboardRuntime* g_runtime = nullptr;

static void signalHandler(int) {
    if (g_runtime) g_runtime->stop();
}

static void loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        // Remove quotes
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
            val = val.substr(1, val.size() - 2);
        setenv(key.c_str(), val.c_str(), 0);  // don't override existing
    }
}

static void setupLogging(const RuntimeConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        config.logFile, 1048576 * 5, 3));  // 5MB, 3 files

    // Console output would land in the middle of the terminal UI
    if (config.backend == RuntimeConfig::Backend::SharedMemory)
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    auto logger = std::make_shared<spdlog::logger>("tuidash", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    const std::string& level = config.logLevel;
    if (level == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (level == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (level == "error") spdlog::set_level(spdlog::level::err);
    else                       spdlog::set_level(spdlog::level::info);
    spdlog::flush_on(spdlog::level::warn);
}

static std::unique_ptr<IRenderer> makeRenderer(const RuntimeConfig& config) {
    if (config.backend == RuntimeConfig::Backend::SharedMemory) {
        SharedMemoryOptions opts;
        opts.name           = config.shmName;
        opts.capacityWidth  = static_cast<uint16_t>(config.shmCapacityWidth);
        opts.capacityHeight = static_cast<uint16_t>(config.shmCapacityHeight);
        opts.width          = static_cast<uint16_t>(config.shmWidth);
        opts.height         = static_cast<uint16_t>(config.shmHeight);
        opts.readerTimeout  = std::chrono::milliseconds(config.shmReaderTimeoutMs);
        return std::make_unique<SharedMemoryRenderer>(opts);
    }

    TerminalOptions opts;
    opts.alternateScreen = config.terminalAlternateScreen;
    opts.mouseCapture    = config.terminalMouse;
    return std::make_unique<TerminalRenderer>(opts);
}

int main(int argc, char* argv[]) {
    loadDotEnv(".env");

    std::string configPath = "config/tuidash.json";
    std::string entryArg;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) configPath = argv[++i];
        else if (arg == "--help" || arg == "-h") {
            std::cout << "usage: tuidash [--config file.json] [dashboard.fsx]\n";
            return 0;
        } else entryArg = arg;
    }

    RuntimeConfig config;
    try {
        config = RuntimeConfig::load(configPath);
        config.applyEnvironment();
    } catch (const ConfigError& e) {
        std::cerr << "tuidash: " << e.what() << "\n";
        return 1;
    }
    if (!entryArg.empty()) config.entry = entryArg;

    setupLogging(config);
    spdlog::info("tuidash v0.1.0 starting (config {}, backend {})",
                 configPath, toString(config.backend));

    Theme theme;
    try {
        theme = Theme::resolve(config.theme);
    } catch (const ThemeError& e) {
        spdlog::error("Theme error: {}", e.what());
        std::cerr << "tuidash: " << e.what() << "\n";
        spdlog::shutdown();
        return 1;
    }

    int exitCode = 0;
    try {
        RuntimeOptions opts;
        opts.tick = std::chrono::milliseconds(config.tickMs);
        if (config.overlayDismissMs > 0)
            opts.overlayDismiss = std::chrono::milliseconds(config.overlayDismissMs);

        DashboardRuntime runtime(makeRenderer(config), opts);
        runtime.engine().setTheme(theme);
        if (config.hotReload)
            runtime.engine().enableHotReload(std::chrono::milliseconds(config.debounceMs),
                                             config.forcePolling);
        if (config.entry.empty())
            spdlog::warn("No dashboard file given (set \"entry\" or pass a path)");
        else
            runtime.engine().load(config.entry);

        g_runtime = &runtime;
        std::signal(SIGINT, signalHandler);
        runtime.run();
        g_runtime = nullptr;
    } catch (const RenderError& e) {
        g_runtime = nullptr;
        spdlog::error("Fatal renderer error: {}", e.what());
        std::cerr << "tuidash: " << e.what() << "\n";
        exitCode = 2;
    } catch (const std::exception& e) {
        g_runtime = nullptr;
        spdlog::error("Fatal error: {}", e.what());
        std::cerr << "tuidash: " << e.what() << "\n";
        exitCode = 1;
    }

    spdlog::info("tuidash exited with code {}", exitCode);
    spdlog::shutdown();
    return exitCode;
}
