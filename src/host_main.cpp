#include "ipc/SharedFrameReader.hpp"
#include "render/TerminalRenderer.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

// Mirrors a shared-memory dashboard session on the local terminal and
// forwards terminal input back to it. Ctrl+] detaches.

static volatile std::sig_atomic_t g_stop = 0;

static void signalHandler(int) { g_stop = 1; }

static ResizeEvent clampToCapacity(uint16_t w, uint16_t h, Rect capacity) {
    return {std::min(w, capacity.width), std::min(h, capacity.height)};
}

static void attachWithRetry(SharedFrameReader& reader, const std::string& name,
                            std::chrono::milliseconds wait) {
    auto deadline = std::chrono::steady_clock::now() + wait;
    while (true) {
        try {
            reader.attach(name);
            return;
        } catch (const RenderError& e) {
            if (std::chrono::steady_clock::now() >= deadline || g_stop) throw;
            spdlog::debug("Waiting for segment {}: {}", name, e.what());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

int main(int argc, char* argv[]) {
    std::string name = "/tuidash";
    std::chrono::milliseconds timeout{2000};
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--name" && i + 1 < argc)         name = argv[++i];
        else if (arg == "--timeout" && i + 1 < argc) timeout = std::chrono::milliseconds(std::atoi(argv[++i]));
        else {
            std::cout << "usage: tuidash-host [--name /segment] [--timeout ms]\n";
            return arg == "--help" || arg == "-h" ? 0 : 1;
        }
    }

    auto logger = std::make_shared<spdlog::logger>(
        "tuidash-host",
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>("tuidash-host.log", 1048576 * 5, 3));
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);

    std::signal(SIGINT, signalHandler);

    SharedFrameReader reader;
    try {
        attachWithRetry(reader, name, std::chrono::milliseconds(5000));
    } catch (const RenderError& e) {
        spdlog::error("Cannot attach to {}: {}", name, e.what());
        std::cerr << "tuidash-host: " << e.what() << "\n";
        return 1;
    }
    spdlog::info("Attached to {} (capacity {}x{})", name,
                 reader.capacity().width, reader.capacity().height);

    int exitCode = 0;
    try {
        TerminalRenderer term;
        Rect cap = reader.capacity();
        Rect area = term.size();
        if (!reader.sendEvent(clampToCapacity(area.width, area.height, cap)))
            spdlog::warn("Event ring full, initial size not sent");

        std::optional<SharedFrameSnapshot> last;
        bool redraw = false;

        while (!g_stop) {
            reader.heartbeat();
            if (!reader.writerAlive(timeout)) {
                spdlog::warn("Writer for {} went away", name);
                break;
            }

            if (auto snap = reader.poll()) {
                last   = std::move(snap);
                redraw = true;
            }

            if (redraw && last) {
                CellBuffer frame(term.size());
                frame.merge(last->buffer);
                term.draw(frame);
                term.flush();
                redraw = false;
            }

            auto ev = term.pollEvent(std::chrono::milliseconds(16));
            if (!ev) continue;

            if (const auto* key = std::get_if<KeyEvent>(&*ev); key && key->isCtrl(']')) break;

            if (const auto* resize = std::get_if<ResizeEvent>(&*ev)) {
                redraw = true;
                ev = clampToCapacity(resize->width, resize->height, cap);
            }
            if (!reader.sendEvent(*ev))
                spdlog::warn("Event ring full, dropped {}", describe(*ev));
        }
        term.cleanup();
    } catch (const RenderError& e) {
        spdlog::error("Host failure: {}", e.what());
        std::cerr << "tuidash-host: " << e.what() << "\n";
        exitCode = 2;
    }

    reader.detach();
    spdlog::info("Detached from {}", name);
    return exitCode;
}
