#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <print>
#include <string>

namespace {

constexpr int EXIT_ALREADY_RUNNING = 2;

void usage() {
    std::println("Usage: fgp-vercel [options]");
    std::println("Options:");
    std::println("  -f, --foreground    Run in foreground (don't daemonize)");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -s, --socket PATH   Listen on PATH instead of the default socket");
    std::println("  -h, --help          Show this help");
    std::println("");
    std::println("The API token is read from $VERCEL_TOKEN (see upstream.token_env).");
}

} // namespace

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;
    std::string socket_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--socket" || arg == "-s") {
            if (i + 1 < argc) socket_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage();
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage();
            return 1;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!socket_path.empty()) config.server.socket_path = socket_path;

    // Bind before detaching so fatal startup errors still reach the terminal.
    // Signal handling is set up by run(), in the process that stays behind.
    LinuxEventLoop loop(std::move(config), verbose);
    if (auto started = loop.init(); !started) {
        const auto& err = started.error();
        if (err.kind == StartError::Kind::AlreadyRunning) {
            std::println(stderr, "[fgp-vercel] already running: {}", err.message);
            return EXIT_ALREADY_RUNNING;
        }
        std::println(stderr, "[fgp-vercel] startup failed: {}", err.message);
        return 1;
    }

    if (!foreground) {
        platform::daemonize();
    }

    return loop.run() ? 0 : 1;
}
