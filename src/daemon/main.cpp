#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "profiles/builtin_profiles.hpp"
#include "profiles/profile_registry.hpp"

#include <curl/curl.h>
#include <print>
#include <string>

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::println(stderr, "{} needs a path", arg);
                return 2;
            }
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: sttpad [options]");
            std::println("Options:");
            std::println("  -f, --foreground    Run in foreground (don't daemonize)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            return 2;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    ProfileRegistry registry;
    if (auto r = register_builtin_profiles(registry, config); !r) {
        std::println(stderr, "Failed to register profiles: {}", r.error().describe());
        return 1;
    }
    registry.seal();

    if (!foreground) {
        platform::daemonize();
    }

    if (verbose && foreground) {
        std::println(stderr, "[sttpad] Starting ({} profiles, model server {})",
                     registry.size(), config.model.url);
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::println(stderr, "curl_global_init failed");
        return 1;
    }

    int rc = 0;
    {
        LinuxEventLoop loop(std::move(config), registry, verbose);
        if (loop.init()) {
            loop.run();
        } else {
            std::println(stderr, "Failed to initialize event loop");
            rc = 1;
        }
    }

    curl_global_cleanup();
    return rc;
}
