#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"
#include "request_builder.hpp"

#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static int print_response(const std::string& command, const json& response) {
    auto status = response.value("status", "");

    if (status == "error") {
        std::println(stderr, "Error: {}{}", response.contains("error")
                         ? response["error"].get<std::string>() + ": " : std::string(),
                     response.value("message", "unknown error"));
        return 1;
    }

    if (response.value("truncated", false)) {
        std::println(stderr, "Warning: recording limit reached, last {:.1f}s were dropped",
                     response.value("dropped_seconds", 0.0));
    }

    if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        if (response.contains("duration")) {
            std::println("Recording duration: {:.1f}s", response["duration"].get<double>());
        }
        if (response.value("limit_reached", false)) {
            std::println("Recording limit of {:.0f}s reached, {:.1f}s dropped",
                         response.value("max_duration", 0.0), response.value("dropped_seconds", 0.0));
        }
        std::println("Jobs: {} pending, {} running ({} workers)",
                     response.value("pending", 0), response.value("running", 0),
                     response.value("workers", 0));
        std::println("Runners: {}, audio clips: {}", response.value("runners", 0),
                     response.value("audio", 0));
    } else if (command == "history") {
        for (auto& entry : response.value("entries", json::array())) {
            std::println("[{}] job {} ({}, {})", entry.value("timestamp", ""), entry.value("job", 0),
                         entry.value("profile", ""), entry.value("state", ""));
            if (entry.contains("text")) std::println("  {}", entry["text"].get<std::string>());
            if (entry.contains("error")) std::println("  Error: {}", entry["error"].get<std::string>());
        }
    } else if (command == "text") {
        std::println("{}", response.value("text", ""));
    } else if (response.contains("state") && response.contains("job")) {
        auto state = response.value("state", "");
        if (response.contains("text")) {
            std::println("{}", response["text"].get<std::string>());
        } else {
            std::println("Job {}: {}", response["job"].get<uint64_t>(), state);
        }
        if (response.contains("notice")) {
            std::println(stderr, "{}", response["notice"].get<std::string>());
        }
        if (state == "cancelled") return 1;
    } else if (response.size() == 1) {
        std::println("OK");
    } else {
        std::println("{}", response.dump(2));
    }
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args[0] == "--help" || args[0] == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    auto cmd = build_request(args);
    if (!cmd) {
        std::println(stderr, "{}", cmd.error());
        print_usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is sttpad running?");
        return 1;
    }

    if (!client.send(*cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    const bool stream = expects_stream(*cmd);
    json response;
    for (;;) {
        if (!client.recv(response, stream ? -1 : 30000)) {
            std::println(stderr, "No response from daemon (timeout)");
            return 1;
        }
        if (response.value("status", "") != "progress") break;
        std::print(stderr, "\rjob {}: {:3.0f}%", response.value("job", 0),
                   response.value("progress", 0.0) * 100.0);
    }
    if (stream) std::println(stderr, "");

    return print_response(args[0], response);
}
