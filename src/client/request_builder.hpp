#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Turns `sttpadctl <command> [args] [--options]` into a daemon request.
// args[0] is the command. The error string is a usage message.
std::expected<nlohmann::json, std::string> build_request(const std::vector<std::string>& args);

// True when the daemon streams progress lines before the final reply.
bool expects_stream(const nlohmann::json& request);

void print_usage(const char* prog);
