#include "request_builder.hpp"

#include <charconv>
#include <format>
#include <print>

using json = nlohmann::json;

namespace {

struct Parsed {
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> options; // flag, value ("" for switches)
};

// Options that take a value; everything else starting with "--" is a switch.
bool takes_value(const std::string& flag) {
    return flag == "--name" || flag == "--param" || flag == "--format" ||
           flag == "--offset" || flag == "--limit";
}

std::expected<Parsed, std::string> split(const std::vector<std::string>& args) {
    Parsed p;
    for (size_t i = 1; i < args.size(); ++i) {
        const auto& a = args[i];
        if (a.starts_with("--")) {
            if (takes_value(a)) {
                if (i + 1 >= args.size()) return std::unexpected(std::format("{} needs a value", a));
                p.options.emplace_back(a, args[++i]);
            } else {
                p.options.emplace_back(a, "");
            }
        } else {
            p.positional.push_back(a);
        }
    }
    return p;
}

const std::string* option(const Parsed& p, const std::string& flag) {
    for (auto& [f, v] : p.options) {
        if (f == flag) return &v;
    }
    return nullptr;
}

bool has_switch(const Parsed& p, const std::string& flag) {
    return option(p, flag) != nullptr;
}

std::expected<uint64_t, std::string> parse_uint(const std::string& s, const char* what) {
    uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::unexpected(std::format("{} must be a non-negative integer: '{}'", what, s));
    }
    return v;
}

// "key=value"; the value is read as JSON when it parses, as a string otherwise.
std::expected<std::pair<std::string, json>, std::string> parse_param(const std::string& s) {
    auto eq = s.find('=');
    if (eq == std::string::npos || eq == 0) {
        return std::unexpected(std::format("--param expects key=value, got '{}'", s));
    }
    auto key = s.substr(0, eq);
    auto raw = s.substr(eq + 1);
    auto value = json::parse(raw, nullptr, false);
    if (value.is_discarded()) value = raw;
    return std::pair{key, value};
}

std::expected<json, std::string> need(const Parsed& p, size_t count, const char* usage) {
    if (p.positional.size() < count) return std::unexpected(std::format("usage: {}", usage));
    return json::object();
}

} // namespace

std::expected<json, std::string> build_request(const std::vector<std::string>& args) {
    if (args.empty()) return std::unexpected("missing command");

    auto parsed = split(args);
    if (!parsed) return std::unexpected(parsed.error());
    const auto& p = *parsed;
    const auto& command = args[0];

    json cmd = {{"cmd", command}};

    if (command == "status" || command == "profiles" || command == "runners" ||
        command == "audio" || command == "text" || command == "undo" || command == "redo" ||
        command == "record_start" || command == "record_cancel") {
        return cmd;
    }

    if (command == "history") {
        int limit = 10;
        if (auto* l = option(p, "--limit")) {
            auto v = parse_uint(*l, "--limit");
            if (!v) return std::unexpected(v.error());
            limit = static_cast<int>(*v);
        }
        cmd["limit"] = limit;
        return cmd;
    }

    if (command == "add_profile") {
        if (auto r = need(p, 1, "add_profile <profile> [--name NAME] [--param key=value]..."); !r) return r;
        cmd["profile"] = p.positional[0];
        if (auto* n = option(p, "--name")) cmd["name"] = *n;
        json params = json::object();
        for (auto& [flag, value] : p.options) {
            if (flag != "--param") continue;
            auto kv = parse_param(value);
            if (!kv) return std::unexpected(kv.error());
            params[kv->first] = kv->second;
        }
        cmd["params"] = std::move(params);
        return cmd;
    }

    if (command == "remove_profile") {
        if (auto r = need(p, 1, "remove_profile <runner>"); !r) return r;
        cmd["runner"] = p.positional[0];
        return cmd;
    }

    if (command == "load_audio") {
        if (auto r = need(p, 1, "load_audio <path> [--name NAME]"); !r) return r;
        cmd["path"] = p.positional[0];
        if (auto* n = option(p, "--name")) cmd["name"] = *n;
        return cmd;
    }

    if (command == "save_audio") {
        if (auto r = need(p, 2, "save_audio <audio> <path> [--format pcm16|float32]"); !r) return r;
        cmd["audio"] = p.positional[0];
        cmd["path"] = p.positional[1];
        if (auto* f = option(p, "--format")) cmd["format"] = *f;
        return cmd;
    }

    if (command == "remove_audio") {
        if (auto r = need(p, 1, "remove_audio <audio>"); !r) return r;
        cmd["audio"] = p.positional[0];
        return cmd;
    }

    if (command == "record_stop") {
        cmd["wait"] = has_switch(p, "--wait");
        return cmd;
    }

    if (command == "run") {
        if (auto r = need(p, 1, "run <runner> [audio] [--wait]"); !r) return r;
        cmd["runner"] = p.positional[0];
        if (p.positional.size() > 1) cmd["audio"] = p.positional[1];
        cmd["wait"] = has_switch(p, "--wait");
        return cmd;
    }

    if (command == "cancel" || command == "job") {
        if (auto r = need(p, 1, "cancel|job <job-id>"); !r) return r;
        auto id = parse_uint(p.positional[0], "job id");
        if (!id) return std::unexpected(id.error());
        cmd["job"] = *id;
        return cmd;
    }

    if (command == "insert") {
        if (auto r = need(p, 1, "insert <text> [--offset N]"); !r) return r;
        cmd["text"] = p.positional[0];
        if (auto* o = option(p, "--offset")) {
            auto v = parse_uint(*o, "--offset");
            if (!v) return std::unexpected(v.error());
            cmd["offset"] = *v;
        }
        return cmd;
    }

    if (command == "erase") {
        if (auto r = need(p, 2, "erase <offset> <count>"); !r) return r;
        auto offset = parse_uint(p.positional[0], "offset");
        if (!offset) return std::unexpected(offset.error());
        auto count = parse_uint(p.positional[1], "count");
        if (!count) return std::unexpected(count.error());
        cmd["offset"] = *offset;
        cmd["count"] = *count;
        return cmd;
    }

    if (command == "caret") {
        if (!p.positional.empty()) {
            auto v = parse_uint(p.positional[0], "offset");
            if (!v) return std::unexpected(v.error());
            cmd["offset"] = *v;
        }
        return cmd;
    }

    if (command == "open_text") {
        if (auto r = need(p, 1, "open_text <path> [--force]"); !r) return r;
        cmd["path"] = p.positional[0];
        if (has_switch(p, "--force")) cmd["force"] = true;
        return cmd;
    }

    if (command == "insert_file") {
        if (auto r = need(p, 1, "insert_file <path>"); !r) return r;
        cmd["path"] = p.positional[0];
        return cmd;
    }

    if (command == "save_text") {
        if (!p.positional.empty()) cmd["path"] = p.positional[0];
        return cmd;
    }

    return std::unexpected(std::format("unknown command: {}", command));
}

bool expects_stream(const json& request) {
    auto cmd = request.value("cmd", "");
    return (cmd == "run" || cmd == "record_stop") && request.value("wait", false);
}

void print_usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  status                                   Show daemon status");
    std::println(stderr, "  profiles                                 List profile types and parameters");
    std::println(stderr, "  add_profile <profile> [--name N] [--param k=v]...");
    std::println(stderr, "  remove_profile <runner>");
    std::println(stderr, "  runners                                  List configured runners");
    std::println(stderr, "  load_audio <path> [--name N]             Decode a WAV file");
    std::println(stderr, "  save_audio <audio> <path> [--format pcm16|float32]");
    std::println(stderr, "  remove_audio <audio>");
    std::println(stderr, "  audio                                    List audio clips");
    std::println(stderr, "  record_start | record_stop [--wait] | record_cancel");
    std::println(stderr, "  run <runner> [audio] [--wait]            Transcribe a clip into the document");
    std::println(stderr, "  cancel <job> | job <job>");
    std::println(stderr, "  text | insert <text> [--offset N] | erase <offset> <count>");
    std::println(stderr, "  caret [offset] | undo | redo");
    std::println(stderr, "  open_text <path> [--force] | insert_file <path> | save_text [path]");
    std::println(stderr, "  history [--limit N]                      Show delivered jobs");
}
