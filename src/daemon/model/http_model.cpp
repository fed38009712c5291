#include "model/http_model.hpp"
#include "audio/wav_codec.hpp"

#include <curl/curl.h>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

void add_field(curl_mime* mime, const char* name, const std::string& value) {
    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}

} // namespace

HttpSpeechModel::HttpSpeechModel(Settings settings)
    : settings_(std::move(settings)) {}

std::string HttpSpeechModel::name() const {
    if (settings_.api_format == "openai") {
        return std::format("{} @ {}", settings_.model.empty() ? "openai" : settings_.model, settings_.url);
    }
    return std::format("whisper.cpp @ {}", settings_.url);
}

std::expected<std::string, Error>
HttpSpeechModel::transcribe(std::span<const float> mono, std::stop_token stop) {
    if (mono.empty()) {
        return std::unexpected(Error{ErrorCode::EmptyAudio, "empty window"});
    }

    auto wav_data = wav::encode(mono, settings_.sample_rate, 1);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(Error{ErrorCode::Model, "curl_easy_init failed"});
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);

    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    if (settings_.api_format == "openai") {
        endpoint = settings_.url + "/v1/audio/transcriptions";
        add_field(mime, "model", settings_.model.empty() ? "whisper-1" : settings_.model);
    } else {
        endpoint = settings_.url + "/inference";
        add_field(mime, "temperature", "0.0");
    }

    add_field(mime, "response_format", "json");
    if (!settings_.language.empty()) {
        add_field(mime, "language", settings_.language);
    }
    if (!settings_.device.empty()) {
        add_field(mime, "device", settings_.device);
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(settings_.timeout_s));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);

    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected(Error{ErrorCode::Model, "request cancelled"});
    }
    if (res != CURLE_OK) {
        return std::unexpected(Error{ErrorCode::Model, std::string("curl error: ") + curl_easy_strerror(res)});
    }

    json j = json::parse(response_body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::unexpected(Error{ErrorCode::Model,
                                     std::format("HTTP {}: unexpected response: {}", http_status, response_body)});
    }

    if (j.contains("error")) {
        const auto& err = j["error"];
        std::string msg = err.is_string() ? err.get<std::string>()
                        : err.is_object() ? err.value("message", err.dump())
                        : err.dump();
        return std::unexpected(Error{ErrorCode::Model, "server error: " + msg});
    }
    if (!j.contains("text") || !j["text"].is_string()) {
        return std::unexpected(Error{ErrorCode::Model, "unexpected response: " + response_body});
    }

    return trim(j["text"].get<std::string>());
}
