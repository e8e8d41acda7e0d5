#include "stt/whisper_cpp_model.hpp"

#include "stt/http_client.hpp"
#include "utilities.hpp"

#include <curl/curl.h>

using json = nlohmann::json;

WhisperCppModel::WhisperCppModel(std::string server_url, std::string model_file,
                                 std::string language)
    : url_(std::move(server_url)), model_file_(std::move(model_file)),
      language_(std::move(language)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

WhisperCppModel::~WhisperCppModel() {
    curl_global_cleanup();
}

std::expected<json, std::string> WhisperCppModel::get_transcription(const std::string& path) {
    auto audio = http::read_file(path);
    if (!audio) return std::unexpected(audio.error());
    if (audio->empty()) return std::unexpected("empty audio");

    std::vector<http::FormPart> parts = {
        {"file", std::move(*audio), "audio.wav", "audio/wav"},
        {"temperature", "0.0", "", ""},
        {"response_format", "json", "", ""},
    };
    if (!language_.empty()) {
        parts.push_back({"language", language_, "", ""});
    }

    auto resp = http::post_form(url_ + "/inference", parts, {});
    if (!resp) return std::unexpected(resp.error());

    try {
        auto j = json::parse(resp->body);
        if (j.contains("error")) {
            return std::unexpected("server error: " + j["error"].get<std::string>());
        }
        if (!j.contains("text")) {
            return std::unexpected("unexpected response: " + resp->body);
        }
        return j;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

std::string WhisperCppModel::process_response(const json& response) const {
    if (!response.contains("text") || !response["text"].is_string()) return {};
    return trim(response["text"].get<std::string>());
}
