#include "stt/openai_model.hpp"

#include "stt/http_client.hpp"
#include "utilities.hpp"

#include <curl/curl.h>
#include <filesystem>

using json = nlohmann::json;

OpenAiModel::OpenAiModel(std::string base_url, std::string api_key, std::string model,
                         std::string language, bool require_key)
    : base_url_(std::move(base_url)), api_key_(std::move(api_key)),
      model_(std::move(model)), language_(std::move(language)),
      require_key_(require_key) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

OpenAiModel::~OpenAiModel() {
    curl_global_cleanup();
}

std::expected<json, std::string> OpenAiModel::get_transcription(const std::string& path) {
    if (require_key_ && api_key_.empty()) {
        return std::unexpected("no OpenAI API key configured (use -k or -sk)");
    }

    auto audio = http::read_file(path);
    if (!audio) return std::unexpected(audio.error());

    std::vector<http::FormPart> parts = {
        {"file", std::move(*audio), std::filesystem::path(path).filename().string(), "audio/wav"},
        {"model", model_, "", ""},
        {"response_format", "json", "", ""},
    };
    if (!language_.empty()) {
        parts.push_back({"language", language_, "", ""});
    }

    http::Options opts;
    if (!api_key_.empty()) {
        opts.headers.push_back("Authorization: Bearer " + api_key_);
    }

    auto resp = http::post_form(base_url_ + "/audio/transcriptions", parts, opts);
    if (!resp) return std::unexpected(resp.error());

    try {
        auto j = json::parse(resp->body);
        if (resp->status >= 400 || j.contains("error")) {
            std::string msg = j.contains("error") && j["error"].is_object()
                ? j["error"].value("message", resp->body)
                : resp->body;
            return std::unexpected("server error (" + std::to_string(resp->status) + "): " + msg);
        }
        return j;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

std::string OpenAiModel::process_response(const json& response) const {
    if (response.contains("text") && response["text"].is_string()) {
        return trim(response["text"].get<std::string>());
    }

    // verbose_json responses from local servers may only carry segments.
    std::string text;
    if (response.contains("segments") && response["segments"].is_array()) {
        for (const auto& seg : response["segments"]) {
            if (!seg.contains("text") || !seg["text"].is_string()) continue;
            auto t = trim(seg["text"].get<std::string>());
            if (t.empty()) continue;
            if (!text.empty()) text += ' ';
            text += t;
        }
    }
    return text;
}
