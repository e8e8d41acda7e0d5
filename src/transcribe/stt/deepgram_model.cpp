#include "stt/deepgram_model.hpp"

#include "stt/http_client.hpp"
#include "utilities.hpp"

#include <curl/curl.h>

using json = nlohmann::json;

DeepgramModel::DeepgramModel(std::string base_url, std::string api_key, std::string model,
                             std::string language)
    : base_url_(std::move(base_url)), api_key_(std::move(api_key)),
      model_(std::move(model)), language_(std::move(language)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

DeepgramModel::~DeepgramModel() {
    curl_global_cleanup();
}

std::expected<json, std::string> DeepgramModel::get_transcription(const std::string& path) {
    if (api_key_.empty()) {
        return std::unexpected("no Deepgram API key configured");
    }

    auto audio = http::read_file(path);
    if (!audio) return std::unexpected(audio.error());

    std::string url = base_url_ + "/listen?smart_format=true&model=" + model_;
    if (!language_.empty()) url += "&language=" + language_;

    http::Options opts;
    opts.headers.push_back("Authorization: Token " + api_key_);

    auto resp = http::post_body(url, *audio, "audio/wav", opts);
    if (!resp) return std::unexpected(resp.error());

    try {
        auto j = json::parse(resp->body);
        if (resp->status >= 400) {
            std::string msg = j.value("err_msg", j.value("reason", resp->body));
            return std::unexpected("server error (" + std::to_string(resp->status) + "): " + msg);
        }
        return j;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

std::string DeepgramModel::process_response(const json& response) const {
    // results.channels[0].alternatives[0].transcript
    auto ptr = json::json_pointer("/results/channels/0/alternatives/0/transcript");
    if (!response.contains(ptr) || !response[ptr].is_string()) return {};
    return trim(response[ptr].get<std::string>());
}
