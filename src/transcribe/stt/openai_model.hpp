#pragma once

#include "stt/stt_model.hpp"

// OpenAI audio transcription API, or any local server speaking the same
// /audio/transcriptions protocol.
class OpenAiModel : public SttModel {
public:
    // base_url includes the version prefix, e.g. "https://api.openai.com/v1".
    OpenAiModel(std::string base_url, std::string api_key, std::string model,
                std::string language = "en", bool require_key = true);
    ~OpenAiModel() override;

    std::string_view name() const override { return "openai"; }

    std::expected<nlohmann::json, std::string>
        get_transcription(const std::string& path) override;

    std::string process_response(const nlohmann::json& response) const override;

    const std::string& model() const { return model_; }
    const std::string& base_url() const { return base_url_; }

private:
    std::string base_url_;
    std::string api_key_;
    std::string model_;
    std::string language_;
    bool require_key_;
};
