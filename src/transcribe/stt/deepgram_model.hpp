#pragma once

#include "stt/stt_model.hpp"

// Deepgram pre-recorded audio API.
class DeepgramModel : public SttModel {
public:
    DeepgramModel(std::string base_url, std::string api_key, std::string model,
                  std::string language = "en");
    ~DeepgramModel() override;

    std::string_view name() const override { return "deepgram"; }

    std::expected<nlohmann::json, std::string>
        get_transcription(const std::string& path) override;

    std::string process_response(const nlohmann::json& response) const override;

private:
    std::string base_url_;
    std::string api_key_;
    std::string model_;
    std::string language_;
};
