#pragma once

#include "stt/stt_model.hpp"

// whisper.cpp server (examples/server) /inference endpoint. The server only
// accepts 16 kHz input.
class WhisperCppModel : public SttModel {
public:
    WhisperCppModel(std::string server_url, std::string model_file, std::string language = "en");
    ~WhisperCppModel() override;

    std::string_view name() const override { return "whisper.cpp"; }

    std::expected<nlohmann::json, std::string>
        get_transcription(const std::string& path) override;

    std::string process_response(const nlohmann::json& response) const override;

    const std::string& model_file() const { return model_file_; }

private:
    std::string url_;
    std::string model_file_;
    std::string language_;
};
