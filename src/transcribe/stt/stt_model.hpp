#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

class SttModel {
public:
    virtual ~SttModel() = default;

    virtual std::string_view name() const = 0;

    // Runs inference on an audio file and returns the engine's raw response.
    virtual std::expected<nlohmann::json, std::string>
        get_transcription(const std::string& path) = 0;

    // Extracts plain text from a response, empty if it carries none.
    virtual std::string process_response(const nlohmann::json& response) const = 0;
};
