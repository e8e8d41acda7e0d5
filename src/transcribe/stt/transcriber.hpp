#pragma once

#include "config_store.hpp"
#include "request.hpp"
#include "stt/stt_model.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>

inline constexpr uint32_t kWhisperCppSampleRate = 16000;

class Transcriber {
public:
    explicit Transcriber(std::unique_ptr<SttModel> model);

    SttModel& stt_model() { return *model_; }

    // Writes a 16 kHz mono copy of a WAV file to a uniquely named file in the
    // temp directory and returns its path; the caller removes it. Files already
    // in that format are returned unchanged.
    std::expected<std::string, std::string>
        convert_wav_to_16khz_format(const std::string& path) const;

    // Transcribes captured samples by way of a temporary WAV file.
    std::expected<std::string, std::string>
        transcribe_samples(std::span<const int16_t> samples, uint32_t sample_rate);

private:
    std::unique_ptr<SttModel> model_;
};

// Builds the model for the selected engine from the effective configuration.
std::unique_ptr<SttModel> make_stt_model(SttEngine engine, const ConfigStore& config);
