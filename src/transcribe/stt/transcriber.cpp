#include "stt/transcriber.hpp"

#include "stt/deepgram_model.hpp"
#include "stt/openai_model.hpp"
#include "stt/whisper_cpp_model.hpp"
#include "wav_file.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <format>
#include <print>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Creates an empty, uniquely named .wav file in the temp directory.
std::expected<fs::path, std::string> make_temp_wav(const std::string& prefix) {
    auto tmpl = (fs::temp_directory_path() / (prefix + "-XXXXXX.wav")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    int fd = mkstemps(buf.data(), 4);
    if (fd < 0) {
        return std::unexpected(std::format("could not create {}: {}", tmpl, std::strerror(errno)));
    }
    close(fd);
    return fs::path(buf.data());
}

} // namespace

Transcriber::Transcriber(std::unique_ptr<SttModel> model)
    : model_(std::move(model)) {}

std::expected<std::string, std::string>
Transcriber::convert_wav_to_16khz_format(const std::string& path) const {
    auto audio = wav::read_file(path);
    if (!audio) return std::unexpected(audio.error());

    if (audio->sample_rate == kWhisperCppSampleRate && audio->source_channels == 1 &&
        audio->source_bits == 16) {
        return path;
    }

    auto converted = wav::resample(audio->samples, audio->sample_rate, kWhisperCppSampleRate);
    auto out = make_temp_wav(fs::path(path).stem().string() + "_16khz");
    if (!out) return std::unexpected(out.error());

    auto res = wav::write_file(*out, converted, kWhisperCppSampleRate);
    if (!res) {
        std::error_code ec;
        fs::remove(*out, ec);
        return std::unexpected(res.error());
    }

    std::println(stderr, "wav: converted {} ({} Hz, {} ch) to {}",
                 path, audio->sample_rate, audio->source_channels, out->string());
    return out->string();
}

std::expected<std::string, std::string>
Transcriber::transcribe_samples(std::span<const int16_t> samples, uint32_t sample_rate) {
    if (samples.empty()) return std::unexpected("empty audio");

    auto tmp = make_temp_wav("transcribe-capture");
    if (!tmp) return std::unexpected(tmp.error());

    std::error_code ec;
    auto res = wav::write_file(*tmp, samples, sample_rate);
    if (!res) {
        fs::remove(*tmp, ec);
        return std::unexpected(res.error());
    }

    auto response = model_->get_transcription(tmp->string());
    fs::remove(*tmp, ec);
    if (!response) return std::unexpected(response.error());

    return model_->process_response(*response);
}

std::unique_ptr<SttModel> make_stt_model(SttEngine engine, const ConfigStore& config) {
    auto language = config.get_string("OpenAI", "audio_lang");

    switch (engine) {
        case SttEngine::WhisperCpp:
            return std::make_unique<WhisperCppModel>(
                config.get_string("WhisperCpp", "server_url"),
                config.get_string("WhisperCpp", "local_transcripton_model_file"),
                language);

        case SttEngine::Deepgram:
            return std::make_unique<DeepgramModel>(
                config.get_string("Deepgram", "base_url"),
                config.get_string("Deepgram", "api_key"),
                config.get_string("Deepgram", "model"),
                language);

        case SttEngine::Whisper:
            break;
    }

    if (config.get_bool("General", "use_api")) {
        return std::make_unique<OpenAiModel>(
            config.get_string("OpenAI", "base_url"),
            config.get_string("OpenAI", "api_key"),
            config.get_string("OpenAI", "api_transcription_model"),
            language);
    }

    return std::make_unique<OpenAiModel>(
        config.get_string("OpenAI", "local_server_url"),
        config.get_string("OpenAI", "api_key"),
        config.get_string("OpenAI", "local_transcripton_model_file"),
        language, /*require_key=*/false);
}
