#include "config_merge.hpp"

#include "args.hpp"

#include <print>

namespace {

constexpr int kUnsetDeviceIndex = -1;

void bind_device(const ConfigStore& config, AudioRecorder& recorder,
                 const char* disable_key, const char* index_key, const char* label) {
    if (config.get_bool("General", disable_key)) return;

    int index = config.get_int("General", index_key);
    if (index == kUnsetDeviceIndex) return;

    std::println("[INFO] Override default {} with device specified in parameters file.", label);
    if (!recorder.set_device(index)) {
        std::println(stderr, "audio: could not select {} device {}, using default", label, index);
    }
}

} // namespace

void apply_request(const Request& req, ConfigStore& config) {
    // Command line key wins over the saved one, for this run only.
    if (req.api_key) {
        config.set("OpenAI", "api_key", *req.api_key);
    }

    std::string model = req.model.value_or(std::string(kDefaultModel));
    config.set("OpenAI", "local_transcripton_model_file", model);
    config.set("WhisperCpp", "local_transcripton_model_file", model);

    if (req.api) {
        config.set("General", "use_api", true);
    }
    if (req.disable_mic) {
        config.set("General", "disable_mic", true);
    }
    if (req.mic_device_index) {
        config.set("General", "mic_device_index", *req.mic_device_index);
    }
    if (req.disable_speaker) {
        config.set("General", "disable_speaker", true);
    }
    if (req.speaker_device_index) {
        config.set("General", "speaker_device_index", *req.speaker_device_index);
    }
}

void bind_audio_devices(const ConfigStore& config, AudioRecorder& mic, AudioRecorder& speaker) {
    bind_device(config, mic, "disable_mic", "mic_device_index", "microphone");
    bind_device(config, speaker, "disable_speaker", "speaker_device_index", "speaker");
}
