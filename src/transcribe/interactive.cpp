#include "interactive.hpp"

#include "session.hpp"

#include <print>
#include <string>
#include <vector>

namespace {

struct Source {
    const char* label;
    AudioRecorder& recorder;
    Session session;
};

} // namespace

int run_interactive(const ConfigStore& config, AudioRecorder& mic, AudioRecorder& speaker,
                    Transcriber& transcriber, std::istream& input) {
    std::vector<Source> sources;
    if (!config.get_bool("General", "disable_mic")) sources.push_back({"You", mic, Session(mic)});
    if (!config.get_bool("General", "disable_speaker")) sources.push_back({"Speaker", speaker, Session(speaker)});

    if (sources.empty()) {
        std::println("Both microphone and speaker are disabled, nothing to transcribe.");
        return 0;
    }

    std::string line;
    for (;;) {
        for (auto& src : sources) {
            if (!src.session.start_recording()) {
                std::println(stderr, "audio: could not start {} capture", src.label);
                return 1;
            }
        }

        std::println("Recording... press Enter to transcribe, Ctrl+D to quit.");
        bool more = static_cast<bool>(std::getline(input, line));

        for (auto& src : sources) {
            double seconds = src.session.recording_duration();
            auto samples = src.session.stop_recording();
            if (samples.empty()) {
                src.session.set_idle();
                continue;
            }

            auto text = transcriber.transcribe_samples(samples, src.recorder.sample_rate());
            if (!text) {
                std::println(stderr, "stt: {} transcription failed after {:.1f}s of audio: {}",
                             src.label, seconds, text.error());
            } else if (!text->empty()) {
                std::println("[{}] {}", src.label, *text);
            }
            src.session.set_idle();
        }

        if (!more) break;
    }

    return 0;
}
