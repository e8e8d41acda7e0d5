#include "args.hpp"
#include "batch_tasks.hpp"
#include "config_merge.hpp"
#include "config_store.hpp"
#include "interactive.hpp"
#include "platform/linux/pipewire_devices.hpp"
#include "platform/linux/pipewire_recorder.hpp"
#include "platform/platform_paths.hpp"
#include "stt/transcriber.hpp"

#include <iostream>
#include <print>

int main(int argc, char* argv[]) {
    const char* prog = argc > 0 ? argv[0] : "transcribe";

    auto req = parse_args(argc, argv);
    if (!req) {
        std::print(stderr, "{}", usage_text(prog));
        std::println(stderr, "{}: error: {}", prog, req.error().message);
        return 2;
    }
    if (req->show_help) {
        std::print("{}", usage_text(prog));
        return 0;
    }

    auto override_path = platform::override_file();
    auto config = ConfigStore::load(override_path);
    if (!config) {
        std::println(stderr, "config: failed to load {}: {}",
                     config.error().path, config.error().message);
        return 1;
    }

    apply_request(*req, *config);

    if (req->experimental) {
        std::println(stderr, "[INFO] experimental mode requested, behavior is undefined");
    }
    std::println(stderr, "[INFO] speech to text: {}, chat inference provider: {}",
                 to_string(req->speech_to_text), to_string(req->chat_inference_provider));

    PipeWireDeviceEnumerator devices;
    Transcriber transcriber(make_stt_model(req->speech_to_text, *config));

    BatchContext ctx{devices, transcriber, override_path};
    auto outcome = dispatch_batch_tasks(*req, ctx);
    if (outcome.should_exit()) {
        return outcome.exit_code;
    }

    PipeWireRecorder mic(devices, PipeWireRecorder::Role::Microphone);
    PipeWireRecorder speaker(devices, PipeWireRecorder::Role::Speaker);
    bind_audio_devices(*config, mic, speaker);

    return run_interactive(*config, mic, speaker, transcriber, std::cin);
}
