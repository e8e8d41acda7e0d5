#include "batch_tasks.hpp"

#include "config_store.hpp"
#include "duration.hpp"
#include "utilities.hpp"

#include <fstream>
#include <print>
#include <system_error>

namespace fs = std::filesystem;

namespace {

BatchOutcome transcription_failed(BatchContext& ctx, const std::string& input,
                                  const std::string& reason) {
    if (!reason.empty()) {
        std::println(stderr, "stt: {}", reason);
    }
    std::println(ctx.out, "Error during Transcription!");
    std::println(ctx.out, "Please ensure {} is an audio file.", input);
    return BatchOutcome::exit(1);
}

} // namespace

BatchTask select_batch_task(const Request& req) {
    if (req.list_devices) return BatchTask::ListDevices;
    if (req.save_api_key) return BatchTask::SaveApiKey;
    if (req.transcribe) return BatchTask::Transcribe;
    return BatchTask::None;
}

BatchOutcome dispatch_batch_tasks(const Request& req, BatchContext& ctx) {
    auto task = select_batch_task(req);
    if (req.output_file && task != BatchTask::Transcribe) {
        std::println(stderr, "args: --output_file is only valid with --transcribe, ignoring");
    }

    switch (task) {
        case BatchTask::ListDevices: return list_devices(ctx);
        case BatchTask::SaveApiKey: return save_api_key(*req.save_api_key, ctx);
        case BatchTask::Transcribe: return transcribe_file(req, ctx);
        case BatchTask::None: break;
    }
    return BatchOutcome::proceed();
}

BatchOutcome list_devices(BatchContext& ctx) {
    std::println(ctx.out, "\n\nList all audio drivers and devices on this machine");
    auto res = ctx.devices.print_detailed_info(ctx.out);
    if (!res) {
        std::println(stderr, "audio: device listing failed: {}", res.error());
        return BatchOutcome::exit(1);
    }
    return BatchOutcome::exit(0);
}

BatchOutcome save_api_key(const std::string& key, BatchContext& ctx) {
    auto store = ConfigStore::load(ctx.override_path);
    if (!store) {
        std::println(ctx.out, "Failed to load override file: {}.", store.error().path);
        std::println(ctx.out, "Error: {}", store.error().message);
        return BatchOutcome::exit(1);
    }

    store->set_override("OpenAI", "api_key", key);

    auto saved = store->save();
    if (!saved) {
        std::println(ctx.out, "Failed to save override file: {}.", saved.error().path);
        std::println(ctx.out, "Error: {}", saved.error().message);
        return BatchOutcome::exit(1);
    }

    std::println(ctx.out, "Saved API Key to {}", ctx.override_path.string());
    return BatchOutcome::exit(0);
}

BatchOutcome transcribe_file(const Request& req, BatchContext& ctx) {
    Duration timer("Transcription", /*log=*/false, /*screen=*/true, ctx.out);

    const std::string& input = *req.transcribe;
    std::string output = req.output_file.value_or(std::string(kDefaultOutputFile));

    std::println(ctx.out, "Converting the audio file {} to text.", input);

    std::error_code ec;
    auto size = fs::file_size(input, ec);
    if (ec) {
        return transcription_failed(ctx, input, input + ": " + ec.message());
    }
    std::println(ctx.out, "{} file size {}.", input, natural_size(size));
    std::println(ctx.out, "Text output will be produced in {}.", output);

    std::string file_path = input;
    if (req.speech_to_text == SttEngine::WhisperCpp) {
        auto converted = ctx.transcriber.convert_wav_to_16khz_format(input);
        if (!converted) {
            return transcription_failed(ctx, input, converted.error());
        }
        file_path = std::move(*converted);
    }

    auto& model = ctx.transcriber.stt_model();
    auto results = model.get_transcription(file_path);
    if (file_path != input) {
        fs::remove(file_path, ec);
    }
    if (!results) {
        return transcription_failed(ctx, input, results.error());
    }

    std::string text = model.process_response(*results);
    if (text.empty()) {
        return transcription_failed(ctx, input, "no text in response");
    }

    std::ofstream f(output, std::ios::trunc);
    if (!f.is_open()) {
        return transcription_failed(ctx, input, "could not open " + output + " for writing");
    }
    f << text << '\n';
    f.close();
    if (f.fail()) {
        if (fs::is_regular_file(output, ec)) fs::remove(output, ec);
        return transcription_failed(ctx, input, "write to " + output + " failed");
    }

    std::println(ctx.out, "Complete!");
    return BatchOutcome::exit(0);
}
