#pragma once

#include "platform/device_enumerator.hpp"
#include "request.hpp"
#include "stt/transcriber.hpp"

#include <cstdio>
#include <filesystem>
#include <string_view>

inline constexpr std::string_view kDefaultOutputFile = "transcription.txt";

enum class BatchTask { None, ListDevices, SaveApiKey, Transcribe };

// Result of dispatch: keep going with interactive startup, or exit with a code.
struct BatchOutcome {
    enum class Action { Continue, Exit };

    Action action = Action::Continue;
    int exit_code = 0;

    static BatchOutcome proceed() { return {}; }
    static BatchOutcome exit(int code) { return {Action::Exit, code}; }

    bool should_exit() const { return action == Action::Exit; }
};

struct BatchContext {
    DeviceEnumerator& devices;
    Transcriber& transcriber;
    std::filesystem::path override_path;
    std::FILE* out = stdout;
};

// Priority: list devices, then save API key, then transcribe.
BatchTask select_batch_task(const Request& req);

// Runs the one-shot action the request asks for, if any.
BatchOutcome dispatch_batch_tasks(const Request& req, BatchContext& ctx);

BatchOutcome list_devices(BatchContext& ctx);
BatchOutcome save_api_key(const std::string& key, BatchContext& ctx);
BatchOutcome transcribe_file(const Request& req, BatchContext& ctx);
