#include "args.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <iterator>
#include <vector>

namespace {

enum class Opt {
    Api,
    Experimental,
    SpeechToText,
    ChatProvider,
    ApiKey,
    SaveApiKey,
    Transcribe,
    OutputFile,
    Model,
    ListDevices,
    MicDeviceIndex,
    SpeakerDeviceIndex,
    DisableMic,
    DisableSpeaker,
    Help,
};

struct OptionSpec {
    Opt id;
    std::string_view short_name;
    std::string_view long_name;
    bool takes_value;
    std::string_view metavar;
    std::string_view help;
};

constexpr OptionSpec kOptions[] = {
    {Opt::Help, "-h", "--help", false, "",
     "Show this help message and exit."},
    {Opt::Api, "-a", "--api", false, "",
     "Use the online Open AI API for transcription.\n"
     "This option requires an API KEY and will consume Open AI credits."},
    {Opt::Experimental, "-e", "--experimental", false, "",
     "Experimental command line argument. Behavior is undefined."},
    {Opt::SpeechToText, "-stt", "--speech_to_text", true, "{whisper,whisper.cpp,deepgram}",
     "Specify the Speech to text Engine.\n"
     "Local STT models tend to perform best for response times.\n"
     "API based STT models tend to perform best for accuracy."},
    {Opt::ChatProvider, "-c", "--chat-inference-provider", true, "{openai,together}",
     "Specify the Chat Inference engine."},
    {Opt::ApiKey, "-k", "--api_key", true, "API_KEY",
     "API Key for accessing OpenAI APIs. This is an optional parameter.\n"
     "Without the API Key only transcription works.\n"
     "This option will not save the API key anywhere, to persist the API key use the -sk option."},
    {Opt::SaveApiKey, "-sk", "--save_api_key", true, "SAVE_API_KEY",
     "Save the API key for accessing OpenAI APIs to the override file.\n"
     "Subsequent invocations of the program will not require API key on command line.\n"
     "To not persist the API key use the -k option."},
    {Opt::Transcribe, "-t", "--transcribe", true, "TRANSCRIBE",
     "Transcribe the given audio file to generate text.\n"
     "This option respects the -m (model) option.\n"
     "Output is produced in transcription.txt or file specified using the -o option."},
    {Opt::OutputFile, "-o", "--output_file", true, "OUTPUT_FILE",
     "Generate output in this file.\n"
     "This option is valid only for the -t (transcribe) option."},
    {Opt::Model, "-m", "--model", true,
     "{tiny,base,small,medium,large-v1,large-v2,large-v3,large}",
     "Specify the local transcription model file to use."},
    {Opt::ListDevices, "-l", "--list_devices", false, "",
     "List all audio drivers and audio devices on this machine.\n"
     "Use this list index to select the microphone, speaker device for transcription."},
    {Opt::MicDeviceIndex, "-mi", "--mic_device_index", true, "MIC_DEVICE_INDEX",
     "Device index of the microphone for capturing sound.\n"
     "Device index can be obtained using the -l option."},
    {Opt::SpeakerDeviceIndex, "-si", "--speaker_device_index", true, "SPEAKER_DEVICE_INDEX",
     "Device index of the speaker for capturing sound.\n"
     "Device index can be obtained using the -l option."},
    {Opt::DisableMic, "-dm", "--disable_mic", false, "",
     "Disable transcription from Microphone"},
    {Opt::DisableSpeaker, "-ds", "--disable_speaker", false, "",
     "Disable transcription from Speaker"},
};

const OptionSpec* find_option(std::string_view name) {
    for (const auto& opt : kOptions) {
        if (name == opt.short_name || name == opt.long_name) return &opt;
    }
    return nullptr;
}

std::string option_label(const OptionSpec& opt) {
    return std::format("{}/{}", opt.short_name, opt.long_name);
}

UsageError invalid_choice(const OptionSpec& opt, std::string_view value,
                          std::span<const std::string_view> choices) {
    std::string list;
    for (auto c : choices) {
        if (!list.empty()) list += ", ";
        list += std::format("'{}'", c);
    }
    return {std::format("argument {}: invalid choice: '{}' (choose from {})",
                        option_label(opt), value, list)};
}

std::expected<int, UsageError> parse_int(const OptionSpec& opt, std::string_view value) {
    int out = 0;
    auto* first = value.data();
    auto* last = value.data() + value.size();
    if (!value.empty() && *first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (value.empty() || ec != std::errc{} || ptr != last) {
        return std::unexpected(UsageError{
            std::format("argument {}: invalid int value: '{}'", option_label(opt), value)});
    }
    return out;
}

std::expected<void, UsageError> apply(Request& req, const OptionSpec& opt,
                                      std::string_view value) {
    switch (opt.id) {
        case Opt::Help: req.show_help = true; break;
        case Opt::Api: req.api = true; break;
        case Opt::Experimental: req.experimental = true; break;
        case Opt::ListDevices: req.list_devices = true; break;
        case Opt::DisableMic: req.disable_mic = true; break;
        case Opt::DisableSpeaker: req.disable_speaker = true; break;
        case Opt::ApiKey: req.api_key = std::string(value); break;
        case Opt::SaveApiKey: req.save_api_key = std::string(value); break;
        case Opt::Transcribe: req.transcribe = std::string(value); break;
        case Opt::OutputFile: req.output_file = std::string(value); break;

        case Opt::SpeechToText: {
            static constexpr std::string_view choices[] = {"whisper", "whisper.cpp", "deepgram"};
            if (value == "whisper") req.speech_to_text = SttEngine::Whisper;
            else if (value == "whisper.cpp") req.speech_to_text = SttEngine::WhisperCpp;
            else if (value == "deepgram") req.speech_to_text = SttEngine::Deepgram;
            else return std::unexpected(invalid_choice(opt, value, choices));
            break;
        }

        case Opt::ChatProvider: {
            static constexpr std::string_view choices[] = {"openai", "together"};
            if (value == "openai") req.chat_inference_provider = ChatProvider::OpenAI;
            else if (value == "together") req.chat_inference_provider = ChatProvider::Together;
            else return std::unexpected(invalid_choice(opt, value, choices));
            break;
        }

        case Opt::Model:
            if (std::ranges::find(kModelSizes, value) == std::end(kModelSizes)) {
                return std::unexpected(invalid_choice(opt, value, kModelSizes));
            }
            req.model = std::string(value);
            break;

        case Opt::MicDeviceIndex: {
            auto idx = parse_int(opt, value);
            if (!idx) return std::unexpected(idx.error());
            req.mic_device_index = *idx;
            break;
        }

        case Opt::SpeakerDeviceIndex: {
            auto idx = parse_int(opt, value);
            if (!idx) return std::unexpected(idx.error());
            req.speaker_device_index = *idx;
            break;
        }
    }
    return {};
}

} // namespace

std::string_view to_string(SttEngine engine) {
    switch (engine) {
        case SttEngine::Whisper: return "whisper";
        case SttEngine::WhisperCpp: return "whisper.cpp";
        case SttEngine::Deepgram: return "deepgram";
    }
    return "unknown";
}

std::string_view to_string(ChatProvider provider) {
    switch (provider) {
        case ChatProvider::OpenAI: return "openai";
        case ChatProvider::Together: return "together";
    }
    return "unknown";
}

std::expected<Request, UsageError> parse_args(std::span<const std::string_view> args) {
    Request req;

    for (size_t i = 0; i < args.size(); i++) {
        std::string_view arg = args[i];
        std::string_view name = arg;
        std::optional<std::string_view> inline_value;

        // --flag=value
        if (arg.starts_with("--")) {
            auto eq = arg.find('=');
            if (eq != std::string_view::npos) {
                name = arg.substr(0, eq);
                inline_value = arg.substr(eq + 1);
            }
        }

        const OptionSpec* opt = arg.starts_with('-') ? find_option(name) : nullptr;
        if (!opt) {
            return std::unexpected(UsageError{std::format("unrecognized arguments: {}", arg)});
        }

        std::string_view value;
        if (opt->takes_value) {
            if (inline_value) {
                value = *inline_value;
            } else if (i + 1 < args.size() && !find_option(args[i + 1])) {
                value = args[++i];
            } else {
                return std::unexpected(UsageError{
                    std::format("argument {}: expected one argument", option_label(*opt))});
            }
        } else if (inline_value) {
            return std::unexpected(UsageError{
                std::format("argument {}: ignored explicit argument '{}'",
                            option_label(*opt), *inline_value)});
        }

        auto res = apply(req, *opt, value);
        if (!res) return std::unexpected(res.error());
    }

    return req;
}

std::expected<Request, UsageError> parse_args(int argc, char* argv[]) {
    std::vector<std::string_view> args;
    for (int i = 1; i < argc; i++) args.emplace_back(argv[i]);
    return parse_args(args);
}

std::string usage_text(std::string_view prog) {
    std::string out = std::format("Usage: {} [options]\n\n"
                                  "Command Line Arguments for Transcribe\n\n"
                                  "Options:\n", prog);
    for (const auto& opt : kOptions) {
        out += std::format("  {}, {}", opt.short_name, opt.long_name);
        if (opt.takes_value) out += std::format(" {}", opt.metavar);
        out += '\n';

        std::string_view help = opt.help;
        while (!help.empty()) {
            auto nl = help.find('\n');
            out += std::format("        {}\n", help.substr(0, nl));
            if (nl == std::string_view::npos) break;
            help.remove_prefix(nl + 1);
        }
    }
    return out;
}
