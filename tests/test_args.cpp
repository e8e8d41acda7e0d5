#include <catch2/catch_test_macros.hpp>

#include "args.hpp"

#include <string_view>
#include <vector>

namespace {

std::expected<Request, UsageError> parse(std::vector<std::string_view> args) {
    return parse_args(args);
}

} // namespace

TEST_CASE("parse_args", "[args]") {

    SECTION("Defaults") {
        auto req = parse({});
        REQUIRE(req.has_value());
        REQUIRE_FALSE(req->api);
        REQUIRE(req->speech_to_text == SttEngine::Whisper);
        REQUIRE(req->chat_inference_provider == ChatProvider::OpenAI);
        REQUIRE_FALSE(req->api_key);
        REQUIRE_FALSE(req->save_api_key);
        REQUIRE_FALSE(req->transcribe);
        REQUIRE_FALSE(req->output_file);
        REQUIRE_FALSE(req->model);
        REQUIRE_FALSE(req->list_devices);
        REQUIRE_FALSE(req->mic_device_index);
        REQUIRE_FALSE(req->speaker_device_index);
        REQUIRE_FALSE(req->disable_mic);
        REQUIRE_FALSE(req->disable_speaker);
    }

    SECTION("LongFlags") {
        auto req = parse({"--api", "--speech_to_text", "deepgram",
                          "--chat-inference-provider", "together",
                          "--api_key", "sk-1", "--model", "large-v3",
                          "--mic_device_index", "3", "--speaker_device_index", "-1",
                          "--disable_mic", "--disable_speaker", "--list_devices"});
        REQUIRE(req.has_value());
        REQUIRE(req->api);
        REQUIRE(req->speech_to_text == SttEngine::Deepgram);
        REQUIRE(req->chat_inference_provider == ChatProvider::Together);
        REQUIRE(req->api_key == "sk-1");
        REQUIRE(req->model == "large-v3");
        REQUIRE(req->mic_device_index == 3);
        REQUIRE(req->speaker_device_index == -1);
        REQUIRE(req->disable_mic);
        REQUIRE(req->disable_speaker);
        REQUIRE(req->list_devices);
    }

    SECTION("ShortAliases") {
        auto req = parse({"-a", "-e", "-stt", "whisper.cpp", "-c", "openai", "-k", "key",
                          "-sk", "saved", "-t", "in.wav", "-o", "out.txt", "-m", "tiny",
                          "-l", "-mi", "1", "-si", "2", "-dm", "-ds"});
        REQUIRE(req.has_value());
        REQUIRE(req->api);
        REQUIRE(req->experimental);
        REQUIRE(req->speech_to_text == SttEngine::WhisperCpp);
        REQUIRE(req->api_key == "key");
        REQUIRE(req->save_api_key == "saved");
        REQUIRE(req->transcribe == "in.wav");
        REQUIRE(req->output_file == "out.txt");
        REQUIRE(req->model == "tiny");
        REQUIRE(req->list_devices);
        REQUIRE(req->mic_device_index == 1);
        REQUIRE(req->speaker_device_index == 2);
        REQUIRE(req->disable_mic);
        REQUIRE(req->disable_speaker);
    }

    SECTION("EqualsForm") {
        auto req = parse({"--model=small", "--transcribe=a b.wav"});
        REQUIRE(req.has_value());
        REQUIRE(req->model == "small");
        REQUIRE(req->transcribe == "a b.wav");
    }

    SECTION("EveryModelTierAccepted") {
        for (auto tier : kModelSizes) {
            auto req = parse({"-m", tier});
            REQUIRE(req.has_value());
            REQUIRE(req->model == tier);
        }
    }

    SECTION("OutputFileWithoutTranscribeIsAccepted") {
        auto req = parse({"-o", "out.txt"});
        REQUIRE(req.has_value());
        REQUIRE(req->output_file == "out.txt");
        REQUIRE_FALSE(req->transcribe);
    }

    SECTION("Help") {
        auto req = parse({"--help"});
        REQUIRE(req.has_value());
        REQUIRE(req->show_help);
    }

    SECTION("InvalidModel") {
        auto req = parse({"--model", "huge"});
        REQUIRE_FALSE(req.has_value());
        REQUIRE(req.error().message.find("invalid choice: 'huge'") != std::string::npos);
    }

    SECTION("InvalidEngine") {
        REQUIRE_FALSE(parse({"-stt", "vosk"}).has_value());
        REQUIRE_FALSE(parse({"-c", "anthropic"}).has_value());
    }

    SECTION("InvalidDeviceIndex") {
        auto req = parse({"-mi", "two"});
        REQUIRE_FALSE(req.has_value());
        REQUIRE(req.error().message.find("invalid int value") != std::string::npos);
        REQUIRE_FALSE(parse({"-si", "3x"}).has_value());
    }

    SECTION("UnknownFlag") {
        auto req = parse({"--frobnicate"});
        REQUIRE_FALSE(req.has_value());
        REQUIRE(req.error().message == "unrecognized arguments: --frobnicate");
    }

    SECTION("StrayPositional") {
        REQUIRE_FALSE(parse({"file.wav"}).has_value());
    }

    SECTION("MissingValue") {
        REQUIRE_FALSE(parse({"--transcribe"}).has_value());
        REQUIRE_FALSE(parse({"-k", "-a"}).has_value());
    }

    SECTION("BooleanRejectsValue") {
        REQUIRE_FALSE(parse({"--api=yes"}).has_value());
    }

    SECTION("UsageListsEveryFlag") {
        auto text = usage_text("transcribe");
        for (auto flag : {"--api", "--speech_to_text", "--chat-inference-provider", "--api_key",
                          "--save_api_key", "--transcribe", "--output_file", "--model",
                          "--list_devices", "--mic_device_index", "--speaker_device_index",
                          "--disable_mic", "--disable_speaker"}) {
            REQUIRE(text.find(flag) != std::string::npos);
        }
    }
}
