#include <catch2/catch_test_macros.hpp>

#include "config_store.hpp"
#include "stt/deepgram_model.hpp"
#include "stt/openai_model.hpp"
#include "stt/transcriber.hpp"
#include "stt/whisper_cpp_model.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

TEST_CASE("OpenAiModel::process_response", "[stt]") {
    OpenAiModel model("https://api.openai.com/v1", "sk", "whisper-1");

    SECTION("Text") {
        REQUIRE(model.process_response(json{{"text", "  Hello there.\n"}}) == "Hello there.");
    }

    SECTION("SegmentsOnly") {
        json resp = {{"segments", json::array({
            {{"text", " one"}}, {{"text", "  "}}, {{"text", "two "}},
        })}};
        REQUIRE(model.process_response(resp) == "one two");
    }

    SECTION("NoText") {
        REQUIRE(model.process_response(json::object()).empty());
        REQUIRE(model.process_response(json{{"text", 42}}).empty());
    }

    SECTION("MissingKeyFailsBeforeNetwork") {
        OpenAiModel keyless("https://api.openai.com/v1", "", "whisper-1");
        auto res = keyless.get_transcription("/nonexistent.wav");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("API key") != std::string::npos);
    }

    SECTION("UnreadableFile") {
        auto res = model.get_transcription("/nonexistent/audio.wav");
        REQUIRE_FALSE(res.has_value());
    }
}

TEST_CASE("WhisperCppModel::process_response", "[stt]") {
    WhisperCppModel model("http://localhost:8080", "base");
    REQUIRE(model.process_response(json{{"text", " And so my fellow Americans\n"}}) ==
            "And so my fellow Americans");
    REQUIRE(model.process_response(json{{"error", "bad"}}).empty());
    REQUIRE_FALSE(model.get_transcription("/nonexistent/audio.wav").has_value());
}

TEST_CASE("DeepgramModel::process_response", "[stt]") {
    DeepgramModel model("https://api.deepgram.com/v1", "dg", "nova-2");

    SECTION("Transcript") {
        auto resp = json::parse(R"({
            "metadata": {"duration": 3.2},
            "results": {"channels": [{"alternatives": [
                {"transcript": "Hello world. ", "confidence": 0.99}
            ]}]}
        })");
        REQUIRE(model.process_response(resp) == "Hello world.");
    }

    SECTION("NoChannels") {
        auto resp = json::parse(R"({"results": {"channels": []}})");
        REQUIRE(model.process_response(resp).empty());
    }

    SECTION("MissingKeyFailsBeforeNetwork") {
        DeepgramModel keyless("https://api.deepgram.com/v1", "", "nova-2");
        REQUIRE_FALSE(keyless.get_transcription("/nonexistent.wav").has_value());
    }
}

TEST_CASE("make_stt_model", "[stt]") {
    ConfigStore config;

    SECTION("WhisperLocalUsesLocalServerAndModelTier") {
        config.set("OpenAI", "local_transcripton_model_file", "small");
        auto model = make_stt_model(SttEngine::Whisper, config);
        auto* openai = dynamic_cast<OpenAiModel*>(model.get());
        REQUIRE(openai != nullptr);
        REQUIRE(openai->model() == "small");
        REQUIRE(openai->base_url() == "http://localhost:8000/v1");
    }

    SECTION("WhisperApi") {
        config.set("General", "use_api", true);
        auto model = make_stt_model(SttEngine::Whisper, config);
        auto* openai = dynamic_cast<OpenAiModel*>(model.get());
        REQUIRE(openai != nullptr);
        REQUIRE(openai->model() == "whisper-1");
        REQUIRE(openai->base_url() == "https://api.openai.com/v1");
    }

    SECTION("WhisperCpp") {
        config.set("WhisperCpp", "local_transcripton_model_file", "large-v3");
        auto model = make_stt_model(SttEngine::WhisperCpp, config);
        auto* wcpp = dynamic_cast<WhisperCppModel*>(model.get());
        REQUIRE(wcpp != nullptr);
        REQUIRE(wcpp->model_file() == "large-v3");
    }

    SECTION("Deepgram") {
        auto model = make_stt_model(SttEngine::Deepgram, config);
        REQUIRE(model->name() == "deepgram");
    }
}
