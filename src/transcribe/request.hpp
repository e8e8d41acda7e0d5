#pragma once

#include <optional>
#include <string>
#include <string_view>

enum class SttEngine { Whisper, WhisperCpp, Deepgram };
enum class ChatProvider { OpenAI, Together };

// Every option recognized on the command line. Optional fields stay
// std::nullopt when the flag was not given.
struct Request {
    bool api = false;
    bool experimental = false;
    SttEngine speech_to_text = SttEngine::Whisper;
    ChatProvider chat_inference_provider = ChatProvider::OpenAI;
    std::optional<std::string> api_key;
    std::optional<std::string> save_api_key;
    std::optional<std::string> transcribe;
    std::optional<std::string> output_file;
    std::optional<std::string> model;
    bool list_devices = false;
    std::optional<int> mic_device_index;
    std::optional<int> speaker_device_index;
    bool disable_mic = false;
    bool disable_speaker = false;
    bool show_help = false;
};

std::string_view to_string(SttEngine engine);
std::string_view to_string(ChatProvider provider);
