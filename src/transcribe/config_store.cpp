#include "config_store.hpp"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <print>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const json* lookup(const json& layer, std::string_view section, std::string_view key) {
    auto s = layer.find(std::string(section));
    if (s == layer.end() || !s->is_object()) return nullptr;
    auto k = s->find(std::string(key));
    if (k == s->end() || k->is_null()) return nullptr;
    return &*k;
}

std::optional<int> to_int(const json& v) {
    if (v.is_number_unsigned()) {
        auto n = v.get<uint64_t>();
        if (n > static_cast<uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(n);
    }
    if (v.is_number_integer()) {
        auto n = v.get<int64_t>();
        if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(n);
    }
    if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        int out = 0;
        auto* first = s.data();
        auto* last = s.data() + s.size();
        if (!s.empty() && *first == '+') ++first;
        auto [ptr, ec] = std::from_chars(first, last, out);
        if (s.empty() || ec != std::errc{} || ptr != last) return std::nullopt;
        return out;
    }
    return std::nullopt;
}

} // namespace

ConfigStore::ConfigStore() = default;

const json& ConfigStore::defaults() {
    static const json d = {
        {"General", {
            {"use_api", false},
            {"disable_mic", false},
            {"disable_speaker", false},
            {"mic_device_index", -1},
            {"speaker_device_index", -1},
        }},
        {"OpenAI", {
            {"api_key", ""},
            {"base_url", "https://api.openai.com/v1"},
            {"local_server_url", "http://localhost:8000/v1"},
            {"local_transcripton_model_file", "base"},
            {"api_transcription_model", "whisper-1"},
            {"audio_lang", "en"},
        }},
        {"WhisperCpp", {
            {"local_transcripton_model_file", "base"},
            {"server_url", "http://localhost:8080"},
        }},
        {"Deepgram", {
            {"api_key", ""},
            {"base_url", "https://api.deepgram.com/v1"},
            {"model", "nova-2"},
        }},
        {"Together", {
            {"api_key", ""},
            {"base_url", "https://api.together.xyz/v1"},
        }},
    };
    return d;
}

std::expected<ConfigStore, ConfigError> ConfigStore::load(const fs::path& path) {
    ConfigStore store;
    store.path_ = path;

    std::error_code ec;
    bool present = fs::exists(path, ec);
    if (ec) {
        return std::unexpected(ConfigError{path.string(), ec.message()});
    }
    if (!present) {
        return store;
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        return std::unexpected(ConfigError{path.string(), "could not open file for reading"});
    }

    // Nothing saved yet.
    if (fs::file_size(path, ec) == 0 && !ec) {
        return store;
    }

    try {
        auto j = json::parse(f);
        if (!j.is_object()) {
            return std::unexpected(ConfigError{path.string(), "top level is not an object"});
        }
        for (auto& [section, values] : j.items()) {
            if (!values.is_object()) {
                return std::unexpected(ConfigError{
                    path.string(), "section '" + section + "' is not an object"});
            }
        }
        store.override_ = std::move(j);
    } catch (const json::exception& e) {
        return std::unexpected(ConfigError{path.string(), e.what()});
    }

    return store;
}

const json* ConfigStore::find(std::string_view section, std::string_view key) const {
    if (auto* v = lookup(session_, section, key)) return v;
    if (auto* v = lookup(override_, section, key)) return v;
    return lookup(defaults(), section, key);
}

std::string ConfigStore::get_string(std::string_view section, std::string_view key) const {
    auto* v = find(section, key);
    if (!v) return {};
    if (v->is_string()) return v->get<std::string>();
    return v->dump();
}

bool ConfigStore::get_bool(std::string_view section, std::string_view key) const {
    auto* v = find(section, key);
    if (!v) return false;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_number_integer()) return v->get<int64_t>() != 0;
    if (v->is_string()) {
        auto s = v->get<std::string>();
        return s == "true" || s == "True" || s == "1" || s == "yes";
    }
    return false;
}

int ConfigStore::get_int(std::string_view section, std::string_view key) const {
    auto* v = find(section, key);
    if (!v) return 0;
    if (v->is_boolean()) return v->get<bool>() ? 1 : 0;
    if (auto n = to_int(*v)) return *n;

    // Malformed values read as the compiled-in default.
    std::println(stderr, "config: {}.{} is not an integer: {}", section, key, v->dump());
    if (auto* d = lookup(defaults(), section, key)) {
        if (auto n = to_int(*d)) return *n;
    }
    return 0;
}

void ConfigStore::set(std::string_view section, std::string_view key, json value) {
    session_[std::string(section)][std::string(key)] = std::move(value);
}

void ConfigStore::set_override(std::string_view section, std::string_view key, json value) {
    override_[std::string(section)][std::string(key)] = std::move(value);
}

std::expected<void, ConfigError> ConfigStore::save() const {
    if (path_.empty()) {
        return std::unexpected(ConfigError{"", "no override file configured"});
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            return std::unexpected(ConfigError{path_.string(), ec.message()});
        }
    }

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f.is_open()) {
            return std::unexpected(ConfigError{tmp.string(), "could not open file for writing"});
        }
        f << override_.dump(4) << '\n';
        if (!f.good()) {
            return std::unexpected(ConfigError{tmp.string(), "write failed"});
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        auto msg = ec.message();
        fs::remove(tmp, ec);
        return std::unexpected(ConfigError{path_.string(), msg});
    }
    return {};
}
