#pragma once

#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

struct ConfigError {
    std::string path;
    std::string message;
};

// Section/key settings resolved from three layers, highest first:
//   session  - written by command-line merging, never persisted
//   override - loaded from and saved to the override file
//   defaults - compiled in
class ConfigStore {
public:
    // Defaults only, no backing file.
    ConfigStore();

    // A missing file yields an empty override layer. A file that cannot be
    // read or is not a JSON object of sections is an error.
    static std::expected<ConfigStore, ConfigError> load(const std::filesystem::path& path);

    static const nlohmann::json& defaults();

    const nlohmann::json* find(std::string_view section, std::string_view key) const;

    std::string get_string(std::string_view section, std::string_view key) const;
    bool get_bool(std::string_view section, std::string_view key) const;
    int get_int(std::string_view section, std::string_view key) const;

    void set(std::string_view section, std::string_view key, nlohmann::json value);
    void set_override(std::string_view section, std::string_view key, nlohmann::json value);

    // Writes the whole override layer to override_path().
    std::expected<void, ConfigError> save() const;

    const nlohmann::json& override_layer() const { return override_; }
    const std::filesystem::path& override_path() const { return path_; }

private:
    std::filesystem::path path_;
    nlohmann::json override_ = nlohmann::json::object();
    nlohmann::json session_ = nlohmann::json::object();
};
