#include <catch2/catch_test_macros.hpp>

#include "config_store.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

TEST_CASE("ConfigStore", "[config]") {
    test::TmpDir dir;

    SECTION("DefaultValues") {
        ConfigStore cfg;
        REQUIRE_FALSE(cfg.get_bool("General", "use_api"));
        REQUIRE_FALSE(cfg.get_bool("General", "disable_mic"));
        REQUIRE_FALSE(cfg.get_bool("General", "disable_speaker"));
        REQUIRE(cfg.get_int("General", "mic_device_index") == -1);
        REQUIRE(cfg.get_int("General", "speaker_device_index") == -1);
        REQUIRE(cfg.get_string("OpenAI", "local_transcripton_model_file") == "base");
        REQUIRE(cfg.get_string("WhisperCpp", "local_transcripton_model_file") == "base");
        REQUIRE(cfg.get_string("OpenAI", "api_key").empty());
    }

    SECTION("UnknownKey") {
        ConfigStore cfg;
        REQUIRE(cfg.find("General", "nope") == nullptr);
        REQUIRE(cfg.find("Nope", "use_api") == nullptr);
        REQUIRE(cfg.get_string("Nope", "x").empty());
    }

    SECTION("LoadMissingFile") {
        auto cfg = ConfigStore::load(dir.file("override.json"));
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->override_layer().empty());
        REQUIRE(cfg->get_int("General", "mic_device_index") == -1);
    }

    SECTION("LoadUnstatablePath") {
        auto loop = dir.file("override.json");
        std::filesystem::create_symlink(loop, loop);
        auto cfg = ConfigStore::load(loop);
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().path == loop.string());
        REQUIRE_FALSE(cfg.error().message.empty());
    }

    SECTION("LoadEmptyFile") {
        auto cfg = ConfigStore::load(dir.write("override.json", ""));
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->override_layer().empty());
    }

    SECTION("LoadPartialOverride") {
        auto path = dir.write("override.json", R"({
            "OpenAI": { "api_key": "sk-saved" },
            "General": { "mic_device_index": 4 }
        })");

        auto cfg = ConfigStore::load(path);
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->get_string("OpenAI", "api_key") == "sk-saved");
        REQUIRE(cfg->get_int("General", "mic_device_index") == 4);
        // Other keys retain defaults
        REQUIRE(cfg->get_int("General", "speaker_device_index") == -1);
        REQUIRE(cfg->get_string("OpenAI", "local_transcripton_model_file") == "base");
    }

    SECTION("LoadInvalidJson") {
        auto path = dir.write("override.json", "not json {{{");
        auto cfg = ConfigStore::load(path);
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().path == path.string());
        REQUIRE_FALSE(cfg.error().message.empty());
    }

    SECTION("LoadWrongShape") {
        REQUIRE_FALSE(ConfigStore::load(dir.write("a.json", "[1, 2]")).has_value());
        REQUIRE_FALSE(ConfigStore::load(dir.write("b.json", R"({"OpenAI": "key"})")).has_value());
    }

    SECTION("SessionOverOverrideOverDefault") {
        auto cfg = ConfigStore::load(dir.write("override.json", R"({"OpenAI": {"api_key": "saved"}})"));
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->get_string("OpenAI", "api_key") == "saved");
        cfg->set("OpenAI", "api_key", "transient");
        REQUIRE(cfg->get_string("OpenAI", "api_key") == "transient");
        REQUIRE(cfg->override_layer()["OpenAI"]["api_key"] == "saved");
    }

    SECTION("SaveRoundTrip") {
        auto path = dir.file("nested/dir/override.json");
        auto cfg = ConfigStore::load(path);
        REQUIRE(cfg.has_value());

        cfg->set_override("OpenAI", "api_key", "ZZZ");
        cfg->set_override("General", "speaker_device_index", 7);
        cfg->set("General", "use_api", true);
        REQUIRE(cfg->save().has_value());

        auto reloaded = ConfigStore::load(path);
        REQUIRE(reloaded.has_value());
        REQUIRE(reloaded->get_string("OpenAI", "api_key") == "ZZZ");
        REQUIRE(reloaded->get_int("General", "speaker_device_index") == 7);
        // Session values are not persisted
        REQUIRE_FALSE(reloaded->get_bool("General", "use_api"));

        auto on_disk = json::parse(test::slurp(path));
        json expected = {{"OpenAI", {{"api_key", "ZZZ"}}},
                         {"General", {{"speaker_device_index", 7}}}};
        REQUIRE(on_disk == expected);
        REQUIRE_FALSE(std::filesystem::exists(path.string() + ".tmp"));
    }

    SECTION("SaveKeepsUnrelatedKeys") {
        auto path = dir.write("override.json", R"({"Deepgram": {"api_key": "dg"}, "Custom": {"x": 1}})");
        auto cfg = ConfigStore::load(path);
        REQUIRE(cfg.has_value());
        cfg->set_override("OpenAI", "api_key", "new");
        REQUIRE(cfg->save().has_value());

        auto on_disk = json::parse(test::slurp(path));
        REQUIRE(on_disk["Deepgram"]["api_key"] == "dg");
        REQUIRE(on_disk["Custom"]["x"] == 1);
        REQUIRE(on_disk["OpenAI"]["api_key"] == "new");
    }

    SECTION("SaveWithoutPath") {
        ConfigStore cfg;
        REQUIRE_FALSE(cfg.save().has_value());
    }

    SECTION("TypedGettersCoerce") {
        auto cfg = ConfigStore::load(dir.write("override.json",
            R"({"General": {"disable_mic": "true", "mic_device_index": "5", "use_api": 1}})"));
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->get_bool("General", "disable_mic"));
        REQUIRE(cfg->get_int("General", "mic_device_index") == 5);
        REQUIRE(cfg->get_bool("General", "use_api"));
    }

    SECTION("MalformedIntsReadAsDefault") {
        auto cfg = ConfigStore::load(dir.write("override.json", R"({"General": {
            "mic_device_index": "3x",
            "speaker_device_index": 4294967298
        }, "Custom": {"big": 1e10, "neg": "-7", "plus": "+2"}})"));
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->get_int("General", "mic_device_index") == -1);
        REQUIRE(cfg->get_int("General", "speaker_device_index") == -1);
        REQUIRE(cfg->get_int("Custom", "big") == 0);
        REQUIRE(cfg->get_int("Custom", "neg") == -7);
        REQUIRE(cfg->get_int("Custom", "plus") == 2);
    }
}
