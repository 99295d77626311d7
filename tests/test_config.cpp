#include <catch2/catch_test_macros.hpp>
#include "config/ConfigManager.hpp"
#include "config/SpringSettings.hpp"
#include "springy/FrameQueue.hpp"
#include "springy/Spring.hpp"
#include "utils/ErrorReporter.hpp"

#include <toml++/toml.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <utility>

namespace fs = std::filesystem;

// Helper to create a temporary config file
class TempConfigFile
{
public:
    explicit TempConfigFile(const std::string& content, std::string path = "test_springy_config.toml")
        : path_(std::move(path))
    {
        write(content);
    }

    ~TempConfigFile()
    {
        std::error_code ec;
        fs::remove(path_, ec);
        fs::remove(path_ + ".tmp", ec);
    }

    // Rewrites the file and pushes its mtime forward so a reload notices it.
    void write(const std::string& content)
    {
        std::error_code ec;
        const bool existed = fs::exists(path_, ec);
        const auto previous = existed ? fs::last_write_time(path_, ec) : fs::file_time_type{};
        {
            std::ofstream file(path_, std::ios::trunc);
            file << content;
        }
        if (existed)
            fs::last_write_time(path_, previous + std::chrono::seconds(2), ec);
    }

    const std::string& getPath() const { return path_; }

private:
    std::string path_;
};

TEST_CASE("ConfigManager - Loading", "[config]")
{
    utils::ErrorReporter::ClearErrors();

    SECTION("A missing file loads as empty")
    {
        ConfigManager config("does_not_exist_springy.toml");
        REQUIRE(config.load());
        REQUIRE(config.root().empty());
    }

    SECTION("Handlers receive their own table")
    {
        TempConfigFile temp("[spring]\nduration = 0.5\n\n[other]\nx = 1\n");
        ConfigManager config(temp.getPath());

        double duration = 0.0;
        REQUIRE(config.registerTable("spring",
                                     { .load = [&](const toml::table& t) {
                                          duration = t["duration"].value_or(0.0);
                                      },
                                       .save = [] { return toml::table{}; } },
                                     { "duration" }));

        REQUIRE(config.load());
        REQUIRE(duration == 0.5);
    }

    SECTION("Handlers for absent tables receive an empty one")
    {
        TempConfigFile temp("[other]\nx = 1\n");
        ConfigManager config(temp.getPath());

        bool called = false;
        bool was_empty = false;
        config.registerTable("spring",
                             { .load = [&](const toml::table& t) {
                                  called = true;
                                  was_empty = t.empty();
                              },
                               .save = [] { return toml::table{}; } },
                             { "duration" });

        REQUIRE(config.load());
        REQUIRE(called);
        REQUIRE(was_empty);
        REQUIRE_FALSE(config.root().contains("spring"));
    }

    SECTION("Parse errors keep the current settings and are reported")
    {
        TempConfigFile temp("[spring\nduration = \n");
        ConfigManager config(temp.getPath());

        bool called = false;
        config.registerTable("spring",
                             { .load = [&](const toml::table&) { called = true; },
                               .save = [] { return toml::table{}; } },
                             { "duration" });

        REQUIRE_FALSE(config.load());
        REQUIRE_FALSE(called);
        REQUIRE(std::string(config.lastError()).find("parse error") != std::string::npos);

        auto errors = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].category == utils::ErrorCategory::Configuration);
    }
}

TEST_CASE("ConfigManager - Key ownership", "[config]")
{
    ConfigManager config("does_not_exist_springy.toml");
    auto noop = [] { return TableCallbacks{ .load = [](const toml::table&) {}, .save = [] { return toml::table{}; } }; };

    REQUIRE(config.registerTable("spring", noop(), { "duration", "value" }));

    SECTION("The same key cannot be owned twice at one path")
    {
        REQUIRE_FALSE(config.registerTable("spring", noop(), { "value" }));
        REQUIRE(std::string(config.lastError()).find("Duplicate ownership") != std::string::npos);
    }

    SECTION("Other keys or other paths are fine")
    {
        REQUIRE(config.registerTable("spring", noop(), { "preset" }));
        REQUIRE(config.registerTable("demo.spring", noop(), { "value" }));
    }
}

TEST_CASE("ConfigManager - Saving", "[config]")
{
    TempConfigFile temp("[spring]\nduration = 0.5\nnote = \"keep me\"\n\n[other]\nx = 1\n");
    ConfigManager config(temp.getPath());
    config.registerTable("spring",
                         { .load = [](const toml::table&) {},
                           .save = [] {
                               toml::table t;
                               t.insert("damping_ratio", 0.7);
                               t.insert("stray", true);
                               return t;
                           } },
                         { "duration", "damping_ratio" });

    REQUIRE(config.load());
    REQUIRE(config.save());

    auto saved = toml::parse_file(temp.getPath());

    SECTION("Owned keys are written or removed")
    {
        REQUIRE(saved["spring"]["damping_ratio"].value<double>() == 0.7);
        REQUIRE(saved["spring"]["duration"].node() == nullptr);
    }

    SECTION("Foreign keys and tables survive")
    {
        REQUIRE(saved["spring"]["note"].value<std::string>() == "keep me");
        REQUIRE(saved["other"]["x"].value<int64_t>() == 1);
    }

    SECTION("Keys outside the owned set are stripped")
    {
        REQUIRE(saved["spring"]["stray"].node() == nullptr);
    }

    SECTION("Saving does not count as an external change")
    {
        REQUIRE_FALSE(config.reloadIfChanged());
    }
}

TEST_CASE("ConfigManager - Reloading", "[config]")
{
    TempConfigFile temp("[spring]\nduration = 0.5\n");
    ConfigManager config(temp.getPath());

    double duration = 0.0;
    int loads = 0;
    config.registerTable("spring",
                         { .load = [&](const toml::table& t) {
                              ++loads;
                              duration = t["duration"].value_or(0.0);
                          },
                           .save = [] { return toml::table{}; } },
                         { "duration" });
    REQUIRE(config.load());

    SECTION("Unchanged files are not reloaded")
    {
        REQUIRE_FALSE(config.reloadIfChanged());
        REQUIRE(loads == 1);
    }

    SECTION("Edited files are reloaded")
    {
        temp.write("[spring]\nduration = 2.0\n");
        REQUIRE(config.reloadIfChanged());
        REQUIRE(duration == 2.0);
        REQUIRE(loads == 2);
    }

    SECTION("A broken edit is reported once")
    {
        utils::ErrorReporter::ClearErrors();
        temp.write("[spring\n");
        REQUIRE_FALSE(config.reloadIfChanged());
        REQUIRE_FALSE(config.reloadIfChanged());
        REQUIRE(duration == 0.5);
        REQUIRE(utils::ErrorReporter::GetPendingErrors().size() == 1);
    }
}

TEST_CASE("SpringSettings - Deserialize", "[config][settings]")
{
    utils::ErrorReporter::ClearErrors();
    std::optional<springy::SpringPreset> preset;

    SECTION("Reads every field; integers are accepted")
    {
        auto section = toml::parse(R"(
            initial_value = -1.0
            value = 2
            initial_velocity = 3.5
            duration = 0.25
            damping_ratio = 0.4
        )");
        auto options = SpringSettings::deserialize(section, preset);
        REQUIRE(options.initial_value == -1.0);
        REQUIRE(options.value == 2.0);
        REQUIRE(options.initial_velocity == 3.5);
        REQUIRE(options.duration == 0.25);
        REQUIRE(options.damping_ratio == 0.4);
        REQUIRE_FALSE(preset.has_value());
    }

    SECTION("Absent keys stay unset")
    {
        auto options = SpringSettings::deserialize(toml::table{}, preset);
        REQUIRE(options == springy::SpringOptions{});
    }

    SECTION("A preset supplies the damping ratio")
    {
        auto options = SpringSettings::deserialize(toml::parse("preset = \"bouncy\""), preset);
        REQUIRE(preset == springy::SpringPreset::Bouncy);
        REQUIRE(options.damping_ratio == 0.7);
    }

    SECTION("An explicit damping ratio wins over the preset")
    {
        auto options = SpringSettings::deserialize(toml::parse("preset = \"bouncy\"\ndamping_ratio = 0.2"), preset);
        REQUIRE(preset == springy::SpringPreset::Bouncy);
        REQUIRE(options.damping_ratio == 0.2);
    }

    SECTION("Unknown presets are reported and ignored")
    {
        auto options = SpringSettings::deserialize(toml::parse("preset = \"wobbly\""), preset);
        REQUIRE_FALSE(preset.has_value());
        REQUIRE_FALSE(options.damping_ratio.has_value());

        auto errors = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].technical_details.find("wobbly") != std::string::npos);
    }

    SECTION("Non-numeric values are reported and ignored")
    {
        auto options = SpringSettings::deserialize(toml::parse("duration = \"fast\"\nvalue = 1.0"), preset);
        REQUIRE_FALSE(options.duration.has_value());
        REQUIRE(options.value == 1.0);

        auto errors = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].user_message.find("duration") != std::string::npos);
    }
}

TEST_CASE("SpringSettings - Editing", "[config][settings]")
{
    SpringSettings settings;
    int notifications = 0;
    auto sub = settings.options().subscribe([&](const springy::SpringOptions&) { ++notifications; });

    SECTION("Presets set the ratio; a different ratio clears the preset")
    {
        settings.applyPreset(springy::SpringPreset::Snappy);
        REQUIRE(settings.current().damping_ratio == 0.85);
        REQUIRE(settings.preset() == springy::SpringPreset::Snappy);

        settings.setDampingRatio(0.85);
        REQUIRE(settings.preset() == springy::SpringPreset::Snappy);

        settings.setDampingRatio(0.3);
        REQUIRE_FALSE(settings.preset().has_value());
        REQUIRE(notifications == 2);
    }

    SECTION("Unchanged edits do not notify")
    {
        settings.setDuration(0.5);
        settings.setDuration(0.5);
        settings.setTarget(1.0);
        REQUIRE(notifications == 2);
    }

    SECTION("serialize writes only what is set")
    {
        settings.setDuration(0.5);
        auto t = SpringSettings::serialize(settings.current(), settings.preset());
        REQUIRE(t.size() == 1);
        REQUIRE(t["duration"].value<double>() == 0.5);

        settings.applyPreset(springy::SpringPreset::Bouncy);
        t = SpringSettings::serialize(settings.current(), settings.preset());
        REQUIRE(t["preset"].value<std::string>() == "bouncy");
        REQUIRE(t["damping_ratio"].value<double>() == 0.7);
    }
}

TEST_CASE("SpringSettings - Driving a spring from config.toml", "[config][settings][spring]")
{
    TempConfigFile temp("[spring]\nvalue = 1.0\nduration = 0.5\npreset = \"bouncy\"\n");
    ConfigManager config(temp.getPath());
    SpringSettings settings;
    settings.registerConfigHandler(config);

    springy::FrameQueue frames;
    springy::Spring spring(frames, settings.options());
    REQUIRE_FALSE(spring.isAnimating());

    REQUIRE(config.load());

    SECTION("Loading re-targets and re-tunes the spring")
    {
        REQUIRE(spring.target() == 1.0);
        REQUIRE(spring.duration() == 0.5);
        REQUIRE(spring.dampingRatio() == 0.7);
        REQUIRE(spring.isAnimating());
    }

    SECTION("Editing the file live re-targets again")
    {
        temp.write("[spring]\nvalue = -1.0\nduration = 0.5\npreset = \"bouncy\"\n");
        REQUIRE(config.reloadIfChanged());
        REQUIRE(spring.target() == -1.0);
    }

    SECTION("Edits made in the app are saved back")
    {
        settings.setDuration(0.25);
        settings.applyPreset(springy::SpringPreset::Snappy);
        REQUIRE(config.save());

        auto saved = toml::parse_file(temp.getPath());
        REQUIRE(saved["spring"]["duration"].value<double>() == 0.25);
        REQUIRE(saved["spring"]["damping_ratio"].value<double>() == 0.85);
        REQUIRE(saved["spring"]["preset"].value<std::string>() == "snappy");
        REQUIRE(saved["spring"]["value"].value<double>() == 1.0);
    }

    SECTION("Registering twice is refused and reported")
    {
        utils::ErrorReporter::ClearErrors();
        SpringSettings duplicate;
        duplicate.registerConfigHandler(config);

        auto errors = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].severity == utils::ErrorSeverity::Error);
    }
}
