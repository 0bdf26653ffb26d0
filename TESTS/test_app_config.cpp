#include "doctest/doctest.h"

#include <cstdlib>

#include <nlohmann/json.hpp>

#include "core/app_config.hpp"
#include "core/app_paths.hpp"
#include "persistence/json_file.hpp"
#include "test_support.hpp"

using namespace mablocks;

TEST_CASE("Config values are clamped and bad types keep defaults") {
    const nlohmann::json doc = {
        {"window_width", 50},
        {"window_height", "tall"},
        {"max_cached_animations", 0},
        {"autosave_interval_seconds", 1},
        {"label_font_size", 500},
        {"font_path", "/fonts/custom.ttf"},
        {"unknown", true},
    };
    const AppConfig config = AppConfig::from_json(doc);
    CHECK(config.window_width == 200);
    CHECK(config.window_height == kInitialWindowHeight);
    CHECK(config.max_cached_animations == 1);
    CHECK(config.autosave_interval_seconds == doctest::Approx(10.0));
    CHECK(config.label_font_size == 96);
    CHECK(config.font_path == "/fonts/custom.ttf");
}

TEST_CASE("Config defaults match the engine constants") {
    const AppConfig config = AppConfig::from_json(nlohmann::json::object());
    CHECK(config.max_cached_animations == kMaxCachedAnimations);
    CHECK(config.autosave_interval_seconds == doctest::Approx(kAutosaveIntervalSeconds));
}

TEST_CASE("Missing settings file is created with defaults") {
    const auto dir = mablocks::test::scratch_dir("config");
    const auto path = dir / "settings.json";

    const AppConfig config = load_config(path);
    CHECK(config.window_width == kInitialWindowWidth);
    REQUIRE(std::filesystem::exists(path));

    const nlohmann::json written = json_file::read(path);
    CHECK(written.value("max_cached_animations", 0) == static_cast<int>(kMaxCachedAnimations));
}

TEST_CASE("Existing settings file is honoured") {
    const auto dir = mablocks::test::scratch_dir("config_existing");
    const auto path = dir / "settings.json";
    json_file::write(path, nlohmann::json{{"max_cached_animations", 7}});

    const AppConfig config = load_config(path);
    if (!std::getenv("MABLOCKS_MAX_CACHED_ANIMATIONS")) {
        CHECK(config.max_cached_animations == 7);
    }
}

TEST_CASE("App paths keep sessions beside the settings file") {
    const auto dir = mablocks::test::scratch_dir("paths");
    const AppPaths paths = AppPaths::at(dir);
    paths.ensure_dirs_exist();

    CHECK(std::filesystem::is_directory(paths.sessions));
    CHECK(std::filesystem::is_directory(paths.images));
    CHECK(paths.settings_file() == dir / "settings.json");
    CHECK(paths.autosave_file().parent_path() == paths.sessions);
    CHECK(paths.default_session_file().filename() == "ma_blocks_session.json");
}
