#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "core/constants.hpp"

namespace mablocks {

struct AppConfig {
    int         window_width = kInitialWindowWidth;
    int         window_height = kInitialWindowHeight;
    std::size_t max_cached_animations = kMaxCachedAnimations;
    double      autosave_interval_seconds = kAutosaveIntervalSeconds;
    std::string font_path;
    int         label_font_size = 14;

    static AppConfig defaults();

    // Unknown keys are ignored; missing or mistyped values keep their
    // defaults and numbers are clamped to sane ranges.
    static AppConfig from_json(const nlohmann::json& data);
    nlohmann::json to_json() const;

    // MABLOCKS_MAX_CACHED_ANIMATIONS
    void apply_env_overrides();
};

// Reads settings.json. A missing file yields defaults and is written back; an
// unreadable one is logged and replaced by defaults in memory only.
AppConfig load_config(const std::filesystem::path& path);

}
