#include "core/app_config.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

#include "persistence/json_file.hpp"
#include "ui/font_paths.hpp"
#include "utils/log.hpp"

namespace mablocks {

namespace {

const log::Channel kLog{"AppConfig"};

constexpr int kMinWindowDimension = 200;
constexpr int kMaxWindowDimension = 16384;
constexpr std::size_t kMaxCacheCapacity = 4096;
constexpr double kMinAutosaveSeconds = 10.0;
constexpr int kMinFontSize = 6;
constexpr int kMaxFontSize = 96;

template <typename T>
T read_number(const nlohmann::json& data, const char* key, T fallback) {
    auto it = data.find(key);
    if (it == data.end() || !it->is_number()) {
        if (it != data.end()) {
            kLog.warn(std::string("Ignoring non-numeric value for '") + key + "'.");
        }
        return fallback;
    }
    const double raw = it->get<double>();
    if (!std::isfinite(raw)) {
        return fallback;
    }
    return static_cast<T>(raw);
}

}

AppConfig AppConfig::defaults() {
    AppConfig config;
    config.font_path = fonts::sans_regular();
    return config;
}

AppConfig AppConfig::from_json(const nlohmann::json& data) {
    AppConfig config = defaults();
    if (!data.is_object()) {
        kLog.warn("Settings document is not an object; using defaults.");
        return config;
    }
    config.window_width = std::clamp(read_number<int>(data, "window_width", config.window_width),
                                     kMinWindowDimension, kMaxWindowDimension);
    config.window_height = std::clamp(read_number<int>(data, "window_height", config.window_height),
                                      kMinWindowDimension, kMaxWindowDimension);

    const double capacity = read_number<double>(data, "max_cached_animations",
                                                static_cast<double>(config.max_cached_animations));
    config.max_cached_animations = static_cast<std::size_t>(
        std::clamp(capacity, 1.0, static_cast<double>(kMaxCacheCapacity)));

    config.autosave_interval_seconds = std::max(
        read_number<double>(data, "autosave_interval_seconds", config.autosave_interval_seconds),
        kMinAutosaveSeconds);

    auto font_it = data.find("font_path");
    if (font_it != data.end() && font_it->is_string() && !font_it->get_ref<const std::string&>().empty()) {
        config.font_path = font_it->get<std::string>();
    }
    config.label_font_size = std::clamp(read_number<int>(data, "label_font_size", config.label_font_size),
                                        kMinFontSize, kMaxFontSize);
    return config;
}

nlohmann::json AppConfig::to_json() const {
    return nlohmann::json{
        {"window_width", window_width},
        {"window_height", window_height},
        {"max_cached_animations", max_cached_animations},
        {"autosave_interval_seconds", autosave_interval_seconds},
        {"font_path", font_path},
        {"label_font_size", label_font_size},
    };
}

void AppConfig::apply_env_overrides() {
    const char* raw = std::getenv("MABLOCKS_MAX_CACHED_ANIMATIONS");
    if (!raw || !*raw) {
        return;
    }
    char* end = nullptr;
    const long long value = std::strtoll(raw, &end, 10);
    if (end == raw || *end != '\0' || value < 1) {
        kLog.warn(std::string("Ignoring invalid MABLOCKS_MAX_CACHED_ANIMATIONS='") + raw + "'.");
        return;
    }
    max_cached_animations = std::min(static_cast<std::size_t>(value), kMaxCacheCapacity);
}

AppConfig load_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        AppConfig config = AppConfig::defaults();
        try {
            json_file::write(path, config.to_json(), 2);
            kLog.info("Wrote default settings to " + path.string());
        } catch (const std::runtime_error& ex) {
            kLog.warn(std::string("Could not write default settings: ") + ex.what());
        }
        config.apply_env_overrides();
        return config;
    }

    AppConfig config;
    try {
        config = AppConfig::from_json(json_file::read(path));
    } catch (const std::runtime_error& ex) {
        kLog.error(std::string(ex.what()) + "; using defaults.");
        config = AppConfig::defaults();
    }
    config.apply_env_overrides();
    return config;
}

}
