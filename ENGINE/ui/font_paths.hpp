#pragma once

#include <filesystem>
#include <initializer_list>
#include <string>
#include <system_error>

namespace mablocks::fonts {

inline std::string resolve_font_path(std::initializer_list<const char*> candidates) {
    const char* fallback = nullptr;
    for (const char* path : candidates) {
        if (!path || !*path) continue;
        if (!fallback) fallback = path;
        std::error_code ec;
        if (std::filesystem::exists(path, ec) && !ec) {
            return std::string(path);
        }
    }
    return fallback ? std::string(fallback) : std::string{};
}

// Label font for file names and counters.
inline std::string sans_regular() {
#ifdef _WIN32
    return resolve_font_path({
        "C:/Windows/Fonts/segoeui.ttf",
        "C:/Windows/Fonts/arial.ttf",
        "C:/Windows/Fonts/verdana.ttf"
    });
#elif defined(__APPLE__)
    return resolve_font_path({
        "/System/Library/Fonts/Supplemental/Arial.ttf",
        "/Library/Fonts/Arial.ttf",
        "/System/Library/Fonts/Helvetica.ttc"
    });
#else
    return resolve_font_path({
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/truetype/freefont/FreeSans.ttf"
    });
#endif
}

inline std::string sans_bold() {
#ifdef _WIN32
    return resolve_font_path({
        "C:/Windows/Fonts/segoeuib.ttf",
        "C:/Windows/Fonts/arialbd.ttf"
    });
#elif defined(__APPLE__)
    return resolve_font_path({
        "/System/Library/Fonts/Supplemental/Arial Bold.ttf",
        "/Library/Fonts/Arial Bold.ttf"
    });
#else
    return resolve_font_path({
        "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf",
        "/usr/share/fonts/truetype/freefont/FreeSansBold.ttf"
    });
#endif
}

}
