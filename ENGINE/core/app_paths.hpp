#pragma once

#include <filesystem>
#include <optional>

namespace mablocks {

// Per-user storage locations. `sessions/` holds session documents and
// `images/` is where the user is expected to keep source images.
struct AppPaths {
    std::filesystem::path base;
    std::filesystem::path sessions;
    std::filesystem::path images;

    static AppPaths at(const std::filesystem::path& base);
    // SDL_GetPrefPath("mablocks", "MaBlocks"); nullopt when SDL cannot
    // determine a writable location.
    static std::optional<AppPaths> discover();

    std::filesystem::path settings_file() const { return base / "settings.json"; }
    std::filesystem::path autosave_file() const { return sessions / "autosave.json"; }
    std::filesystem::path default_session_file() const { return sessions / "ma_blocks_session.json"; }

    // Throws std::runtime_error when a directory cannot be created.
    void ensure_dirs_exist() const;
};

}
