#include "core/app_paths.hpp"

#include <SDL.h>

#include <sstream>
#include <stdexcept>
#include <system_error>

#include "utils/log.hpp"

namespace mablocks {

namespace {

const log::Channel kLog{"AppPaths"};

void ensure_directory_exists(const std::filesystem::path& dir, const char* description) {
    if (dir.empty()) {
        return;
    }
    std::error_code ec;
    if (std::filesystem::create_directories(dir, ec)) {
        return;
    }
    if (ec && !std::filesystem::exists(dir)) {
        std::ostringstream oss;
        oss << "Failed to create " << description << " directory '" << dir.u8string() << "': " << ec.message();
        throw std::runtime_error(oss.str());
    }
}

}

AppPaths AppPaths::at(const std::filesystem::path& base) {
    AppPaths paths;
    paths.base = base;
    paths.sessions = base / "sessions";
    paths.images = base / "images";
    return paths;
}

std::optional<AppPaths> AppPaths::discover() {
    char* pref = SDL_GetPrefPath("mablocks", "MaBlocks");
    if (!pref) {
        kLog.warn(std::string("SDL_GetPrefPath failed: ") + SDL_GetError());
        return std::nullopt;
    }
    std::filesystem::path base = std::filesystem::u8path(pref);
    SDL_free(pref);
    return at(base);
}

void AppPaths::ensure_dirs_exist() const {
    ensure_directory_exists(base, "data");
    ensure_directory_exists(sessions, "sessions");
    ensure_directory_exists(images, "images");
}

}
