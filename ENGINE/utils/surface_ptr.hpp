#pragma once

#include <SDL.h>

#include <memory>

namespace mablocks {

struct SurfaceDeleter { void operator()(SDL_Surface* s) const { if (s) SDL_FreeSurface(s); } };
using SurfacePtr = std::unique_ptr<SDL_Surface, SurfaceDeleter>;
using SharedSurface = std::shared_ptr<SDL_Surface>;

inline SurfacePtr make_surface_ptr(SDL_Surface* surface) {
    return SurfacePtr(surface, SurfaceDeleter{});
}

inline SharedSurface make_shared_surface(SDL_Surface* surface) {
    return SharedSurface(surface, SurfaceDeleter{});
}

inline SharedSurface share_surface(SurfacePtr surface) {
    return SharedSurface(surface.release(), SurfaceDeleter{});
}

}
