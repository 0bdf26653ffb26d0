#include "render/text.hpp"

#include "utils/log.hpp"
#include "utils/surface_ptr.hpp"

namespace mablocks {

namespace {

const log::Channel kLog{"Text"};

}

FontPtr open_font(const LabelStyle& style, int size_override) {
    const int size = size_override > 0 ? size_override : style.font_size;
    FontPtr font(TTF_OpenFont(style.font_path.c_str(), size));
    if (!font) {
        kLog.warn("Failed to open font '" + style.font_path + "': " + TTF_GetError());
    }
    return font;
}

SDL_Point measure_text(TTF_Font* font, const std::string& text) {
    SDL_Point size{0, 0};
    if (font && !text.empty()) {
        TTF_SizeUTF8(font, text.c_str(), &size.x, &size.y);
    }
    return size;
}

SDL_Point draw_text(SDL_Renderer* renderer,
                    TTF_Font* font,
                    const std::string& text,
                    SDL_Color color,
                    SDL_Point pos,
                    bool centered) {
    if (!renderer || !font || text.empty()) {
        return SDL_Point{0, 0};
    }
    SurfacePtr surf = make_surface_ptr(TTF_RenderUTF8_Blended(font, text.c_str(), color));
    if (!surf) {
        return SDL_Point{0, 0};
    }
    SDL_Texture* tex = SDL_CreateTextureFromSurface(renderer, surf.get());
    if (!tex) {
        return SDL_Point{0, 0};
    }
    SDL_Rect dst{ pos.x, pos.y, surf->w, surf->h };
    if (centered) {
        dst.x -= surf->w / 2;
        dst.y -= surf->h / 2;
    }
    SDL_RenderCopy(renderer, tex, nullptr, &dst);
    SDL_DestroyTexture(tex);
    return SDL_Point{surf->w, surf->h};
}

}
