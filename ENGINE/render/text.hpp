#pragma once

#include <memory>
#include <string>

#include <SDL.h>
#include <SDL_ttf.h>

#include "ui/styles.hpp"

namespace mablocks {

struct FontDeleter { void operator()(TTF_Font* f) const { if (f) TTF_CloseFont(f); } };
using FontPtr = std::unique_ptr<TTF_Font, FontDeleter>;

// Logs and returns null when the font cannot be opened; text drawing with a
// null font is a no-op.
FontPtr open_font(const LabelStyle& style, int size_override = 0);

SDL_Point measure_text(TTF_Font* font, const std::string& text);

// Draws `text` with its top-left at `pos`, or centered on it.
SDL_Point draw_text(SDL_Renderer* renderer,
                    TTF_Font* font,
                    const std::string& text,
                    SDL_Color color,
                    SDL_Point pos,
                    bool centered = false);

}
