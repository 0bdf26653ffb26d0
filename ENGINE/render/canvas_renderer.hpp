#pragma once

#include <unordered_map>
#include <unordered_set>

#include <SDL.h>

#include "blocks/block.hpp"
#include "core/canvas_engine.hpp"
#include "interaction/block_controls.hpp"
#include "render/text.hpp"
#include "utils/input.hpp"

namespace mablocks {

// Draws the canvas: every block with its current frame, group folders,
// per-block controls, counter badges and optional file name labels.
class CanvasRenderer {
public:
    explicit CanvasRenderer(SDL_Renderer* renderer);
    ~CanvasRenderer();

    CanvasRenderer(const CanvasRenderer&) = delete;
    CanvasRenderer& operator=(const CanvasRenderer&) = delete;

    void render(const CanvasEngine& engine, const Viewport& viewport, const InputSnapshot& input);

private:
    struct CachedTexture {
        SDL_Texture*        texture = nullptr;
        const SDL_Surface*  source = nullptr;
        int                 w = 0;
        int                 h = 0;
    };

    struct DrawConfig {
        float        zoom = 1.0f;
        bool         show_controls = false;
        bool         show_file_names = false;
        bool         can_chain = false;
        bool         is_drop_target = false;
        ControlHover hover;
    };

    SDL_Texture* texture_for(const Block& block);
    void prune_textures(const std::unordered_set<BlockId>& live);

    void draw_block(const Block& block, const SDL_FRect& rect, const DrawConfig& config);
    void draw_image(const Block& block, const SDL_FRect& rect);
    void draw_group(const Block& block, const SDL_FRect& rect);
    void draw_controls(const Block& block, const SDL_FRect& rect, const DrawConfig& config);
    void draw_counter_badge(const Block& block, const SDL_FRect& rect, float zoom);
    void draw_label(const std::string& text, const SDL_FRect& rect);

    TTF_Font* icon_font(float zoom);

    void fill_rect(const SDL_FRect& rect, SDL_Color color);
    void outline_rect(const SDL_FRect& rect, SDL_Color color, int thickness);
    void fill_circle(SDL_FPoint center, float radius, SDL_Color color);

    SDL_Renderer* renderer_ = nullptr;
    FontPtr       label_font_;
    FontPtr       badge_font_;
    FontPtr       icon_font_;
    int           icon_font_size_ = 0;
    std::unordered_map<BlockId, CachedTexture> textures_;
};

}
