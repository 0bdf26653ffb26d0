#include "render/canvas_renderer.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "core/constants.hpp"
#include "ui/styles.hpp"
#include "utils/log.hpp"

namespace mablocks {

namespace {

const log::Channel kLog{"CanvasRenderer"};

constexpr int kBadgeFontSize = 20;
constexpr int kButtonIconFontSize = 12;

bool intersects(const SDL_FRect& a, const SDL_FRect& b) {
    return a.x < b.x + b.w && b.x < a.x + a.w && a.y < b.y + b.h && b.y < a.y + a.h;
}

SDL_FPoint rect_center(const SDL_FRect& r) {
    return SDL_FPoint{r.x + r.w * 0.5f, r.y + r.h * 0.5f};
}

SDL_FRect inset(const SDL_FRect& r, float by) {
    return SDL_FRect{r.x + by, r.y + by, std::max(r.w - by * 2.0f, 0.0f), std::max(r.h - by * 2.0f, 0.0f)};
}

// Largest rect with the source aspect that fits inside `bounds`, centered.
SDL_FRect fit_inside(const SDL_FRect& bounds, int src_w, int src_h) {
    if (src_w <= 0 || src_h <= 0) return bounds;
    const float scale = std::min(bounds.w / static_cast<float>(src_w), bounds.h / static_cast<float>(src_h));
    const float w = static_cast<float>(src_w) * scale;
    const float h = static_cast<float>(src_h) * scale;
    return SDL_FRect{bounds.x + (bounds.w - w) * 0.5f, bounds.y + (bounds.h - h) * 0.5f, w, h};
}

void collect_live_ids(const Block& block, std::unordered_set<BlockId>& out) {
    out.insert(block.id());
    for (const auto& child : block.children()) {
        collect_live_ids(*child, out);
    }
}

}

CanvasRenderer::CanvasRenderer(SDL_Renderer* renderer)
    : renderer_(renderer),
      label_font_(open_font(Styles::Label())),
      badge_font_(open_font(Styles::ToolbarLabel(), kBadgeFontSize)) {}

CanvasRenderer::~CanvasRenderer() {
    for (auto& entry : textures_) {
        if (entry.second.texture) SDL_DestroyTexture(entry.second.texture);
    }
}

SDL_Texture* CanvasRenderer::texture_for(const Block& block) {
    const AnimationFrame* frame = block.visible_frame();
    if (!frame || !frame->image) {
        return nullptr;
    }
    SDL_Surface* surface = frame->image.get();
    CachedTexture& cached = textures_[block.id()];
    if (cached.texture && cached.source == surface) {
        return cached.texture;
    }

    if (cached.texture && (cached.w != surface->w || cached.h != surface->h)) {
        SDL_DestroyTexture(cached.texture);
        cached.texture = nullptr;
    }
    if (!cached.texture) {
        cached.texture = SDL_CreateTexture(renderer_, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STREAMING,
                                           surface->w, surface->h);
        if (!cached.texture) {
            kLog.error(std::string("SDL_CreateTexture failed: ") + SDL_GetError());
            return nullptr;
        }
        SDL_SetTextureBlendMode(cached.texture, SDL_BLENDMODE_BLEND);
        cached.w = surface->w;
        cached.h = surface->h;
    }
    if (SDL_UpdateTexture(cached.texture, nullptr, surface->pixels, surface->pitch) != 0) {
        kLog.warn(std::string("SDL_UpdateTexture failed: ") + SDL_GetError());
    }
    cached.source = surface;
    return cached.texture;
}

void CanvasRenderer::prune_textures(const std::unordered_set<BlockId>& live) {
    for (auto it = textures_.begin(); it != textures_.end();) {
        if (live.count(it->first) == 0) {
            if (it->second.texture) SDL_DestroyTexture(it->second.texture);
            it = textures_.erase(it);
        } else {
            ++it;
        }
    }
}

void CanvasRenderer::render(const CanvasEngine& engine, const Viewport& viewport, const InputSnapshot& input) {
    const BlockManager& manager = engine.manager();
    const float zoom = engine.zoom();

    SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
    const SDL_Rect clip{static_cast<int>(viewport.origin.x), static_cast<int>(viewport.origin.y),
                        static_cast<int>(viewport.width), static_cast<int>(viewport.height)};
    SDL_RenderSetClipRect(renderer_, &clip);
    const SDL_FRect visible{viewport.origin.x, viewport.origin.y, viewport.width, viewport.height};
    fill_rect(visible, Styles::CanvasBackground());

    const bool any_dragging = manager.any_dragging();
    const std::optional<BlockId> drop_target = engine.drop_target();

    std::vector<std::pair<const Block*, DrawConfig>> on_top;
    std::optional<std::pair<const Block*, DrawConfig>> target_entry;
    std::unordered_set<BlockId> live;

    for (const auto& block : manager.blocks()) {
        collect_live_ids(*block, live);
        const SDL_FRect rect = engine.world_to_screen(block->rect(), viewport);
        const bool hovering = input.has_pointer && rect_contains(rect, input.pointer);

        DrawConfig config;
        config.zoom = zoom;
        config.show_file_names = engine.show_file_names();
        config.can_chain = !manager.empty();
        config.show_controls = hovering || block->pos.is_dragging || block->chained;
        config.hover = control_hover(control_rects(rect, zoom), input.pointer, input.has_pointer, block->is_group());

        const bool is_target = drop_target && *drop_target == block->id();
        const bool lifted = block->pos.is_dragging || (any_dragging && block->chained);
        if (is_target) {
            config.is_drop_target = true;
            target_entry = std::make_pair(block.get(), config);
        } else if (lifted) {
            on_top.emplace_back(block.get(), config);
        } else if (intersects(rect, visible)) {
            draw_block(*block, rect, config);
        }
    }
    for (const auto& entry : on_top) {
        draw_block(*entry.first, engine.world_to_screen(entry.first->rect(), viewport), entry.second);
    }
    if (target_entry) {
        draw_block(*target_entry->first, engine.world_to_screen(target_entry->first->rect(), viewport),
                   target_entry->second);
    }

    prune_textures(live);
    SDL_RenderSetClipRect(renderer_, nullptr);
}

void CanvasRenderer::draw_block(const Block& block, const SDL_FRect& rect, const DrawConfig& config) {
    if (block.is_group()) {
        draw_group(block, rect);
    } else {
        draw_image(block, rect);
    }

    if (config.is_drop_target) {
        outline_rect(rect, Styles::DropTargetOutline(), 3);
    } else if (block.chained) {
        outline_rect(rect, Styles::ChainedBorder(), 2);
    } else {
        outline_rect(rect, Styles::BlockBorder(), 1);
    }

    if (config.show_file_names && !block.is_group()) {
        draw_label(block.file_name(), rect);
    }
    if (!block.is_group() && block.counter > 0) {
        draw_counter_badge(block, rect, config.zoom);
    }
    if (config.show_controls) {
        draw_controls(block, rect, config);
    }
}

void CanvasRenderer::draw_image(const Block& block, const SDL_FRect& rect) {
    const SDL_FRect image_rect = inset(rect, kBlockPadding * (rect.w / std::max(block.outer_size().x, 1.0f)));
    SDL_Texture* texture = texture_for(block);
    if (!texture) {
        fill_rect(image_rect, Styles::SkeletonFill());
        return;
    }
    SDL_RenderCopyF(renderer_, texture, nullptr, &image_rect);
}

void CanvasRenderer::draw_group(const Block& block, const SDL_FRect& rect) {
    fill_rect(rect, block.chained ? Styles::ChainedGroupBackground() : Styles::NormalGroupBackground());

    // Folder: a tab across the top-left and a body below it, tinted with the block color.
    const SDL_FRect body{rect.x + rect.w * 0.1f, rect.y + rect.h * 0.25f, rect.w * 0.8f, rect.h * 0.6f};
    const SDL_FRect tab{body.x, body.y - rect.h * 0.08f, body.w * 0.4f, rect.h * 0.08f + 1.0f};
    fill_rect(tab, block.color);
    fill_rect(body, block.color);

    if (!block.children().empty()) {
        const Block& first = *block.children().front();
        if (SDL_Texture* texture = texture_for(first)) {
            const AnimationFrame* frame = first.visible_frame();
            const SDL_FRect thumb = fit_inside(inset(body, body.w * 0.1f), frame->image->w, frame->image->h);
            SDL_RenderCopyF(renderer_, texture, nullptr, &thumb);
        }
    }
    draw_label(block.display_name(), rect);
}

void CanvasRenderer::draw_controls(const Block& block, const SDL_FRect& rect, const DrawConfig& config) {
    const ControlRects rects = control_rects(rect, config.zoom);
    const float radius = kButtonBaseSize * config.zoom * 0.5f;
    TTF_Font* font = icon_font(config.zoom);
    auto icon = [&](const SDL_FRect& r, const char* glyph) {
        const SDL_FPoint c = rect_center(r);
        draw_text(renderer_, font, glyph, SDL_Color{255, 255, 255, 255},
                  SDL_Point{static_cast<int>(c.x), static_cast<int>(c.y)}, true);
    };

    fill_circle(rect_center(rects.close), radius,
                config.hover.close ? Styles::CloseButtonHover() : Styles::CloseButton());
    icon(rects.close, "x");

    SDL_Color chain_color = Styles::ChainNormal();
    if (block.chained) {
        chain_color = Styles::ChainActive();
    } else if (!config.can_chain) {
        chain_color = Styles::ChainDisabled();
    } else if (config.hover.chain) {
        chain_color = Styles::ChainHover();
    }
    fill_circle(rect_center(rects.chain), radius, chain_color);
    icon(rects.chain, "o");

    if (!block.is_group()) {
        fill_circle(rect_center(rects.counter), radius,
                    config.hover.counter ? Styles::CounterButtonHover() : Styles::CounterButton());
        icon(rects.counter, "+");
    }
}

// Glyphs are skipped when zoomed out far enough that they would be unreadable.
TTF_Font* CanvasRenderer::icon_font(float zoom) {
    if (zoom <= 0.4f) {
        return nullptr;
    }
    const int size = std::max(1, static_cast<int>(kButtonIconFontSize * zoom));
    if (size != icon_font_size_) {
        icon_font_ = open_font(Styles::ToolbarLabel(), size);
        icon_font_size_ = size;
    }
    return icon_font_.get();
}

void CanvasRenderer::draw_counter_badge(const Block& block, const SDL_FRect& rect, float zoom) {
    const float radius = kCounterBadgeRadius * zoom;
    const SDL_FPoint center{rect.x + kCounterBadgeOffset * zoom + radius, rect.y + kCounterBadgeOffset * zoom + radius};
    fill_circle(center, radius, Styles::CounterBadge());
    draw_text(renderer_, badge_font_.get(), std::to_string(block.counter), Styles::Ivory(),
              SDL_Point{static_cast<int>(center.x), static_cast<int>(center.y)}, true);
}

void CanvasRenderer::draw_label(const std::string& text, const SDL_FRect& rect) {
    if (!label_font_ || text.empty()) {
        return;
    }
    const SDL_Point size = measure_text(label_font_.get(), text);
    const float pad = kLabelPadding;
    const SDL_FRect bg{rect.x + pad, rect.y + rect.h - static_cast<float>(size.y) - pad * 2.0f,
                       std::min(static_cast<float>(size.x) + pad * 2.0f, rect.w - pad * 2.0f),
                       static_cast<float>(size.y) + pad};
    if (bg.w <= 0.0f) {
        return;
    }
    fill_rect(bg, Styles::LabelBackground());
    const SDL_Rect clip{static_cast<int>(bg.x), static_cast<int>(bg.y), static_cast<int>(bg.w), static_cast<int>(bg.h)};
    SDL_Rect previous;
    SDL_RenderGetClipRect(renderer_, &previous);
    const bool had_clip = SDL_RenderIsClipEnabled(renderer_) == SDL_TRUE;
    SDL_Rect combined = clip;
    if (had_clip) {
        SDL_IntersectRect(&previous, &clip, &combined);
    }
    SDL_RenderSetClipRect(renderer_, &combined);
    draw_text(renderer_, label_font_.get(), text, Styles::Label().color,
              SDL_Point{static_cast<int>(bg.x + pad), static_cast<int>(bg.y + pad * 0.5f)});
    SDL_RenderSetClipRect(renderer_, had_clip ? &previous : nullptr);
}

void CanvasRenderer::fill_rect(const SDL_FRect& rect, SDL_Color color) {
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
    SDL_RenderFillRectF(renderer_, &rect);
}

void CanvasRenderer::outline_rect(const SDL_FRect& rect, SDL_Color color, int thickness) {
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
    for (int i = 0; i < thickness; ++i) {
        const SDL_FRect r = inset(rect, static_cast<float>(i));
        SDL_RenderDrawRectF(renderer_, &r);
    }
}

void CanvasRenderer::fill_circle(SDL_FPoint center, float radius, SDL_Color color) {
    if (radius <= 0.0f) return;
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
    const int r = static_cast<int>(std::ceil(radius));
    for (int dy = -r; dy <= r; ++dy) {
        const float fy = static_cast<float>(dy);
        if (std::fabs(fy) > radius) continue;
        const float half = std::sqrt(radius * radius - fy * fy);
        SDL_RenderDrawLineF(renderer_, center.x - half, center.y + fy, center.x + half, center.y + fy);
    }
}

}
