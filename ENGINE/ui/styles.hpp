#pragma once

#include <SDL.h>
#include <string>

namespace mablocks {

struct LabelStyle {
	std::string font_path;
	int         font_size;
	SDL_Color   color;
};

class Styles {

	public:
    static const SDL_Color& CanvasBackground();
    static const SDL_Color& ToolbarBackground();
    static const SDL_Color& ToolbarButtonHover();
    static const SDL_Color& BlockBorder();
    static const SDL_Color& ChainedBorder();
    static const SDL_Color& SkeletonFill();
    static const SDL_Color& NormalGroupBackground();
    static const SDL_Color& ChainedGroupBackground();
    static const SDL_Color& DropTargetOutline();
    static const SDL_Color& CloseButton();
    static const SDL_Color& CloseButtonHover();
    static const SDL_Color& ChainActive();
    static const SDL_Color& ChainDisabled();
    static const SDL_Color& ChainHover();
    static const SDL_Color& ChainNormal();
    static const SDL_Color& CounterButton();
    static const SDL_Color& CounterButtonHover();
    static const SDL_Color& CounterBadge();
    static const SDL_Color& LabelBackground();
    static const SDL_Color& Ivory();

    // Label font follows settings.json; call once before any label is drawn.
    static void configure_label_font(const std::string& font_path, int font_size);
    static const LabelStyle& Label();
    static const LabelStyle& ToolbarLabel();
};

}
