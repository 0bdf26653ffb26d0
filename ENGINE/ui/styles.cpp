#include "styles.hpp"
#include "font_paths.hpp"

#include <algorithm>

namespace mablocks {

static inline SDL_Color make_color(Uint8 r, Uint8 g, Uint8 b, Uint8 a = 255) {
    return SDL_Color{ r, g, b, a };
}

static const SDL_Color kCanvas        = make_color( 24, 24, 24);
static const SDL_Color kToolbar       = make_color( 30, 30, 30);
static const SDL_Color kToolbarHover  = make_color( 60, 60, 60);
static const SDL_Color kBorder        = make_color( 90, 90, 90);
static const SDL_Color kChainedBorder = make_color(  0,200,  0);
static const SDL_Color kSkeleton      = make_color( 40, 40, 40);
static const SDL_Color kGroupNormal   = make_color( 60, 60, 60);
static const SDL_Color kGroupChained  = make_color(100,100,150);
static const SDL_Color kDropTarget    = make_color(250,195, 73);
static const SDL_Color kClose         = make_color(255,  0,  0);
static const SDL_Color kCloseHover    = make_color(255,100,100);
static const SDL_Color kChainActive   = make_color(  0,255,  0);
static const SDL_Color kChainDisabled = make_color( 80, 80, 80);
static const SDL_Color kChainHover    = make_color(211,211,211);
static const SDL_Color kChainNormal   = make_color(160,160,160);
static const SDL_Color kCounter       = make_color(  0,100,  0);
static const SDL_Color kCounterHover  = make_color(  0,150,  0);
static const SDL_Color kCounterBadge  = make_color(  0,100,  0,170);
static const SDL_Color kLabelBg       = make_color(  0,  0,  0,180);
static const SDL_Color kIvory         = make_color(235,235,225);

static LabelStyle& label_style() {
    static LabelStyle style{ fonts::sans_regular(), 12, kIvory };
    return style;
}

static const LabelStyle kToolbarLabel{
    fonts::sans_bold(), 14, kIvory };

const SDL_Color& Styles::CanvasBackground()       { return kCanvas; }
const SDL_Color& Styles::ToolbarBackground()      { return kToolbar; }
const SDL_Color& Styles::ToolbarButtonHover()     { return kToolbarHover; }
const SDL_Color& Styles::BlockBorder()            { return kBorder; }
const SDL_Color& Styles::ChainedBorder()          { return kChainedBorder; }
const SDL_Color& Styles::SkeletonFill()           { return kSkeleton; }
const SDL_Color& Styles::NormalGroupBackground()  { return kGroupNormal; }
const SDL_Color& Styles::ChainedGroupBackground() { return kGroupChained; }
const SDL_Color& Styles::DropTargetOutline()      { return kDropTarget; }
const SDL_Color& Styles::CloseButton()            { return kClose; }
const SDL_Color& Styles::CloseButtonHover()       { return kCloseHover; }
const SDL_Color& Styles::ChainActive()            { return kChainActive; }
const SDL_Color& Styles::ChainDisabled()          { return kChainDisabled; }
const SDL_Color& Styles::ChainHover()             { return kChainHover; }
const SDL_Color& Styles::ChainNormal()            { return kChainNormal; }
const SDL_Color& Styles::CounterButton()          { return kCounter; }
const SDL_Color& Styles::CounterButtonHover()     { return kCounterHover; }
const SDL_Color& Styles::CounterBadge()           { return kCounterBadge; }
const SDL_Color& Styles::LabelBackground()        { return kLabelBg; }
const SDL_Color& Styles::Ivory()                  { return kIvory; }

void Styles::configure_label_font(const std::string& font_path, int font_size) {
    LabelStyle& style = label_style();
    if (!font_path.empty()) {
        style.font_path = font_path;
    }
    style.font_size = std::max(font_size, 1);
}

const LabelStyle& Styles::Label()        { return label_style(); }
const LabelStyle& Styles::ToolbarLabel() { return kToolbarLabel; }

}
