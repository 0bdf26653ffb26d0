#pragma once

#include <cstddef>

namespace mablocks {

// Block layout
inline constexpr float kBlockPadding          = 4.0f;
inline constexpr float kMinBlockSize          = 50.0f;
inline constexpr float kRowQuantizationHeight = 100.0f;
inline constexpr float kDefaultGroupSize      = 160.0f;

// Canvas
inline constexpr float kCanvasPadding        = 32.0f;
inline constexpr float kCanvasWorkingWidth   = 1400.0f;
inline constexpr float kAlignSpacing         = 24.0f;
inline constexpr float kMaxBlockDimension    = 420.0f;
inline constexpr float kMinCanvasInnerWidth  = kMinBlockSize + kBlockPadding * 2.0f;
inline constexpr float kMinZoom              = 0.1f;
inline constexpr float kMaxZoom              = 10.0f;
inline constexpr float kMaxCanvasCoordinate  = 1.0e7f;

// Resources
inline constexpr std::size_t kMaxCachedAnimations = 20;
inline constexpr std::size_t kMaxAnimationFrames  = 1024;
inline constexpr int kDefaultFrameDurationMs      = 1000;
inline constexpr int kMinFrameDurationMs          = 16;
inline constexpr double kAutosaveIntervalSeconds  = 300.0;

// Block controls (close, chain, counter), in unzoomed pixels
inline constexpr float kButtonBaseSize          = 16.0f;
inline constexpr float kButtonSpacing           = 4.0f;
inline constexpr float kButtonHitAreaMultiplier = 1.2f;
inline constexpr float kCounterBadgeRadius      = 15.0f;
inline constexpr float kCounterBadgeOffset      = 5.0f;
inline constexpr float kLabelPadding            = 4.0f;

// Toolbar
inline constexpr int kToolbarHeight       = 40;
inline constexpr int kToolbarButtonSize   = 32;
inline constexpr int kToolbarStartSpacing = 8;

// Window
inline constexpr int kInitialWindowWidth  = 800;
inline constexpr int kInitialWindowHeight = 600;

}
